#pragma once

#include <expected>        // std::{unexpected, expected}
#include <format>          // std::{format, formatter}
#include <matchit.hpp>     // matchit::{match, is, or_, _}
#include <source_location> // std::source_location
#include <system_error>    // std::error_code

#include "Definitions.hpp"
#include "Types.hpp"

namespace argon::utils {
  namespace error {
    namespace {
      using types::Exception;
      using types::String;
      using types::StringView;
      using types::u8;
      using types::Vec;
    } // namespace

    /**
     * @enum ArgonErrorCode
     * @brief Error codes for library infrastructure (configuration, I/O) failures.
     */
    enum class ArgonErrorCode : u8 {
      ConfigurationError, ///< A configuration value is missing, malformed or out of range.
      InternalError,      ///< An error occurred within the library's own logic.
      InvalidArgument,    ///< An invalid argument was passed to a function or method.
      IoError,            ///< General I/O error (filesystem, streams, etc.).
      NotFound,           ///< A required resource (usually a file) was not found.
      ParseError,         ///< Failed to parse external data (e.g. a TOML document).
      Other,              ///< A generic or unclassified error.
    };

    /**
     * @struct ArgonError
     * @brief Holds structured information about an infrastructure error.
     *
     * Used as the default error type of Result.
     */
    struct ArgonError {
      String               message;  ///< A descriptive error message.
      std::source_location location; ///< The source location where the error occurred (file, line, function).
      ArgonErrorCode       code;     ///< The general category of the error.

      ArgonError(const ArgonErrorCode errc, String msg, const std::source_location& loc = std::source_location::current())
        : message(std::move(msg)), location(loc), code(errc) {}

      explicit ArgonError(const Exception& exc, const std::source_location& loc = std::source_location::current())
        : message(exc.what()), location(loc), code(ArgonErrorCode::InternalError) {}

      explicit ArgonError(const std::error_code& errc, const std::source_location& loc = std::source_location::current())
        : message(errc.message()), location(loc) {
        using matchit::match, matchit::is, matchit::or_, matchit::_;
        using enum ArgonErrorCode;
        using enum std::errc;

        code = match(errc)(
          is | or_(file_too_large, io_error)                                                = IoError,
          is | invalid_argument                                                             = InvalidArgument,
          is | or_(no_such_file_or_directory, not_a_directory, is_a_directory, file_exists) = NotFound,
          is | _                                                                            = Other
        );
      }
    };

    /**
     * @enum RegistrationErrorCode
     * @brief Reasons a schema registration call can be rejected.
     *
     * These are programmer errors: they surface while the schema is being
     * built, before any token is parsed.
     */
    enum class RegistrationErrorCode : u8 {
      DuplicateArgument,      ///< A positional or option (or inverse) name is already registered.
      DuplicateShortAlias,    ///< The short alias character is already in use.
      InvalidShortAlias,      ///< The short alias character cannot be recognized on a command line.
      InvalidInverseName,     ///< An explicitly named flag inverse is empty.
      DuplicateCommand,       ///< A command with the same printed name already exists in this scope.
      DuplicateCommandSet,    ///< A command set was already added to this scope.
      DuplicateUsageGroup,    ///< A usage group with the same name already exists.
      MandatoryAfterOptional, ///< A mandatory positional was added after an optional one.
      MultiValuedNotLast,     ///< A positional was added after a multi-valued positional.
    };

    /**
     * @struct RegistrationError
     * @brief Holds structured information about a rejected registration call.
     */
    struct RegistrationError {
      String                message;  ///< A descriptive error message.
      String                subject;  ///< The name (or short alias) that caused the rejection.
      std::source_location  location; ///< The source location of the registration call.
      RegistrationErrorCode code;     ///< The reason for the rejection.

      RegistrationError(
        const RegistrationErrorCode errc,
        String                      subject,
        String                      msg,
        const std::source_location& loc = std::source_location::current()
      )
        : message(std::move(msg)), subject(std::move(subject)), location(loc), code(errc) {}
    };

    /**
     * @enum ParseErrorKind
     * @brief The closed set of ways parsing a token vector can fail.
     */
    enum class ParseErrorKind : u8 {
      UnknownOption,      ///< A token named an option or short alias that is not registered.
      UnknownCommand,     ///< A command was expected but the token matched no registered command.
      MissingCommand,     ///< Input ended while a command was still required.
      MissingPositionals, ///< Input ended with mandatory positionals unfilled.
      MissingOptionValue, ///< Input ended while an option was waiting for its value.
      TooManyPositionals, ///< A positional token arrived with no positional slot left.
      ValueParsingFailed, ///< A value parser rejected the raw text.
    };

    /**
     * @struct ParseError
     * @brief Holds structured information about a failed parse.
     *
     * Parsing is fail-fast, so a parse produces at most one of these.
     */
    struct ParseError {
      String               message;  ///< A human-readable description, ready to be shown to the user.
      Vec<String>          names;    ///< The offending token, option, command or positional names.
      String               value;    ///< The rejected raw text (ValueParsingFailed only).
      String               reason;   ///< The parser-supplied reason (ValueParsingFailed only).
      std::source_location location; ///< The source location where the error was raised.
      ParseErrorKind       kind;     ///< The kind of failure.

      ParseError(const ParseErrorKind kind, String msg, Vec<String> names, const std::source_location& loc = std::source_location::current())
        : message(std::move(msg)), names(std::move(names)), location(loc), kind(kind) {}

      static fn UnknownOption(const StringView token, const std::source_location& loc = std::source_location::current()) -> ParseError {
        return { ParseErrorKind::UnknownOption, std::format("Unknown option: {}", token), { String(token) }, loc };
      }

      static fn UnknownCommand(const StringView command, const std::source_location& loc = std::source_location::current()) -> ParseError {
        return { ParseErrorKind::UnknownCommand, std::format("Unknown command: {}", command), { String(command) }, loc };
      }

      static fn MissingCommand(const std::source_location& loc = std::source_location::current()) -> ParseError {
        return { ParseErrorKind::MissingCommand, "A command is required", {}, loc };
      }

      static fn MissingPositionals(Vec<String> positionals, const std::source_location& loc = std::source_location::current()) -> ParseError {
        String joined;

        for (const String& name : positionals) {
          if (!joined.empty())
            joined += ", ";

          joined += name;
        }

        return { ParseErrorKind::MissingPositionals, std::format("Missing required positional argument(s): {}", joined), std::move(positionals), loc };
      }

      static fn MissingOptionValue(const StringView option, const std::source_location& loc = std::source_location::current()) -> ParseError {
        return { ParseErrorKind::MissingOptionValue, std::format("Option {} requires a value", option), { String(option) }, loc };
      }

      static fn TooManyPositionals(const StringView positional, const std::source_location& loc = std::source_location::current()) -> ParseError {
        return { ParseErrorKind::TooManyPositionals, std::format("Too many positional arguments: {}", positional), { String(positional) }, loc };
      }

      static fn ValueParsingFailed(
        const StringView            name,
        const StringView            value,
        const StringView            reason,
        const std::source_location& loc = std::source_location::current()
      ) -> ParseError {
        ParseError error(ParseErrorKind::ValueParsingFailed, std::format("Failed to parse {}[={}]: {}", name, value, reason), { String(name) }, loc);
        error.value  = value;
        error.reason = reason;
        return error;
      }
    };

    /**
     * @struct ValueParserError
     * @brief Returned by a value parser that cannot convert its input text.
     */
    struct ValueParserError {
      String reason; ///< Why the text was rejected, e.g. "Invalid int".
    };
  } // namespace error

  namespace types {
    /**
     * @typedef Result
     * @brief Alias for std::expected<Tp, Er>. Represents a value that can either be
     * a success value of type Tp or an error value of type Er.
     * @tparam Tp The type of the success value.
     * @tparam Er The type of the error value.
     */
    template <typename Tp = void, typename Er = error::ArgonError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Alias for std::unexpected<Er>. Used to construct a Result in an error state.
     * @tparam Er The type of the error value.
     */
    template <typename Er = error::ArgonError>
    using Err = std::unexpected<Er>;
  } // namespace types
} // namespace argon::utils

namespace std {
  template <>
  struct formatter<::argon::utils::error::ArgonErrorCode> : formatter<::argon::utils::types::StringView> {
    template <typename FormatContext>
    fn format(argon::utils::error::ArgonErrorCode code, FormatContext& ctx) const {
      using enum argon::utils::error::ArgonErrorCode;
      using matchit::match, matchit::is, matchit::_;

      argon::utils::types::StringView name = match(code)(
        is | ConfigurationError = "ConfigurationError",
        is | InternalError      = "InternalError",
        is | InvalidArgument    = "InvalidArgument",
        is | IoError            = "IoError",
        is | NotFound           = "NotFound",
        is | ParseError         = "ParseError",
        is | Other              = "Other",
        is | _                  = "Unknown"
      );

      return formatter<argon::utils::types::StringView>::format(name, ctx);
    }
  };

  template <>
  struct formatter<::argon::utils::error::RegistrationErrorCode> : formatter<::argon::utils::types::StringView> {
    template <typename FormatContext>
    fn format(argon::utils::error::RegistrationErrorCode code, FormatContext& ctx) const {
      using enum argon::utils::error::RegistrationErrorCode;
      using matchit::match, matchit::is, matchit::_;

      argon::utils::types::StringView name = match(code)(
        is | DuplicateArgument      = "DuplicateArgument",
        is | DuplicateShortAlias    = "DuplicateShortAlias",
        is | InvalidShortAlias      = "InvalidShortAlias",
        is | InvalidInverseName     = "InvalidInverseName",
        is | DuplicateCommand       = "DuplicateCommand",
        is | DuplicateCommandSet    = "DuplicateCommandSet",
        is | DuplicateUsageGroup    = "DuplicateUsageGroup",
        is | MandatoryAfterOptional = "MandatoryAfterOptional",
        is | MultiValuedNotLast     = "MultiValuedNotLast",
        is | _                      = "Unknown"
      );

      return formatter<argon::utils::types::StringView>::format(name, ctx);
    }
  };

  template <>
  struct formatter<::argon::utils::error::ParseErrorKind> : formatter<::argon::utils::types::StringView> {
    template <typename FormatContext>
    fn format(argon::utils::error::ParseErrorKind kind, FormatContext& ctx) const {
      using enum argon::utils::error::ParseErrorKind;
      using matchit::match, matchit::is, matchit::_;

      argon::utils::types::StringView name = match(kind)(
        is | UnknownOption      = "UnknownOption",
        is | UnknownCommand     = "UnknownCommand",
        is | MissingCommand     = "MissingCommand",
        is | MissingPositionals = "MissingPositionals",
        is | MissingOptionValue = "MissingOptionValue",
        is | TooManyPositionals = "TooManyPositionals",
        is | ValueParsingFailed = "ValueParsingFailed",
        is | _                  = "Unknown"
      );

      return formatter<argon::utils::types::StringView>::format(name, ctx);
    }
  };
} // namespace std

#define ERR(errc, msg)          return ::argon::utils::types::Err(::argon::utils::error::ArgonError(errc, msg))
#define ERR_FROM(err)           return ::argon::utils::types::Err(::argon::utils::error::ArgonError(err))
#define ERR_FMT(errc, fmt, ...) return ::argon::utils::types::Err(::argon::utils::error::ArgonError(errc, std::format(fmt, __VA_ARGS__)))
