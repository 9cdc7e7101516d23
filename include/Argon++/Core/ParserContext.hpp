/**
 * @file ParserContext.hpp
 * @brief The parse state machine.
 *
 * A ParserContext walks the raw tokens of one scope, fills the holders of the
 * scope's definitions, and recurses into a command's scope as soon as a
 * command is selected. It never prints anything; every failure is returned as
 * a ParseError.
 */

#pragma once

#include "Argon++/Core/Config.hpp"
#include "Argon++/Core/Definition.hpp"
#include "Argon++/Utils/Definitions.hpp"
#include "Argon++/Utils/Error.hpp"
#include "Argon++/Utils/Types.hpp"

namespace argon::core {
  namespace {
    using utils::error::ParseError;

    using utils::types::Result;
    using utils::types::SharedPointer;
    using utils::types::Span;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::u8;
    using utils::types::Unit;
    using utils::types::usize;
  } // namespace

  class ParserContext {
   public:
    /**
     * @brief Parses @p tokens against @p args under @p config.
     *
     * Parsing stops at the first error. Holders filled before the error keep
     * their values.
     */
    static fn Parse(const ArgConfig& config, const FrozenArgumentSet& args, Span<const String> tokens) -> Result<Unit, ParseError>;

   private:
    enum class TokenKind : u8 {
      Positional,
      LongOption,
      ShortOption,
    };

    struct ClassifiedToken {
      TokenKind  kind;
      StringView text; ///< The token without its prefix.
    };

    ParserContext(const ArgConfig& config, FrozenArgumentSet args);

    fn run(Span<const String> tokens) -> Result<Unit, ParseError>;
    [[nodiscard]] fn classify(StringView token) const -> ClassifiedToken;

    fn parsePositional(StringView text) -> Result<Unit, ParseError>;
    fn parseCommand(StringView text, Span<const String> remaining) -> Result<Unit, ParseError>;
    fn parseLongOption(StringView token, StringView text) -> Result<Unit, ParseError>;
    fn parseShortOption(StringView text) -> Result<Unit, ParseError>;
    fn parseShortOptionUnclustered(StringView token, StringView text) -> Result<Unit, ParseError>;

    [[nodiscard]] fn finish() const -> Result<Unit, ParseError>;

    [[nodiscard]] fn shortDisplay(char shortName) const -> String;

    static fn Fill(ValueTarget& target, StringView raw) -> Result<Unit, ParseError>;
    static fn FillFlag(const OptionDefinition& option, bool inverse) -> Result<Unit, ParseError>;

    const ArgConfig&                      m_config;
    FrozenArgumentSet                     m_args;
    SharedPointer<const OptionDefinition> m_waitingForValue; ///< The option whose value is the next token.
    bool                                  m_optionsAvailable = true;
    usize                                 m_nextPositional   = 0;
  };
} // namespace argon::core
