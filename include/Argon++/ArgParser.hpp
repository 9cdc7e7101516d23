/**
 * @file ArgParser.hpp
 * @brief The high-level, declarative argument parser.
 *
 * Arguments are registered on an AppArgParser (or on the CommandParser of a
 * command); each registration returns a typed holder that is filled by
 * AppArgParser::parse.
 *
 * Methods ending in `S` parse plain strings. Methods ending in `N` default to
 * "no value" (the holder stores an Option). `SN` combines both.
 *
 * @code
 * argon::AppArgParser parser(argon::usage::UsageInfo { .application = "app" });
 *
 * auto count = parser.addOption<i32>("count", 1, argon::core::IntValueParser<i32>(), { .shortName = 'c' });
 * auto file  = parser.addPositionalS("file");
 *
 * parser.parseOrQuit(tokens);
 * @endcode
 */

#pragma once

#include <cstdlib>     // std::exit
#include <iostream>    // std::{cout, cerr}
#include <ostream>     // std::ostream
#include <type_traits> // std::type_identity_t

#include "Argon++/Core/Config.hpp"
#include "Argon++/Core/Definition.hpp"
#include "Argon++/Core/Holder.hpp"
#include "Argon++/Core/Registry.hpp"
#include "Argon++/Core/Value.hpp"
#include "Argon++/Usage/Usage.hpp"
#include "Argon++/Utils/Definitions.hpp"
#include "Argon++/Utils/Error.hpp"
#include "Argon++/Utils/Types.hpp"

namespace argon {
  namespace {
    using core::Accumulator;
    using core::Arg;
    using core::ArgConfig;
    using core::ArgRegistry;
    using core::FlagInverse;
    using core::FrozenArgumentSet;
    using core::Requires;
    using core::UsageGroup;
    using core::ValueParser;
    using core::ValuePrinter;

    using usage::UsageContext;
    using usage::UsageInfo;
    using usage::UsagePrinter;

    using utils::error::ParseError;
    using utils::error::RegistrationError;
    using utils::error::ValueParserError;

    using utils::types::Err;
    using utils::types::Fn;
    using utils::types::i32;
    using utils::types::Map;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::SharedPointer;
    using utils::types::Span;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::Unit;
    using utils::types::Vec;
  } // namespace

  /**
   * @struct PositionalInfo
   * @brief Optional presentation and behaviour settings of a positional.
   */
  struct PositionalInfo {
    String             description;
    Option<UsageGroup> usageGroup;
    Option<bool>       noOptionsFollowing; ///< Once given, every later token is positional.
  };

  /**
   * @struct OptionInfo
   * @brief Optional presentation settings of an option.
   */
  struct OptionInfo {
    String             description;
    Option<String>     valueDescription; ///< Placeholder shown in usage, VALUE by default.
    Option<UsageGroup> usageGroup;
    Option<char>       shortName;
  };

  /**
   * @struct FlagInfo
   * @brief Optional presentation and behaviour settings of a flag.
   */
  struct FlagInfo {
    String             description;
    Option<UsageGroup> usageGroup;
    Option<char>       shortName;
    FlagInverse        inverse = FlagInverse::Auto();
    Fn<void(bool)>     onParse; ///< Called with every parsed occurrence.
  };

  /**
   * @struct CommandInfo
   * @brief Optional presentation settings of a command.
   */
  struct CommandInfo {
    String             description;
    Option<UsageGroup> usageGroup;
  };

  /**
   * @struct HelpInfo
   * @brief Settings of the option added by AppArgParser::addHelpOption.
   */
  struct HelpInfo {
    String        name        = "help";
    Option<char>  shortName   = 'h';
    String        description = "Show this help";
    std::ostream* sink        = &std::cout;
  };

  class CommandParser;

  template <typename T>
  class CommandSet;

  /**
   * @brief The registration surface shared by AppArgParser and CommandParser.
   *
   * Copies refer to the same scope.
   */
  class ArgParser {
   public:
    [[nodiscard]] fn args() const -> FrozenArgumentSet;
    [[nodiscard]] fn config() const -> const ArgConfig&;
    [[nodiscard]] fn info() const -> const UsageInfo&;
    [[nodiscard]] fn usageContext() const -> const UsageContext&;
    [[nodiscard]] fn usagePrinter() const -> const UsagePrinter&;
    [[nodiscard]] fn usageGroups() const -> const Vec<UsageGroup>&;

    /**
     * @brief The parser of the command registered under the printed id @p id.
     */
    [[nodiscard]] fn commandParser(StringView id) const -> Option<CommandParser>;

    fn createUsageGroup(String name) -> Result<UsageGroup, RegistrationError>;

    template <typename T>
    fn addPositional(
      String                          name,
      ValueParser<T>                  parser,
      Requires<std::type_identity_t<T>> requirement = Requires<T>::Mandatory(),
      PositionalInfo                  info        = {}
    ) -> Result<Arg<T>, RegistrationError> {
      return m_node->registry.addPositional(core::PositionalParams<T, T> {
        .name               = std::move(name),
        .description        = std::move(info.description),
        .usageGroup         = std::move(info.usageGroup),
        .requirement        = std::move(requirement),
        .parser             = std::move(parser),
        .accumulator        = core::DiscardAccumulator<T>(),
        .isMulti            = false,
        .noOptionsFollowing = info.noOptionsFollowing,
      });
    }

    fn addPositionalS(String name, Requires<String> requirement = Requires<String>::Mandatory(), PositionalInfo info = {})
      -> Result<Arg<String>, RegistrationError>;

    template <typename T>
    fn addPositionalN(String name, ValueParser<T> parser, PositionalInfo info = {}) -> Result<Arg<Option<T>>, RegistrationError> {
      return m_node->registry.addPositional(core::PositionalParams<T, Option<T>> {
        .name               = std::move(name),
        .description        = std::move(info.description),
        .usageGroup         = std::move(info.usageGroup),
        .requirement        = Requires<Option<T>>::Optional(None),
        .parser             = std::move(parser),
        .accumulator        = core::LiftOptional(core::DiscardAccumulator<T>()),
        .isMulti            = false,
        .noOptionsFollowing = info.noOptionsFollowing,
      });
    }

    fn addPositionalSN(String name, PositionalInfo info = {}) -> Result<Arg<Option<String>>, RegistrationError>;

    /**
     * @brief Adds a positional that takes every remaining positional token.
     */
    template <typename T, typename U>
    fn addMultiPositional(
      String                            name,
      ValueParser<T>                    parser,
      Accumulator<T, U>                 accumulator,
      Requires<std::type_identity_t<U>> requirement = Requires<U>::Mandatory(),
      PositionalInfo                    info        = {}
    ) -> Result<Arg<U>, RegistrationError> {
      return m_node->registry.addPositional(core::PositionalParams<T, U> {
        .name               = std::move(name),
        .description        = std::move(info.description),
        .usageGroup         = std::move(info.usageGroup),
        .requirement        = std::move(requirement),
        .parser             = std::move(parser),
        .accumulator        = std::move(accumulator),
        .isMulti            = true,
        .noOptionsFollowing = info.noOptionsFollowing,
      });
    }

    template <typename U>
    fn addMultiPositionalS(
      String                            name,
      Accumulator<String, U>            accumulator,
      Requires<std::type_identity_t<U>> requirement = Requires<U>::Mandatory(),
      PositionalInfo                    info        = {}
    ) -> Result<Arg<U>, RegistrationError> {
      return addMultiPositional<String, U>(std::move(name), core::IdValueParser(), std::move(accumulator), std::move(requirement), std::move(info));
    }

    template <typename T>
    fn addOption(String name, std::type_identity_t<T> defaultValue, ValueParser<T> parser, OptionInfo info = {}) -> Result<Arg<T>, RegistrationError> {
      return addMultiOption<T, T>(std::move(name), std::move(defaultValue), std::move(parser), core::DiscardAccumulator<T>(), std::move(info));
    }

    fn addOptionS(String name, String defaultValue, OptionInfo info = {}) -> Result<Arg<String>, RegistrationError>;

    template <typename T>
    fn addOptionN(String name, ValueParser<T> parser, OptionInfo info = {}) -> Result<Arg<Option<T>>, RegistrationError> {
      return addMultiOption<T, Option<T>>(std::move(name), None, std::move(parser), core::LiftOptional(core::DiscardAccumulator<T>()), std::move(info));
    }

    fn addOptionSN(String name, OptionInfo info = {}) -> Result<Arg<Option<String>>, RegistrationError>;

    /**
     * @brief Adds an option whose every occurrence is folded by @p accumulator.
     */
    template <typename T, typename U>
    fn addMultiOption(
      String                  name,
      std::type_identity_t<U> defaultValue,
      ValueParser<T>          parser,
      Accumulator<T, U>       accumulator,
      OptionInfo              info = {}
    ) -> Result<Arg<U>, RegistrationError> {
      return m_node->registry.addOption(core::OptionParams<T, U> {
        .name             = std::move(name),
        .description      = std::move(info.description),
        .valueDescription = std::move(info.valueDescription),
        .usageGroup       = std::move(info.usageGroup),
        .shortName        = info.shortName,
        .flag             = None,
        .defaultValue     = std::move(defaultValue),
        .parser           = std::move(parser),
        .accumulator      = std::move(accumulator),
      });
    }

    template <typename U>
    fn addMultiOptionS(String name, std::type_identity_t<U> defaultValue, Accumulator<String, U> accumulator, OptionInfo info = {})
      -> Result<Arg<U>, RegistrationError> {
      return addMultiOption<String, U>(std::move(name), std::move(defaultValue), core::IdValueParser(), std::move(accumulator), std::move(info));
    }

    template <typename U>
    fn addMultiOptionSN(String name, Accumulator<String, U> accumulator, OptionInfo info = {}) -> Result<Arg<Option<U>>, RegistrationError> {
      return addMultiOption<String, Option<U>>(std::move(name), None, core::IdValueParser(), core::LiftOptional(std::move(accumulator)), std::move(info));
    }

    fn addFlag(String name, FlagInfo info = {}, bool defaultValue = false) -> Result<Arg<bool>, RegistrationError>;

    /**
     * @brief Adds a flag whose every occurrence (and inverse occurrence) is
     * folded by @p accumulator.
     */
    template <typename U>
    fn addMultiFlag(String name, std::type_identity_t<U> defaultValue, Accumulator<bool, U> accumulator, FlagInfo info = {})
      -> Result<Arg<U>, RegistrationError> {
      ValueParser<bool> parser = core::BoolValueParser();

      if (info.onParse)
        parser = core::Also(std::move(parser), [onParse = std::move(info.onParse)](const bool value) -> Result<Unit, ValueParserError> {
          onParse(value);
          return {};
        });

      return m_node->registry.addOption(core::OptionParams<bool, U> {
        .name             = std::move(name),
        .description      = std::move(info.description),
        .valueDescription = None,
        .usageGroup       = std::move(info.usageGroup),
        .shortName        = info.shortName,
        .flag             = std::move(info.inverse),
        .defaultValue     = std::move(defaultValue),
        .parser           = std::move(parser),
        .accumulator      = std::move(accumulator),
      });
    }

    /**
     * @brief Makes this scope take exactly one command.
     * @param parser Parses a command name into its id.
     * @param printer Produces the name each id is selected by.
     */
    template <typename T>
    fn addCommands(ValueParser<T> parser, ValuePrinter<T> printer) -> Result<CommandSet<T>, RegistrationError>;

    template <typename T>
      requires std::formattable<T, char>
    fn addCommands(ValueParser<T> parser) -> Result<CommandSet<T>, RegistrationError> {
      return addCommands<T>(std::move(parser), core::ToStringValuePrinter<T>());
    }

    fn addCommandsS() -> Result<CommandSet<String>, RegistrationError>;

    /**
     * @brief Commands named after the enumerators of E.
     * @param intercept Optional hook rewriting each enumerator name.
     */
    template <typename E>
      requires std::is_enum_v<E>
    fn addEnumCommands(const Fn<String(StringView)>& intercept = {}) -> Result<CommandSet<E>, RegistrationError> {
      return addCommands<E>(core::EnumValueParser<E>(intercept), core::EnumValuePrinter<E>(intercept));
    }

    /**
     * @brief Prints the usage of this scope through the usage printer.
     * @param showShortUsage Print only the `Usage:` line.
     */
    fn printUsage(std::ostream& sink = std::cout, bool showShortUsage = false) const -> void;

   protected:
    struct Node {
      ArgRegistry                       registry;
      UsageInfo                         info;
      UsageContext                      context;
      UsagePrinter                      printer;
      Map<String, SharedPointer<Node>> commandParsers;
    };

    explicit ArgParser(SharedPointer<Node> node)
      : m_node(std::move(node)) {}

    /**
     * @brief The node of the most deeply selected command, starting at @p node.
     */
    static fn DeepestSelected(const SharedPointer<Node>& node) -> SharedPointer<Node>;

    SharedPointer<Node> m_node;

    template <typename T>
    friend class CommandSet;
  };

  /**
   * @brief The parser of a single command, returned by CommandSet::addCommand.
   */
  class CommandParser : public ArgParser {
   public:
    /**
     * @brief The definition of the command this parser adds arguments to.
     */
    [[nodiscard]] fn command() const -> SharedPointer<const core::CommandDefinition>;

   private:
    explicit CommandParser(SharedPointer<Node> node)
      : ArgParser(std::move(node)) {}

    friend class ArgParser;

    template <typename T>
    friend class CommandSet;
  };

  /**
   * @brief A set of commands, exactly one of which is selected while parsing.
   */
  template <typename T>
  class CommandSet {
   public:
    /**
     * @brief Adds the command identified by @p id.
     * @return The parser for the command's own arguments.
     */
    fn addCommand(const T& id, CommandInfo info = {}) -> Result<CommandParser, RegistrationError> {
      Result<core::AddedCommand, RegistrationError> added = m_registrar.addCommand(id, std::move(info.description), std::move(info.usageGroup));

      if (!added)
        return Err(std::move(added).error());

      SharedPointer<ArgParser::Node> node = std::make_shared<ArgParser::Node>(ArgParser::Node {
        .registry       = std::move(added->registry),
        .info           = m_parent->info,
        .context        = m_parent->context.subCommand(added->command),
        .printer        = m_parent->printer,
        .commandParsers = {},
      });

      m_parent->commandParsers.insert_or_assign(added->command->name, node);

      return CommandParser(std::move(node));
    }

    /**
     * @brief The id of the command selected by the last parse.
     * @throws std::bad_optional_access if no command was parsed.
     */
    [[nodiscard]] fn selected() const -> const T& {
      return m_registrar.selected().value();
    }

    [[nodiscard]] fn hasSelection() const -> bool {
      return m_registrar.selected().hasValue();
    }

   private:
    CommandSet(SharedPointer<ArgParser::Node> parent, core::CommandSetRegistrar<T> registrar)
      : m_parent(std::move(parent)), m_registrar(std::move(registrar)) {}

    SharedPointer<ArgParser::Node> m_parent;
    core::CommandSetRegistrar<T>   m_registrar;

    friend class ArgParser;
  };

  template <typename T>
  fn ArgParser::addCommands(ValueParser<T> parser, ValuePrinter<T> printer) -> Result<CommandSet<T>, RegistrationError> {
    Result<core::CommandSetRegistrar<T>, RegistrationError> registrar = m_node->registry.addCommandSet<T>(std::move(parser), std::move(printer));

    if (!registrar)
      return Err(std::move(registrar).error());

    return CommandSet<T>(m_node, std::move(*registrar));
  }

  /**
   * @brief The root parser of an application.
   */
  class AppArgParser : public ArgParser {
   public:
    explicit AppArgParser(
      UsageInfo    info         = {},
      UsagePrinter usagePrinter = usage::DefaultUsagePrinter::Create(),
      ArgConfig    config       = ArgConfig::Default()
    );

    /**
     * @brief Parses @p tokens, filling every holder registered on this parser
     * and on the selected commands.
     */
    fn parse(Span<const String> tokens) const -> Result<Unit, ParseError>;

    /**
     * @brief Parses the arguments of `main`, skipping the program name.
     */
    fn parseArgv(i32 argc, const char* const* argv) const -> Result<Unit, ParseError>;

    /**
     * @brief Parses @p tokens; on failure prints the error and the usage of
     * the most deeply selected command to @p sink and exits with status 1.
     */
    fn parseOrQuit(Span<const String> tokens, std::ostream& sink = std::cerr, bool showShortUsage = true) const -> void;

    /**
     * @brief Adds a flag that prints the full usage of the most deeply
     * selected command and exits with status 0.
     */
    fn addHelpOption(HelpInfo help = {}) -> Result<Arg<bool>, RegistrationError>;
  };
} // namespace argon
