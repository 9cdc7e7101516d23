/**
 * @file Dispatch.hpp
 * @brief Object-oriented command dispatch on top of ArgParser.
 *
 * An application is an AppHandler; each command is a CommandHandler. A handler
 * that also implements WithCommands owns child command handlers, which are
 * registered as its commands. After a successful parse the handler of every
 * selected command runs, outermost first.
 */

#pragma once

#include <algorithm> // std::ranges::find_if
#include <concepts>  // std::same_as
#include <variant>   // std::variant

#include "Argon++/ArgParser.hpp"
#include "Argon++/Core/Config.hpp"
#include "Argon++/Core/Definition.hpp"
#include "Argon++/Usage/Usage.hpp"
#include "Argon++/Utils/Definitions.hpp"
#include "Argon++/Utils/Error.hpp"
#include "Argon++/Utils/Types.hpp"

namespace argon::dispatch {
  namespace {
    using core::ArgConfig;
    using core::UsageGroup;
    using core::ValueParser;
    using core::ValuePrinter;

    using usage::UsageInfo;
    using usage::UsagePrinter;

    using utils::error::ParseError;
    using utils::error::RegistrationError;

    using utils::types::None;
    using utils::types::Option;
    using utils::types::Pair;
    using utils::types::Result;
    using utils::types::Span;
    using utils::types::String;
    using utils::types::UniquePointer;
    using utils::types::Unit;
    using utils::types::Vec;
  } // namespace

  class Handler;

  /**
   * @brief The handlers of the commands enclosing the one being run.
   */
  class HandlerContext {
   public:
    /**
     * @brief The first registered enclosing handler of type T.
     * @return nullptr if no enclosing handler has type T.
     */
    template <typename T>
    [[nodiscard]] fn parent() const -> T* {
      for (Handler* handler : m_parents)
        if (T* typed = dynamic_cast<T*>(handler))
          return typed;

      return nullptr;
    }

   private:
    fn add(Handler& handler) -> void {
      m_parents.push_back(&handler);
    }

    Vec<Handler*> m_parents;

    friend class AppHandler;
  };

  /**
   * @brief Registers arguments, then runs once they are parsed.
   */
  class Handler {
   public:
    Handler()                                  = default;
    Handler(const Handler&)                    = delete;
    Handler(Handler&&)                         = delete;
    fn operator=(const Handler&)->Handler&     = delete;
    fn operator=(Handler&&)->Handler&          = delete;
    virtual ~Handler()                         = default;

    virtual fn registerArgs(ArgParser& parser) -> Result<Unit, RegistrationError> = 0;
    virtual fn run(HandlerContext& context) -> void                            = 0;
  };

  /**
   * @brief The handler of one command, selected by an id of type T.
   */
  template <typename T>
  class CommandHandler : public Handler {
   public:
    [[nodiscard]] virtual fn id() const -> T = 0;

    [[nodiscard]] virtual fn description() const -> String {
      return {};
    }

    [[nodiscard]] virtual fn usageGroup() const -> Option<UsageGroup> {
      return None;
    }
  };

  /**
   * @brief The child command handlers of a handler, whatever their id type.
   */
  class CommandHandlerSetBase {
   public:
    CommandHandlerSetBase()                                            = default;
    CommandHandlerSetBase(const CommandHandlerSetBase&)                = delete;
    CommandHandlerSetBase(CommandHandlerSetBase&&)                     = delete;
    fn operator=(const CommandHandlerSetBase&)->CommandHandlerSetBase& = delete;
    fn operator=(CommandHandlerSetBase&&)->CommandHandlerSetBase&      = delete;
    virtual ~CommandHandlerSetBase()                                   = default;

    [[nodiscard]] virtual fn empty() const -> bool = 0;

   private:
    /**
     * @brief Adds a command set to @p parent and one command per handler.
     * @return Each handler paired with the parser of its command.
     */
    virtual fn addTo(ArgParser& parent) -> Result<Vec<Pair<Handler*, CommandParser>>, RegistrationError> = 0;

    /**
     * @return nullptr if no handler has the selected id.
     */
    [[nodiscard]] virtual fn selectedHandler() const -> Handler* = 0;

    [[nodiscard]] virtual fn selectedName() const -> String = 0;

    friend class AppHandler;
  };

  /**
   * @brief The child command handlers of a handler, selected by ids of type T.
   */
  template <typename T>
  class CommandHandlerSet final : public CommandHandlerSetBase {
   public:
    /**
     * @param parser Parses a command name into a handler id.
     * @param printer Produces the name each handler is selected by.
     */
    CommandHandlerSet(ValueParser<T> parser, ValuePrinter<T> printer)
      : m_parser(std::move(parser)), m_printer(std::move(printer)) {}

    CommandHandlerSet()
      requires std::same_as<T, String>
      : CommandHandlerSet(core::IdValueParser(), [](const String& name) -> String { return name; }) {}

    fn add(UniquePointer<CommandHandler<T>> handler) -> void {
      m_handlers.push_back(std::move(handler));
    }

    [[nodiscard]] fn handlers() const -> const Vec<UniquePointer<CommandHandler<T>>>& {
      return m_handlers;
    }

    [[nodiscard]] fn empty() const -> bool override {
      return m_handlers.empty();
    }

    /**
     * @brief The id of the selected command.
     * @throws std::bad_optional_access before a successful parse.
     */
    [[nodiscard]] fn selected() const -> const T& {
      return m_commandSet.value().selected();
    }

   private:
    fn addTo(ArgParser& parent) -> Result<Vec<Pair<Handler*, CommandParser>>, RegistrationError> override {
      Result<CommandSet<T>, RegistrationError> commandSet = parent.addCommands<T>(m_parser, m_printer);

      if (!commandSet)
        return Err(std::move(commandSet).error());

      m_commandSet = *commandSet;

      Vec<Pair<Handler*, CommandParser>> added;

      for (const UniquePointer<CommandHandler<T>>& handler : m_handlers) {
        Result<CommandParser, RegistrationError> parser = m_commandSet->addCommand(
          handler->id(),
          CommandInfo { .description = handler->description(), .usageGroup = handler->usageGroup() }
        );

        if (!parser)
          return Err(std::move(parser).error());

        added.emplace_back(handler.get(), std::move(*parser));
      }

      return added;
    }

    [[nodiscard]] fn selectedHandler() const -> Handler* override {
      const T& id = selected();

      const auto iter = std::ranges::find_if(m_handlers, [&id](const UniquePointer<CommandHandler<T>>& handler) {
        return handler->id() == id;
      });

      return iter == m_handlers.end() ? nullptr : iter->get();
    }

    [[nodiscard]] fn selectedName() const -> String override {
      return m_printer(selected());
    }

    Vec<UniquePointer<CommandHandler<T>>> m_handlers;
    ValueParser<T>                        m_parser;
    ValuePrinter<T>                       m_printer;
    Option<CommandSet<T>>                 m_commandSet;
  };

  /**
   * @brief Implemented by handlers that have subcommands.
   *
   * Such a handler runs before the handler of its selected command.
   */
  class WithCommands {
   public:
    WithCommands()                                   = default;
    WithCommands(const WithCommands&)                = delete;
    WithCommands(WithCommands&&)                     = delete;
    fn operator=(const WithCommands&)->WithCommands& = delete;
    fn operator=(WithCommands&&)->WithCommands&      = delete;
    virtual ~WithCommands()                          = default;

    /**
     * @brief Implementations may narrow the return type to their CommandHandlerSet<T>.
     */
    virtual fn commands() -> CommandHandlerSetBase& = 0;
  };

  /**
   * @brief Either failure of AppHandler::runApp.
   */
  using AppError = std::variant<RegistrationError, ParseError>;

  /**
   * @brief The handler of the application itself.
   */
  class AppHandler : public Handler {
   public:
    /**
     * @brief Whether a `--help`/`-h` option is added before anything else.
     */
    [[nodiscard]] virtual fn addHelp() const -> bool {
      return true;
    }

    [[nodiscard]] virtual fn usageInfo() const -> UsageInfo {
      return {};
    }

    /**
     * @brief None selects usage::DefaultUsagePrinter.
     */
    [[nodiscard]] virtual fn usagePrinter() const -> Option<UsagePrinter> {
      return None;
    }

    [[nodiscard]] virtual fn config() const -> ArgConfig {
      return ArgConfig::Default();
    }

    /**
     * @brief Registers every handler, parses @p tokens and runs the handlers
     * of the selected commands.
     */
    fn runApp(Span<const String> tokens) -> Result<Unit, AppError>;

    /**
     * @brief Like runApp, but a parse failure prints the error and usage and
     * exits with status 1. A registration failure is logged and also exits
     * with status 1.
     */
    fn runAppOrQuit(Span<const String> tokens) -> void;

   private:
    fn buildParser() -> Result<AppArgParser, RegistrationError>;

    static fn RegisterCommands(ArgParser& parent, WithCommands& handler) -> Result<Unit, RegistrationError>;
    static fn RunWithCommands(Handler& handler, HandlerContext& context) -> void;
  };
} // namespace argon::dispatch
