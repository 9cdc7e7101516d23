/**
 * @file Registry.hpp
 * @brief Validated registration of positionals, options and commands.
 *
 * Every registration call checks the scope's invariants before touching it,
 * so a rejected call leaves the schema unchanged.
 */

#pragma once

#include "Argon++/Core/Config.hpp"
#include "Argon++/Core/Definition.hpp"
#include "Argon++/Core/Holder.hpp"
#include "Argon++/Core/Value.hpp"
#include "Argon++/Utils/Definitions.hpp"
#include "Argon++/Utils/Error.hpp"
#include "Argon++/Utils/Types.hpp"

namespace argon::core {
  namespace {
    using utils::error::RegistrationError;

    using utils::types::Err;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::SharedPointer;
    using utils::types::String;
    using utils::types::Unit;
    using utils::types::Vec;
  } // namespace

  /**
   * @struct PositionalParams
   * @brief Everything needed to register one positional argument.
   */
  template <typename T, typename U>
  struct PositionalParams {
    String             name;
    String             description;
    Option<UsageGroup> usageGroup;
    Requires<U>        requirement = Requires<U>::Mandatory();
    ValueParser<T>     parser;
    Accumulator<T, U>  accumulator;
    bool               isMulti = false;
    Option<bool>       noOptionsFollowing;
  };

  /**
   * @struct OptionParams
   * @brief Everything needed to register one option or flag.
   *
   * Setting @ref flag makes the option a boolean flag.
   */
  template <typename T, typename U>
  struct OptionParams {
    String              name;
    String              description;
    Option<String>      valueDescription;
    Option<UsageGroup>  usageGroup;
    Option<char>        shortName;
    Option<FlagInverse> flag;
    U                   defaultValue;
    ValueParser<T>      parser;
    Accumulator<T, U>   accumulator;
  };

  struct AddedCommand;

  template <typename T>
  class CommandSetRegistrar;

  /**
   * @brief The registration surface of one parsing scope.
   *
   * Copies refer to the same scope.
   */
  class ArgRegistry {
   public:
    explicit ArgRegistry(ArgConfig config);

    /**
     * @brief Creates the registry of a command scope inheriting from @p parent.
     */
    static fn SubCommand(const ArgRegistry& parent) -> ArgRegistry;

    [[nodiscard]] fn config() const -> const ArgConfig&;

    /**
     * @brief A frozen snapshot of the scope, ready to be parsed.
     */
    [[nodiscard]] fn args() const -> FrozenArgumentSet;

    [[nodiscard]] fn usageGroups() const -> const Vec<UsageGroup>&;

    /**
     * @brief Creates a usage group, rejecting duplicate names.
     */
    fn createUsageGroup(String name) -> Result<UsageGroup, RegistrationError>;

    /**
     * @brief Registers a positional argument.
     * @return The holder the parsed value will be stored in.
     */
    template <typename T, typename U>
    fn addPositional(PositionalParams<T, U> params) -> Result<Arg<U>, RegistrationError> {
      if (Result<Unit, RegistrationError> valid = checkPositional(params.name, params.requirement.isMandatory()); !valid)
        return Err(std::move(valid).error());

      SharedPointer<ValueCell<U>> cell = std::make_shared<ValueCell<U>>(ValueCell<U> { params.name, params.requirement.defaultValue(), false });

      PositionalDefinition definition {
        .name               = std::move(params.name),
        .description        = std::move(params.description),
        .usageGroup         = std::move(params.usageGroup),
        .isMandatory        = params.requirement.isMandatory(),
        .isMulti            = params.isMulti,
        .noOptionsFollowing = params.noOptionsFollowing,
        .target             = std::make_shared<AccumulatingTarget<T, U>>(cell, std::move(params.parser), std::move(params.accumulator)),
      };

      addPositionalDefinition(std::move(definition));

      return Arg<U>(cell);
    }

    /**
     * @brief Registers an option, or a flag if @p params.flag is set.
     *
     * A flag's inverse name (explicit, or produced by the config's inverse
     * generator) is indexed as a second key for the same option.
     * @return The holder the parsed value will be stored in.
     */
    template <typename T, typename U>
    fn addOption(OptionParams<T, U> params) -> Result<Arg<U>, RegistrationError> {
      Result<Option<Flag>, RegistrationError> flag = resolveOption(params.name, params.shortName, params.flag);

      if (!flag)
        return Err(std::move(flag).error());

      SharedPointer<ValueCell<U>> cell = std::make_shared<ValueCell<U>>(ValueCell<U> { params.name, std::move(params.defaultValue), false });

      OptionDefinition definition {
        .name             = std::move(params.name),
        .description      = std::move(params.description),
        .valueDescription = std::move(params.valueDescription),
        .usageGroup       = std::move(params.usageGroup),
        .shortName        = params.shortName,
        .flag             = std::move(*flag),
        .target           = std::make_shared<AccumulatingTarget<T, U>>(cell, std::move(params.parser), std::move(params.accumulator)),
      };

      addOptionDefinition(std::move(definition));

      return Arg<U>(cell);
    }

    /**
     * @brief Declares that this scope takes exactly one command.
     * @param parser Parses a command name back into its id.
     * @param printer Produces the name a command is selected by.
     */
    template <typename T>
    fn addCommandSet(ValueParser<T> parser, ValuePrinter<T> printer) -> Result<CommandSetRegistrar<T>, RegistrationError>;

    /**
     * @brief Adds a command named @p name to this scope's command set.
     *
     * The command's scope inherits the positionals and options registered
     * so far. Prefer CommandSetRegistrar::addCommand.
     */
    fn addCommand(String name, String description, Option<UsageGroup> usageGroup) -> Result<AddedCommand, RegistrationError>;

   private:
    struct State {
      SharedPointer<const ArgConfig> config;
      SharedPointer<ArgumentSet>     args;
      Vec<UsageGroup>                usageGroups;
    };

    explicit ArgRegistry(SharedPointer<State> state);

    fn checkPositional(const String& name, bool isMandatory) const -> Result<Unit, RegistrationError>;
    fn resolveOption(const String& name, const Option<char>& shortName, const Option<FlagInverse>& inverse) const -> Result<Option<Flag>, RegistrationError>;
    fn checkCommandSet() const -> Result<Unit, RegistrationError>;

    fn addPositionalDefinition(PositionalDefinition definition) -> void;
    fn addOptionDefinition(OptionDefinition definition) -> void;
    fn setCommandSet(CommandSetDefinition commandSet) -> void;

    SharedPointer<State> m_state;
  };

  /**
   * @struct AddedCommand
   * @brief A newly added command and the registry of its scope.
   */
  struct AddedCommand {
    ArgRegistry                            registry;
    SharedPointer<const CommandDefinition> command;
  };

  /**
   * @brief Adds commands to a scope's command set and exposes the selection.
   */
  template <typename T>
  class CommandSetRegistrar {
   public:
    CommandSetRegistrar(ArgRegistry parent, Arg<T> selected, ValuePrinter<T> printer)
      : m_parent(std::move(parent)), m_selected(std::move(selected)), m_printer(std::move(printer)) {}

    /**
     * @brief Adds the command identified by @p id.
     */
    fn addCommand(const T& id, String description = {}, Option<UsageGroup> usageGroup = None) -> Result<AddedCommand, RegistrationError> {
      return m_parent.addCommand(m_printer(id), std::move(description), std::move(usageGroup));
    }

    /**
     * @brief The holder of the selected command's id.
     */
    [[nodiscard]] fn selected() const -> const Arg<T>& {
      return m_selected;
    }

    [[nodiscard]] fn printer() const -> const ValuePrinter<T>& {
      return m_printer;
    }

   private:
    ArgRegistry     m_parent;
    Arg<T>          m_selected;
    ValuePrinter<T> m_printer;
  };

  template <typename T>
  fn ArgRegistry::addCommandSet(ValueParser<T> parser, ValuePrinter<T> printer) -> Result<CommandSetRegistrar<T>, RegistrationError> {
    if (Result<Unit, RegistrationError> valid = checkCommandSet(); !valid)
      return Err(std::move(valid).error());

    SharedPointer<ValueCell<T>> cell = std::make_shared<ValueCell<T>>(ValueCell<T> { "command", None, false });

    setCommandSet(CommandSetDefinition {
      .target        = std::make_shared<AccumulatingTarget<T, T>>(cell, std::move(parser), DiscardAccumulator<T>()),
      .printSelected = [cell, printer]() -> Option<String> {
        if (!cell->value)
          return None;

        return printer(*cell->value);
      },
    });

    return CommandSetRegistrar<T>(*this, Arg<T>(cell), std::move(printer));
  }
} // namespace argon::core
