/**
 * @file Definition.hpp
 * @brief The declarative schema: positional, option and command definitions,
 * and the ArgumentSet aggregating them for one parsing scope.
 */

#pragma once

#include <variant> // std::variant

#include "Argon++/Core/Holder.hpp"
#include "Argon++/Utils/Definitions.hpp"
#include "Argon++/Utils/Types.hpp"

namespace argon::core {
  namespace {
    using utils::types::Fn;
    using utils::types::Map;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::SharedPointer;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::u8;
    using utils::types::Vec;
  } // namespace

  /**
   * @struct UsageGroup
   * @brief A named section of the usage text that arguments can be placed under.
   */
  struct UsageGroup {
    String name;

    fn operator==(const UsageGroup&) const -> bool = default;
  };

  /**
   * @brief Whether an argument is mandatory, or optional with a default value.
   */
  template <typename U>
  class Requires {
   public:
    static fn Mandatory() -> Requires {
      return Requires(true, None);
    }

    static fn Optional(U defaultValue) -> Requires {
      return Requires(false, std::move(defaultValue));
    }

    [[nodiscard]] fn isMandatory() const -> bool {
      return m_isMandatory;
    }

    [[nodiscard]] fn defaultValue() const -> const Option<U>& {
      return m_defaultValue;
    }

   private:
    Requires(const bool isMandatory, Option<U> defaultValue)
      : m_isMandatory(isMandatory), m_defaultValue(std::move(defaultValue)) {}

    bool      m_isMandatory;
    Option<U> m_defaultValue;
  };

  /**
   * @brief How the inverse name of a flag is chosen at registration time.
   */
  class FlagInverse {
   public:
    enum class Mode : u8 {
      Auto,     ///< Ask the config's inverse generator.
      Named,    ///< Use an explicitly given name.
      Disabled, ///< The flag has no inverse.
    };

    static fn Auto() -> FlagInverse {
      return FlagInverse(Mode::Auto, {});
    }

    static fn Named(String name) -> FlagInverse {
      return FlagInverse(Mode::Named, std::move(name));
    }

    static fn Disabled() -> FlagInverse {
      return FlagInverse(Mode::Disabled, {});
    }

    [[nodiscard]] fn mode() const -> Mode {
      return m_mode;
    }

    [[nodiscard]] fn name() const -> const String& {
      return m_name;
    }

   private:
    FlagInverse(const Mode mode, String name)
      : m_mode(mode), m_name(std::move(name)) {}

    Mode   m_mode;
    String m_name;
  };

  /**
   * @struct Flag
   * @brief Marks an option as boolean-valued; carries its resolved inverse name.
   */
  struct Flag {
    Option<String> inverse; ///< None if the flag has no inverse.
  };

  /**
   * @struct PositionalDefinition
   * @brief A registered positional argument.
   */
  struct PositionalDefinition {
    String                     name;
    String                     description;
    Option<UsageGroup>         usageGroup;
    bool                       isMandatory = true;
    bool                       isMulti     = false;
    Option<bool>               noOptionsFollowing; ///< Overrides ArgConfig::noOptionsAfterPositional when set.
    SharedPointer<ValueTarget> target;
  };

  /**
   * @struct OptionDefinition
   * @brief A registered option or flag. Options always have a default.
   */
  struct OptionDefinition {
    String                     name;
    String                     description;
    Option<String>             valueDescription; ///< Shown as `--name=<valueDescription>`, VALUE if unset.
    Option<UsageGroup>         usageGroup;
    Option<char>               shortName;
    Option<Flag>               flag;
    SharedPointer<ValueTarget> target;

    [[nodiscard]] fn isFlag() const -> bool {
      return flag.has_value();
    }

    [[nodiscard]] fn inverseName() const -> Option<String> {
      return flag ? flag->inverse : None;
    }
  };

  class ArgumentSet;
  class FrozenArgumentSet;

  /**
   * @struct CommandDefinition
   * @brief A registered command and the scope parsed once it is selected.
   */
  struct CommandDefinition {
    String                     name; ///< The printed form of the command's id.
    String                     description;
    Option<UsageGroup>         usageGroup;
    SharedPointer<ArgumentSet> scope; ///< Still being populated while registration is in progress.

    /**
     * @brief A frozen snapshot of the command's scope.
     */
    [[nodiscard]] fn args() const -> FrozenArgumentSet;
  };

  /**
   * @struct CommandSetDefinition
   * @brief The "exactly one command" slot of a scope.
   */
  struct CommandSetDefinition {
    SharedPointer<ValueTarget> target;        ///< Receives the selected command's name.
    Fn<Option<String>()>       printSelected; ///< The printed name of the selected id, None before selection.
  };

  /**
   * @brief Any of the definitions of a scope.
   */
  using Definition = std::variant<
    SharedPointer<const PositionalDefinition>,
    SharedPointer<const OptionDefinition>,
    SharedPointer<const CommandDefinition>>;

  /**
   * @struct NamedDefinition
   * @brief A definition together with the key it is indexed under.
   */
  struct NamedDefinition {
    String     key;
    Definition definition;
  };

  /**
   * @brief The full registered schema for one parsing scope.
   *
   * Populated by ArgRegistry; handed to the parse state machine through a
   * FrozenArgumentSet.
   */
  class ArgumentSet {
   public:
    ArgumentSet() = default;

    /**
     * @brief Creates the scope of a new command of @p parent.
     *
     * Positionals, options and short aliases are copied as they are now;
     * commands and the command set are never inherited.
     */
    static fn SubCommand(const ArgumentSet& parent) -> ArgumentSet;

    [[nodiscard]] fn positionals() const -> const Vec<SharedPointer<const PositionalDefinition>>& {
      return m_positionals;
    }

    [[nodiscard]] fn commands() const -> const Vec<SharedPointer<const CommandDefinition>>& {
      return m_commands;
    }

    [[nodiscard]] fn commandSet() const -> const Option<CommandSetDefinition>& {
      return m_commandSet;
    }

    /**
     * @brief Looks up an option by its name or its inverse name.
     * @return nullptr if no option is registered under @p name.
     */
    [[nodiscard]] fn findOption(StringView name) const -> SharedPointer<const OptionDefinition>;

    /**
     * @brief Looks up an option by its short alias.
     * @return nullptr if no option has this alias.
     */
    [[nodiscard]] fn findShort(char shortName) const -> SharedPointer<const OptionDefinition>;

    /**
     * @brief Looks up a command by its printed name.
     * @return nullptr if no command has this name.
     */
    [[nodiscard]] fn findCommand(StringView name) const -> SharedPointer<const CommandDefinition>;

    [[nodiscard]] fn hasPositional(StringView name) const -> bool;

    /**
     * @brief Every definition in the scope: commands, then positionals, then
     * options in registration order.
     * @param includeInverse Whether inverse flag names get their own entry.
     */
    [[nodiscard]] fn allDefinitions(bool includeInverse) const -> Vec<NamedDefinition>;

    fn addPositional(SharedPointer<const PositionalDefinition> positional) -> void;

    /**
     * @brief Indexes @p option under its name, its inverse name and its short alias.
     */
    fn addOption(const SharedPointer<const OptionDefinition>& option) -> void;

    fn addCommand(SharedPointer<const CommandDefinition> command) -> void;

    fn setCommandSet(CommandSetDefinition commandSet) -> void;

   private:
    Vec<SharedPointer<const PositionalDefinition>>     m_positionals;
    Map<String, SharedPointer<const OptionDefinition>> m_options;
    Vec<String>                                        m_optionKeys; ///< Keys of m_options in insertion order.
    Map<char, String>                                  m_shortToLong;
    Vec<SharedPointer<const CommandDefinition>>        m_commands;
    Option<CommandSetDefinition>                       m_commandSet;
  };

  /**
   * @brief A read-only snapshot of an ArgumentSet.
   *
   * Copies share the same snapshot.
   */
  class FrozenArgumentSet {
   public:
    explicit FrozenArgumentSet(const ArgumentSet& args)
      : m_args(std::make_shared<const ArgumentSet>(args)) {}

    fn operator->() const -> const ArgumentSet* {
      return m_args.get();
    }

    fn operator*() const -> const ArgumentSet& {
      return *m_args;
    }

   private:
    SharedPointer<const ArgumentSet> m_args;
  };
} // namespace argon::core
