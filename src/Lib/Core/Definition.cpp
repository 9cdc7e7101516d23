#include "Argon++/Core/Definition.hpp"

#include <algorithm> // std::ranges::{any_of, find_if}

#include "Argon++/Utils/Types.hpp"

using namespace argon::utils::types;

namespace argon::core {
  fn CommandDefinition::args() const -> FrozenArgumentSet {
    return FrozenArgumentSet(*scope);
  }

  fn ArgumentSet::SubCommand(const ArgumentSet& parent) -> ArgumentSet {
    ArgumentSet child;

    child.m_positionals = parent.m_positionals;
    child.m_options     = parent.m_options;
    child.m_optionKeys  = parent.m_optionKeys;
    child.m_shortToLong = parent.m_shortToLong;

    return child;
  }

  fn ArgumentSet::findOption(const StringView name) const -> SharedPointer<const OptionDefinition> {
    if (const auto iter = m_options.find(String(name)); iter != m_options.end())
      return iter->second;

    return nullptr;
  }

  fn ArgumentSet::findShort(const char shortName) const -> SharedPointer<const OptionDefinition> {
    if (const auto iter = m_shortToLong.find(shortName); iter != m_shortToLong.end())
      return findOption(iter->second);

    return nullptr;
  }

  fn ArgumentSet::findCommand(const StringView name) const -> SharedPointer<const CommandDefinition> {
    const auto iter = std::ranges::find_if(m_commands, [name](const SharedPointer<const CommandDefinition>& command) {
      return command->name == name;
    });

    return iter != m_commands.end() ? *iter : nullptr;
  }

  fn ArgumentSet::hasPositional(const StringView name) const -> bool {
    return std::ranges::any_of(m_positionals, [name](const SharedPointer<const PositionalDefinition>& positional) {
      return positional->name == name;
    });
  }

  fn ArgumentSet::allDefinitions(const bool includeInverse) const -> Vec<NamedDefinition> {
    Vec<NamedDefinition> definitions;
    definitions.reserve(m_commands.size() + m_positionals.size() + m_optionKeys.size());

    for (const SharedPointer<const CommandDefinition>& command : m_commands)
      definitions.push_back({ command->name, command });

    for (const SharedPointer<const PositionalDefinition>& positional : m_positionals)
      definitions.push_back({ positional->name, positional });

    for (const String& key : m_optionKeys) {
      const SharedPointer<const OptionDefinition>& option = m_options.at(key);

      if (!includeInverse && key != option->name)
        continue;

      definitions.push_back({ key, option });
    }

    return definitions;
  }

  fn ArgumentSet::addPositional(SharedPointer<const PositionalDefinition> positional) -> void {
    m_positionals.push_back(std::move(positional));
  }

  fn ArgumentSet::addOption(const SharedPointer<const OptionDefinition>& option) -> void {
    m_options[option->name] = option;
    m_optionKeys.push_back(option->name);

    if (Option<String> inverse = option->inverseName()) {
      m_options[*inverse] = option;
      m_optionKeys.push_back(*inverse);
    }

    if (option->shortName)
      m_shortToLong[*option->shortName] = option->name;
  }

  fn ArgumentSet::addCommand(SharedPointer<const CommandDefinition> command) -> void {
    m_commands.push_back(std::move(command));
  }

  fn ArgumentSet::setCommandSet(CommandSetDefinition commandSet) -> void {
    m_commandSet = std::move(commandSet);
  }
} // namespace argon::core
