#include "Argon++/Core/Registry.hpp"

#include <algorithm> // std::ranges::find
#include <cctype>    // std::isspace

#include "Argon++/Utils/Error.hpp"
#include "Argon++/Utils/Types.hpp"

using namespace argon::utils::types;
using argon::utils::error::RegistrationError;
using enum argon::utils::error::RegistrationErrorCode;

namespace argon::core {
  ArgRegistry::ArgRegistry(ArgConfig config)
    : m_state(std::make_shared<State>(State {
        .config      = std::make_shared<const ArgConfig>(std::move(config)),
        .args        = std::make_shared<ArgumentSet>(),
        .usageGroups = {},
      })) {}

  ArgRegistry::ArgRegistry(SharedPointer<State> state)
    : m_state(std::move(state)) {}

  fn ArgRegistry::SubCommand(const ArgRegistry& parent) -> ArgRegistry {
    return ArgRegistry(std::make_shared<State>(State {
      .config      = parent.m_state->config,
      .args        = std::make_shared<ArgumentSet>(ArgumentSet::SubCommand(*parent.m_state->args)),
      .usageGroups = {},
    }));
  }

  fn ArgRegistry::config() const -> const ArgConfig& {
    return *m_state->config;
  }

  fn ArgRegistry::args() const -> FrozenArgumentSet {
    return FrozenArgumentSet(*m_state->args);
  }

  fn ArgRegistry::usageGroups() const -> const Vec<UsageGroup>& {
    return m_state->usageGroups;
  }

  fn ArgRegistry::createUsageGroup(String name) -> Result<UsageGroup, RegistrationError> {
    UsageGroup group { .name = std::move(name) };

    if (std::ranges::find(m_state->usageGroups, group) != m_state->usageGroups.end())
      return Err(RegistrationError(DuplicateUsageGroup, group.name, std::format("Duplicate usage group: {}", group.name)));

    m_state->usageGroups.push_back(group);
    return group;
  }

  fn ArgRegistry::addCommand(String name, String description, Option<UsageGroup> usageGroup) -> Result<AddedCommand, RegistrationError> {
    if (m_state->args->findCommand(name))
      return Err(RegistrationError(DuplicateCommand, name, std::format("Duplicate command: {}", name)));

    ArgRegistry child = SubCommand(*this);

    SharedPointer<const CommandDefinition> command = std::make_shared<const CommandDefinition>(CommandDefinition {
      .name        = std::move(name),
      .description = std::move(description),
      .usageGroup  = std::move(usageGroup),
      .scope       = child.m_state->args,
    });

    m_state->args->addCommand(command);

    return AddedCommand { .registry = std::move(child), .command = std::move(command) };
  }

  fn ArgRegistry::checkPositional(const String& name, const bool isMandatory) const -> Result<Unit, RegistrationError> {
    const ArgumentSet& args = *m_state->args;

    if (args.hasPositional(name))
      return Err(RegistrationError(DuplicateArgument, name, std::format("Duplicate argument: {}", name)));

    if (args.positionals().empty())
      return {};

    const PositionalDefinition& last = *args.positionals().back();

    if (!last.isMandatory && isMandatory)
      return Err(RegistrationError(MandatoryAfterOptional, name, std::format("Mandatory positional {} cannot come after optional positional {}", name, last.name)));

    if (last.isMulti)
      return Err(RegistrationError(MultiValuedNotLast, name, std::format("Positional {} cannot follow multi-valued positional {}", name, last.name)));

    return {};
  }

  fn ArgRegistry::resolveOption(const String& name, const Option<char>& shortName, const Option<FlagInverse>& inverse) const -> Result<Option<Flag>, RegistrationError> {
    const ArgumentSet& args = *m_state->args;

    if (args.findOption(name))
      return Err(RegistrationError(DuplicateArgument, name, std::format("Duplicate argument: {}", name)));

    if (shortName) {
      const char alias = *shortName;

      if (alias == '\0' || alias == '=' || std::isspace(static_cast<unsigned char>(alias)))
        return Err(RegistrationError(InvalidShortAlias, String(1, alias), std::format("Invalid short alias for {}: '{}'", name, alias)));

      if (args.findShort(alias))
        return Err(RegistrationError(DuplicateShortAlias, String(1, alias), std::format("Duplicate short alias: {}", alias)));
    }

    if (!inverse)
      return Option<Flag>();

    Option<String> inverseName;

    switch (inverse->mode()) {
      case FlagInverse::Mode::Auto:
        if (const InverseGenerator& generator = m_state->config->inverseGenerator)
          inverseName = generator(name);
        break;
      case FlagInverse::Mode::Named:
        if (inverse->name().empty())
          return Err(RegistrationError(InvalidInverseName, name, std::format("Empty inverse name for flag {}", name)));

        inverseName = inverse->name();
        break;
      case FlagInverse::Mode::Disabled:
        break;
    }

    if (inverseName && (*inverseName == name || args.findOption(*inverseName)))
      return Err(RegistrationError(DuplicateArgument, *inverseName, std::format("Duplicate argument: {} (inverse of {})", *inverseName, name)));

    return Flag { .inverse = std::move(inverseName) };
  }

  fn ArgRegistry::checkCommandSet() const -> Result<Unit, RegistrationError> {
    if (m_state->args->commandSet())
      return Err(RegistrationError(DuplicateCommandSet, "command", "Already added a command set"));

    return {};
  }

  fn ArgRegistry::addPositionalDefinition(PositionalDefinition definition) -> void {
    m_state->args->addPositional(std::make_shared<const PositionalDefinition>(std::move(definition)));
  }

  fn ArgRegistry::addOptionDefinition(OptionDefinition definition) -> void {
    m_state->args->addOption(std::make_shared<const OptionDefinition>(std::move(definition)));
  }

  fn ArgRegistry::setCommandSet(CommandSetDefinition commandSet) -> void {
    m_state->args->setCommandSet(std::move(commandSet));
  }
} // namespace argon::core
