#include "Argon++/ArgParser.hpp"

#include "Argon++/Core/ParserContext.hpp"
#include "Argon++/Utils/Types.hpp"

using namespace argon::utils::types;
using argon::core::Arg;
using argon::core::ArgConfig;
using argon::core::ArgRegistry;
using argon::core::FlagInverse;
using argon::core::FrozenArgumentSet;
using argon::core::Requires;
using argon::core::UsageGroup;
using argon::usage::UsageContext;
using argon::usage::UsageInfo;
using argon::usage::UsagePrinter;
using argon::utils::error::ParseError;
using argon::utils::error::RegistrationError;

namespace argon {
  fn ArgParser::args() const -> FrozenArgumentSet {
    return m_node->registry.args();
  }

  fn ArgParser::config() const -> const ArgConfig& {
    return m_node->registry.config();
  }

  fn ArgParser::info() const -> const UsageInfo& {
    return m_node->info;
  }

  fn ArgParser::usageContext() const -> const UsageContext& {
    return m_node->context;
  }

  fn ArgParser::usagePrinter() const -> const UsagePrinter& {
    return m_node->printer;
  }

  fn ArgParser::usageGroups() const -> const Vec<UsageGroup>& {
    return m_node->registry.usageGroups();
  }

  fn ArgParser::commandParser(const StringView id) const -> Option<CommandParser> {
    if (const auto iter = m_node->commandParsers.find(String(id)); iter != m_node->commandParsers.end())
      return CommandParser(iter->second);

    return None;
  }

  fn ArgParser::createUsageGroup(String name) -> Result<UsageGroup, RegistrationError> {
    return m_node->registry.createUsageGroup(std::move(name));
  }

  fn ArgParser::addPositionalS(String name, Requires<String> requirement, PositionalInfo info) -> Result<Arg<String>, RegistrationError> {
    return addPositional<String>(std::move(name), core::IdValueParser(), std::move(requirement), std::move(info));
  }

  fn ArgParser::addPositionalSN(String name, PositionalInfo info) -> Result<Arg<Option<String>>, RegistrationError> {
    return addPositionalN<String>(std::move(name), core::IdValueParser(), std::move(info));
  }

  fn ArgParser::addOptionS(String name, String defaultValue, OptionInfo info) -> Result<Arg<String>, RegistrationError> {
    return addOption<String>(std::move(name), std::move(defaultValue), core::IdValueParser(), std::move(info));
  }

  fn ArgParser::addOptionSN(String name, OptionInfo info) -> Result<Arg<Option<String>>, RegistrationError> {
    return addOptionN<String>(std::move(name), core::IdValueParser(), std::move(info));
  }

  fn ArgParser::addFlag(String name, FlagInfo info, const bool defaultValue) -> Result<Arg<bool>, RegistrationError> {
    return addMultiFlag<bool>(std::move(name), defaultValue, core::DiscardAccumulator<bool>(), std::move(info));
  }

  fn ArgParser::addCommandsS() -> Result<CommandSet<String>, RegistrationError> {
    return addCommands<String>(core::IdValueParser(), [](const String& id) -> String { return id; });
  }

  fn ArgParser::printUsage(std::ostream& sink, const bool showShortUsage) const -> void {
    m_node->printer(m_node->registry.args(), m_node->registry.config(), m_node->info, m_node->context, sink, showShortUsage);
  }

  fn ArgParser::DeepestSelected(const SharedPointer<Node>& node) -> SharedPointer<Node> {
    SharedPointer<Node> current = node;

    while (true) {
      const FrozenArgumentSet args = current->registry.args();

      const Option<core::CommandSetDefinition>& commandSet = args->commandSet();

      if (!commandSet || commandSet->target->isEmpty())
        break;

      const Option<String> selected = commandSet->printSelected();

      if (!selected)
        break;

      const auto iter = current->commandParsers.find(*selected);

      if (iter == current->commandParsers.end())
        break;

      current = iter->second;
    }

    return current;
  }

  fn CommandParser::command() const -> SharedPointer<const core::CommandDefinition> {
    return m_node->context.path().back();
  }

  AppArgParser::AppArgParser(UsageInfo info, UsagePrinter usagePrinter, ArgConfig config)
    : ArgParser(std::make_shared<Node>(Node {
        .registry       = ArgRegistry(std::move(config)),
        .info           = std::move(info),
        .context        = UsageContext(),
        .printer        = std::move(usagePrinter),
        .commandParsers = {},
      })) {}

  fn AppArgParser::parse(const Span<const String> tokens) const -> Result<Unit, ParseError> {
    return core::ParserContext::Parse(m_node->registry.config(), m_node->registry.args(), tokens);
  }

  fn AppArgParser::parseArgv(const i32 argc, const char* const* argv) const -> Result<Unit, ParseError> {
    Vec<String> tokens;

    for (i32 i = 1; i < argc; i++)
      tokens.emplace_back(argv[i]);

    return parse(tokens);
  }

  fn AppArgParser::parseOrQuit(const Span<const String> tokens, std::ostream& sink, const bool showShortUsage) const -> void {
    if (Result<Unit, ParseError> parsed = parse(tokens); !parsed) {
      sink << parsed.error().message << '\n';

      const SharedPointer<Node> deepest = DeepestSelected(m_node);
      deepest->printer(deepest->registry.args(), deepest->registry.config(), deepest->info, deepest->context, sink, showShortUsage);

      sink.flush();
      std::exit(1);
    }
  }

  fn AppArgParser::addHelpOption(HelpInfo help) -> Result<Arg<bool>, RegistrationError> {
    std::ostream* sink = help.sink != nullptr ? help.sink : &std::cout;

    return addFlag(
      std::move(help.name),
      FlagInfo {
        .description = std::move(help.description),
        .usageGroup  = None,
        .shortName   = help.shortName,
        .inverse     = FlagInverse::Disabled(),
        .onParse     = [root = WeakPointer<Node>(m_node), sink](bool /*value*/) {
          const SharedPointer<Node> node = root.lock();

          if (!node)
            return;

          const SharedPointer<Node> deepest = DeepestSelected(node);
          deepest->printer(deepest->registry.args(), deepest->registry.config(), deepest->info, deepest->context, *sink, false);

          sink->flush();
          std::exit(0);
        },
      }
    );
  }
} // namespace argon
