#include "Argon++/Dispatch.hpp"

#include <cstdlib>  // std::exit
#include <iostream> // std::cerr

#include "Argon++/Utils/Logging.hpp"
#include "Argon++/Utils/Types.hpp"

using namespace argon::utils::types;
using argon::utils::error::ParseError;
using argon::utils::error::RegistrationError;

namespace argon::dispatch {
  fn AppHandler::buildParser() -> Result<AppArgParser, RegistrationError> {
    Option<UsagePrinter> printer = usagePrinter();

    AppArgParser parser(usageInfo(), printer ? std::move(*printer) : usage::DefaultUsagePrinter::Create(), config());

    if (addHelp())
      if (Result<core::Arg<bool>, RegistrationError> help = parser.addHelpOption(); !help)
        return Err(std::move(help).error());

    if (Result<Unit, RegistrationError> registered = registerArgs(parser); !registered)
      return Err(std::move(registered).error());

    if (auto* withCommands = dynamic_cast<WithCommands*>(this))
      if (Result<Unit, RegistrationError> registered = RegisterCommands(parser, *withCommands); !registered)
        return Err(std::move(registered).error());

    return parser;
  }

  fn AppHandler::RegisterCommands(ArgParser& parent, WithCommands& handler) -> Result<Unit, RegistrationError> {
    CommandHandlerSetBase& commands = handler.commands();

    if (commands.empty())
      return {};

    Result<Vec<Pair<Handler*, CommandParser>>, RegistrationError> added = commands.addTo(parent);

    if (!added)
      return Err(std::move(added).error());

    for (auto& [child, parser] : *added) {
      if (Result<Unit, RegistrationError> registered = child->registerArgs(parser); !registered)
        return Err(std::move(registered).error());

      if (auto* withCommands = dynamic_cast<WithCommands*>(child))
        if (Result<Unit, RegistrationError> registered = RegisterCommands(parser, *withCommands); !registered)
          return Err(std::move(registered).error());
    }

    return {};
  }

  fn AppHandler::RunWithCommands(Handler& handler, HandlerContext& context) -> void {
    handler.run(context);

    auto* withCommands = dynamic_cast<WithCommands*>(&handler);

    if (!withCommands || withCommands->commands().empty())
      return;

    context.add(handler);

    const CommandHandlerSetBase& commands = withCommands->commands();

    Handler* selected = commands.selectedHandler();

    if (!selected)
      return;

    debug_log("Dispatching to command '{}'", commands.selectedName());

    RunWithCommands(*selected, context);
  }

  fn AppHandler::runApp(const Span<const String> tokens) -> Result<Unit, AppError> {
    Result<AppArgParser, RegistrationError> parser = buildParser();

    if (!parser)
      return Err(AppError(std::move(parser).error()));

    if (Result<Unit, ParseError> parsed = parser->parse(tokens); !parsed)
      return Err(AppError(std::move(parsed).error()));

    HandlerContext context;
    RunWithCommands(*this, context);

    return {};
  }

  fn AppHandler::runAppOrQuit(const Span<const String> tokens) -> void {
    Result<AppArgParser, RegistrationError> parser = buildParser();

    if (!parser) {
      error_at(parser.error());
      std::exit(1);
    }

    parser->parseOrQuit(tokens, std::cerr);

    HandlerContext context;
    RunWithCommands(*this, context);
  }
} // namespace argon::dispatch
