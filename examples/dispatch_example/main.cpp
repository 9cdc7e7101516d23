/**
 * @file main.cpp
 * @brief Argon++ handler dispatch example
 *
 * The same two commands as argon-demo (`add` and `echo`), written as
 * handlers: the application handler owns the shared `--verbose` flag and each
 * command handler registers and runs its own arguments.
 */

#include <cstdlib>
#include <limits> // std::numeric_limits

#include <Argon++/ArgParser.hpp>
#include <Argon++/Core/Value.hpp>
#include <Argon++/Dispatch.hpp>
#include <Argon++/Utils/Error.hpp>
#include <Argon++/Utils/Logging.hpp>
#include <Argon++/Utils/Types.hpp>

using namespace argon::utils::types;
using argon::ArgParser;
using argon::core::Arg;
using argon::dispatch::AppHandler;
using argon::dispatch::CommandHandler;
using argon::dispatch::CommandHandlerSet;
using argon::dispatch::HandlerContext;
using argon::dispatch::WithCommands;
using argon::usage::UsageInfo;
using argon::utils::error::RegistrationError;
using argon::utils::error::ValueParserError;
using argon::utils::logging::Println;

namespace {
  class DispatchExampleHandler;

  fn CheckedSum(const i64 lhs, const i64 rhs) -> Option<i64> {
    if ((rhs > 0 && lhs > std::numeric_limits<i64>::max() - rhs) || (rhs < 0 && lhs < std::numeric_limits<i64>::min() - rhs))
      return None;

    return lhs + rhs;
  }

  class CommandAdd final : public CommandHandler<String> {
   public:
    [[nodiscard]] fn id() const -> String override {
      return "add";
    }

    [[nodiscard]] fn description() const -> String override {
      return "Add two numbers";
    }

    fn registerArgs(ArgParser& parser) -> Result<Unit, RegistrationError> override;
    fn run(HandlerContext& context) -> void override;

   private:
    Arg<i64> m_a;
    Arg<i64> m_b;
  };

  class CommandEcho final : public CommandHandler<String> {
   public:
    [[nodiscard]] fn id() const -> String override {
      return "echo";
    }

    [[nodiscard]] fn description() const -> String override {
      return "Print a string";
    }

    fn registerArgs(ArgParser& parser) -> Result<Unit, RegistrationError> override {
      Result<Arg<String>, RegistrationError> string =
        parser.addPositionalS("string", argon::core::Requires<String>::Optional(""), { .description = "The string" });

      if (!string)
        return Err(std::move(string).error());

      Result<Arg<i32>, RegistrationError> lines = parser.addOption<i32>(
        "count",
        1,
        argon::core::Also(argon::core::IntValueParser<i32>(), [](const i32 count) -> Result<Unit, ValueParserError> {
          if (count <= 0)
            return Err(ValueParserError { "Must be >0" });

          return {};
        }),
        { .description = "Number of times to print the line (default: 1)", .shortName = 'c' }
      );

      if (!lines)
        return Err(std::move(lines).error());

      m_string = *string;
      m_lines  = *lines;
      return {};
    }

    fn run(HandlerContext& /*context*/) -> void override {
      for (i32 i = 0; i < m_lines.value(); i++)
        Println("{}", m_string.value());
    }

   private:
    Arg<String> m_string;
    Arg<i32>    m_lines;
  };

  class DispatchExampleHandler final : public AppHandler, public WithCommands {
   public:
    DispatchExampleHandler() {
      m_commands.add(std::make_unique<CommandAdd>());
      m_commands.add(std::make_unique<CommandEcho>());
    }

    [[nodiscard]] fn usageInfo() const -> UsageInfo override {
      return {
        .application = "argon-dispatch-example",
        .prologue    = "This is another boring example.",
        .epilogue    = "Copyright Foo Bar Productions Inc.",
      };
    }

    fn commands() -> CommandHandlerSet<String>& override {
      return m_commands;
    }

    fn registerArgs(ArgParser& parser) -> Result<Unit, RegistrationError> override {
      Result<argon::core::UsageGroup, RegistrationError> loggingGroup = parser.createUsageGroup("Logging options");

      if (!loggingGroup)
        return Err(std::move(loggingGroup).error());

      Result<Arg<i32>, RegistrationError> verbose = parser.addMultiFlag<i32>(
        "verbose",
        0,
        argon::core::FlagCountAccumulator(),
        { .description = "Increase verbosity", .usageGroup = *loggingGroup, .shortName = 'v' }
      );

      if (!verbose)
        return Err(std::move(verbose).error());

      m_verbose = *verbose;
      return {};
    }

    fn run(HandlerContext& /*context*/) -> void override {
      if (m_verbose.value() >= 1)
        Println("V1: command: {}", m_commands.selected());
    }

    [[nodiscard]] fn verbosity() const -> i32 {
      return m_verbose.value();
    }

   private:
    CommandHandlerSet<String> m_commands;
    Arg<i32>                  m_verbose;
  };

  fn CommandAdd::registerArgs(ArgParser& parser) -> Result<Unit, RegistrationError> {
    Result<Arg<i64>, RegistrationError> first = parser.addPositional("a", argon::core::IntValueParser());

    if (!first)
      return Err(std::move(first).error());

    Result<Arg<i64>, RegistrationError> second = parser.addPositional("b", argon::core::IntValueParser());

    if (!second)
      return Err(std::move(second).error());

    m_a = *first;
    m_b = *second;
    return {};
  }

  fn CommandAdd::run(HandlerContext& context) -> void {
    if (const DispatchExampleHandler* app = context.parent<DispatchExampleHandler>(); app && app->verbosity() >= 2) {
      Println("V2: a: {}", m_a.value());
      Println("V2: b: {}", m_b.value());
    }

    const Option<i64> sum = CheckedSum(m_a.value(), m_b.value());

    if (!sum) {
      error_log("{} + {} does not fit in a 64-bit integer", m_a.value(), m_b.value());
      std::exit(EXIT_FAILURE);
    }

    Println("{}", *sum);
  }
} // namespace

fn main(const i32 argc, char* argv[]) -> i32 try {
  DispatchExampleHandler app;

  app.runAppOrQuit(Vec<String>(argv + 1, argv + argc));

  return EXIT_SUCCESS;
} catch (const Exception& e) {
  error_at(e);
  return EXIT_FAILURE;
}
