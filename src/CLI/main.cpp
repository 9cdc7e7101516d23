#include <cstdlib> // EXIT_SUCCESS, EXIT_FAILURE
#include <limits>  // std::numeric_limits

#include <Argon++/ArgParser.hpp>
#include <Argon++/Core/Config.hpp>
#include <Argon++/Core/Value.hpp>
#include <Argon++/Utils/Env.hpp>
#include <Argon++/Utils/Error.hpp>
#include <Argon++/Utils/Logging.hpp>
#include <Argon++/Utils/Types.hpp>

using namespace argon::utils::types;
using namespace argon::utils::logging;
using argon::core::ArgConfig;
using argon::utils::error::ValueParserError;

namespace {
  enum class Command : u8 {
    add,
    echo,
  };

  fn CheckAboveZero(const i32 value) -> Result<Unit, ValueParserError> {
    if (value <= 0)
      return Err(ValueParserError { "Must be >0" });

    return {};
  }

  fn CheckedSum(const i64 lhs, const i64 rhs) -> Option<i64> {
    if ((rhs > 0 && lhs > std::numeric_limits<i64>::max() - rhs) || (rhs < 0 && lhs < std::numeric_limits<i64>::min() - rhs))
      return None;

    return lhs + rhs;
  }

  // `ARGON_DEMO_CONFIG` may point at a TOML file overriding the parsing policy.
  fn LoadConfig() -> ArgConfig {
    ArgConfig config        = ArgConfig::Default();
    config.inverseGenerator = argon::core::PrefixInverseGenerator();

#if ARGON_TOML_CONFIG
    if (const Result<String> path = argon::utils::env::GetEnv("ARGON_DEMO_CONFIG")) {
      Result<ArgConfig> loaded = ArgConfig::FromFile(*path);

      if (loaded)
        return std::move(*loaded);

      warn_at(loaded.error());
    }
#endif

    return config;
  }

  template <typename T>
  fn Check(Result<T, argon::utils::error::RegistrationError> registered) -> T {
    if (!registered) {
      error_at(registered.error());
      std::exit(EXIT_FAILURE);
    }

    return std::move(*registered);
  }
} // namespace

fn main(const i32 argc, char* argv[]) -> i32 try {
  argon::AppArgParser parser(
    argon::usage::UsageInfo {
      .application = "argon-demo",
      .prologue    = "This example is boring.",
      .epilogue    = "Copyright Foo Bar Productions Inc.",
    },
    argon::usage::DefaultUsagePrinter::Create(),
    LoadConfig()
  );

  Check(parser.addHelpOption());

  const argon::core::UsageGroup loggingGroup = Check(parser.createUsageGroup("Logging options"));

  const argon::core::Arg<i32> verbose = Check(parser.addMultiFlag<i32>(
    "verbose",
    0,
    argon::core::FlagCountAccumulator(),
    { .description = "Increase verbosity", .usageGroup = loggingGroup, .shortName = 'v' }
  ));

  argon::CommandSet<Command> commands = Check(parser.addEnumCommands<Command>());

  argon::CommandParser add = Check(commands.addCommand(Command::add, { .description = "Add two numbers" }));

  const argon::core::Arg<i64> addA = Check(add.addPositional("a", argon::core::IntValueParser()));
  const argon::core::Arg<i64> addB = Check(add.addPositional("b", argon::core::IntValueParser()));

  argon::CommandParser echo = Check(commands.addCommand(Command::echo, { .description = "Print a string" }));

  const argon::core::Arg<String> echoString = Check(echo.addPositionalS("string", argon::core::Requires<String>::Mandatory(), { .description = "The string" }));

  const argon::core::Arg<i32> echoLines = Check(echo.addOption<i32>(
    "count",
    1,
    argon::core::Also(argon::core::IntValueParser<i32>(), CheckAboveZero),
    { .description = "Number of times to print the line (default: 1)", .shortName = 'c' }
  ));

  Vec<String> tokens(argv + 1, argv + argc);
  parser.parseOrQuit(tokens);

  if (verbose.value() >= 2)
    SetRuntimeLogLevel(LogLevel::Debug);

  debug_log("Parsed {} token(s)", tokens.size());

  if (verbose.value() >= 1)
    Println("V1: command: {}", magic_enum::enum_name(commands.selected()));

  switch (commands.selected()) {
    case Command::add:
      if (verbose.value() >= 2) {
        Println("V2: a: {}", addA.value());
        Println("V2: b: {}", addB.value());
      }

      if (const Option<i64> sum = CheckedSum(addA.value(), addB.value()))
        Println("{}", *sum);
      else {
        error_log("{} + {} does not fit in a 64-bit integer", addA.value(), addB.value());
        return EXIT_FAILURE;
      }
      break;
    case Command::echo:
      for (i32 i = 0; i < echoLines.value(); i++)
        Println("{}", echoString.value());
      break;
  }

  Println("{}", verbose.value());

  return EXIT_SUCCESS;
} catch (const Exception& e) {
  error_at(e);
  return EXIT_FAILURE;
}
