#include <cctype>   // std::tolower
#include <optional> // std::bad_optional_access

#include <Argon++/ArgParser.hpp>
#include <Argon++/Core/Value.hpp>
#include <Argon++/Utils/Error.hpp>
#include <Argon++/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace argon::utils::types;
using argon::AppArgParser;
using argon::CommandParser;
using argon::CommandSet;
using argon::core::Arg;
using argon::utils::error::ParseError;
using argon::utils::error::ParseErrorKind;
using argon::utils::error::RegistrationError;

namespace {
  enum class Tool : u8 {
    Build,
    Test,
  };
} // namespace

class CommandTest : public testing::Test {
 protected:
  AppArgParser parser;
};

TEST_F(CommandTest, SelectedCommand_OnlyItsFlagIsSet) {
  Result<CommandSet<String>, RegistrationError> commands = parser.addCommandsS();
  ASSERT_TRUE(commands);

  Result<CommandParser, RegistrationError> commandA = commands->addCommand("a");
  Result<CommandParser, RegistrationError> commandB = commands->addCommand("b");
  ASSERT_TRUE(commandA && commandB);

  Result<Arg<bool>, RegistrationError> flagA = commandA->addFlag("c");
  Result<Arg<bool>, RegistrationError> flagB = commandB->addFlag("c");
  ASSERT_TRUE(flagA && flagB);

  const Vec<String> tokens = { "b", "--c" };
  ASSERT_TRUE(parser.parse(tokens));

  EXPECT_EQ(commands->selected(), "b");
  EXPECT_FALSE(flagA->value());
  EXPECT_TRUE(flagB->value());
}

TEST_F(CommandTest, UnknownName_UnknownCommand) {
  Result<CommandSet<String>, RegistrationError> commands = parser.addCommandsS();
  ASSERT_TRUE(commands);
  ASSERT_TRUE(commands->addCommand("a"));
  ASSERT_TRUE(commands->addCommand("b"));

  const Vec<String> tokens = { "c" };

  Result<Unit, ParseError> parsed = parser.parse(tokens);
  ASSERT_FALSE(parsed);
  EXPECT_EQ(parsed.error().kind, ParseErrorKind::UnknownCommand);
  EXPECT_EQ(parsed.error().names, Vec<String> { "c" });
  EXPECT_EQ(parsed.error().message, "Unknown command: c");
}

TEST_F(CommandTest, NoTokens_MissingCommand) {
  Result<CommandSet<String>, RegistrationError> commands = parser.addCommandsS();
  ASSERT_TRUE(commands);
  ASSERT_TRUE(commands->addCommand("a"));

  Result<Unit, ParseError> parsed = parser.parse(Vec<String> {});
  ASSERT_FALSE(parsed);
  EXPECT_EQ(parsed.error().kind, ParseErrorKind::MissingCommand);
  EXPECT_EQ(parsed.error().message, "A command is required");
  EXPECT_FALSE(commands->hasSelection());
}

TEST_F(CommandTest, PendingOptionValue_MissingCommandWins) {
  ASSERT_TRUE(parser.addOptionS("a", ""));

  Result<CommandSet<String>, RegistrationError> commands = parser.addCommandsS();
  ASSERT_TRUE(commands);
  ASSERT_TRUE(commands->addCommand("b"));

  const Vec<String> tokens = { "--a" };

  Result<Unit, ParseError> parsed = parser.parse(tokens);
  ASSERT_FALSE(parsed);
  EXPECT_EQ(parsed.error().kind, ParseErrorKind::MissingCommand);
}

TEST_F(CommandTest, CommandScope_MissingPositionalBeforePendingValue) {
  Result<CommandSet<String>, RegistrationError> commands = parser.addCommandsS();
  ASSERT_TRUE(commands);

  Result<CommandParser, RegistrationError> build = commands->addCommand("build");
  ASSERT_TRUE(build);
  ASSERT_TRUE(build->addOptionS("out", ""));
  ASSERT_TRUE(build->addPositionalS("target"));

  const Vec<String> tokens = { "build", "--out" };

  Result<Unit, ParseError> parsed = parser.parse(tokens);
  ASSERT_FALSE(parsed);
  EXPECT_EQ(parsed.error().kind, ParseErrorKind::MissingPositionals);
  EXPECT_EQ(parsed.error().names, Vec<String> { "target" });
}

TEST_F(CommandTest, Selected_ThrowsBeforeParsing) {
  Result<CommandSet<String>, RegistrationError> commands = parser.addCommandsS();
  ASSERT_TRUE(commands);

  EXPECT_FALSE(commands->hasSelection());
  EXPECT_THROW((void)commands->selected(), std::bad_optional_access);
}

TEST_F(CommandTest, FirstPositional_IsAlwaysTheCommandName) {
  Result<Arg<String>, RegistrationError> positional = parser.addPositionalS("target", argon::core::Requires<String>::Optional(""));
  ASSERT_TRUE(positional);

  Result<CommandSet<String>, RegistrationError> commands = parser.addCommandsS();
  ASSERT_TRUE(commands);
  ASSERT_TRUE(commands->addCommand("run"));

  const Vec<String> tokens = { "lib", "run" };

  Result<Unit, ParseError> parsed = parser.parse(tokens);
  ASSERT_FALSE(parsed);
  EXPECT_EQ(parsed.error().kind, ParseErrorKind::UnknownCommand);
  EXPECT_EQ(parsed.error().names, Vec<String> { "lib" });
}

TEST_F(CommandTest, InheritedPositional_FilledAfterCommandName) {
  Result<Arg<String>, RegistrationError> target = parser.addPositionalS("target");
  ASSERT_TRUE(target);

  Result<CommandSet<String>, RegistrationError> commands = parser.addCommandsS();
  ASSERT_TRUE(commands);

  Result<CommandParser, RegistrationError> run = commands->addCommand("run");
  ASSERT_TRUE(run);

  Result<Arg<String>, RegistrationError> mode = run->addPositionalS("mode");
  ASSERT_TRUE(mode);

  const Vec<String> tokens = { "run", "lib", "fast" };
  ASSERT_TRUE(parser.parse(tokens));

  EXPECT_EQ(target->value(), "lib");
  EXPECT_EQ(mode->value(), "fast");
}

TEST_F(CommandTest, InheritedOption_SharesHolderAcrossScopes) {
  Result<Arg<Vec<String>>, RegistrationError> option =
    parser.addMultiOptionS<Vec<String>>("b", {}, argon::core::ListAccumulator<String>());
  ASSERT_TRUE(option);

  Result<CommandSet<String>, RegistrationError> commands = parser.addCommandsS();
  ASSERT_TRUE(commands);

  Result<CommandParser, RegistrationError> command = commands->addCommand("a");
  ASSERT_TRUE(command);

  Result<Arg<String>, RegistrationError> positional = command->addPositionalS("c");
  ASSERT_TRUE(positional);

  const Vec<String> tokens = { "--b=1", "a", "--b=2", "x" };
  ASSERT_TRUE(parser.parse(tokens));

  EXPECT_EQ(option->value(), (Vec<String> { "1", "2" }));
  EXPECT_EQ(positional->value(), "x");
}

TEST_F(CommandTest, LaterParentOptions_AreNotInherited) {
  Result<CommandSet<String>, RegistrationError> commands = parser.addCommandsS();
  ASSERT_TRUE(commands);
  ASSERT_TRUE(commands->addCommand("a"));

  ASSERT_TRUE(parser.addFlag("late"));

  const Vec<String> tokens = { "a", "--late" };

  Result<Unit, ParseError> parsed = parser.parse(tokens);
  ASSERT_FALSE(parsed);
  EXPECT_EQ(parsed.error().kind, ParseErrorKind::UnknownOption);
}

TEST_F(CommandTest, CommandScope_ReportsItsOwnMissingPositionals) {
  Result<CommandSet<String>, RegistrationError> commands = parser.addCommandsS();
  ASSERT_TRUE(commands);

  Result<CommandParser, RegistrationError> copy = commands->addCommand("copy");
  ASSERT_TRUE(copy);
  ASSERT_TRUE(copy->addPositionalS("source"));
  ASSERT_TRUE(copy->addPositionalS("destination"));

  const Vec<String> tokens = { "copy", "a.txt" };

  Result<Unit, ParseError> parsed = parser.parse(tokens);
  ASSERT_FALSE(parsed);
  EXPECT_EQ(parsed.error().kind, ParseErrorKind::MissingPositionals);
  EXPECT_EQ(parsed.error().names, Vec<String> { "destination" });
  EXPECT_EQ(commands->selected(), "copy");
}

TEST_F(CommandTest, NestedCommands_SelectAtEveryLevel) {
  Result<CommandSet<String>, RegistrationError> top = parser.addCommandsS();
  ASSERT_TRUE(top);

  Result<CommandParser, RegistrationError> remote = top->addCommand("remote");
  ASSERT_TRUE(remote);

  Result<Arg<bool>, RegistrationError> verbose = remote->addFlag("verbose", { .shortName = 'v' });
  ASSERT_TRUE(verbose);

  Result<CommandSet<String>, RegistrationError> nested = remote->addCommandsS();
  ASSERT_TRUE(nested);

  Result<CommandParser, RegistrationError> add = nested->addCommand("add");
  ASSERT_TRUE(add);
  ASSERT_TRUE(nested->addCommand("remove"));

  Result<Arg<String>, RegistrationError> name = add->addPositionalS("name");
  ASSERT_TRUE(name);

  const Vec<String> tokens = { "remote", "-v", "add", "origin" };
  ASSERT_TRUE(parser.parse(tokens));

  EXPECT_EQ(top->selected(), "remote");
  EXPECT_EQ(nested->selected(), "add");
  EXPECT_TRUE(verbose->value());
  EXPECT_EQ(name->value(), "origin");
}

TEST_F(CommandTest, NestedCommandSet_MissingAtInnerLevel) {
  Result<CommandSet<String>, RegistrationError> top = parser.addCommandsS();
  ASSERT_TRUE(top);

  Result<CommandParser, RegistrationError> remote = top->addCommand("remote");
  ASSERT_TRUE(remote);

  Result<CommandSet<String>, RegistrationError> nested = remote->addCommandsS();
  ASSERT_TRUE(nested);
  ASSERT_TRUE(nested->addCommand("add"));

  const Vec<String> tokens = { "remote" };

  Result<Unit, ParseError> parsed = parser.parse(tokens);
  ASSERT_FALSE(parsed);
  EXPECT_EQ(parsed.error().kind, ParseErrorKind::MissingCommand);
}

TEST_F(CommandTest, SiblingCommands_AreNotInherited) {
  Result<CommandSet<String>, RegistrationError> top = parser.addCommandsS();
  ASSERT_TRUE(top);

  Result<CommandParser, RegistrationError> first = top->addCommand("first");
  ASSERT_TRUE(first);
  ASSERT_TRUE(top->addCommand("second"));

  Result<Arg<String>, RegistrationError> positional = first->addPositionalS("arg", argon::core::Requires<String>::Optional(""));
  ASSERT_TRUE(positional);

  const Vec<String> tokens = { "first", "second" };
  ASSERT_TRUE(parser.parse(tokens));

  EXPECT_EQ(positional->value(), "second");
  EXPECT_TRUE(first->args()->commands().empty());
}

TEST_F(CommandTest, EnumCommands_SelectEnumerator) {
  Result<CommandSet<Tool>, RegistrationError> commands = parser.addEnumCommands<Tool>();
  ASSERT_TRUE(commands);
  ASSERT_TRUE(commands->addCommand(Tool::Build));
  ASSERT_TRUE(commands->addCommand(Tool::Test));

  const Vec<String> tokens = { "Test" };
  ASSERT_TRUE(parser.parse(tokens));

  EXPECT_EQ(commands->selected(), Tool::Test);
}

TEST_F(CommandTest, EnumCommands_InterceptRenamesCommands) {
  Result<CommandSet<Tool>, RegistrationError> commands = parser.addEnumCommands<Tool>([](const StringView name) -> String {
    String lower(name);

    for (char& character : lower)
      character = static_cast<char>(std::tolower(static_cast<unsigned char>(character)));

    return lower;
  });
  ASSERT_TRUE(commands);
  ASSERT_TRUE(commands->addCommand(Tool::Build));

  const Vec<String> tokens = { "build" };
  ASSERT_TRUE(parser.parse(tokens));

  EXPECT_EQ(commands->selected(), Tool::Build);

  const Option<CommandParser> build = parser.commandParser("build");
  ASSERT_TRUE(build.has_value());
  EXPECT_EQ(build->command()->name, "build");
}

TEST_F(CommandTest, IntCommands_UsePrintedIdsAsNames) {
  Result<CommandSet<i64>, RegistrationError> commands = parser.addCommands<i64>(argon::core::IntValueParser());
  ASSERT_TRUE(commands);
  ASSERT_TRUE(commands->addCommand(1));
  ASSERT_TRUE(commands->addCommand(2));

  const Vec<String> tokens = { "2" };
  ASSERT_TRUE(parser.parse(tokens));

  EXPECT_EQ(commands->selected(), 2);
}

TEST_F(CommandTest, CommandParser_KnowsItsCommand) {
  Result<CommandSet<String>, RegistrationError> commands = parser.addCommandsS();
  ASSERT_TRUE(commands);

  Result<CommandParser, RegistrationError> serve = commands->addCommand("serve", { .description = "Run the server" });
  ASSERT_TRUE(serve);

  EXPECT_EQ(serve->command()->name, "serve");
  EXPECT_EQ(serve->command()->description, "Run the server");
  EXPECT_EQ(serve->usageContext().path().size(), 1U);
  EXPECT_FALSE(parser.commandParser("missing").has_value());
}
