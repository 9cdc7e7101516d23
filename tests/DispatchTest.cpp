#include <format>  // std::format
#include <variant> // std::{get_if, holds_alternative}

#include <Argon++/ArgParser.hpp>
#include <Argon++/Core/Value.hpp>
#include <Argon++/Dispatch.hpp>
#include <Argon++/Utils/Error.hpp>
#include <Argon++/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace argon::utils::types;
using argon::ArgParser;
using argon::core::Arg;
using argon::core::Requires;
using argon::dispatch::AppError;
using argon::dispatch::AppHandler;
using argon::dispatch::CommandHandler;
using argon::dispatch::CommandHandlerSet;
using argon::dispatch::HandlerContext;
using argon::dispatch::WithCommands;
using argon::utils::error::ParseError;
using argon::utils::error::ParseErrorKind;
using argon::utils::error::RegistrationError;
using argon::utils::error::RegistrationErrorCode;

namespace {
  using Journal = SharedPointer<Vec<String>>;

  class GroupCommand;
  class TestApp;

  class LeafCommand final : public CommandHandler<String> {
   public:
    LeafCommand(String name, Journal journal)
      : m_name(std::move(name)), m_journal(std::move(journal)) {}

    [[nodiscard]] fn id() const -> String override {
      return m_name;
    }

    [[nodiscard]] fn description() const -> String override {
      return std::format("Run {}", m_name);
    }

    fn registerArgs(ArgParser& parser) -> Result<Unit, RegistrationError> override {
      Result<Arg<String>, RegistrationError> target = parser.addPositionalS("target", Requires<String>::Optional("all"));

      if (!target)
        return Err(std::move(target).error());

      m_target = *target;
      return {};
    }

    fn run(HandlerContext& context) -> void override;

    bool sawGroup   = false;
    bool sawVerbose = false;

   private:
    String      m_name;
    Journal     m_journal;
    Arg<String> m_target;
  };

  class GroupCommand final : public CommandHandler<String>, public WithCommands {
   public:
    explicit GroupCommand(const Journal& journal)
      : m_journal(journal) {
      m_commands.add(std::make_unique<LeafCommand>("leaf", journal));
    }

    [[nodiscard]] fn id() const -> String override {
      return "group";
    }

    fn registerArgs(ArgParser& parser) -> Result<Unit, RegistrationError> override {
      Result<Arg<bool>, RegistrationError> force = parser.addFlag("force");

      if (!force)
        return Err(std::move(force).error());

      m_force = *force;
      return {};
    }

    fn run(HandlerContext& /*context*/) -> void override {
      m_journal->push_back(std::format("group force={}", m_force.value()));
    }

    fn commands() -> CommandHandlerSet<String>& override {
      return m_commands;
    }

   private:
    Journal                   m_journal;
    Arg<bool>                 m_force;
    CommandHandlerSet<String> m_commands;
  };

  class TestApp final : public AppHandler, public WithCommands {
   public:
    explicit TestApp(const bool withHelp = true, const bool claimHelpName = false)
      : m_withHelp(withHelp), m_claimHelpName(claimHelpName) {
      m_commands.add(std::make_unique<GroupCommand>(journal));
      m_commands.add(std::make_unique<LeafCommand>("build", journal));
    }

    [[nodiscard]] fn addHelp() const -> bool override {
      return m_withHelp;
    }

    [[nodiscard]] fn usageInfo() const -> argon::usage::UsageInfo override {
      return { .application = "test", .prologue = None, .epilogue = None };
    }

    fn registerArgs(ArgParser& parser) -> Result<Unit, RegistrationError> override {
      Result<Arg<bool>, RegistrationError> verbose = parser.addFlag("verbose", { .shortName = 'v' });

      if (!verbose)
        return Err(std::move(verbose).error());

      m_verbose = *verbose;

      if (m_claimHelpName)
        if (Result<Arg<bool>, RegistrationError> help = parser.addFlag("help"); !help)
          return Err(std::move(help).error());

      return {};
    }

    fn run(HandlerContext& /*context*/) -> void override {
      journal->push_back("app");
    }

    fn commands() -> CommandHandlerSet<String>& override {
      return m_commands;
    }

    [[nodiscard]] fn verbose() const -> bool {
      return m_verbose.value();
    }

    Journal journal = std::make_shared<Vec<String>>();

   private:
    bool                      m_withHelp;
    bool                      m_claimHelpName;
    Arg<bool>                 m_verbose;
    CommandHandlerSet<String> m_commands;
  };

  fn LeafCommand::run(HandlerContext& context) -> void {
    m_journal->push_back(std::format("{}:{}", m_name, m_target.value()));

    sawGroup = context.parent<GroupCommand>() != nullptr;

    if (const TestApp* app = context.parent<TestApp>())
      sawVerbose = app->verbose();
  }

  enum class Stage : u8 {
    Fetch,
    Install,
  };

  class StageCommand final : public CommandHandler<Stage> {
   public:
    StageCommand(const Stage stage, Journal journal)
      : m_stage(stage), m_journal(std::move(journal)) {}

    [[nodiscard]] fn id() const -> Stage override {
      return m_stage;
    }

    fn registerArgs(ArgParser& /*parser*/) -> Result<Unit, RegistrationError> override {
      return {};
    }

    fn run(HandlerContext& /*context*/) -> void override {
      m_journal->push_back(std::format("stage {}", static_cast<i32>(m_stage)));
    }

   private:
    Stage   m_stage;
    Journal m_journal;
  };

  class StagedApp final : public AppHandler, public WithCommands {
   public:
    StagedApp() {
      m_commands.add(std::make_unique<StageCommand>(Stage::Fetch, journal));
      m_commands.add(std::make_unique<StageCommand>(Stage::Install, journal));
    }

    fn registerArgs(ArgParser& /*parser*/) -> Result<Unit, RegistrationError> override {
      return {};
    }

    fn run(HandlerContext& /*context*/) -> void override {}

    fn commands() -> CommandHandlerSet<Stage>& override {
      return m_commands;
    }

    Journal journal = std::make_shared<Vec<String>>();

   private:
    CommandHandlerSet<Stage> m_commands { argon::core::EnumValueParser<Stage>(), argon::core::EnumValuePrinter<Stage>() };
  };

  fn ParseErrorOf(const Result<Unit, AppError>& result) -> const ParseError* {
    return result ? nullptr : std::get_if<ParseError>(&result.error());
  }
} // namespace

class DispatchTest : public testing::Test {
 protected:
  TestApp app;
};

TEST_F(DispatchTest, NestedCommands_RunOutermostFirst) {
  const Vec<String> tokens = { "-v", "group", "--force", "leaf", "docs" };
  ASSERT_TRUE(app.runApp(tokens));

  EXPECT_EQ(*app.journal, (Vec<String> { "app", "group force=true", "leaf:docs" }));
  EXPECT_EQ(app.commands().selected(), "group");
}

TEST_F(DispatchTest, Leaf_SeesEnclosingHandlers) {
  const Vec<String> tokens = { "group", "leaf", "--verbose" };
  ASSERT_TRUE(app.runApp(tokens));

  auto&       group = dynamic_cast<GroupCommand&>(*app.commands().handlers().front());
  const auto& leaf  = dynamic_cast<const LeafCommand&>(*group.commands().handlers().front());

  EXPECT_TRUE(leaf.sawGroup);
  EXPECT_TRUE(leaf.sawVerbose);
}

TEST_F(DispatchTest, TopLevelCommand_HasNoGroupParent) {
  const Vec<String> tokens = { "build" };
  ASSERT_TRUE(app.runApp(tokens));

  EXPECT_EQ(*app.journal, (Vec<String> { "app", "build:all" }));

  const auto& build = dynamic_cast<const LeafCommand&>(*app.commands().handlers().back());

  EXPECT_FALSE(build.sawGroup);
  EXPECT_FALSE(build.sawVerbose);
}

TEST_F(DispatchTest, ParseFailure_RunsNothing) {
  const Vec<String> tokens = { "build", "--bogus" };

  Result<Unit, AppError> result = app.runApp(tokens);

  const ParseError* error = ParseErrorOf(result);
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->kind, ParseErrorKind::UnknownOption);
  EXPECT_TRUE(app.journal->empty());
}

TEST_F(DispatchTest, MissingCommand_IsParseError) {
  Result<Unit, AppError> result = app.runApp(Vec<String> {});

  const ParseError* error = ParseErrorOf(result);
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->kind, ParseErrorKind::MissingCommand);
}

TEST_F(DispatchTest, RegistrationFailure_IsReported) {
  TestApp clashing(true, true);

  const Vec<String> tokens = { "build" };

  Result<Unit, AppError> result = clashing.runApp(tokens);
  ASSERT_FALSE(result);
  ASSERT_TRUE(std::holds_alternative<RegistrationError>(result.error()));
  EXPECT_EQ(std::get<RegistrationError>(result.error()).code, RegistrationErrorCode::DuplicateArgument);
  EXPECT_TRUE(clashing.journal->empty());
}

TEST_F(DispatchTest, WithoutHelp_HelpIsUnknown) {
  TestApp bare(false);

  const Vec<String> tokens = { "--help" };

  Result<Unit, AppError> result = bare.runApp(tokens);

  const ParseError* error = ParseErrorOf(result);
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->kind, ParseErrorKind::UnknownOption);
}

TEST_F(DispatchTest, WithoutHelp_NameIsFree) {
  TestApp claiming(false, true);

  const Vec<String> tokens = { "--help", "build" };
  EXPECT_TRUE(claiming.runApp(tokens));
}

class DispatchEnumTest : public testing::Test {
 protected:
  StagedApp staged;
};

TEST_F(DispatchEnumTest, EnumIds_SelectByEnumeratorName) {
  const Vec<String> tokens = { "Install" };
  ASSERT_TRUE(staged.runApp(tokens));

  EXPECT_EQ(staged.commands().selected(), Stage::Install);
  EXPECT_EQ(*staged.journal, Vec<String> { "stage 1" });
}

TEST_F(DispatchEnumTest, EnumIds_OtherNamesAreUnknown) {
  const Vec<String> tokens = { "install" };

  Result<Unit, AppError> result = staged.runApp(tokens);

  const ParseError* error = ParseErrorOf(result);
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->kind, ParseErrorKind::UnknownCommand);
  EXPECT_TRUE(staged.journal->empty());
}
