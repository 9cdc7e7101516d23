#include <Argon++/Utils/Error.hpp>
#include <Argon++/Utils/Logging.hpp>
#include <Argon++/Utils/Types.hpp>

#include "gtest/gtest.h"

using argon::utils::logging::LogLevel, argon::utils::logging::LogLevelConst;
using argon::utils::logging::Bold, argon::utils::logging::Colorize, argon::utils::logging::Italic;
using argon::utils::types::String, argon::utils::types::StringView;

class LoggingUtilsTest : public testing::Test {
 protected:
  void TearDown() override {
    argon::utils::logging::SetRuntimeLogLevel(LogLevel::Error);
  }
};

TEST_F(LoggingUtilsTest, Colorize_WrapsTextInColorAndReset) {
  const StringView              text   = "Unknown option: --x";
  const ftxui::Color::Palette16 color  = ftxui::Color::Palette16::Red;
  const String                  prefix = String(LogLevelConst::COLOR_CODE_LITERALS.at(color));

  EXPECT_EQ(Colorize(text, color), prefix + String(text) + LogLevelConst::RESET_CODE);
}

TEST_F(LoggingUtilsTest, Colorize_EmptyText) {
  const ftxui::Color::Palette16 color = ftxui::Color::Palette16::Green;

  EXPECT_EQ(Colorize("", color), String(LogLevelConst::COLOR_CODE_LITERALS.at(color)) + LogLevelConst::RESET_CODE);
}

TEST_F(LoggingUtilsTest, Bold_UsageHeading) {
  EXPECT_EQ(Bold("Usage:"), String(LogLevelConst::BOLD_START) + "Usage:" + LogLevelConst::BOLD_END);
}

TEST_F(LoggingUtilsTest, Italic_EmptyText) {
  EXPECT_EQ(Italic(""), String(LogLevelConst::ITALIC_START) + LogLevelConst::ITALIC_END);
}

TEST_F(LoggingUtilsTest, Combined_BoldItalicColoredText) {
  const StringView              text  = "Options:";
  const ftxui::Color::Palette16 color = ftxui::Color::Palette16::Magenta;

  String expected = String(LogLevelConst::ITALIC_START) + String(text) + LogLevelConst::ITALIC_END;
  expected        = String(LogLevelConst::BOLD_START) + expected + LogLevelConst::BOLD_END;
  expected        = String(LogLevelConst::COLOR_CODE_LITERALS.at(color)) + expected + LogLevelConst::RESET_CODE;

  EXPECT_EQ(Colorize(Bold(Italic(text)), color), expected);
}

TEST_F(LoggingUtilsTest, LevelStringsAndColors) {
  using argon::utils::logging::GetLevelColor, argon::utils::logging::GetLevelString;

  EXPECT_EQ(GetLevelString(LogLevel::Debug), LogLevelConst::DEBUG_STR);
  EXPECT_EQ(GetLevelString(LogLevel::Warn), LogLevelConst::WARN_STR);
  EXPECT_EQ(GetLevelColor(LogLevel::Info), LogLevelConst::INFO_COLOR);
  EXPECT_EQ(GetLevelColor(LogLevel::Error), LogLevelConst::ERROR_COLOR);
}

TEST_F(LoggingUtilsTest, MessagesBelowRuntimeLevelAreDropped) {
  argon::utils::logging::SetRuntimeLogLevel(LogLevel::Warn);

  testing::internal::CaptureStderr();
  debug_log("hidden {}", 1);
  info_log("hidden {}", 2);
  const String output = testing::internal::GetCapturedStderr();

  EXPECT_TRUE(output.empty());
}

TEST_F(LoggingUtilsTest, MessagesAtRuntimeLevelAreWrittenToStderr) {
  argon::utils::logging::SetRuntimeLogLevel(LogLevel::Warn);

  testing::internal::CaptureStderr();
  warn_log("Ignoring unknown config key '{}'", "colour");
  const String output = testing::internal::GetCapturedStderr();

  EXPECT_NE(output.find("Ignoring unknown config key 'colour'"), String::npos);
  EXPECT_NE(output.find(Bold(Colorize(LogLevelConst::WARN_STR, LogLevelConst::WARN_COLOR))), String::npos);
}

TEST_F(LoggingUtilsTest, ErrorAtLogsTheErrorMessage) {
  using argon::utils::error::RegistrationError, argon::utils::error::RegistrationErrorCode;

  argon::utils::logging::SetRuntimeLogLevel(LogLevel::Error);

  testing::internal::CaptureStderr();
  error_at(RegistrationError(RegistrationErrorCode::DuplicateArgument, "a", "Duplicate argument: a"));
  const String output = testing::internal::GetCapturedStderr();

  EXPECT_NE(output.find("Duplicate argument: a"), String::npos);
}
