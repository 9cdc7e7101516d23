#include <Argon++/ArgParser.hpp>
#include <Argon++/Core/Value.hpp>
#include <Argon++/Utils/Error.hpp>
#include <Argon++/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace argon::utils::types;
using argon::AppArgParser;
using argon::core::Arg;
using argon::core::ArgConfig;
using argon::utils::error::ParseError;
using argon::utils::error::ParseErrorKind;
using argon::utils::error::RegistrationError;

class OptionTest : public testing::Test {
 protected:
  AppArgParser parser;
};

TEST_F(OptionTest, InlineValues_FillBothOptions) {
  Result<Arg<String>, RegistrationError> first  = parser.addOptionS("a", "");
  Result<Arg<String>, RegistrationError> second = parser.addOptionS("b", "");
  ASSERT_TRUE(first && second);

  const Vec<String> tokens = { "--a=x", "--b=y" };
  ASSERT_TRUE(parser.parse(tokens));

  EXPECT_EQ(first->value(), "x");
  EXPECT_EQ(second->value(), "y");
  EXPECT_TRUE(first->wasGiven());
}

TEST_F(OptionTest, SeparateValue_EquivalentToInline) {
  Result<Arg<String>, RegistrationError> option = parser.addOptionS("a", "");
  ASSERT_TRUE(option);

  const Vec<String> tokens = { "--a", "x" };
  ASSERT_TRUE(parser.parse(tokens));

  EXPECT_EQ(option->value(), "x");
}

TEST_F(OptionTest, PendingValue_TakesNextTokenWhole) {
  Result<Arg<String>, RegistrationError> first  = parser.addOptionS("a", "");
  Result<Arg<String>, RegistrationError> second = parser.addOptionS("b", "untouched");
  ASSERT_TRUE(first && second);

  const Vec<String> tokens = { "--a", "--b" };
  ASSERT_TRUE(parser.parse(tokens));

  EXPECT_EQ(first->value(), "--b");
  EXPECT_EQ(second->value(), "untouched");
  EXPECT_FALSE(second->wasGiven());
}

TEST_F(OptionTest, PendingValue_TakesTerminatorToken) {
  Result<Arg<String>, RegistrationError> option = parser.addOptionS("a", "");
  Result<Arg<bool>, RegistrationError>   flag   = parser.addFlag("f");
  ASSERT_TRUE(option && flag);

  const Vec<String> tokens = { "--a", "--", "--f" };
  ASSERT_TRUE(parser.parse(tokens));

  EXPECT_EQ(option->value(), "--");
  EXPECT_TRUE(flag->value());
}

TEST_F(OptionTest, ValueAlone_MissingOptionValue) {
  ASSERT_TRUE(parser.addOptionS("a", ""));

  const Vec<String> tokens = { "--a" };

  Result<Unit, ParseError> parsed = parser.parse(tokens);
  ASSERT_FALSE(parsed);
  EXPECT_EQ(parsed.error().kind, ParseErrorKind::MissingOptionValue);
  EXPECT_EQ(parsed.error().names, Vec<String> { "a" });
  EXPECT_EQ(parsed.error().message, "Option a requires a value");
}

TEST_F(OptionTest, SplitsOnFirstEquals) {
  Result<Arg<String>, RegistrationError> option = parser.addOptionS("define", "");
  ASSERT_TRUE(option);

  const Vec<String> tokens = { "--define=key=value" };
  ASSERT_TRUE(parser.parse(tokens));

  EXPECT_EQ(option->value(), "key=value");
}

TEST_F(OptionTest, EmptyInlineValue_IsAValue) {
  Result<Arg<String>, RegistrationError> option = parser.addOptionS("a", "default");
  ASSERT_TRUE(option);

  const Vec<String> tokens = { "--a=" };
  ASSERT_TRUE(parser.parse(tokens));

  EXPECT_EQ(option->value(), "");
  EXPECT_TRUE(option->wasGiven());
}

TEST_F(OptionTest, UnknownName_ReportsWholeToken) {
  ASSERT_TRUE(parser.addOptionS("a", ""));

  const Vec<String> tokens = { "--zzz=3" };

  Result<Unit, ParseError> parsed = parser.parse(tokens);
  ASSERT_FALSE(parsed);
  EXPECT_EQ(parsed.error().kind, ParseErrorKind::UnknownOption);
  EXPECT_EQ(parsed.error().names, Vec<String> { "--zzz=3" });
  EXPECT_EQ(parsed.error().message, "Unknown option: --zzz=3");
}

TEST_F(OptionTest, NotGiven_KeepsDefault) {
  Result<Arg<i32>, RegistrationError> count = parser.addOption<i32>("count", 1, argon::core::IntValueParser<i32>());
  ASSERT_TRUE(count);

  ASSERT_TRUE(parser.parse(Vec<String> {}));

  EXPECT_EQ(count->value(), 1);
  EXPECT_FALSE(count->wasGiven());
}

TEST_F(OptionTest, RepeatedSingleOption_LastOneWins) {
  Result<Arg<i32>, RegistrationError> count = parser.addOption<i32>("count", 1, argon::core::IntValueParser<i32>());
  ASSERT_TRUE(count);

  const Vec<String> tokens = { "--count=2", "--count", "7" };
  ASSERT_TRUE(parser.parse(tokens));

  EXPECT_EQ(count->value(), 7);
}

TEST_F(OptionTest, MultiOption_AppendsEveryOccurrence) {
  Result<Arg<Vec<String>>, RegistrationError> includes =
    parser.addMultiOptionS<Vec<String>>("include", {}, argon::core::ListAccumulator<String>(), { .shortName = 'I' });
  ASSERT_TRUE(includes);

  const Vec<String> tokens = { "--include=a", "-Ib", "--include", "c" };
  ASSERT_TRUE(parser.parse(tokens));

  EXPECT_EQ(includes->value(), (Vec<String> { "a", "b", "c" }));
}

TEST_F(OptionTest, MultiOption_DefaultIsExtendedNotReplaced) {
  Result<Arg<Vec<String>>, RegistrationError> paths =
    parser.addMultiOptionS<Vec<String>>("path", { "/usr/lib" }, argon::core::ListAccumulator<String>());
  ASSERT_TRUE(paths);

  const Vec<String> tokens = { "--path=/opt/lib" };
  ASSERT_TRUE(parser.parse(tokens));

  EXPECT_EQ(paths->value(), (Vec<String> { "/usr/lib", "/opt/lib" }));
}

TEST_F(OptionTest, NullDefaultOption_IsNoneUntilGiven) {
  Result<Arg<Option<String>>, RegistrationError> name  = parser.addOptionSN("name");
  Result<Arg<Option<f64>>, RegistrationError>    ratio = parser.addOptionN<f64>("ratio", argon::core::FloatValueParser());
  ASSERT_TRUE(name && ratio);

  const Vec<String> tokens = { "--ratio=0.5" };
  ASSERT_TRUE(parser.parse(tokens));

  EXPECT_FALSE(name->value().has_value());
  ASSERT_TRUE(ratio->value().has_value());
  EXPECT_DOUBLE_EQ(*ratio->value(), 0.5);
}

TEST_F(OptionTest, NullDefaultMultiOption_StartsFromNothing) {
  Result<Arg<Option<Set<String>>>, RegistrationError> tags =
    parser.addMultiOptionSN<Set<String>>("tag", argon::core::SetAccumulator<String>());
  ASSERT_TRUE(tags);

  ASSERT_TRUE(parser.parse(Vec<String> {}));
  EXPECT_FALSE(tags->value().has_value());

  const Vec<String> tokens = { "--tag=b", "--tag=a", "--tag=b" };
  ASSERT_TRUE(parser.parse(tokens));

  EXPECT_EQ(tags->value(), Option<Set<String>>(Set<String> { "a", "b" }));
}

TEST_F(OptionTest, RejectedValue_ReportsOptionNameAndReason) {
  ASSERT_TRUE(parser.addOption<i32>("count", 1, argon::core::IntValueParser<i32>()));

  const Vec<String> tokens = { "--count", "many" };

  Result<Unit, ParseError> parsed = parser.parse(tokens);
  ASSERT_FALSE(parsed);
  EXPECT_EQ(parsed.error().kind, ParseErrorKind::ValueParsingFailed);
  EXPECT_EQ(parsed.error().value, "many");
  EXPECT_EQ(parsed.error().message, "Failed to parse count[=many]: Invalid int");
}

TEST_F(OptionTest, ValidatedOption_CheckRejectsValue) {
  ASSERT_TRUE(parser.addOption<i32>(
    "count",
    1,
    argon::core::Also(argon::core::IntValueParser<i32>(), [](const i32 value) -> Result<Unit, argon::utils::error::ValueParserError> {
      if (value <= 0)
        return Err(argon::utils::error::ValueParserError { "Must be >0" });

      return {};
    })
  ));

  const Vec<String> tokens = { "--count=0" };

  Result<Unit, ParseError> parsed = parser.parse(tokens);
  ASSERT_FALSE(parsed);
  EXPECT_EQ(parsed.error().reason, "Must be >0");
}

TEST_F(OptionTest, FailedParse_KeepsEarlierValues) {
  Result<Arg<String>, RegistrationError> name  = parser.addOptionS("name", "");
  Result<Arg<i32>, RegistrationError>    count = parser.addOption<i32>("count", 1, argon::core::IntValueParser<i32>());
  ASSERT_TRUE(name && count);

  const Vec<String> tokens = { "--name=kept", "--count=x" };
  ASSERT_FALSE(parser.parse(tokens));

  EXPECT_EQ(name->value(), "kept");
  EXPECT_EQ(count->value(), 1);
  EXPECT_FALSE(count->wasGiven());
}

TEST_F(OptionTest, GoPreset_SingleDashLongOptions) {
  AppArgParser go({}, argon::usage::DefaultUsagePrinter::Create(), ArgConfig::Go());

  Result<Arg<bool>, RegistrationError> both   = go.addFlag("ab");
  Result<Arg<bool>, RegistrationError> first  = go.addFlag("a");
  Result<Arg<bool>, RegistrationError> second = go.addFlag("b");
  Result<Arg<i32>, RegistrationError>  count  = go.addOption<i32>("count", 0, argon::core::IntValueParser<i32>());
  ASSERT_TRUE(both && first && second && count);

  const Vec<String> tokens = { "-ab", "-count=3" };
  ASSERT_TRUE(go.parse(tokens));

  EXPECT_TRUE(both->value());
  EXPECT_FALSE(first->value());
  EXPECT_FALSE(second->value());
  EXPECT_EQ(count->value(), 3);
}

TEST_F(OptionTest, GoPreset_HasNoGeneratedInverse) {
  AppArgParser go({}, argon::usage::DefaultUsagePrinter::Create(), ArgConfig::Go());

  ASSERT_TRUE(go.addFlag("ab"));

  const Vec<String> tokens = { "-no-ab" };

  Result<Unit, ParseError> parsed = go.parse(tokens);
  ASSERT_FALSE(parsed);
  EXPECT_EQ(parsed.error().kind, ParseErrorKind::UnknownOption);
}

TEST_F(OptionTest, CustomLongPrefix_OtherDashesArePositional) {
  ArgConfig config   = ArgConfig::Default();
  config.longPrefix  = "++";
  config.shortPrefix = None;

  AppArgParser custom({}, argon::usage::DefaultUsagePrinter::Create(), std::move(config));

  Result<Arg<String>, RegistrationError> option = custom.addOptionS("mode", "");
  Result<Arg<String>, RegistrationError> rest   = custom.addPositionalS("rest");
  ASSERT_TRUE(option && rest);

  const Vec<String> tokens = { "++mode=fast", "--mode" };
  ASSERT_TRUE(custom.parse(tokens));

  EXPECT_EQ(option->value(), "fast");
  EXPECT_EQ(rest->value(), "--mode");
}
