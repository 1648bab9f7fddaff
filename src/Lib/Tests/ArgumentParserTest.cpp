#include <MacCtl/Utils/ArgumentParser.hpp>
#include <MacCtl/Utils/Error.hpp>
#include <MacCtl/Utils/Logging.hpp>
#include <MacCtl/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace testing;
using namespace macctl::utils::types;
using macctl::utils::argparse::ArgumentParser;
using macctl::utils::logging::LogLevel;
using enum macctl::utils::error::MacCtlErrorCode;

class ArgumentParserTest : public Test {
 protected:
  ArgumentParser m_parser { "macctl", "1.0.0" };

  fn SetUp() -> void override {
    m_parser
      .addArguments("command")
      .positional()
      .choices({ "brightness" });

    m_parser
      .addArguments("percentage")
      .positional();

    m_parser
      .addArguments("-V", "--verbose")
      .flag();

    m_parser
      .addArguments("-l", "--log-level")
      .defaultValue(LogLevel::Info);

    m_parser
      .addArguments("-c", "--config")
      .defaultValue(String(""));
  }
};

TEST_F(ArgumentParserTest, DefaultsWhenNothingIsGiven) {
  ASSERT_TRUE(m_parser.parseArgs(Vec<String> { "macctl" }));

  EXPECT_FALSE(m_parser.isUsed("command"));
  EXPECT_FALSE(m_parser.get<bool>("--verbose"));
  EXPECT_EQ(m_parser.getEnum<LogLevel>("--log-level"), LogLevel::Info);
  EXPECT_EQ(m_parser.get<String>("--config"), "");
}

TEST_F(ArgumentParserTest, PositionalsFillInOrder) {
  ASSERT_TRUE(m_parser.parseArgs(Vec<String> { "macctl", "brightness", "55" }));

  EXPECT_EQ(m_parser.get<String>("command"), "brightness");
  EXPECT_TRUE(m_parser.isUsed("percentage"));
  EXPECT_EQ(m_parser.get<String>("percentage"), "55");
}

TEST_F(ArgumentParserTest, NegativeNumberIsPositional) {
  ASSERT_TRUE(m_parser.parseArgs(Vec<String> { "macctl", "brightness", "-3" }));

  EXPECT_EQ(m_parser.get<String>("percentage"), "-3");
}

TEST_F(ArgumentParserTest, FlagsAndValuedOptionsMixWithPositionals) {
  ASSERT_TRUE(m_parser.parseArgs(Vec<String> { "macctl", "-V", "brightness", "--log-level", "warn", "-c", "/tmp/macctl.toml" }));

  EXPECT_TRUE(m_parser.get<bool>("-V"));
  EXPECT_TRUE(m_parser.get<bool>("--verbose"));
  EXPECT_EQ(m_parser.getEnum<LogLevel>("-l"), LogLevel::Warn);
  EXPECT_EQ(m_parser.get<String>("--config"), "/tmp/macctl.toml");
  EXPECT_EQ(m_parser.get<String>("command"), "brightness");
  EXPECT_FALSE(m_parser.isUsed("percentage"));
}

TEST_F(ArgumentParserTest, InvalidChoiceIsRejected) {
  const Result<> result = m_parser.parseArgs(Vec<String> { "macctl", "volume" });

  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, InvalidArgument);
}

TEST_F(ArgumentParserTest, InvalidEnumValueIsRejected) {
  const Result<> result = m_parser.parseArgs(Vec<String> { "macctl", "--log-level", "loud" });

  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, InvalidArgument);
}

TEST_F(ArgumentParserTest, UnknownOptionIsRejected) {
  const Result<> result = m_parser.parseArgs(Vec<String> { "macctl", "--frobnicate" });

  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().message, "Unknown argument: --frobnicate");
}

TEST_F(ArgumentParserTest, SurplusPositionalIsRejected) {
  const Result<> result = m_parser.parseArgs(Vec<String> { "macctl", "brightness", "50", "60" });

  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().message, "Unexpected argument: 60");
}

TEST_F(ArgumentParserTest, MissingOptionValueIsRejected) {
  const Result<> result = m_parser.parseArgs(Vec<String> { "macctl", "--config" });

  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().message, "Argument --config requires a value");
}

fn main(i32 argc, char** argv) -> i32 {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
