#include <MacCtl/Utils/Logging.hpp>
#include <MacCtl/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace testing;
using macctl::utils::logging::Bold;
using macctl::utils::logging::Colorize;
using macctl::utils::logging::GetLevelInfo;
using macctl::utils::logging::GetRuntimeLogLevel;
using macctl::utils::logging::Italic;
using macctl::utils::logging::LogLevel;
using macctl::utils::logging::LogLevelConst;
using macctl::utils::logging::SetRuntimeLogLevel;
using macctl::utils::types::i32;
using macctl::utils::types::String;
using macctl::utils::types::StringView;
using macctl::utils::types::usize;

class LoggingUtilsTest : public Test {
 protected:
  LogLevel m_savedLevel = LogLevel::Info;

  fn SetUp() -> void override {
    m_savedLevel = GetRuntimeLogLevel();
  }

  fn TearDown() -> void override {
    SetRuntimeLogLevel(m_savedLevel);
  }
};

TEST_F(LoggingUtilsTest, Colorize_RedText) {
  constexpr StringView              textToColorize = "Hello, Red World!";
  constexpr ftxui::Color::Palette16 color          = ftxui::Color::Palette16::Red;
  const String                      expectedPrefix = String(LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<usize>(color)));
  const String                      expectedSuffix = String(LogLevelConst::RESET_CODE);

  const String colorizedText = Colorize(textToColorize, color);

  EXPECT_TRUE(colorizedText.rfind(expectedPrefix, 0) == 0);
  EXPECT_NE(colorizedText.find(textToColorize.data(), 0, textToColorize.length()), String::npos);
  EXPECT_EQ(colorizedText.substr(colorizedText.length() - expectedSuffix.length()), expectedSuffix);
}

TEST_F(LoggingUtilsTest, Colorize_EmptyText) {
  constexpr StringView              textToColorize;
  constexpr ftxui::Color::Palette16 color          = ftxui::Color::Palette16::Green;
  const String                      expectedPrefix = String(LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<usize>(color)));
  const String                      expectedSuffix = String(LogLevelConst::RESET_CODE);

  const String colorizedText = Colorize(textToColorize, color);
  const String expectedText  = expectedPrefix + String(textToColorize) + expectedSuffix;
  EXPECT_EQ(colorizedText, expectedText);
}

TEST_F(LoggingUtilsTest, Bold_SimpleText) {
  constexpr StringView textToBold     = "This is bold.";
  const String         expectedPrefix = String(LogLevelConst::BOLD_START);
  const String         expectedSuffix = String(LogLevelConst::BOLD_END);

  const String boldedText   = Bold(textToBold);
  const String expectedText = expectedPrefix + String(textToBold) + expectedSuffix;

  EXPECT_EQ(boldedText, expectedText);
}

TEST_F(LoggingUtilsTest, Italic_SimpleText) {
  constexpr StringView textToItalicize = "This is italic.";
  const String         expectedPrefix  = String(LogLevelConst::ITALIC_START);
  const String         expectedSuffix  = String(LogLevelConst::ITALIC_END);

  const String italicizedText = Italic(textToItalicize);
  const String expectedText   = expectedPrefix + String(textToItalicize) + expectedSuffix;

  EXPECT_EQ(italicizedText, expectedText);
}

TEST_F(LoggingUtilsTest, Combined_BoldItalicMagentaText) {
  constexpr StringView              textToStyle = "Styled Text";
  constexpr ftxui::Color::Palette16 color       = ftxui::Color::Palette16::Magenta;

  const String colorPrefix  = String(LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<usize>(color)));
  const String colorSuffix  = String(LogLevelConst::RESET_CODE);
  const String boldPrefix   = String(LogLevelConst::BOLD_START);
  const String boldSuffix   = String(LogLevelConst::BOLD_END);
  const String italicPrefix = String(LogLevelConst::ITALIC_START);
  const String italicSuffix = String(LogLevelConst::ITALIC_END);

  const String styledText = Colorize(Bold(Italic(textToStyle)), color);

  String expectedInnerText       = italicPrefix + String(textToStyle) + italicSuffix;
  expectedInnerText              = boldPrefix + expectedInnerText + boldSuffix;
  const String expectedFinalText = colorPrefix + expectedInnerText + colorSuffix;

  EXPECT_EQ(styledText, expectedFinalText);
}

TEST_F(LoggingUtilsTest, LevelTagsAreBoldAndColored) {
  EXPECT_EQ(GetLevelInfo().at(static_cast<usize>(LogLevel::Debug)), Bold(Colorize(LogLevelConst::DEBUG_STR, LogLevelConst::DEBUG_COLOR)));
  EXPECT_EQ(GetLevelInfo().at(static_cast<usize>(LogLevel::Warn)), Bold(Colorize(LogLevelConst::WARN_STR, LogLevelConst::WARN_COLOR)));
  EXPECT_EQ(GetLevelInfo().at(static_cast<usize>(LogLevel::Error)), Bold(Colorize(LogLevelConst::ERROR_STR, LogLevelConst::ERROR_COLOR)));
}

TEST_F(LoggingUtilsTest, MessagesBelowRuntimeLevelAreDropped) {
  SetRuntimeLogLevel(LogLevel::Warn);

  internal::CaptureStderr();
  debug_log("hidden {}", 1);
  warn_log("shown {}", 2);
  const String output = internal::GetCapturedStderr();

  EXPECT_EQ(output.find("hidden 1"), String::npos);
  EXPECT_NE(output.find("shown 2"), String::npos);
}

TEST_F(LoggingUtilsTest, RuntimeLevelCanBeChanged) {
  SetRuntimeLogLevel(LogLevel::Error);
  EXPECT_EQ(GetRuntimeLogLevel(), LogLevel::Error);

  SetRuntimeLogLevel(LogLevel::Debug);
  EXPECT_EQ(GetRuntimeLogLevel(), LogLevel::Debug);
}

fn main(i32 argc, char** argv) -> i32 {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
