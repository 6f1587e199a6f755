#include <chrono> // std::chrono::system_clock

#include <TDC/Utils/Logging.hpp>
#include <TDC/Utils/Types.hpp>

#include "gtest/gtest.h"

using tdc::utils::logging::LogLevelConst, tdc::utils::logging::Bold, tdc::utils::logging::Colorize, tdc::utils::logging::Italic;
using tdc::utils::logging::FormatTimestamp, tdc::utils::logging::LogLevel, tdc::utils::logging::ParseLogLevel;
using tdc::utils::types::String, tdc::utils::types::StringView, tdc::utils::types::usize;

class LoggingUtilsTest : public testing::Test {};

TEST_F(LoggingUtilsTest, Colorize_RedText) {
  const StringView              textToColorize = "Uninstalling 'Huion Tablet'...";
  const ftxui::Color::Palette16 color          = ftxui::Color::Palette16::Red;
  const String                  expectedPrefix = String(LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<usize>(color)));
  const String                  expectedSuffix = String(LogLevelConst::RESET_CODE);

  String colorizedText = Colorize(textToColorize, color);

  EXPECT_TRUE(colorizedText.starts_with(expectedPrefix));
  EXPECT_NE(colorizedText.find(textToColorize), String::npos);
  EXPECT_TRUE(colorizedText.ends_with(expectedSuffix));
}

TEST_F(LoggingUtilsTest, Colorize_EmptyText) {
  const StringView              textToColorize;
  const ftxui::Color::Palette16 color          = ftxui::Color::Palette16::Green;
  const String                  expectedPrefix = String(LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<usize>(color)));
  const String                  expectedSuffix = String(LogLevelConst::RESET_CODE);

  EXPECT_EQ(Colorize(textToColorize, color), expectedPrefix + expectedSuffix);
}

TEST_F(LoggingUtilsTest, Bold_SimpleText) {
  const StringView textToBold = "Reboot is required";

  EXPECT_EQ(Bold(textToBold), String(LogLevelConst::BOLD_START) + String(textToBold) + String(LogLevelConst::BOLD_END));
}

TEST_F(LoggingUtilsTest, Italic_SimpleText) {
  const StringView textToItalicize = "oem12.inf";

  EXPECT_EQ(Italic(textToItalicize), String(LogLevelConst::ITALIC_START) + String(textToItalicize) + String(LogLevelConst::ITALIC_END));
}

TEST_F(LoggingUtilsTest, Combined_BoldItalicYellowText) {
  const StringView              textToStyle = "Styled Text";
  const ftxui::Color::Palette16 color       = ftxui::Color::Palette16::Yellow;

  String styledText = Colorize(Bold(Italic(textToStyle)), color);

  String expectedText = String(LogLevelConst::ITALIC_START) + String(textToStyle) + String(LogLevelConst::ITALIC_END);
  expectedText        = String(LogLevelConst::BOLD_START) + expectedText + String(LogLevelConst::BOLD_END);
  expectedText        = String(LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<usize>(color))) + expectedText + String(LogLevelConst::RESET_CODE);

  EXPECT_EQ(styledText, expectedText);
}

TEST_F(LoggingUtilsTest, ParseLogLevel_KnownNames) {
  EXPECT_EQ(ParseLogLevel("debug"), LogLevel::Debug);
  EXPECT_EQ(ParseLogLevel("INFO"), LogLevel::Info);
  EXPECT_EQ(ParseLogLevel("Warn"), LogLevel::Warn);
  EXPECT_EQ(ParseLogLevel("warning"), LogLevel::Warn);
  EXPECT_EQ(ParseLogLevel("error"), LogLevel::Error);
}

TEST_F(LoggingUtilsTest, ParseLogLevel_UnknownNames) {
  EXPECT_FALSE(ParseLogLevel("").has_value());
  EXPECT_FALSE(ParseLogLevel("verbose").has_value());
}

TEST_F(LoggingUtilsTest, FormatTimestamp_ClockTime) {
  const String timestamp = FormatTimestamp(std::chrono::system_clock::now());

  ASSERT_EQ(timestamp.size(), 8U);
  EXPECT_EQ(timestamp[2], ':');
  EXPECT_EQ(timestamp[5], ':');
}
