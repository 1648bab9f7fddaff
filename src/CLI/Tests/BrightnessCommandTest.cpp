#include <memory> // std::make_unique

#include <MacCtl/Core/Brightness.hpp>
#include <MacCtl/Utils/Error.hpp>
#include <MacCtl/Utils/Types.hpp>

#include "Commands/Brightness.hpp"

#include "gtest/gtest.h"

using namespace testing;
using namespace macctl::utils::types;
using namespace macctl::cli;
using macctl::core::brightness::BrightnessController;
using macctl::core::brightness::InMemoryBackend;
using enum macctl::utils::error::MacCtlErrorCode;

class BrightnessCommandTest : public Test {
 protected:
  InMemoryBackend*             m_backend    = nullptr;
  Result<BrightnessController> m_controller = BrightnessController::FromBackend(1, makeBackend());

  fn SetUp() -> void override {
    ASSERT_TRUE(m_controller);
  }

  fn makeBackend() -> UniquePointer<InMemoryBackend> {
    auto backend = std::make_unique<InMemoryBackend>(0.73F);
    m_backend    = backend.get();
    return backend;
  }
};

TEST_F(BrightnessCommandTest, ParsePercentage_AcceptsNumbers) {
  const Vec<Pair<StringView, f32>> cases = {
    { "55", 55.0F },
    { "55.5", 55.5F },
    { "-3", -3.0F },
    { "100", 100.0F },
  };

  for (const auto& [text, expected] : cases) {
    const Result<f32> value = ParsePercentage(text);

    ASSERT_TRUE(value) << text;
    EXPECT_FLOAT_EQ(*value, expected);
  }
}

TEST_F(BrightnessCommandTest, ParsePercentage_RejectsNonNumbers) {
  for (const StringView text : { "", "abc", "50%", "5O", "nan", "inf" }) {
    const Result<f32> value = ParsePercentage(text);

    ASSERT_FALSE(value) << text;
    EXPECT_EQ(value.error().code, InvalidArgument);
  }
}

TEST_F(BrightnessCommandTest, ValidatePercentage_ZeroHasItsOwnMessage) {
  const Result<f32> level = ValidatePercentage(0.0F);

  ASSERT_FALSE(level);
  EXPECT_EQ(level.error().message, "Brightness cannot be 0");
}

TEST_F(BrightnessCommandTest, ValidatePercentage_RejectsOutsideRange) {
  for (const f32 percent : { 5.0F, 9.99F, 100.5F, -3.0F, 1000.0F }) {
    const Result<f32> level = ValidatePercentage(percent);

    ASSERT_FALSE(level) << percent;
    EXPECT_EQ(level.error().code, InvalidArgument);
    EXPECT_EQ(level.error().message, "Brightness must be between 10 and 100");
  }
}

TEST_F(BrightnessCommandTest, ValidatePercentage_AcceptsRange) {
  for (const f32 percent : { 10.0F, 55.5F, 100.0F }) {
    const Result<f32> level = ValidatePercentage(percent);

    ASSERT_TRUE(level) << percent;
    EXPECT_FLOAT_EQ(*level, percent / 100.0F);
  }
}

TEST_F(BrightnessCommandTest, FormatPercentage_RoundsToWholeNumber) {
  EXPECT_EQ(FormatPercentage(0.73F), "73%");
  EXPECT_EQ(FormatPercentage(1.0F), "100%");
  EXPECT_EQ(FormatPercentage(0.0F), "0%");
  EXPECT_EQ(FormatPercentage(0.456F), "46%");
}

TEST_F(BrightnessCommandTest, RunBrightness_ReadsCurrentLevel) {
  const Result<String> output = RunBrightness(*m_controller, None);

  ASSERT_TRUE(output);
  EXPECT_EQ(*output, "73%");
  EXPECT_EQ(m_backend->setCalls(), 0U);
}

TEST_F(BrightnessCommandTest, RunBrightness_SetsLevel) {
  const Result<String> output = RunBrightness(*m_controller, 40.0F);

  ASSERT_TRUE(output);
  EXPECT_EQ(*output, "Brightness set to 40%");
  EXPECT_FLOAT_EQ(m_backend->level(1), 0.4F);
  EXPECT_EQ(m_backend->getCalls(), 0U);
}

TEST_F(BrightnessCommandTest, RunBrightness_PropagatesPlatformFailure) {
  m_backend->failWith(7);

  const Result<String> output = RunBrightness(*m_controller, None);

  ASSERT_FALSE(output);
  EXPECT_EQ(output.error().code, PlatformReturnedError);
  EXPECT_EQ(output.error().message, "Failed to get brightness: error code 7");
}

fn main(i32 argc, char** argv) -> i32 {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
