#pragma once

#include <MacCtl/Core/Brightness.hpp>
#include <MacCtl/Utils/Definitions.hpp>
#include <MacCtl/Utils/Error.hpp>
#include <MacCtl/Utils/Types.hpp>

namespace macctl::cli {
  namespace {
    using core::brightness::BrightnessController;

    using utils::types::f32;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
  } // namespace

  inline constexpr f32 MIN_BRIGHTNESS_PERCENT = 10.0F;
  inline constexpr f32 MAX_BRIGHTNESS_PERCENT = 100.0F;

  /**
   * @brief Parses a percentage given on the command line.
   * @param text The raw argument, e.g. "55" or "55.5".
   * @return The parsed number, or `InvalidArgument` if @p text is not entirely a number.
   */
  fn ParsePercentage(StringView text) -> Result<f32>;

  /**
   * @brief Checks that @p percent is a brightness the command accepts.
   *
   * Zero is rejected separately from the rest of the range so that the user is
   * told they cannot blank the display.
   * @return The corresponding level in [0.1, 1.0].
   */
  fn ValidatePercentage(f32 percent) -> Result<f32>;

  /**
   * @brief Formats a brightness level as a rounded whole-number percentage.
   * @param level Level in [0.0, 1.0], e.g. 0.73.
   * @return "73%"
   */
  fn FormatPercentage(f32 level) -> String;

  /**
   * @brief Runs the `brightness` command against @p controller.
   *
   * @param controller The bound controller.
   * @param percent Target brightness in percent, already validated. Reads the
   * current brightness when unset.
   * @return The line to print on success.
   */
  fn RunBrightness(const BrightnessController& controller, Option<f32> percent) -> Result<String>;
} // namespace macctl::cli
