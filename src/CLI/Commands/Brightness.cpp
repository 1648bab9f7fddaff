#include "Brightness.hpp"

#include <charconv>     // std::from_chars
#include <cmath>        // std::isfinite
#include <format>       // std::format
#include <system_error> // std::errc

#include <MacCtl/Core/Brightness.hpp>
#include <MacCtl/Utils/Error.hpp>
#include <MacCtl/Utils/Logging.hpp>
#include <MacCtl/Utils/Types.hpp>

using namespace macctl::utils::types;
using enum macctl::utils::error::MacCtlErrorCode;

namespace macctl::cli {
  fn ParsePercentage(const StringView text) -> Result<f32> {
    f32 value = 0.0F;

    const PCStr first = text.data();
    const PCStr last  = text.data() + text.size();

    const auto [ptr, errc] = std::from_chars(first, last, value);

    if (text.empty() || errc != std::errc() || ptr != last || !std::isfinite(value))
      ERR_FMT(InvalidArgument, "Invalid brightness value: '{}'", text);

    return value;
  }

  fn ValidatePercentage(const f32 percent) -> Result<f32> {
    if (percent == 0.0F)
      ERR(InvalidArgument, "Brightness cannot be 0");

    if (!(percent >= MIN_BRIGHTNESS_PERCENT && percent <= MAX_BRIGHTNESS_PERCENT))
      ERR_FMT(InvalidArgument, "Brightness must be between {} and {}", MIN_BRIGHTNESS_PERCENT, MAX_BRIGHTNESS_PERCENT);

    return percent / 100.0F;
  }

  fn FormatPercentage(const f32 level) -> String {
    return std::format("{:.0f}%", level * 100.0F);
  }

  fn RunBrightness(const BrightnessController& controller, const Option<f32> percent) -> Result<String> {
    if (!percent) {
      Result<f32> level = controller.get();

      if (!level)
        return Err(level.error());

      debug_log("Display {} reports brightness {}", controller.display(), *level);

      return FormatPercentage(*level);
    }

    if (Result<> result = controller.set(*percent / 100.0F); !result)
      return Err(result.error());

    return std::format("Brightness set to {:.0f}%", *percent);
  }
} // namespace macctl::cli
