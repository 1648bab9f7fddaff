#include <MacCtl/Core/Display.hpp>

#include <algorithm> // std::{min, ranges::find}
#include <format>    // std::format
#include <limits>    // std::numeric_limits

#include <MacCtl/Utils/Error.hpp>
#include <MacCtl/Utils/Logging.hpp>
#include <MacCtl/Utils/Types.hpp>

using namespace macctl::utils::types;
using macctl::utils::error::MacCtlError;
using enum macctl::utils::error::MacCtlErrorCode;

namespace macctl::core::display {
  fn ListActiveDisplays(ActiveDisplayQueryFn query, const usize maxDisplays) -> Result<Vec<DisplayID>> {
    if (query == nullptr)
      ERR(InvalidArgument, "No display query was provided");

    if (maxDisplays == 0)
      ERR(InvalidArgument, "Display enumeration bound must be at least 1");

    const u32 bound = static_cast<u32>(std::min<usize>(maxDisplays, std::numeric_limits<u32>::max()));

    Vec<DisplayID> displays(bound);
    u32            displayCount = 0;

    if (const i32 status = query(bound, displays.data(), &displayCount); status != 0)
      return Err(MacCtlError(PlatformCallFailed, status, std::format("Failed to get active displays (status {})", status)));

    if (displayCount == 0)
      ERR(NoActiveDisplays, "No active displays found");

    displays.resize(std::min(displayCount, bound));

    debug_log("Found {} active display(s)", displays.size());

    return displays;
  }

  fn SelectDisplay(const Vec<DisplayID>& active, const Option<DisplayID> preferred) -> Result<DisplayID> {
    if (active.empty())
      ERR(NoActiveDisplays, "No active displays found");

    if (!preferred)
      return active.front();

    if (std::ranges::find(active, *preferred) == active.end())
      ERR_FMT(NotFound, "Display {} is not active", *preferred);

    return *preferred;
  }
} // namespace macctl::core::display
