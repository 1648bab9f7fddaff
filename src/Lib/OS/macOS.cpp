#ifdef __APPLE__

  #include <CoreGraphics/CGDirectDisplay.h> // CGGetActiveDisplayList, CGDirectDisplayID
  #include <type_traits>                    // std::is_same_v

  #include <MacCtl/Core/Display.hpp>

  #include <MacCtl/Utils/Error.hpp>
  #include <MacCtl/Utils/Types.hpp>

using namespace macctl::utils::types;

namespace {
  using macctl::core::display::DisplayID;

  static_assert(std::is_same_v<CGDirectDisplayID, DisplayID>, "DisplayID must match CGDirectDisplayID");

  fn QueryActiveDisplays(const u32 maxDisplays, DisplayID* displays, u32* displayCount) -> i32 {
    return static_cast<i32>(CGGetActiveDisplayList(maxDisplays, displays, displayCount));
  }
} // namespace

namespace macctl::core::display {
  fn GetActiveDisplayQuery() -> Result<ActiveDisplayQueryFn> {
    return &QueryActiveDisplays;
  }
} // namespace macctl::core::display

#endif // __APPLE__
