#ifndef __APPLE__

  #include <MacCtl/Core/Display.hpp>

  #include <MacCtl/Utils/Error.hpp>
  #include <MacCtl/Utils/Types.hpp>

using namespace macctl::utils::types;
using enum macctl::utils::error::MacCtlErrorCode;

namespace macctl::core::display {
  fn GetActiveDisplayQuery() -> Result<ActiveDisplayQueryFn> {
    ERR(NotSupported, "Display enumeration requires CoreGraphics, which is only available on macOS");
  }
} // namespace macctl::core::display

#endif // __APPLE__
