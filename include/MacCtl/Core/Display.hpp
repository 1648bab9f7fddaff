#pragma once

#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace macctl::core::display {
  namespace {
    using utils::types::i32;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::u32;
    using utils::types::usize;
    using utils::types::Vec;
  } // namespace

  /**
   * @brief Platform-assigned identifier of one active display.
   *
   * Matches the width of CoreGraphics' CGDirectDisplayID.
   */
  using DisplayID = u32;

  /**
   * @brief Signature of the platform display-enumeration call.
   *
   * Fills at most @p maxDisplays identifiers into @p displays, writes the number
   * found to @p displayCount and returns 0 on success. Mirrors CGGetActiveDisplayList.
   */
  using ActiveDisplayQueryFn = i32 (*)(u32 maxDisplays, DisplayID* displays, u32* displayCount);

  /// Default upper bound on the number of identifiers retrieved per query.
  inline constexpr usize DEFAULT_MAX_DISPLAYS = 16;

  /**
   * @brief Returns the platform's display-enumeration call.
   *
   * @return The query on macOS; a `NotSupported` error on every other platform.
   */
  fn GetActiveDisplayQuery() -> Result<ActiveDisplayQueryFn>;

  /**
   * @brief Lists the currently active displays.
   *
   * @param query The platform display-enumeration call.
   * @param maxDisplays Upper bound on the number of identifiers retrieved. Must be non-zero.
   * @return The identifiers reported by the platform, in platform order.
   *
   * @details Errors:
   * - `InvalidArgument` when @p maxDisplays is zero or @p query is null (no platform call is made).
   * - `PlatformCallFailed` when the query returns a non-zero status (carried in `MacCtlError::status`).
   * - `NoActiveDisplays` when the query succeeds but reports zero displays.
   */
  fn ListActiveDisplays(ActiveDisplayQueryFn query, usize maxDisplays = DEFAULT_MAX_DISPLAYS) -> Result<Vec<DisplayID>>;

  /**
   * @brief Picks the display a controller binds to.
   *
   * @param active Identifiers returned by ListActiveDisplays; must not be empty.
   * @param preferred Display requested by configuration, if any.
   * @return The preferred display when it is active, otherwise the first active display.
   * A preferred display that is not active yields `NotFound`.
   */
  fn SelectDisplay(const Vec<DisplayID>& active, Option<DisplayID> preferred) -> Result<DisplayID>;
} // namespace macctl::core::display
