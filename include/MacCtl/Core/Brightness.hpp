/**
 * @file Brightness.hpp
 * @brief Display brightness control through the private DisplayServices interface.
 *
 * @details DisplayServices is undocumented and its location differs between OS
 * releases, so its entry points are resolved at runtime from an ordered list of
 * candidate frameworks, falling back to the images already mapped into the process.
 */

#pragma once

#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

#include "Display.hpp"
#include "DynamicLibrary.hpp"

namespace macctl::core::brightness {
  namespace {
    using display::ActiveDisplayQueryFn;
    using display::DisplayID;

    using utils::types::f32;
    using utils::types::i32;
    using utils::types::Map;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::UniquePointer;
    using utils::types::Unit;
    using utils::types::usize;
    using utils::types::Vec;
  } // namespace

  /// `DisplayServicesGetBrightness(display, &brightness)`; returns 0 on success.
  using BrightnessGetterFn = i32 (*)(DisplayID display, f32* brightness);

  /// `DisplayServicesSetBrightness(display, brightness)`; returns 0 on success.
  using BrightnessSetterFn = i32 (*)(DisplayID display, f32 brightness);

  inline constexpr f32 MIN_BRIGHTNESS = 0.0F;
  inline constexpr f32 MAX_BRIGHTNESS = 1.0F;

  /**
   * @brief Frameworks known to export the brightness entry points, in priority order.
   */
  fn DefaultFrameworkPaths() -> Vec<String>;

  /**
   * @brief Default names of the brightness entry points.
   */
  fn DefaultSymbolNames() -> dl::SymbolNames;

  /**
   * @struct BrightnessOptions
   * @brief Inputs to controller construction.
   */
  struct BrightnessOptions {
    Vec<String>       frameworkPaths = DefaultFrameworkPaths();         ///< Candidate libraries, tried in order.
    dl::SymbolNames   symbols        = DefaultSymbolNames();           ///< Getter and setter entry points.
    usize             maxDisplays    = display::DEFAULT_MAX_DISPLAYS;  ///< Bound on the enumeration buffer.
    Option<DisplayID> display;                                         ///< Display to bind to; the first active one when unset.
  };

  /**
   * @brief Returns whether @p value is an acceptable brightness level.
   *
   * NaN is never acceptable.
   */
  constexpr fn IsValidBrightness(const f32 value) -> bool {
    return value >= MIN_BRIGHTNESS && value <= MAX_BRIGHTNESS;
  }

  /**
   * @class IBrightnessBackend
   * @brief Where brightness is actually read and written.
   *
   * Errors carry the raw status reported by the platform.
   */
  class IBrightnessBackend {
   public:
    IBrightnessBackend()                                         = default;
    IBrightnessBackend(const IBrightnessBackend&)                = delete;
    IBrightnessBackend(IBrightnessBackend&&)                     = delete;
    fn operator=(const IBrightnessBackend&)->IBrightnessBackend& = delete;
    fn operator=(IBrightnessBackend&&)->IBrightnessBackend&      = delete;
    virtual ~IBrightnessBackend()                                = default;

    virtual fn get(DisplayID display) -> Result<f32, i32>             = 0;
    virtual fn set(DisplayID display, f32 value) -> Result<Unit, i32> = 0;

    /// Human-readable description of where the entry points came from.
    [[nodiscard]] virtual fn name() const -> String = 0;
  };

  /**
   * @class DisplayServicesBackend
   * @brief Backend calling dynamically resolved DisplayServices entry points.
   *
   * Owns the library the entry points were resolved from, so the pointers stay
   * valid for the backend's whole lifetime.
   */
  class DisplayServicesBackend final : public IBrightnessBackend {
    dl::LibraryGuard   m_library;
    BrightnessGetterFn m_getBrightness;
    BrightnessSetterFn m_setBrightness;

   public:
    explicit DisplayServicesBackend(dl::ResolvedSymbols<BrightnessGetterFn, BrightnessSetterFn> symbols);

    fn get(DisplayID display) -> Result<f32, i32> override;
    fn set(DisplayID display, f32 value) -> Result<Unit, i32> override;

    [[nodiscard]] fn name() const -> String override;
  };

  /**
   * @class InMemoryBackend
   * @brief Backend keeping brightness levels in memory.
   *
   * Unknown displays read as @p initialLevel. A non-zero failure status makes
   * every subsequent call fail with that status.
   */
  class InMemoryBackend final : public IBrightnessBackend {
    Map<DisplayID, f32> m_levels;
    f32                 m_initialLevel;
    i32                 m_failureStatus = 0;
    usize               m_getCalls      = 0;
    usize               m_setCalls      = 0;

   public:
    explicit InMemoryBackend(f32 initialLevel = MAX_BRIGHTNESS)
      : m_initialLevel(initialLevel) {}

    fn get(DisplayID display) -> Result<f32, i32> override;
    fn set(DisplayID display, f32 value) -> Result<Unit, i32> override;

    [[nodiscard]] fn name() const -> String override {
      return "in-memory";
    }

    fn failWith(const i32 status) -> Unit {
      m_failureStatus = status;
    }

    [[nodiscard]] fn level(DisplayID display) const -> f32;

    [[nodiscard]] fn getCalls() const -> usize {
      return m_getCalls;
    }

    [[nodiscard]] fn setCalls() const -> usize {
      return m_setCalls;
    }
  };

  /**
   * @class BrightnessController
   * @brief Brightness control bound to one active display.
   *
   * A controller only exists in the bound state: Create() either returns a fully
   * bound controller or an error. Destroying it releases the loaded library, if any.
   */
  class BrightnessController {
    DisplayID                         m_display;
    UniquePointer<IBrightnessBackend> m_backend;

    BrightnessController(DisplayID display, UniquePointer<IBrightnessBackend> backend);

   public:
    BrightnessController(const BrightnessController&)                = delete;
    fn operator=(const BrightnessController&)->BrightnessController& = delete;
    BrightnessController(BrightnessController&&) noexcept            = default;
    fn operator=(BrightnessController&&) noexcept -> BrightnessController& = default;
    ~BrightnessController()                                          = default;

    /**
     * @brief Enumerates displays, then resolves the brightness entry points.
     *
     * @param query Display-enumeration call.
     * @param loader Loader used to resolve the entry points.
     * @param options Candidate paths, symbol names and display selection.
     * @return A bound controller. Enumeration or selection failures are returned
     * before any library is touched.
     */
    static fn Create(ActiveDisplayQueryFn query, dl::ILibraryLoader& loader, const BrightnessOptions& options) -> Result<BrightnessController>;

    /**
     * @brief Creates a controller for the running system.
     *
     * Uses the platform display query and the system loader.
     */
    static fn CreateForSystem(const BrightnessOptions& options = {}) -> Result<BrightnessController>;

    /**
     * @brief Binds an already constructed backend to @p display.
     * @return `InvalidArgument` when @p backend is null.
     */
    static fn FromBackend(DisplayID display, UniquePointer<IBrightnessBackend> backend) -> Result<BrightnessController>;

    /**
     * @brief Reads the current brightness of the bound display.
     * @return The platform's value, nominally within [0.0, 1.0]; `PlatformReturnedError` otherwise.
     */
    fn get() const -> Result<f32>;

    /**
     * @brief Sets the brightness of the bound display.
     * @param value Level within [0.0, 1.0]. Anything else yields `OutOfRange` without
     * calling into the platform.
     */
    fn set(f32 value) const -> Result<>;

    [[nodiscard]] fn display() const -> DisplayID {
      return m_display;
    }

    [[nodiscard]] fn backendName() const -> String {
      return m_backend->name();
    }
  };
} // namespace macctl::core::brightness
