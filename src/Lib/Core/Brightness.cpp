#include <MacCtl/Core/Brightness.hpp>

#include <format> // std::format

#include <MacCtl/Core/Display.hpp>
#include <MacCtl/Core/DynamicLibrary.hpp>

#include <MacCtl/Utils/Error.hpp>
#include <MacCtl/Utils/Logging.hpp>
#include <MacCtl/Utils/Types.hpp>

using namespace macctl::utils::types;
using macctl::utils::error::MacCtlError;
using enum macctl::utils::error::MacCtlErrorCode;

namespace macctl::core::brightness {
  using display::DisplayID;

  fn DefaultFrameworkPaths() -> Vec<String> {
    return {
      "/System/Library/PrivateFrameworks/DisplayServices.framework/DisplayServices",
      "/System/Library/PrivateFrameworks/SkyLight.framework/SkyLight",
    };
  }

  fn DefaultSymbolNames() -> dl::SymbolNames {
    return { .getter = "DisplayServicesGetBrightness", .setter = "DisplayServicesSetBrightness" };
  }

  DisplayServicesBackend::DisplayServicesBackend(dl::ResolvedSymbols<BrightnessGetterFn, BrightnessSetterFn> symbols)
    : m_library(std::move(symbols.library)), m_getBrightness(symbols.getter), m_setBrightness(symbols.setter) {}

  fn DisplayServicesBackend::get(const DisplayID display) -> Result<f32, i32> {
    f32 brightness = 0.0F;

    if (const i32 status = m_getBrightness(display, &brightness); status != 0)
      return std::unexpected(status);

    return brightness;
  }

  fn DisplayServicesBackend::set(const DisplayID display, const f32 value) -> Result<Unit, i32> {
    if (const i32 status = m_setBrightness(display, value); status != 0)
      return std::unexpected(status);

    return {};
  }

  fn DisplayServicesBackend::name() const -> String {
    return m_library ? m_library.path() : String("default search scope");
  }

  fn InMemoryBackend::get(const DisplayID display) -> Result<f32, i32> {
    ++m_getCalls;

    if (m_failureStatus != 0)
      return std::unexpected(m_failureStatus);

    return level(display);
  }

  fn InMemoryBackend::set(const DisplayID display, const f32 value) -> Result<Unit, i32> {
    ++m_setCalls;

    if (m_failureStatus != 0)
      return std::unexpected(m_failureStatus);

    m_levels.insert_or_assign(display, value);
    return {};
  }

  fn InMemoryBackend::level(const DisplayID display) const -> f32 {
    if (const auto iter = m_levels.find(display); iter != m_levels.end())
      return iter->second;

    return m_initialLevel;
  }

  BrightnessController::BrightnessController(const DisplayID display, UniquePointer<IBrightnessBackend> backend)
    : m_display(display), m_backend(std::move(backend)) {}

  fn BrightnessController::Create(ActiveDisplayQueryFn query, dl::ILibraryLoader& loader, const BrightnessOptions& options) -> Result<BrightnessController> {
    Result<Vec<DisplayID>> displays = display::ListActiveDisplays(query, options.maxDisplays);

    if (!displays)
      return Err(displays.error());

    Result<DisplayID> selected = display::SelectDisplay(*displays, options.display);

    if (!selected)
      return Err(selected.error());

    Result<dl::ResolvedSymbols<BrightnessGetterFn, BrightnessSetterFn>> symbols =
      dl::ResolveSymbols<BrightnessGetterFn, BrightnessSetterFn>(loader, options.frameworkPaths, options.symbols);

    if (!symbols)
      return Err(symbols.error());

    auto backend = std::make_unique<DisplayServicesBackend>(std::move(*symbols));

    debug_log("Brightness controller bound to display {} using {}", *selected, backend->name());

    return BrightnessController(*selected, std::move(backend));
  }

  fn BrightnessController::CreateForSystem(const BrightnessOptions& options) -> Result<BrightnessController> {
    Result<ActiveDisplayQueryFn> query = display::GetActiveDisplayQuery();

    if (!query)
      return Err(query.error());

    return Create(*query, dl::GetSystemLoader(), options);
  }

  fn BrightnessController::FromBackend(const DisplayID display, UniquePointer<IBrightnessBackend> backend) -> Result<BrightnessController> {
    if (!backend)
      ERR_FMT(InvalidArgument, "No brightness backend given for display {}", display);

    return BrightnessController(display, std::move(backend));
  }

  fn BrightnessController::get() const -> Result<f32> {
    Result<f32, i32> brightness = m_backend->get(m_display);

    if (!brightness)
      return Err(MacCtlError(PlatformReturnedError, brightness.error(), std::format("Failed to get brightness: error code {}", brightness.error())));

    return *brightness;
  }

  fn BrightnessController::set(const f32 value) const -> Result<> {
    if (!IsValidBrightness(value))
      ERR_FMT(OutOfRange, "Brightness must be between {} and {}, got {}", MIN_BRIGHTNESS, MAX_BRIGHTNESS, value);

    if (Result<Unit, i32> result = m_backend->set(m_display, value); !result)
      return Err(MacCtlError(PlatformReturnedError, result.error(), std::format("Failed to set brightness: error code {}", result.error())));

    return {};
  }
} // namespace macctl::core::brightness
