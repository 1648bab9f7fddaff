#include <MacCtl/Core/DynamicLibrary.hpp>

#include <dlfcn.h> // dlopen, dlsym, dlclose, dlerror, RTLD_LAZY, RTLD_DEFAULT
#include <format>  // std::format
#include <utility> // std::exchange

#include <MacCtl/Utils/Error.hpp>
#include <MacCtl/Utils/Logging.hpp>
#include <MacCtl/Utils/Types.hpp>

using namespace macctl::utils::types;
using macctl::utils::error::MacCtlError;
using enum macctl::utils::error::MacCtlErrorCode;

namespace {
  constexpr StringView DEFAULT_SCOPE_NAME = "the default search scope";

  fn LastLoaderError() -> String {
    const PCStr message = dlerror();
    return message ? String(message) : String("unknown error");
  }
} // namespace

namespace macctl::core::dl {
  fn SystemLibraryLoader::open(const String& path) -> Result<LibraryHandle> {
    LibraryHandle handle = dlopen(path.c_str(), RTLD_LAZY);

    if (!handle)
      ERR_FMT(NotFound, "Failed to load library '{}': {}", path, LastLoaderError());

    return handle;
  }

  fn SystemLibraryLoader::findSymbol(const SymbolScope scope, const String& name) -> AnyPtr {
    return dlsym(scope ? *scope : RTLD_DEFAULT, name.c_str());
  }

  fn SystemLibraryLoader::close(LibraryHandle handle) -> i32 {
    return dlclose(handle);
  }

  fn GetSystemLoader() -> ILibraryLoader& {
    static SystemLibraryLoader Instance;
    return Instance;
  }

  LibraryGuard::LibraryGuard(ILibraryLoader& loader, LibraryHandle handle, String path)
    : m_loader(&loader), m_handle(handle), m_path(std::move(path)) {}

  LibraryGuard::~LibraryGuard() {
    reset();
  }

  LibraryGuard::LibraryGuard(LibraryGuard&& other) noexcept
    : m_loader(std::exchange(other.m_loader, nullptr)),
      m_handle(std::exchange(other.m_handle, nullptr)),
      m_path(std::move(other.m_path)) {}

  fn LibraryGuard::operator=(LibraryGuard&& other) noexcept -> LibraryGuard& {
    if (this != &other) {
      reset();

      m_loader = std::exchange(other.m_loader, nullptr);
      m_handle = std::exchange(other.m_handle, nullptr);
      m_path   = std::move(other.m_path);
    }

    return *this;
  }

  fn LibraryGuard::scope() const -> SymbolScope {
    if (m_handle)
      return m_handle;

    return None;
  }

  fn LibraryGuard::reset() -> Unit {
    if (m_handle == nullptr || m_loader == nullptr)
      return;

    if (const i32 status = m_loader->close(m_handle); status != 0)
      warn_log("Failed to release library '{}' (status {})", m_path, status);
    else
      debug_log("Released library '{}'", m_path);

    m_handle = nullptr;
    m_loader = nullptr;
    m_path.clear();
  }

  fn ResolveRawSymbols(ILibraryLoader& loader, const Span<const String> candidatePaths, const SymbolNames& names) -> Result<RawSymbols> {
    LibraryGuard library;

    for (const String& path : candidatePaths) {
      Result<LibraryHandle> handle = loader.open(path);

      if (!handle) {
        debug_at(handle.error());
        continue;
      }

      debug_log("Loaded '{}'", path);
      library = LibraryGuard(loader, *handle, path);
      break;
    }

    if (!library) {
      // Best effort: the entry points are usually already mapped even when no candidate loads by path.
      if (!candidatePaths.empty())
        warn_log("None of {} candidate libraries could be loaded, searching {}", candidatePaths.size(), DEFAULT_SCOPE_NAME);
      else
        debug_log("No candidate libraries configured, searching {}", DEFAULT_SCOPE_NAME);
    }

    const String scopeName = library ? std::format("'{}'", library.path()) : String(DEFAULT_SCOPE_NAME);

    AnyPtr getter = loader.findSymbol(library.scope(), names.getter);
    AnyPtr setter = loader.findSymbol(library.scope(), names.setter);

    if (!getter || !setter) {
      String missing;

      if (!getter)
        missing = names.getter;

      if (!setter)
        missing += missing.empty() ? names.setter : " and " + names.setter;

      // `library` releases the handle on return.
      ERR_FMT(SymbolsUnavailable, "Brightness functions are not available on this system: {} not found in {}", missing, scopeName);
    }

    debug_log("Resolved '{}' and '{}' from {}", names.getter, names.setter, scopeName);

    return RawSymbols {
      .library = std::move(library),
      .getter  = getter,
      .setter  = setter,
    };
  }
} // namespace macctl::core::dl
