/**
 * @file DynamicLibrary.hpp
 * @brief Runtime library loading and symbol resolution.
 *
 * @details The loader is an interface so that resolution policy (candidate order,
 * default-scope fallback, release on failure) can be exercised without touching
 * real system libraries. Loaded handles are owned by LibraryGuard, which releases
 * them on every exit path.
 */

#pragma once

#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace macctl::core::dl {
  namespace {
    using utils::types::AnyPtr;
    using utils::types::i32;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::Span;
    using utils::types::String;
    using utils::types::Unit;
  } // namespace

  /// Opaque handle returned by the platform loader.
  using LibraryHandle = AnyPtr;

  /**
   * @brief Lookup scope for a symbol.
   *
   * `None` is the reserved default scope: every image already mapped into the process.
   */
  using SymbolScope = Option<LibraryHandle>;

  /**
   * @class ILibraryLoader
   * @brief Abstraction over dlopen/dlsym/dlclose.
   */
  class ILibraryLoader {
   public:
    ILibraryLoader()                                     = default;
    ILibraryLoader(const ILibraryLoader&)                = delete;
    ILibraryLoader(ILibraryLoader&&)                     = delete;
    fn operator=(const ILibraryLoader&)->ILibraryLoader& = delete;
    fn operator=(ILibraryLoader&&)->ILibraryLoader&      = delete;
    virtual ~ILibraryLoader()                            = default;

    /**
     * @brief Loads the library at @p path.
     * @return A non-null handle, or an error describing why the load failed.
     */
    virtual fn open(const String& path) -> Result<LibraryHandle> = 0;

    /**
     * @brief Looks up @p name in @p scope.
     * @return The symbol's address, or nullptr when it is not exported there.
     */
    virtual fn findSymbol(SymbolScope scope, const String& name) -> AnyPtr = 0;

    /**
     * @brief Releases a handle obtained from open().
     * @return 0 on success, the platform's status otherwise.
     */
    virtual fn close(LibraryHandle handle) -> i32 = 0;
  };

  /**
   * @class SystemLibraryLoader
   * @brief ILibraryLoader backed by the platform's dynamic loader (lazy binding).
   */
  class SystemLibraryLoader final : public ILibraryLoader {
   public:
    fn open(const String& path) -> Result<LibraryHandle> override;
    fn findSymbol(SymbolScope scope, const String& name) -> AnyPtr override;
    fn close(LibraryHandle handle) -> i32 override;
  };

  /**
   * @brief Process-wide SystemLibraryLoader instance.
   */
  fn GetSystemLoader() -> ILibraryLoader&;

  /**
   * @class LibraryGuard
   * @brief Exclusive owner of one loaded library handle.
   *
   * An empty guard owns nothing; this is the state used when symbols were found
   * through the default scope. A non-empty guard closes its handle exactly once,
   * on destruction or reset().
   */
  class LibraryGuard {
    ILibraryLoader* m_loader = nullptr;
    LibraryHandle   m_handle = nullptr;
    String          m_path;

   public:
    LibraryGuard() = default;
    LibraryGuard(ILibraryLoader& loader, LibraryHandle handle, String path);
    ~LibraryGuard();

    // Non-copyable
    LibraryGuard(const LibraryGuard&)                = delete;
    fn operator=(const LibraryGuard&)->LibraryGuard& = delete;

    // Movable
    LibraryGuard(LibraryGuard&& other) noexcept;
    fn operator=(LibraryGuard&& other) noexcept -> LibraryGuard&;

    [[nodiscard]] explicit operator bool() const {
      return m_handle != nullptr;
    }

    [[nodiscard]] fn get() const -> LibraryHandle {
      return m_handle;
    }

    /// Path the handle was loaded from; empty for an empty guard.
    [[nodiscard]] fn path() const -> const String& {
      return m_path;
    }

    /// Scope to resolve symbols in: this handle, or the default scope when empty.
    [[nodiscard]] fn scope() const -> SymbolScope;

    /// Closes the owned handle now, if any. Leaves the guard empty.
    fn reset() -> Unit;
  };

  /**
   * @brief Names of the two entry points resolved together.
   */
  struct SymbolNames {
    String getter;
    String setter;
  };

  /**
   * @brief Untyped result of symbol resolution.
   */
  struct RawSymbols {
    LibraryGuard library; ///< Owner of the loaded library; empty when the default scope was used.
    AnyPtr       getter;  ///< Address of SymbolNames::getter. Never null.
    AnyPtr       setter;  ///< Address of SymbolNames::setter. Never null.
  };

  /**
   * @brief Typed result of symbol resolution.
   */
  template <typename GetterFn, typename SetterFn>
  struct ResolvedSymbols {
    LibraryGuard library;
    GetterFn     getter;
    SetterFn     setter;
  };

  /**
   * @brief Resolves both entry points of @p names.
   *
   * @param loader The dynamic loader to use.
   * @param candidatePaths Libraries to try, in priority order. Loading stops at the
   * first success; later candidates are never attempted. When none loads, the
   * default scope is searched instead.
   * @param names Symbols to resolve. Both must resolve in the chosen scope.
   * @return The owning guard plus both addresses, or `SymbolsUnavailable`. On failure
   * a library opened along the way has already been released.
   */
  fn ResolveRawSymbols(ILibraryLoader& loader, Span<const String> candidatePaths, const SymbolNames& names) -> Result<RawSymbols>;

  /**
   * @brief Typed wrapper around ResolveRawSymbols().
   * @tparam GetterFn Function-pointer type of the getter entry point.
   * @tparam SetterFn Function-pointer type of the setter entry point.
   */
  template <typename GetterFn, typename SetterFn>
  fn ResolveSymbols(ILibraryLoader& loader, Span<const String> candidatePaths, const SymbolNames& names) -> Result<ResolvedSymbols<GetterFn, SetterFn>> {
    Result<RawSymbols> raw = ResolveRawSymbols(loader, candidatePaths, names);

    if (!raw)
      return utils::types::Err(raw.error());

    // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast) - symbol addresses are only usable through a cast
    return ResolvedSymbols<GetterFn, SetterFn> {
      .library = std::move(raw->library),
      .getter  = reinterpret_cast<GetterFn>(raw->getter),
      .setter  = reinterpret_cast<SetterFn>(raw->setter),
    };
    // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)
  }
} // namespace macctl::core::dl
