#pragma once

#include <expected>                  // std::{unexpected, expected}
#include <format>                    // std::{format, formatter}
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name
#include <matchit.hpp>               // matchit::{match, is, or_, _}
#include <source_location>           // std::source_location
#include <system_error>              // std::{error_code, errc, generic_category}

#include "Definitions.hpp"
#include "Types.hpp"

namespace macctl::utils {
  namespace error {
    namespace {
      using types::i32;
      using types::Option;
      using types::String;
      using types::u8;
    } // namespace

    /**
     * @enum MacCtlErrorCode
     * @brief Error codes for device-control operations.
     */
    enum class MacCtlErrorCode : u8 {
      // Display enumeration
      PlatformCallFailed, ///< The platform display-enumeration call reported a non-zero status.
      NoActiveDisplays,   ///< The platform reported zero active displays.

      // Symbol resolution
      SymbolsUnavailable, ///< The brightness entry points could not be resolved in any candidate scope.

      // Brightness access
      OutOfRange,            ///< A brightness value outside [0.0, 1.0] was rejected before any platform call.
      PlatformReturnedError, ///< A resolved platform entry point returned a non-zero status (see MacCtlError::status).

      InternalError,      ///< An error occurred within the application's own logic.
      InvalidArgument,    ///< An invalid argument was passed to a function or on the command line.
      IoError,            ///< General I/O error (filesystem, pipes, etc.).
      NotFound,           ///< A required resource (file, display, library) was not found.
      NotSupported,       ///< The requested operation is not supported on this platform.
      ParseError,         ///< Failed to parse input (configuration file, numeric argument).
      PermissionDenied,   ///< Insufficient permissions to perform the operation.
      PlatformSpecific,   ///< An unmapped error specific to the underlying OS platform occurred (check message).
    };

    /**
     * @struct MacCtlError
     * @brief Holds structured information about an error.
     *
     * Used as the error type in Result throughout the project.
     */
    struct MacCtlError {
      String               message;  ///< A descriptive error message, potentially including platform details.
      std::source_location location; ///< The source location where the error occurred (file, line, function).
      MacCtlErrorCode      code;     ///< The general category of the error.
      Option<i32>          status;   ///< Raw status returned by the platform, when one exists.

      MacCtlError(const MacCtlErrorCode errc, String msg, const std::source_location& loc = std::source_location::current())
        : message(std::move(msg)), location(loc), code(errc) {}

      MacCtlError(const MacCtlErrorCode errc, const i32 platformStatus, String msg, const std::source_location& loc = std::source_location::current())
        : message(std::move(msg)), location(loc), code(errc), status(platformStatus) {}

      explicit MacCtlError(const std::error_code& errc, const std::source_location& loc = std::source_location::current())
        : message(errc.message()), location(loc), status(errc.value()) {
        using matchit::match, matchit::is, matchit::or_, matchit::_;
        using enum MacCtlErrorCode;
        using enum std::errc;

        code = match(errc)(
          is | or_(file_too_large, io_error)                                                = IoError,
          is | or_(invalid_argument, filename_too_long)                                     = InvalidArgument,
          is | or_(operation_not_supported, not_supported)                                  = NotSupported,
          is | or_(no_such_file_or_directory, not_a_directory, is_a_directory, file_exists) = NotFound,
          is | permission_denied                                                            = PermissionDenied,
          is | _                                                                            = errc.category() == std::generic_category() ? InternalError : PlatformSpecific
        );
      }
    };
  } // namespace error

  namespace types {
    /**
     * @typedef Result
     * @brief Alias for std::expected<Tp, Er>. Represents a value that can either be
     * a success value of type Tp or an error value of type Er.
     * @tparam Tp The type of the success value.
     * @tparam Er The type of the error value.
     */
    template <typename Tp = Unit, typename Er = error::MacCtlError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Alias for std::unexpected<Er>. Used to construct a Result in an error state.
     * @tparam Er The type of the error value.
     */
    template <typename Er = error::MacCtlError>
    using Err = std::unexpected<Er>;
  } // namespace types
} // namespace macctl::utils

namespace std {
  template <>
  struct formatter<::macctl::utils::error::MacCtlErrorCode> : formatter<::macctl::utils::types::StringView> {
    template <typename FormatContext>
    fn format(const ::macctl::utils::error::MacCtlErrorCode code, FormatContext& ctx) const {
      const ::macctl::utils::types::StringView name = magic_enum::enum_name(code);

      return formatter<::macctl::utils::types::StringView>::format(name.empty() ? "Unknown" : name, ctx);
    }
  };
} // namespace std

#define ERR(errc, msg)          return ::macctl::utils::types::Err(::macctl::utils::error::MacCtlError(errc, msg))
#define ERR_FMT(errc, fmt, ...) return ::macctl::utils::types::Err(::macctl::utils::error::MacCtlError(errc, std::format(fmt, __VA_ARGS__)))
