#pragma once

#include <cstdlib> // std::getenv, setenv, unsetenv

#include "Definitions.hpp"
#include "Error.hpp"
#include "Types.hpp"

namespace macctl::utils::env {
  namespace {
    using types::Err;
    using types::PCStr;
    using types::Result;

    using error::MacCtlError;
    using enum error::MacCtlErrorCode;
  } // namespace

  /**
   * @brief Safely retrieves an environment variable.
   * @param name The name of the environment variable to retrieve.
   * @return A Result containing the value of the environment variable as a CStr.
   */
  [[nodiscard]] inline fn GetEnv(const PCStr name) -> Result<PCStr> {
    const PCStr value = std::getenv(name);

    if (!value)
      return Err(MacCtlError(NotFound, "Environment variable not found"));

    return value;
  }

  /**
   * @brief Safely sets an environment variable.
   * @param name The name of the environment variable to set.
   * @param value The value to set the environment variable to.
   */
  inline fn SetEnv(const PCStr name, const PCStr value) -> void {
    setenv(name, value, 1);
  }

  /**
   * @brief Safely unsets an environment variable.
   * @param name The name of the environment variable to unset.
   */
  inline fn UnsetEnv(const PCStr name) -> void {
    unsetenv(name);
  }
} // namespace macctl::utils::env
