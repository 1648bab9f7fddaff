#include "Config.hpp"

#include <filesystem>                // std::filesystem::{path, operator/, exists}
#include <format>                    // std::format
#include <limits>                    // std::numeric_limits
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_cast, case_insensitive}
#include <system_error>              // std::error_code
#include <toml++/toml.hpp>           // toml::{table, array, node_view, parse_file, parse_error}
#include <utility>                   // std::move

#include <MacCtl/Core/Brightness.hpp>
#include <MacCtl/Utils/Env.hpp>
#include <MacCtl/Utils/Error.hpp>
#include <MacCtl/Utils/Logging.hpp>
#include <MacCtl/Utils/Types.hpp>

namespace fs = std::filesystem;

using namespace macctl::utils::types;
using macctl::utils::error::MacCtlError;
using macctl::utils::logging::LogLevel;
using enum macctl::utils::error::MacCtlErrorCode;

namespace {
  constexpr PCStr CONFIG_DIR_NAME  = "macctl";
  constexpr PCStr CONFIG_FILE_NAME = "config.toml";

  // A present but empty or non-string value falls back to the default.
  fn ReadSymbolName(const toml::table& tbl, const PCStr key, String fallback) -> String {
    const toml::node_view<const toml::node> node = tbl[key];

    if (!node)
      return fallback;

    if (Option<String> value = node.value<String>(); value && !value->empty())
      return *value;

    warn_log("Invalid '{}' in [brightness]: expected a non-empty string. Using '{}'.", key, fallback);
    return fallback;
  }
} // namespace

namespace macctl::config {
  fn General::fromToml(const toml::table& tbl) -> General {
    General gen;

    if (const toml::node_view<const toml::node> levelNode = tbl["log_level"]) {
      const Option<String> levelStr = levelNode.value<String>();

      if (Option<LogLevel> level = levelStr ? magic_enum::enum_cast<LogLevel>(*levelStr, magic_enum::case_insensitive) : None)
        gen.logLevel = *level;
      else
        warn_log("Invalid log_level in [general]. Accepted values are 'debug', 'info', 'warn' and 'error'.");
    }

    return gen;
  }

  fn Brightness::fromToml(const toml::table& tbl) -> Brightness {
    Brightness brightness;

    if (const toml::node_view<const toml::node> pathsNode = tbl["framework_paths"]) {
      if (const toml::array* paths = pathsNode.as_array()) {
        Vec<String> parsed;
        parsed.reserve(paths->size());

        bool valid = true;

        for (const toml::node& path : *paths) {
          Option<String> value = path.value<String>();

          if (!value || value->empty()) {
            valid = false;
            break;
          }

          parsed.emplace_back(std::move(*value));
        }

        if (valid)
          brightness.frameworkPaths = std::move(parsed);
        else
          warn_log("Invalid framework_paths in [brightness]: every entry must be a non-empty string. Using defaults.");
      } else
        warn_log("Invalid framework_paths in [brightness]: expected an array of strings. Using defaults.");
    }

    brightness.getterSymbol = ReadSymbolName(tbl, "getter_symbol", brightness.getterSymbol);
    brightness.setterSymbol = ReadSymbolName(tbl, "setter_symbol", brightness.setterSymbol);

    if (const toml::node_view<const toml::node> maxNode = tbl["max_displays"]) {
      const Option<i64> value = maxNode.value<i64>();

      if (value && *value >= 1 && *value <= static_cast<i64>(MAX_DISPLAYS_LIMIT))
        brightness.maxDisplays = static_cast<usize>(*value);
      else
        warn_log("Invalid max_displays in [brightness]: expected an integer between 1 and {}. Using {}.", MAX_DISPLAYS_LIMIT, brightness.maxDisplays);
    }

    if (const toml::node_view<const toml::node> displayNode = tbl["display_id"]) {
      const Option<i64> value = displayNode.value<i64>();

      if (value && *value >= 0 && *value <= static_cast<i64>(std::numeric_limits<u32>::max()))
        brightness.displayId = static_cast<u32>(*value);
      else
        warn_log("Invalid display_id in [brightness]: expected a display identifier. Using the first active display.");
    }

    return brightness;
  }

  fn Brightness::toOptions() const -> core::brightness::BrightnessOptions {
    return {
      .frameworkPaths = frameworkPaths,
      .symbols        = { .getter = getterSymbol, .setter = setterSymbol },
      .maxDisplays    = maxDisplays,
      .display        = displayId,
    };
  }

  Config::Config(const toml::table& tbl) {
    const toml::node_view genTbl = tbl["general"];
    const toml::node_view brtTbl = tbl["brightness"];

    this->general    = genTbl.is_table() ? General::fromToml(*genTbl.as_table()) : General {};
    this->brightness = brtTbl.is_table() ? Brightness::fromToml(*brtTbl.as_table()) : Brightness {};
  }

  fn Config::getConfigPath() -> Option<fs::path> {
    using utils::env::GetEnv;

    Vec<fs::path> possiblePaths;

    if (Result<PCStr> result = GetEnv("XDG_CONFIG_HOME"))
      possiblePaths.emplace_back(fs::path(*result) / CONFIG_DIR_NAME / CONFIG_FILE_NAME);

    if (Result<PCStr> result = GetEnv("HOME")) {
      possiblePaths.emplace_back(fs::path(*result) / ".config" / CONFIG_DIR_NAME / CONFIG_FILE_NAME);
      possiblePaths.emplace_back(fs::path(*result) / ".macctl" / CONFIG_FILE_NAME);
    }

    possiblePaths.emplace_back(fs::path(".") / CONFIG_FILE_NAME);

    for (const fs::path& path : possiblePaths) {
      std::error_code errc;

      if (fs::exists(path, errc))
        return path;

      if (errc)
        warn_log("Skipping config candidate {}: {}", path.string(), errc.message());
    }

    return None;
  }

  fn Config::fromFile(const fs::path& path) -> Result<Config> {
    std::error_code errc;
    const bool      exists = fs::exists(path, errc);

    if (errc) {
      MacCtlError error(errc);
      error.message = std::format("Cannot access config file {}: {}", path.string(), error.message);
      return Err(std::move(error));
    }

    if (!exists)
      ERR_FMT(NotFound, "Config file not found: {}", path.string());

    try {
      const toml::table parsedConfig = toml::parse_file(path.string());

      debug_log("Config loaded from {}", path.string());

      return Config(parsedConfig);
    } catch (const toml::parse_error& err) {
      ERR_FMT(ParseError, "Failed to parse config file {} (line {}): {}", path.string(), err.source().begin.line, err.description());
    }
  }

  fn Config::getInstance(const Option<fs::path>& explicitPath) -> Result<Config> {
    if (explicitPath)
      return fromFile(*explicitPath);

    if (Option<fs::path> configPath = getConfigPath())
      return fromFile(*configPath);

    debug_log("No config file found, using defaults.");
    return Config {};
  }
} // namespace macctl::config
