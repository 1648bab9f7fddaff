#pragma once

#include <filesystem>       // std::filesystem::path
#include <toml++/toml.hpp>  // toml::table

#include <MacCtl/Core/Brightness.hpp>
#include <MacCtl/Core/Display.hpp>
#include <MacCtl/Utils/Definitions.hpp>
#include <MacCtl/Utils/Error.hpp>
#include <MacCtl/Utils/Logging.hpp>
#include <MacCtl/Utils/Types.hpp>

namespace macctl::config {
  namespace {
    using utils::logging::LogLevel;

    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::u32;
    using utils::types::usize;
    using utils::types::Vec;
  } // namespace

  /// Largest value accepted for `max_displays`.
  inline constexpr usize MAX_DISPLAYS_LIMIT = 64;

  /**
   * @struct General
   * @brief Holds general configuration settings.
   */
  struct General {
    Option<LogLevel> logLevel; ///< Minimum log level; the command line wins when both are given.

    /**
     * @brief Parses a TOML table to create a General instance.
     * @param tbl The TOML table to parse, containing [general].
     * @return A General instance with the parsed values, or defaults otherwise.
     */
    static fn fromToml(const toml::table& tbl) -> General;
  };

  /**
   * @struct Brightness
   * @brief Holds settings for locating the brightness entry points.
   */
  struct Brightness {
    Vec<String> frameworkPaths = core::brightness::DefaultFrameworkPaths();      ///< Candidate libraries, in priority order.
    String      getterSymbol   = core::brightness::DefaultSymbolNames().getter; ///< Name of the getter entry point.
    String      setterSymbol   = core::brightness::DefaultSymbolNames().setter; ///< Name of the setter entry point.
    usize       maxDisplays    = core::display::DEFAULT_MAX_DISPLAYS;           ///< Bound on display enumeration.
    Option<u32> displayId;                                                      ///< Preferred display, if any.

    /**
     * @brief Parses a TOML table to create a Brightness instance.
     *
     * Invalid values are reported with a warning and replaced by their defaults.
     * @param tbl The TOML table to parse, containing [brightness].
     * @return A Brightness instance with the parsed values, or defaults otherwise.
     */
    static fn fromToml(const toml::table& tbl) -> Brightness;

    /**
     * @brief Converts these settings into controller options.
     */
    [[nodiscard]] fn toOptions() const -> core::brightness::BrightnessOptions;
  };

  /**
   * @struct Config
   * @brief Holds the application configuration settings.
   *
   * The file is only ever read; a missing file means built-in defaults.
   */
  struct Config {
    General    general;    ///< General configuration settings.
    Brightness brightness; ///< Brightness configuration settings.

    /**
     * @brief Default constructor for Config.
     */
    Config() = default;

    /**
     * @brief Constructs a Config instance from a TOML table.
     * @param tbl The TOML table to parse, containing [general] and [brightness].
     */
    explicit Config(const toml::table& tbl);

    /**
     * @brief Finds the configuration file to use.
     * @return The first existing candidate path, or None when there is none.
     *
     * Candidates are `$XDG_CONFIG_HOME/macctl/config.toml`,
     * `$HOME/.config/macctl/config.toml`, `$HOME/.macctl/config.toml` and
     * `./config.toml`, in that order.
     */
    static fn getConfigPath() -> Option<std::filesystem::path>;

    /**
     * @brief Loads and parses the configuration file at @p path.
     * @return The parsed configuration, `NotFound` when the file does not exist,
     * or `ParseError` when it is not valid TOML.
     */
    static fn fromFile(const std::filesystem::path& path) -> Result<Config>;

    /**
     * @brief Loads the configuration for this run.
     * @param explicitPath Path given with `--config`. It must exist.
     * @return The loaded configuration, or defaults when no file was found.
     */
    static fn getInstance(const Option<std::filesystem::path>& explicitPath) -> Result<Config>;
  };
} // namespace macctl::config
