#include <cstdlib>    // EXIT_FAILURE, EXIT_SUCCESS
#include <filesystem> // std::filesystem::path

#include <MacCtl/Core/Brightness.hpp>
#include <MacCtl/Utils/ArgumentParser.hpp>
#include <MacCtl/Utils/Definitions.hpp>
#include <MacCtl/Utils/Error.hpp>
#include <MacCtl/Utils/Logging.hpp>
#include <MacCtl/Utils/Types.hpp>

#include "Commands/Brightness.hpp"
#include "Config/Config.hpp"

using namespace macctl::utils::types;
using namespace macctl::utils::logging;
using namespace macctl::config;
using namespace macctl::cli;

using macctl::core::brightness::BrightnessController;

fn main(const i32 argc, PCStr argv[]) -> i32 try {
  // clang-format off
  auto [
    command,
    percentage,
    configPath
  ] = Tuple(String(""), Option<f32>(None), Option<std::filesystem::path>(None));
  // clang-format on

  LogLevel cliLogLevel = LogLevel::Info;
  bool     levelGiven  = false;

  {
    using macctl::utils::argparse::ArgumentParser;

    ArgumentParser parser("macctl", MACCTL_VERSION);

    parser
      .addArguments("command")
      .help("Command to run.")
      .positional()
      .choices({ "brightness" });

    parser
      .addArguments("percentage")
      .help("Brightness to set, in percent (10-100). Prints the current brightness when omitted.")
      .positional();

    parser
      .addArguments("-V", "--verbose")
      .help("Enable verbose logging. Overrides --log-level.")
      .flag();

    parser
      .addArguments("-l", "--log-level")
      .help("Set the minimum log level.")
      .defaultValue(LogLevel::Info);

    parser
      .addArguments("-c", "--config")
      .help("Path to a configuration file. Overrides the default search locations.")
      .defaultValue(String(""));

    if (Result result = parser.parseArgs({ argv, static_cast<usize>(argc) }); !result) {
      error_at(result.error());
      return EXIT_FAILURE;
    }

    if (!parser.isUsed("command")) {
      parser.printHelp();
      return EXIT_FAILURE;
    }

    command = parser.get<String>("command");

    if (parser.isUsed("percentage")) {
      Result<f32> percent = ParsePercentage(parser.get<String>("percentage"));

      if (!percent) {
        error_at(percent.error());
        return EXIT_FAILURE;
      }

      if (Result<f32> level = ValidatePercentage(*percent); !level) {
        error_at(level.error());
        return EXIT_FAILURE;
      }

      percentage = *percent;
    }

    if (parser.isUsed("--config"))
      configPath = std::filesystem::path(parser.get<String>("--config"));

    const bool verbose = parser.get<bool>("-V") || parser.get<bool>("--verbose");

    levelGiven  = verbose || parser.isUsed("--log-level");
    cliLogLevel = verbose ? LogLevel::Debug : parser.getEnum<LogLevel>("--log-level");
  }

  SetRuntimeLogLevel(cliLogLevel);

  Result<Config> config = Config::getInstance(configPath);

  if (!config) {
    error_at(config.error());
    return EXIT_FAILURE;
  }

  // The config file only decides the level when the command line did not.
  if (!levelGiven && config->general.logLevel)
    SetRuntimeLogLevel(*config->general.logLevel);

  debug_log("Running '{}'", command);

  Result<BrightnessController> controller = BrightnessController::CreateForSystem(config->brightness.toOptions());

  if (!controller) {
    error_at(controller.error());
    return EXIT_FAILURE;
  }

  Result<String> output = RunBrightness(*controller, percentage);

  if (!output) {
    error_at(output.error());
    return EXIT_FAILURE;
  }

  Println(*output);

  return EXIT_SUCCESS;
} catch (const Exception& e) {
  error_at(e);
  return EXIT_FAILURE;
}
