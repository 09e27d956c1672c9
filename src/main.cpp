#include "cli/cli.hpp"
#include "config/settings.hpp"
#include "logging/logger.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
  histvault::logging::init_logging();

  histvault::config::Settings settings;
  try {
    settings = histvault::config::load_settings();
    histvault::logging::init_logging(settings.log.file, settings.log.level);
  } catch (const histvault::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }

  const std::vector<std::string> args(argv + 1, argv + argc);
  histvault::cli::CLI cli(std::move(settings));
  const int status = cli.run(args);

  histvault::logging::shutdown_logging();
  return status;
}
