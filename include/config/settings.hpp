#ifndef HISTVAULT_CONFIG_SETTINGS_HPP
#define HISTVAULT_CONFIG_SETTINGS_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <stdexcept>
#include <string>
#include "logging/logger.hpp"

namespace histvault::config {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Config error: " + message) {}
};

struct ClientSettings {
  std::string sync_address = "http://127.0.0.1:8888";
  std::filesystem::path db_path;
  std::filesystem::path key_path;
  std::filesystem::path session_path;
  std::filesystem::path checkpoint_path;
  std::filesystem::path lock_path;
  std::string hostname;
  std::size_t page_size = 100;
  std::chrono::seconds timeout{30};
};

struct ServerSettings {
  std::string host = "127.0.0.1";
  uint16_t port = 8888;
  std::filesystem::path db_path;
  bool open_registration = true;
  std::size_t page_size = 1000;
};

struct LogSettings {
  logging::severity_level level = boost::log::trivial::warning;
  std::string file;
};

struct Settings {
  ClientSettings client;
  ServerSettings server;
  LogSettings log;

  // Defaults with every file placed under data_dir
  static Settings defaults(const std::filesystem::path& data_dir);
};


// ---- LOCATIONS ----
// $HISTVAULT_CONFIG, else $XDG_CONFIG_HOME/histvault/config.ini, else ~/.config/histvault/config.ini
std::filesystem::path default_config_path();
// $XDG_DATA_HOME/histvault, else ~/.local/share/histvault
std::filesystem::path default_data_dir();


// ---- LOADING ----
// Reads [client], [server] and [log] from an INI document. Throws ConfigError.
Settings parse_settings(std::istream& input, const std::filesystem::path& data_dir);
// A missing file yields the defaults
Settings load_settings(const std::filesystem::path& path, const std::filesystem::path& data_dir);
Settings load_settings();

} // namespace histvault::config

#endif // HISTVAULT_CONFIG_SETTINGS_HPP
