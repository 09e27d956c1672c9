#include "config/settings.hpp"
#include "history/history.hpp"
#include <boost/log/trivial.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <cstdlib>
#include <fstream>

namespace histvault::config {

namespace pt = boost::property_tree;

namespace {

std::filesystem::path env_path(const char* name) {
  const char* value = std::getenv(name);
  if (value && *value) {
    return std::filesystem::path(value);
  }
  return {};
}

std::filesystem::path home_dir() {
  auto home = env_path("HOME");
  if (home.empty()) {
    throw ConfigError("HOME is not set");
  }
  return home;
}

template <typename T>
T read_value(const pt::ptree& tree, const std::string& key, const T& fallback) {
  if (!tree.get_optional<std::string>(key)) {
    return fallback;
  }
  try {
    return tree.get<T>(key);
  } catch (const pt::ptree_bad_data& e) {
    throw ConfigError("invalid value for " + key + ": " + e.what());
  }
}

} // namespace

//==============================================
// DEFAULTS AND LOCATIONS
//==============================================

Settings Settings::defaults(const std::filesystem::path& data_dir) {
  Settings settings;
  settings.client.db_path = data_dir / "history.db";
  settings.client.key_path = data_dir / "key";
  settings.client.session_path = data_dir / "session";
  settings.client.checkpoint_path = data_dir / "checkpoint.json";
  settings.client.lock_path = data_dir / "sync.lock";
  settings.client.hostname = history::default_hostname();
  settings.server.db_path = data_dir / "server.db";
  return settings;
}

std::filesystem::path default_config_path() {
  if (auto explicit_path = env_path("HISTVAULT_CONFIG"); !explicit_path.empty()) {
    return explicit_path;
  }
  if (auto xdg = env_path("XDG_CONFIG_HOME"); !xdg.empty()) {
    return xdg / "histvault" / "config.ini";
  }
  return home_dir() / ".config" / "histvault" / "config.ini";
}

std::filesystem::path default_data_dir() {
  if (auto xdg = env_path("XDG_DATA_HOME"); !xdg.empty()) {
    return xdg / "histvault";
  }
  return home_dir() / ".local" / "share" / "histvault";
}

//==============================================
// LOADING
//==============================================

Settings parse_settings(std::istream& input, const std::filesystem::path& data_dir) {
  pt::ptree tree;
  try {
    pt::ini_parser::read_ini(input, tree);
  } catch (const pt::ini_parser_error& e) {
    throw ConfigError(e.what());
  }

  Settings settings = Settings::defaults(data_dir);

  // [client]
  auto& client = settings.client;
  client.sync_address = read_value(tree, "client.sync_address", client.sync_address);
  client.db_path = read_value(tree, "client.db_path", client.db_path.string());
  client.key_path = read_value(tree, "client.key_path", client.key_path.string());
  client.session_path = read_value(tree, "client.session_path", client.session_path.string());
  client.checkpoint_path = read_value(tree, "client.checkpoint_path", client.checkpoint_path.string());
  client.lock_path = read_value(tree, "client.lock_path", client.lock_path.string());
  client.hostname = read_value(tree, "client.hostname", client.hostname);

  const auto page_size = read_value<long long>(tree, "client.page_size", 100);
  if (page_size <= 0 || page_size > 100000) {
    throw ConfigError("client.page_size must be between 1 and 100000");
  }
  client.page_size = static_cast<std::size_t>(page_size);

  const auto timeout = read_value<long long>(tree, "client.timeout_seconds", 30);
  if (timeout <= 0) {
    throw ConfigError("client.timeout_seconds must be positive");
  }
  client.timeout = std::chrono::seconds(timeout);

  if (client.hostname.empty()) {
    throw ConfigError("client.hostname must not be empty");
  }

  // [server]
  auto& server = settings.server;
  server.host = read_value(tree, "server.host", server.host);
  const auto port = read_value<long>(tree, "server.port", server.port);
  if (port < 0 || port > 65535) {
    throw ConfigError("server.port must be between 0 and 65535");
  }
  server.port = static_cast<uint16_t>(port);
  server.db_path = read_value(tree, "server.db_path", server.db_path.string());
  server.open_registration = read_value(tree, "server.open_registration", server.open_registration);

  const auto server_page_size = read_value<long long>(tree, "server.page_size", 1000);
  if (server_page_size <= 0) {
    throw ConfigError("server.page_size must be positive");
  }
  server.page_size = static_cast<std::size_t>(server_page_size);

  // [log]
  const auto level = read_value<std::string>(tree, "log.level", "warning");
  try {
    settings.log.level = logging::parse_severity(level);
  } catch (const std::invalid_argument& e) {
    throw ConfigError(e.what());
  }
  settings.log.file = read_value<std::string>(tree, "log.file", "");

  return settings;
}

Settings load_settings(const std::filesystem::path& path, const std::filesystem::path& data_dir) {
  if (!std::filesystem::exists(path)) {
    BOOST_LOG_TRIVIAL(debug) << "Config: No config file at " << path.string() << ", using defaults";
    return Settings::defaults(data_dir);
  }

  std::ifstream file(path);
  if (!file) {
    throw ConfigError("cannot open " + path.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "Config: Loading " << path.string();
  return parse_settings(file, data_dir);
}

Settings load_settings() {
  return load_settings(default_config_path(), default_data_dir());
}

} // namespace histvault::config
