#include "cli/cli.hpp"
#include "api/http_api_client.hpp"
#include "crypto/crypto_error.hpp"
#include "crypto/key.hpp"
#include "history/history.hpp"
#include "server/api_service.hpp"
#include "server/auth_gateway.hpp"
#include "server/server_database.hpp"
#include "server/sync_server.hpp"
#include "store/sqlite_history_store.hpp"
#include "sync/checkpoint.hpp"
#include "sync/sync_client.hpp"
#include "sync/sync_lock.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <optional>

namespace histvault::cli {

namespace {

int64_t parse_int(const std::string& text, const std::string& name) {
  try {
    std::size_t used = 0;
    const long long value = std::stoll(text, &used);
    if (used != text.size()) {
      throw std::invalid_argument(text);
    }
    return value;
  } catch (const std::logic_error&) {
    throw std::invalid_argument("Invalid value for " + name + ": " + text);
  }
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

CLI::CLI(config::Settings settings, std::ostream& out, std::ostream& err)
  : settings_(std::move(settings))
  , out_(out)
  , err_(err) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Initialized for host " << settings_.client.hostname;
}

//==============================================
// STARTUP
//==============================================

int CLI::run(const std::vector<std::string>& args) {
  if (args.empty()) {
    print_usage();
    return 1;
  }

  try {
    return dispatch(args);
  } catch (const sync::SyncError& e) {
    BOOST_LOG_TRIVIAL(error) << "CLI: Sync failed: " << e.what();
    err_ << "sync failed during " << sync::to_string(e.phase()) << ": " << e.what() << std::endl;
  } catch (const api::TransportError& e) {
    log_and_display_error("Request failed", e.what());
  } catch (const api::ProtocolError& e) {
    log_and_display_error("Unexpected server response", e.what());
  } catch (const crypto::CryptoError& e) {
    log_and_display_error("Key error", e.what());
  } catch (const store::StoreError& e) {
    log_and_display_error("Storage error", e.what());
  } catch (const config::ConfigError& e) {
    log_and_display_error("Configuration error", e.what());
  } catch (const std::filesystem::filesystem_error& e) {
    log_and_display_error("File system error", e.what());
  } catch (const std::invalid_argument& e) {
    log_and_display_error("Invalid arguments", e.what());
    print_usage();
  }
  return 1;
}

void CLI::print_usage() const {
  err_ << "Usage: histvault <command> [options]\n"
       << "Commands:\n"
       << "  register -u <user> -e <email> -p <password>   Create an account\n"
       << "  login -u <user> -p <password> [-k <key>]      Log in, optionally installing a key\n"
       << "  logout                                        Forget the session\n"
       << "  key                                           Print the encryption key\n"
       << "  sync [-f|--force]                             Synchronize with the server\n"
       << "  status                                        Show local sync state\n"
       << "  history add [--cwd D] [--exit N] [--duration NS] [--session S] -- <command...>\n"
       << "  history list [--limit N]\n"
       << "  server start [--host H] [--port P]            Run the sync server\n"
       << "  uuid                                          Print a fresh id\n";
}

//==============================================
// COMMAND PROCESSING
//==============================================

int CLI::dispatch(const std::vector<std::string>& args) {
  const std::string& command = args[0];
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command;

  if (command == "register") {
    return handle_register(parse_flags(args, 1, {}));
  }
  if (command == "login") {
    return handle_login(parse_flags(args, 1, {}));
  }
  if (command == "logout") {
    return handle_logout();
  }
  if (command == "key") {
    return handle_key();
  }
  if (command == "sync") {
    return handle_sync(parse_flags(args, 1, {"-f", "--force"}));
  }
  if (command == "status") {
    return handle_status();
  }
  if (command == "uuid") {
    return handle_uuid();
  }
  if (command == "history" && args.size() >= 2) {
    if (args[1] == "add") {
      std::vector<std::string> rest;
      const auto flags = parse_flags(args, 2, {}, &rest);
      return handle_history_add(flags, rest);
    }
    if (args[1] == "list") {
      return handle_history_list(parse_flags(args, 2, {}));
    }
  }
  if (command == "server" && args.size() >= 2 && args[1] == "start") {
    return handle_server_start(parse_flags(args, 2, {}));
  }

  err_ << "Unknown command: " << command << std::endl;
  print_usage();
  return 1;
}

int CLI::handle_register(const Flags& flags) {
  api::RegisterRequest request{flag_value(flags, "-u", "--username"),
                               flag_value(flags, "-e", "--email"),
                               flag_value(flags, "-p", "--password")};
  if (request.username.empty() || request.email.empty() || request.password.empty()) {
    throw std::invalid_argument("register requires -u, -e and -p");
  }

  api::HttpApiClient client(settings_.client.sync_address, "", settings_.client.timeout);
  const auto response = client.register_user(request);
  save_session(response.session);
  crypto::load_or_create_key(settings_.client.key_path);

  out_ << "Registered " << request.username << ". Your key is stored in "
       << settings_.client.key_path.string() << std::endl;
  return 0;
}

int CLI::handle_login(const Flags& flags) {
  api::LoginRequest request{flag_value(flags, "-u", "--username"), flag_value(flags, "-p", "--password")};
  if (request.username.empty() || request.password.empty()) {
    throw std::invalid_argument("login requires -u and -p");
  }

  const std::string key_text = flag_value(flags, "-k", "--key");
  if (key_text.empty() && !std::filesystem::exists(settings_.client.key_path)) {
    err_ << "No key found at " << settings_.client.key_path.string()
         << ". Pass the output of 'histvault key' from another machine with -k." << std::endl;
    return 1;
  }
  // Validate before contacting the server
  std::optional<crypto::SymmetricKey> installed_key;
  if (!key_text.empty()) {
    installed_key = crypto::decode_key(key_text);
  }

  api::HttpApiClient client(settings_.client.sync_address, "", settings_.client.timeout);
  const auto response = client.login(request);
  save_session(response.session);
  if (installed_key) {
    crypto::save_key(settings_.client.key_path, *installed_key);
  }

  out_ << "Logged in as " << request.username << std::endl;
  return 0;
}

int CLI::handle_logout() {
  std::error_code ec;
  if (!std::filesystem::remove(settings_.client.session_path, ec)) {
    if (ec) {
      throw store::StoreError("failed to remove session file: " + ec.message());
    }
    out_ << "Not logged in" << std::endl;
    return 0;
  }
  out_ << "Logged out" << std::endl;
  return 0;
}

int CLI::handle_key() {
  out_ << crypto::encode_key(crypto::load_or_create_key(settings_.client.key_path)) << std::endl;
  return 0;
}

int CLI::handle_sync(const Flags& flags) {
  sync::SyncLock lock(settings_.client.lock_path);

  sync::SessionContext session{load_session(),
                               crypto::load_key(settings_.client.key_path),
                               settings_.client.hostname};
  store::SqliteHistoryStore store(settings_.client.db_path.string());
  api::HttpApiClient client(settings_.client.sync_address, session.session_token, settings_.client.timeout);
  sync::SyncClient sync_client(std::move(session), client, store,
                               sync::CheckpointFile(settings_.client.checkpoint_path));

  sync::SyncOptions options;
  options.force = flags.count("-f") > 0 || flags.count("--force") > 0;
  options.page_size = settings_.client.page_size;

  const auto report = sync_client.sync(options);
  out_ << "Sync complete\n"
       << "  uploaded:   " << report.uploaded << "\n"
       << "  downloaded: " << report.downloaded << "\n"
       << "  skipped:    " << report.skipped << "\n"
       << "  pages:      " << report.pages << "\n"
       << "  remote:     " << report.remote_count << " records before sync\n"
       << "  last sync:  " << history::to_rfc3339(report.checkpoint.last_sync_timestamp) << std::endl;
  return 0;
}

int CLI::handle_status() {
  store::SqliteHistoryStore store(settings_.client.db_path.string());
  const auto checkpoint = sync::CheckpointFile(settings_.client.checkpoint_path).load();
  const bool logged_in = std::filesystem::exists(settings_.client.session_path);

  out_ << "host:         " << settings_.client.hostname << "\n"
       << "server:       " << settings_.client.sync_address << (logged_in ? "" : " (not logged in)") << "\n"
       << "records:      " << store.count() << "\n"
       << "newest:       " << history::to_rfc3339(store.max_timestamp()) << "\n"
       << "last sync:    " << history::to_rfc3339(checkpoint.last_sync_timestamp)
       << " (relay sequence " << checkpoint.last_sync_seq << ")\n"
       << "last upload:  " << history::to_rfc3339(checkpoint.last_upload_timestamp) << std::endl;
  return 0;
}

int CLI::handle_history_add(const Flags& flags, const std::vector<std::string>& command) {
  if (command.empty()) {
    throw std::invalid_argument("history add requires a command after --");
  }

  std::string text;
  for (const auto& part : command) {
    if (!text.empty()) {
      text += ' ';
    }
    text += part;
  }

  std::string session = flag_value(flags, "-s", "--session");
  if (session.empty()) {
    const char* env_session = std::getenv("HISTVAULT_SESSION");
    session = env_session ? env_session : history::uuid_v4();
  }

  const auto record = history::HistoryRecord::create(
      text,
      flag_value(flags, "-c", "--cwd", std::filesystem::current_path().string()),
      parse_int(flag_value(flags, "-x", "--exit", "0"), "--exit"),
      parse_int(flag_value(flags, "-d", "--duration", "0"), "--duration"),
      session,
      settings_.client.hostname);

  store::SqliteHistoryStore store(settings_.client.db_path.string());
  store.insert_if_absent(record);
  out_ << record.id << std::endl;
  return 0;
}

int CLI::handle_history_list(const Flags& flags) {
  const int64_t limit = parse_int(flag_value(flags, "-n", "--limit", "20"), "--limit");
  if (limit <= 0) {
    throw std::invalid_argument("--limit must be positive");
  }

  store::SqliteHistoryStore store(settings_.client.db_path.string());
  auto records = store.recent(static_cast<std::size_t>(limit));
  std::reverse(records.begin(), records.end());
  for (const auto& record : records) {
    out_ << history::to_rfc3339(record.timestamp) << '\t' << record.exit << '\t'
         << record.hostname << '\t' << record.command << '\n';
  }
  out_.flush();
  return 0;
}

int CLI::handle_server_start(const Flags& flags) {
  const auto& server_settings = settings_.server;
  const std::string host = flag_value(flags, "-h", "--host", server_settings.host);
  const int64_t port = parse_int(flag_value(flags, "-p", "--port", std::to_string(server_settings.port)), "--port");
  if (port < 0 || port > 65535) {
    throw std::invalid_argument("--port must be between 0 and 65535");
  }

  server::ServerDatabase database(server_settings.db_path.string());
  server::AuthGateway auth(database, server_settings.open_registration);
  server::ApiService service(database, auth, server_settings.page_size);
  server::SyncServer server(service, host, static_cast<uint16_t>(port));

  if (!server.start_listener()) {
    err_ << "Error: Failed to start server on " << host << ":" << port << std::endl;
    return 1;
  }
  out_ << "Listening on " << host << ":" << server.port() << std::endl;

  boost::asio::io_context signals_context;
  boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
  signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
    if (!ec) {
      BOOST_LOG_TRIVIAL(info) << "CLI: Received signal " << signal_number << ", stopping server";
    }
  });
  signals_context.run();

  server.shutdown();
  return 0;
}

int CLI::handle_uuid() {
  out_ << history::uuid_v4() << std::endl;
  return 0;
}

//==============================================
// ARGUMENT PARSING
//==============================================

CLI::Flags CLI::parse_flags(const std::vector<std::string>& args, std::size_t start,
                            const std::vector<std::string>& boolean_flags,
                            std::vector<std::string>* rest) {
  Flags flags;
  for (std::size_t i = start; i < args.size(); ++i) {
    const std::string& flag = args[i];

    if (flag == "--" && rest) {
      rest->assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
      break;
    }
    if (flag.empty() || flag[0] != '-') {
      throw std::invalid_argument("Unexpected argument: " + flag);
    }
    if (std::find(boolean_flags.begin(), boolean_flags.end(), flag) != boolean_flags.end()) {
      flags[flag] = "true";
      continue;
    }
    if (i + 1 >= args.size()) {
      throw std::invalid_argument("Missing value for " + flag);
    }
    flags[flag] = args[++i];
  }
  return flags;
}

std::string CLI::flag_value(const Flags& flags, const std::string& short_name,
                            const std::string& long_name, const std::string& fallback) {
  if (auto it = flags.find(short_name); it != flags.end()) {
    return it->second;
  }
  if (auto it = flags.find(long_name); it != flags.end()) {
    return it->second;
  }
  return fallback;
}

//==============================================
// SESSION FILE
//==============================================

std::string CLI::load_session() const {
  std::ifstream file(settings_.client.session_path);
  std::string token;
  if (!file || !std::getline(file, token) || token.empty()) {
    throw config::ConfigError("not logged in; run 'histvault login' or 'histvault register' first");
  }
  return token;
}

void CLI::save_session(const std::string& token) const {
  const auto& path = settings_.client.session_path;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  std::ofstream file(path, std::ios::trunc);
  if (!file || !(file << token << '\n')) {
    throw store::StoreError("failed to write session file " + path.string());
  }

  std::error_code ec;
  std::filesystem::permissions(path,
                               std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "CLI: Failed to restrict session file permissions: " << ec.message();
  }
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) const {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  err_ << message << ": " << error << std::endl;
}

} // namespace histvault::cli
