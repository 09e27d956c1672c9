#include "server/server_database.hpp"
#include "../store/sqlite_util.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <filesystem>
#include <limits>

namespace histvault::server {

namespace {

User read_user(const store::sqlite::Statement& stmt) {
  User user;
  user.id = stmt.column_int64(0);
  user.username = stmt.column_text(1);
  user.email = stmt.column_text(2);
  user.password = stmt.column_text(3);
  return user;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ServerDatabase::ServerDatabase(const std::string& db_path) {
  BOOST_LOG_TRIVIAL(info) << "Server database: Opening " << db_path;

  if (db_path != ":memory:") {
    const std::filesystem::path path(db_path);
    if (path.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(path.parent_path(), ec);
      if (ec) {
        throw store::StoreError("failed to create directory for " + db_path + ": " + ec.message());
      }
    }
  }

  db_ = store::sqlite::open_or_throw(db_path);
  try {
    create_schema();
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Server database: Failed to initialize schema: " << e.what();
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

ServerDatabase::~ServerDatabase() {
  if (db_) {
    sqlite3_close(db_);
  }
}

void ServerDatabase::create_schema() {
  store::sqlite::exec_or_throw(db_, "PRAGMA journal_mode=WAL;");
  store::sqlite::exec_or_throw(db_,
      "CREATE TABLE IF NOT EXISTS users ("
      "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
      "  username TEXT NOT NULL UNIQUE,"
      "  email TEXT NOT NULL UNIQUE,"
      "  password TEXT NOT NULL"
      ");");
  store::sqlite::exec_or_throw(db_,
      "CREATE TABLE IF NOT EXISTS sessions ("
      "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
      "  user_id INTEGER NOT NULL REFERENCES users(id),"
      "  token TEXT NOT NULL UNIQUE"
      ");");
  store::sqlite::exec_or_throw(db_,
      "CREATE TABLE IF NOT EXISTS history ("
      "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
      "  client_id TEXT NOT NULL,"
      "  user_id INTEGER NOT NULL REFERENCES users(id),"
      "  hostname TEXT NOT NULL,"
      "  timestamp INTEGER NOT NULL,"
      "  data TEXT NOT NULL,"
      "  created_at INTEGER NOT NULL,"
      "  UNIQUE(user_id, client_id)"
      ");");
  store::sqlite::exec_or_throw(db_,
      "CREATE INDEX IF NOT EXISTS idx_history_user_timestamp ON history(user_id, timestamp);");

  store::sqlite::Statement mark(db_, "SELECT MAX(created_at) FROM history;");
  if (mark.step() && !mark.column_is_null(0)) {
    last_created_at_ = mark.column_int64(0);
  }
}

//==============================================
// USERS AND SESSIONS
//==============================================

std::optional<User> ServerDatabase::add_user(const NewUser& user) {
  std::lock_guard<std::mutex> lock(mutex_);

  store::sqlite::Statement existing(db_, "SELECT 1 FROM users WHERE username = ? OR email = ?;");
  existing.bind_text(1, user.username);
  existing.bind_text(2, user.email);
  if (existing.step()) {
    BOOST_LOG_TRIVIAL(info) << "Server database: Username or email already registered: " << user.username;
    return std::nullopt;
  }

  store::sqlite::Statement insert(db_, "INSERT INTO users (username, email, password) VALUES (?, ?, ?);");
  insert.bind_text(1, user.username);
  insert.bind_text(2, user.email);
  insert.bind_text(3, user.password);
  insert.step();

  User created;
  created.id = sqlite3_last_insert_rowid(db_);
  created.username = user.username;
  created.email = user.email;
  created.password = user.password;
  BOOST_LOG_TRIVIAL(info) << "Server database: Created user " << created.username << " (" << created.id << ")";
  return created;
}

std::optional<User> ServerDatabase::get_user(const std::string& username) {
  std::lock_guard<std::mutex> lock(mutex_);

  store::sqlite::Statement stmt(db_, "SELECT id, username, email, password FROM users WHERE username = ?;");
  stmt.bind_text(1, username);
  if (!stmt.step()) {
    return std::nullopt;
  }
  return read_user(stmt);
}

std::optional<User> ServerDatabase::get_session_user(const std::string& token) {
  std::lock_guard<std::mutex> lock(mutex_);

  store::sqlite::Statement stmt(db_,
      "SELECT users.id, users.username, users.email, users.password FROM sessions "
      "INNER JOIN users ON users.id = sessions.user_id WHERE sessions.token = ?;");
  stmt.bind_text(1, token);
  if (!stmt.step()) {
    return std::nullopt;
  }
  return read_user(stmt);
}

void ServerDatabase::add_session(int64_t user_id, const std::string& token) {
  std::lock_guard<std::mutex> lock(mutex_);

  store::sqlite::Statement stmt(db_, "INSERT INTO sessions (user_id, token) VALUES (?, ?);");
  stmt.bind_int64(1, user_id);
  stmt.bind_text(2, token);
  stmt.step();
}

//==============================================
// HISTORY
//==============================================

std::size_t ServerDatabase::add_history(int64_t user_id, const std::vector<api::AddHistoryRequest>& batch) {
  std::lock_guard<std::mutex> lock(mutex_);

  // Kept monotonic along the row id even if the wall clock steps back
  const int64_t created_at = std::max(history::to_nanos(history::now()), last_created_at_);
  std::size_t inserted = 0;

  store::sqlite::exec_or_throw(db_, "BEGIN;");
  try {
    for (const auto& item : batch) {
      store::sqlite::Statement stmt(db_,
          "INSERT OR IGNORE INTO history (client_id, user_id, hostname, timestamp, data, created_at) "
          "VALUES (?, ?, ?, ?, ?, ?);");
      stmt.bind_text(1, item.id);
      stmt.bind_int64(2, user_id);
      stmt.bind_text(3, item.hostname);
      stmt.bind_int64(4, history::to_nanos(item.timestamp));
      stmt.bind_text(5, item.data);
      stmt.bind_int64(6, created_at);
      stmt.step();
      inserted += static_cast<std::size_t>(sqlite3_changes(db_));
    }
    store::sqlite::exec_or_throw(db_, "COMMIT;");
    if (inserted > 0) {
      last_created_at_ = created_at;
    }
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Server database: Rolling back history batch: " << e.what();
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
      BOOST_LOG_TRIVIAL(error) << "Server database: Rollback failed: " << sqlite3_errmsg(db_);
    }
    throw;
  }

  BOOST_LOG_TRIVIAL(debug) << "Server database: Stored " << inserted << " of " << batch.size()
                           << " blobs for user " << user_id;
  return inserted;
}

int64_t ServerDatabase::count_history(int64_t user_id) {
  std::lock_guard<std::mutex> lock(mutex_);

  store::sqlite::Statement stmt(db_, "SELECT COUNT(*) FROM history WHERE user_id = ?;");
  stmt.bind_int64(1, user_id);
  if (!stmt.step()) {
    throw store::StoreError("count query returned no row");
  }
  return stmt.column_int64(0);
}

std::vector<api::AddHistoryRequest> ServerDatabase::list_history(int64_t user_id, history::Timestamp sync_ts,
                                                                 history::Timestamp history_ts, int64_t after_seq,
                                                                 const std::string& host, std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);

  store::sqlite::Statement stmt(db_,
      "SELECT client_id, timestamp, data, hostname, id FROM history "
      "WHERE user_id = ? AND id > ? AND timestamp > ? AND hostname != ? AND created_at <= ? "
      "ORDER BY id ASC LIMIT ?;");
  stmt.bind_int64(1, user_id);
  stmt.bind_int64(2, after_seq);
  stmt.bind_int64(3, history::to_nanos(history_ts));
  stmt.bind_text(4, host);
  stmt.bind_int64(5, history::to_nanos(sync_ts));
  stmt.bind_int64(6, static_cast<int64_t>(std::min<std::size_t>(limit, std::numeric_limits<int64_t>::max())));

  std::vector<api::AddHistoryRequest> page;
  while (stmt.step()) {
    api::AddHistoryRequest item;
    item.id = stmt.column_text(0);
    item.timestamp = history::from_nanos(stmt.column_int64(1));
    item.data = stmt.column_text(2);
    item.hostname = stmt.column_text(3);
    item.seq = stmt.column_int64(4);
    page.push_back(std::move(item));
  }
  return page;
}

history::Timestamp ServerDatabase::ingestion_mark() {
  std::lock_guard<std::mutex> lock(mutex_);
  return history::from_nanos(last_created_at_);
}

} // namespace histvault::server
