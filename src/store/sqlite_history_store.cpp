#include "store/sqlite_history_store.hpp"
#include "sqlite_util.hpp"
#include <boost/log/trivial.hpp>
#include <filesystem>
#include <limits>

namespace histvault::store {

namespace {

constexpr const char* kSelectColumns =
    "SELECT id, timestamp, duration, exit, command, cwd, session, hostname FROM history ";

history::HistoryRecord read_record(const sqlite::Statement& stmt) {
  history::HistoryRecord record;
  record.id = stmt.column_text(0);
  record.timestamp = history::from_nanos(stmt.column_int64(1));
  record.duration = stmt.column_int64(2);
  record.exit = stmt.column_int64(3);
  record.command = stmt.column_text(4);
  record.cwd = stmt.column_text(5);
  record.session = stmt.column_text(6);
  record.hostname = stmt.column_text(7);
  return record;
}

int64_t to_limit(std::size_t limit) {
  if (limit > static_cast<std::size_t>(std::numeric_limits<int64_t>::max())) {
    return std::numeric_limits<int64_t>::max();
  }
  return static_cast<int64_t>(limit);
}

std::vector<history::HistoryRecord> collect(sqlite::Statement& stmt) {
  std::vector<history::HistoryRecord> records;
  while (stmt.step()) {
    records.push_back(read_record(stmt));
  }
  return records;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SqliteHistoryStore::SqliteHistoryStore(const std::string& db_path) {
  BOOST_LOG_TRIVIAL(info) << "History store: Opening database: " << db_path;

  if (db_path != ":memory:") {
    const std::filesystem::path path(db_path);
    if (path.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(path.parent_path(), ec);
      if (ec) {
        BOOST_LOG_TRIVIAL(error) << "History store: Failed to create directory for " << db_path
                                 << ": " << ec.message();
        throw StoreError("failed to create directory for " + db_path + ": " + ec.message());
      }
    }
  }

  db_ = sqlite::open_or_throw(db_path);
  try {
    create_schema();
  } catch (const StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "History store: Failed to initialize schema: " << e.what();
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteHistoryStore::~SqliteHistoryStore() {
  if (db_) {
    sqlite3_close(db_);
  }
}

void SqliteHistoryStore::create_schema() {
  sqlite::exec_or_throw(db_, "PRAGMA journal_mode=WAL;");
  sqlite::exec_or_throw(db_,
      "CREATE TABLE IF NOT EXISTS history ("
      "  id TEXT PRIMARY KEY,"
      "  timestamp INTEGER NOT NULL,"
      "  duration INTEGER NOT NULL,"
      "  exit INTEGER NOT NULL,"
      "  command TEXT NOT NULL,"
      "  cwd TEXT NOT NULL,"
      "  session TEXT NOT NULL,"
      "  hostname TEXT NOT NULL"
      ");");
  sqlite::exec_or_throw(db_,
      "CREATE INDEX IF NOT EXISTS idx_history_timestamp ON history(timestamp);");
}

//==============================================
// WRITE OPERATIONS
//==============================================

bool SqliteHistoryStore::insert_if_absent(const history::HistoryRecord& record) {
  sqlite::Statement stmt(db_,
      "INSERT OR IGNORE INTO history "
      "(id, timestamp, duration, exit, command, cwd, session, hostname) "
      "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
  stmt.bind_text(1, record.id);
  stmt.bind_int64(2, history::to_nanos(record.timestamp));
  stmt.bind_int64(3, record.duration);
  stmt.bind_int64(4, record.exit);
  stmt.bind_text(5, record.command);
  stmt.bind_text(6, record.cwd);
  stmt.bind_text(7, record.session);
  stmt.bind_text(8, record.hostname);
  stmt.step();

  const bool inserted = sqlite3_changes(db_) > 0;
  BOOST_LOG_TRIVIAL(trace) << "History store: " << (inserted ? "Inserted" : "Skipped existing")
                           << " record " << record.id;
  return inserted;
}

//==============================================
// QUERY OPERATIONS
//==============================================

std::vector<history::HistoryRecord> SqliteHistoryStore::records_since(history::Timestamp since,
                                                                      const std::string& exclude_host,
                                                                      std::size_t limit) {
  const std::string sql = std::string(kSelectColumns)
      + "WHERE timestamp > ? AND hostname != ? ORDER BY timestamp ASC, id ASC LIMIT ?;";
  sqlite::Statement stmt(db_, sql.c_str());
  stmt.bind_int64(1, history::to_nanos(since));
  stmt.bind_text(2, exclude_host);
  stmt.bind_int64(3, to_limit(limit));
  return collect(stmt);
}

std::vector<history::HistoryRecord> SqliteHistoryStore::records_from_host(history::Timestamp since,
                                                                          const std::string& after_id,
                                                                          const std::string& host,
                                                                          std::size_t limit) {
  const std::string sql = std::string(kSelectColumns)
      + "WHERE hostname = ? AND (timestamp > ? OR (timestamp = ? AND id > ?)) "
        "ORDER BY timestamp ASC, id ASC LIMIT ?;";
  sqlite::Statement stmt(db_, sql.c_str());
  stmt.bind_text(1, host);
  stmt.bind_int64(2, history::to_nanos(since));
  stmt.bind_int64(3, history::to_nanos(since));
  stmt.bind_text(4, after_id);
  stmt.bind_int64(5, to_limit(limit));
  return collect(stmt);
}

std::vector<history::HistoryRecord> SqliteHistoryStore::recent(std::size_t limit) {
  const std::string sql = std::string(kSelectColumns) + "ORDER BY timestamp DESC, id DESC LIMIT ?;";
  sqlite::Statement stmt(db_, sql.c_str());
  stmt.bind_int64(1, to_limit(limit));
  return collect(stmt);
}

int64_t SqliteHistoryStore::count() {
  sqlite::Statement stmt(db_, "SELECT COUNT(*) FROM history;");
  if (!stmt.step()) {
    throw StoreError("count query returned no row");
  }
  return stmt.column_int64(0);
}

history::Timestamp SqliteHistoryStore::max_timestamp() {
  sqlite::Statement stmt(db_, "SELECT MAX(timestamp) FROM history;");
  if (!stmt.step() || stmt.column_is_null(0)) {
    return history::epoch();
  }
  return history::from_nanos(stmt.column_int64(0));
}

} // namespace histvault::store
