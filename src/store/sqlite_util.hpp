#ifndef HISTVAULT_STORE_SQLITE_UTIL_HPP
#define HISTVAULT_STORE_SQLITE_UTIL_HPP

#include <sqlite3.h>
#include <cstdint>
#include <string>
#include "store/store_error.hpp"

namespace histvault::store::sqlite {

// Prepared statement, finalized on scope exit
class Statement {
public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      throw StoreError(std::string("prepare failed: ") + sqlite3_errmsg(db));
    }
  }

  ~Statement() {
    if (stmt_) {
      sqlite3_finalize(stmt_);
    }
  }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return stmt_; }

  void bind_text(int index, const std::string& value) {
    check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
  }

  void bind_int64(int index, int64_t value) {
    check(sqlite3_bind_int64(stmt_, index, value));
  }

  // Returns true while a row is available
  bool step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
      return true;
    }
    if (rc == SQLITE_DONE) {
      return false;
    }
    throw StoreError(std::string("step failed: ") + sqlite3_errmsg(db_));
  }

  std::string column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_, index);
    if (!text) {
      return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt_, index)));
  }

  int64_t column_int64(int index) const {
    return sqlite3_column_int64(stmt_, index);
  }

  bool column_is_null(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
  }

private:
  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;

  void check(int rc) {
    if (rc != SQLITE_OK) {
      throw StoreError(std::string("bind failed: ") + sqlite3_errmsg(db_));
    }
  }
};

inline void exec_or_throw(sqlite3* db, const char* sql) {
  char* error = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
    std::string message = error ? error : "sqlite exec failed";
    sqlite3_free(error);
    throw StoreError(message);
  }
}

inline sqlite3* open_or_throw(const std::string& db_path) {
  sqlite3* db = nullptr;
  if (sqlite3_open(db_path.c_str(), &db) != SQLITE_OK) {
    std::string message = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw StoreError("failed to open database " + db_path + ": " + message);
  }
  sqlite3_busy_timeout(db, 5000);
  return db;
}

} // namespace histvault::store::sqlite

#endif // HISTVAULT_STORE_SQLITE_UTIL_HPP
