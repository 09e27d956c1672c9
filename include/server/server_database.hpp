#ifndef HISTVAULT_SERVER_DATABASE_HPP
#define HISTVAULT_SERVER_DATABASE_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "api/api_types.hpp"
#include "history/history.hpp"

struct sqlite3;

namespace histvault::server {

struct User {
  int64_t id = 0;
  std::string username;
  std::string email;
  std::string password;  // encoded password hash
};

struct NewUser {
  std::string username;
  std::string email;
  std::string password;
};

/*
 * Server side persistence of users, sessions and encrypted blobs.
 *
 * Every history query is scoped by user id. Blob contents are stored as
 * received and never inspected. Calls are serialized by an internal mutex,
 * and every method throws store::StoreError on a database failure.
 */
class ServerDatabase {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ServerDatabase(const std::string& db_path);
  ~ServerDatabase();

  ServerDatabase(const ServerDatabase&) = delete;
  ServerDatabase& operator=(const ServerDatabase&) = delete;


  // ---- USERS AND SESSIONS ----
  // Returns std::nullopt if the username or email is already taken
  std::optional<User> add_user(const NewUser& user);
  std::optional<User> get_user(const std::string& username);
  std::optional<User> get_session_user(const std::string& token);
  void add_session(int64_t user_id, const std::string& token);


  // ---- HISTORY ----
  // Stores each blob unless (user, id) already exists; returns the number inserted
  std::size_t add_history(int64_t user_id, const std::vector<api::AddHistoryRequest>& batch);
  int64_t count_history(int64_t user_id);
  // Blobs with seq > after_seq, timestamp > history_ts, hostname != host and
  // ingested at or before sync_ts, in ingestion order. seq is the row id, and
  // created_at never decreases along it, so the bound always cuts a suffix.
  std::vector<api::AddHistoryRequest> list_history(int64_t user_id, history::Timestamp sync_ts,
                                                   history::Timestamp history_ts, int64_t after_seq,
                                                   const std::string& host, std::size_t limit);
  // created_at of the most recent ingestion; the epoch on an empty database
  history::Timestamp ingestion_mark();

private:
  sqlite3* db_ = nullptr;
  std::mutex mutex_;
  int64_t last_created_at_ = 0;

  void create_schema();
};

} // namespace histvault::server

#endif // HISTVAULT_SERVER_DATABASE_HPP
