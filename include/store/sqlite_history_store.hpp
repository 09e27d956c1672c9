#ifndef HISTVAULT_STORE_SQLITE_HISTORY_STORE_HPP
#define HISTVAULT_STORE_SQLITE_HISTORY_STORE_HPP

#include <filesystem>
#include <memory>
#include "store/history_store.hpp"

struct sqlite3;

namespace histvault::store {

class SqliteHistoryStore : public HistoryStore {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Opens or creates the database; ":memory:" gives a private in-memory store
  explicit SqliteHistoryStore(const std::string& db_path);
  ~SqliteHistoryStore() override;

  SqliteHistoryStore(const SqliteHistoryStore&) = delete;
  SqliteHistoryStore& operator=(const SqliteHistoryStore&) = delete;


  // ---- HISTORY STORE ----
  bool insert_if_absent(const history::HistoryRecord& record) override;
  std::vector<history::HistoryRecord> records_since(history::Timestamp since,
                                                    const std::string& exclude_host,
                                                    std::size_t limit) override;
  std::vector<history::HistoryRecord> records_from_host(history::Timestamp since,
                                                        const std::string& after_id,
                                                        const std::string& host,
                                                        std::size_t limit) override;
  std::vector<history::HistoryRecord> recent(std::size_t limit) override;
  int64_t count() override;
  history::Timestamp max_timestamp() override;

private:
  sqlite3* db_ = nullptr;

  void create_schema();
};

} // namespace histvault::store

#endif // HISTVAULT_STORE_SQLITE_HISTORY_STORE_HPP
