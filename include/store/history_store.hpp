#ifndef HISTVAULT_STORE_HISTORY_STORE_HPP
#define HISTVAULT_STORE_HISTORY_STORE_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "history/history.hpp"
#include "store/store_error.hpp"

namespace histvault::store {

// Contract the sync engine uses against the local history database.
// Every operation throws StoreError on failure.
class HistoryStore {
public:
  virtual ~HistoryStore() = default;

  // ---- WRITE OPERATIONS ----
  // Inserts the record unless its id is already present; returns true if inserted
  virtual bool insert_if_absent(const history::HistoryRecord& record) = 0;


  // ---- QUERY OPERATIONS ----
  // Records with timestamp > since and hostname != exclude_host, oldest first
  virtual std::vector<history::HistoryRecord> records_since(history::Timestamp since,
                                                            const std::string& exclude_host,
                                                            std::size_t limit) = 0;
  // Records with hostname == host that come after (since, after_id) in
  // (timestamp, id) order, oldest first
  virtual std::vector<history::HistoryRecord> records_from_host(history::Timestamp since,
                                                                const std::string& after_id,
                                                                const std::string& host,
                                                                std::size_t limit) = 0;
  // Newest records first
  virtual std::vector<history::HistoryRecord> recent(std::size_t limit) = 0;
  virtual int64_t count() = 0;
  // Epoch when the store is empty
  virtual history::Timestamp max_timestamp() = 0;
};

} // namespace histvault::store

#endif // HISTVAULT_STORE_HISTORY_STORE_HPP
