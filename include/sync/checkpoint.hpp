#ifndef HISTVAULT_SYNC_CHECKPOINT_HPP
#define HISTVAULT_SYNC_CHECKPOINT_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include "history/history.hpp"

namespace histvault::sync {

// Sync cursors for one (user, host) pair
struct SyncCheckpoint {
  // Newest record timestamp among everything downloaded so far
  history::Timestamp last_sync_timestamp = history::epoch();
  // Every blob from other hosts the relay ingested up to this sequence has been downloaded
  int64_t last_sync_seq = 0;
  // Every record from this host up to (last_upload_timestamp, last_upload_id)
  // in (timestamp, id) order has been uploaded
  history::Timestamp last_upload_timestamp = history::epoch();
  std::string last_upload_id;
};

bool operator==(const SyncCheckpoint& lhs, const SyncCheckpoint& rhs);

// JSON persistence of a checkpoint. Throws store::StoreError on failure.
class CheckpointFile {
public:
  explicit CheckpointFile(std::filesystem::path path);

  // Missing file yields a checkpoint at the epoch
  SyncCheckpoint load() const;
  // Replaces the file atomically
  void save(const SyncCheckpoint& checkpoint) const;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace histvault::sync

#endif // HISTVAULT_SYNC_CHECKPOINT_HPP
