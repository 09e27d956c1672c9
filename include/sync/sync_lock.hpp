#ifndef HISTVAULT_SYNC_LOCK_HPP
#define HISTVAULT_SYNC_LOCK_HPP

#include <filesystem>
#include <boost/interprocess/sync/file_lock.hpp>

namespace histvault::sync {

// Exclusive cross-process lock held for the duration of one sync run.
// Throws store::StoreError if the lock file cannot be created or another
// process already holds it.
class SyncLock {
public:
  explicit SyncLock(const std::filesystem::path& path);
  ~SyncLock();

  SyncLock(const SyncLock&) = delete;
  SyncLock& operator=(const SyncLock&) = delete;

private:
  boost::interprocess::file_lock lock_;
  std::filesystem::path path_;
};

} // namespace histvault::sync

#endif // HISTVAULT_SYNC_LOCK_HPP
