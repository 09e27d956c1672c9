#include "sync/sync_lock.hpp"
#include "store/store_error.hpp"
#include <boost/interprocess/exceptions.hpp>
#include <boost/log/trivial.hpp>
#include <fstream>

namespace histvault::sync {

namespace {

boost::interprocess::file_lock open_lock(const std::filesystem::path& path) {
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  // file_lock requires the file to exist
  std::ofstream touch(path, std::ios::app);
  if (!touch) {
    throw store::StoreError("failed to create lock file " + path.string());
  }
  touch.close();

  try {
    return boost::interprocess::file_lock(path.string().c_str());
  } catch (const boost::interprocess::interprocess_exception& e) {
    throw store::StoreError("failed to open lock file " + path.string() + ": " + e.what());
  }
}

} // namespace

SyncLock::SyncLock(const std::filesystem::path& path) : lock_(open_lock(path)), path_(path) {
  bool acquired = false;
  try {
    acquired = lock_.try_lock();
  } catch (const boost::interprocess::interprocess_exception& e) {
    throw store::StoreError("failed to lock " + path.string() + ": " + e.what());
  }
  if (!acquired) {
    BOOST_LOG_TRIVIAL(warning) << "Sync lock: Another sync is already running (" << path.string() << ")";
    throw store::StoreError("another sync is already running");
  }
  BOOST_LOG_TRIVIAL(debug) << "Sync lock: Acquired " << path.string();
}

SyncLock::~SyncLock() {
  try {
    lock_.unlock();
    BOOST_LOG_TRIVIAL(debug) << "Sync lock: Released " << path_.string();
  } catch (const boost::interprocess::interprocess_exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Sync lock: Failed to release " << path_.string() << ": " << e.what();
  }
}

} // namespace histvault::sync
