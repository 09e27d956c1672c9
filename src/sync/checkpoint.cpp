#include "sync/checkpoint.hpp"
#include "codec/codec_error.hpp"
#include "store/store_error.hpp"
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace histvault::sync {

bool operator==(const SyncCheckpoint& lhs, const SyncCheckpoint& rhs) {
  return lhs.last_sync_timestamp == rhs.last_sync_timestamp
      && lhs.last_sync_seq == rhs.last_sync_seq
      && lhs.last_upload_timestamp == rhs.last_upload_timestamp
      && lhs.last_upload_id == rhs.last_upload_id;
}

CheckpointFile::CheckpointFile(std::filesystem::path path) : path_(std::move(path)) {}

//==============================================
// LOAD AND SAVE
//==============================================

SyncCheckpoint CheckpointFile::load() const {
  SyncCheckpoint checkpoint;
  if (!std::filesystem::exists(path_)) {
    BOOST_LOG_TRIVIAL(debug) << "Checkpoint: No checkpoint at " << path_.string() << ", starting from epoch";
    return checkpoint;
  }

  std::ifstream file(path_);
  if (!file) {
    throw store::StoreError("failed to open checkpoint " + path_.string());
  }

  try {
    const auto j = nlohmann::json::parse(file);
    checkpoint.last_sync_timestamp = history::from_rfc3339(j.at("last_sync_timestamp").get<std::string>());
    checkpoint.last_sync_seq = j.at("last_sync_seq").get<int64_t>();
    checkpoint.last_upload_timestamp = history::from_rfc3339(j.at("last_upload_timestamp").get<std::string>());
    checkpoint.last_upload_id = j.at("last_upload_id").get<std::string>();
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Checkpoint: Corrupt checkpoint " << path_.string() << ": " << e.what();
    throw store::StoreError("corrupt checkpoint " + path_.string() + ": " + e.what());
  } catch (const codec::CodecError& e) {
    BOOST_LOG_TRIVIAL(error) << "Checkpoint: Corrupt checkpoint " << path_.string() << ": " << e.what();
    throw store::StoreError("corrupt checkpoint " + path_.string() + ": " + e.what());
  }
  return checkpoint;
}

void CheckpointFile::save(const SyncCheckpoint& checkpoint) const {
  const nlohmann::json j{
      {"last_sync_timestamp", history::to_rfc3339(checkpoint.last_sync_timestamp)},
      {"last_sync_seq", checkpoint.last_sync_seq},
      {"last_upload_timestamp", history::to_rfc3339(checkpoint.last_upload_timestamp)},
      {"last_upload_id", checkpoint.last_upload_id},
  };

  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      throw store::StoreError("failed to create directory for checkpoint: " + ec.message());
    }
  }

  std::filesystem::path tmp = path_;
  tmp += ".tmp";
  {
    std::ofstream file(tmp, std::ios::trunc);
    if (!file) {
      throw store::StoreError("failed to write checkpoint " + tmp.string());
    }
    file << j.dump(2) << '\n';
    file.close();
    if (!file) {
      throw store::StoreError("failed to write checkpoint " + tmp.string());
    }
  }

  std::filesystem::rename(tmp, path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Checkpoint: Failed to replace " << path_.string() << ": " << ec.message();
    throw store::StoreError("failed to replace checkpoint " + path_.string() + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(debug) << "Checkpoint: Saved sync=" << checkpoint.last_sync_seq
                           << " upload=" << history::to_rfc3339(checkpoint.last_upload_timestamp);
}

} // namespace histvault::sync
