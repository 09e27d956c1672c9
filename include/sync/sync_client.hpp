#ifndef HISTVAULT_SYNC_CLIENT_HPP
#define HISTVAULT_SYNC_CLIENT_HPP

#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include "api/sync_api.hpp"
#include "crypto/key.hpp"
#include "store/history_store.hpp"
#include "sync/checkpoint.hpp"

namespace histvault::sync {

// Credentials and identity of the local host for one client lifetime
struct SessionContext {
  std::string session_token;
  crypto::SymmetricKey key;
  std::string hostname;
};

enum class SyncState {
  Idle,
  Negotiating,
  Uploading,
  Downloading,
  Committed,
  Failed
};

enum class SyncPhase {
  Negotiate,
  Upload,
  Download,
  Commit
};

enum class ErrorKind {
  Crypto,
  Transport,
  Protocol,
  Store,
  Cancelled
};

const char* to_string(SyncState state);
const char* to_string(SyncPhase phase);
const char* to_string(ErrorKind kind);

// The single error surfaced by a failed sync run
class SyncError : public std::runtime_error {
public:
  SyncError(SyncPhase phase, ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , phase_(phase)
    , kind_(kind) {}

  SyncPhase phase() const { return phase_; }
  ErrorKind kind() const { return kind_; }

private:
  SyncPhase phase_;
  ErrorKind kind_;
};

struct SyncOptions {
  bool force = false;
  std::size_t page_size = 100;
};

struct SyncReport {
  std::size_t uploaded = 0;
  std::size_t downloaded = 0;
  std::size_t skipped = 0;   // downloaded blobs already present locally
  std::size_t pages = 0;     // download round trips
  int64_t remote_count = 0;
  int64_t local_count = 0;
  SyncCheckpoint checkpoint;
};


/*
 * Reconciles the local store with the relay.
 *
 * A run moves Idle -> Negotiating -> Uploading -> Downloading -> Committed,
 * or to Failed from any of them. Cursors in the checkpoint only move
 * forward and only after the batch they cover has been fully handled, so
 * an aborted run can be retried as is.
 */
class SyncClient {
public:
  // ---- CONSTRUCTOR ----
  SyncClient(SessionContext session, api::SyncApi& api, store::HistoryStore& store,
             CheckpointFile checkpoint_file);


  // ---- SYNC OPERATIONS ----
  // Runs one full sync; throws SyncError on failure
  SyncReport sync(const SyncOptions& options = SyncOptions{});
  // Requests the running sync to stop at the next batch boundary
  void cancel() { cancelled_ = true; }


  // ---- GETTERS ----
  SyncState state() const { return state_; }
  const SessionContext& session() const { return session_; }

private:
  // ---- PARAMETERS ----
  SessionContext session_;
  api::SyncApi& api_;
  store::HistoryStore& store_;
  CheckpointFile checkpoint_file_;
  std::atomic<SyncState> state_{SyncState::Idle};
  std::atomic<bool> cancelled_{false};


  // ---- PHASES ----
  // Fetches remote and local counts
  void negotiate(SyncReport& report);
  // Uploads unsynced local records from this host
  void upload(SyncCheckpoint& checkpoint, const SyncOptions& options, SyncReport& report);
  // Downloads, decrypts and stores records from other hosts; phase tracks
  // whether a failure happened while fetching or while committing a page
  void download(SyncCheckpoint& checkpoint, const SyncOptions& options, SyncReport& report,
                SyncPhase& phase);
  // Decrypts a full page before anything is written
  std::vector<history::HistoryRecord> decrypt_page(const api::SyncHistoryResponse& page);

  void check_cancelled(SyncPhase phase) const;
  void save_checkpoint(const SyncCheckpoint& checkpoint, SyncPhase phase);
};

} // namespace histvault::sync

#endif // HISTVAULT_SYNC_CLIENT_HPP
