#include "sync/sync_client.hpp"
#include "codec/codec_error.hpp"
#include "crypto/cipher.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace histvault::sync {

//==============================================
// NAMES
//==============================================

const char* to_string(SyncState state) {
  switch (state) {
    case SyncState::Idle: return "idle";
    case SyncState::Negotiating: return "negotiating";
    case SyncState::Uploading: return "uploading";
    case SyncState::Downloading: return "downloading";
    case SyncState::Committed: return "committed";
    case SyncState::Failed: return "failed";
  }
  return "unknown";
}

const char* to_string(SyncPhase phase) {
  switch (phase) {
    case SyncPhase::Negotiate: return "negotiate";
    case SyncPhase::Upload: return "upload";
    case SyncPhase::Download: return "download";
    case SyncPhase::Commit: return "commit";
  }
  return "unknown";
}

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Crypto: return "crypto";
    case ErrorKind::Transport: return "transport";
    case ErrorKind::Protocol: return "protocol";
    case ErrorKind::Store: return "store";
    case ErrorKind::Cancelled: return "cancelled";
  }
  return "unknown";
}

//==============================================
// CONSTRUCTOR
//==============================================

SyncClient::SyncClient(SessionContext session, api::SyncApi& api, store::HistoryStore& store,
                       CheckpointFile checkpoint_file)
  : session_(std::move(session))
  , api_(api)
  , store_(store)
  , checkpoint_file_(std::move(checkpoint_file)) {
  BOOST_LOG_TRIVIAL(debug) << "Sync client: Created for host " << session_.hostname;
}

//==============================================
// SYNC OPERATIONS
//==============================================

SyncReport SyncClient::sync(const SyncOptions& options) {
  if (options.page_size == 0) {
    throw std::invalid_argument("Sync client: page size must be positive");
  }

  BOOST_LOG_TRIVIAL(info) << "Sync client: Starting " << (options.force ? "forced " : "")
                          << "sync for host " << session_.hostname;

  cancelled_ = false;
  SyncReport report;
  SyncPhase phase = SyncPhase::Negotiate;

  auto fail = [&](ErrorKind kind, const std::string& message) {
    state_ = SyncState::Failed;
    BOOST_LOG_TRIVIAL(error) << "Sync client: Sync failed during " << to_string(phase)
                             << " (" << to_string(kind) << "): " << message;
    return SyncError(phase, kind, message);
  };

  try {
    state_ = SyncState::Negotiating;
    SyncCheckpoint checkpoint = checkpoint_file_.load();
    if (options.force) {
      BOOST_LOG_TRIVIAL(info) << "Sync client: Forced sync, resetting checkpoint";
      checkpoint = SyncCheckpoint{};
      checkpoint_file_.save(checkpoint);
    }
    negotiate(report);

    phase = SyncPhase::Upload;
    state_ = SyncState::Uploading;
    upload(checkpoint, options, report);

    phase = SyncPhase::Download;
    state_ = SyncState::Downloading;
    const bool counts_differ = report.remote_count != report.local_count;
    if (options.force || report.uploaded > 0 || counts_differ) {
      download(checkpoint, options, report, phase);
    } else {
      BOOST_LOG_TRIVIAL(info) << "Sync client: Local and remote counts match ("
                              << report.local_count << "), skipping download";
    }

    report.checkpoint = checkpoint;
    state_ = SyncState::Committed;
  } catch (const crypto::CryptoError& e) {
    throw fail(ErrorKind::Crypto, e.what());
  } catch (const codec::CodecError& e) {
    throw fail(ErrorKind::Protocol, e.what());
  } catch (const api::TransportError& e) {
    throw fail(ErrorKind::Transport, e.what());
  } catch (const api::ProtocolError& e) {
    throw fail(ErrorKind::Protocol, e.what());
  } catch (const store::StoreError& e) {
    throw fail(ErrorKind::Store, e.what());
  } catch (const SyncError&) {
    state_ = SyncState::Failed;
    throw;
  }

  BOOST_LOG_TRIVIAL(info) << "Sync client: Sync complete: uploaded " << report.uploaded
                          << ", downloaded " << report.downloaded
                          << ", skipped " << report.skipped
                          << " in " << report.pages << " pages";
  return report;
}

//==============================================
// PHASES
//==============================================

void SyncClient::negotiate(SyncReport& report) {
  report.remote_count = api_.count().count;
  report.local_count = store_.count();
  BOOST_LOG_TRIVIAL(debug) << "Sync client: Remote count " << report.remote_count
                           << ", local count " << report.local_count;
}

void SyncClient::upload(SyncCheckpoint& checkpoint, const SyncOptions& options, SyncReport& report) {
  while (true) {
    check_cancelled(SyncPhase::Upload);

    const auto records = store_.records_from_host(checkpoint.last_upload_timestamp, checkpoint.last_upload_id,
                                                  session_.hostname, options.page_size);
    if (records.empty()) {
      break;
    }

    std::vector<api::AddHistoryRequest> batch;
    batch.reserve(records.size());
    for (const auto& record : records) {
      batch.push_back(api::to_wire(crypto::Cipher::encrypt(session_.key, record)));
    }

    api_.add_history(batch);

    // records come back in (timestamp, id) order, so the last one is the new position
    checkpoint.last_upload_timestamp = records.back().timestamp;
    checkpoint.last_upload_id = records.back().id;
    save_checkpoint(checkpoint, SyncPhase::Upload);
    report.uploaded += records.size();
    BOOST_LOG_TRIVIAL(debug) << "Sync client: Uploaded batch of " << records.size() << " records";

    if (records.size() < options.page_size) {
      break;
    }
  }
}

void SyncClient::download(SyncCheckpoint& checkpoint, const SyncOptions& options, SyncReport& report,
                          SyncPhase& phase) {
  // The relay pins the ingestion bound on the first page; later pages reuse it
  history::Timestamp sync_ts = history::epoch();

  while (true) {
    phase = SyncPhase::Download;
    check_cancelled(SyncPhase::Download);

    const int64_t cursor = checkpoint.last_sync_seq;
    const api::SyncHistoryRequest request{sync_ts, history::epoch(), session_.hostname, options.page_size, cursor};
    const auto page = api_.sync_history(request);
    ++report.pages;

    if (page.history.size() > options.page_size) {
      throw api::ProtocolError("server returned " + std::to_string(page.history.size())
                               + " blobs for a page of " + std::to_string(options.page_size));
    }
    if (sync_ts == history::epoch()) {
      sync_ts = page.sync_ts;
    }

    int64_t page_seq = cursor;
    history::Timestamp page_max = checkpoint.last_sync_timestamp;
    for (const auto& blob : page.history) {
      if (blob.seq <= page_seq) {
        throw api::ProtocolError("blob " + blob.id + " has sequence " + std::to_string(blob.seq)
                                 + ", expected more than " + std::to_string(page_seq));
      }
      page_seq = blob.seq;
      page_max = std::max(page_max, blob.timestamp);
    }

    const auto records = decrypt_page(page);

    phase = SyncPhase::Commit;
    for (const auto& record : records) {
      if (store_.insert_if_absent(record)) {
        ++report.downloaded;
      } else {
        ++report.skipped;
      }
    }

    checkpoint.last_sync_seq = page_seq;
    checkpoint.last_sync_timestamp = page_max;
    save_checkpoint(checkpoint, SyncPhase::Commit);
    BOOST_LOG_TRIVIAL(debug) << "Sync client: Committed page of " << records.size()
                             << " records up to sequence " << page_seq;

    if (page.history.size() < options.page_size) {
      break;
    }
  }
  phase = SyncPhase::Download;
}

std::vector<history::HistoryRecord> SyncClient::decrypt_page(const api::SyncHistoryResponse& page) {
  std::vector<history::HistoryRecord> records;
  records.reserve(page.history.size());
  for (const auto& item : page.history) {
    const auto blob = api::from_wire(item);
    try {
      records.push_back(crypto::Cipher::decrypt(session_.key, blob));
    } catch (const crypto::AuthenticationFailure& e) {
      BOOST_LOG_TRIVIAL(error) << "Sync client: Failed to decrypt blob " << e.id()
                               << " (" << history::to_rfc3339(e.timestamp()) << ", host " << e.hostname() << ")";
      throw;
    }
  }
  return records;
}

void SyncClient::check_cancelled(SyncPhase phase) const {
  if (cancelled_) {
    BOOST_LOG_TRIVIAL(info) << "Sync client: Cancelled before next " << to_string(phase) << " batch";
    throw SyncError(phase, ErrorKind::Cancelled, "sync cancelled");
  }
}

void SyncClient::save_checkpoint(const SyncCheckpoint& checkpoint, SyncPhase phase) {
  BOOST_LOG_TRIVIAL(trace) << "Sync client: Saving checkpoint after " << to_string(phase) << " batch";
  checkpoint_file_.save(checkpoint);
}

} // namespace histvault::sync
