#ifndef HISTVAULT_API_SYNC_API_HPP
#define HISTVAULT_API_SYNC_API_HPP

#include <vector>
#include "api/api_types.hpp"

namespace histvault::api {

// Authenticated operations the sync client needs from the relay.
// Implementations throw TransportError or ProtocolError.
class SyncApi {
public:
  virtual ~SyncApi() = default;

  // Total number of blobs the server holds for the session's user
  virtual CountResponse count() = 0;
  // Uploads one batch; ids already stored are ignored by the server
  virtual void add_history(const std::vector<AddHistoryRequest>& batch) = 0;
  // One page of blobs from other hosts, oldest first
  virtual SyncHistoryResponse sync_history(const SyncHistoryRequest& request) = 0;
};

} // namespace histvault::api

#endif // HISTVAULT_API_SYNC_API_HPP
