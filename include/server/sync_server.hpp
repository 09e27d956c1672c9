#ifndef HISTVAULT_SERVER_SYNC_SERVER_HPP
#define HISTVAULT_SERVER_SYNC_SERVER_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include "server/api_service.hpp"

namespace histvault::server {

// HTTP listener for the relay API. Accepts and serves connections on a
// dedicated I/O thread.
class SyncServer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Port 0 binds an ephemeral port, see port()
  SyncServer(ApiService& service, const std::string& address, uint16_t port,
             std::chrono::seconds timeout = std::chrono::seconds(30));
  ~SyncServer();

  SyncServer(const SyncServer&) = delete;
  SyncServer& operator=(const SyncServer&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  void shutdown();


  // ---- GETTERS ----
  // Bound port once listening
  uint16_t port() const { return port_; }
  bool is_running() const { return is_running_; }

private:
  // ---- PARAMETERS ----
  ApiService& service_;

  // Network Parameters
  const std::string address_;
  std::atomic<uint16_t> port_;
  const std::chrono::seconds timeout_;

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Main listening loop that hands each connection to an HTTP session
  void start_accept();
};

} // namespace histvault::server

#endif // HISTVAULT_SERVER_SYNC_SERVER_HPP
