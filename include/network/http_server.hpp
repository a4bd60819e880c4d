#pragma once

#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include "http/request_handler.hpp"

namespace golink {
namespace network {

// Accepts and reads connections asynchronously on a dedicated IO thread and
// runs the request handler on a bounded worker pool: one request, one
// response, then close. Idle connections only cost a pending read, never a
// worker, and are dropped after read_timeout.
class HttpServer {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  HttpServer(const std::string& address, uint16_t port, http::RequestHandler& handler,
             std::size_t worker_count,
             std::chrono::seconds read_timeout = std::chrono::seconds(30));
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Binds and starts accepting; false if already running or the bind fails
  bool start_listener();
  // Stops accepting, drops connections still waiting for a request, then
  // waits for requests already being handled to be answered
  void shutdown();


  // ---- GETTERS ----
  bool is_running() const { return is_running_; }
  // Bound port, useful when constructed with port 0
  uint16_t port() const;

private:
  class Session;

  // ---- PARAMETERS ----
  // Network Parameters
  const std::string address_;
  const uint16_t port_;
  const std::size_t worker_count_;
  const std::chrono::seconds read_timeout_;

  // Server state
  std::atomic<bool> is_running_;
  std::atomic<uint16_t> bound_port_;
  std::mutex lifecycle_mutex_;
  std::unique_ptr<std::thread> io_thread_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::unique_ptr<boost::asio::thread_pool> workers_;

  // Live connections, so shutdown can drop the idle ones
  std::mutex sessions_mutex_;
  std::unordered_map<std::uint64_t, std::weak_ptr<Session>> sessions_;
  std::uint64_t next_session_id_;

  // System components
  http::RequestHandler& handler_;


  // ---- CONNECTION HANDLING ----
  // Main listening loop; each accepted socket becomes a Session
  void start_accept();
  // Runs on a worker; never throws
  http::Response handle_request(const http::Request& request);
  // Runs on the IO thread
  void cancel_idle_sessions();
  void unregister_session(std::uint64_t id);
};

} // namespace network
} // namespace golink
