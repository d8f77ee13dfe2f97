#pragma once
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <vector>

#include "session.hpp"

namespace lanxfer {

enum class AcceptorState { Idle, Listening, Stopping };

// Result of one bounded wait for an inbound connection.
enum class PollResult { Accepted, Timeout, Stopped, Fault };

const char* to_string(AcceptorState state);

// Listening socket plus the running flag shared with whoever calls stop().
// run() occupies the calling thread; every accepted connection gets its own
// Session on its own thread and its report comes back through the sink.
class Acceptor {
public:
  using ReportSink = std::function<void(const SessionReport&)>;

  Acceptor(ReceiverOptions options, ReportSink on_report = {}, ProgressCallback on_progress = {},
           std::chrono::milliseconds accept_timeout = std::chrono::milliseconds(1000));
  ~Acceptor();

  Acceptor(const Acceptor&) = delete;
  Acceptor& operator=(const Acceptor&) = delete;

  // Idle -> Listening. Throws TransferError(BindError); state stays Idle.
  void start(const std::string& bind_address, std::uint16_t port);

  // Accept loop, returns once stop() was observed or the socket faulted.
  void run();

  // Idempotent; safe before start() and after the loop has returned.
  void stop();

  // Blocks until every dispatched handler finished and was reported.
  void drain();

  AcceptorState state() const;
  bool running() const { return running_.load(); }
  std::uint16_t local_port() const;
  std::size_t in_flight() const;

private:
  PollResult poll_accept(asio::ip::tcp::socket& out);
  void dispatch(asio::ip::tcp::socket socket);
  void reap(bool wait);
  void teardown_locked();

  ReceiverOptions options_;
  ReportSink on_report_;
  ProgressCallback on_progress_;
  std::chrono::milliseconds accept_timeout_;

  asio::io_context io_;
  asio::ip::tcp::acceptor acceptor_;
  std::atomic<bool> running_{false};
  bool loop_active_ = false;
  AcceptorState state_ = AcceptorState::Idle;
  std::uint16_t port_ = 0;
  mutable std::mutex mutex_;            // acceptor_, state_, loop_active_, port_

  std::vector<std::future<SessionReport>> handlers_;
  mutable std::mutex handlers_mutex_;
};

} // namespace lanxfer
