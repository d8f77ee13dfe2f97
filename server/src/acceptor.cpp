#include "acceptor.hpp"

#include <cerrno>

#include <poll.h>
#include <sys/socket.h>

#include <spdlog/spdlog.h>

using asio::ip::tcp;

namespace lanxfer {

const char* to_string(AcceptorState state) {
  switch (state) {
  case AcceptorState::Idle:      return "idle";
  case AcceptorState::Listening: return "listening";
  case AcceptorState::Stopping:  return "stopping";
  }
  return "unknown";
}

Acceptor::Acceptor(ReceiverOptions options, ReportSink on_report, ProgressCallback on_progress,
                   std::chrono::milliseconds accept_timeout)
  : options_(std::move(options)),
    on_report_(std::move(on_report)),
    on_progress_(std::move(on_progress)),
    accept_timeout_(accept_timeout),
    acceptor_(io_) {}

Acceptor::~Acceptor() {
  stop();
  drain();
}

void Acceptor::start(const std::string& bind_address, std::uint16_t port) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != AcceptorState::Idle) {
    throw TransferError(ErrorCode::BindError, "acceptor already started");
  }

  asio::error_code ec;
  asio::ip::address addr = asio::ip::address_v4::any();
  if (!bind_address.empty()) {
    addr = asio::ip::make_address(bind_address, ec);
    if (ec) {
      throw TransferError(ErrorCode::BindError, "Invalid bind address '" + bind_address + "'");
    }
  }
  const tcp::endpoint ep(addr, port);

  auto fail = [&](const char* what) {
    asio::error_code ignore;
    acceptor_.close(ignore);
    throw TransferError(ErrorCode::BindError,
                        std::string(what) + " " + addr.to_string() + ":" + std::to_string(port) +
                        ": " + ec.message());
  };

  acceptor_.open(ep.protocol(), ec);
  if (ec) fail("Cannot open listening socket on");
  acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
  if (ec) fail("Cannot set SO_REUSEADDR on");
  acceptor_.bind(ep, ec);
  if (ec) fail("Cannot bind");
  acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if (ec) fail("Cannot listen on");
  acceptor_.non_blocking(true, ec);
  if (ec) fail("Cannot configure");

  port_ = acceptor_.local_endpoint(ec).port();
  running_.store(true);
  state_ = AcceptorState::Listening;
  spdlog::info("listening on {}:{}, root: {}", addr.to_string(), port_, options_.root.string());
}

void Acceptor::run() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != AcceptorState::Listening || !running_.load()) {
      state_ = AcceptorState::Idle;
      return;
    }
    loop_active_ = true;
  }

  while (running_.load()) {
    reap(false);

    tcp::socket sock(io_);
    const PollResult r = poll_accept(sock);
    if (r == PollResult::Timeout) continue;
    if (r == PollResult::Stopped) break;
    if (r == PollResult::Fault) {
      std::lock_guard<std::mutex> lock(mutex_);
      running_.store(false);
      teardown_locked();
      break;
    }
    dispatch(std::move(sock));
  }

  reap(false);
  std::lock_guard<std::mutex> lock(mutex_);
  teardown_locked();
  loop_active_ = false;
  state_ = AcceptorState::Idle;
  spdlog::info("acceptor stopped, {} transfer(s) still running", in_flight());
}

PollResult Acceptor::poll_accept(tcp::socket& out) {
  int fd = -1;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.load() || !acceptor_.is_open()) return PollResult::Stopped;
    fd = acceptor_.native_handle();
  }

  pollfd p{};
  p.fd = fd;
  p.events = POLLIN;
  const int rc = ::poll(&p, 1, static_cast<int>(accept_timeout_.count()));
  const int poll_errno = errno;

  std::lock_guard<std::mutex> lock(mutex_);
  // A closed socket wakes the poll too; the flag tells it apart from a fault.
  if (!running_.load() || !acceptor_.is_open()) return PollResult::Stopped;
  if (rc == 0) return PollResult::Timeout;
  if (rc < 0) {
    if (poll_errno == EINTR) return PollResult::Timeout;
    spdlog::error("accept poll failed: {}", std::error_code(poll_errno, std::system_category()).message());
    return PollResult::Fault;
  }

  asio::error_code ec;
  acceptor_.accept(out, ec);
  if (!ec) return PollResult::Accepted;
  if (ec == asio::error::would_block || ec == asio::error::try_again ||
      ec == asio::error::connection_aborted || ec == asio::error::interrupted) {
    return PollResult::Timeout;
  }
  if (!running_.load()) return PollResult::Stopped;
  spdlog::error("accept error: {}", ec.message());
  return PollResult::Fault;
}

void Acceptor::dispatch(tcp::socket socket) {
  asio::error_code ec;
  auto ep = socket.remote_endpoint(ec);
  if (!ec) spdlog::info("connection from {}", ep.address().to_string());

  ReceiverOptions options = options_;
  ProgressCallback progress = on_progress_;
  auto task = [s = std::move(socket), options, progress]() mutable -> SessionReport {
    try {
      Session session(std::move(s), options, progress);
      return session.run();
    } catch (const std::exception& e) {
      SessionReport r;
      r.error = ErrorCode::IoError;
      r.message = e.what();
      spdlog::error("handler failed to start: {}", e.what());
      return r;
    }
  };

  std::lock_guard<std::mutex> lock(handlers_mutex_);
  handlers_.push_back(std::async(std::launch::async, std::move(task)));
}

void Acceptor::reap(bool wait) {
  std::vector<SessionReport> done;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    for (auto it = handlers_.begin(); it != handlers_.end(); ) {
      if (wait || it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        done.push_back(it->get());
        it = handlers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  if (on_report_) {
    for (const auto& r : done) on_report_(r);
  }
}

void Acceptor::stop() {
  running_.store(false);
  std::lock_guard<std::mutex> lock(mutex_);
  teardown_locked();
  if (state_ == AcceptorState::Listening) {
    state_ = loop_active_ ? AcceptorState::Stopping : AcceptorState::Idle;
  }
}

void Acceptor::drain() {
  reap(true);
}

void Acceptor::teardown_locked() {
  if (!acceptor_.is_open()) return;
  asio::error_code ignore;
  // shutdown wakes a concurrent poll() on Linux before the descriptor goes away
  ::shutdown(acceptor_.native_handle(), SHUT_RDWR);
  acceptor_.close(ignore);
}

AcceptorState Acceptor::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::uint16_t Acceptor::local_port() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return port_;
}

std::size_t Acceptor::in_flight() const {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  return handlers_.size();
}

} // namespace lanxfer
