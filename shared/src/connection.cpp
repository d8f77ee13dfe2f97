#include "lanxfer/connection.hpp"
#include "lanxfer/error.hpp"

#include <cerrno>
#include <sstream>
#include <vector>

#include <poll.h>
#include <sys/socket.h>

using asio::ip::tcp;

namespace lanxfer {

namespace {

std::string endpoint_str(const tcp::socket& sock) {
  asio::error_code ec;
  auto ep = sock.remote_endpoint(ec);
  if (ec) {
    return "?";
  }
  std::ostringstream oss;
  oss << ep;
  return oss.str();
}

// false on timeout
bool poll_fd(int fd, short events, std::chrono::milliseconds timeout) {
  pollfd p{};
  p.fd = fd;
  p.events = events;
  const int ms = timeout.count() > 0 ? static_cast<int>(timeout.count()) : -1;
  while (true) {
    const int rc = ::poll(&p, 1, ms);
    if (rc < 0 && errno == EINTR) continue;
    if (rc < 0) {
      throw TransferError(ErrorCode::IoError,
                          "poll failed: " + std::error_code(errno, std::system_category()).message());
    }
    return rc > 0;
  }
}

bool would_block(const asio::error_code& ec) {
  return ec == asio::error::would_block || ec == asio::error::try_again;
}

} // namespace

Connection::Connection()
  : io_(std::make_unique<asio::io_context>()), sock_(*io_) {}

Connection::Connection(tcp::socket socket)
  : sock_(std::move(socket)) {
  peer_ = endpoint_str(sock_);
  asio::error_code ec;
  sock_.non_blocking(true, ec);
  if (ec) throw_socket_error(ec, "cannot configure socket for " + peer_);
}

Connection::~Connection() { close(); }

void Connection::connect(const std::string& host, std::uint16_t port,
                         const std::string& bind_address, std::chrono::milliseconds timeout) {
  asio::error_code ec;
  tcp::resolver r(sock_.get_executor());
  auto results = r.resolve(host, std::to_string(port), ec);
  if (ec) {
    throw TransferError(ErrorCode::IoError, "Cannot resolve " + host + ": " + ec.message());
  }

  asio::ip::address local;
  if (!bind_address.empty()) {
    local = asio::ip::make_address(bind_address, ec);
    if (ec) {
      throw TransferError(ErrorCode::IoError, "Invalid bind address '" + bind_address + "'");
    }
  }

  asio::error_code last = asio::error::host_not_found;
  for (const auto& entry : results) {
    const tcp::endpoint ep = entry.endpoint();
    asio::error_code ignore;
    sock_.close(ignore);

    sock_.open(ep.protocol(), ec);
    if (ec) { last = ec; continue; }

    if (!bind_address.empty()) {
      if (local.is_v4() != ep.address().is_v4()) {
        last = asio::error::address_family_not_supported;
        continue;
      }
      sock_.bind(tcp::endpoint(local, 0), ec);
      if (ec) {
        sock_.close(ignore);
        throw TransferError(ErrorCode::IoError, "Cannot bind to " + bind_address + ": " + ec.message());
      }
    }

    sock_.non_blocking(true, ec);
    if (ec) { last = ec; continue; }

    // asio's sync connect waits without a bound, go through the native handle
    if (::connect(sock_.native_handle(), ep.data(), static_cast<socklen_t>(ep.size())) != 0) {
      ec = asio::error_code(errno, asio::error::get_system_category());
      if (ec == asio::error::in_progress || would_block(ec)) {
        if (!poll_fd(sock_.native_handle(), POLLOUT, timeout)) {
          ec = asio::error::timed_out;
        } else {
          int so_error = 0;
          socklen_t len = sizeof(so_error);
          if (::getsockopt(sock_.native_handle(), SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
            so_error = errno;
          }
          ec = asio::error_code(so_error, asio::error::get_system_category());
        }
      }
    } else {
      ec.clear();
    }

    if (!ec) {
      sock_.set_option(tcp::no_delay(true), ignore);
      peer_ = endpoint_str(sock_);
      return;
    }
    last = ec;
  }

  asio::error_code ignore;
  sock_.close(ignore);
  throw_socket_error(last, "Cannot connect to " + host + ":" + std::to_string(port));
}

void Connection::wait_ready(short events, const char* what) {
  if (!poll_fd(sock_.native_handle(), events, timeout_)) {
    throw TransferError(ErrorCode::Timeout,
                        std::string("timed out waiting to ") + what + " " + peer_);
  }
}

void Connection::write_all(const void* data, std::size_t len) {
  const auto* p = static_cast<const char*>(data);
  std::size_t sent = 0;
  while (sent < len) {
    asio::error_code ec;
    const std::size_t n = sock_.write_some(asio::buffer(p + sent, len - sent), ec);
    if (would_block(ec)) {
      wait_ready(POLLOUT, "write to");
      continue;
    }
    if (ec) throw_socket_error(ec, "write to " + peer_ + " failed");
    sent += n;
  }
}

void Connection::read_exact(void* data, std::size_t len) {
  auto* p = static_cast<char*>(data);
  std::size_t got = 0;
  while (got < len) {
    asio::error_code ec;
    const std::size_t n = sock_.read_some(asio::buffer(p + got, len - got), ec);
    if (would_block(ec)) {
      wait_ready(POLLIN, "read from");
      continue;
    }
    if (ec) throw_socket_error(ec, "read from " + peer_ + " failed");
    got += n;
  }
}

void Connection::send_token(ControlToken token) {
  const TokenBytes b = token_bytes(token);
  write_all(b.data(), b.size());
}

ControlToken Connection::read_token() {
  TokenBytes b{};
  read_exact(b.data(), b.size());
  auto t = parse_token(b);
  if (!t) {
    throw TransferError(ErrorCode::HandshakeFailed,
                        "unexpected control token '" + std::string(b.data(), b.size()) + "' from " + peer_);
  }
  return *t;
}

void Connection::expect_token(ControlToken expected) {
  ControlToken got = ControlToken::Ack1;
  try {
    got = read_token();
  } catch (const TransferError& e) {
    if (e.code() != ErrorCode::ConnectionLost) throw;
    throw TransferError(ErrorCode::HandshakeFailed,
                        std::string("connection closed while waiting for ") + to_string(expected));
  }
  if (got != expected) {
    throw TransferError(ErrorCode::HandshakeFailed,
                        std::string("expected ") + to_string(expected) + ", got " + to_string(got));
  }
}

void Connection::send_manifest(const Manifest& manifest) {
  const auto bytes = encode_manifest(manifest);
  write_all(bytes.data(), bytes.size());
}

Manifest Connection::read_manifest(std::uint32_t max_len) {
  unsigned char hdr[4];
  read_exact(hdr, sizeof(hdr));
  const std::uint32_t len = read_frame_length(hdr, max_len);
  std::string payload(len, '\0');
  read_exact(payload.data(), payload.size());
  return decode_manifest_payload(payload);
}

void Connection::close() {
  if (!sock_.is_open()) return;
  asio::error_code ignore;
  sock_.shutdown(tcp::socket::shutdown_both, ignore);
  sock_.close(ignore);
}

} // namespace lanxfer
