#pragma once
#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "lanxfer/protocol.hpp"

namespace lanxfer {

// One TCP stream carrying one transfer. The socket runs non-blocking and every
// wait for readiness is bounded by the idle timeout, so a stalled peer surfaces
// as TransferError(Timeout) instead of hanging the caller.
class Connection {
public:
  Connection();
  explicit Connection(asio::ip::tcp::socket socket);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // bind_address may be empty (any local interface).
  void connect(const std::string& host, std::uint16_t port,
               const std::string& bind_address, std::chrono::milliseconds timeout);

  // Zero disables the bound.
  void set_timeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }

  void write_all(const void* data, std::size_t len);
  void read_exact(void* data, std::size_t len);

  void send_token(ControlToken token);
  ControlToken read_token();
  // Missing or mismatched acknowledgment -> TransferError(HandshakeFailed).
  void expect_token(ControlToken expected);

  void send_manifest(const Manifest& manifest);
  Manifest read_manifest(std::uint32_t max_len = kMaxMetadataBytes);

  const std::string& remote_endpoint() const { return peer_; }
  bool is_open() const { return sock_.is_open(); }
  void close();

private:
  void wait_ready(short events, const char* what);

  std::unique_ptr<asio::io_context> io_;
  asio::ip::tcp::socket sock_;
  std::chrono::milliseconds timeout_{0};
  std::string peer_;
};

} // namespace lanxfer
