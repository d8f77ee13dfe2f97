#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace lanxfer {

enum class ErrorCode {
    NotFound,
    Empty,
    BindError,
    OversizedMetadata,
    MalformedMetadata,
    HandshakeFailed,
    ConnectionLost,
    IntegrityMismatch,
    Timeout,
    ConnectionRefused,
    IoError
};

const char* to_string(ErrorCode code);

// OversizedMetadata, MalformedMetadata, HandshakeFailed, ConnectionLost
bool is_protocol_error(ErrorCode code);
// Timeout, ConnectionRefused, IoError
bool is_transport_error(ErrorCode code);

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// Maps a socket level error onto the transfer taxonomy.
ErrorCode classify(const std::error_code& ec);

[[noreturn]] void throw_socket_error(const std::error_code& ec, const std::string& what);

} // namespace lanxfer
