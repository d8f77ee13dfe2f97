#include "lanxfer/error.hpp"

#include <asio/error.hpp>

namespace lanxfer {

const char* to_string(ErrorCode code) {
    switch (code) {
    case ErrorCode::NotFound:          return "not found";
    case ErrorCode::Empty:             return "empty";
    case ErrorCode::BindError:         return "bind error";
    case ErrorCode::OversizedMetadata: return "oversized metadata";
    case ErrorCode::MalformedMetadata: return "malformed metadata";
    case ErrorCode::HandshakeFailed:   return "handshake failed";
    case ErrorCode::ConnectionLost:    return "connection lost";
    case ErrorCode::IntegrityMismatch: return "integrity mismatch";
    case ErrorCode::Timeout:           return "timeout";
    case ErrorCode::ConnectionRefused: return "connection refused";
    case ErrorCode::IoError:           return "i/o error";
    }
    return "unknown";
}

bool is_protocol_error(ErrorCode code) {
    return code == ErrorCode::OversizedMetadata || code == ErrorCode::MalformedMetadata ||
           code == ErrorCode::HandshakeFailed || code == ErrorCode::ConnectionLost;
}

bool is_transport_error(ErrorCode code) {
    return code == ErrorCode::Timeout || code == ErrorCode::ConnectionRefused ||
           code == ErrorCode::IoError;
}

TransferError::TransferError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

ErrorCode classify(const std::error_code& ec) {
    if (ec == asio::error::eof || ec == asio::error::connection_reset ||
        ec == asio::error::broken_pipe || ec == asio::error::connection_aborted ||
        ec == asio::error::shut_down) {
        return ErrorCode::ConnectionLost;
    }
    if (ec == asio::error::timed_out) {
        return ErrorCode::Timeout;
    }
    if (ec == asio::error::connection_refused) {
        return ErrorCode::ConnectionRefused;
    }
    return ErrorCode::IoError;
}

void throw_socket_error(const std::error_code& ec, const std::string& what) {
    throw TransferError(classify(ec), what + ": " + ec.message());
}

} // namespace lanxfer
