#pragma once
#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "lanxfer/config.hpp"
#include "lanxfer/connection.hpp"
#include "lanxfer/error.hpp"
#include "lanxfer/progress.hpp"
#include "lanxfer/protocol.hpp"

namespace lanxfer {

struct ReceiverOptions {
  std::filesystem::path root = kDefaultReceiveRoot;
  std::size_t chunk_size = kDefaultChunkSize;
  std::chrono::milliseconds io_timeout{60000};
  std::chrono::milliseconds progress_interval = kDefaultProgressInterval;
  std::uint32_t max_metadata_bytes = kMaxMetadataBytes;
};

ReceiverOptions receiver_options_from(const Config& config);

struct ValidationFailure {
  std::string file;
  std::string expected;
  std::string actual;
};

// Outcome of one connection, handed back to whoever dispatched the handler.
struct SessionReport {
  std::string peer;
  std::string name;
  TransferKind kind = TransferKind::SingleFile;
  bool completed = false;
  std::optional<ErrorCode> error;
  std::string message;
  std::uint64_t bytes_received = 0;
  std::size_t items_received = 0;
  std::vector<ValidationFailure> validation_failures;
};

// Integrity failures accumulated across sessions until the operator reads them.
class ValidationLog {
public:
  void record(const std::vector<ValidationFailure>& failures);
  std::vector<ValidationFailure> take();
  std::vector<ValidationFailure> snapshot() const;
  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::vector<ValidationFailure> failures_;
};

// Receives exactly one manifest's worth of items from an accepted connection.
class Session {
public:
  Session(asio::ip::tcp::socket socket, ReceiverOptions options, ProgressCallback on_progress = {});

  // Never throws; failures end up in the report.
  SessionReport run();

private:
  void receive_single_file(const Manifest& manifest);
  void receive_tree(const Manifest& manifest);
  void receive_item(const ItemDescriptor& item, const std::filesystem::path& dest,
                    ProgressTracker& progress);
  void verify_item(const ItemDescriptor& item, const std::filesystem::path& dest,
                   HashAlgorithm algorithm);

  Connection conn_;
  ReceiverOptions options_;
  ProgressCallback on_progress_;
  std::vector<char> buffer_;
  SessionReport report_;
};

} // namespace lanxfer
