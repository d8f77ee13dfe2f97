#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "lanxfer/config.hpp"
#include "lanxfer/directory.hpp"
#include "lanxfer/progress.hpp"
#include "lanxfer/protocol.hpp"

namespace lanxfer {

struct SendOptions {
  std::string host;
  std::uint16_t port = kDefaultPort;
  std::string bind_address;
  std::size_t chunk_size = kDefaultChunkSize;
  std::chrono::milliseconds connect_timeout{10000};
  std::chrono::milliseconds io_timeout{60000};
  std::chrono::milliseconds progress_interval = kDefaultProgressInterval;
  HashAlgorithm hash_algorithm = HashAlgorithm::Sha256;
  bool hash_tree_items = false;
};

SendOptions send_options_from(const Config& config);

struct SendResult {
  TransferKind kind = TransferKind::SingleFile;
  std::string name;
  std::size_t items = 0;
  std::uint64_t bytes_sent = 0;
};

// One item manifest with the file's digest.
Manifest build_file_manifest(const std::filesystem::path& path, HashAlgorithm algorithm);
// Items in listing order; digests only when hash_items is set.
Manifest build_tree_manifest(const std::string& name, const DirectoryListing& listing,
                             HashAlgorithm algorithm, bool hash_items);

// Both throw TransferError: NotFound / Empty before connecting, Timeout,
// ConnectionRefused, IoError, HandshakeFailed once connected. No retries.
SendResult send_single_file(const std::filesystem::path& path, const SendOptions& options,
                            ProgressCallback on_progress = {});
SendResult send_directory_tree(const std::filesystem::path& root, const SendOptions& options,
                               ProgressCallback on_progress = {});

// Dispatches on the kind of path.
SendResult send_path(const std::filesystem::path& path, const SendOptions& options,
                     ProgressCallback on_progress = {});

} // namespace lanxfer
