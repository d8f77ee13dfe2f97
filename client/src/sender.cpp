#include "sender.hpp"

#include "lanxfer/connection.hpp"
#include "lanxfer/error.hpp"
#include "lanxfer/hashing.hpp"

#include <algorithm>
#include <fstream>
#include <vector>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace lanxfer {

namespace {

std::string display_name(const fs::path& p) {
  fs::path norm = fs::absolute(p).lexically_normal();
  if (norm.filename().empty()) norm = norm.parent_path();
  return norm.filename().string();
}

void open_connection(Connection& conn, const SendOptions& options) {
  spdlog::info("connecting to {}:{}{}", options.host, options.port,
               options.bind_address.empty() ? "" : " from " + options.bind_address);
  conn.connect(options.host, options.port, options.bind_address, options.connect_timeout);
  conn.set_timeout(options.io_timeout);
}

// Streams exactly `size` bytes of the file, one chunk per write.
void stream_file(Connection& conn, const fs::path& path, std::uint64_t size,
                 std::vector<char>& buffer, std::uint64_t& sent_total, ProgressTracker& progress) {
  std::ifstream f(path, std::ios::binary);
  if (!f.is_open()) {
    throw TransferError(ErrorCode::IoError, "Cannot open file: " + path.string());
  }

  std::uint64_t sent = 0;
  while (sent < size) {
    const auto want = static_cast<std::size_t>(
        std::min<std::uint64_t>(buffer.size(), size - sent));
    f.read(buffer.data(), static_cast<std::streamsize>(want));
    if (static_cast<std::size_t>(f.gcount()) != want) {
      throw TransferError(ErrorCode::IoError, "File changed while sending: " + path.string());
    }
    conn.write_all(buffer.data(), want);
    sent += want;
    sent_total += want;
    progress.update(sent_total);
  }
}

} // namespace

SendOptions send_options_from(const Config& config) {
  SendOptions o;
  o.host = config.target;
  o.port = config.port;
  o.bind_address = config.bind_address;
  o.chunk_size = config.chunk_size;
  o.connect_timeout = config.connect_timeout;
  o.io_timeout = config.io_timeout;
  o.progress_interval = config.progress_interval;
  o.hash_algorithm = config.hash_algorithm;
  o.hash_tree_items = config.hash_tree_items;
  return o;
}

Manifest build_file_manifest(const fs::path& path, HashAlgorithm algorithm) {
  std::error_code ec;
  const auto size = fs::file_size(path, ec);
  if (ec) {
    throw TransferError(ErrorCode::NotFound, "File not found: " + path.string());
  }

  Manifest m;
  m.kind = TransferKind::SingleFile;
  m.name = path.filename().string();
  m.hash_algorithm = algorithm;
  m.created_at = now_unix_ms();

  ItemDescriptor item;
  item.relative_path = m.name;
  item.size = static_cast<std::uint64_t>(size);
  item.content_hash = hash_file(path, algorithm);
  m.items.push_back(std::move(item));
  m.total_bytes = m.items.front().size;
  return m;
}

Manifest build_tree_manifest(const std::string& name, const DirectoryListing& listing,
                             HashAlgorithm algorithm, bool hash_items) {
  Manifest m;
  m.kind = TransferKind::DirectoryTree;
  m.name = name;
  m.hash_algorithm = algorithm;
  m.created_at = now_unix_ms();
  m.total_bytes = listing.total_bytes;
  for (const auto& e : listing.entries) {
    ItemDescriptor item;
    item.relative_path = e.relative_path;
    item.size = e.size;
    if (hash_items) item.content_hash = hash_file(e.absolute_path, algorithm);
    m.items.push_back(std::move(item));
  }
  return m;
}

SendResult send_single_file(const fs::path& path, const SendOptions& options,
                            ProgressCallback on_progress) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw TransferError(ErrorCode::NotFound, "File not found: " + path.string());
  }

  Connection conn;
  open_connection(conn, options);

  spdlog::debug("hashing {} ({})", path.string(), to_string(options.hash_algorithm));
  const Manifest manifest = build_file_manifest(path, options.hash_algorithm);
  const ItemDescriptor& item = manifest.items.front();

  conn.send_manifest(manifest);
  spdlog::info("{} -> file '{}', {} bytes", conn.remote_endpoint(), manifest.name, item.size);
  conn.expect_token(ControlToken::Ack1);
  spdlog::debug("{} <- ACK1", conn.remote_endpoint());

  ProgressTracker progress("Sending " + manifest.name, manifest.total_bytes,
                           options.progress_interval, std::move(on_progress));
  std::vector<char> buffer(std::max<std::size_t>(options.chunk_size, 1));
  std::uint64_t sent_total = 0;
  stream_file(conn, path, item.size, buffer, sent_total, progress);
  progress.update(sent_total);

  conn.expect_token(ControlToken::Done);
  spdlog::info("{} <- DONE for '{}'", conn.remote_endpoint(), manifest.name);
  conn.close();

  return {manifest.kind, manifest.name, 1, sent_total};
}

SendResult send_directory_tree(const fs::path& root, const SendOptions& options,
                               ProgressCallback on_progress) {
  const DirectoryListing listing = enumerate_directory(root);
  if (listing.entries.empty()) {
    throw TransferError(ErrorCode::Empty, "Directory has no files: " + root.string());
  }

  Connection conn;
  open_connection(conn, options);

  const Manifest manifest = build_tree_manifest(display_name(root), listing,
                                                options.hash_algorithm, options.hash_tree_items);
  conn.send_manifest(manifest);
  spdlog::info("{} -> directory '{}', {} file(s), {} bytes", conn.remote_endpoint(),
               manifest.name, manifest.items.size(), manifest.total_bytes);
  conn.expect_token(ControlToken::Ack1);
  spdlog::debug("{} <- ACK1", conn.remote_endpoint());

  ProgressTracker progress("Sending " + manifest.name, manifest.total_bytes,
                           options.progress_interval, std::move(on_progress));
  std::vector<char> buffer(std::max<std::size_t>(options.chunk_size, 1));
  std::uint64_t sent_total = 0;

  for (std::size_t i = 0; i < listing.entries.size(); ++i) {
    const DirEntry& e = listing.entries[i];
    spdlog::debug("[{}/{}] {}", i + 1, listing.entries.size(), e.relative_path);
    stream_file(conn, e.absolute_path, e.size, buffer, sent_total, progress);
    if (i + 1 < listing.entries.size()) {
      conn.expect_token(ControlToken::Ack2);
      spdlog::debug("{} <- ACK2 for {}", conn.remote_endpoint(), e.relative_path);
    }
  }
  progress.update(sent_total);

  conn.expect_token(ControlToken::Done);
  spdlog::info("{} <- DONE for '{}'", conn.remote_endpoint(), manifest.name);
  conn.close();

  return {manifest.kind, manifest.name, manifest.items.size(), sent_total};
}

SendResult send_path(const fs::path& path, const SendOptions& options, ProgressCallback on_progress) {
  std::error_code ec;
  if (fs::is_directory(path, ec)) {
    return send_directory_tree(path, options, std::move(on_progress));
  }
  return send_single_file(path, options, std::move(on_progress));
}

} // namespace lanxfer
