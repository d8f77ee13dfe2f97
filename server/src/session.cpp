#include "session.hpp"

#include "lanxfer/hashing.hpp"

#include <algorithm>
#include <fstream>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace lanxfer {

ReceiverOptions receiver_options_from(const Config& config) {
  ReceiverOptions o;
  o.root = config.receive_root;
  o.chunk_size = config.chunk_size;
  o.io_timeout = config.io_timeout;
  o.progress_interval = config.progress_interval;
  o.max_metadata_bytes = config.max_metadata_bytes;
  return o;
}

void ValidationLog::record(const std::vector<ValidationFailure>& failures) {
  std::lock_guard<std::mutex> lock(mutex_);
  failures_.insert(failures_.end(), failures.begin(), failures.end());
}

std::vector<ValidationFailure> ValidationLog::take() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ValidationFailure> out;
  out.swap(failures_);
  return out;
}

std::vector<ValidationFailure> ValidationLog::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failures_;
}

std::size_t ValidationLog::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failures_.size();
}

Session::Session(asio::ip::tcp::socket socket, ReceiverOptions options, ProgressCallback on_progress)
  : conn_(std::move(socket)),
    options_(std::move(options)),
    on_progress_(std::move(on_progress)),
    buffer_(std::max<std::size_t>(options_.chunk_size, 1)) {
  conn_.set_timeout(options_.io_timeout);
  report_.peer = conn_.remote_endpoint();
}

SessionReport Session::run() {
  const std::string& peer = report_.peer;
  spdlog::info("{} connected", peer);

  try {
    const Manifest manifest = conn_.read_manifest(options_.max_metadata_bytes);
    report_.name = manifest.name;
    report_.kind = manifest.kind;
    spdlog::info("{} -> {} '{}' accepted, {} item(s), {} bytes", peer, to_string(manifest.kind),
                 manifest.name, manifest.items.size(), manifest.total_bytes);
    conn_.send_token(ControlToken::Ack1);

    if (manifest.kind == TransferKind::SingleFile) {
      receive_single_file(manifest);
    } else {
      receive_tree(manifest);
    }

    conn_.send_token(ControlToken::Done);
    report_.completed = true;
    spdlog::info("{} <- DONE, '{}' complete ({} bytes)", peer, manifest.name, report_.bytes_received);
  } catch (const TransferError& e) {
    report_.error = e.code();
    report_.message = e.what();
    spdlog::error("{} transfer aborted ({}): {}", peer, to_string(e.code()), e.what());
  } catch (const std::exception& e) {
    report_.error = ErrorCode::IoError;
    report_.message = e.what();
    spdlog::error("{} transfer aborted: {}", peer, e.what());
  }

  conn_.close();
  spdlog::info("{} disconnected", peer);
  return report_;
}

void Session::receive_single_file(const Manifest& manifest) {
  const ItemDescriptor& item = manifest.items.front();
  const fs::path dest = options_.root / fs::path(item.relative_path);

  ProgressTracker progress("Receiving " + manifest.name, manifest.total_bytes,
                           options_.progress_interval, on_progress_);
  receive_item(item, dest, progress);
  verify_item(item, dest, manifest.hash_algorithm);
}

void Session::receive_tree(const Manifest& manifest) {
  const fs::path base = options_.root / fs::path(manifest.name);

  ProgressTracker progress("Receiving " + manifest.name, manifest.total_bytes,
                           options_.progress_interval, on_progress_);
  for (std::size_t i = 0; i < manifest.items.size(); ++i) {
    const ItemDescriptor& item = manifest.items[i];
    const fs::path dest = base / fs::path(item.relative_path);
    spdlog::debug("{} [{}/{}] {}", report_.peer, i + 1, manifest.items.size(), item.relative_path);

    receive_item(item, dest, progress);
    if (item.content_hash) {
      verify_item(item, dest, manifest.hash_algorithm);
    }
    if (i + 1 < manifest.items.size()) {
      conn_.send_token(ControlToken::Ack2);
    }
  }
}

void Session::receive_item(const ItemDescriptor& item, const fs::path& dest, ProgressTracker& progress) {
  std::error_code ec;
  fs::create_directories(dest.parent_path(), ec);
  if (ec) {
    throw TransferError(ErrorCode::IoError,
                        "Cannot create directory " + dest.parent_path().string() + ": " + ec.message());
  }

  std::ofstream out(dest, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw TransferError(ErrorCode::IoError, "Cannot create file " + dest.string());
  }

  try {
    std::uint64_t received = 0;
    while (received < item.size) {
      const auto want = static_cast<std::size_t>(
          std::min<std::uint64_t>(buffer_.size(), item.size - received));
      conn_.read_exact(buffer_.data(), want);
      out.write(buffer_.data(), static_cast<std::streamsize>(want));
      if (!out) {
        throw TransferError(ErrorCode::IoError, "Write failed for " + dest.string());
      }
      received += want;
      report_.bytes_received += want;
      progress.update(report_.bytes_received);
    }
    out.close();
    if (out.fail()) {
      throw TransferError(ErrorCode::IoError, "Cannot finish writing " + dest.string());
    }
    progress.update(report_.bytes_received);
  } catch (const std::exception&) {
    out.close();
    std::error_code rm;
    fs::remove(dest, rm);
    spdlog::warn("{} removed partial file {}", report_.peer, dest.string());
    throw;
  }

  ++report_.items_received;
  spdlog::debug("{} wrote {} ({} bytes)", report_.peer, dest.string(), item.size);
}

void Session::verify_item(const ItemDescriptor& item, const fs::path& dest, HashAlgorithm algorithm) {
  if (!item.content_hash) return;

  const std::string actual = hash_file(dest, algorithm);
  if (digests_equal(actual, *item.content_hash)) {
    spdlog::info("{} verified {} ({})", report_.peer, dest.string(), to_string(algorithm));
    return;
  }

  report_.validation_failures.push_back({dest.string(), *item.content_hash, actual});
  spdlog::warn("{} {} for {}: expected {}, got {}", report_.peer,
               to_string(ErrorCode::IntegrityMismatch), dest.string(),
               item.content_hash->substr(0, 16), actual.substr(0, 16));
}

} // namespace lanxfer
