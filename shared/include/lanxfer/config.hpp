#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "lanxfer/hashing.hpp"
#include "lanxfer/progress.hpp"
#include "lanxfer/protocol.hpp"

namespace lanxfer {

inline constexpr std::uint16_t kDefaultPort = 8888;
inline constexpr std::size_t kDefaultChunkSize = 32 * 1024;
inline constexpr std::size_t kMaxChunkSize = 16 * 1024 * 1024;
inline constexpr const char* kDefaultReceiveRoot = "received_files";

struct Config {
    std::uint16_t port = kDefaultPort;
    std::string bind_address;                   // empty: all interfaces
    std::string target;                         // sender only
    std::string send_path;                      // sender only
    std::filesystem::path receive_root = kDefaultReceiveRoot;
    std::size_t chunk_size = kDefaultChunkSize;
    std::chrono::milliseconds io_timeout{60000};
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds accept_timeout{1000};
    std::chrono::milliseconds progress_interval = kDefaultProgressInterval;
    std::uint32_t max_metadata_bytes = kMaxMetadataBytes;
    HashAlgorithm hash_algorithm = HashAlgorithm::Sha256;
    bool hash_tree_items = false;
    std::string log_level = "info";

    bool list_interfaces = false;
    bool show_help = false;
    bool show_version = false;
};

// --key value | --key=value, applied left to right. Throws std::invalid_argument.
Config parse_args(int argc, char* argv[]);

// Applies one long option (without the leading "--").
void apply_option(Config& config, const std::string& key, const std::string& value);

// JSON object, keys: port, bind, target, root, chunk_size, timeout_ms,
// connect_timeout_ms, accept_timeout_ms, progress_interval_ms, hash,
// hash_items, log_level.
void load_config_file(Config& config, const std::filesystem::path& path);

std::string usage(const std::string& program);

} // namespace lanxfer
