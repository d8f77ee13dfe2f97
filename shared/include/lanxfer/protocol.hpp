#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

#include "lanxfer/hashing.hpp"

namespace lanxfer {

// Hard ceiling on the announced metadata length.
inline constexpr std::uint32_t kMaxMetadataBytes = 10u * 1024u * 1024u;

enum class TransferKind { SingleFile, DirectoryTree };

const char* to_string(TransferKind kind);   // "file" / "directory"

struct ItemDescriptor {
    std::string relative_path;
    std::uint64_t size = 0;
    std::optional<std::string> content_hash;

    bool operator==(const ItemDescriptor& other) const;
    bool operator!=(const ItemDescriptor& other) const { return !(*this == other); }
};

struct Manifest {
    TransferKind kind = TransferKind::SingleFile;
    std::string name;
    std::vector<ItemDescriptor> items;
    std::uint64_t total_bytes = 0;
    std::int64_t created_at = 0;            // unix ms, informational
    HashAlgorithm hash_algorithm = HashAlgorithm::Sha256;

    bool operator==(const Manifest& other) const;
    bool operator!=(const Manifest& other) const { return !(*this == other); }
};

// Handshake signals, always 4 ASCII bytes on the wire.
enum class ControlToken { Ack1, Ack2, Done };

using TokenBytes = std::array<char, 4>;

TokenBytes token_bytes(ControlToken token);
std::optional<ControlToken> parse_token(const TokenBytes& bytes);
const char* to_string(ControlToken token);

std::int64_t now_unix_ms();

// Relative, non-empty, no ".." component, no root or drive prefix.
bool is_safe_relative_path(std::string_view path);

// Throws TransferError(MalformedMetadata) on any violated manifest invariant.
void validate_manifest(const Manifest& manifest);

nlohmann::json manifest_to_json(const Manifest& manifest);
Manifest manifest_from_json(const nlohmann::json& j);

// u32_be(len) || json payload
std::vector<uint8_t> frame_json(const nlohmann::json& j);
std::vector<uint8_t> encode_manifest(const Manifest& manifest);

std::uint32_t read_frame_length(const unsigned char hdr[4], std::uint32_t max_len = kMaxMetadataBytes);
Manifest decode_manifest_payload(const std::string& payload);

// Incremental variant for buffered input: false while the frame is incomplete,
// consumes the frame from inbuf once it is.
bool try_extract_manifest(std::string& inbuf, Manifest& out, std::uint32_t max_len = kMaxMetadataBytes);

} // namespace lanxfer
