#include "lanxfer/protocol.hpp"
#include "lanxfer/error.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <cstring>      // std::memcpy
#include <cstdint>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace {
inline void write_u32_be(uint32_t v, unsigned char out[4]) {
    out[0] = static_cast<unsigned char>((v >> 24) & 0xFF);
    out[1] = static_cast<unsigned char>((v >> 16) & 0xFF);
    out[2] = static_cast<unsigned char>((v >> 8)  & 0xFF);
    out[3] = static_cast<unsigned char>( v        & 0xFF);
}

inline uint32_t read_u32_be(const unsigned char in[4]) {
    return (uint32_t(in[0]) << 24) |
           (uint32_t(in[1]) << 16) |
           (uint32_t(in[2]) << 8)  |
            uint32_t(in[3]);
}

[[noreturn]] void malformed(const std::string& why) {
    throw lanxfer::TransferError(lanxfer::ErrorCode::MalformedMetadata, "Malformed metadata: " + why);
}

std::uint64_t get_u64(const nlohmann::json& j, const char* key) {
    const auto& v = j.at(key);
    if (!v.is_number_unsigned()) malformed(std::string("'") + key + "' must be a non-negative integer");
    return v.get<std::uint64_t>();
}

// Spelling-independent form of a relative path: "./a.txt", "sub//a.txt" and
// "sub\\a.txt" all collapse to the name the receiver would write.
std::string normalized_path(std::string path) {
    std::replace(path.begin(), path.end(), '\\', '/');
    std::string out = std::filesystem::path(path).lexically_normal().generic_string();
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}
} // namespace

namespace lanxfer {

const char* to_string(TransferKind kind) {
    return kind == TransferKind::SingleFile ? "file" : "directory";
}

bool ItemDescriptor::operator==(const ItemDescriptor& other) const {
    return relative_path == other.relative_path && size == other.size &&
           content_hash == other.content_hash;
}

bool Manifest::operator==(const Manifest& other) const {
    return kind == other.kind && name == other.name && items == other.items &&
           total_bytes == other.total_bytes && created_at == other.created_at &&
           hash_algorithm == other.hash_algorithm;
}

TokenBytes token_bytes(ControlToken token) {
    switch (token) {
    case ControlToken::Ack1: return {'A', 'C', 'K', '1'};
    case ControlToken::Ack2: return {'A', 'C', 'K', '2'};
    case ControlToken::Done: return {'D', 'O', 'N', 'E'};
    }
    return {'?', '?', '?', '?'};
}

std::optional<ControlToken> parse_token(const TokenBytes& bytes) {
    for (ControlToken t : {ControlToken::Ack1, ControlToken::Ack2, ControlToken::Done}) {
        if (token_bytes(t) == bytes) return t;
    }
    return std::nullopt;
}

const char* to_string(ControlToken token) {
    switch (token) {
    case ControlToken::Ack1: return "ACK1";
    case ControlToken::Ack2: return "ACK2";
    case ControlToken::Done: return "DONE";
    }
    return "????";
}

std::int64_t now_unix_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

bool is_safe_relative_path(std::string_view path) {
    if (path.empty()) return false;
    if (path.front() == '/' || path.front() == '\\') return false;
    if (path.size() >= 2 && path[1] == ':') return false;   // C:foo, C:\foo

    std::size_t start = 0;
    bool has_name = false;
    while (start <= path.size()) {
        std::size_t end = path.find_first_of("/\\", start);
        if (end == std::string_view::npos) end = path.size();
        std::string_view part = path.substr(start, end - start);
        if (part == "..") return false;
        if (!part.empty() && part != ".") has_name = true;
        start = end + 1;
    }
    return has_name;
}

void validate_manifest(const Manifest& manifest) {
    if (manifest.name.empty()) malformed("empty name");

    if (manifest.kind == TransferKind::SingleFile) {
        if (manifest.items.size() != 1) malformed("file transfer must carry exactly one item");
    } else {
        if (manifest.items.empty()) malformed("directory transfer without items");
        if (manifest.name == "." || manifest.name == ".." ||
            manifest.name.find_first_of("/\\") != std::string::npos) {
            malformed("directory name must be a single path component: " + manifest.name);
        }
    }

    std::set<std::string> seen;
    std::uint64_t sum = 0;
    for (const auto& item : manifest.items) {
        if (!is_safe_relative_path(item.relative_path)) {
            malformed("unsafe path '" + item.relative_path + "'");
        }
        if (!seen.insert(normalized_path(item.relative_path)).second) {
            malformed("duplicate path '" + item.relative_path + "'");
        }
        if (manifest.kind == TransferKind::SingleFile && !item.content_hash) {
            malformed("file transfer without a content hash");
        }
        if (item.content_hash && item.content_hash->size() != 2 * digest_size(manifest.hash_algorithm)) {
            malformed("bad digest length for '" + item.relative_path + "'");
        }
        if (sum + item.size < sum) malformed("item sizes overflow");
        sum += item.size;
    }
    if (sum != manifest.total_bytes) {
        malformed("total_bytes " + std::to_string(manifest.total_bytes) +
                  " does not match item sizes " + std::to_string(sum));
    }
}

nlohmann::json manifest_to_json(const Manifest& manifest) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& item : manifest.items) {
        nlohmann::json e = {{"path", item.relative_path}, {"size", item.size}};
        if (item.content_hash) e["hash"] = *item.content_hash;
        items.push_back(std::move(e));
    }
    return {
        {"kind",           to_string(manifest.kind)},
        {"name",           manifest.name},
        {"items",          items},
        {"total_bytes",    manifest.total_bytes},
        {"created_at",     manifest.created_at},
        {"hash_algorithm", to_string(manifest.hash_algorithm)}
    };
}

Manifest manifest_from_json(const nlohmann::json& j) {
    Manifest m;
    try {
        if (!j.is_object()) malformed("not an object");

        const std::string kind = j.at("kind").get<std::string>();
        if (kind == "file") m.kind = TransferKind::SingleFile;
        else if (kind == "directory") m.kind = TransferKind::DirectoryTree;
        else malformed("unknown kind '" + kind + "'");

        m.name = j.at("name").get<std::string>();
        m.total_bytes = get_u64(j, "total_bytes");
        m.created_at = j.value("created_at", std::int64_t{0});
        m.hash_algorithm = hash_algorithm_from_string(j.value("hash_algorithm", std::string("sha256")));

        const auto& items = j.at("items");
        if (!items.is_array()) malformed("'items' must be an array");
        for (const auto& e : items) {
            ItemDescriptor item;
            item.relative_path = e.at("path").get<std::string>();
            item.size = get_u64(e, "size");
            if (e.contains("hash") && !e.at("hash").is_null()) {
                item.content_hash = e.at("hash").get<std::string>();
            }
            m.items.push_back(std::move(item));
        }
    } catch (const nlohmann::json::exception& e) {
        malformed(e.what());
    } catch (const std::invalid_argument& e) {
        malformed(e.what());
    }
    validate_manifest(m);
    return m;
}

std::vector<uint8_t> frame_json(const nlohmann::json& j) {
    const std::string payload = j.dump();

    if (payload.size() > kMaxMetadataBytes) {
        throw TransferError(ErrorCode::OversizedMetadata,
                            "metadata payload too large (" + std::to_string(payload.size()) + " bytes)");
    }

    unsigned char hdr[4];
    write_u32_be(static_cast<uint32_t>(payload.size()), hdr);

    std::vector<uint8_t> out;
    out.resize(4 + payload.size());
    std::memcpy(out.data(), hdr, 4);
    std::memcpy(out.data() + 4, payload.data(), payload.size());
    return out;
}

std::vector<uint8_t> encode_manifest(const Manifest& manifest) {
    validate_manifest(manifest);
    return frame_json(manifest_to_json(manifest));
}

std::uint32_t read_frame_length(const unsigned char hdr[4], std::uint32_t max_len) {
    const uint32_t len = read_u32_be(hdr);
    if (len > max_len) {
        throw TransferError(ErrorCode::OversizedMetadata,
                            "metadata length " + std::to_string(len) + " exceeds limit " +
                            std::to_string(max_len));
    }
    return len;
}

Manifest decode_manifest_payload(const std::string& payload) {
    nlohmann::json j = nlohmann::json::parse(payload, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        malformed("invalid JSON");
    }
    return manifest_from_json(j);
}

bool try_extract_manifest(std::string& inbuf, Manifest& out, std::uint32_t max_len) {
    if (inbuf.size() < 4) return false;

    unsigned char hdr[4];
    std::memcpy(hdr, inbuf.data(), 4);
    const uint32_t len = read_frame_length(hdr, max_len);

    if (inbuf.size() < static_cast<size_t>(4) + len) return false;

    const std::string payload = inbuf.substr(4, len);
    out = decode_manifest_payload(payload);
    inbuf.erase(0, 4 + static_cast<size_t>(len));
    return true;
}

} // namespace lanxfer
