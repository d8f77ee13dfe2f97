#include "lanxfer/hashing.hpp"
#include "lanxfer/error.hpp"

#include <fstream>
#include <stdexcept>
#include <vector>

namespace lanxfer {

namespace {

constexpr std::size_t kHashBlock = 8192;
constexpr std::size_t kBlake2bBytes = 32;

void ensure_sodium() {
    static const bool ready = sodium_init() >= 0;
    if (!ready) {
        throw std::runtime_error("sodium_init failed");
    }
}

std::string to_hex(const unsigned char* bin, std::size_t len) {
    std::string hex(len * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bin, len);
    hex.resize(len * 2);
    return hex;
}

bool hex_to_vec(const std::string& hex, std::vector<unsigned char>& out) {
    out.assign(hex.size() / 2, 0);
    std::size_t outlen = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(out.data(), out.size(),
                       hex.c_str(), hex.size(),
                       nullptr, &outlen, &end) != 0) {
        return false;
    }
    if (end != hex.c_str() + hex.size()) return false;
    out.resize(outlen);
    return true;
}

} // namespace

const char* to_string(HashAlgorithm algorithm) {
    switch (algorithm) {
    case HashAlgorithm::Sha256:  return "sha256";
    case HashAlgorithm::Sha512:  return "sha512";
    case HashAlgorithm::Blake2b: return "blake2b";
    }
    return "unknown";
}

HashAlgorithm hash_algorithm_from_string(std::string_view name) {
    if (name == "sha256") return HashAlgorithm::Sha256;
    if (name == "sha512") return HashAlgorithm::Sha512;
    if (name == "blake2b") return HashAlgorithm::Blake2b;
    throw std::invalid_argument("unsupported hash algorithm: " + std::string(name));
}

std::size_t digest_size(HashAlgorithm algorithm) {
    switch (algorithm) {
    case HashAlgorithm::Sha256:  return crypto_hash_sha256_BYTES;
    case HashAlgorithm::Sha512:  return crypto_hash_sha512_BYTES;
    case HashAlgorithm::Blake2b: return kBlake2bBytes;
    }
    return 0;
}

Hasher::Hasher(HashAlgorithm algorithm) : algorithm_(algorithm) {
    ensure_sodium();
    int rc = 0;
    switch (algorithm_) {
    case HashAlgorithm::Sha256:  rc = crypto_hash_sha256_init(&sha256_); break;
    case HashAlgorithm::Sha512:  rc = crypto_hash_sha512_init(&sha512_); break;
    case HashAlgorithm::Blake2b: rc = crypto_generichash_init(&blake2b_, nullptr, 0, kBlake2bBytes); break;
    }
    if (rc != 0) {
        throw std::runtime_error(std::string("hash init failed: ") + to_string(algorithm_));
    }
}

void Hasher::update(const void* data, std::size_t len) {
    if (finished_) {
        throw std::logic_error("Hasher::update after final_hex");
    }
    const auto* p = static_cast<const unsigned char*>(data);
    const auto n = static_cast<unsigned long long>(len);
    int rc = 0;
    switch (algorithm_) {
    case HashAlgorithm::Sha256:  rc = crypto_hash_sha256_update(&sha256_, p, n); break;
    case HashAlgorithm::Sha512:  rc = crypto_hash_sha512_update(&sha512_, p, n); break;
    case HashAlgorithm::Blake2b: rc = crypto_generichash_update(&blake2b_, p, n); break;
    }
    if (rc != 0) {
        throw std::runtime_error(std::string("hash update failed: ") + to_string(algorithm_));
    }
}

std::string Hasher::final_hex() {
    if (finished_) {
        throw std::logic_error("Hasher::final_hex called twice");
    }
    finished_ = true;
    unsigned char out[crypto_hash_sha512_BYTES];
    int rc = 0;
    switch (algorithm_) {
    case HashAlgorithm::Sha256:  rc = crypto_hash_sha256_final(&sha256_, out); break;
    case HashAlgorithm::Sha512:  rc = crypto_hash_sha512_final(&sha512_, out); break;
    case HashAlgorithm::Blake2b: rc = crypto_generichash_final(&blake2b_, out, kBlake2bBytes); break;
    }
    if (rc != 0) {
        throw std::runtime_error(std::string("hash final failed: ") + to_string(algorithm_));
    }
    return to_hex(out, digest_size(algorithm_));
}

std::string hash_bytes(const void* data, std::size_t len, HashAlgorithm algorithm) {
    Hasher h(algorithm);
    h.update(data, len);
    return h.final_hex();
}

std::string hash_stream(std::istream& in, HashAlgorithm algorithm) {
    Hasher h(algorithm);
    char buf[kHashBlock];
    while (true) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n <= 0) break;
        h.update(buf, static_cast<std::size_t>(n));
    }
    if (in.bad()) {
        throw TransferError(ErrorCode::IoError, "read failed while hashing");
    }
    return h.final_hex();
}

std::string hash_file(const std::filesystem::path& path, HashAlgorithm algorithm) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        throw TransferError(ErrorCode::NotFound, "Cannot open file for hashing: " + path.string());
    }
    return hash_stream(f, algorithm);
}

bool digests_equal(const std::string& a_hex, const std::string& b_hex) {
    ensure_sodium();
    std::vector<unsigned char> a;
    std::vector<unsigned char> b;
    if (!hex_to_vec(a_hex, a) || !hex_to_vec(b_hex, b)) return false;
    if (a.empty() || a.size() != b.size()) return false;
    int rc = sodium_memcmp(a.data(), b.data(), a.size());
    sodium_memzero(a.data(), a.size());
    sodium_memzero(b.data(), b.size());
    return rc == 0;
}

} // namespace lanxfer
