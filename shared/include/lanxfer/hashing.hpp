#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>

#include <sodium.h>

namespace lanxfer {

enum class HashAlgorithm { Sha256, Sha512, Blake2b };

const char* to_string(HashAlgorithm algorithm);
// Accepts "sha256", "sha512", "blake2b"; throws std::invalid_argument otherwise.
HashAlgorithm hash_algorithm_from_string(std::string_view name);

std::size_t digest_size(HashAlgorithm algorithm);

// Streaming digest over any byte source. One Hasher produces one digest.
class Hasher {
public:
    explicit Hasher(HashAlgorithm algorithm);

    void update(const void* data, std::size_t len);
    std::string final_hex();

    HashAlgorithm algorithm() const { return algorithm_; }

private:
    HashAlgorithm algorithm_;
    bool finished_ = false;
    crypto_hash_sha256_state sha256_{};
    crypto_hash_sha512_state sha512_{};
    crypto_generichash_state blake2b_{};
};

std::string hash_bytes(const void* data, std::size_t len, HashAlgorithm algorithm);
std::string hash_stream(std::istream& in, HashAlgorithm algorithm);
std::string hash_file(const std::filesystem::path& path, HashAlgorithm algorithm);

// Constant time comparison of two hex digests. Malformed hex never compares equal.
bool digests_equal(const std::string& a_hex, const std::string& b_hex);

} // namespace lanxfer
