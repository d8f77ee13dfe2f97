#pragma once
// Helpers shared by the lanxfer test executables.

#include <asio.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <unistd.h>

namespace lanxfer::test {

namespace fs = std::filesystem;

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() /
                ("lanxfer_" + tag + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& rel) const { return path_ / rel; }

private:
    fs::path path_;
};

// Deterministic, non repeating-looking content.
inline std::string make_bytes(std::size_t n, std::uint32_t seed = 1) {
    std::string out(n, '\0');
    std::uint32_t x = seed * 2654435761u + 1;
    for (std::size_t i = 0; i < n; ++i) {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        out[i] = static_cast<char>(x & 0xFF);
    }
    return out;
}

inline void write_file(const fs::path& p, const std::string& content) {
    if (p.has_parent_path()) fs::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline std::string read_file(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

inline asio::ip::tcp::socket connect_raw(asio::io_context& io, std::uint16_t port) {
    asio::ip::tcp::socket s(io);
    s.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    return s;
}

// Next 4 byte control token, "" on EOF or error.
inline std::string read_token_raw(asio::ip::tcp::socket& s) {
    char b[4];
    asio::error_code ec;
    asio::read(s, asio::buffer(b, 4), ec);
    if (ec) return "";
    return std::string(b, 4);
}

inline void write_raw(asio::ip::tcp::socket& s, const void* data, std::size_t len) {
    asio::write(s, asio::buffer(data, len));
}

inline void write_raw(asio::ip::tcp::socket& s, const std::string& data) {
    write_raw(s, data.data(), data.size());
}

inline void write_raw(asio::ip::tcp::socket& s, const std::vector<uint8_t>& data) {
    write_raw(s, data.data(), data.size());
}

} // namespace lanxfer::test
