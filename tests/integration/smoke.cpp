#include "lanxfer/version.hpp"
#include "lanxfer/hashing.hpp"
#include "lanxfer/protocol.hpp"

#include <cassert>
#include <cstring>
#include <iostream>
#include <string>

// Test library headers
#include <asio.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sodium.h>

int main() {
    // Test 1: Version check
    const auto v = lanxfer::version();
    assert(!v.empty());
    assert(std::string(lanxfer::resolved_version()) == std::string(v));
    std::cout << "Version library linked: " << lanxfer::resolved_version() << std::endl;

    // Test 2: Asio
    asio::io_context io_context;
    assert(io_context.stopped() == false);
    asio::ip::tcp::acceptor acc(io_context, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    assert(acc.local_endpoint().port() != 0);
    std::cout << "Asio library linked" << std::endl;

    // Test 3: nlohmann/json through the manifest codec
    lanxfer::Manifest m;
    m.name = "a.txt";
    m.items.push_back({"a.txt", 3, lanxfer::hash_bytes("abc", 3, lanxfer::HashAlgorithm::Sha256)});
    m.total_bytes = 3;
    nlohmann::json j = lanxfer::manifest_to_json(m);
    assert(j["kind"] == "file");
    assert(j["total_bytes"] == 3);
    std::cout << "nlohmann/json library linked" << std::endl;

    // Test 4: spdlog
    spdlog::set_level(spdlog::level::off); // Suppress output
    spdlog::info("Test message");
    std::cout << "spdlog library linked" << std::endl;

    // Test 5: libsodium
    if (sodium_init() < 0) {
        std::cerr << "libsodium initialization failed" << std::endl;
        return 1;
    }
    unsigned char hash[crypto_hash_sha256_BYTES];
    const char* message = "test";
    crypto_hash_sha256(hash, reinterpret_cast<const unsigned char*>(message), 4);
    assert(lanxfer::hash_bytes(message, 4, lanxfer::HashAlgorithm::Sha256).size() == 2 * sizeof(hash));
    std::cout << "libsodium library linked" << std::endl;

    std::cout << "\nAll libraries successfully linked!" << std::endl;
    return 0;
}
