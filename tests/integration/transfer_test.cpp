#include "sender.hpp"
#include "session.hpp"
#include "lanxfer/error.hpp"
#include "lanxfer/hashing.hpp"
#include "lanxfer/protocol.hpp"
#include "test_support.hpp"

#include <cassert>
#include <functional>
#include <future>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using namespace lanxfer;
using asio::ip::tcp;
using namespace std::chrono_literals;

namespace {

// Accepts one connection on 127.0.0.1 and runs a receiver Session on it.
struct LoopbackReceiver {
    asio::io_context io;
    tcp::acceptor acc{io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)};

    std::uint16_t port() const { return acc.local_endpoint().port(); }

    std::future<SessionReport> serve_one(ReceiverOptions opts, ProgressCallback cb = {}) {
        return std::async(std::launch::async, [this, opts, cb]() {
            tcp::socket s(io);
            acc.accept(s);
            Session session(std::move(s), opts, cb);
            return session.run();
        });
    }
};

ReceiverOptions receiver_options(const test::TempDir& root) {
    ReceiverOptions o;
    o.root = root.path();
    o.chunk_size = 4096;
    o.io_timeout = 10s;
    o.progress_interval = 0ms;
    return o;
}

SendOptions sender_options(std::uint16_t port) {
    SendOptions o;
    o.host = "127.0.0.1";
    o.port = port;
    o.chunk_size = 4096;
    o.connect_timeout = 5s;
    o.io_timeout = 10s;
    o.progress_interval = 0ms;
    return o;
}

ErrorCode send_error(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const TransferError& e) {
        return e.code();
    }
    assert(false && "expected TransferError");
    return ErrorCode::IoError;
}

std::uint16_t unused_port() {
    asio::io_context io;
    tcp::acceptor a(io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    return a.local_endpoint().port();
}

void single_file_with_progress() {
    test::TempDir src("tx_src"), dst("tx_dst");
    const std::string content = test::make_bytes(10 * 1024, 3);
    test::write_file(src / "report.pdf", content);

    LoopbackReceiver rx;
    std::vector<std::uint64_t> recv_progress;
    auto report = rx.serve_one(receiver_options(dst),
                               [&](const ProgressSnapshot& s) { recv_progress.push_back(s.bytes_done); });

    std::vector<std::uint64_t> sent_progress;
    const SendResult res = send_path(src / "report.pdf", sender_options(rx.port()),
                                     [&](const ProgressSnapshot& s) { sent_progress.push_back(s.bytes_done); });
    const SessionReport r = report.get();

    assert(res.kind == TransferKind::SingleFile);
    assert(res.bytes_sent == 10240);
    assert((sent_progress == std::vector<std::uint64_t>{4096, 8192, 10240}));
    assert(!recv_progress.empty() && recv_progress.back() == 10240);

    assert(r.completed);
    assert(!r.error);
    assert(r.name == "report.pdf");
    assert(r.bytes_received == 10240);
    assert(r.items_received == 1);
    assert(r.validation_failures.empty());
    assert(test::read_file(dst / "report.pdf") == content);
    assert(hash_file(dst / "report.pdf", HashAlgorithm::Sha256) ==
           hash_bytes(content.data(), content.size(), HashAlgorithm::Sha256));
    std::cout << "single file transfer ok" << std::endl;
}

void tree_token_sequence() {
    test::TempDir dst("tree_dst");
    LoopbackReceiver rx;
    auto report = rx.serve_one(receiver_options(dst));

    Manifest m;
    m.kind = TransferKind::DirectoryTree;
    m.name = "photos";
    m.items = {{"a.bin", 100, std::nullopt}, {"empty.txt", 0, std::nullopt}, {"sub/c.bin", 5000, std::nullopt}};
    m.total_bytes = 5100;
    m.created_at = now_unix_ms();
    const std::string a = test::make_bytes(100, 1), c = test::make_bytes(5000, 2);

    asio::io_context io;
    tcp::socket s = test::connect_raw(io, rx.port());
    test::write_raw(s, encode_manifest(m));
    std::vector<std::string> tokens;
    tokens.push_back(test::read_token_raw(s));
    test::write_raw(s, a);
    tokens.push_back(test::read_token_raw(s));
    tokens.push_back(test::read_token_raw(s));   // empty item needs no bytes
    test::write_raw(s, c);
    tokens.push_back(test::read_token_raw(s));

    const SessionReport r = report.get();
    assert((tokens == std::vector<std::string>{"ACK1", "ACK2", "ACK2", "DONE"}));
    assert(r.completed);
    assert(r.kind == TransferKind::DirectoryTree);
    assert(r.bytes_received == 5100);
    assert(r.items_received == 3);
    assert(test::read_file(dst / "photos/a.bin") == a);
    assert(std::filesystem::exists(dst / "photos/empty.txt"));
    assert(std::filesystem::file_size(dst / "photos/empty.txt") == 0);
    assert(test::read_file(dst / "photos/sub/c.bin") == c);
    std::cout << "directory token sequence ok" << std::endl;
}

void tree_via_sender_with_item_hashes() {
    test::TempDir src("tree_src"), dst("tree_dst2");
    const std::filesystem::path root = src / "album";
    test::write_file(root / "one.jpg", test::make_bytes(9000, 4));
    test::write_file(root / "nested/two.jpg", test::make_bytes(3, 5));
    test::write_file(root / "nested/deeper/zero.txt", "");

    LoopbackReceiver rx;
    auto report = rx.serve_one(receiver_options(dst));

    SendOptions opts = sender_options(rx.port());
    opts.hash_algorithm = HashAlgorithm::Sha512;
    opts.hash_tree_items = true;
    const SendResult res = send_path(root, opts);
    const SessionReport r = report.get();

    assert(res.kind == TransferKind::DirectoryTree);
    assert(res.name == "album");
    assert(res.items == 3);
    assert(res.bytes_sent == 9003);
    assert(r.completed);
    assert(r.validation_failures.empty());
    for (const char* rel : {"one.jpg", "nested/two.jpg", "nested/deeper/zero.txt"}) {
        assert(std::filesystem::exists(dst / "album" / rel));
        assert(test::read_file(dst / "album" / rel) == test::read_file(root / rel));
    }
    std::cout << "directory via sender ok" << std::endl;
}

void short_send_removes_partial() {
    test::TempDir dst("short_dst");
    LoopbackReceiver rx;
    auto report = rx.serve_one(receiver_options(dst));

    const std::string full = test::make_bytes(1000);
    Manifest m;
    m.name = "short.bin";
    m.items = {{"short.bin", 1000, hash_bytes(full.data(), full.size(), HashAlgorithm::Sha256)}};
    m.total_bytes = 1000;
    {
        asio::io_context io;
        tcp::socket s = test::connect_raw(io, rx.port());
        test::write_raw(s, encode_manifest(m));
        assert(test::read_token_raw(s) == "ACK1");
        test::write_raw(s, full.substr(0, 500));
        s.shutdown(tcp::socket::shutdown_send);
        assert(test::read_token_raw(s) == "");
    }

    const SessionReport r = report.get();
    assert(!r.completed);
    assert(r.error && *r.error == ErrorCode::ConnectionLost);
    assert(r.bytes_received == 500);
    assert(!std::filesystem::exists(dst / "short.bin"));
    std::cout << "short send cleanup ok" << std::endl;
}

void tree_item_failure_aborts_session() {
    test::TempDir dst("tree_abort_dst");
    LoopbackReceiver rx;
    auto report = rx.serve_one(receiver_options(dst));

    const std::string first = test::make_bytes(300, 21);
    const std::string second = test::make_bytes(6000, 22);
    Manifest m;
    m.kind = TransferKind::DirectoryTree;
    m.name = "batch";
    m.items = {{"first.bin", 300, std::nullopt}, {"second.bin", 6000, std::nullopt}, {"third.bin", 10, std::nullopt}};
    m.total_bytes = 6310;
    {
        asio::io_context io;
        tcp::socket s = test::connect_raw(io, rx.port());
        test::write_raw(s, encode_manifest(m));
        assert(test::read_token_raw(s) == "ACK1");
        test::write_raw(s, first);
        assert(test::read_token_raw(s) == "ACK2");
        test::write_raw(s, second.substr(0, 3000));
        s.shutdown(tcp::socket::shutdown_send);
        // no ACK2 for the broken item and no DONE
        assert(test::read_token_raw(s) == "");
    }

    const SessionReport r = report.get();
    assert(!r.completed);
    assert(r.error && *r.error == ErrorCode::ConnectionLost);
    assert(r.items_received == 1);
    assert(r.bytes_received == 3300);
    assert(test::read_file(dst / "batch/first.bin") == first);
    assert(!std::filesystem::exists(dst / "batch/second.bin"));
    assert(!std::filesystem::exists(dst / "batch/third.bin"));
    std::cout << "directory item failure cleanup ok" << std::endl;
}

void integrity_mismatch_is_not_fatal() {
    test::TempDir dst("mismatch_dst");
    LoopbackReceiver rx;
    auto report = rx.serve_one(receiver_options(dst));

    const std::string sent = test::make_bytes(2048, 8);
    const std::string other = test::make_bytes(2048, 9);
    Manifest m;
    m.name = "data.bin";
    m.items = {{"data.bin", 2048, hash_bytes(other.data(), other.size(), HashAlgorithm::Sha256)}};
    m.total_bytes = 2048;

    asio::io_context io;
    tcp::socket s = test::connect_raw(io, rx.port());
    test::write_raw(s, encode_manifest(m));
    assert(test::read_token_raw(s) == "ACK1");
    test::write_raw(s, sent);
    assert(test::read_token_raw(s) == "DONE");

    const SessionReport r = report.get();
    assert(r.completed);
    assert(!r.error);
    assert(r.validation_failures.size() == 1);
    assert(r.validation_failures[0].expected == *m.items[0].content_hash);
    assert(r.validation_failures[0].actual == hash_bytes(sent.data(), sent.size(), HashAlgorithm::Sha256));
    assert(test::read_file(dst / "data.bin") == sent);

    ValidationLog log;
    log.record(r.validation_failures);
    assert(log.size() == 1);
    assert(log.snapshot().size() == 1);
    assert(log.size() == 1);
    assert(log.take().size() == 1);
    assert(log.size() == 0);
    std::cout << "integrity mismatch recorded" << std::endl;
}

// Sends raw bytes, expects the receiver to hang up without ACK1.
void rejected_metadata(const std::string& bytes, ErrorCode expected, const test::TempDir& dst) {
    LoopbackReceiver rx;
    auto report = rx.serve_one(receiver_options(dst));

    asio::io_context io;
    tcp::socket s = test::connect_raw(io, rx.port());
    test::write_raw(s, bytes);
    assert(test::read_token_raw(s) == "");

    const SessionReport r = report.get();
    assert(!r.completed);
    assert(r.error && *r.error == expected);
}

void bad_metadata_rejected() {
    test::TempDir dst("bad_meta");

    rejected_metadata(std::string("\x7F\xFF\xFF\xFF", 4), ErrorCode::OversizedMetadata, dst);

    const std::string garbage = "{\"kind\": nope";
    std::string frame = {0, 0, 0, static_cast<char>(garbage.size())};
    rejected_metadata(frame + garbage, ErrorCode::MalformedMetadata, dst);

    nlohmann::json j = {{"kind", "file"}, {"name", "evil"}, {"total_bytes", 4},
                        {"items", {{{"path", "../evil"}, {"size", 4}}}}};
    const auto framed = frame_json(j);
    rejected_metadata(std::string(framed.begin(), framed.end()) + "evil", ErrorCode::MalformedMetadata, dst);
    assert(!std::filesystem::exists(dst.path().parent_path() / "evil"));
    assert(std::filesystem::is_empty(dst.path()));
    std::cout << "bad metadata rejected" << std::endl;
}

void receiver_idle_timeout() {
    test::TempDir dst("idle_dst");
    LoopbackReceiver rx;
    ReceiverOptions opts = receiver_options(dst);
    opts.io_timeout = 200ms;
    auto report = rx.serve_one(opts);

    asio::io_context io;
    tcp::socket s = test::connect_raw(io, rx.port());
    const SessionReport r = report.get();
    assert(r.error && *r.error == ErrorCode::Timeout);
    assert(test::read_token_raw(s) == "");
    std::cout << "receiver idle timeout ok" << std::endl;
}

void sender_preconditions() {
    test::TempDir src("pre_src");
    std::filesystem::create_directories(src / "hollow/inner");
    const SendOptions opts = sender_options(unused_port());

    assert(send_error([&] { send_path(src / "missing.bin", opts); }) == ErrorCode::NotFound);
    assert(send_error([&] { send_path(src / "hollow", opts); }) == ErrorCode::Empty);

    test::write_file(src / "x.bin", "x");
    assert(send_error([&] { send_path(src / "x.bin", opts); }) == ErrorCode::ConnectionRefused);
    std::cout << "sender preconditions ok" << std::endl;
}

// A receiver that reads the manifest and then answers with `reply`, or just hangs up.
void sender_sees_handshake_failure(const std::string& reply) {
    test::TempDir src("hs_src");
    test::write_file(src / "x.bin", test::make_bytes(100));

    asio::io_context io;
    tcp::acceptor acc(io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    const auto port = acc.local_endpoint().port();
    auto fake = std::async(std::launch::async, [&]() {
        tcp::socket s(io);
        acc.accept(s);
        unsigned char hdr[4];
        asio::read(s, asio::buffer(hdr, 4));
        std::string payload(read_frame_length(hdr), '\0');
        asio::read(s, asio::buffer(payload.data(), payload.size()));
        decode_manifest_payload(payload);
        if (!reply.empty()) {
            test::write_raw(s, reply);
            char sink[256];
            asio::error_code ec;
            while (!ec) s.read_some(asio::buffer(sink), ec);
        }
    });

    assert(send_error([&] { send_path(src / "x.bin", sender_options(port)); }) == ErrorCode::HandshakeFailed);
    fake.get();
}

} // namespace

int main() {
    spdlog::set_level(spdlog::level::warn);

    single_file_with_progress();
    tree_token_sequence();
    tree_via_sender_with_item_hashes();
    short_send_removes_partial();
    tree_item_failure_aborts_session();
    integrity_mismatch_is_not_fatal();
    bad_metadata_rejected();
    receiver_idle_timeout();
    sender_preconditions();
    sender_sees_handshake_failure("NOPE");
    sender_sees_handshake_failure("DONE");
    sender_sees_handshake_failure("");
    std::cout << "handshake failures ok" << std::endl;

    std::cout << "\ntransfer_test passed" << std::endl;
    return 0;
}
