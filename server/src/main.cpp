// lanxfer-recv: listens for incoming transfers until the operator stops it.
#include "acceptor.hpp"
#include "session.hpp"

#include "lanxfer/commands.hpp"
#include "lanxfer/config.hpp"
#include "lanxfer/logging.hpp"
#include "lanxfer/ui.hpp"
#include "lanxfer/version.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include <poll.h>
#include <unistd.h>

#include <sodium.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace lanxfer;

static std::atomic_bool g_terminate{false};

static void handle_signal(int)
{
    g_terminate.store(true, std::memory_order_relaxed);
}

static void show_validation_summary(ConsoleUi& ui, std::vector<ValidationFailure> failures)
{
    if (failures.empty()) {
        ui.notify("No integrity failures recorded", Severity::Info);
        return;
    }
    ui.notify(std::to_string(failures.size()) + " file(s) failed integrity check:", Severity::Error);
    for (const auto& f : failures) {
        ui.notify("  " + f.file + "\n      expected: " + f.expected.substr(0, 16) +
                  "...\n      received: " + f.actual.substr(0, 16) + "...", Severity::Error);
    }
}

// Waits up to 300 ms for an operator line on stdin. False on timeout or EOF.
static bool poll_stdin_line(std::string& line, bool& eof)
{
    pollfd p{};
    p.fd = STDIN_FILENO;
    p.events = POLLIN;
    if (::poll(&p, 1, 300) <= 0) return false;
    if (!std::getline(std::cin, line)) {
        eof = true;
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = parse_args(argc, argv);
        init_logging(config.log_level);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << usage(argv[0]);
        return 2;
    }
    if (config.show_help) {
        std::cout << usage(argv[0]);
        return 0;
    }
    if (config.show_version) {
        std::cout << "lanxfer-recv " << resolved_version() << "\n";
        return 0;
    }

    if (sodium_init() < 0) {
        spdlog::critical("sodium_init failed");
        return 1;
    }

    try {
        if (!fs::exists(config.receive_root)) fs::create_directories(config.receive_root);
        config.receive_root = fs::weakly_canonical(config.receive_root);
    } catch (const std::exception& e) {
        std::cerr << "Failed to prepare root directory: " << e.what() << "\n";
        return 2;
    }

    std::signal(SIGINT,  handle_signal);
    std::signal(SIGTERM, handle_signal);

    ConsoleUi ui;
    ValidationLog validation_log;

    auto on_report = [&](const SessionReport& r) {
        if (r.completed) {
            ui.notify(r.peer + ": received " + std::string(to_string(r.kind)) + " '" + r.name + "' (" +
                      format_size(r.bytes_received) + ")", Severity::Success);
        } else {
            ui.notify(r.peer + ": transfer failed: " + r.message, Severity::Error);
        }
        if (!r.validation_failures.empty()) {
            validation_log.record(r.validation_failures);
            show_validation_summary(ui, r.validation_failures);
        }
    };
    auto on_progress = [&](const ProgressSnapshot& s) { ui.render_progress(s); };

    Acceptor acceptor(receiver_options_from(config), on_report, on_progress, config.accept_timeout);
    try {
        acceptor.start(config.bind_address, config.port);
    } catch (const TransferError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    ui.notify("Files will be saved in '" + config.receive_root.string() + "'", Severity::Info);
    ui.notify("Type 'stop' or 'q' to quit, 'help' for commands", Severity::Info);

    std::thread loop([&acceptor] { acceptor.run(); });

    bool eof = false;
    while (acceptor.running() && !g_terminate.load(std::memory_order_relaxed)) {
        std::string line;
        if (!poll_stdin_line(line, eof)) {
            if (eof) {
                // detached from a terminal: keep serving until a signal arrives
                while (acceptor.running() && !g_terminate.load(std::memory_order_relaxed)) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(300));
                }
            }
            continue;
        }

        const ParsedCommand cmd = parse_line(line);
        switch (cmd.type) {
        case CommandType::STOP:
            acceptor.stop();
            break;
        case CommandType::STATUS:
            ui.notify(std::string("acceptor ") + to_string(acceptor.state()) + " on port " +
                      std::to_string(acceptor.local_port()) + ", " +
                      std::to_string(acceptor.in_flight()) + " transfer(s) in flight", Severity::Info);
            break;
        case CommandType::SUMMARY:
            if (cmd.args.empty()) {
                show_validation_summary(ui, validation_log.snapshot());
            } else {
                show_validation_summary(ui, validation_log.take());
                ui.notify("Integrity failure log cleared", Severity::Info);
            }
            break;
        case CommandType::HELP:
            ui.notify(help_text(), Severity::Info);
            break;
        case CommandType::INVALID:
            if (!line.empty()) ui.notify("Unknown command: " + line, Severity::Warning);
            break;
        }
    }

    acceptor.stop();
    loop.join();
    if (acceptor.in_flight() > 0) {
        ui.notify("Waiting for " + std::to_string(acceptor.in_flight()) + " transfer(s) to finish",
                  Severity::Warning);
    }
    acceptor.drain();
    if (validation_log.size() > 0) {
        show_validation_summary(ui, validation_log.snapshot());
    }
    ui.notify("Receive mode stopped", Severity::Warning);
    return 0;
}
