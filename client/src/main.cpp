// lanxfer-send: sends one file or directory tree to a listening lanxfer-recv.
#include "sender.hpp"

#include "lanxfer/config.hpp"
#include "lanxfer/error.hpp"
#include "lanxfer/logging.hpp"
#include "lanxfer/netif.hpp"
#include "lanxfer/ui.hpp"
#include "lanxfer/version.hpp"

#include <filesystem>
#include <iostream>
#include <string>

#include <asio.hpp>
#include <sodium.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace lanxfer;

static bool valid_ip(const std::string& ip) {
    asio::error_code ec;
    asio::ip::make_address(ip, ec);
    return !ec;
}

static std::string clean_path(std::string s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return s;
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
        std::cout << "lanxfer-send " << resolved_version() << "\n";
        return 0;
    }

    ConsoleUi ui;

    if (config.list_interfaces) {
        const auto addrs = enumerate_network_addresses();
        if (addrs.empty()) {
            ui.notify("No network interfaces with IPv4 addresses found", Severity::Warning);
            return 1;
        }
        for (std::size_t i = 0; i < addrs.size(); ++i) {
            std::cout << "  " << (i + 1) << ". " << addrs[i].label << " - " << addrs[i].address << "\n";
        }
        return 0;
    }

    if (sodium_init() < 0) {
        spdlog::critical("sodium_init failed");
        return 1;
    }

    while (config.target.empty() || !valid_ip(config.target)) {
        if (!config.target.empty()) {
            ui.notify("Invalid IP address: " + config.target, Severity::Error);
        }
        config.target = ui.prompt_line("Target IP: ");
        if (std::cin.eof()) return 2;
    }
    if (config.send_path.empty()) {
        config.send_path = clean_path(ui.prompt_line("File or directory to send: "));
        if (config.send_path.empty()) return 2;
    }

    const SendOptions options = send_options_from(config);
    try {
        const SendResult r = send_path(config.send_path, options,
                                       [&ui](const ProgressSnapshot& s) { ui.render_progress(s); });
        ui.notify(std::string(r.kind == TransferKind::SingleFile ? "File" : "Directory") + " '" + r.name +
                  "' sent: " + std::to_string(r.items) + " item(s), " + format_size(r.bytes_sent),
                  Severity::Success);
    } catch (const TransferError& e) {
        ui.notify(std::string("Transfer failed (") + to_string(e.code()) + "): " + e.what(), Severity::Error);
        return 1;
    } catch (const std::exception& e) {
        ui.notify(std::string("Transfer failed: ") + e.what(), Severity::Error);
        return 1;
    }
    return 0;
}
