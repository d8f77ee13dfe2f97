#include "lanxfer/config.hpp"

#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace lanxfer {

namespace {

std::string trimQuotes(std::string s) {
    auto q = [](char c){ return c == '\'' || c == '"'; };
    if (!s.empty() && q(s.front())) s.erase(s.begin());
    if (!s.empty() && q(s.back()))  s.pop_back();
    return s;
}

std::uint64_t parse_uint(const std::string& key, const std::string& val,
                         std::uint64_t min, std::uint64_t max) {
    std::size_t pos = 0;
    unsigned long long v = 0;
    try {
        if (val.empty() || val.front() == '-') throw std::invalid_argument(key);
        v = std::stoull(val, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid --" + key + ": " + val);
    }
    if (pos != val.size() || v < min || v > max) {
        throw std::invalid_argument("Invalid --" + key + ": " + val + " (expected " +
                                    std::to_string(min) + ".." + std::to_string(max) + ")");
    }
    return v;
}

bool parse_bool(const std::string& key, const std::string& val) {
    if (val == "true" || val == "1" || val == "yes" || val == "on") return true;
    if (val == "false" || val == "0" || val == "no" || val == "off") return false;
    throw std::invalid_argument("Invalid --" + key + ": " + val + " (expected true/false)");
}

std::chrono::milliseconds parse_ms(const std::string& key, const std::string& val) {
    return std::chrono::milliseconds(parse_uint(key, val, 1, 24ull * 3600 * 1000));
}

bool is_flag(const std::string& key) {
    return key == "list-interfaces" || key == "help" || key == "version";
}

} // namespace

void apply_option(Config& config, const std::string& key, const std::string& value) {
    const std::string val = trimQuotes(value);

    if (key == "port") {
        config.port = static_cast<std::uint16_t>(parse_uint(key, val, 1, 65535));
    } else if (key == "bind") {
        config.bind_address = val;
    } else if (key == "target") {
        config.target = val;
    } else if (key == "send") {
        if (val.empty()) throw std::invalid_argument("Invalid --send: empty path");
        config.send_path = val;
    } else if (key == "root") {
        if (val.empty()) throw std::invalid_argument("Invalid --root: empty path");
        config.receive_root = val;
    } else if (key == "chunk-size") {
        config.chunk_size = static_cast<std::size_t>(parse_uint(key, val, 1, kMaxChunkSize));
    } else if (key == "timeout") {
        config.io_timeout = parse_ms(key, val);
    } else if (key == "connect-timeout") {
        config.connect_timeout = parse_ms(key, val);
    } else if (key == "accept-timeout") {
        config.accept_timeout = parse_ms(key, val);
    } else if (key == "progress-interval") {
        config.progress_interval = std::chrono::milliseconds(parse_uint(key, val, 0, 60000));
    } else if (key == "hash") {
        config.hash_algorithm = hash_algorithm_from_string(val);
    } else if (key == "hash-items") {
        config.hash_tree_items = parse_bool(key, val);
    } else if (key == "log-level") {
        if (val != "trace" && val != "debug" && val != "info" && val != "warn" &&
            val != "error" && val != "critical" && val != "off") {
            throw std::invalid_argument("Invalid --log-level: " + val);
        }
        config.log_level = val;
    } else if (key == "config") {
        load_config_file(config, val);
    } else if (key == "list-interfaces") {
        config.list_interfaces = true;
    } else if (key == "help") {
        config.show_help = true;
    } else if (key == "version") {
        config.show_version = true;
    } else {
        throw std::invalid_argument("Unknown option: --" + key);
    }
}

Config parse_args(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ) {
        std::string arg = argv[i];

        if (arg.rfind("--", 0) != 0) {
            throw std::invalid_argument("Unexpected positional argument: " + arg);
        }

        std::string key, val;
        if (auto eq = arg.find('='); eq != std::string::npos) {
            key = arg.substr(2, eq - 2);
            val = arg.substr(eq + 1);
            ++i;
        } else if (is_flag(arg.substr(2))) {
            key = arg.substr(2);
            ++i;
        } else {
            key = arg.substr(2);
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for --" + key);
            }
            val = argv[i + 1];
            i += 2;
        }

        apply_option(config, key, val);
    }
    return config;
}

void load_config_file(Config& config, const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::invalid_argument("Cannot open config file: " + path.string());
    }

    nlohmann::json j = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        throw std::invalid_argument("Config file is not a JSON object: " + path.string());
    }

    static const std::pair<const char*, const char*> keys[] = {
        {"port", "port"},
        {"bind", "bind"},
        {"target", "target"},
        {"root", "root"},
        {"chunk_size", "chunk-size"},
        {"timeout_ms", "timeout"},
        {"connect_timeout_ms", "connect-timeout"},
        {"accept_timeout_ms", "accept-timeout"},
        {"progress_interval_ms", "progress-interval"},
        {"hash", "hash"},
        {"hash_items", "hash-items"},
        {"log_level", "log-level"},
    };

    for (auto it = j.begin(); it != j.end(); ++it) {
        const char* option = nullptr;
        for (const auto& k : keys) {
            if (it.key() == k.first) { option = k.second; break; }
        }
        if (!option) {
            throw std::invalid_argument("Unknown key in " + path.string() + ": " + it.key());
        }

        const auto& v = it.value();
        std::string value;
        if (v.is_string()) value = v.get<std::string>();
        else if (v.is_boolean()) value = v.get<bool>() ? "true" : "false";
        else if (v.is_number_unsigned()) value = std::to_string(v.get<std::uint64_t>());
        else throw std::invalid_argument("Bad value for '" + it.key() + "' in " + path.string());

        apply_option(config, option, value);
    }
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "  --port N                 service port (default 8888)\n"
           "  --bind IP                local interface address\n"
           "  --target IP              receiver address (sender)\n"
           "  --send PATH              file or directory to send (sender)\n"
           "  --root DIR               receive directory (default received_files)\n"
           "  --chunk-size BYTES       streaming chunk size (default 32768)\n"
           "  --timeout MS             idle timeout per connection (default 60000)\n"
           "  --connect-timeout MS     connect timeout (default 10000)\n"
           "  --accept-timeout MS      accept poll interval (default 1000)\n"
           "  --progress-interval MS   progress refresh interval (default 50)\n"
           "  --hash sha256|sha512|blake2b\n"
           "  --hash-items true|false  digest every file of a directory transfer\n"
           "  --log-level LEVEL        trace|debug|info|warn|error|critical|off\n"
           "  --config FILE            JSON file with the same settings\n"
           "  --list-interfaces        print local IPv4 addresses and exit\n"
           "  --version, --help\n";
}

} // namespace lanxfer
