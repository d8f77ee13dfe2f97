#include "lanxfer/logging.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace lanxfer {

void init_logging(const std::string& level) {
    const auto lvl = spdlog::level::from_str(level);
    // from_str maps unknown names to off
    if (lvl == spdlog::level::off && level != "off") {
        throw std::invalid_argument("Invalid log level: " + level);
    }
    spdlog::set_level(lvl);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
}

} // namespace lanxfer
