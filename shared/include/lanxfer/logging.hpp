#pragma once

#include <string>

namespace lanxfer {

// Configures the default spdlog logger; level is one of trace, debug, info,
// warn, error, critical, off. Throws std::invalid_argument on anything else.
void init_logging(const std::string& level);

} // namespace lanxfer
