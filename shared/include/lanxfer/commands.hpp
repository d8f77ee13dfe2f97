#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace lanxfer {
// Operator commands understood by the receiver while it is listening.
enum class CommandType { STOP, STATUS, SUMMARY, HELP, INVALID };
struct ParsedCommand { CommandType type{CommandType::INVALID}; std::vector<std::string> args; };

CommandType command_from_string(std::string_view);
const char* to_string(CommandType);
ParsedCommand parse_line(const std::string& line);
std::string help_text();
}
