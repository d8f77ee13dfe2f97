#include "lanxfer/commands.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace lanxfer
{
    static std::string upper(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    CommandType command_from_string(std::string_view sv)
    {
        const std::string s = upper(std::string(sv));
        if (s == "STOP" || s == "Q" || s == "QUIT")
            return CommandType::STOP;
        if (s == "STATUS")
            return CommandType::STATUS;
        if (s == "SUMMARY")
            return CommandType::SUMMARY;
        if (s == "HELP" || s == "?")
            return CommandType::HELP;
        return CommandType::INVALID;
    }

    const char *to_string(CommandType t)
    {
        switch (t)
        {
        case CommandType::STOP:
            return "STOP";
        case CommandType::STATUS:
            return "STATUS";
        case CommandType::SUMMARY:
            return "SUMMARY";
        case CommandType::HELP:
            return "HELP";
        default:
            return "INVALID";
        }
    }

    // Operator input is whitespace separated; arguments are matched case-insensitively.
    ParsedCommand parse_line(const std::string &line)
    {
        ParsedCommand pc;
        std::istringstream in(line);
        std::string word;
        if (!(in >> word))
            return pc;
        pc.type = command_from_string(word);
        while (in >> word)
            pc.args.push_back(upper(word));

        const bool summary_clear = pc.type == CommandType::SUMMARY && pc.args.size() == 1 && pc.args[0] == "CLEAR";
        if (!pc.args.empty() && !summary_clear)
            pc.type = CommandType::INVALID;
        return pc;
    }

    std::string help_text()
    {
        return "Commands:\n  STOP | Q         stop listening\n  STATUS           listening state and active transfers\n"
               "  SUMMARY          integrity failures recorded so far\n  SUMMARY CLEAR    show them, then forget them\n  HELP\n";
    }
}
