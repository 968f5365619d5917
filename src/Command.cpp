#include "Command.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

#include <fmt/format.h>

namespace {

    std::string toUpper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c){ return std::toupper(c); });
        return s;
    }

    std::vector<std::string> splitTokens(const std::string& text) {
        std::istringstream iss(text);
        std::vector<std::string> tokens;
        std::string token;
        while (iss >> token) {
            tokens.push_back(token);
        }
        return tokens;
    }

    const char* const GET_USAGE = "Usage: GET remote-path local-path";
    const char* const PUT_USAGE = "Usage: PUT local-path remote-path";
    const char* const LS_USAGE  = "Usage: LS client|server";

} // namespace


bool CommandParser::parse(const std::string& text, Command& out, std::string& out_error) {
    std::vector<std::string> args = splitTokens(text);
    if (args.empty()) {
        out_error = "Empty command.\n" + usage("");
        return false;
    }

    std::string header = toUpper(args[0]);

    if (header == "GET" || header == "PUT") {
        if (args.size() != 3) {
            out_error = usage(header);
            return false;
        }
        if (header == "GET") {
            out = GetCommand{args[1], args[2]};
        } else {
            out = PutCommand{args[1], args[2]};
        }
        return true;
    }

    if (header == "LS") {
        if (args.size() != 2) {
            out_error = usage(header);
            return false;
        }
        std::string target = toUpper(args[1]);
        if (target == "CLIENT") {
            out = ListCommand{ListTarget::CLIENT};
        } else if (target == "SERVER") {
            out = ListCommand{ListTarget::SERVER};
        } else {
            out_error = usage(header);
            return false;
        }
        return true;
    }

    out_error = fmt::format("Unknown command '{}'.\n{}", args[0], usage(""));
    return false;
}


std::string CommandParser::toText(const Command& command) {
    return std::visit(overloaded{
        [](const GetCommand& c) { return fmt::format("GET {} {}", c.source, c.destination); },
        [](const PutCommand& c) { return fmt::format("PUT {} {}", c.source, c.destination); },
        [](const ListCommand& c) {
            return std::string(c.target == ListTarget::CLIENT ? "LS client" : "LS server");
        },
    }, command);
}


const char* CommandParser::keyword(const Command& command) {
    return std::visit(overloaded{
        [](const GetCommand&) { return "GET"; },
        [](const PutCommand&) { return "PUT"; },
        [](const ListCommand&) { return "LS"; },
    }, command);
}


std::string CommandParser::usage(const std::string& keyword) {
    std::string header = toUpper(keyword);
    if (header == "GET") return GET_USAGE;
    if (header == "PUT") return PUT_USAGE;
    if (header == "LS")  return LS_USAGE;
    return fmt::format("{}\n{}\n{}", GET_USAGE, PUT_USAGE, LS_USAGE);
}
