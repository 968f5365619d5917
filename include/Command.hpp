#ifndef COMMAND_HPP
#define COMMAND_HPP

#include <string>
#include <variant>

/**
 * Command - The closed set of requests a client can issue
 *
 * GET  <remote-src> <local-dst>   copy a server file to the client
 * PUT  <local-src>  <remote-dst>  copy a client file to the server
 * LS   client|server              list the client's or server's working directory
 */
struct GetCommand {
    std::string source;        // Server-side path
    std::string destination;   // Client-side path
};

struct PutCommand {
    std::string source;        // Client-side path
    std::string destination;   // Server-side path
};

enum class ListTarget {
    CLIENT,
    SERVER
};

struct ListCommand {
    ListTarget target = ListTarget::SERVER;
};

using Command = std::variant<GetCommand, PutCommand, ListCommand>;

// Builds a visitor out of lambdas for std::visit
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;


/**
 * CommandParser - Converts between command text and Command values
 */
class CommandParser {
public:
    /**
     * Parse one command line
     *
     * Tokens are separated by runs of whitespace. The keyword and the LS
     * target are case-insensitive; paths are taken verbatim.
     *
     * @param text Raw command text
     * @param out Set only on success
     * @param out_error Usage message describing what was wrong, on failure
     * @return true if text is a well-formed command
     */
    static bool parse(const std::string& text, Command& out, std::string& out_error);

    /** Canonical wire text for a command (e.g. "GET a.txt b.txt") */
    static std::string toText(const Command& command);

    /** Keyword of a command ("GET", "PUT" or "LS") */
    static const char* keyword(const Command& command);

    /**
     * Usage line for a keyword, or every usage line if the keyword is unknown
     */
    static std::string usage(const std::string& keyword);

private:
    CommandParser() = delete;
};

#endif // COMMAND_HPP
