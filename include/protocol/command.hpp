#pragma once

#include <string>

namespace protocol {

struct Command {
    std::string verb;     // upper-cased
    std::string argument; // trimmed, empty if absent
};

class CommandParser {
public:
    // Split on the first run of whitespace. Never fails; unknown verbs are
    // reported by the caller.
    static Command parse(const std::string& line);

    // Membership in the command grammar {LS, GET, PUT, EXIT, HELP}.
    static bool validate(const std::string& verb);

    // True for GET and PUT.
    static bool requires_argument(const std::string& verb);
};

} // namespace protocol
