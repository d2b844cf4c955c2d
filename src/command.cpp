#include "protocol/command.hpp"
#include <algorithm>
#include <cctype>

namespace protocol {

namespace {

const char* const kValidCommands[] = {"LS", "GET", "PUT", "EXIT", "HELP"};
const char* const kArgumentCommands[] = {"GET", "PUT"};

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), is_space);
    auto end = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

Command CommandParser::parse(const std::string& line) {
    std::string text = trim(line);
    Command command;

    auto split = std::find_if(text.begin(), text.end(), is_space);
    command.verb.assign(text.begin(), split);
    std::transform(command.verb.begin(), command.verb.end(), command.verb.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    command.argument = trim(std::string(split, text.end()));
    return command;
}

bool CommandParser::validate(const std::string& verb) {
    return std::any_of(std::begin(kValidCommands), std::end(kValidCommands),
                       [&verb](const char* valid) { return verb == valid; });
}

bool CommandParser::requires_argument(const std::string& verb) {
    return std::any_of(std::begin(kArgumentCommands), std::end(kArgumentCommands),
                       [&verb](const char* valid) { return verb == valid; });
}

} // namespace protocol
