#pragma once
#include <optional>
#include <string>
#include <vector>

namespace ipc
{

enum class Verb
{
    Status,
    Abort,
    Connect,
    Disconnect,
    Quit
};

struct Command
{
    Verb        verb = Verb::Status;
    std::string mac;  // Connect only, normalized AA:BB:CC:DD:EE:FF
};

const char *verb_line(Verb v);

// Daemon side: one control line ("STATUS", "CONNECT AA:BB:CC:DD:EE:FF").
// On nullopt, *why (if set) holds the text for the ERR reply.
std::optional<Command> parse_line(const std::string &line, std::string *why = nullptr);

// CLI side: words after the options ("connect", "aa:bb:cc:dd:ee:ff").
std::optional<Command> parse_args(const std::vector<std::string> &args, std::string *why = nullptr);

// Wire form of a command, without the trailing newline.
std::string to_line(const Command &cmd);

}  // namespace ipc
