#include <optional>
#include <string>
#include <vector>

#include "ctl/command.hpp"
#include "util/env_config.hpp"

namespace ipc
{

namespace
{
struct VerbEntry
{
    Verb        verb;
    const char *line;  // on the socket
    const char *word;  // on the blerxctl command line
    bool        takes_mac;
};

constexpr VerbEntry VERBS[] = {
    {Verb::Status, "STATUS", "status", false},
    {Verb::Abort, "ABORT", "abort", false},
    {Verb::Connect, "CONNECT", "connect", true},
    {Verb::Disconnect, "DISCONNECT", "disconnect", false},
    {Verb::Quit, "QUIT", "quit", false},
};

const VerbEntry *find_verb(const std::string &name, bool by_word)
{
    for (const auto &v : VERBS)
    {
        if (name == (by_word ? v.word : v.line))
            return &v;
    }
    return nullptr;
}

void set_why(std::string *why, const std::string &text)
{
    if (why)
        *why = text;
}

// Shared tail of both parsers: the verb is known, check its argument.
std::optional<Command> finish(const VerbEntry &v, const std::string *arg, std::string *why)
{
    Command cmd;
    cmd.verb = v.verb;
    if (!v.takes_mac)
    {
        if (arg)
        {
            set_why(why, std::string(v.word) + " takes no argument");
            return std::nullopt;
        }
        return cmd;
    }
    if (!arg || arg->empty())
    {
        set_why(why, "missing MAC address");
        return std::nullopt;
    }
    cmd.mac = envcfg::normalize_mac(*arg);
    if (!envcfg::is_valid_mac(cmd.mac))
    {
        set_why(why, "invalid MAC address: " + *arg);
        return std::nullopt;
    }
    return cmd;
}
}  // namespace

const char *verb_line(Verb v)
{
    for (const auto &e : VERBS)
    {
        if (e.verb == v)
            return e.line;
    }
    return "?";
}

std::optional<Command> parse_line(const std::string &line, std::string *why)
{
    // VERB or "VERB <arg>", exactly one space
    const auto        sp   = line.find(' ');
    const std::string verb = line.substr(0, sp);
    const VerbEntry  *v    = find_verb(verb, false);
    if (!v)
    {
        set_why(why, "unknown command");
        return std::nullopt;
    }
    if (sp == std::string::npos)
        return finish(*v, nullptr, why);

    const std::string arg = line.substr(sp + 1);
    return finish(*v, &arg, why);
}

std::optional<Command> parse_args(const std::vector<std::string> &args, std::string *why)
{
    if (args.empty())
    {
        set_why(why, "missing command");
        return std::nullopt;
    }
    const VerbEntry *v = find_verb(args[0], true);
    if (!v)
    {
        set_why(why, "unknown command: " + args[0]);
        return std::nullopt;
    }
    if (args.size() > 2)
    {
        set_why(why, "too many arguments for " + args[0]);
        return std::nullopt;
    }
    return finish(*v, args.size() == 2 ? &args[1] : nullptr, why);
}

std::string to_line(const Command &cmd)
{
    std::string out = verb_line(cmd.verb);
    if (cmd.verb == Verb::Connect)
        out += " " + cmd.mac;
    return out;
}

}  // namespace ipc
