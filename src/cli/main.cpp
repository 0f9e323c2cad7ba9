#include <cstdio>
#include <string>
#include <vector>

#include "ctl/command.hpp"
#include "ctl/ipc.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

const char USAGE[] = "Usage: blerxctl [--sock <path>] <command>\n"
                     "\n"
                     "Commands:\n"
                     "  status                      link and transfer state\n"
                     "  abort                       discard the transfer in progress\n"
                     "  connect AA:BB:CC:DD:EE:FF   receive from another peer\n"
                     "  disconnect                  drop the link, clear the peer\n"
                     "  quit                        stop the daemon\n";

int usage_error(const std::string &why)
{
    if (!why.empty())
        std::fprintf(stderr, "error: %s\n", why.c_str());
    std::fputs(USAGE, stderr);
    return exitc::bad_args;
}

// "OK <text>" prints <text>; "ERR <text>" is a refusal
int report_reply(const std::string &reply)
{
    const auto sp   = reply.find(' ');
    const auto head = reply.substr(0, sp);
    const auto body = (sp == std::string::npos) ? std::string() : reply.substr(sp + 1);

    if (head == "ERR")
    {
        std::fprintf(stderr, "error: %s\n", body.empty() ? "rejected by daemon" : body.c_str());
        return exitc::rejected;
    }
    const std::string &shown = (head == "OK") ? body : reply;
    if (!shown.empty())
        std::printf("%s\n", shown.c_str());
    return exitc::ok;
}

}  // namespace

int main(int argc, char **argv)
{
    // errors only; the daemon holds the interesting logs
    blerx::set_log_level(blerx::Level::Error);

    std::string              sock;
    std::vector<std::string> words;
    for (int i = 1; i < argc; ++i)
    {
        const std::string a = argv[i];
        if (a == "-h" || a == "--help")
        {
            std::fputs(USAGE, stdout);
            return exitc::ok;
        }
        if (a != "--sock")
        {
            words.push_back(a);
            continue;
        }
        if (++i == argc)
            return usage_error("--sock needs a path");
        sock = ipc::expand_user(argv[i]);
    }

    std::string why;
    const auto  cmd = ipc::parse_args(words, &why);
    if (!cmd)
        return usage_error(why);

    if (sock.empty())
        sock = ipc::expand_user(constants::ctl_sock_path());

    std::string reply;
    if (!ipc::send_line(sock, ipc::to_line(*cmd) + "\n", &reply))
    {
        std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
        return exitc::no_server;
    }
    return report_reply(reply);
}
