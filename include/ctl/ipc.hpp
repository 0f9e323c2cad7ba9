#pragma once
#include <string>

namespace ipc
{

// Handles one command line; a non-empty return is written back as the reply.
using LineHandler = std::string (*)(const std::string &line);

// Serves one line per connection until a "QUIT" line arrives, then unlinks the socket.
// false on socket errors.
bool start_server(const std::string &sock_path, LineHandler on_line);
// Sends a line; when reply is set, waits for the daemon's answer (may be empty).
// false when the daemon cannot be reached.
bool send_line(const std::string &sock_path, const std::string &line,
               std::string *reply = nullptr);
// "~" and "~/x" against $HOME
std::string expand_user(const std::string &path);

}  // namespace ipc
