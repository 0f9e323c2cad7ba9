#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <system_error>
#include <unistd.h>

#include "ctl/ipc.hpp"
#include "util/log.hpp"

namespace ipc
{
namespace fs = std::filesystem;

namespace
{
// Closes on scope exit, keeps errno intact for the caller's log line
class ScopedFd
{
  public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd()
    {
        if (fd_ >= 0)
        {
            const int saved = errno;
            ::close(fd_);
            errno = saved;
        }
    }
    ScopedFd(const ScopedFd &)            = delete;
    ScopedFd &operator=(const ScopedFd &) = delete;

    int  get() const { return fd_; }
    bool ok() const { return fd_ >= 0; }

  private:
    int fd_;
};

struct UnixAddr
{
    sockaddr_un sa{};
    socklen_t   len = 0;
};

// The control socket lives in a private (0700) directory
bool prepare_socket_dir(const std::string &sock_path)
{
    const fs::path dir = fs::path(sock_path).parent_path();
    if (dir.empty())
        return true;

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
    {
        LOG_ERROR("cannot create %s: %s", dir.string().c_str(), ec.message().c_str());
        return false;
    }
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec)
        LOG_WARN("cannot restrict %s to 0700: %s", dir.string().c_str(), ec.message().c_str());
    return true;
}

bool to_addr(const std::string &sock_path, UnixAddr &out)
{
    if (sock_path.empty() || sock_path.size() >= sizeof(out.sa.sun_path))
    {
        errno = sock_path.empty() ? EINVAL : ENAMETOOLONG;
        LOG_ERROR("unusable socket path '%s': %s", sock_path.c_str(), std::strerror(errno));
        return false;
    }
    std::memset(&out.sa, 0, sizeof(out.sa));
    out.sa.sun_family = AF_UNIX;
    std::memcpy(out.sa.sun_path, sock_path.c_str(), sock_path.size() + 1);
    out.len = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + sock_path.size() + 1);
    return true;
}

int open_stream()
{
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd == -1)
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
    return fd;
}

bool send_all(int fd, const std::string &data)
{
    std::size_t off = 0;
    while (off < data.size())
    {
        const ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n >= 0)
        {
            off += static_cast<std::size_t>(n);
        }
        else if (errno != EINTR)
        {
            LOG_ERROR("send() failed: %s", std::strerror(errno));
            return false;
        }
    }
    return true;
}

// Appends to out until EOF, or until a newline when first_line_only is set.
bool recv_text(int fd, std::string &out, bool first_line_only)
{
    char buf[256];
    for (;;)
    {
        const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n == 0)
            return true;
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("recv() failed: %s", std::strerror(errno));
            return false;
        }
        out.append(buf, static_cast<std::size_t>(n));
        if (first_line_only && out.find('\n') != std::string::npos)
            return true;
    }
}

void strip_eol(std::string &s)
{
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r'))
        s.pop_back();
}

// One request/reply exchange. Returns the request line ("" if unreadable).
std::string serve_client(int client, LineHandler on_line)
{
    std::string text;
    if (!recv_text(client, text, true))
        return {};

    std::string line = text.substr(0, text.find('\n'));
    strip_eol(line);

    std::string reply = on_line ? on_line(line) : std::string();
    if (!reply.empty())
    {
        if (reply.back() != '\n')
            reply += '\n';
        if (!send_all(client, reply))
            LOG_WARN("reply to '%s' not delivered", line.c_str());
    }
    return line;
}
}  // namespace

// ======================================================================
// Function: start_server
// - In: socket path, handler for each request line
// - Out: true after a QUIT line was served; false on socket errors
// - Note: the socket file is removed on every exit after bind()
// ======================================================================
bool start_server(const std::string &sock_path, LineHandler on_line)
{
    UnixAddr addr;
    if (!to_addr(sock_path, addr) || !prepare_socket_dir(sock_path))
        return false;

    // leftover from a daemon that did not exit cleanly
    if (::unlink(sock_path.c_str()) == -1 && errno != ENOENT)
        LOG_WARN("cannot remove stale %s: %s", sock_path.c_str(), std::strerror(errno));

    ScopedFd listener(open_stream());
    if (!listener.ok())
        return false;
    if (::bind(listener.get(), reinterpret_cast<const sockaddr *>(&addr.sa), addr.len) == -1)
    {
        LOG_ERROR("bind(%s) failed: %s", sock_path.c_str(), std::strerror(errno));
        return false;
    }

    bool quit = false;
    if (::listen(listener.get(), 4) == -1)
    {
        LOG_ERROR("listen() failed: %s", std::strerror(errno));
    }
    else
    {
        LOG_SYSTEM("Listening on %s", sock_path.c_str());
        while (!quit)
        {
            const int c = ::accept4(listener.get(), nullptr, nullptr, SOCK_CLOEXEC);
            if (c == -1)
            {
                if (errno == EINTR)
                    continue;
                LOG_ERROR("accept() failed: %s", std::strerror(errno));
                break;
            }
            ScopedFd client(c);
            quit = (serve_client(client.get(), on_line) == "QUIT");
        }
    }

    if (::unlink(sock_path.c_str()) == -1 && errno != ENOENT)
        LOG_WARN("cannot remove %s: %s", sock_path.c_str(), std::strerror(errno));
    return quit;
}

bool send_line(const std::string &sock_path, const std::string &line, std::string *reply)
{
    if (line.empty())
    {
        errno = EINVAL;
        LOG_ERROR("refusing to send an empty line");
        return false;
    }
    UnixAddr addr;
    if (!to_addr(sock_path, addr))
        return false;

    ScopedFd fd(open_stream());
    if (!fd.ok())
        return false;
    if (::connect(fd.get(), reinterpret_cast<const sockaddr *>(&addr.sa), addr.len) == -1)
    {
        LOG_ERROR("connect(%s) failed: %s", sock_path.c_str(), std::strerror(errno));
        return false;
    }

    LOG_DEBUG("Sending line: %s", line.c_str());
    if (!send_all(fd.get(), line))
        return false;
    if (!reply)
        return true;

    // the daemon answers once and closes
    reply->clear();
    if (::shutdown(fd.get(), SHUT_WR) == -1)
        LOG_DEBUG("shutdown(SHUT_WR): %s", std::strerror(errno));
    if (!recv_text(fd.get(), *reply, false))
        return false;
    strip_eol(*reply);
    return true;
}

std::string expand_user(const std::string &p)
{
    // "~" and "~/..." only; "~user" is left alone
    const bool tilde = !p.empty() && p[0] == '~' && (p.size() == 1 || p[1] == '/');
    const char *home = tilde ? std::getenv("HOME") : nullptr;
    if (!home || !*home)
        return p;
    return std::string(home) + p.substr(1);
}

}  // namespace ipc
