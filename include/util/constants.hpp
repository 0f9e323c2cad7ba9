#pragma once
#include <cstddef>
#include <cstdlib>
#include <string>
#include <string_view>

namespace constants
{
// HM-10 style UART service; the peer notifies file data on the characteristic
inline constexpr std::string_view SVC_UUID  = "0000ffe0-0000-1000-8000-00805f9b34fb";
inline constexpr std::string_view CHAR_UUID = "0000ffe1-0000-1000-8000-00805f9b34fb";  // Notify

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("BLERX_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    const char *home      = std::getenv("HOME");
    std::string base = home && *home ? std::string(home) : "/tmp";
    return base + "/.cache/blerx/ctl.sock";
}

// Where completed files land unless BLERX_DOWNLOAD_DIR says otherwise
[[maybe_unused]] static std::string download_dir()
{
    if (const char *p = std::getenv("BLERX_DOWNLOAD_DIR"); p && *p)
        return std::string(p);
    if (const char *x = std::getenv("XDG_DOWNLOAD_DIR"); x && *x)
        return std::string(x);
    const char *home = std::getenv("HOME");
    std::string base = home && *home ? std::string(home) : "/tmp";
    return base + "/Downloads";
}

}  // namespace constants
