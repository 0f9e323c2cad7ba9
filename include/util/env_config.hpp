#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "proto/frame.hpp"

namespace envcfg
{

struct ReceiverConfig
{
    frame::Config              frame{};
    std::string                transport = "loopback";  // "bluez" | "loopback"
    std::string                adapter   = "hci0";
    std::optional<std::string> peer_addr{};
    std::string                svc_uuid;
    std::string                char_uuid;
    std::string                download_dir;
    std::uint32_t              idle_timeout_ms = 0;  // 0 = no watchdog
};

// Reads BLERX_* variables; invalid values are logged and replaced by defaults.
ReceiverConfig load_from_env();

// Decimal or 0x-prefixed hex, whole string, within [lo, hi].
bool parse_uint(const char *s, unsigned long long lo, unsigned long long hi,
                unsigned long long &out);

bool        is_valid_mac(const std::string &mac);
std::string normalize_mac(std::string mac);

}  // namespace envcfg
