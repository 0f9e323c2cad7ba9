#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <string>

#include "util/constants.hpp"
#include "util/env_config.hpp"
#include "util/log.hpp"

namespace envcfg
{

bool parse_uint(const char *s, unsigned long long lo, unsigned long long hi,
                unsigned long long &out)
{
    // strtoull would skip blanks and wrap negatives
    if (!s || !*s || *s == '-' || *s == '+' || std::isspace(static_cast<unsigned char>(*s)))
        return false;
    errno                = 0;
    char              *p = nullptr;
    unsigned long long v = std::strtoull(s, &p, 0);  // base 0: accepts 0x..
    if (errno == ERANGE || !p || *p != '\0')
        return false;
    if (v < lo || v > hi)
        return false;
    out = v;
    return true;
}

bool is_valid_mac(const std::string &mac)
{
    if (mac.size() != 17)
        return false;
    for (size_t i = 0; i < mac.size(); ++i)
    {
        if ((i % 3) == 2)
        {
            if (mac[i] != ':')
                return false;
        }
        else
        {
            unsigned char c = static_cast<unsigned char>(mac[i]);
            if (!std::isxdigit(c))
                return false;
        }
    }
    return true;
}

std::string normalize_mac(std::string mac)
{
    std::transform(mac.begin(), mac.end(), mac.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return mac;
}

static std::string env_or(const char *key, const std::string &defv)
{
    const char *v = std::getenv(key);
    return (v && *v) ? std::string(v) : defv;
}

// leaves out untouched when unset or invalid
static void env_sentinel(const char *key, std::uint8_t &out)
{
    const char *e = std::getenv(key);
    if (!e)
        return;
    unsigned long long v = 0;
    if (!parse_uint(e, 0, 0xFF, v))
    {
        LOG_WARN("Ignoring invalid %s='%s' (expect 0..255)", key, e);
        return;
    }
    out = static_cast<std::uint8_t>(v);
}

ReceiverConfig load_from_env()
{
    ReceiverConfig cfg;

    std::string which = env_or("BLERX_TRANSPORT", "loopback");
    std::transform(which.begin(), which.end(), which.begin(), ::tolower);
    if (which != "bluez" && which != "loopback")
    {
        LOG_WARN("Ignoring unknown BLERX_TRANSPORT='%s' (expect bluez|loopback)", which.c_str());
        which = "loopback";
    }
    cfg.transport    = which;
    cfg.adapter      = env_or("BLERX_ADAPTER", "hci0");
    cfg.svc_uuid     = env_or("BLERX_SVC_UUID", std::string(constants::SVC_UUID));
    cfg.char_uuid    = env_or("BLERX_CHAR_UUID", std::string(constants::CHAR_UUID));
    cfg.download_dir = constants::download_dir();

    if (const char *p = std::getenv("BLERX_PEER"); p && *p)
    {
        std::string mac = normalize_mac(p);
        if (is_valid_mac(mac))
            cfg.peer_addr = mac;
        else
            LOG_WARN("Ignoring invalid BLERX_PEER='%s'", p);
    }

    if (const char *e = std::getenv("BLERX_MAX_BUFFER"))
    {
        unsigned long long v = 0;
        if (parse_uint(e, 1, std::numeric_limits<std::size_t>::max(), v))
        {
            cfg.frame.max_buffer = static_cast<std::size_t>(v);
            LOG_INFO("Using max_buffer=%zu (from BLERX_MAX_BUFFER)", cfg.frame.max_buffer);
        }
        else
        {
            LOG_WARN("Ignoring invalid BLERX_MAX_BUFFER='%s'", e);
        }
    }

    frame::Config candidate = cfg.frame;
    env_sentinel("BLERX_START_SENTINEL", candidate.start_sentinel);
    env_sentinel("BLERX_END_SENTINEL", candidate.end_sentinel);
    const std::string why = frame::validate(candidate);
    if (why.empty())
    {
        cfg.frame.start_sentinel = candidate.start_sentinel;
        cfg.frame.end_sentinel   = candidate.end_sentinel;
    }
    else
    {
        LOG_WARN("Ignoring sentinel override: %s", why.c_str());
    }

    if (const char *e = std::getenv("BLERX_IDLE_TIMEOUT_MS"))
    {
        unsigned long long v = 0;
        if (parse_uint(e, 0, 24ull * 3600 * 1000, v))
            cfg.idle_timeout_ms = static_cast<std::uint32_t>(v);
        else
            LOG_WARN("Ignoring invalid BLERX_IDLE_TIMEOUT_MS='%s'", e);
    }

    if (const char *e = std::getenv("BLERX_NAME_PREFIX"))
        cfg.frame.name_prefix = e;
    if (const char *e = std::getenv("BLERX_NAME_SUFFIX"))
        cfg.frame.name_suffix = e;
    if (cfg.frame.name_prefix.find('/') != std::string::npos ||
        cfg.frame.name_suffix.find('/') != std::string::npos)
    {
        LOG_WARN("Ignoring file name parts containing '/'");
        cfg.frame.name_prefix = frame::Config{}.name_prefix;
        cfg.frame.name_suffix = frame::Config{}.name_suffix;
    }

    return cfg;
}

}  // namespace envcfg
