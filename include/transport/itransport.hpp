#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace transport
{

using Chunk   = std::vector<std::uint8_t>;
using OnChunk = std::function<void(const Chunk &)>;

// Link-level outcomes reported to the receiver
enum class LinkStatus
{
    Ready,                   // notifications subscribed, chunks may flow
    Dropped,                 // connection lost; the chunk sequence has ended
    ServiceNotFound,         // peer has no such GATT service
    CharacteristicNotFound,  // service present, notify characteristic missing
    ConnectFailed
};

inline const char *link_status_name(LinkStatus s)
{
    switch (s)
    {
        case LinkStatus::Ready:
            return "ready";
        case LinkStatus::Dropped:
            return "dropped";
        case LinkStatus::ServiceNotFound:
            return "service-not-found";
        case LinkStatus::CharacteristicNotFound:
            return "characteristic-not-found";
        case LinkStatus::ConnectFailed:
            return "connect-failed";
    }
    return "?";
}

using OnLink = std::function<void(LinkStatus, const std::string &detail)>;

// Per-run GATT target; empty fields keep the transport's own defaults
struct Settings
{
    std::string svc_uuid, char_uuid;
};

struct ITransport
{
    virtual bool        start(const Settings &s, OnChunk on_rx, OnLink on_link) = 0;
    virtual void        stop()                                                  = 0;  // idempotent
    virtual std::string name() const { return ""; }
    virtual bool        link_ready() const = 0;
    virtual ~ITransport()                  = default;
};

}  // namespace transport
