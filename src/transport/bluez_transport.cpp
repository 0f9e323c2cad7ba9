/* ======================================================================
 * BlueZ Transport (facade)
 *
 *  start(settings, on_chunk, on_link)
 *    └─ UUID overrides from settings, allocate Impl
 *    └─ start_central(): bus matches + bus loop thread
 *
 *  Bus thread (bluez_transport_central.cpp)
 *    └─ walks LinkPhase: Searching → Connecting → Resolving → Subscribing → Up
 *    └─ Value changes on the notify characteristic ──▶ on_chunk
 *    └─ Ready / Dropped / setup failures ────────────▶ on_link
 *
 *  stop()
 *    └─ running_ = false first: no callback runs after stop() returns
 *    └─ stop_central(): Disconnect, close bus, join loop
 * ====================================================================== */

#include <atomic>
#include <memory>
#include <string>
#include <utility>

// clang-format off
#include "transport/bluez_transport.hpp"
#include "transport/bluez_transport_impl.hpp"
#include "util/log.hpp"
// clang-format on

namespace transport
{

const char *link_phase_name(LinkPhase p)
{
    switch (p)
    {
        case LinkPhase::NoPeer:
            return "no-peer";
        case LinkPhase::Searching:
            return "searching";
        case LinkPhase::Connecting:
            return "connecting";
        case LinkPhase::Resolving:
            return "resolving";
        case LinkPhase::Subscribing:
            return "subscribing";
        case LinkPhase::Up:
            return "up";
        case LinkPhase::Failed:
            return "failed";
    }
    return "?";
}

BluezTransport::BluezTransport(BluezConfig cfg) : cfg_(std::move(cfg)) {}

BluezTransport::~BluezTransport()
{
    stop();
}

std::string BluezTransport::name() const
{
    return "bluez";
}

LinkPhase BluezTransport::phase() const
{
    return impl_ ? impl_->phase.load() : LinkPhase::NoPeer;
}

bool BluezTransport::link_ready() const
{
    return phase() == LinkPhase::Up;
}

void BluezTransport::enter(LinkPhase p)
{
    const LinkPhase was = impl_->phase.exchange(p);
    if (was != p)
        LOG_DEBUG("[BLUEZ][central] %s -> %s", link_phase_name(was), link_phase_name(p));
}

void BluezTransport::notify_link(LinkStatus st, const std::string &detail)
{
    if (!running_.load(std::memory_order_relaxed) || !on_link_)
        return;
    on_link_(st, detail);
}

// ======================================================================
// Function: BluezTransport::start
// - In: settings (UUIDs), chunk and link callbacks
// - Out: true when the bus loop is running
// - Note: non-empty settings UUIDs replace the configured ones
// ======================================================================
bool BluezTransport::start(const Settings &s, OnChunk on_rx, OnLink on_link)
{
    if (running_.load(std::memory_order_relaxed))
        return true;

    if (!s.svc_uuid.empty())
        cfg_.svc_uuid = s.svc_uuid;
    if (!s.char_uuid.empty())
        cfg_.char_uuid = s.char_uuid;
    on_chunk_ = std::move(on_rx);
    on_link_  = std::move(on_link);
    impl_     = std::make_unique<Impl>();

    if (!cfg_.peer_addr)
        LOG_WARN("[BLUEZ] no peer address set (BLERX_PEER); waiting for CONNECT");
    LOG_DEBUG("[BLUEZ][central] start: adapter=%s svc=%s char=%s peer=%s", cfg_.adapter.c_str(),
              cfg_.svc_uuid.c_str(), cfg_.char_uuid.c_str(),
              cfg_.peer_addr ? cfg_.peer_addr->c_str() : "-");

    running_.store(true, std::memory_order_relaxed);
    if (start_central())
        return true;

    running_.store(false, std::memory_order_relaxed);
    stop_central();
    impl_.reset();
    on_chunk_ = nullptr;
    on_link_  = nullptr;
    return false;
}

// ======================================================================
// Function: BluezTransport::stop
// - In: can be called anytime, any number of times
// - Out: link torn down, no further callbacks
// ======================================================================
void BluezTransport::stop()
{
    if (!running_.exchange(false, std::memory_order_relaxed) || !impl_)
        return;

    stop_central();
    impl_.reset();
    on_chunk_ = nullptr;
    on_link_  = nullptr;
    LOG_DEBUG("[BLUEZ] stopped");
}

}  // namespace transport
