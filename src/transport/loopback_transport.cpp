#include <string>
#include <utility>

#include "transport/loopback_transport.hpp"
#include "util/log.hpp"

namespace transport
{
// LoopbackTransport: a fake link to drive the receiver (daemon -> reassembler -> store) without BLE.
bool LoopbackTransport::start(const Settings & /*s*/, OnChunk on_rx, OnLink on_link)
{
    on_rx_   = std::move(on_rx);
    on_link_ = std::move(on_link);
    started_ = true;
    if (on_link_)
        on_link_(LinkStatus::Ready, "loopback");
    return true;
}

bool LoopbackTransport::deliver(const Chunk &chunk)
{
    if (!started_ || !on_rx_)
        return false;
    on_rx_(chunk);
    return true;
}

void LoopbackTransport::drop_link(const std::string &detail)
{
    if (!started_.exchange(false))
        return;
    LOG_DEBUG("[LOOPBACK] %s", detail.c_str());
    if (on_link_)
        on_link_(LinkStatus::Dropped, detail);
    on_rx_   = nullptr;
    on_link_ = nullptr;
}

void LoopbackTransport::stop()
{
    started_ = false;
    on_rx_   = nullptr;
    on_link_ = nullptr;
}

bool LoopbackTransport::link_ready() const
{
    return started_;
}

}  // namespace transport
