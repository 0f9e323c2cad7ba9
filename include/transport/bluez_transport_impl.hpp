// include/transport/bluez_transport_impl.hpp
#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

struct sd_bus;
struct sd_bus_slot;

#include "bluez_transport.hpp"

namespace transport
{
struct BluezTransport::Impl
{
#if BLERX_HAVE_SDBUS
    sd_bus *bus = nullptr;

    // every sd-bus call, callback and the fields below
    std::mutex bus_mu;

    sd_bus_slot *added_slot   = nullptr;  // InterfacesAdded
    sd_bus_slot *removed_slot = nullptr;  // InterfacesRemoved
    sd_bus_slot *props_slot   = nullptr;  // PropertiesChanged (Connected, Value, ...)
    sd_bus_slot *connect_slot = nullptr;  // pending Device1.Connect
#endif
    std::thread loop;
    std::string adapter_path;  // "/org/bluez/hci0"

    std::atomic<LinkPhase> phase{LinkPhase::NoPeer};
    std::string            dev_path;   // peer's Device1 object
    std::string            char_path;  // notify characteristic, set from Resolving on
    bool                   services_resolved = false;

    uint64_t connect_at_ms = 0;  // earliest next Connect (backoff)
    uint64_t lookup_at_ms  = 0;  // earliest next object tree lookup
};

inline constexpr uint32_t LOOKUP_INTERVAL_MS = 2000;
inline constexpr uint32_t CONNECT_BACKOFF_MS = 2000;
inline constexpr uint32_t BUSY_BACKOFF_MS    = 5000;  // adapter busy / no reply
}  // namespace transport
