/* ======================================================================
 * BlueZ Central — receive path
 *
 *  Phase          Pump / signal                         BlueZ
 *  -----          -------------                         -----
 *  Searching      lookup_peer (every 2s) ─────────────▶ ObjectManager.GetManagedObjects
 *                 or InterfacesAdded(Device1 = peer)
 *                 connect ────────────────────────────▶ Device1.Connect (async)
 *  Connecting     ◀── connect reply / Connected=true
 *  Resolving      resolve ────────────────────────────▶ GetManagedObjects → resolve_gatt
 *                   Ready                     → Subscribing
 *                   missing svc/char once ServicesResolved → Failed (reported)
 *  Subscribing    subscribe ──────────────────────────▶ GattCharacteristic1.StartNotify
 *  Up             ◀── PropertiesChanged(Value) → on_chunk
 *
 *  Connected=false / InterfacesRemoved → back to Searching, Dropped reported
 *  when the link had come up. Discovery is left to the system: the peer
 *  must already be known to BlueZ (paired or seen by a scan).
 *
 *  The bus thread holds impl_->bus_mu while processing signals and while
 *  pumping; handover_to() and stop() take it from other threads.
 * ====================================================================== */

#include <cstring>
#include <mutex>
#include <string>
#include <thread>

// clang-format off
#include "transport/bluez_transport.hpp"
#include "transport/bluez_transport_impl.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "transport/bluez_helper_central.hpp"
#include "util/log.hpp"
// clang-format on

namespace transport
{

#if !BLERX_HAVE_SDBUS

bool BluezTransport::start_central()
{
    LOG_ERROR("[BLUEZ][central] sd-bus not available (BLERX_HAVE_SDBUS=0)");
    return false;
}

void BluezTransport::stop_central() {}

bool BluezTransport::handover_to(const std::string & /*addr*/)
{
    return false;
}

#else

namespace
{
bool connected_phase(LinkPhase p)
{
    return p == LinkPhase::Resolving || p == LinkPhase::Subscribing || p == LinkPhase::Up;
}

// Best-effort Device1.Disconnect; bus_mu held
void disconnect_locked(sd_bus *bus, const std::string &dev_path)
{
    if (!bus || dev_path.empty())
        return;
    sd_bus_error    err = SD_BUS_ERROR_NULL;
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", dev_path.c_str(), "org.bluez.Device1",
                               "Disconnect", &err, &rep, "");
    if (r < 0)
        LOG_DEBUG("[BLUEZ][central] Disconnect(%s): %s", dev_path.c_str(),
                  err.message ? err.message : strerror(-r));
    if (rep)
        sd_bus_message_unref(rep);
    sd_bus_error_free(&err);
}

// StartNotify errors that go away on their own
bool notify_error_transient(const char *ename, const char *emsg)
{
    return std::strstr(emsg, "ATT error: 0x0e") != nullptr ||  // CCCD write raced the peer
           std::strcmp(ename, "org.freedesktop.DBus.Error.NoReply") == 0 ||
           std::strcmp(ename, "org.bluez.Error.InProgress") == 0;
}

bool connect_error_busy(const char *ename, const char *emsg)
{
    return std::strcmp(ename, "org.freedesktop.DBus.Error.NoReply") == 0 ||
           std::strcmp(ename, "org.bluez.Error.InProgress") == 0 ||
           (std::strcmp(ename, "org.bluez.Error.Failed") == 0 &&
            std::strstr(emsg, "already in progress") != nullptr);
}
}  // namespace

// -------- signal side (bus thread, bus_mu held) --------

bool BluezTransport::adopt_device(const ObjectTree &tree)
{
    if (!cfg_.peer_addr || !impl_->dev_path.empty())
        return false;
    const DeviceObject *d = find_peer_device(tree.devices, cfg_.adapter, *cfg_.peer_addr);
    if (!d)
        return false;

    impl_->dev_path          = d->path;
    impl_->services_resolved = d->services_resolved;
    LOG_SYSTEM("[BLUEZ][central] found %s addr=%s%s", d->path.c_str(), cfg_.peer_addr->c_str(),
               d->connected ? " (already connected)" : "");
    if (d->connected)
        enter(LinkPhase::Resolving);
    return true;
}

void BluezTransport::on_objects_added(const ObjectTree &tree)
{
    if (impl_->phase.load() == LinkPhase::Searching)
        (void)adopt_device(tree);
}

void BluezTransport::on_object_removed(const std::string &path)
{
    if (impl_->dev_path.empty() || path != impl_->dev_path)
        return;
    LOG_SYSTEM("[BLUEZ][central] InterfacesRemoved -> cleared device %s", path.c_str());
    link_lost("device removed");
    impl_->dev_path.clear();
}

void BluezTransport::on_device_changed(const std::string  &path,
                                       std::optional<bool> connected,
                                       std::optional<bool> services_resolved)
{
    if (impl_->dev_path.empty() || path != impl_->dev_path)
        return;

    if (services_resolved)
    {
        impl_->services_resolved = *services_resolved;
        LOG_INFO("[BLUEZ][central] ServicesResolved=%s on %s", *services_resolved ? "true" : "false",
                 path.c_str());
    }
    if (!connected)
        return;

    const LinkPhase p = impl_->phase.load();
    if (*connected && (p == LinkPhase::Searching || p == LinkPhase::Connecting))
    {
        LOG_SYSTEM("[BLUEZ][central] Connected property became true (%s)", path.c_str());
        enter(LinkPhase::Resolving);
    }
    else if (!*connected && p != LinkPhase::Searching && p != LinkPhase::NoPeer)
    {
        LOG_SYSTEM("[BLUEZ][central] Disconnected (%s)", path.c_str());
        link_lost("peer disconnected");
    }
}

void BluezTransport::on_value(const std::string &path, const uint8_t *data, size_t len)
{
    // one notification == one chunk, handed up unchanged
    if (!data || len == 0 || impl_->phase.load() != LinkPhase::Up || path != impl_->char_path)
        return;
    if (!running_.load(std::memory_order_relaxed) || !on_chunk_)
        return;
    LOG_DEBUG("[BLUEZ][central] notify len=%zu", len);
    on_chunk_(Chunk(data, data + len));
}

void BluezTransport::on_connect_result(const char *ename, const char *emsg)
{
    // handover_to() or a Connected signal got there first
    if (impl_->phase.load() != LinkPhase::Connecting)
        return;

    if (!ename || std::strcmp(ename, "org.bluez.Error.AlreadyConnected") == 0)
    {
        LOG_SYSTEM("[BLUEZ][central] Device connected: %s", impl_->dev_path.c_str());
        enter(LinkPhase::Resolving);
        return;
    }

    const bool     busy    = connect_error_busy(ename, emsg);
    const uint32_t backoff = busy ? BUSY_BACKOFF_MS : CONNECT_BACKOFF_MS;
    if (busy)
        LOG_WARN("[BLUEZ][central] Connect busy, retry in %ums: %s: %s", backoff, ename, emsg);
    else
        LOG_ERROR("[BLUEZ][central] Connect failed, retry in %ums: %s: %s", backoff, ename, emsg);

    // the device object is gone: look it up again
    if (std::strcmp(ename, "org.freedesktop.DBus.Error.UnknownObject") == 0)
        impl_->dev_path.clear();
    impl_->connect_at_ms = steady_ms() + backoff;
    enter(LinkPhase::Searching);
    notify_link(LinkStatus::ConnectFailed, std::string(ename) + ": " + emsg);
}

void BluezTransport::link_lost(const std::string &detail)
{
    const LinkPhase was = impl_->phase.load();
    impl_->char_path.clear();
    impl_->services_resolved = false;
    impl_->connect_at_ms     = steady_ms() + CONNECT_BACKOFF_MS;
    enter(cfg_.peer_addr ? LinkPhase::Searching : LinkPhase::NoPeer);
    if (connected_phase(was))
        notify_link(LinkStatus::Dropped, detail);
}

// -------- pump side (bus thread, bus_mu held) --------

// ======================================================================
// Function: BluezTransport::central_pump
// - In: called by the bus loop after each wait, bus_mu held
// - Out: advances the phase by at most one bus round trip per step
// ======================================================================
void BluezTransport::central_pump()
{
    switch (impl_->phase.load())
    {
        case LinkPhase::Searching:
            if (impl_->dev_path.empty())
                central_lookup_peer();
            if (!impl_->dev_path.empty() && impl_->phase.load() == LinkPhase::Searching &&
                steady_ms() >= impl_->connect_at_ms)
                central_connect();
            break;
        case LinkPhase::Resolving:
            central_resolve();
            break;
        case LinkPhase::Subscribing:
            central_subscribe();
            break;
        case LinkPhase::NoPeer:
        case LinkPhase::Connecting:
        case LinkPhase::Up:
        case LinkPhase::Failed:
            break;
    }
}

void BluezTransport::central_lookup_peer()
{
    const uint64_t now = steady_ms();
    if (now < impl_->lookup_at_ms)
        return;
    impl_->lookup_at_ms = now + LOOKUP_INTERVAL_MS;

    ObjectTree tree;
    if (read_managed_objects(impl_->bus, tree) < 0)
        return;
    if (!adopt_device(tree))
        LOG_DEBUG("[BLUEZ][central] %s not known to %s yet", cfg_.peer_addr->c_str(),
                  cfg_.adapter.c_str());
}

void BluezTransport::central_connect()
{
    unref_slot(impl_->connect_slot);
    int r = sd_bus_call_method_async(impl_->bus, &impl_->connect_slot, "org.bluez",
                                     impl_->dev_path.c_str(), "org.bluez.Device1", "Connect",
                                     bluez_on_connect_reply, this, "");
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ][central] submit Connect() failed: %s", strerror(-r));
        impl_->connect_at_ms = steady_ms() + CONNECT_BACKOFF_MS;
        return;
    }
    LOG_DEBUG("[BLUEZ][central] Connect(%s) submitted", impl_->dev_path.c_str());
    enter(LinkPhase::Connecting);
}

void BluezTransport::central_resolve()
{
    // until ServicesResolved the tree may still be filling in: poll slowly
    const uint64_t now = steady_ms();
    if (!impl_->services_resolved && now < impl_->lookup_at_ms)
        return;
    impl_->lookup_at_ms = now + LOOKUP_INTERVAL_MS;

    ObjectTree tree;
    if (read_managed_objects(impl_->bus, tree) < 0)
        return;
    for (const auto &d : tree.devices)
    {
        // in case the ServicesResolved signal went by before we looked
        if (d.path == impl_->dev_path && d.services_resolved)
            impl_->services_resolved = true;
    }

    const GattSetup setup = resolve_gatt(tree.gatt, impl_->dev_path, cfg_.svc_uuid, cfg_.char_uuid);
    if (!setup.ok())
    {
        if (!impl_->services_resolved)
            return;
        LOG_SYSTEM("[BLUEZ][central] setup failed: %s", setup.detail.c_str());
        enter(LinkPhase::Failed);
        notify_link(setup.status, setup.detail);
        return;
    }

    impl_->char_path = setup.char_path;
    LOG_INFO("[BLUEZ][central] GATT resolved: svc=%s char=%s", setup.svc_path.c_str(),
             setup.char_path.c_str());
    enter(LinkPhase::Subscribing);
    central_subscribe();
}

void BluezTransport::central_subscribe()
{
    sd_bus_error    err = SD_BUS_ERROR_NULL;
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(impl_->bus, "org.bluez", impl_->char_path.c_str(),
                               "org.bluez.GattCharacteristic1", "StartNotify", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        const char *ename = err.name ? err.name : "";
        const char *emsg  = err.message ? err.message : strerror(-r);
        // retried on the next pump either way
        if (notify_error_transient(ename, emsg))
            LOG_INFO("[BLUEZ][central] StartNotify not ready yet: %s", emsg);
        else
            LOG_WARN("[BLUEZ][central] StartNotify failed: %s", emsg);
        sd_bus_error_free(&err);
        return;
    }
    sd_bus_error_free(&err);

    LOG_SYSTEM("[BLUEZ][central] Notifications enabled; ready (%s)", impl_->char_path.c_str());
    enter(LinkPhase::Up);
    notify_link(LinkStatus::Ready, impl_->char_path);
}

// -------- lifecycle (app thread) --------

// ======================================================================
// Function: BluezTransport::start_central
// - In: fresh Impl, running_ already set
// - Out: signal matches installed and bus loop thread running
// ======================================================================
bool BluezTransport::start_central()
{
    int r = sd_bus_open_system(&impl_->bus);
    if (r < 0 || !impl_->bus)
    {
        LOG_ERROR("[BLUEZ][central] failed to connect system bus: %s", strerror(-r));
        return false;
    }
    impl_->adapter_path = "/org/bluez/" + cfg_.adapter;

    struct Match
    {
        sd_bus_slot          **slot;
        const char            *path;
        const char            *iface;
        const char            *member;
        sd_bus_message_handler_t cb;
    };
    const Match matches[] = {
        {&impl_->added_slot, "/", "org.freedesktop.DBus.ObjectManager", "InterfacesAdded",
         bluez_on_iface_added},
        {&impl_->removed_slot, "/", "org.freedesktop.DBus.ObjectManager", "InterfacesRemoved",
         bluez_on_iface_removed},
        {&impl_->props_slot, nullptr, "org.freedesktop.DBus.Properties", "PropertiesChanged",
         bluez_on_props_changed},
    };
    for (const auto &m : matches)
    {
        r = sd_bus_match_signal(impl_->bus, m.slot, "org.bluez", m.path, m.iface, m.member, m.cb,
                                this);
        if (r < 0)
        {
            LOG_ERROR("[BLUEZ][central] subscribe to %s failed: %s", m.member, strerror(-r));
            return false;
        }
    }

    enter(cfg_.peer_addr ? LinkPhase::Searching : LinkPhase::NoPeer);
    LOG_INFO("[BLUEZ][central] watching %s for svc=%s char=%s", impl_->adapter_path.c_str(),
             cfg_.svc_uuid.c_str(), cfg_.char_uuid.c_str());

    impl_->loop = std::thread([this] {
        while (running_.load(std::memory_order_relaxed))
        {
            {
                std::lock_guard<std::mutex> lk(impl_->bus_mu);
                while (sd_bus_process(impl_->bus, nullptr) > 0)
                {
                }
            }
            // unlocked: IPC commands must not stall behind the wait
            (void)sd_bus_wait(impl_->bus, 100000);  // 100ms
            std::lock_guard<std::mutex> lk(impl_->bus_mu);
            if (running_.load(std::memory_order_relaxed))
                central_pump();
        }
    });
    return true;
}

// ======================================================================
// Function: BluezTransport::stop_central
// - In: running_ already cleared; Impl may be half set up by a failed start
// - Out: peer disconnected, matches released, loop joined, bus closed
// ======================================================================
void BluezTransport::stop_central()
{
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        disconnect_locked(impl_->bus, impl_->dev_path);
        // wakes the loop out of sd_bus_wait()
        if (impl_->bus)
            sd_bus_close(impl_->bus);
    }
    // outside bus_mu: the loop takes it every round
    if (impl_->loop.joinable())
        impl_->loop.join();

    unref_slot(impl_->added_slot);
    unref_slot(impl_->removed_slot);
    unref_slot(impl_->props_slot);
    unref_slot(impl_->connect_slot);
    if (impl_->bus)
    {
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
    }
    impl_->phase.store(LinkPhase::NoPeer);
}

// ======================================================================
// Function: BluezTransport::handover_to
// - In: addr in AA:BB:CC:DD:EE:FF format, or "" to just disconnect
// - Out: current link dropped (reported as Dropped), new target set
// - Note: the pump finds and connects the new peer
// ======================================================================
bool BluezTransport::handover_to(const std::string &addr)
{
    if (!impl_ || !impl_->bus)
        return false;

    LinkPhase was;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        unref_slot(impl_->connect_slot);  // drops a pending Connect reply
        was = impl_->phase.load();
        disconnect_locked(impl_->bus, impl_->dev_path);

        impl_->dev_path.clear();
        impl_->char_path.clear();
        impl_->services_resolved = false;
        impl_->connect_at_ms     = 0;
        impl_->lookup_at_ms      = 0;
        if (addr.empty())
            cfg_.peer_addr.reset();
        else
            cfg_.peer_addr = addr;
        enter(addr.empty() ? LinkPhase::NoPeer : LinkPhase::Searching);
    }

    if (connected_phase(was))
        notify_link(LinkStatus::Dropped, "disconnect requested");
    LOG_SYSTEM("[BLUEZ][handover] target=%s", addr.empty() ? "(none)" : addr.c_str());
    return true;
}

#endif  // BLERX_HAVE_SDBUS

}  // namespace transport
