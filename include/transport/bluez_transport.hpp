#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "transport/gatt_resolve.hpp"
#include "transport/itransport.hpp"
#include "util/constants.hpp"

namespace transport
{

struct BluezConfig
{
    std::string                adapter   = "hci0";
    std::string                svc_uuid  = std::string(constants::SVC_UUID);
    std::string                char_uuid = std::string(constants::CHAR_UUID);  // Notify
    std::optional<std::string> peer_addr{};  // the connection handle: only this device is used
};

// Where the central is on the way from "peer configured" to "chunks flowing"
enum class LinkPhase
{
    NoPeer,       // no address; waits for handover_to()
    Searching,    // peer's Device1 not known yet, or waiting to retry Connect
    Connecting,   // Device1.Connect in flight
    Resolving,    // connected, waiting for the GATT service / characteristic
    Subscribing,  // StartNotify pending a retry
    Up,           // notifications on: link_ready()
    Failed        // GATT setup outcome reported; stays until the link drops
};

const char *link_phase_name(LinkPhase p);

// BLE central that subscribes to one notify characteristic and hands
// every Value change to the receiver as a chunk.
class BluezTransport final : public ITransport
{
  public:
    explicit BluezTransport(BluezConfig cfg);
    ~BluezTransport() override;

    bool        start(const Settings &s, OnChunk on_rx, OnLink on_link) override;
    void        stop() override;
    std::string name() const override;
    bool        link_ready() const override;

    const BluezConfig &config() const { return cfg_; }
    LinkPhase          phase() const;

    // Switch to another peer ("" = disconnect and clear the target).
    bool handover_to(const std::string &addr);

    // Bus thread only, from the signal handlers in bluez_helper_central.cpp.
    // The bus lock is held by the caller.
    void on_objects_added(const ObjectTree &tree);
    void on_object_removed(const std::string &path);
    void on_device_changed(const std::string   &path,
                           std::optional<bool>  connected,
                           std::optional<bool>  services_resolved);
    void on_value(const std::string &path, const uint8_t *data, size_t len);
    // ename == nullptr on success
    void on_connect_result(const char *ename, const char *emsg);

  private:
    BluezConfig      cfg_;
    OnChunk          on_chunk_{};
    OnLink           on_link_{};
    std::atomic_bool running_{false};

    struct Impl;
    std::unique_ptr<Impl> impl_;

    void notify_link(LinkStatus st, const std::string &detail);
    void enter(LinkPhase p);
    // Connected -> not connected: forget GATT paths, report Dropped if chunks could flow
    void link_lost(const std::string &detail);
    bool adopt_device(const ObjectTree &tree);

    bool start_central();
    void stop_central();
    void central_pump();
    void central_lookup_peer();
    void central_connect();
    void central_resolve();
    void central_subscribe();
};

}  // namespace transport
