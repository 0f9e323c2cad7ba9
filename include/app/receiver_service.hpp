#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "proto/frame.hpp"
#include "storage/file_store.hpp"
#include "transport/itransport.hpp"

namespace app
{

// Point-in-time view for STATUS; derived from emitted events only.
struct Status
{
    bool          link_ready       = false;
    bool          running          = false;
    frame::State  state            = frame::State::Idle;
    std::size_t   buffered         = 0;
    std::uint64_t progress         = 0;  // bytes in the current session
    std::uint64_t bytes_received   = 0;
    std::uint64_t files_saved      = 0;
    std::uint64_t transfers_failed = 0;  // aborts + errors
    std::string   last_saved;
    std::string   last_error;
};

// Called after every reassembler event, outside the service lock.
using Observer = std::function<void(const frame::Event &)>;

class ReceiverService
{
  public:
    ReceiverService(transport::ITransport &t, storage::IFileStore &store, frame::Config cfg,
                    std::uint32_t idle_timeout_ms = 0);
    ~ReceiverService() { stop(); }

    ReceiverService(const ReceiverService &)            = delete;
    ReceiverService &operator=(const ReceiverService &) = delete;

    bool start(const transport::Settings &s = {});
    void stop();

    // Operator abort; true when a session was discarded.
    bool   abort_transfer();
    Status status() const;
    void   set_observer(Observer cb);

  private:
    void on_chunk(const transport::Chunk &c);
    void on_link(transport::LinkStatus st, const std::string &detail);
    // runs inside rx_ calls, mu_ held
    void on_event(frame::Event &&ev);
    void notify(const std::vector<frame::Event> &evs);
    void watchdog_loop();

    transport::ITransport &tx_;
    storage::IFileStore   &store_;
    std::uint32_t          idle_timeout_ms_{0};

    mutable std::mutex                    mu_;
    frame::Reassembler                    rx_;
    bool                                  accepting_{false};
    std::chrono::steady_clock::time_point last_chunk_at_{};
    std::vector<frame::Event>             pending_;
    Status                                stats_{};

    std::mutex obs_mu_;
    Observer   observer_{};

    std::atomic_bool started_{false};
    // idle watchdog
    std::thread      watchdog_thr_;
    std::atomic_bool watchdog_stop_{true};
};

}  // namespace app
