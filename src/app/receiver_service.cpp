#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "app/receiver_service.hpp"
#include "proto/frame.hpp"
#include "storage/file_store.hpp"
#include "transport/itransport.hpp"
#include "util/log.hpp"

namespace app
{

ReceiverService::ReceiverService(transport::ITransport &t, storage::IFileStore &store,
                                 frame::Config cfg, std::uint32_t idle_timeout_ms)
    : tx_(t),
      store_(store),
      idle_timeout_ms_(idle_timeout_ms),
      rx_(std::move(cfg), [this](frame::Event &&ev) { this->on_event(std::move(ev)); })
{
}

// ======================================================================
// Function: ReceiverService::start
// - In: transport settings (GATT UUIDs)
// - Out: true when the transport accepted the subscription
// - Note: starts the idle watchdog when idle_timeout_ms > 0
// ======================================================================
bool ReceiverService::start(const transport::Settings &s)
{
    // in case a previous run is still attached
    stop();

    {
        std::lock_guard<std::mutex> lk(mu_);
        accepting_     = true;
        last_chunk_at_ = std::chrono::steady_clock::now();
    }

    bool ok = tx_.start(
        s, [this](const transport::Chunk &c) { this->on_chunk(c); },
        [this](transport::LinkStatus st, const std::string &detail) { this->on_link(st, detail); });
    if (!ok)
    {
        std::lock_guard<std::mutex> lk(mu_);
        accepting_ = false;
        LOG_ERROR("[RX] transport '%s' failed to start", tx_.name().c_str());
        return false;
    }
    started_.store(true);
    LOG_INFO("[RX] listening on %s transport", tx_.name().c_str());

    if (idle_timeout_ms_ == 0)
        return true;

    watchdog_stop_.store(false);
    watchdog_thr_ = std::thread([this] { watchdog_loop(); });
    return true;
}

// ======================================================================
// Function: ReceiverService::stop
// - In: can be called anytime, any number of times
// - Out: transport unsubscribed, in-flight session discarded as Cancelled
// - Note: tx_.stop() runs without mu_; bus callbacks may be waiting on it
// ======================================================================
void ReceiverService::stop()
{
    watchdog_stop_.store(true);
    if (watchdog_thr_.joinable())
        watchdog_thr_.join();

    if (!started_.exchange(false))
        return;

    {
        // late chunks between here and tx_.stop() are ignored
        std::lock_guard<std::mutex> lk(mu_);
        accepting_ = false;
    }
    tx_.stop();

    std::vector<frame::Event> evs;
    {
        std::lock_guard<std::mutex> lk(mu_);
        rx_.abort(frame::AbortReason::Cancelled);
        evs.swap(pending_);
    }
    notify(evs);
    LOG_INFO("[RX] stopped");
}

bool ReceiverService::abort_transfer()
{
    std::vector<frame::Event> evs;
    bool                      dropped = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        dropped = rx_.abort(frame::AbortReason::Requested);
        evs.swap(pending_);
    }
    notify(evs);
    return dropped;
}

Status ReceiverService::status() const
{
    // transport first: link_ready() never blocks on the bus
    const bool ready = started_.load() && tx_.link_ready();

    std::lock_guard<std::mutex> lk(mu_);
    Status                      st = stats_;
    st.link_ready                  = ready;
    st.running                     = started_.load();
    st.state                       = rx_.state();
    st.buffered                    = rx_.buffered();
    st.progress                    = rx_.session_received();
    st.bytes_received              = rx_.total_received();
    return st;
}

void ReceiverService::set_observer(Observer cb)
{
    std::lock_guard<std::mutex> lk(obs_mu_);
    observer_ = std::move(cb);
}

void ReceiverService::on_chunk(const transport::Chunk &c)
{
    std::vector<frame::Event> evs;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!accepting_)
            return;
        last_chunk_at_ = std::chrono::steady_clock::now();
        rx_.feed(c);
        evs.swap(pending_);
    }
    notify(evs);
}

void ReceiverService::on_link(transport::LinkStatus st, const std::string &detail)
{
    std::vector<frame::Event> evs;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!accepting_)
            return;

        switch (st)
        {
            case transport::LinkStatus::Ready:
                LOG_SYSTEM("[LINK] ready on %s", tx_.name().c_str());
                break;
            case transport::LinkStatus::Dropped:
                LOG_SYSTEM("[LINK] dropped: %s", detail.c_str());
                rx_.link_terminated(detail);
                break;
            case transport::LinkStatus::ServiceNotFound:
            case transport::LinkStatus::CharacteristicNotFound:
            case transport::LinkStatus::ConnectFailed:
                LOG_SYSTEM("[LINK] setup failed (%s): %s", transport::link_status_name(st),
                           detail.c_str());
                // after link_terminated(): the setup kind wins over LinkTerminated in STATUS
                rx_.link_terminated(detail);
                stats_.last_error = std::string(transport::link_status_name(st)) + ": " + detail;
                break;
        }
        evs.swap(pending_);
    }
    notify(evs);
}

// ======================================================================
// Function: ReceiverService::on_event
// - In: one reassembler event, mu_ held
// - Out: completed files handed to the store, stats updated, event queued
//        for the observer
// ======================================================================
void ReceiverService::on_event(frame::Event &&ev)
{
    std::optional<frame::TransferError> lost;

    if (const auto *fc = std::get_if<frame::FileComplete>(&ev))
    {
        storage::StoreResult res = store_.write_new(fc->suggested_name, fc->bytes);
        if (res.ok)
        {
            stats_.files_saved++;
            stats_.last_saved = res.path;
        }
        else
        {
            frame::TransferError err;
            err.kind   = frame::ErrorKind::StorageFailure;
            err.detail = res.detail;
            LOG_SYSTEM("[RX] file lost (%zu bytes): %s", fc->bytes.size(), err.detail.c_str());
            lost = std::move(err);
        }
    }
    else if (const auto *ta = std::get_if<frame::TransferAborted>(&ev))
    {
        stats_.transfers_failed++;
        stats_.last_error = std::string("aborted: ") + frame::abort_reason_name(ta->reason);
    }
    else if (const auto *te = std::get_if<frame::TransferError>(&ev))
    {
        stats_.transfers_failed++;
        stats_.last_error = std::string(frame::error_kind_name(te->kind)) + ": " + te->detail;
    }

    pending_.push_back(std::move(ev));
    if (lost)
    {
        // reported right after the completion it belongs to
        stats_.transfers_failed++;
        stats_.last_error = std::string(frame::error_kind_name(lost->kind)) + ": " + lost->detail;
        pending_.emplace_back(std::move(*lost));
    }
}

void ReceiverService::notify(const std::vector<frame::Event> &evs)
{
    if (evs.empty())
        return;
    std::lock_guard<std::mutex> lk(obs_mu_);
    if (!observer_)
        return;
    for (const auto &ev : evs)
        observer_(ev);
}

// ======================================================================
// Function: ReceiverService::watchdog_loop
// - Aborts a session that saw no chunk for idle_timeout_ms (Timeout)
// ======================================================================
void ReceiverService::watchdog_loop()
{
    const auto timeout = std::chrono::milliseconds(idle_timeout_ms_);
    const auto poll    = std::chrono::milliseconds(
        std::min<std::uint32_t>(200, std::max<std::uint32_t>(10, idle_timeout_ms_ / 4)));

    while (!watchdog_stop_.load())
    {
        std::vector<frame::Event> evs;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (rx_.receiving() && std::chrono::steady_clock::now() - last_chunk_at_ >= timeout)
            {
                LOG_WARN("[RX] no data for %u ms", idle_timeout_ms_);
                rx_.abort(frame::AbortReason::Timeout);
            }
            evs.swap(pending_);
        }
        notify(evs);

        std::this_thread::sleep_for(poll);
    }
}

}  // namespace app
