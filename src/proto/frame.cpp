#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

#include "proto/frame.hpp"
#include "util/log.hpp"

namespace frame
{

std::string validate(const Config &cfg)
{
    if (cfg.start_sentinel == cfg.end_sentinel)
        return "start and end sentinel must differ";
    if (cfg.max_buffer == 0)
        return "max_buffer must be > 0";
    return {};
}

const char *state_name(State s)
{
    switch (s)
    {
        case State::Idle:
            return "idle";
        case State::Receiving:
            return "receiving";
    }
    return "?";
}

const char *abort_reason_name(AbortReason r)
{
    switch (r)
    {
        case AbortReason::Restarted:
            return "restarted";
        case AbortReason::Timeout:
            return "timeout";
        case AbortReason::Cancelled:
            return "cancelled";
        case AbortReason::Requested:
            return "requested";
    }
    return "?";
}

const char *error_kind_name(ErrorKind k)
{
    switch (k)
    {
        case ErrorKind::BufferOverflow:
            return "buffer-overflow";
        case ErrorKind::StorageFailure:
            return "storage-failure";
        case ErrorKind::LinkTerminated:
            return "link-terminated";
    }
    return "?";
}

std::string timestamp_name(const std::string &prefix, const std::string &suffix)
{
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    return prefix + std::to_string(ms) + suffix;
}

Reassembler::Reassembler(Config cfg, OnEvent on_event, NameGen name_gen)
    : cfg_(std::move(cfg)), on_event_(std::move(on_event)), name_gen_(std::move(name_gen))
{
}

void Reassembler::feed(const Chunk &c)
{
    feed(c.data(), c.size());
}

void Reassembler::feed(const std::uint8_t *data, std::size_t len)
{
    // empty chunk: nothing to index, nothing to do
    if (!data || len == 0)
        return;

    const bool starts = (data[0] == cfg_.start_sentinel);
    if (state_ == State::Idle)
    {
        if (!starts)
        {
            LOG_DEBUG("[RX] idle, dropping %zu bytes without start sentinel", len);
            return;
        }
        begin(data, len);
    }
    else if (starts)
    {
        // new transfer before the previous one ended
        abort(AbortReason::Restarted);
        begin(data, len);
    }
    else if (!append(data, len))
    {
        return;  // overflowed, already back to Idle
    }

    if (state_ == State::Receiving && data[len - 1] == cfg_.end_sentinel)
        finish();
}

bool Reassembler::abort(AbortReason reason)
{
    if (state_ != State::Receiving)
        return false;

    TransferAborted ev;
    ev.reason    = reason;
    ev.discarded = session_.buffer.size();
    reset();
    LOG_SYSTEM("[RX] transfer aborted (%s), discarded %zu bytes", abort_reason_name(reason),
               ev.discarded);
    emit(std::move(ev));
    return true;
}

bool Reassembler::link_terminated(const std::string &detail)
{
    if (state_ != State::Receiving)
        return false;

    const std::size_t lost = session_.buffer.size();
    reset();
    TransferError ev;
    ev.kind   = ErrorKind::LinkTerminated;
    ev.detail = detail.empty() ? std::string("link dropped") : detail;
    ev.detail += " (" + std::to_string(lost) + " bytes incomplete)";
    LOG_SYSTEM("[RX] transfer incomplete: %s", ev.detail.c_str());
    emit(std::move(ev));
    return true;
}

void Reassembler::begin(const std::uint8_t *data, std::size_t len)
{
    reset();
    state_ = State::Receiving;
    LOG_SYSTEM("[RX] transfer started");
    // sentinel byte stays in the payload
    (void)append(data, len);
}

bool Reassembler::append(const std::uint8_t *data, std::size_t len)
{
    auto &buf = session_.buffer;
    // buf.size() <= max_buffer holds, so the subtraction cannot wrap
    if (len > cfg_.max_buffer - buf.size())
    {
        TransferError ev;
        ev.kind   = ErrorKind::BufferOverflow;
        ev.detail = "session would reach " + std::to_string(buf.size() + len) +
                    " bytes (max " + std::to_string(cfg_.max_buffer) + ")";
        reset();
        LOG_SYSTEM("[RX] transfer aborted: %s", ev.detail.c_str());
        emit(std::move(ev));
        return false;
    }

    buf.insert(buf.end(), data, data + len);
    session_.received += len;
    total_received_ += len;
    LOG_DEBUG("[RX] +%zu bytes, session=%llu", len,
              static_cast<unsigned long long>(session_.received));
    return true;
}

void Reassembler::finish()
{
    FileComplete ev;
    ev.bytes          = std::move(session_.buffer);
    ev.suggested_name = name_gen_ ? name_gen_() : timestamp_name(cfg_.name_prefix, cfg_.name_suffix);
    reset();
    LOG_SYSTEM("[RX] transfer complete: %zu bytes -> %s", ev.bytes.size(),
               ev.suggested_name.c_str());
    emit(std::move(ev));
}

void Reassembler::reset()
{
    state_ = State::Idle;
    session_.buffer.clear();
    session_.buffer.shrink_to_fit();
    session_.received = 0;
}

void Reassembler::emit(Event &&ev)
{
    if (on_event_)
        on_event_(std::move(ev));
}

}  // namespace frame
