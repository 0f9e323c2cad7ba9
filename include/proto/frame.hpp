#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <variant>
#include <vector>

/*
RX:
transport.on_chunk(bytes)
  -> reassembler.feed(bytes)
      Idle      + first byte == START -> Receiving (chunk kept, sentinel included)
      Receiving + first byte == START -> TransferAborted(Restarted), new session
      Receiving                        -> append (cap exceeded -> TransferError(BufferOverflow))
      Receiving + last byte  == END   -> FileComplete(bytes, name) -> Idle
  -> on_event(...) -> storage / status
*/

namespace frame
{

// --- Protocol constants ---
inline constexpr std::uint8_t DEFAULT_START      = 0x02;
inline constexpr std::uint8_t DEFAULT_END        = 0x03;
inline constexpr std::size_t  DEFAULT_MAX_BUFFER = 16u * 1024u * 1024u;  // 16 MiB
inline constexpr std::size_t  UNLIMITED          = std::numeric_limits<std::size_t>::max();

using Chunk = std::vector<std::uint8_t>;

struct Config
{
    std::uint8_t start_sentinel{DEFAULT_START};
    std::uint8_t end_sentinel{DEFAULT_END};
    std::size_t  max_buffer{DEFAULT_MAX_BUFFER};
    std::string  name_prefix{"received_"};
    std::string  name_suffix{".pdf"};
};

// Empty string when the config is usable, otherwise the reason.
std::string validate(const Config &cfg);

enum class State
{
    Idle,
    Receiving
};

enum class AbortReason
{
    Restarted,  // start sentinel while Receiving
    Timeout,    // watchdog
    Cancelled,  // local teardown
    Requested   // operator ABORT
};

enum class ErrorKind
{
    BufferOverflow,
    StorageFailure,
    LinkTerminated
};

const char *state_name(State s);
const char *abort_reason_name(AbortReason r);
const char *error_kind_name(ErrorKind k);

struct FileComplete
{
    std::vector<std::uint8_t> bytes;
    std::string               suggested_name;
};

struct TransferAborted
{
    AbortReason reason{AbortReason::Restarted};
    std::size_t discarded{0};  // bytes dropped with the session
};

struct TransferError
{
    ErrorKind   kind{ErrorKind::BufferOverflow};
    std::string detail;
};

using Event   = std::variant<FileComplete, TransferAborted, TransferError>;
using OnEvent = std::function<void(Event &&)>;
using NameGen = std::function<std::string()>;

// Default name: <prefix><epoch ms><suffix>
std::string timestamp_name(const std::string &prefix, const std::string &suffix);

class Reassembler
{
  public:
    explicit Reassembler(Config cfg = {}, OnEvent on_event = nullptr, NameGen name_gen = nullptr);

    void set_on_event(OnEvent cb) { on_event_ = std::move(cb); }

    // Feed one chunk. Events (if any) are emitted before this returns.
    void feed(const Chunk &c);
    void feed(const std::uint8_t *data, std::size_t len);

    // Drop the in-flight session (if any) and report it as aborted.
    // Returns true when a session was discarded.
    bool abort(AbortReason reason);
    // The chunk stream ended; an in-flight session is reported as LinkTerminated.
    bool link_terminated(const std::string &detail);

    State         state() const { return state_; }
    bool          receiving() const { return state_ == State::Receiving; }
    std::size_t   buffered() const { return session_.buffer.size(); }
    // progress of the current session; 0 while Idle
    std::uint64_t session_received() const { return session_.received; }
    std::uint64_t total_received() const { return total_received_; }
    const Config &config() const { return cfg_; }

  private:
    struct Session
    {
        std::vector<std::uint8_t> buffer;
        std::uint64_t             received = 0;  // bytes in this session, never decreases
    };

    void begin(const std::uint8_t *data, std::size_t len);
    bool append(const std::uint8_t *data, std::size_t len);
    void finish();
    void reset();
    void emit(Event &&ev);

    Config        cfg_;
    OnEvent       on_event_;
    NameGen       name_gen_;
    State         state_{State::Idle};
    Session       session_;
    std::uint64_t total_received_{0};
};

}  // namespace frame
