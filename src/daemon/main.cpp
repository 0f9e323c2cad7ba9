#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>
#include <variant>

#include "app/receiver_service.hpp"
#include "ctl/command.hpp"
#include "ctl/ipc.hpp"
#include "storage/file_store.hpp"
#include "transport/bluez_transport.hpp"
#include "transport/loopback_transport.hpp"
#include "util/constants.hpp"
#include "util/env_config.hpp"
#include "util/log.hpp"

static app::ReceiverService  *g_rx = nullptr;
static transport::ITransport *g_tx = nullptr;

// ---------------- helpers ----------------
static std::unique_ptr<transport::ITransport> make_transport(const envcfg::ReceiverConfig &rc)
{
    if (rc.transport == "bluez")
    {
        transport::BluezConfig cfg;
        cfg.adapter   = rc.adapter;
        cfg.svc_uuid  = rc.svc_uuid;
        cfg.char_uuid = rc.char_uuid;
        cfg.peer_addr = rc.peer_addr;
        return std::make_unique<transport::BluezTransport>(std::move(cfg));
    }
    // default - loopback
    return std::make_unique<transport::LoopbackTransport>();
}

static std::string format_status(const app::Status &st)
{
    char head[200];
    std::snprintf(head, sizeof(head),
                  "link=%s state=%s buffered=%zu progress=%llu received=%llu saved=%llu "
                  "failed=%llu",
                  st.link_ready ? "ready" : "down", frame::state_name(st.state), st.buffered,
                  static_cast<unsigned long long>(st.progress),
                  static_cast<unsigned long long>(st.bytes_received),
                  static_cast<unsigned long long>(st.files_saved),
                  static_cast<unsigned long long>(st.transfers_failed));
    std::string out = head;
    out += " last=" + (st.last_saved.empty() ? std::string("-") : st.last_saved);
    out += " error=" + (st.last_error.empty() ? std::string("-") : st.last_error);
    return out;
}

// Rebind the BlueZ link; "" only disconnects. ERR text on failure, empty on success.
static std::string retarget(const std::string &mac)
{
    auto *bt = dynamic_cast<transport::BluezTransport *>(g_tx);
    if (!bt)
        return "not supported on this transport";
    if (!bt->handover_to(mac))
        return mac.empty() ? "disconnect failed" : "switch failed";
    return {};
}

static std::string on_line(const std::string &line)
{
    LOG_DEBUG("IPC line: %s", line.c_str());

    std::string why;
    const auto  cmd = ipc::parse_line(line, &why);
    if (!cmd)
    {
        LOG_WARN("Rejected control line '%s': %s", line.c_str(), why.c_str());
        return "ERR " + why;
    }
    if (cmd->verb == ipc::Verb::Quit)
    {
        LOG_INFO("Received QUIT command, exiting...");
        return "OK bye";
    }
    if (!g_rx)
        return "ERR receiver not running";

    switch (cmd->verb)
    {
        case ipc::Verb::Status:
            return "OK " + format_status(g_rx->status());
        case ipc::Verb::Abort:
            if (!g_rx->abort_transfer())
                return "OK idle";
            LOG_SYSTEM("[ABORT] transfer discarded on request");
            return "OK aborted";
        case ipc::Verb::Connect:
        case ipc::Verb::Disconnect:
        {
            const std::string err = retarget(cmd->mac);
            const char       *tag = ipc::verb_line(cmd->verb);
            if (!err.empty())
            {
                LOG_WARN("[%s] %s", tag, err.c_str());
                return "ERR " + err;
            }
            if (cmd->verb == ipc::Verb::Connect)
            {
                LOG_SYSTEM("[CONNECT] switching to %s", cmd->mac.c_str());
                return "OK connecting " + cmd->mac;
            }
            LOG_SYSTEM("[DISCONNECT] link dropped and target cleared");
            return "OK disconnected";
        }
        case ipc::Verb::Quit:
            break;
    }
    return "ERR unknown command";
}

int main()
{
    // log level from env var
    if (const char *log_level = std::getenv("BLERX_LOG_LEVEL"))
    {
        if (!blerx::set_log_level_by_name(log_level))
            LOG_WARN("Ignoring unknown BLERX_LOG_LEVEL='%s'", log_level);
    }

    const envcfg::ReceiverConfig rc = envcfg::load_from_env();
    LOG_SYSTEM("Config: transport=%s adapter=%s peer=%s dir=%s max_buffer=%zu idle_timeout=%ums",
               rc.transport.c_str(), rc.adapter.c_str(),
               rc.peer_addr ? rc.peer_addr->c_str() : "(none)", rc.download_dir.c_str(),
               rc.frame.max_buffer, rc.idle_timeout_ms);

    // Bind transport from config
    auto tx = make_transport(rc);
    g_tx    = tx.get();

    storage::DirectoryStore store(rc.download_dir);

    transport::Settings s{};
    s.svc_uuid  = rc.svc_uuid;
    s.char_uuid = rc.char_uuid;

    app::ReceiverService rx(*tx, store, rc.frame, rc.idle_timeout_ms);
    rx.set_observer([](const frame::Event &ev) {
        if (const auto *fc = std::get_if<frame::FileComplete>(&ev))
            LOG_DEBUG("[EVENT] file complete: %s", fc->suggested_name.c_str());
        else if (const auto *ta = std::get_if<frame::TransferAborted>(&ev))
            LOG_DEBUG("[EVENT] aborted: %s", frame::abort_reason_name(ta->reason));
        else if (const auto *te = std::get_if<frame::TransferError>(&ev))
            LOG_DEBUG("[EVENT] error: %s", frame::error_kind_name(te->kind));
    });
    if (!rx.start(s))
    {
        LOG_ERROR("ReceiverService start failed");
        return 1;
    }
    g_rx = &rx;

    // IPC server
    std::string sock = ipc::expand_user(constants::ctl_sock_path());

    const bool served = ipc::start_server(sock, &on_line);
    g_rx              = nullptr;
    rx.stop();
    if (!served)
    {
        LOG_ERROR("start_server failed");
        return 1;
    }
    return 0;
}
