#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

#ifndef BLERX_SOURCE_DIR
#error "BLERX_SOURCE_DIR must be defined by CMake to the project source root"
#endif

struct Check
{
    const char              *label;
    const char              *rel_path;
    std::vector<std::string> needles;  // all substrings must appear in the SAME line
    bool                     allow_prev_line_macro = true;  // sometimes macro is on prev line
};

static std::string read_file(const std::string &path)
{
    std::ifstream      ifs(path);
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

static bool line_has_all(const std::string &line, const std::vector<std::string> &needles)
{
    for (const auto &n : needles)
    {
        if (line.find(n) == std::string::npos)
            return false;
    }
    return true;
}

static bool has_system_macro_near(const std::string              &content,
                                  const std::vector<std::string> &needles,
                                  bool                            allow_prev)
{
    std::istringstream iss(content);
    std::string        line, prev;
    while (std::getline(iss, line))
    {
        if (line_has_all(line, needles))
        {
            const bool on_same = line.find("LOG_SYSTEM(") != std::string::npos;
            const bool on_prev = allow_prev && prev.find("LOG_SYSTEM(") != std::string::npos;
            return on_same || on_prev;
        }
        prev = line;
    }
    // message not found => fail
    return false;
}

TEST(LifecycleLogs, AllSystemLevel)
{
    const std::vector<Check> checks = {
        // clang-format off
        {"transfer started", "src/proto/frame.cpp", {"[RX]", "transfer started"}},
        {"transfer complete", "src/proto/frame.cpp", {"[RX]", "transfer complete:"}},
        {"transfer aborted", "src/proto/frame.cpp", {"[RX]", "transfer aborted (%s)"}},
        {"overflow", "src/proto/frame.cpp", {"[RX]", "transfer aborted: %s"}},
        {"transfer incomplete", "src/proto/frame.cpp", {"[RX]", "transfer incomplete:"}},
        {"file saved", "src/storage/file_store.cpp", {"[STORE]", "saved "}},
        {"file lost", "src/app/receiver_service.cpp", {"[RX]", "file lost"}},
        {"link ready", "src/app/receiver_service.cpp", {"[LINK]", "ready on"}},
        {"link dropped", "src/app/receiver_service.cpp", {"[LINK]", "dropped:"}},
        {"link setup failed", "src/app/receiver_service.cpp", {"[LINK]", "setup failed"}},
        {"operator abort", "src/daemon/main.cpp", {"[ABORT]", "discarded on request"}},
        // BlueZ central
        {"Notifications ready", "src/transport/bluez_transport_central.cpp", {"Notifications enabled; ready"}},
        {"GATT setup failed", "src/transport/bluez_transport_central.cpp", {"setup failed:"}},
        {"handover", "src/transport/bluez_transport_central.cpp", {"[handover] target="}},
        {"Device connected", "src/transport/bluez_transport_central.cpp", {"Device connected:"}},
        {"Connected property true", "src/transport/bluez_transport_central.cpp", {"Connected property became true"}},
        {"Disconnected", "src/transport/bluez_transport_central.cpp", {"Disconnected", "("}},
        {"InterfacesRemoved", "src/transport/bluez_transport_central.cpp", {"InterfacesRemoved -> cleared device"}},
        {"found peer addr", "src/transport/bluez_transport_central.cpp", {"found ", " addr="}},
        // control socket
        {"listening", "src/ctl/ipc.cpp", {"Listening on"}}
        // clang-format on
    };

    for (const auto &c : checks)
    {
        const std::string path    = std::string(BLERX_SOURCE_DIR) + "/" + c.rel_path;
        const std::string content = read_file(path);
        ASSERT_FALSE(content.empty()) << "Missing file: " << path;
        const bool ok = has_system_macro_near(content, c.needles, c.allow_prev_line_macro);
        if (!ok)
        {
            std::ostringstream err;
            err << "Log for [" << c.label << "] is not LOG_SYSTEM near message in " << path
                << " (needles: ";
            for (size_t i = 0; i < c.needles.size(); ++i)
            {
                if (i)
                    err << ", ";
                err << '"' << c.needles[i] << '"';
            }
            err << ")";
            ADD_FAILURE() << err.str();
        }
    }
}
