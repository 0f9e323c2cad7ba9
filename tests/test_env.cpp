// tests/test_env.cpp
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <limits>
#include <string>

#include "util/constants.hpp"
#include "util/env_config.hpp"
#include "util/log.hpp"

// ENV guard
struct EnvGuard
{
    std::string key, old_val;
    bool        had = false;
    explicit EnvGuard(const char *k) : key(k)
    {
        const char *v = std::getenv(k);
        if (v)
        {
            had     = true;
            old_val = v;
        }
    }
    void set(const std::string &v) const { ::setenv(key.c_str(), v.c_str(), 1); }
    void unset() const { ::unsetenv(key.c_str()); }
    ~EnvGuard()
    {
        if (had)
            ::setenv(key.c_str(), old_val.c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }
};

// Every variable load_from_env() reads, cleared for the test's duration
struct CleanEnv
{
    EnvGuard transport{"BLERX_TRANSPORT"}, adapter{"BLERX_ADAPTER"}, peer{"BLERX_PEER"},
        svc{"BLERX_SVC_UUID"}, chr{"BLERX_CHAR_UUID"}, max_buf{"BLERX_MAX_BUFFER"},
        start{"BLERX_START_SENTINEL"}, end{"BLERX_END_SENTINEL"}, idle{"BLERX_IDLE_TIMEOUT_MS"},
        dir{"BLERX_DOWNLOAD_DIR"}, prefix{"BLERX_NAME_PREFIX"}, suffix{"BLERX_NAME_SUFFIX"};
    CleanEnv()
    {
        for (EnvGuard *g : {&transport, &adapter, &peer, &svc, &chr, &max_buf, &start, &end, &idle,
                            &dir, &prefix, &suffix})
            g->unset();
    }
};

TEST(Env_CtlSockPath, FromEnv)
{
    EnvGuard          g("BLERX_CTL_SOCK");
    const std::string want = "/tmp/blerx-test.sock";
    g.set(want);
    EXPECT_EQ(constants::ctl_sock_path(), want);
}

TEST(Env_CtlSockPath, DefaultFromHomeIsQuiet)
{
    EnvGuard g_sock("BLERX_CTL_SOCK");
    g_sock.unset();

    EnvGuard              g_home("HOME");
    std::filesystem::path tmp = std::filesystem::temp_directory_path() / "blerx-home";
    std::filesystem::create_directories(tmp);
    g_home.set(tmp.string());

    // blerxctl resolves the same path; only the server announces it
    testing::internal::CaptureStderr();
    std::string got = constants::ctl_sock_path();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(got, (tmp / ".cache/blerx/ctl.sock").string());
    EXPECT_TRUE(err.empty()) << err;
}

TEST(Env_DownloadDir, Precedence)
{
    EnvGuard g_dir("BLERX_DOWNLOAD_DIR");
    EnvGuard g_xdg("XDG_DOWNLOAD_DIR");
    EnvGuard g_home("HOME");
    g_home.set("/tmp/blerx-home");
    g_dir.unset();
    g_xdg.unset();
    EXPECT_EQ(constants::download_dir(), "/tmp/blerx-home/Downloads");

    g_xdg.set("/tmp/xdg-dl");
    EXPECT_EQ(constants::download_dir(), "/tmp/xdg-dl");

    g_dir.set("/tmp/blerx-dl");
    EXPECT_EQ(constants::download_dir(), "/tmp/blerx-dl");
}

TEST(Env_ParseUint, AcceptsDecimalAndHex)
{
    unsigned long long v = 0;
    EXPECT_TRUE(envcfg::parse_uint("42", 0, 100, v));
    EXPECT_EQ(v, 42u);
    EXPECT_TRUE(envcfg::parse_uint("0x7f", 0, 255, v));
    EXPECT_EQ(v, 127u);

    EXPECT_FALSE(envcfg::parse_uint("", 0, 100, v));
    EXPECT_FALSE(envcfg::parse_uint("-1", 0, 100, v));
    EXPECT_FALSE(envcfg::parse_uint(" 5", 0, 100, v));
    EXPECT_FALSE(envcfg::parse_uint("12abc", 0, 100, v));
    EXPECT_FALSE(envcfg::parse_uint("101", 0, 100, v));
    EXPECT_FALSE(envcfg::parse_uint("0", 1, 100, v));
    EXPECT_FALSE(envcfg::parse_uint(nullptr, 0, 100, v));
}

TEST(Env_Mac, ValidateAndNormalize)
{
    EXPECT_TRUE(envcfg::is_valid_mac("AA:BB:CC:DD:EE:FF"));
    EXPECT_TRUE(envcfg::is_valid_mac(envcfg::normalize_mac("aa:bb:cc:dd:ee:0f")));
    EXPECT_EQ(envcfg::normalize_mac("aa:bb:cc:dd:ee:0f"), "AA:BB:CC:DD:EE:0F");
    EXPECT_FALSE(envcfg::is_valid_mac("AA:BB:CC:DD:EE"));
    EXPECT_FALSE(envcfg::is_valid_mac("AA-BB-CC-DD-EE-FF"));
    EXPECT_FALSE(envcfg::is_valid_mac("GG:BB:CC:DD:EE:FF"));
}

TEST(Env_Receiver, Defaults)
{
    CleanEnv                     clean;
    const envcfg::ReceiverConfig rc = envcfg::load_from_env();

    EXPECT_EQ(rc.transport, "loopback");
    EXPECT_EQ(rc.adapter, "hci0");
    EXPECT_FALSE(rc.peer_addr.has_value());
    EXPECT_EQ(rc.svc_uuid, std::string(constants::SVC_UUID));
    EXPECT_EQ(rc.char_uuid, std::string(constants::CHAR_UUID));
    EXPECT_EQ(rc.frame.start_sentinel, 0x02);
    EXPECT_EQ(rc.frame.end_sentinel, 0x03);
    EXPECT_EQ(rc.frame.max_buffer, frame::DEFAULT_MAX_BUFFER);
    EXPECT_EQ(rc.frame.name_prefix, "received_");
    EXPECT_EQ(rc.frame.name_suffix, ".pdf");
    EXPECT_EQ(rc.idle_timeout_ms, 0u);
}

TEST(Env_Receiver, Overrides)
{
    CleanEnv clean;
    clean.transport.set("BlueZ");
    clean.peer.set("aa:bb:cc:dd:ee:ff");
    clean.max_buf.set("4096");
    clean.start.set("0xAA");
    clean.end.set("85");
    clean.idle.set("1500");
    clean.dir.set("/tmp/blerx-in");
    clean.prefix.set("scan_");
    clean.suffix.set(".bin");

    const envcfg::ReceiverConfig rc = envcfg::load_from_env();
    EXPECT_EQ(rc.transport, "bluez");
    ASSERT_TRUE(rc.peer_addr.has_value());
    EXPECT_EQ(*rc.peer_addr, "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(rc.frame.max_buffer, 4096u);
    EXPECT_EQ(rc.frame.start_sentinel, 0xAA);
    EXPECT_EQ(rc.frame.end_sentinel, 0x55);
    EXPECT_EQ(rc.idle_timeout_ms, 1500u);
    EXPECT_EQ(rc.download_dir, "/tmp/blerx-in");
    EXPECT_EQ(rc.frame.name_prefix, "scan_");
    EXPECT_EQ(rc.frame.name_suffix, ".bin");
}

TEST(Env_Receiver, InvalidValuesFallBack)
{
    CleanEnv clean;
    clean.transport.set("carrier-pigeon");
    clean.peer.set("not-a-mac");
    clean.max_buf.set("0");
    clean.start.set("0x03");  // equal to the end sentinel
    clean.idle.set("soon");
    clean.prefix.set("../up");

    testing::internal::CaptureStderr();
    const envcfg::ReceiverConfig rc  = envcfg::load_from_env();
    const std::string            err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(rc.transport, "loopback");
    EXPECT_FALSE(rc.peer_addr.has_value());
    EXPECT_EQ(rc.frame.max_buffer, frame::DEFAULT_MAX_BUFFER);
    EXPECT_EQ(rc.frame.start_sentinel, 0x02);
    EXPECT_EQ(rc.frame.end_sentinel, 0x03);
    EXPECT_EQ(rc.idle_timeout_ms, 0u);
    EXPECT_EQ(rc.frame.name_prefix, "received_");
    EXPECT_NE(err.find("BLERX_MAX_BUFFER"), std::string::npos);
}

TEST(LogLevel, FiltersByThreshold)
{
    using namespace blerx;

    // ERROR-only: WARN should be suppressed, ERROR should appear
    EXPECT_TRUE(set_log_level_by_name("ERROR"));
    testing::internal::CaptureStderr();
    LOG_WARN("should_not_print_warn");
    std::string out1 = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out1.find("should_not_print_warn") == std::string::npos);

    testing::internal::CaptureStderr();
    LOG_ERROR("should_print_error");
    std::string out2 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out2.find("should_print_error"), std::string::npos);

    // SYSTEM lines pass any threshold
    testing::internal::CaptureStderr();
    LOG_SYSTEM("system_always");
    std::string out3 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out3.find("system_always"), std::string::npos);

    // DEBUG: DEBUG should appear
    EXPECT_TRUE(set_log_level_by_name("debug"));
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_visible");
    std::string out4 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out4.find("debug_visible"), std::string::npos);

    EXPECT_FALSE(set_log_level_by_name("chatty"));
    EXPECT_EQ(global_level(), Level::Info);
}
