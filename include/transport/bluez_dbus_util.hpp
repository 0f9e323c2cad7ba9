// include/transport/bluez_dbus_util.hpp
#pragma once
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

#if BLERX_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace transport
{

inline uint64_t steady_ms()
{
    using namespace std::chrono;
    return (uint64_t)duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

inline void unref_slot(sd_bus_slot *&s)
{
    if (s)
    {
        sd_bus_slot_unref(s);
        s = nullptr;
    }
}

// variant "s"
inline int read_var_s(sd_bus_message *m, std::string &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "s");
    if (r < 0)
        return r;
    const char *s = nullptr;
    if ((r = sd_bus_message_read(m, "s", &s)) < 0)
        return r;
    out = s ? s : "";
    return sd_bus_message_exit_container(m);
}

// variant "b"
inline int read_var_b(sd_bus_message *m, bool &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "b");
    if (r < 0)
        return r;
    int b = 0;
    if ((r = sd_bus_message_read(m, "b", &b)) < 0)
        return r;
    out = (b != 0);
    return sd_bus_message_exit_container(m);
}

// variant "as"
inline int read_var_as(sd_bus_message *m, std::vector<std::string> &out)
{
    out.clear();
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "as");
    if (r < 0)
        return r;
    char **strv = nullptr;
    if ((r = sd_bus_message_read_strv(m, &strv)) < 0)
        return r;
    for (char **p = strv; p && *p; ++p)
    {
        out.emplace_back(*p);
        free(*p);
    }
    free(strv);
    return sd_bus_message_exit_container(m);
}

// Walk an a{sv} property dict. on_prop(key, m) reads the variant of the keys
// it knows and returns 0/positive, or returns -ENOENT to have it skipped.
template <class OnProp> int for_each_prop(sd_bus_message *m, OnProp &&on_prop)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;
        r = on_prop(std::string(key ? key : ""), m);
        if (r == -ENOENT)
            r = sd_bus_message_skip(m, "v");
        if (r < 0)
            return r;
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);
}

}  // namespace transport
#endif  // BLERX_HAVE_SDBUS
