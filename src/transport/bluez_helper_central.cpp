// src/transport/bluez_helper_central.cpp
#include "transport/bluez_transport.hpp"
#include "transport/bluez_helper_central.hpp"
#include "transport/bluez_dbus_util.hpp"

#include <cerrno>
#include <cstring>
#include <optional>
#include <string>
#include <utility>

#include "util/log.hpp"

#if BLERX_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace transport
{

namespace
{
constexpr const char *DEVICE_IFACE  = "org.bluez.Device1";
constexpr const char *SERVICE_IFACE = "org.bluez.GattService1";
constexpr const char *CHAR_IFACE    = "org.bluez.GattCharacteristic1";

int read_device(sd_bus_message *m, DeviceObject &dev)
{
    return for_each_prop(m, [&](const std::string &key, sd_bus_message *msg) {
        if (key == "Address")
            return read_var_s(msg, dev.address);
        if (key == "Connected")
            return read_var_b(msg, dev.connected);
        if (key == "ServicesResolved")
            return read_var_b(msg, dev.services_resolved);
        return -ENOENT;
    });
}

int read_gatt(sd_bus_message *m, GattObject &obj)
{
    return for_each_prop(m, [&](const std::string &key, sd_bus_message *msg) {
        if (key == "UUID")
            return read_var_s(msg, obj.uuid);
        if (key == "Flags" && obj.kind == GattObject::Kind::Characteristic)
            return read_var_as(msg, obj.flags);
        return -ENOENT;
    });
}
}  // namespace

int read_object_ifaces(sd_bus_message *m, const char *path, ObjectTree &tree)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sa{sv}}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
    {
        const char *iface = nullptr;
        if ((r = sd_bus_message_read(m, "s", &iface)) < 0)
            return r;
        iface = iface ? iface : "";

        if (std::strcmp(iface, DEVICE_IFACE) == 0)
        {
            DeviceObject dev;
            dev.path = path;
            if ((r = read_device(m, dev)) < 0)
                return r;
            tree.devices.push_back(std::move(dev));
        }
        else if (std::strcmp(iface, SERVICE_IFACE) == 0 || std::strcmp(iface, CHAR_IFACE) == 0)
        {
            GattObject obj;
            obj.path = path;
            obj.kind = std::strcmp(iface, SERVICE_IFACE) == 0 ? GattObject::Kind::Service
                                                              : GattObject::Kind::Characteristic;
            if ((r = read_gatt(m, obj)) < 0)
                return r;
            tree.gatt.push_back(std::move(obj));
        }
        else if ((r = sd_bus_message_skip(m, "a{sv}")) < 0)
        {
            return r;
        }
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);
}

int read_managed_objects(sd_bus *bus, ObjectTree &tree)
{
    sd_bus_error    err   = SD_BUS_ERROR_NULL;
    sd_bus_message *reply = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &err, &reply, "");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ][central] GetManagedObjects failed: %s",
                 err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        return r;
    }
    sd_bus_error_free(&err);

    // a{o a{s a{sv}}}: object path -> interface -> properties
    r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    while (r >= 0 &&
           (r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &obj)) < 0)
            break;
        if ((r = read_object_ifaces(reply, obj ? obj : "", tree)) < 0)
            break;
        r = sd_bus_message_exit_container(reply);
    }
    sd_bus_message_unref(reply);
    if (r < 0)
        LOG_WARN("[BLUEZ][central] malformed object tree: %s", strerror(-r));
    return r;
}

int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *self = static_cast<BluezTransport *>(userdata);
    const char *obj  = nullptr;
    int         r    = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;

    ObjectTree tree;
    if ((r = read_object_ifaces(m, obj, tree)) < 0)
        return r;
    if (!tree.devices.empty() || !tree.gatt.empty())
        self->on_objects_added(tree);
    return 0;
}

int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *self = static_cast<BluezTransport *>(userdata);
    const char *obj  = nullptr;
    int         r    = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;
    self->on_object_removed(obj);
    return 0;
}

int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret_error*/)
{
    auto       *self  = static_cast<BluezTransport *>(userdata);
    const char *path  = sd_bus_message_get_path(m);
    const char *iface = nullptr;
    int         r     = sd_bus_message_read(m, "s", &iface);
    if (r < 0)
        return r;
    if (!path || !iface)
        return 0;

    if (std::strcmp(iface, DEVICE_IFACE) == 0)
    {
        std::optional<bool> connected, resolved;
        r = for_each_prop(m, [&](const std::string &key, sd_bus_message *msg) {
            bool v = false;
            int  rr;
            if (key == "Connected")
            {
                if ((rr = read_var_b(msg, v)) >= 0)
                    connected = v;
                return rr;
            }
            if (key == "ServicesResolved")
            {
                if ((rr = read_var_b(msg, v)) >= 0)
                    resolved = v;
                return rr;
            }
            return -ENOENT;
        });
        if (r < 0)
            return r;
        if (connected || resolved)
            self->on_device_changed(path, connected, resolved);
        return 0;
    }

    if (std::strcmp(iface, CHAR_IFACE) != 0)
        return 0;

    // Value arrives as "ay"; the bytes live in m, so hand them up before returning
    return for_each_prop(m, [&](const std::string &key, sd_bus_message *msg) {
        if (key != "Value")
            return -ENOENT;
        const void *buf = nullptr;
        size_t      len = 0;
        int         rr  = sd_bus_message_enter_container(msg, SD_BUS_TYPE_VARIANT, "ay");
        if (rr < 0 || (rr = sd_bus_message_read_array(msg, 'y', &buf, &len)) < 0)
            return rr;
        self->on_value(path, static_cast<const uint8_t *>(buf), len);
        return sd_bus_message_exit_container(msg);
    });
}

int bluez_on_connect_reply(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *self = static_cast<BluezTransport *>(userdata);
    if (!sd_bus_message_is_method_error(m, nullptr))
    {
        self->on_connect_result(nullptr, nullptr);
        return 1;
    }
    const sd_bus_error *e = sd_bus_message_get_error(m);
    self->on_connect_result((e && e->name) ? e->name : "unknown",
                            (e && e->message) ? e->message : "no message");
    return 1;
}

}  // namespace transport

#endif
