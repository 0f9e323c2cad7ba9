#include <algorithm>
#include <string>

#include "transport/gatt_resolve.hpp"

namespace transport
{

static bool under(const std::string &path, const std::string &parent)
{
    return !parent.empty() && path.size() > parent.size() + 1 &&
           path.compare(0, parent.size(), parent) == 0 && path[parent.size()] == '/';
}

static bool can_notify(const GattObject &c)
{
    if (c.flags.empty())
        return true;  // Flags not exported yet: let StartNotify decide
    return std::any_of(c.flags.begin(), c.flags.end(), [](const std::string &f) {
        return f == "notify" || f == "indicate";
    });
}

// "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF" -> "AA:BB:CC:DD:EE:FF"
static std::string mac_from_path(const std::string &path)
{
    const auto pos = path.rfind("/dev_");
    if (pos == std::string::npos)
        return {};
    std::string mac = path.substr(pos + 5);
    std::replace(mac.begin(), mac.end(), '_', ':');
    return mac;
}

const DeviceObject *find_peer_device(const std::vector<DeviceObject> &devices,
                                     const std::string               &adapter,
                                     const std::string               &mac)
{
    if (mac.empty())
        return nullptr;
    const std::string prefix = "/org/bluez/" + adapter + "/dev_";
    for (const auto &d : devices)
    {
        // direct children only; GATT objects sit one level deeper
        if (d.path.compare(0, prefix.size(), prefix) != 0 ||
            d.path.find('/', prefix.size()) != std::string::npos)
            continue;
        const std::string &addr = d.address.empty() ? mac_from_path(d.path) : d.address;
        if (same_id(addr, mac))
            return &d;
    }
    return nullptr;
}

GattSetup resolve_gatt(const std::vector<GattObject> &objects,
                       const std::string             &dev_path,
                       const std::string             &svc_uuid,
                       const std::string             &char_uuid)
{
    GattSetup out;

    for (const auto &o : objects)
    {
        if (o.kind == GattObject::Kind::Service && under(o.path, dev_path) &&
            same_id(o.uuid, svc_uuid))
        {
            out.svc_path = o.path;
            break;
        }
    }
    if (out.svc_path.empty())
    {
        out.status = LinkStatus::ServiceNotFound;
        out.detail = "service " + svc_uuid + " not found on " + dev_path;
        return out;
    }

    bool wrong_flags = false;
    for (const auto &o : objects)
    {
        if (o.kind != GattObject::Kind::Characteristic || !under(o.path, out.svc_path) ||
            !same_id(o.uuid, char_uuid))
            continue;
        if (!can_notify(o))
        {
            wrong_flags = true;
            continue;
        }
        out.char_path = o.path;
        out.status    = LinkStatus::Ready;
        return out;
    }

    out.status = LinkStatus::CharacteristicNotFound;
    out.detail = "characteristic " + char_uuid +
                 (wrong_flags ? " does not support notify" : " not found") + " in " +
                 out.svc_path;
    return out;
}

}  // namespace transport
