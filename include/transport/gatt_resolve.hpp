#pragma once
#include <cctype>
#include <string>
#include <vector>

#include "transport/itransport.hpp"

// Pure queries over a snapshot of the org.bluez object tree. The bus code
// fills an ObjectTree; everything here is testable without a bus.

namespace transport
{

struct DeviceObject
{
    std::string path;  // /org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF
    std::string address;
    bool        connected         = false;
    bool        services_resolved = false;
};

// One org.bluez GATT object as seen in the ObjectManager tree
struct GattObject
{
    enum class Kind
    {
        Service,
        Characteristic
    };
    std::string              path;
    Kind                     kind = Kind::Service;
    std::string              uuid;
    std::vector<std::string> flags;  // characteristic Flags (empty if unknown)
};

struct ObjectTree
{
    std::vector<DeviceObject> devices;
    std::vector<GattObject>   gatt;
};

struct GattSetup
{
    LinkStatus  status = LinkStatus::ServiceNotFound;
    std::string svc_path;
    std::string char_path;
    std::string detail;

    bool ok() const { return status == LinkStatus::Ready; }
};

// The Device1 object of adapter that is the peer with address mac, or nullptr.
// Matches the Address property, or the dev_XX_XX.. path when Address is absent.
const DeviceObject *find_peer_device(const std::vector<DeviceObject> &devices,
                                     const std::string               &adapter,
                                     const std::string               &mac);

// Pick the service and its notify characteristic under dev_path.
// status is Ready, ServiceNotFound or CharacteristicNotFound.
GattSetup resolve_gatt(const std::vector<GattObject> &objects,
                       const std::string             &dev_path,
                       const std::string             &svc_uuid,
                       const std::string             &char_uuid);

// case-insensitive; UUIDs and MACs only differ in hex digit case
inline bool same_id(const std::string &a, const std::string &b)
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i]))
            return false;
    }
    return true;
}

}  // namespace transport
