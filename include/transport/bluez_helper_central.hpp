// include/transport/bluez_helper_central.hpp
#pragma once

#if BLERX_HAVE_SDBUS
#include <systemd/sd-bus.h>

#include "transport/gatt_resolve.hpp"

namespace transport
{

// Object tree readers. Both append Device1 / GattService1 /
// GattCharacteristic1 objects to tree and skip everything else.
// m positioned at an a{sa{sv}} (InterfacesAdded body after the path)
int read_object_ifaces(sd_bus_message *m, const char *path, ObjectTree &tree);
// ObjectManager.GetManagedObjects on org.bluez; bus lock held
int read_managed_objects(sd_bus *bus, ObjectTree &tree);

// Central-side DBus callbacks, userdata is the BluezTransport
int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_connect_reply(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);

}  // namespace transport
#endif  // BLERX_HAVE_SDBUS
