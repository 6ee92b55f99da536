#pragma once

#include <dbus/dbus.h>
#include <optional>
#include <string>
#include <vector>

namespace bluez {

constexpr const char* SERVICE = "org.bluez";
constexpr const char* ADAPTER_IFACE = "org.bluez.Adapter1";
constexpr const char* DEVICE_IFACE = "org.bluez.Device1";
constexpr const char* CHARACTERISTIC_IFACE = "org.bluez.GattCharacteristic1";

// Device info
struct DeviceInfo {
    std::string path;       // D-Bus object path
    std::string address;    // MAC address
    std::string name;
    bool connected;
    bool paired;
};

// Check if an advertised name belongs to a mug
bool is_mug_name(const std::string& name);

// Get adapter path (usually /org/bluez/hci0)
std::optional<std::string> get_adapter_path(DBusConnection* conn);

// BlueZ device path for a MAC address under an adapter
std::string get_device_path(const std::string& adapter_path, const std::string& mac_address);

// All devices BlueZ knows about whose name matches a mug
std::vector<DeviceInfo> find_mugs(DBusConnection* conn);

// Device info for an object path
DeviceInfo get_device_info(DBusConnection* conn, const std::string& device_path);

// Start BLE discovery
bool start_discovery(DBusConnection* conn);

// Stop discovery
void stop_discovery(DBusConnection* conn);

// Blocking Device1 calls, for one-shot tools
bool connect_device(DBusConnection* conn, const std::string& device_path);
bool disconnect_device(DBusConnection* conn, const std::string& device_path);
bool pair_device(DBusConnection* conn, const std::string& device_path);

// Trust device (for auto-reconnect)
bool trust_device(DBusConnection* conn, const std::string& device_path);

// Blocking property reads, empty/false on error
std::string get_string_property(DBusConnection* conn, const char* path,
                                const char* iface, const char* prop);
bool get_bool_property(DBusConnection* conn, const char* path,
                       const char* iface, const char* prop);

} // namespace bluez
