#include "bluez.hpp"

#include <protocol/uuids.hpp>

#include <algorithm>
#include <cstring>
#include <iostream>

namespace bluez {

// "Already connected", "AlreadyExists" and friends mean the work is done
static bool is_already_error(const DBusError& err) {
    return (err.name && strstr(err.name, "Already")) ||
           (err.message && (strstr(err.message, "Already") || strstr(err.message, "already")));
}

// Helper to call a method with no arguments and no return
static bool call_method_void(DBusConnection* conn, const char* path, const char* iface,
                             const char* method, int timeout_ms) {
    DBusMessage* msg = dbus_message_new_method_call(SERVICE, path, iface, method);
    if (!msg) return false;

    DBusError err;
    dbus_error_init(&err);

    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, timeout_ms, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        if (is_already_error(err)) {
            dbus_error_free(&err);
            return true;
        }
        std::cerr << "bluez: " << method << " on " << path << " failed: " << err.message << std::endl;
        dbus_error_free(&err);
        return false;
    }

    if (reply) dbus_message_unref(reply);
    return true;
}

// Properties.Get, returns the reply positioned on the variant or nullptr
static DBusMessage* get_property(DBusConnection* conn, const char* path,
                                 const char* iface, const char* prop, DBusMessageIter* variant) {
    DBusMessage* msg = dbus_message_new_method_call(SERVICE, path,
        "org.freedesktop.DBus.Properties", "Get");
    if (!msg) return nullptr;

    dbus_message_append_args(msg, DBUS_TYPE_STRING, &iface,
                             DBUS_TYPE_STRING, &prop, DBUS_TYPE_INVALID);

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 2000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        dbus_error_free(&err);
        return nullptr;
    }
    if (!reply) return nullptr;

    DBusMessageIter iter;
    if (!dbus_message_iter_init(reply, &iter) ||
        dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_VARIANT) {
        dbus_message_unref(reply);
        return nullptr;
    }
    dbus_message_iter_recurse(&iter, variant);
    return reply;
}

std::string get_string_property(DBusConnection* conn, const char* path,
                                const char* iface, const char* prop) {
    DBusMessageIter variant;
    DBusMessage* reply = get_property(conn, path, iface, prop, &variant);
    if (!reply) return "";

    std::string result;
    if (dbus_message_iter_get_arg_type(&variant) == DBUS_TYPE_STRING) {
        const char* val;
        dbus_message_iter_get_basic(&variant, &val);
        result = val;
    }
    dbus_message_unref(reply);
    return result;
}

bool get_bool_property(DBusConnection* conn, const char* path,
                       const char* iface, const char* prop) {
    DBusMessageIter variant;
    DBusMessage* reply = get_property(conn, path, iface, prop, &variant);
    if (!reply) return false;

    bool result = false;
    if (dbus_message_iter_get_arg_type(&variant) == DBUS_TYPE_BOOLEAN) {
        dbus_bool_t val;
        dbus_message_iter_get_basic(&variant, &val);
        result = val;
    }
    dbus_message_unref(reply);
    return result;
}

bool is_mug_name(const std::string& name) {
    return name == ember::uuids::ADVERTISED_NAME;
}

// GetManagedObjects on the BlueZ root; caller unrefs
static DBusMessage* get_managed_objects(DBusConnection* conn) {
    DBusMessage* msg = dbus_message_new_method_call(SERVICE, "/",
        "org.freedesktop.DBus.ObjectManager", "GetManagedObjects");
    if (!msg) return nullptr;

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 5000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        std::cerr << "bluez: GetManagedObjects failed: " << err.message << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }
    return reply;
}

// Walk the a{oa{sa{sv}}} reply, calling visit(path, interface) for each pair
template <typename Visit>
static void for_each_interface(DBusMessage* reply, Visit visit) {
    DBusMessageIter iter, dict;
    if (!dbus_message_iter_init(reply, &iter) ||
        dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) {
        return;
    }

    dbus_message_iter_recurse(&iter, &dict);
    while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter entry, ifaces;
        dbus_message_iter_recurse(&dict, &entry);

        const char* obj_path;
        dbus_message_iter_get_basic(&entry, &obj_path);
        dbus_message_iter_next(&entry);

        if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_ARRAY) {
            dbus_message_iter_recurse(&entry, &ifaces);

            while (dbus_message_iter_get_arg_type(&ifaces) == DBUS_TYPE_DICT_ENTRY) {
                DBusMessageIter iface_entry;
                dbus_message_iter_recurse(&ifaces, &iface_entry);

                const char* iface_name;
                dbus_message_iter_get_basic(&iface_entry, &iface_name);
                if (!visit(obj_path, iface_name)) {
                    return;
                }
                dbus_message_iter_next(&ifaces);
            }
        }
        dbus_message_iter_next(&dict);
    }
}

std::optional<std::string> get_adapter_path(DBusConnection* conn) {
    DBusMessage* reply = get_managed_objects(conn);
    if (!reply) return std::nullopt;

    std::optional<std::string> result;
    for_each_interface(reply, [&result](const char* path, const char* iface) {
        if (strcmp(iface, ADAPTER_IFACE) == 0) {
            result = path;
            return false;
        }
        return true;
    });

    dbus_message_unref(reply);
    return result;
}

std::string get_device_path(const std::string& adapter_path, const std::string& mac_address) {
    std::string result = mac_address;
    std::transform(result.begin(), result.end(), result.begin(), [](char c) {
        return c == ':' ? '_' : static_cast<char>(toupper(static_cast<unsigned char>(c)));
    });
    return adapter_path + "/dev_" + result;
}

DeviceInfo get_device_info(DBusConnection* conn, const std::string& device_path) {
    const char* path = device_path.c_str();
    DeviceInfo info;
    info.path = device_path;
    info.address = get_string_property(conn, path, DEVICE_IFACE, "Address");
    info.name = get_string_property(conn, path, DEVICE_IFACE, "Name");
    info.connected = get_bool_property(conn, path, DEVICE_IFACE, "Connected");
    info.paired = get_bool_property(conn, path, DEVICE_IFACE, "Paired");
    return info;
}

std::vector<DeviceInfo> find_mugs(DBusConnection* conn) {
    std::vector<DeviceInfo> result;

    DBusMessage* reply = get_managed_objects(conn);
    if (!reply) return result;

    std::vector<std::string> device_paths;
    for_each_interface(reply, [&device_paths](const char* path, const char* iface) {
        if (strcmp(iface, DEVICE_IFACE) == 0) {
            device_paths.emplace_back(path);
        }
        return true;
    });
    dbus_message_unref(reply);

    for (const auto& path : device_paths) {
        std::string name = get_string_property(conn, path.c_str(), DEVICE_IFACE, "Name");
        if (is_mug_name(name)) {
            result.push_back(get_device_info(conn, path));
        }
    }
    return result;
}

bool start_discovery(DBusConnection* conn) {
    auto adapter = get_adapter_path(conn);
    if (!adapter) {
        std::cerr << "bluez: no adapter found" << std::endl;
        return false;
    }

    return call_method_void(conn, adapter->c_str(), ADAPTER_IFACE, "StartDiscovery", 5000);
}

void stop_discovery(DBusConnection* conn) {
    auto adapter = get_adapter_path(conn);
    if (!adapter) return;

    call_method_void(conn, adapter->c_str(), ADAPTER_IFACE, "StopDiscovery", 5000);
}

bool connect_device(DBusConnection* conn, const std::string& device_path) {
    return call_method_void(conn, device_path.c_str(), DEVICE_IFACE, "Connect", 30000);
}

bool disconnect_device(DBusConnection* conn, const std::string& device_path) {
    return call_method_void(conn, device_path.c_str(), DEVICE_IFACE, "Disconnect", 5000);
}

bool pair_device(DBusConnection* conn, const std::string& device_path) {
    return call_method_void(conn, device_path.c_str(), DEVICE_IFACE, "Pair", 30000);
}

bool trust_device(DBusConnection* conn, const std::string& device_path) {
    // Set Trusted property to true
    DBusMessage* msg = dbus_message_new_method_call(SERVICE, device_path.c_str(),
        "org.freedesktop.DBus.Properties", "Set");
    if (!msg) return false;

    const char* iface = DEVICE_IFACE;
    const char* prop = "Trusted";
    dbus_message_append_args(msg, DBUS_TYPE_STRING, &iface,
                             DBUS_TYPE_STRING, &prop, DBUS_TYPE_INVALID);

    // Append variant(bool true)
    DBusMessageIter iter, variant;
    dbus_message_iter_init_append(msg, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_VARIANT, "b", &variant);
    dbus_bool_t val = TRUE;
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_BOOLEAN, &val);
    dbus_message_iter_close_container(&iter, &variant);

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 2000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        std::cerr << "bluez: trust_device failed: " << err.message << std::endl;
        dbus_error_free(&err);
        return false;
    }

    if (reply) dbus_message_unref(reply);
    std::cout << "bluez: device trusted" << std::endl;
    return true;
}

} // namespace bluez
