#include "dbus.hpp"

#include <protocol/codec.hpp>
#include <types/enums.hpp>

#include <cmath>
#include <cstring>
#include <iostream>
#include <limits>
#include <vector>

namespace dbus_service {

// Global pointers for callbacks (set in init)
static Callbacks* g_callbacks = nullptr;
static State* g_state = nullptr;

// Introspection XML
static const char* INTROSPECT_XML =
    "<!DOCTYPE node PUBLIC \"-//freedesktop//DTD D-BUS Object Introspection 1.0//EN\"\n"
    "\"http://www.freedesktop.org/standards/dbus/1.0/introspect.dtd\">\n"
    "<node>\n"
    "  <interface name=\"com.ember.Mug\">\n"
    "    <method name=\"SetTargetTemperature\">\n"
    "      <arg name=\"value\" type=\"d\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"GetDiagnostics\">\n"
    "      <arg name=\"readings\" type=\"a{ss}\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"Disconnect\"/>\n"
    "    <property name=\"Address\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"ConnectionStatus\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"Connected\" type=\"b\" access=\"read\"/>\n"
    "    <property name=\"Available\" type=\"b\" access=\"read\"/>\n"
    "    <property name=\"Status\" type=\"i\" access=\"read\"/>\n"
    "    <property name=\"CurrentTemperature\" type=\"d\" access=\"read\"/>\n"
    "    <property name=\"TargetTemperature\" type=\"d\" access=\"read\"/>\n"
    "    <property name=\"Battery\" type=\"d\" access=\"read\"/>\n"
    "    <property name=\"Color\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"Unit\" type=\"s\" access=\"read\"/>\n"
    "  </interface>\n"
    "  <interface name=\"org.freedesktop.DBus.Properties\">\n"
    "    <method name=\"Get\">\n"
    "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"property\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"value\" type=\"v\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"GetAll\">\n"
    "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"properties\" type=\"a{sv}\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <signal name=\"PropertiesChanged\">\n"
    "      <arg name=\"interface\" type=\"s\"/>\n"
    "      <arg name=\"changed_properties\" type=\"a{sv}\"/>\n"
    "      <arg name=\"invalidated_properties\" type=\"as\"/>\n"
    "    </signal>\n"
    "  </interface>\n"
    "  <interface name=\"org.freedesktop.DBus.Introspectable\">\n"
    "    <method name=\"Introspect\">\n"
    "      <arg name=\"xml\" type=\"s\" direction=\"out\"/>\n"
    "    </method>\n"
    "  </interface>\n"
    "</node>\n";

static const char* PROPERTY_NAMES[] = {
    "Address", "ConnectionStatus", "Connected", "Available", "Status",
    "CurrentTemperature", "TargetTemperature", "Battery", "Color", "Unit",
};

// Helper to append variant with string
static void append_variant_string(DBusMessageIter* iter, const char* value) {
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "s", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &value);
    dbus_message_iter_close_container(iter, &variant);
}

// Helper to append variant with bool
static void append_variant_bool(DBusMessageIter* iter, dbus_bool_t value) {
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "b", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_BOOLEAN, &value);
    dbus_message_iter_close_container(iter, &variant);
}

// Helper to append variant with int32
static void append_variant_int32(DBusMessageIter* iter, dbus_int32_t value) {
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "i", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_INT32, &value);
    dbus_message_iter_close_container(iter, &variant);
}

// Helper to append variant with double
static void append_variant_double(DBusMessageIter* iter, double value) {
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "d", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_DOUBLE, &value);
    dbus_message_iter_close_container(iter, &variant);
}

// Append the value of prop as a variant, false if there is no such property
static bool append_property(DBusMessageIter* iter, const State& state, const char* prop) {
    if (strcmp(prop, "Address") == 0) {
        append_variant_string(iter, state.address.c_str());
    } else if (strcmp(prop, "ConnectionStatus") == 0) {
        append_variant_string(iter, state.connection_status.c_str());
    } else if (strcmp(prop, "Connected") == 0) {
        append_variant_bool(iter, state.connected);
    } else if (strcmp(prop, "Available") == 0) {
        append_variant_bool(iter, state.available);
    } else if (strcmp(prop, "Status") == 0) {
        append_variant_int32(iter, state.status);
    } else if (strcmp(prop, "CurrentTemperature") == 0) {
        append_variant_double(iter, state.current_temperature);
    } else if (strcmp(prop, "TargetTemperature") == 0) {
        append_variant_double(iter, state.target_temperature);
    } else if (strcmp(prop, "Battery") == 0) {
        append_variant_double(iter, state.battery);
    } else if (strcmp(prop, "Color") == 0) {
        append_variant_string(iter, state.color.c_str());
    } else if (strcmp(prop, "Unit") == 0) {
        append_variant_string(iter, state.unit.c_str());
    } else {
        return false;
    }
    return true;
}

// Append {name: value} entries for the given properties
static void append_property_dict(DBusMessageIter* iter, const State& state,
                                 const char* const* names, int count) {
    DBusMessageIter dict, entry;
    dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, "{sv}", &dict);

    for (int i = 0; i < count; i++) {
        const char* prop = names[i];
        dbus_message_iter_open_container(&dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &prop);
        append_property(&entry, state, prop);
        dbus_message_iter_close_container(&dict, &entry);
    }

    dbus_message_iter_close_container(iter, &dict);
}

// Handle Get property
static DBusMessage* handle_get(DBusMessage* msg, const State& state) {
    const char* iface;
    const char* prop;

    if (!dbus_message_get_args(msg, nullptr,
            DBUS_TYPE_STRING, &iface,
            DBUS_TYPE_STRING, &prop,
            DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Invalid arguments");
    }

    if (strcmp(iface, INTERFACE_NAME) != 0) {
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_INTERFACE, "Unknown interface");
    }

    DBusMessage* reply = dbus_message_new_method_return(msg);
    DBusMessageIter iter;
    dbus_message_iter_init_append(reply, &iter);

    if (!append_property(&iter, state, prop)) {
        dbus_message_unref(reply);
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_PROPERTY, "Unknown property");
    }

    return reply;
}

// Handle GetAll properties
static DBusMessage* handle_get_all(DBusMessage* msg, const State& state) {
    const char* iface;

    if (!dbus_message_get_args(msg, nullptr,
            DBUS_TYPE_STRING, &iface,
            DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Invalid arguments");
    }

    if (strcmp(iface, INTERFACE_NAME) != 0) {
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_INTERFACE, "Unknown interface");
    }

    DBusMessage* reply = dbus_message_new_method_return(msg);
    DBusMessageIter iter;
    dbus_message_iter_init_append(reply, &iter);
    append_property_dict(&iter, state, PROPERTY_NAMES,
                         static_cast<int>(sizeof(PROPERTY_NAMES) / sizeof(PROPERTY_NAMES[0])));
    return reply;
}

// Handle GetDiagnostics
static DBusMessage* handle_get_diagnostics(DBusMessage* msg, const State& state) {
    DBusMessage* reply = dbus_message_new_method_return(msg);
    DBusMessageIter iter, dict, entry;
    dbus_message_iter_init_append(reply, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{ss}", &dict);

    for (const auto& [uuid, hex] : state.diagnostics) {
        const char* key = uuid.c_str();
        const char* val = hex.c_str();
        dbus_message_iter_open_container(&dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &val);
        dbus_message_iter_close_container(&dict, &entry);
    }

    dbus_message_iter_close_container(&iter, &dict);
    return reply;
}

// Handle SetTargetTemperature, replies once the write completes
static DBusMessage* handle_set_target_temperature(DBusConnection* conn, DBusMessage* msg) {
    double value;
    if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_DOUBLE, &value, DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected double argument");
    }
    if (!g_callbacks || !g_callbacks->on_set_target_temperature) {
        return dbus_message_new_error(msg, ERROR_FAILED, "Not available");
    }

    std::cout << "dbus: SetTargetTemperature(" << value << ") called" << std::endl;

    dbus_message_ref(msg);
    g_callbacks->on_set_target_temperature(value, [conn, msg](const ember::Status& status) {
        DBusMessage* reply = status
            ? dbus_message_new_error(msg, ERROR_FAILED, status->describe().c_str())
            : dbus_message_new_method_return(msg);
        if (reply) {
            dbus_connection_send(conn, reply, nullptr);
            dbus_message_unref(reply);
        }
        dbus_message_unref(msg);
    });
    return nullptr;
}

// Message handler
static DBusHandlerResult message_handler(DBusConnection* conn, DBusMessage* msg, void* data) {
    (void)data;

    const char* iface = dbus_message_get_interface(msg);
    const char* member = dbus_message_get_member(msg);
    const char* path = dbus_message_get_path(msg);

    if (!path || strcmp(path, OBJECT_PATH) != 0) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    DBusMessage* reply = nullptr;

    // Introspection
    if (iface && strcmp(iface, "org.freedesktop.DBus.Introspectable") == 0 &&
        member && strcmp(member, "Introspect") == 0) {
        reply = dbus_message_new_method_return(msg);
        dbus_message_append_args(reply, DBUS_TYPE_STRING, &INTROSPECT_XML, DBUS_TYPE_INVALID);
    }
    // Properties
    else if (iface && strcmp(iface, "org.freedesktop.DBus.Properties") == 0) {
        if (member && strcmp(member, "Get") == 0) {
            reply = handle_get(msg, *g_state);
        } else if (member && strcmp(member, "GetAll") == 0) {
            reply = handle_get_all(msg, *g_state);
        } else if (member && strcmp(member, "Set") == 0) {
            reply = dbus_message_new_error(msg, DBUS_ERROR_PROPERTY_READ_ONLY, "Property is read-only");
        }
    }
    // Our interface methods
    else if (iface && strcmp(iface, INTERFACE_NAME) == 0) {
        if (member && strcmp(member, "SetTargetTemperature") == 0) {
            reply = handle_set_target_temperature(conn, msg);
            if (!reply) return DBUS_HANDLER_RESULT_HANDLED;
        } else if (member && strcmp(member, "GetDiagnostics") == 0) {
            reply = handle_get_diagnostics(msg, *g_state);
        } else if (member && strcmp(member, "Disconnect") == 0) {
            std::cout << "dbus: Disconnect() called" << std::endl;
            if (g_callbacks && g_callbacks->on_disconnect) g_callbacks->on_disconnect();
            reply = dbus_message_new_method_return(msg);
        }
    }

    if (reply) {
        dbus_connection_send(conn, reply, nullptr);
        dbus_message_unref(reply);
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

DBusConnection* init(Callbacks* callbacks, State* state) {
    g_callbacks = callbacks;
    g_state = state;

    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get(DBUS_BUS_SESSION, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "dbus: connection error: " << err.message << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }

    // Register object path
    DBusObjectPathVTable vtable = {};
    vtable.message_function = message_handler;

    if (!dbus_connection_register_object_path(conn, OBJECT_PATH, &vtable, nullptr)) {
        std::cerr << "dbus: failed to register object path" << std::endl;
        dbus_connection_unref(conn);
        return nullptr;
    }

    return conn;
}

bool request_name(DBusConnection* conn) {
    DBusError err;
    dbus_error_init(&err);

    int ret = dbus_bus_request_name(conn, SERVICE_NAME, DBUS_NAME_FLAG_REPLACE_EXISTING, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "dbus: name error: " << err.message << std::endl;
        dbus_error_free(&err);
        return false;
    }

    if (ret != DBUS_REQUEST_NAME_REPLY_PRIMARY_OWNER) {
        std::cerr << "dbus: not primary owner of " << SERVICE_NAME << std::endl;
        return false;
    }

    std::cout << "dbus: registered service " << SERVICE_NAME << std::endl;
    return true;
}

void emit_properties_changed(DBusConnection* conn, const State& state,
                              const char** property_names, int num_properties) {
    DBusMessage* signal = dbus_message_new_signal(OBJECT_PATH,
        "org.freedesktop.DBus.Properties", "PropertiesChanged");
    if (!signal) return;

    DBusMessageIter iter;
    dbus_message_iter_init_append(signal, &iter);

    // Interface name
    const char* iface = INTERFACE_NAME;
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &iface);

    // Changed properties dict
    append_property_dict(&iter, state, property_names, num_properties);

    // Invalidated properties (empty array)
    DBusMessageIter invalidated;
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "s", &invalidated);
    dbus_message_iter_close_container(&iter, &invalidated);

    dbus_connection_send(conn, signal, nullptr);
    dbus_message_unref(signal);
}

// NaN compares unequal to itself
static bool same_reading(double a, double b) {
    return (std::isnan(a) && std::isnan(b)) || a == b;
}

template <typename T>
static void update(T* field, const T& value, const char* name, std::vector<const char*>* changed) {
    if (!(*field == value)) {
        *field = value;
        changed->push_back(name);
    }
}

static void update_reading(double* field, double value, const char* name,
                           std::vector<const char*>* changed) {
    if (!same_reading(*field, value)) {
        *field = value;
        changed->push_back(name);
    }
}

void update_from_mug_state(DBusConnection* conn, State* state,
                           const ember::MugState& mug, bool metric) {
    constexpr double UNKNOWN = std::numeric_limits<double>::quiet_NaN();
    std::vector<const char*> changed;

    update(&state->address, mug.address, "Address", &changed);
    update(&state->connection_status, std::string(ember::to_string(mug.connection_status)),
           "ConnectionStatus", &changed);
    update(&state->connected, ember::is_link_up(mug.connection_status), "Connected", &changed);
    update(&state->available, mug.available, "Available", &changed);
    update(&state->status, mug.mug_status ? static_cast<int32_t>(*mug.mug_status) : -1,
           "Status", &changed);
    update_reading(&state->current_temperature, mug.current_temperature.value_or(UNKNOWN),
                   "CurrentTemperature", &changed);
    update_reading(&state->target_temperature, mug.target_temperature.value_or(UNKNOWN),
                   "TargetTemperature", &changed);
    update_reading(&state->battery, mug.battery_percent.value_or(UNKNOWN), "Battery", &changed);
    update(&state->color, ember::codec::format_color_hex(mug.led_color), "Color", &changed);
    update(&state->unit, std::string(metric ? "C" : "F"), "Unit", &changed);

    // Not a property; served by GetDiagnostics
    state->diagnostics = mug.diagnostic_readings;

    if (!changed.empty() && conn) {
        emit_properties_changed(conn, *state, changed.data(), static_cast<int>(changed.size()));
    }
}

void cleanup(DBusConnection* conn) {
    if (!conn) return;
    dbus_connection_unregister_object_path(conn, OBJECT_PATH);
    dbus_connection_unref(conn);
}

} // namespace dbus_service
