#pragma once

#include <dbus/dbus.h>
#include <types/error.hpp>
#include <types/mug.hpp>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <string>

namespace dbus_service {

// D-Bus service configuration
constexpr const char* SERVICE_NAME = "com.ember.Mug";
constexpr const char* OBJECT_PATH = "/com/ember/Mug";
constexpr const char* INTERFACE_NAME = "com.ember.Mug";
constexpr const char* ERROR_FAILED = "com.ember.Mug.Error.Failed";

// Completes an asynchronous method call
using Reply = std::function<void(const ember::Status&)>;

// Callbacks for method invocations
struct Callbacks {
    // Value is in the daemon's display unit
    std::function<void(double, Reply)> on_set_target_temperature;
    std::function<void()> on_disconnect;
};

// Current state exposed via D-Bus
struct State {
    std::string address;
    std::string connection_status = "disconnected";
    bool connected = false;
    bool available = false;
    int32_t status = -1;
    double current_temperature = std::numeric_limits<double>::quiet_NaN();
    double target_temperature = std::numeric_limits<double>::quiet_NaN();
    double battery = std::numeric_limits<double>::quiet_NaN();
    std::string color = "#ffffff";
    std::string unit = "C";
    std::map<std::string, std::string> diagnostics;
};

// Initialize D-Bus service, returns connection (caller owns)
// Sets up object path and method handlers
DBusConnection* init(Callbacks* callbacks, State* state);

// Request the service name on the bus
bool request_name(DBusConnection* conn);

// Emit PropertiesChanged signal for given properties
void emit_properties_changed(DBusConnection* conn, const State& state,
                              const char** property_names, int num_properties);

// Update state from MugState and emit signals for what changed
void update_from_mug_state(DBusConnection* conn, State* state,
                           const ember::MugState& mug, bool metric);

// Cleanup
void cleanup(DBusConnection* conn);

} // namespace dbus_service
