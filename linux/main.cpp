#include "bluez.hpp"
#include "dbus.hpp"
#include "event_loop.hpp"
#include "gatt.hpp"

#include <client/session.hpp>
#include <protocol/codec.hpp>
#include <types/config.hpp>

#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

// Global state (for daemon mode)
static std::atomic<bool> g_running{true};
static DBusConnection* g_session_dbus = nullptr;
static DBusConnection* g_system_dbus = nullptr;
static dbus_service::State g_dbus_state;
static dbus_service::Callbacks g_dbus_callbacks;

// Signal handler
static void signal_handler(int signum) {
    (void)signum;
    g_running = false;
}

static DBusConnection* connect_bus(DBusBusType type, const char* label) {
    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get(type, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "Failed to connect to " << label << " D-Bus: " << err.message << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }
    return conn;
}

// ============================================================================
// Subcommand implementations
// ============================================================================

static int cmd_daemon(const ember::Config& config) {
    // Set up signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::cout << "Ember mug daemon starting for " << config.address
              << " (" << (config.use_metric ? "C" : "F") << ")" << std::endl;

    // Connect to system D-Bus (for BlueZ)
    g_system_dbus = connect_bus(DBUS_BUS_SYSTEM, "system");
    if (!g_system_dbus) return 1;

    auto adapter = bluez::get_adapter_path(g_system_dbus);
    if (!adapter) {
        std::cerr << "No Bluetooth adapter found" << std::endl;
        dbus_connection_unref(g_system_dbus);
        return 1;
    }
    std::string device_path = bluez::get_device_path(*adapter, config.address);

    // Trust a known, paired mug so BlueZ reconnects it on its own
    auto known = bluez::get_device_info(g_system_dbus, device_path);
    if (known.paired) {
        bluez::trust_device(g_system_dbus, device_path);
    }

    // Initialize session D-Bus service
    g_session_dbus = dbus_service::init(&g_dbus_callbacks, &g_dbus_state);
    if (!g_session_dbus) {
        std::cerr << "Failed to initialize D-Bus service" << std::endl;
        dbus_connection_unref(g_system_dbus);
        return 1;
    }

    if (!dbus_service::request_name(g_session_dbus)) {
        std::cerr << "Failed to request D-Bus name" << std::endl;
        dbus_service::cleanup(g_session_dbus);
        dbus_connection_unref(g_system_dbus);
        return 1;
    }

    event_loop::EventLoop loop;
    loop.add_connection(g_system_dbus);
    loop.add_connection(g_session_dbus);

    {
        bluez::GattTransport transport(g_system_dbus, loop, config.address, device_path,
                                       config.transport_timeout,
                                       config.services_resolved_timeout);

        std::unique_ptr<ember::Session> session;
        session = std::make_unique<ember::Session>(transport, loop, config, [&session, &config]() {
            dbus_service::update_from_mug_state(g_session_dbus, &g_dbus_state,
                                                session->snapshot(), config.use_metric);
        });

        // Set up D-Bus service callbacks
        g_dbus_callbacks.on_set_target_temperature = [&session, &config](double value,
                                                                         dbus_service::Reply reply) {
            double celsius = config.use_metric ? value : ember::codec::fahrenheit_to_celsius(value);
            session->set_target_temperature(celsius, std::move(reply));
        };

        g_dbus_callbacks.on_disconnect = []() {
            g_running = false;
        };

        dbus_service::update_from_mug_state(g_session_dbus, &g_dbus_state,
                                            session->snapshot(), config.use_metric);
        session->start();

        std::cout << "Daemon ready. D-Bus service: " << dbus_service::SERVICE_NAME << std::endl;

        // Run event loop
        loop.run([]() { return g_running.load(); });

        // Graceful shutdown: let in-flight operations and the disconnect finish
        std::cout << "Shutting down..." << std::endl;
        bool closed = false;
        session->disconnect([&closed]() { closed = true; });

        auto deadline = event_loop::EventLoop::Clock::now() + 2 * config.transport_timeout;
        loop.run([&closed, deadline]() {
            return !closed && event_loop::EventLoop::Clock::now() < deadline;
        });
        if (!closed) {
            std::cerr << "Timed out waiting for disconnect" << std::endl;
        }

        g_dbus_callbacks = {};
    }

    // Cleanup
    dbus_service::cleanup(g_session_dbus);
    dbus_connection_unref(g_system_dbus);

    std::cout << "Daemon stopped" << std::endl;
    return 0;
}

static int cmd_scan(int seconds) {
    DBusConnection* conn = connect_bus(DBUS_BUS_SYSTEM, "system");
    if (!conn) return 1;

    std::cout << "Scanning for " << seconds << "s..." << std::flush;
    if (!bluez::start_discovery(conn)) {
        std::cerr << "\nFailed to start discovery" << std::endl;
        dbus_connection_unref(conn);
        return 1;
    }

    // BlueZ keeps discovering in the background
    constexpr int poll_interval_ms = 500;
    for (int elapsed_ms = 0; elapsed_ms < seconds * 1000; elapsed_ms += poll_interval_ms) {
        usleep(poll_interval_ms * 1000);
        if ((elapsed_ms % 2000) == 0) {
            std::cout << "." << std::flush;
        }
    }
    bluez::stop_discovery(conn);
    std::cout << std::endl;

    auto mugs = bluez::find_mugs(conn);
    if (mugs.empty()) {
        std::cout << "No mugs found" << std::endl;
        dbus_connection_unref(conn);
        return 1;
    }

    for (const auto& mug : mugs) {
        std::cout << mug.address << "  " << mug.name
                  << (mug.paired ? "  (paired)" : "") << std::endl;

        // Probe: a mug that connects and pairs is ready for the daemon
        bool connected = bluez::connect_device(conn, mug.path);
        bool paired = connected && bluez::pair_device(conn, mug.path);
        std::cout << "  connect: " << (connected ? "ok" : "failed")
                  << ", pair: " << (paired ? "ok" : "failed") << std::endl;
        if (connected) {
            bluez::disconnect_device(conn, mug.path);
        }
    }

    dbus_connection_unref(conn);
    return 0;
}

static int cmd_status() {
    DBusConnection* conn = connect_bus(DBUS_BUS_SESSION, "session");
    if (!conn) return 1;

    // Get all properties
    DBusMessage* msg = dbus_message_new_method_call(
        dbus_service::SERVICE_NAME,
        dbus_service::OBJECT_PATH,
        "org.freedesktop.DBus.Properties",
        "GetAll"
    );
    if (!msg) {
        dbus_connection_unref(conn);
        return 1;
    }

    const char* iface = dbus_service::INTERFACE_NAME;
    dbus_message_append_args(msg, DBUS_TYPE_STRING, &iface, DBUS_TYPE_INVALID);

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 2000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        std::cerr << "Failed to get status (is daemon running?): " << err.message << std::endl;
        dbus_error_free(&err);
        dbus_connection_unref(conn);
        return 1;
    }

    if (reply) {
        DBusMessageIter iter, dict;
        if (dbus_message_iter_init(reply, &iter) &&
            dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_ARRAY) {

            dbus_message_iter_recurse(&iter, &dict);

            while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
                DBusMessageIter entry, variant;
                dbus_message_iter_recurse(&dict, &entry);

                const char* prop_name;
                dbus_message_iter_get_basic(&entry, &prop_name);
                dbus_message_iter_next(&entry);
                dbus_message_iter_recurse(&entry, &variant);

                int type = dbus_message_iter_get_arg_type(&variant);
                if (type == DBUS_TYPE_STRING) {
                    const char* val;
                    dbus_message_iter_get_basic(&variant, &val);
                    std::cout << prop_name << ": " << val << std::endl;
                } else if (type == DBUS_TYPE_BOOLEAN) {
                    dbus_bool_t val;
                    dbus_message_iter_get_basic(&variant, &val);
                    std::cout << prop_name << ": " << (val ? "true" : "false") << std::endl;
                } else if (type == DBUS_TYPE_INT32) {
                    dbus_int32_t val;
                    dbus_message_iter_get_basic(&variant, &val);
                    std::cout << prop_name << ": ";
                    if (val < 0) std::cout << "(unknown)"; else std::cout << val;
                    std::cout << std::endl;
                } else if (type == DBUS_TYPE_DOUBLE) {
                    double val;
                    dbus_message_iter_get_basic(&variant, &val);
                    std::cout << prop_name << ": ";
                    if (std::isnan(val)) std::cout << "(unknown)"; else std::cout << val;
                    std::cout << std::endl;
                }

                dbus_message_iter_next(&dict);
            }
        }
        dbus_message_unref(reply);
    }

    dbus_connection_unref(conn);
    return 0;
}

static int cmd_set_temperature(const char* value_str) {
    char* end = nullptr;
    double value = std::strtod(value_str, &end);
    if (end == value_str || *end != '\0' || !std::isfinite(value)) {
        std::cerr << "Invalid temperature: " << value_str << std::endl;
        return 1;
    }

    DBusConnection* conn = connect_bus(DBUS_BUS_SESSION, "session");
    if (!conn) return 1;

    DBusMessage* msg = dbus_message_new_method_call(
        dbus_service::SERVICE_NAME,
        dbus_service::OBJECT_PATH,
        dbus_service::INTERFACE_NAME,
        "SetTargetTemperature"
    );
    if (!msg) {
        dbus_connection_unref(conn);
        return 1;
    }

    dbus_message_append_args(msg, DBUS_TYPE_DOUBLE, &value, DBUS_TYPE_INVALID);

    // The write waits behind whatever the daemon is doing on the link
    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 60000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        std::cerr << "SetTargetTemperature failed: " << err.message << std::endl;
        dbus_error_free(&err);
        dbus_connection_unref(conn);
        return 1;
    }

    if (reply) dbus_message_unref(reply);
    dbus_connection_unref(conn);

    std::cout << "Target temperature set to: " << value << std::endl;
    return 0;
}

static int cmd_diagnostics() {
    DBusConnection* conn = connect_bus(DBUS_BUS_SESSION, "session");
    if (!conn) return 1;

    DBusMessage* msg = dbus_message_new_method_call(
        dbus_service::SERVICE_NAME,
        dbus_service::OBJECT_PATH,
        dbus_service::INTERFACE_NAME,
        "GetDiagnostics"
    );
    if (!msg) {
        dbus_connection_unref(conn);
        return 1;
    }

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 2000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        std::cerr << "GetDiagnostics failed (is daemon running?): " << err.message << std::endl;
        dbus_error_free(&err);
        dbus_connection_unref(conn);
        return 1;
    }

    int count = 0;
    if (reply) {
        DBusMessageIter iter, dict;
        if (dbus_message_iter_init(reply, &iter) &&
            dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_ARRAY) {

            dbus_message_iter_recurse(&iter, &dict);

            while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
                DBusMessageIter entry;
                dbus_message_iter_recurse(&dict, &entry);

                const char* uuid;
                const char* hex;
                dbus_message_iter_get_basic(&entry, &uuid);
                dbus_message_iter_next(&entry);
                dbus_message_iter_get_basic(&entry, &hex);
                std::cout << uuid << ": " << hex << std::endl;
                count++;

                dbus_message_iter_next(&dict);
            }
        }
        dbus_message_unref(reply);
    }

    if (count == 0) {
        std::cout << "No diagnostic readings yet" << std::endl;
    }

    dbus_connection_unref(conn);
    return 0;
}

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  daemon <address> [--imperial] [--diagnostics N]\n"
              << "                      Run the mug daemon (diagnostic sweep every N polls, 0 = off)\n"
              << "  scan [seconds]      Discover nearby mugs and try connect/pair\n"
              << "  status              Show current status\n"
              << "  set-temp <value>    Set target temperature in the daemon's unit\n"
              << "  diagnostics         Show raw readings of unidentified characteristics\n"
              << "  help                Show this help\n";
}

// Parse "daemon <address> [--imperial] [--diagnostics N]"
static bool parse_daemon_args(int argc, char* argv[], ember::Config* config) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " daemon <address> [--imperial] [--diagnostics N]\n";
        return false;
    }

    if (!ember::codec::parse_address(argv[2])) {
        std::cerr << "Invalid address: " << argv[2] << " (expected AA:BB:CC:DD:EE:FF)" << std::endl;
        return false;
    }
    config->address = argv[2];

    for (int i = 3; i < argc; i++) {
        if (strcmp(argv[i], "--imperial") == 0) {
            config->use_metric = false;
        } else if (strcmp(argv[i], "--diagnostics") == 0 && i + 1 < argc) {
            char* end = nullptr;
            long every = std::strtol(argv[++i], &end, 10);
            if (*end != '\0' || every < 0) {
                std::cerr << "Invalid --diagnostics value: " << argv[i] << std::endl;
                return false;
            }
            config->diagnostic_every = static_cast<int>(every);
        } else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            return false;
        }
    }
    return true;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "daemon") {
        ember::Config config;
        if (!parse_daemon_args(argc, argv, &config)) {
            return 1;
        }
        return cmd_daemon(config);
    } else if (cmd == "scan") {
        int seconds = 10;
        if (argc >= 3) {
            seconds = std::atoi(argv[2]);
            if (seconds <= 0) {
                std::cerr << "Invalid scan duration: " << argv[2] << std::endl;
                return 1;
            }
        }
        return cmd_scan(seconds);
    } else if (cmd == "status") {
        return cmd_status();
    } else if (cmd == "set-temp") {
        if (argc < 3) {
            std::cerr << "Usage: " << argv[0] << " set-temp <value>\n";
            return 1;
        }
        return cmd_set_temperature(argv[2]);
    } else if (cmd == "diagnostics") {
        return cmd_diagnostics();
    } else if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_usage(argv[0]);
        return 0;
    } else {
        std::cerr << "Unknown command: " << cmd << std::endl;
        print_usage(argv[0]);
        return 1;
    }
}
