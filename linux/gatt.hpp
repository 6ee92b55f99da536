#pragma once

#include <client/scheduler.hpp>
#include <client/transport.hpp>

#include <dbus/dbus.h>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace bluez {

// ember::Transport over BlueZ's GATT D-Bus API on the system bus.
//
// Calls are asynchronous pending calls completed from the event loop.
// Every call carries its own timeout timer since nothing else drives
// libdbus timeouts in our loop. Notifications arrive as PropertiesChanged
// on the characteristic's "Value".
class GattTransport : public ember::Transport {
public:
    using ReplyHandler = std::function<void(const ember::Status&, DBusMessage* reply)>;

    GattTransport(DBusConnection* conn, ember::Scheduler& scheduler,
                  std::string address, std::string device_path,
                  std::chrono::milliseconds call_timeout,
                  std::chrono::milliseconds resolve_timeout);
    ~GattTransport() override;

    GattTransport(const GattTransport&) = delete;
    GattTransport& operator=(const GattTransport&) = delete;

    const std::string& address() const override { return address_; }
    bool is_connected() const override { return connected_; }

    void connect(DoneHandler done) override;
    void pair(DoneHandler done) override;
    void disconnect(DoneHandler done) override;

    void read_characteristic(const std::string& uuid, ReadHandler done) override;
    void write_characteristic(const std::string& uuid, const ember::Bytes& value,
                              bool response, DoneHandler done) override;

    void subscribe(const std::string& uuid, NotifyHandler on_value, DoneHandler done) override;
    void unsubscribe(const std::string& uuid, DoneHandler done) override;

private:
    struct Subscription {
        std::string uuid;
        NotifyHandler on_value;
    };

    // Send msg (takes ownership) and complete on_reply from the scheduler
    void call(DBusMessage* msg, const std::string& operation, ReplyHandler on_reply);

    void wait_services_resolved(DoneHandler done);
    void finish_resolve(const ember::Status& status);
    void load_characteristics(DoneHandler done);
    void link_down();

    // Object path of a characteristic, empty if unknown
    std::string characteristic_path(const std::string& uuid) const;

    // Post an immediate failure
    void fail(DoneHandler done, const std::string& operation, const std::string& message);

    static DBusHandlerResult filter(DBusConnection* conn, DBusMessage* msg, void* user_data);
    void handle_properties_changed(DBusMessage* msg);

    DBusConnection* conn_;
    ember::Scheduler& scheduler_;
    std::string address_;
    std::string device_path_;
    std::chrono::milliseconds call_timeout_;
    std::chrono::milliseconds resolve_timeout_;
    std::string match_rule_;

    bool connected_ = false;
    bool services_resolved_ = false;
    std::vector<DoneHandler> resolve_waiters_;
    uint64_t resolve_wait_ = 0;

    // Characteristic UUID -> object path
    std::map<std::string, std::string> characteristics_;
    // Characteristic object path -> subscriber
    std::map<std::string, Subscription> subscriptions_;

    // Expires with the transport; checked by everything posted
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace bluez
