#include "gatt.hpp"
#include "bluez.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iostream>

namespace bluez {

namespace {

using ember::Status;

struct PendingReply {
    std::weak_ptr<bool> alive;
    ember::Scheduler* scheduler = nullptr;
    std::string operation;
    GattTransport::ReplyHandler on_reply;
    DBusPendingCall* pending = nullptr;
    bool finished = false;

    void release() {
        if (pending) {
            dbus_pending_call_unref(pending);
            pending = nullptr;
        }
    }
};

using MessagePtr = std::shared_ptr<DBusMessage>;

MessagePtr adopt(DBusMessage* msg) {
    return MessagePtr(msg, [](DBusMessage* m) {
        if (m) dbus_message_unref(m);
    });
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

void on_pending_complete(DBusPendingCall* pending, void* user_data) {
    auto state = *static_cast<std::shared_ptr<PendingReply>*>(user_data);
    if (state->finished) return;
    state->finished = true;

    MessagePtr reply = adopt(dbus_pending_call_steal_reply(pending));
    state->release();

    Status status;
    if (!reply) {
        status = ember::transport_error(state->operation, "no reply");
    } else if (dbus_message_get_type(reply.get()) == DBUS_MESSAGE_TYPE_ERROR) {
        DBusError err;
        dbus_error_init(&err);
        dbus_set_error_from_message(&err, reply.get());
        std::string message = err.name ? err.name : "unknown error";
        if (err.message) {
            message += ": ";
            message += err.message;
        }
        dbus_error_free(&err);
        status = ember::transport_error(state->operation, message);
    }

    state->scheduler->post([state, status, reply] {
        if (state->alive.expired()) return;
        state->on_reply(status, status ? nullptr : reply.get());
    });
}

void free_pending(void* user_data) {
    delete static_cast<std::shared_ptr<PendingReply>*>(user_data);
}

DBusMessage* device_call(const std::string& path, const char* method) {
    return dbus_message_new_method_call(SERVICE, path.c_str(), DEVICE_IFACE, method);
}

// Append an empty a{sv} options dict
void append_empty_options(DBusMessageIter* iter) {
    DBusMessageIter dict;
    dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, "{sv}", &dict);
    dbus_message_iter_close_container(iter, &dict);
}

// Append {"type": <type>} as the a{sv} options of WriteValue
void append_write_options(DBusMessageIter* iter, const char* type) {
    DBusMessageIter dict, entry, variant;
    const char* key = "type";
    dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, "{sv}", &dict);
    dbus_message_iter_open_container(&dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "s", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &type);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(&dict, &entry);
    dbus_message_iter_close_container(iter, &dict);
}

void append_bytes(DBusMessageIter* iter, const ember::Bytes& value) {
    DBusMessageIter array;
    const uint8_t* data = value.data();
    dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, "y", &array);
    dbus_message_iter_append_fixed_array(&array, DBUS_TYPE_BYTE, &data,
                                         static_cast<int>(value.size()));
    dbus_message_iter_close_container(iter, &array);
}

// Read an "ay" at iter
ember::Bytes read_bytes(DBusMessageIter* iter) {
    ember::Bytes out;
    if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY ||
        dbus_message_iter_get_element_type(iter) != DBUS_TYPE_BYTE) {
        return out;
    }
    DBusMessageIter array;
    dbus_message_iter_recurse(iter, &array);
    const uint8_t* data = nullptr;
    int len = 0;
    dbus_message_iter_get_fixed_array(&array, &data, &len);
    if (data && len > 0) {
        out.assign(data, data + len);
    }
    return out;
}

bool read_variant_bool(DBusMessageIter* variant, bool* out) {
    if (dbus_message_iter_get_arg_type(variant) != DBUS_TYPE_BOOLEAN) return false;
    dbus_bool_t val;
    dbus_message_iter_get_basic(variant, &val);
    *out = val;
    return true;
}

} // namespace

GattTransport::GattTransport(DBusConnection* conn, ember::Scheduler& scheduler,
                             std::string address, std::string device_path,
                             std::chrono::milliseconds call_timeout,
                             std::chrono::milliseconds resolve_timeout)
    : conn_(conn),
      scheduler_(scheduler),
      address_(std::move(address)),
      device_path_(std::move(device_path)),
      call_timeout_(call_timeout),
      resolve_timeout_(resolve_timeout) {
    match_rule_ = "type='signal',sender='org.bluez',"
                  "interface='org.freedesktop.DBus.Properties',member='PropertiesChanged',"
                  "path_namespace='" + device_path_ + "'";

    DBusError err;
    dbus_error_init(&err);
    dbus_bus_add_match(conn_, match_rule_.c_str(), &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "gatt: failed to add PropertiesChanged match: " << err.message << std::endl;
        dbus_error_free(&err);
    }
    dbus_connection_add_filter(conn_, filter, this, nullptr);

    // BlueZ may already hold the link from an earlier run
    connected_ = get_bool_property(conn_, device_path_.c_str(), DEVICE_IFACE, "Connected");
    services_resolved_ = connected_ &&
        get_bool_property(conn_, device_path_.c_str(), DEVICE_IFACE, "ServicesResolved");
}

GattTransport::~GattTransport() {
    dbus_connection_remove_filter(conn_, filter, this);
    dbus_bus_remove_match(conn_, match_rule_.c_str(), nullptr);
}

void GattTransport::call(DBusMessage* msg, const std::string& operation, ReplyHandler on_reply) {
    if (!msg) {
        scheduler_.post([on_reply, operation] {
            on_reply(ember::transport_error(operation, "out of memory"), nullptr);
        });
        return;
    }

    auto state = std::make_shared<PendingReply>();
    state->alive = alive_;
    state->scheduler = &scheduler_;
    state->operation = operation;
    state->on_reply = std::move(on_reply);

    DBusPendingCall* pending = nullptr;
    bool sent = dbus_connection_send_with_reply(conn_, msg, &pending,
                                                static_cast<int>(call_timeout_.count()));
    dbus_message_unref(msg);

    if (!sent || !pending) {
        state->finished = true;
        scheduler_.post([state] {
            if (state->alive.expired()) return;
            state->on_reply(ember::transport_error(state->operation, "bus disconnected"), nullptr);
        });
        return;
    }

    state->pending = pending;
    if (!dbus_pending_call_set_notify(pending, on_pending_complete,
                                      new std::shared_ptr<PendingReply>(state), free_pending)) {
        state->finished = true;
        dbus_pending_call_cancel(pending);
        state->release();
        scheduler_.post([state] {
            if (state->alive.expired()) return;
            state->on_reply(ember::transport_error(state->operation, "out of memory"), nullptr);
        });
        return;
    }

    scheduler_.call_later(call_timeout_, [state] {
        if (state->finished) return;
        state->finished = true;
        if (state->pending) {
            dbus_pending_call_cancel(state->pending);
        }
        state->release();
        if (state->alive.expired()) return;
        state->on_reply(ember::transport_error(state->operation, "timed out"), nullptr);
    });
}

void GattTransport::fail(DoneHandler done, const std::string& operation, const std::string& message) {
    std::weak_ptr<bool> alive = alive_;
    scheduler_.post([alive, done = std::move(done), operation, message] {
        if (alive.expired()) return;
        done(ember::transport_error(operation, message));
    });
}

void GattTransport::connect(DoneHandler done) {
    call(device_call(device_path_, "Connect"), "connect",
         [this, done = std::move(done)](const Status& status, DBusMessage*) {
        if (status && !contains(status->message, "Already")) {
            if (contains(status->message, "UnknownObject")) {
                // BlueZ forgets unseen LE devices; scan so the next attempt finds it
                std::cerr << "gatt: " << address_ << " unknown to BlueZ, starting discovery" << std::endl;
                start_discovery(conn_);
            }
            done(status);
            return;
        }

        connected_ = true;
        wait_services_resolved([this, done](const Status& resolved) {
            if (resolved) {
                done(resolved);
                return;
            }
            load_characteristics(done);
        });
    });
}

void GattTransport::pair(DoneHandler done) {
    call(device_call(device_path_, "Pair"), "pair",
         [done = std::move(done)](const Status& status, DBusMessage*) {
        if (status && contains(status->message, "AlreadyExists")) {
            done(std::nullopt);
            return;
        }
        done(status);
    });
}

void GattTransport::disconnect(DoneHandler done) {
    call(device_call(device_path_, "Disconnect"), "disconnect",
         [this, done = std::move(done)](const Status& status, DBusMessage*) {
        if (!status) {
            link_down();
        }
        done(status);
    });
}

void GattTransport::wait_services_resolved(DoneHandler done) {
    if (services_resolved_) {
        done(std::nullopt);
        return;
    }

    resolve_waiters_.push_back(std::move(done));
    if (resolve_waiters_.size() > 1) return;

    uint64_t wait = ++resolve_wait_;
    std::weak_ptr<bool> alive = alive_;
    scheduler_.call_later(resolve_timeout_, [this, alive, wait] {
        if (alive.expired() || wait != resolve_wait_) return;
        finish_resolve(ember::transport_error("connect", "timed out waiting for services"));
    });

    // The signal may have fired before we started listening
    DBusMessage* msg = dbus_message_new_method_call(SERVICE, device_path_.c_str(),
        "org.freedesktop.DBus.Properties", "Get");
    if (msg) {
        const char* iface = DEVICE_IFACE;
        const char* prop = "ServicesResolved";
        dbus_message_append_args(msg, DBUS_TYPE_STRING, &iface,
                                 DBUS_TYPE_STRING, &prop, DBUS_TYPE_INVALID);
    }
    call(msg, "connect", [this, wait](const Status& status, DBusMessage* reply) {
        if (status || wait != resolve_wait_) return;

        DBusMessageIter iter, variant;
        if (!dbus_message_iter_init(reply, &iter) ||
            dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_VARIANT) {
            return;
        }
        dbus_message_iter_recurse(&iter, &variant);
        bool resolved = false;
        if (read_variant_bool(&variant, &resolved) && resolved) {
            services_resolved_ = true;
            finish_resolve(std::nullopt);
        }
    });
}

void GattTransport::finish_resolve(const Status& status) {
    ++resolve_wait_;
    auto waiters = std::move(resolve_waiters_);
    resolve_waiters_.clear();
    for (auto& waiter : waiters) {
        waiter(status);
    }
}

void GattTransport::load_characteristics(DoneHandler done) {
    DBusMessage* msg = dbus_message_new_method_call(SERVICE, "/",
        "org.freedesktop.DBus.ObjectManager", "GetManagedObjects");

    call(msg, "connect", [this, done = std::move(done)](const Status& status, DBusMessage* reply) {
        if (status) {
            done(status);
            return;
        }

        std::string prefix = device_path_ + "/";
        std::map<std::string, std::string> found;

        DBusMessageIter iter, objects;
        if (dbus_message_iter_init(reply, &iter) &&
            dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_ARRAY) {
            dbus_message_iter_recurse(&iter, &objects);

            while (dbus_message_iter_get_arg_type(&objects) == DBUS_TYPE_DICT_ENTRY) {
                DBusMessageIter object, ifaces;
                dbus_message_iter_recurse(&objects, &object);

                const char* obj_path;
                dbus_message_iter_get_basic(&object, &obj_path);
                dbus_message_iter_next(&object);

                if (strncmp(obj_path, prefix.c_str(), prefix.size()) == 0 &&
                    dbus_message_iter_get_arg_type(&object) == DBUS_TYPE_ARRAY) {
                    dbus_message_iter_recurse(&object, &ifaces);

                    while (dbus_message_iter_get_arg_type(&ifaces) == DBUS_TYPE_DICT_ENTRY) {
                        DBusMessageIter iface_entry, props;
                        dbus_message_iter_recurse(&ifaces, &iface_entry);

                        const char* iface_name;
                        dbus_message_iter_get_basic(&iface_entry, &iface_name);
                        dbus_message_iter_next(&iface_entry);

                        if (strcmp(iface_name, CHARACTERISTIC_IFACE) == 0) {
                            dbus_message_iter_recurse(&iface_entry, &props);

                            while (dbus_message_iter_get_arg_type(&props) == DBUS_TYPE_DICT_ENTRY) {
                                DBusMessageIter prop_entry, variant;
                                dbus_message_iter_recurse(&props, &prop_entry);

                                const char* prop_name;
                                dbus_message_iter_get_basic(&prop_entry, &prop_name);
                                dbus_message_iter_next(&prop_entry);
                                dbus_message_iter_recurse(&prop_entry, &variant);

                                if (strcmp(prop_name, "UUID") == 0 &&
                                    dbus_message_iter_get_arg_type(&variant) == DBUS_TYPE_STRING) {
                                    const char* uuid;
                                    dbus_message_iter_get_basic(&variant, &uuid);
                                    found[lowercase(uuid)] = obj_path;
                                }
                                dbus_message_iter_next(&props);
                            }
                        }
                        dbus_message_iter_next(&ifaces);
                    }
                }
                dbus_message_iter_next(&objects);
            }
        }

        if (found.empty()) {
            done(ember::transport_error("connect", "no GATT characteristics under " + device_path_));
            return;
        }

        std::cout << "gatt: resolved " << found.size() << " characteristics on " << address_ << std::endl;
        characteristics_ = std::move(found);
        done(std::nullopt);
    });
}

std::string GattTransport::characteristic_path(const std::string& uuid) const {
    auto it = characteristics_.find(lowercase(uuid));
    return it == characteristics_.end() ? std::string() : it->second;
}

void GattTransport::read_characteristic(const std::string& uuid, ReadHandler done) {
    std::string path = characteristic_path(uuid);
    if (path.empty()) {
        fail([done](const Status& status) { done(status, {}); }, "read " + uuid, "unknown characteristic");
        return;
    }

    DBusMessage* msg = dbus_message_new_method_call(SERVICE, path.c_str(),
        CHARACTERISTIC_IFACE, "ReadValue");
    if (msg) {
        DBusMessageIter iter;
        dbus_message_iter_init_append(msg, &iter);
        append_empty_options(&iter);
    }

    call(msg, "read " + uuid, [done = std::move(done)](const Status& status, DBusMessage* reply) {
        if (status) {
            done(status, {});
            return;
        }
        DBusMessageIter iter;
        ember::Bytes value;
        if (dbus_message_iter_init(reply, &iter)) {
            value = read_bytes(&iter);
        }
        done(std::nullopt, value);
    });
}

void GattTransport::write_characteristic(const std::string& uuid, const ember::Bytes& value,
                                         bool response, DoneHandler done) {
    std::string path = characteristic_path(uuid);
    if (path.empty()) {
        fail(std::move(done), "write " + uuid, "unknown characteristic");
        return;
    }

    DBusMessage* msg = dbus_message_new_method_call(SERVICE, path.c_str(),
        CHARACTERISTIC_IFACE, "WriteValue");
    if (msg) {
        DBusMessageIter iter;
        dbus_message_iter_init_append(msg, &iter);
        append_bytes(&iter, value);
        append_write_options(&iter, response ? "request" : "command");
    }

    call(msg, "write " + uuid, [done = std::move(done)](const Status& status, DBusMessage*) {
        done(status);
    });
}

void GattTransport::subscribe(const std::string& uuid, NotifyHandler on_value, DoneHandler done) {
    std::string path = characteristic_path(uuid);
    if (path.empty()) {
        fail(std::move(done), "subscribe " + uuid, "unknown characteristic");
        return;
    }

    // Values can arrive before StartNotify returns
    subscriptions_[path] = Subscription{uuid, std::move(on_value)};

    call(dbus_message_new_method_call(SERVICE, path.c_str(), CHARACTERISTIC_IFACE, "StartNotify"),
         "subscribe " + uuid,
         [this, path, done = std::move(done)](const Status& status, DBusMessage*) {
        if (status) {
            subscriptions_.erase(path);
        }
        done(status);
    });
}

void GattTransport::unsubscribe(const std::string& uuid, DoneHandler done) {
    std::string path = characteristic_path(uuid);
    if (path.empty()) {
        fail(std::move(done), "unsubscribe " + uuid, "unknown characteristic");
        return;
    }

    subscriptions_.erase(path);
    call(dbus_message_new_method_call(SERVICE, path.c_str(), CHARACTERISTIC_IFACE, "StopNotify"),
         "unsubscribe " + uuid,
         [done = std::move(done)](const Status& status, DBusMessage*) {
        done(status);
    });
}

void GattTransport::link_down() {
    connected_ = false;
    services_resolved_ = false;
    characteristics_.clear();
    subscriptions_.clear();
}

DBusHandlerResult GattTransport::filter(DBusConnection*, DBusMessage* msg, void* user_data) {
    if (dbus_message_is_signal(msg, "org.freedesktop.DBus.Properties", "PropertiesChanged")) {
        static_cast<GattTransport*>(user_data)->handle_properties_changed(msg);
    }
    // Other filters may want the same signal
    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

void GattTransport::handle_properties_changed(DBusMessage* msg) {
    const char* obj_path = dbus_message_get_path(msg);
    if (!obj_path) return;

    std::string path = obj_path;
    bool is_device = path == device_path_;
    auto sub = subscriptions_.find(path);
    if (!is_device && sub == subscriptions_.end()) return;

    DBusMessageIter iter;
    if (!dbus_message_iter_init(msg, &iter)) return;

    // First arg: interface name
    if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_STRING) return;
    const char* changed_iface;
    dbus_message_iter_get_basic(&iter, &changed_iface);

    // Second arg: changed properties dict
    dbus_message_iter_next(&iter);
    if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) return;

    DBusMessageIter props;
    dbus_message_iter_recurse(&iter, &props);

    std::weak_ptr<bool> alive = alive_;
    while (dbus_message_iter_get_arg_type(&props) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter prop_entry, variant;
        dbus_message_iter_recurse(&props, &prop_entry);

        const char* prop_name;
        dbus_message_iter_get_basic(&prop_entry, &prop_name);
        dbus_message_iter_next(&prop_entry);
        dbus_message_iter_recurse(&prop_entry, &variant);

        if (is_device && strcmp(changed_iface, DEVICE_IFACE) == 0) {
            bool value = false;
            if (strcmp(prop_name, "Connected") == 0 && read_variant_bool(&variant, &value)) {
                if (!value && connected_) {
                    std::cout << "gatt: " << address_ << " disconnected" << std::endl;
                    link_down();
                }
            } else if (strcmp(prop_name, "ServicesResolved") == 0 &&
                       read_variant_bool(&variant, &value)) {
                services_resolved_ = value;
                if (value && !resolve_waiters_.empty()) {
                    uint64_t wait = resolve_wait_;
                    scheduler_.post([this, alive, wait] {
                        if (alive.expired() || wait != resolve_wait_) return;
                        finish_resolve(std::nullopt);
                    });
                }
            }
        } else if (!is_device && strcmp(changed_iface, CHARACTERISTIC_IFACE) == 0 &&
                   strcmp(prop_name, "Value") == 0) {
            ember::Bytes value = read_bytes(&variant);
            std::string uuid = sub->second.uuid;
            NotifyHandler handler = sub->second.on_value;
            scheduler_.post([alive, handler, uuid, value] {
                if (alive.expired()) return;
                handler(uuid, value);
            });
        }
        dbus_message_iter_next(&props);
    }
}

} // namespace bluez
