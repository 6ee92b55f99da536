#pragma once

#include "../types/error.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace ember {

using Bytes = std::vector<uint8_t>;

// BLE client capability for one peripheral. Every operation except
// is_connected completes asynchronously through its handler, which is
// always invoked from the scheduler, never from inside the call.
class Transport {
public:
    using DoneHandler = std::function<void(const Status&)>;
    using ReadHandler = std::function<void(const Status&, const Bytes&)>;
    using NotifyHandler = std::function<void(const std::string& uuid, const Bytes&)>;

    virtual ~Transport() = default;

    virtual const std::string& address() const = 0;
    virtual bool is_connected() const = 0;

    virtual void connect(DoneHandler done) = 0;
    virtual void pair(DoneHandler done) = 0;
    virtual void disconnect(DoneHandler done) = 0;

    virtual void read_characteristic(const std::string& uuid, ReadHandler done) = 0;
    virtual void write_characteristic(const std::string& uuid, const Bytes& value,
                                      bool response, DoneHandler done) = 0;

    virtual void subscribe(const std::string& uuid, NotifyHandler on_value,
                           DoneHandler done) = 0;
    virtual void unsubscribe(const std::string& uuid, DoneHandler done) = 0;
};

} // namespace ember
