#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace ember {

enum class ErrorKind : uint8_t {
    Transport,  // connect/pair/read/write/subscribe failures from BlueZ
    Decode,     // malformed payload
    Encode,     // value does not fit the wire format
    Session,    // exception escaping the session loop
};

inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Decode: return "decode";
        case ErrorKind::Encode: return "encode";
        case ErrorKind::Session: return "session";
    }
    return "unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::Transport;
    std::string operation;
    std::string message;

    std::string describe() const {
        std::string out(to_string(kind));
        out += " error in ";
        out += operation;
        if (!message.empty()) {
            out += ": ";
            out += message;
        }
        return out;
    }
};

// Completion value of an asynchronous operation; nullopt means success
using Status = std::optional<Error>;

inline Error transport_error(std::string operation, std::string message) {
    return Error{ErrorKind::Transport, std::move(operation), std::move(message)};
}

} // namespace ember
