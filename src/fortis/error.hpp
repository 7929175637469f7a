#pragma once

#include <string>
#include <string_view>

enum class ErrorKind {
    ConfigIncomplete,
    DeviceEnumeration,
    DeviceOpen,
    DeviceRemoved,
    Auth,
    Connect,
    Send,
    Disconnected,
    ChunkDropped,
    OutOfOrder,
    Rejected,
};

struct Error {
    ErrorKind kind;
    std::string message;

    // Auth failures and device loss need the user to act; everything else
    // is retried or reported without leaving the current session.
    bool is_fatal() const {
        return kind == ErrorKind::Auth || kind == ErrorKind::DeviceRemoved;
    }
};

inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConfigIncomplete: return "settings required";
        case ErrorKind::DeviceEnumeration: return "device enumeration failed";
        case ErrorKind::DeviceOpen: return "device open failed";
        case ErrorKind::DeviceRemoved: return "device removed";
        case ErrorKind::Auth: return "authentication rejected";
        case ErrorKind::Connect: return "connect failed";
        case ErrorKind::Send: return "send failed";
        case ErrorKind::Disconnected: return "disconnected";
        case ErrorKind::ChunkDropped: return "chunk dropped";
        case ErrorKind::OutOfOrder: return "out of order";
        case ErrorKind::Rejected: return "command rejected";
    }
    return "unknown";
}

inline std::string describe(const Error& err) {
    std::string out(to_string(err.kind));
    if (!err.message.empty()) {
        out += ": ";
        out += err.message;
    }
    return out;
}
