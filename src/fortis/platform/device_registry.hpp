#pragma once

#include "audio_chunk.hpp"
#include "error.hpp"

#include <algorithm>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

class DeviceRegistry {
public:
    // Invoked from the registry's own thread.
    using RemovedCallback = std::function<void(const std::string& device_id)>;

    virtual ~DeviceRegistry() = default;

    virtual std::expected<std::vector<DeviceDescriptor>, Error> list_devices() = 0;
    virtual std::optional<DeviceDescriptor> default_device() = 0;
    virtual void set_removed_callback(RemovedCallback cb) = 0;

    virtual std::optional<DeviceDescriptor> find_device(const std::string& id) {
        auto devices = list_devices();
        if (!devices) return std::nullopt;
        auto it = std::ranges::find_if(*devices,
                                       [&id](const DeviceDescriptor& d) { return d.id == id; });
        if (it == devices->end()) return std::nullopt;
        return *it;
    }
};
