#pragma once

#include "platform/device_registry.hpp"

#include <mutex>
#include <pipewire/pipewire.h>
#include <vector>

// Tracks Audio/Source nodes through the PipeWire registry on a dedicated
// thread loop. Removal of a tracked node is reported via the callback.
class PipeWireRegistry : public DeviceRegistry {
public:
    PipeWireRegistry();
    ~PipeWireRegistry() override;

    PipeWireRegistry(const PipeWireRegistry&) = delete;
    PipeWireRegistry& operator=(const PipeWireRegistry&) = delete;

    bool start();
    void stop();

    std::expected<std::vector<DeviceDescriptor>, Error> list_devices() override;
    std::optional<DeviceDescriptor> default_device() override;
    void set_removed_callback(RemovedCallback cb) override;

private:
    struct Node {
        uint32_t global_id;
        int priority;
        DeviceDescriptor desc;
    };

    // Blocks until the server processed everything sent so far.
    bool roundtrip();

    static void on_global(void* data, uint32_t id, uint32_t permissions,
                          const char* type, uint32_t version, const spa_dict* props);
    static void on_global_remove(void* data, uint32_t id);
    static void on_core_done(void* data, uint32_t id, int seq);
    static void on_core_error(void* data, uint32_t id, int seq, int res, const char* message);

    pw_thread_loop* loop_ = nullptr;
    pw_context* context_ = nullptr;
    pw_core* core_ = nullptr;
    pw_registry* registry_ = nullptr;
    spa_hook core_listener_{};
    spa_hook registry_listener_{};

    // Guarded by the thread loop lock.
    std::vector<Node> nodes_;
    int pending_seq_ = 0;
    bool synced_ = false;
    bool core_failed_ = false;

    std::mutex cb_mutex_;
    RemovedCallback removed_cb_;

    static constexpr pw_registry_events registry_events_ = {
        .version = PW_VERSION_REGISTRY_EVENTS,
        .global = on_global,
        .global_remove = on_global_remove,
    };

    static constexpr pw_core_events core_events_ = {
        .version = PW_VERSION_CORE_EVENTS,
        .done = on_core_done,
        .error = on_core_error,
    };
};
