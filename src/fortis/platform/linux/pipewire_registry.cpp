#include "platform/linux/pipewire_registry.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <print>
#include <spa/utils/result.h>

namespace {

constexpr int kRoundtripTimeoutSeconds = 2;

int parse_int(const char* s, int fallback) {
    if (!s || !*s) return fallback;
    return std::atoi(s);
}

} // namespace

PipeWireRegistry::PipeWireRegistry() {
    pw_init(nullptr, nullptr);
}

PipeWireRegistry::~PipeWireRegistry() {
    stop();
    pw_deinit();
}

bool PipeWireRegistry::start() {
    if (core_) return true;

    loop_ = pw_thread_loop_new("fortis-registry", nullptr);
    if (!loop_) {
        std::println(stderr, "devices: failed to create thread loop");
        return false;
    }

    context_ = pw_context_new(pw_thread_loop_get_loop(loop_), nullptr, 0);
    if (!context_) {
        std::println(stderr, "devices: failed to create context");
        stop();
        return false;
    }

    if (pw_thread_loop_start(loop_) < 0) {
        std::println(stderr, "devices: thread loop start failed");
        stop();
        return false;
    }

    pw_thread_loop_lock(loop_);
    core_ = pw_context_connect(context_, nullptr, 0);
    if (!core_) {
        pw_thread_loop_unlock(loop_);
        std::println(stderr, "devices: cannot connect to PipeWire: {}", std::strerror(errno));
        stop();
        return false;
    }
    pw_core_add_listener(core_, &core_listener_, &core_events_, this);

    registry_ = pw_core_get_registry(core_, PW_VERSION_REGISTRY, 0);
    pw_registry_add_listener(registry_, &registry_listener_, &registry_events_, this);
    pw_thread_loop_unlock(loop_);

    return roundtrip();
}

void PipeWireRegistry::stop() {
    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (registry_) {
        spa_hook_remove(&registry_listener_);
        pw_proxy_destroy(reinterpret_cast<pw_proxy*>(registry_));
        registry_ = nullptr;
    }
    if (core_) {
        spa_hook_remove(&core_listener_);
        pw_core_disconnect(core_);
        core_ = nullptr;
    }
    if (context_) {
        pw_context_destroy(context_);
        context_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
    nodes_.clear();

    std::lock_guard lock(cb_mutex_);
    removed_cb_ = nullptr;
}

bool PipeWireRegistry::roundtrip() {
    if (!core_) return false;

    pw_thread_loop_lock(loop_);
    synced_ = false;
    pending_seq_ = pw_core_sync(core_, PW_ID_CORE, 0);
    bool ok = true;
    while (!synced_ && !core_failed_) {
        if (pw_thread_loop_timed_wait(loop_, kRoundtripTimeoutSeconds) != 0) {
            ok = false;
            break;
        }
    }
    ok = ok && !core_failed_;
    pw_thread_loop_unlock(loop_);
    return ok;
}

std::expected<std::vector<DeviceDescriptor>, Error> PipeWireRegistry::list_devices() {
    if (!core_) {
        return std::unexpected(Error{ErrorKind::DeviceEnumeration, "PipeWire not connected"});
    }
    if (!roundtrip()) {
        return std::unexpected(Error{ErrorKind::DeviceEnumeration, "PipeWire not responding"});
    }

    std::vector<DeviceDescriptor> devices;
    pw_thread_loop_lock(loop_);
    int best = -1;
    size_t best_idx = 0;
    for (auto& n : nodes_) {
        if (n.priority > best) {
            best = n.priority;
            best_idx = devices.size();
        }
        devices.push_back(n.desc);
    }
    pw_thread_loop_unlock(loop_);

    if (!devices.empty()) devices[best_idx].is_default = true;
    return devices;
}

std::optional<DeviceDescriptor> PipeWireRegistry::default_device() {
    auto devices = list_devices();
    if (!devices) return std::nullopt;
    auto it = std::ranges::find_if(*devices, [](const DeviceDescriptor& d) { return d.is_default; });
    if (it == devices->end()) return std::nullopt;
    return *it;
}

void PipeWireRegistry::set_removed_callback(RemovedCallback cb) {
    std::lock_guard lock(cb_mutex_);
    removed_cb_ = std::move(cb);
}

void PipeWireRegistry::on_global(void* data, uint32_t id, uint32_t /*permissions*/,
                                 const char* type, uint32_t /*version*/, const spa_dict* props) {
    auto* self = static_cast<PipeWireRegistry*>(data);
    if (!props || std::strcmp(type, PW_TYPE_INTERFACE_Node) != 0) return;

    const char* media_class = spa_dict_lookup(props, PW_KEY_MEDIA_CLASS);
    if (!media_class || std::strcmp(media_class, "Audio/Source") != 0) return;

    const char* name = spa_dict_lookup(props, PW_KEY_NODE_NAME);
    if (!name) return;
    const char* desc = spa_dict_lookup(props, PW_KEY_NODE_DESCRIPTION);

    Node node{
        .global_id = id,
        .priority = parse_int(spa_dict_lookup(props, PW_KEY_PRIORITY_SESSION), 0),
        .desc = DeviceDescriptor{
            .id = name,
            .name = desc ? desc : name,
            .sample_rates = {},
            .channels = static_cast<uint32_t>(
                std::max(1, parse_int(spa_dict_lookup(props, PW_KEY_AUDIO_CHANNELS), 1))),
            .is_default = false,
        },
    };
    int rate = parse_int(spa_dict_lookup(props, PW_KEY_AUDIO_RATE), 0);
    if (rate > 0) node.desc.sample_rates.push_back(static_cast<uint32_t>(rate));

    std::erase_if(self->nodes_, [id](const Node& n) { return n.global_id == id; });
    self->nodes_.push_back(std::move(node));
}

void PipeWireRegistry::on_global_remove(void* data, uint32_t id) {
    auto* self = static_cast<PipeWireRegistry*>(data);
    auto it = std::ranges::find_if(self->nodes_, [id](const Node& n) { return n.global_id == id; });
    if (it == self->nodes_.end()) return;

    std::string device_id = it->desc.id;
    self->nodes_.erase(it);

    std::lock_guard lock(self->cb_mutex_);
    if (self->removed_cb_) self->removed_cb_(device_id);
}

void PipeWireRegistry::on_core_done(void* data, uint32_t id, int seq) {
    auto* self = static_cast<PipeWireRegistry*>(data);
    if (id != PW_ID_CORE || seq != self->pending_seq_) return;
    self->synced_ = true;
    pw_thread_loop_signal(self->loop_, false);
}

void PipeWireRegistry::on_core_error(void* data, uint32_t id, int /*seq*/, int res,
                                     const char* message) {
    auto* self = static_cast<PipeWireRegistry*>(data);
    std::println(stderr, "devices: core error on {}: {} ({})", id,
                 message ? message : "", spa_strerror(res));
    if (id == PW_ID_CORE) {
        self->core_failed_ = true;
        pw_thread_loop_signal(self->loop_, false);
    }
}
