#include "platform/linux/pipewire_capture.hpp"

#include <print>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

namespace {

// How long open() waits for the stream to leave CONNECTING.
constexpr int kOpenTimeoutSeconds = 3;

} // namespace

PipeWireCapture::PipeWireCapture(RingBuffer& ring_buf) : ring_buf_(ring_buf) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    close();
    pw_deinit();
}

std::expected<void, Error> PipeWireCapture::open(const DeviceDescriptor& device,
                                                 const CaptureFormat& format) {
    if (capturing_.load(std::memory_order_relaxed)) {
        return std::unexpected(Error{ErrorKind::DeviceOpen, "capture already open"});
    }
    if (format.sample_rate == 0 || format.channels == 0) {
        return std::unexpected(Error{ErrorKind::DeviceOpen, "unsupported capture format"});
    }

    loop_ = pw_thread_loop_new("fortis-capture", nullptr);
    if (!loop_) {
        return std::unexpected(Error{ErrorKind::DeviceOpen, "failed to create thread loop"});
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "fortis",
        PW_KEY_APP_NAME, "fortis",
        nullptr
    );
    if (!device.id.empty()) {
        pw_properties_set(props, PW_KEY_TARGET_OBJECT, device.id.c_str());
    }

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "fortis-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        teardown();
        return std::unexpected(Error{ErrorKind::DeviceOpen, "failed to create stream"});
    }

    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = format.sample_rate,
        .channels = format.channels
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    stream_state_ = PW_STREAM_STATE_CONNECTING;
    stream_error_.clear();
    ring_buf_.reset();

    // Unplugging the target must end the stream instead of following the
    // session manager to another source.
    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS |
            PW_STREAM_FLAG_RT_PROCESS | PW_STREAM_FLAG_DONT_RECONNECT
        ),
        params, 1
    );

    if (ret < 0) {
        teardown();
        return std::unexpected(Error{ErrorKind::DeviceOpen,
                                     std::string("stream connect failed: ") + spa_strerror(ret)});
    }

    capturing_.store(true, std::memory_order_release);

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        capturing_.store(false, std::memory_order_release);
        teardown();
        return std::unexpected(Error{ErrorKind::DeviceOpen,
                                     std::string("thread loop start failed: ") + spa_strerror(ret)});
    }

    pw_thread_loop_lock(loop_);
    while (stream_state_ == PW_STREAM_STATE_CONNECTING) {
        if (pw_thread_loop_timed_wait(loop_, kOpenTimeoutSeconds) != 0) break;
    }
    auto state = stream_state_;
    std::string error = stream_error_;
    pw_thread_loop_unlock(loop_);

    if (state != PW_STREAM_STATE_PAUSED && state != PW_STREAM_STATE_STREAMING) {
        close();
        if (error.empty()) error = std::string("stream ") + pw_stream_state_as_string(state);
        return std::unexpected(Error{ErrorKind::DeviceOpen, device.name + ": " + error});
    }

    return {};
}

void PipeWireCapture::close() {
    if (!capturing_.load(std::memory_order_relaxed) && !loop_) return;

    capturing_.store(false, std::memory_order_release);

    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    teardown();
}

void PipeWireCapture::teardown() {
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* data = static_cast<const uint8_t*>(d->data) + d->chunk->offset;
    size_t size = d->chunk->size;

    if (self->capturing_.load(std::memory_order_relaxed)) {
        self->ring_buf_.write(data, size);
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_state_changed(void* userdata, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    auto* self = static_cast<PipeWireCapture*>(userdata);
    self->stream_state_ = state;
    if (error) {
        self->stream_error_ = error;
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }
    pw_thread_loop_signal(self->loop_, false);
}
