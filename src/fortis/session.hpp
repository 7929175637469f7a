#pragma once

#include "backoff.hpp"
#include "capture_source.hpp"
#include "chunk_queue.hpp"
#include "config.hpp"
#include "error.hpp"
#include "platform/audio_capture.hpp"
#include "platform/device_registry.hpp"
#include "ring_buffer.hpp"
#include "stt/transcriber.hpp"
#include "stt/transcription_session.hpp"
#include "transcript/transcript_log.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <variant>

enum class SessionState { Idle, Recording, Paused, Reconnecting, SwitchingDevice, Error };

std::string_view to_string(SessionState state);

namespace command {

// From the display.
struct Start {};
struct Pause {};
struct Resume {};
struct SelectDevice { std::string device_id; };
struct OpenSettings {};
struct Reset {};
struct Quit {};

// From the registry and the network thread.
struct DeviceRemoved { std::string device_id; };
struct Disconnected {
    Error error;
    // Link the failure was seen on; empty means whichever link is current.
    std::optional<uint64_t> link;
};
struct Reconnected {};
struct ReconnectFailed { Error error; };

} // namespace command

using Command = std::variant<command::Start, command::Pause, command::Resume,
                             command::SelectDevice, command::OpenSettings, command::Reset,
                             command::Quit, command::DeviceRemoved, command::Disconnected,
                             command::Reconnected, command::ReconnectFailed>;

std::string_view command_name(const Command& cmd);

struct SessionStatus {
    SessionState state = SessionState::Idle;
    std::string device_id;
    std::string device_name;
    std::string error;   // reason while in Error
    std::string notice;  // last rejected Start, e.g. "settings required"
    std::chrono::milliseconds recorded{0};
    uint64_t dropped = 0;
    uint32_t reconnect_attempts = 0;
};

// Owns the capture-to-transcript pipeline and the one state object it
// runs under. Transitions happen on the control thread (post) or on the
// caller's thread (dispatch), always under the transition lock. The network
// thread moves chunks to the provider and events to the log; it reports
// connection changes back through post() and never takes the lock itself.
class Session {
public:
    using ConfigLoader = std::function<Config()>;

    Session(Config config, bool verbose,
            DeviceRegistry& registry, AudioCapture& capture, RingBuffer& ring_buf,
            TranscriberFactory transcriber_factory, ConfigLoader reload_config);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Subscribes to device removal and starts the worker threads.
    bool start();

    // Queue a command for the control thread. False once the session quit.
    bool post(Command cmd);

    // Apply a command on the calling thread. Commands that make no sense in
    // the current state fail with Rejected and change nothing.
    std::expected<void, Error> dispatch(const Command& cmd);

    SessionState state() const { return state_.load(std::memory_order_acquire); }
    SessionStatus status() const;
    bool quit() const { return quit_.load(std::memory_order_acquire); }

    TranscriptLog& transcript() { return log_; }
    const TranscriptLog& transcript() const { return log_; }
    const ChunkQueue& queue() const { return queue_; }
    Config config() const;

private:
    std::expected<void, Error> handle(const command::Start& cmd);
    std::expected<void, Error> handle(const command::Pause& cmd);
    std::expected<void, Error> handle(const command::Resume& cmd);
    std::expected<void, Error> handle(const command::SelectDevice& cmd);
    std::expected<void, Error> handle(const command::OpenSettings& cmd);
    std::expected<void, Error> handle(const command::Reset& cmd);
    std::expected<void, Error> handle(const command::Quit& cmd);
    std::expected<void, Error> handle(const command::DeviceRemoved& cmd);
    std::expected<void, Error> handle(const command::Disconnected& cmd);
    std::expected<void, Error> handle(const command::Reconnected& cmd);
    std::expected<void, Error> handle(const command::ReconnectFailed& cmd);

    std::expected<void, Error> reject(std::string_view what) const;
    std::expected<DeviceDescriptor, Error> resolve_device();
    std::expected<void, Error> open_capture(const DeviceDescriptor& device);
    std::expected<void, Error> open_transcription(uint64_t base_offset);
    void enter_error(const std::string& reason);
    void set_state(SessionState state);
    void start_timer();
    void stop_timer();
    void wake_network();

    void run_control(std::stop_token st);
    void run_network(std::stop_token st);
    std::optional<Error> pump(uint64_t& link);
    bool reconnect_once(std::stop_token st);
    void idle_wait(std::stop_token st, std::chrono::milliseconds timeout);

    void log(const std::string& msg) const;

    Config config_;
    bool verbose_;
    DeviceRegistry& registry_;
    ConfigLoader reload_config_;

    ChunkQueue queue_;
    CaptureSource capture_source_;
    TranscriptLog log_;

    std::mutex transition_mutex_;
    std::atomic<SessionState> state_{SessionState::Idle};
    std::atomic<bool> quit_{false};
    SessionState reconnect_return_ = SessionState::Recording;
    std::string selected_id_;  // empty = default source
    uint64_t next_capture_session_ = 0;

    mutable std::mutex status_mutex_;
    DeviceDescriptor device_;
    std::string error_;
    std::string notice_;
    std::chrono::milliseconds recorded_{0};
    std::optional<std::chrono::steady_clock::time_point> recording_since_;

    // Owned by the network thread except for open/close on transitions.
    std::mutex net_mutex_;
    TranscriptionSession transcription_;
    Settings net_settings_;
    CaptureFormat net_format_;
    std::atomic<uint64_t> link_generation_{0};
    std::optional<AudioChunk> carry_;

    std::mutex wake_mutex_;
    std::condition_variable_any wake_cv_;
    bool wake_ = false;
    bool kick_ = false;
    bool reset_backoff_ = false;
    Backoff backoff_;
    std::atomic<uint32_t> reconnect_attempts_{0};

    std::mutex command_mutex_;
    std::condition_variable_any command_cv_;
    std::deque<Command> commands_;

    std::jthread network_;
    std::jthread control_;
};
