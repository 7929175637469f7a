#include "session.hpp"

#include <format>
#include <print>

static constexpr auto kIdleWait = std::chrono::milliseconds(50);
static constexpr auto kPollInterval = std::chrono::milliseconds(20);

std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Recording: return "recording";
        case SessionState::Paused: return "paused";
        case SessionState::Reconnecting: return "reconnecting";
        case SessionState::SwitchingDevice: return "switching device";
        case SessionState::Error: return "error";
    }
    return "unknown";
}

std::string_view command_name(const Command& cmd) {
    // Same order as the Command alternatives.
    static constexpr std::string_view names[] = {
        "start", "pause", "resume", "select-device", "open-settings", "reset", "quit",
        "device-removed", "disconnected", "reconnected", "reconnect-failed",
    };
    return names[cmd.index()];
}

static BackoffPolicy backoff_policy(const Config::Reconnect& r) {
    return BackoffPolicy{
        .base = std::chrono::milliseconds(r.base_ms),
        .cap = std::chrono::milliseconds(r.cap_ms),
        .jitter = r.jitter,
        .max_attempts = r.max_attempts,
    };
}

Session::Session(Config config, bool verbose,
                 DeviceRegistry& registry, AudioCapture& capture, RingBuffer& ring_buf,
                 TranscriberFactory transcriber_factory, ConfigLoader reload_config)
    : config_(std::move(config)), verbose_(verbose),
      registry_(registry), reload_config_(std::move(reload_config)),
      queue_(config_.audio.queue_capacity()),
      capture_source_(capture, ring_buf, queue_),
      selected_id_(config_.audio.device),
      transcription_(std::move(transcriber_factory)),
      backoff_(backoff_policy(config_.reconnect)) {}

Session::~Session() {
    if (!quit()) {
        if (auto res = dispatch(command::Quit{}); !res) {
            std::println(stderr, "session: shutdown: {}", describe(res.error()));
        }
    }
    control_.request_stop();
    if (control_.joinable()) control_.join();
}

bool Session::start() {
    auto devices = registry_.list_devices();
    if (!devices) {
        std::println(stderr, "session: {}", describe(devices.error()));
        return false;
    }
    log(std::format("{} input device(s) available", devices->size()));

    registry_.set_removed_callback([this](const std::string& id) {
        post(command::DeviceRemoved{id});
    });

    network_ = std::jthread([this](std::stop_token st) { run_network(st); });
    control_ = std::jthread([this](std::stop_token st) { run_control(st); });
    return true;
}

bool Session::post(Command cmd) {
    if (quit()) return false;
    {
        std::lock_guard lock(command_mutex_);
        commands_.push_back(std::move(cmd));
    }
    command_cv_.notify_one();
    return true;
}

std::expected<void, Error> Session::dispatch(const Command& cmd) {
    std::lock_guard lock(transition_mutex_);
    if (quit()) {
        return std::unexpected(Error{ErrorKind::Rejected, "session has quit"});
    }
    return std::visit([this](const auto& c) { return handle(c); }, cmd);
}

SessionStatus Session::status() const {
    SessionStatus st;
    st.state = state();
    st.dropped = queue_.dropped();
    st.reconnect_attempts = reconnect_attempts_.load(std::memory_order_relaxed);

    std::lock_guard lock(status_mutex_);
    st.device_id = device_.id;
    st.device_name = device_.name;
    st.error = error_;
    st.notice = notice_;
    st.recorded = recorded_;
    if (recording_since_) {
        st.recorded += std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - *recording_since_);
    }
    return st;
}

Config Session::config() const {
    std::lock_guard lock(status_mutex_);
    return config_;
}

// --- transitions ---

std::expected<void, Error> Session::handle(const command::Start&) {
    if (state() != SessionState::Idle) return reject("start");

    auto fail = [this](Error err) -> std::expected<void, Error> {
        {
            std::lock_guard lock(status_mutex_);
            notice_ = describe(err);
        }
        std::println(stderr, "session: start failed: {}", describe(err));
        return std::unexpected(std::move(err));
    };

    auto settings = config_.settings();
    if (!settings) return fail(settings.error());

    auto device = resolve_device();
    if (!device) return fail(device.error());

    {
        std::lock_guard lock(net_mutex_);
        net_settings_ = *settings;
        net_format_ = config_.audio.format();
    }

    if (auto res = open_transcription(0); !res) return fail(res.error());

    if (auto res = open_capture(*device); !res) {
        {
            std::lock_guard lock(net_mutex_);
            transcription_.close();
        }
        return fail(res.error());
    }

    log_.clear();
    {
        std::lock_guard lock(status_mutex_);
        notice_.clear();
        error_.clear();
        recorded_ = std::chrono::milliseconds(0);
    }
    start_timer();
    set_state(SessionState::Recording);
    wake_network();
    return {};
}

std::expected<void, Error> Session::handle(const command::Pause&) {
    if (state() != SessionState::Recording) return reject("pause");

    capture_source_.close();
    size_t discarded = queue_.clear();
    if (discarded > 0) log(std::format("pause discarded {} queued chunk(s)", discarded));

    stop_timer();
    set_state(SessionState::Paused);
    return {};
}

std::expected<void, Error> Session::handle(const command::Resume&) {
    if (state() != SessionState::Paused) return reject("resume");

    bool connected;
    {
        std::lock_guard lock(net_mutex_);
        connected = transcription_.is_connected();
    }
    if (!connected) {
        if (auto res = open_transcription(log_.committed_end()); !res) {
            std::println(stderr, "session: resume failed: {}", describe(res.error()));
            return std::unexpected(res.error());
        }
    }

    DeviceDescriptor device;
    {
        std::lock_guard lock(status_mutex_);
        device = device_;
    }
    if (auto res = open_capture(device); !res) {
        std::println(stderr, "session: resume failed: {}", describe(res.error()));
        return std::unexpected(res.error());
    }

    start_timer();
    set_state(SessionState::Recording);
    wake_network();
    return {};
}

std::expected<void, Error> Session::handle(const command::SelectDevice& cmd) {
    auto prev = state();
    if (prev == SessionState::SwitchingDevice) return reject("select device");

    auto device = registry_.find_device(cmd.device_id);
    if (!device) {
        return std::unexpected(Error{ErrorKind::DeviceOpen, "no such device: " + cmd.device_id});
    }

    if (prev == SessionState::Idle || prev == SessionState::Error) {
        selected_id_ = device->id;
        std::lock_guard lock(status_mutex_);
        device_ = *device;
        return {};
    }

    bool capturing = prev == SessionState::Recording ||
                     (prev == SessionState::Reconnecting &&
                      reconnect_return_ == SessionState::Recording);

    set_state(SessionState::SwitchingDevice);
    capture_source_.close();
    size_t discarded = queue_.clear();
    log(std::format("switching to {}, discarded {} queued chunk(s)", device->id, discarded));

    selected_id_ = device->id;
    {
        std::lock_guard lock(status_mutex_);
        device_ = *device;
    }

    if (capturing) {
        if (auto res = open_capture(*device); !res) {
            enter_error(describe(res.error()));
            return std::unexpected(res.error());
        }
    }

    set_state(prev);

    // The woken attempt must see Reconnecting again, or it is skipped.
    if (prev == SessionState::Reconnecting) {
        std::lock_guard lock(wake_mutex_);
        kick_ = true;
    }
    wake_cv_.notify_all();
    return {};
}

std::expected<void, Error> Session::handle(const command::OpenSettings&) {
    auto s = state();
    if (s != SessionState::Idle && s != SessionState::Error) return reject("open settings");
    if (!reload_config_) return {};

    auto config = reload_config_();
    if (!config.audio.device.empty()) selected_id_ = config.audio.device;
    {
        std::lock_guard lock(wake_mutex_);
        backoff_ = Backoff(backoff_policy(config.reconnect));
    }
    {
        std::lock_guard lock(status_mutex_);
        config_ = std::move(config);
        notice_.clear();
    }
    log("settings reloaded");
    return {};
}

std::expected<void, Error> Session::handle(const command::Reset&) {
    if (state() != SessionState::Error) return reject("reset");

    capture_source_.close();
    queue_.clear();
    {
        std::lock_guard lock(net_mutex_);
        transcription_.close();
    }
    {
        std::lock_guard lock(status_mutex_);
        error_.clear();
    }
    set_state(SessionState::Idle);
    return {};
}

std::expected<void, Error> Session::handle(const command::Quit&) {
    log("quitting");
    quit_.store(true, std::memory_order_release);

    queue_.close();
    capture_source_.close();
    stop_timer();

    network_.request_stop();
    wake_network();
    if (network_.joinable()) network_.join();

    {
        std::lock_guard lock(net_mutex_);
        transcription_.close();
    }
    queue_.clear();
    registry_.set_removed_callback(nullptr);

    control_.request_stop();
    set_state(SessionState::Idle);
    return {};
}

std::expected<void, Error> Session::handle(const command::DeviceRemoved& cmd) {
    std::string current_id;
    std::string current_name;
    {
        std::lock_guard lock(status_mutex_);
        current_id = device_.id;
        current_name = device_.name;
    }

    if (cmd.device_id == selected_id_) selected_id_.clear();
    if (cmd.device_id != current_id) return {};

    auto s = state();
    if (s == SessionState::Recording || s == SessionState::Paused ||
        s == SessionState::Reconnecting) {
        enter_error("device removed: " + (current_name.empty() ? current_id : current_name));
    }
    return {};
}

std::expected<void, Error> Session::handle(const command::Disconnected& cmd) {
    // A transition may have replaced the link after the failure was posted.
    if (cmd.link && *cmd.link != link_generation_.load(std::memory_order_acquire)) {
        log(std::format("ignoring disconnect of replaced link {}", *cmd.link));
        return {};
    }

    auto s = state();
    if (s != SessionState::Recording && s != SessionState::Paused) return reject("disconnect");

    std::println(stderr, "session: connection lost: {}", describe(cmd.error));
    {
        // Reconnecting always starts from a closed link.
        std::lock_guard lock(net_mutex_);
        transcription_.close();
    }
    reconnect_return_ = s;
    {
        std::lock_guard lock(wake_mutex_);
        reset_backoff_ = true;
        kick_ = false;
    }
    set_state(SessionState::Reconnecting);
    wake_network();
    return {};
}

std::expected<void, Error> Session::handle(const command::Reconnected&) {
    if (state() != SessionState::Reconnecting) return reject("reconnected");
    reconnect_attempts_.store(0, std::memory_order_relaxed);
    set_state(reconnect_return_);
    return {};
}

std::expected<void, Error> Session::handle(const command::ReconnectFailed& cmd) {
    if (state() != SessionState::Reconnecting) return reject("reconnect failure");
    enter_error("connection lost: " + describe(cmd.error));
    return {};
}

// --- helpers ---

std::expected<void, Error> Session::reject(std::string_view what) const {
    return std::unexpected(Error{ErrorKind::Rejected,
                                 std::format("cannot {} while {}", what, to_string(state()))});
}

std::expected<DeviceDescriptor, Error> Session::resolve_device() {
    if (selected_id_.empty()) {
        auto device = registry_.default_device();
        if (!device) {
            return std::unexpected(Error{ErrorKind::DeviceOpen, "no input device available"});
        }
        return *device;
    }

    auto device = registry_.find_device(selected_id_);
    if (!device) {
        return std::unexpected(Error{ErrorKind::DeviceOpen, "no such device: " + selected_id_});
    }
    return *device;
}

std::expected<void, Error> Session::open_capture(const DeviceDescriptor& device) {
    uint64_t capture_session = ++next_capture_session_;
    queue_.reset(capture_session);

    if (auto res = capture_source_.open(device, config_.audio.format(), capture_session); !res) {
        return std::unexpected(res.error());
    }

    {
        std::lock_guard lock(status_mutex_);
        device_ = device;
    }
    log(std::format("capturing from {} (session {})", device.id, capture_session));
    return {};
}

std::expected<void, Error> Session::open_transcription(uint64_t base_offset) {
    std::lock_guard lock(net_mutex_);
    if (auto res = transcription_.open(net_settings_, net_format_, base_offset); !res) {
        return std::unexpected(res.error());
    }
    link_generation_.fetch_add(1, std::memory_order_acq_rel);
    return {};
}

void Session::enter_error(const std::string& reason) {
    capture_source_.close();
    stop_timer();
    {
        std::lock_guard lock(status_mutex_);
        error_ = reason;
    }
    std::println(stderr, "session: {}", reason);
    set_state(SessionState::Error);
}

void Session::set_state(SessionState state) {
    state_.store(state, std::memory_order_release);
    log(std::format("state: {}", to_string(state)));
}

void Session::start_timer() {
    std::lock_guard lock(status_mutex_);
    recording_since_ = std::chrono::steady_clock::now();
}

void Session::stop_timer() {
    std::lock_guard lock(status_mutex_);
    if (!recording_since_) return;
    recorded_ += std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - *recording_since_);
    recording_since_.reset();
}

void Session::wake_network() {
    {
        std::lock_guard lock(wake_mutex_);
        wake_ = true;
    }
    wake_cv_.notify_all();
}

// --- threads ---

void Session::run_control(std::stop_token st) {
    while (!st.stop_requested()) {
        Command cmd;
        {
            std::unique_lock lock(command_mutex_);
            if (!command_cv_.wait(lock, st, [this] { return !commands_.empty(); })) return;
            cmd = std::move(commands_.front());
            commands_.pop_front();
        }

        if (auto res = dispatch(cmd); !res) {
            log(std::format("{}: {}", command_name(cmd), describe(res.error())));
        }
        if (quit()) return;
    }
}

void Session::run_network(std::stop_token st) {
    uint64_t seen_generation = link_generation_.load(std::memory_order_acquire);
    bool reported_down = false;
    bool gave_up = false;

    while (!st.stop_requested()) {
        uint64_t generation = link_generation_.load(std::memory_order_acquire);
        if (generation != seen_generation) {
            seen_generation = generation;
            reported_down = false;
            gave_up = false;
        }

        auto s = state();
        if (s == SessionState::Reconnecting) {
            reported_down = false;
            bool connected;
            {
                std::lock_guard lock(net_mutex_);
                connected = transcription_.is_connected();
            }
            // Waiting for the control thread to act on what we posted.
            if (gave_up || connected) {
                idle_wait(st, kIdleWait);
                continue;
            }
            if (!reconnect_once(st)) gave_up = true;
            continue;
        }
        gave_up = false;

        if (s == SessionState::Idle || reported_down) {
            idle_wait(st, kIdleWait);
            continue;
        }

        uint64_t link = 0;
        if (auto err = pump(link)) {
            log("link down: " + describe(*err));
            post(command::Disconnected{*err, link});
            reported_down = true;
        }
    }
}

std::optional<Error> Session::pump(uint64_t& link) {
    if (!carry_) carry_ = queue_.pop(kPollInterval);

    std::lock_guard lock(net_mutex_);
    link = link_generation_.load(std::memory_order_acquire);
    if (!transcription_.is_connected()) {
        return Error{ErrorKind::Disconnected, "connection is down"};
    }

    // A chunk held back from a failed send is stale once capture moved on.
    if (carry_ && carry_->capture_session != queue_.accepted_session()) carry_.reset();

    if (carry_) {
        if (auto res = transcription_.send(*carry_); !res) return res.error();
        carry_.reset();
    }

    if (auto res = transcription_.maintain(); !res) return res.error();

    while (true) {
        auto event = transcription_.poll_event(std::chrono::milliseconds(0));
        if (!event) return event.error();
        if (!*event) break;
        if (auto res = log_.apply(**event); !res) {
            std::println(stderr, "session: dropped transcript event: {}", describe(res.error()));
        }
    }
    return std::nullopt;
}

bool Session::reconnect_once(std::stop_token st) {
    std::optional<std::chrono::milliseconds> delay;
    uint32_t attempt = 0;
    {
        std::unique_lock lock(wake_mutex_);
        if (reset_backoff_) {
            backoff_.reset();
            reset_backoff_ = false;
        }
        delay = backoff_.next_delay();
        attempt = backoff_.attempts();
        reconnect_attempts_.store(attempt, std::memory_order_relaxed);

        if (delay) {
            log(std::format("reconnect attempt {} in {} ms", attempt, delay->count()));
            wake_cv_.wait_for(lock, st, *delay, [this] { return kick_; });
            if (kick_) {
                kick_ = false;
                backoff_.reset();
            }
        }
    }

    if (!delay) {
        post(command::ReconnectFailed{
            Error{ErrorKind::Connect, std::format("gave up after {} attempts", attempt)}});
        return false;
    }
    if (st.stop_requested() || state() != SessionState::Reconnecting) return true;

    std::expected<void, Error> res;
    {
        std::lock_guard lock(net_mutex_);
        res = transcription_.open(net_settings_, net_format_, log_.committed_end());
        if (res) link_generation_.fetch_add(1, std::memory_order_acq_rel);
    }

    if (res) {
        log("reconnected");
        post(command::Reconnected{});
        return true;
    }
    if (res.error().kind == ErrorKind::Auth) {
        post(command::ReconnectFailed{res.error()});
        return false;
    }
    std::println(stderr, "session: reconnect attempt {} failed: {}", attempt,
                 describe(res.error()));
    return true;
}

void Session::idle_wait(std::stop_token st, std::chrono::milliseconds timeout) {
    std::unique_lock lock(wake_mutex_);
    wake_cv_.wait_for(lock, st, timeout, [this] { return wake_; });
    wake_ = false;
}

void Session::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[fortis] {}", msg);
    }
}
