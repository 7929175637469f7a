#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"
#include "stt/deepgram_transcriber.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, std::string config_path, bool verbose)
    : config_(std::move(config)), config_path_(std::move(config_path)), verbose_(verbose),
      ring_buf_(config_.audio.ring_buffer_bytes()),
      audio_capture_(ring_buf_),
      session_(config_, verbose_, registry_, audio_capture_, ring_buf_,
               // TranscriberFactory
               []() -> std::unique_ptr<StreamingTranscriber> {
                   return std::make_unique<DeepgramTranscriber>();
               },
               // ConfigLoader
               [path = config_path_]() {
                   return path.empty() ? Config::load_default() : Config::load(path);
               }),
      view_(config_.ui) {}

LinuxEventLoop::~LinuxEventLoop() {
    terminal_.restore();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (timer_fd_ >= 0) ::close(timer_fd_);
}

bool LinuxEventLoop::init() {
    if (config_.transcriber.provider != "deepgram") {
        std::println(stderr, "Unknown transcriber provider: {}", config_.transcriber.provider);
        return false;
    }

    // Block before any thread exists so every thread inherits the mask and
    // signals only arrive through the signalfd.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGWINCH);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    if (!registry_.start()) return false;

    if (config_.history.enabled) {
        auto data = platform::data_dir();
        auto db_path = (data.empty() ? std::string("/tmp/fortis") : data) + "/history.db";
        if (archive_.open(db_path)) {
            log("Archiving transcript to " + db_path);
            session_.transcript().set_commit_listener([this](const Segment& segment) {
                auto status = session_.status();
                auto config = session_.config();
                bool stored = archive_.insert(segment, ArchiveContext{
                    .device = status.device_id,
                    .language = config.transcriber.language,
                    .model = config.transcriber.model,
                });
                if (!stored) log("Segment not archived");
            });
        } else {
            std::println(stderr, "Warning: history DB failed to open, history disabled");
        }
    }

    if (!session_.start()) return false;
    refresh_devices();

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }
    long refresh_ns = static_cast<long>(std::max<uint32_t>(config_.ui.refresh_ms, 10)) * 1000000L;
    itimerspec spec{
        .it_interval = {.tv_sec = refresh_ns / 1000000000L, .tv_nsec = refresh_ns % 1000000000L},
        .it_value = {.tv_sec = refresh_ns / 1000000000L, .tv_nsec = refresh_ns % 1000000000L},
    };
    if (timerfd_settime(timer_fd_, 0, &spec, nullptr) != 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(timer_fd_, EPOLLIN) ||
        !add_fd(terminal_.input_fd(), EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    if (!terminal_.enter_raw()) return false;

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 8;
    epoll_event events[MAX_EVENTS];

    redraw();

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) != static_cast<ssize_t>(sizeof(info))) continue;
                if (info.ssi_signo == SIGWINCH) {
                    redraw();
                    continue;
                }
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == timer_fd_) {
                uint64_t expirations;
                if (::read(timer_fd_, &expirations, sizeof(expirations)) < 0) continue;
                // Device list every second.
                if (++ticks_ * std::max<uint32_t>(config_.ui.refresh_ms, 10) >= 1000) {
                    ticks_ = 0;
                    refresh_devices();
                }
                redraw();
                continue;
            }

            if (fd == terminal_.input_fd()) {
                char buf[64];
                ssize_t got = ::read(fd, buf, sizeof(buf));
                if (got > 0) handle_input({buf, static_cast<size_t>(got)});
                continue;
            }
        }

        if (session_.quit()) running_.store(false, std::memory_order_release);
    }

    // Clean shutdown
    if (auto res = session_.dispatch(command::Quit{}); !res) {
        log("Quit: " + describe(res.error()));
    }
    terminal_.restore();
    archive_.close();
    registry_.stop();
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::handle_input(std::string_view bytes) {
    for (size_t i = 0; i < bytes.size(); ++i) {
        // CSI sequences: up/down arrows scroll, everything else is ignored.
        if (bytes[i] == '\x1b' && i + 1 < bytes.size() && bytes[i + 1] == '[') {
            size_t j = i + 2;
            while (j < bytes.size() && !(bytes[j] >= '@' && bytes[j] <= '~')) ++j;
            if (j < bytes.size()) {
                if (bytes[j] == 'A') handle_key('k');
                else if (bytes[j] == 'B') handle_key('j');
            }
            i = j;
            continue;
        }
        handle_key(bytes[i]);
    }
    redraw();
}

void LinuxEventLoop::handle_key(char key) {
    switch (key) {
        case 'r':
            session_.post(command::Start{});
            break;
        case ' ':
            if (session_.state() == SessionState::Recording) {
                session_.post(command::Pause{});
            } else if (session_.state() == SessionState::Paused) {
                session_.post(command::Resume{});
            }
            break;
        case 'd':
            next_device();
            break;
        case 's':
            session_.post(command::OpenSettings{});
            break;
        case 'x':
            session_.post(command::Reset{});
            break;
        case 'j':
            view_.scroll_down(1);
            break;
        case 'k':
            view_.scroll_up(1);
            break;
        case 'q':
        case '\x1b':
        case '\x03':
            running_.store(false, std::memory_order_release);
            break;
        default:
            break;
    }
}

void LinuxEventLoop::next_device() {
    refresh_devices();
    auto& devices = view_.devices();
    if (devices.empty()) return;

    auto current = session_.status().device_id;
    auto it = std::ranges::find_if(devices,
                                   [&current](const DeviceDescriptor& d) { return d.id == current; });
    size_t next = it == devices.end() ? 0 : (static_cast<size_t>(it - devices.begin()) + 1) %
                                                devices.size();
    log("Selecting " + devices[next].id);
    session_.post(command::SelectDevice{devices[next].id});
}

void LinuxEventLoop::refresh_devices() {
    auto devices = registry_.list_devices();
    if (!devices) {
        std::println(stderr, "devices: {}", describe(devices.error()));
        return;
    }
    view_.set_devices(std::move(*devices));
}

void LinuxEventLoop::redraw() {
    auto frame = view_.render(session_.status(), session_.transcript().snapshot(),
                              terminal_.size());
    if (!terminal_.write(frame)) {
        std::println(stderr, "terminal: write failed: {}", std::strerror(errno));
        running_.store(false, std::memory_order_release);
    }
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[fortis] {}", msg);
    }
}
