#pragma once

#include "config.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/pipewire_registry.hpp"
#include "platform/linux/terminal.hpp"
#include "ring_buffer.hpp"
#include "session.hpp"
#include "storage/transcript_archive.hpp"
#include "ui/transcript_view.hpp"

#include <atomic>
#include <string>
#include <string_view>

class LinuxEventLoop {
public:
    LinuxEventLoop(Config config, std::string config_path, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_input(std::string_view bytes);
    void handle_key(char key);
    void next_device();
    void refresh_devices();
    void redraw();
    void log(const std::string& msg);

    Config config_;
    std::string config_path_;
    bool verbose_;

    // Platform implementations (constructed before session_)
    RingBuffer ring_buf_;
    PipeWireRegistry registry_;
    PipeWireCapture audio_capture_;
    TranscriptArchive archive_;

    // Portable pipeline
    Session session_;

    Terminal terminal_;
    TranscriptView view_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int timer_fd_ = -1;
    unsigned ticks_ = 0;

    std::atomic<bool> running_{false};
};
