#include "platform/linux/terminal.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <sys/ioctl.h>
#include <unistd.h>

// Alternate screen, hidden cursor, cleared.
static constexpr std::string_view kEnterScreen = "\x1b[?1049h\x1b[?25l\x1b[2J";
static constexpr std::string_view kLeaveScreen = "\x1b[?25h\x1b[?1049l";

Terminal::~Terminal() {
    restore();
}

bool Terminal::enter_raw() {
    if (raw_) return true;

    if (!::isatty(STDIN_FILENO) || !::isatty(STDOUT_FILENO)) {
        std::println(stderr, "terminal: stdin/stdout is not a terminal");
        return false;
    }
    if (tcgetattr(STDIN_FILENO, &saved_) != 0) {
        std::println(stderr, "terminal: tcgetattr failed: {}", std::strerror(errno));
        return false;
    }

    termios raw = saved_;
    raw.c_iflag &= ~(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
    raw.c_oflag &= ~(OPOST);
    raw.c_cflag |= CS8;
    // ISIG stays on so Ctrl-C arrives as SIGINT through the signalfd.
    raw.c_lflag &= ~(ECHO | ICANON | IEXTEN);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;

    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) != 0) {
        std::println(stderr, "terminal: tcsetattr failed: {}", std::strerror(errno));
        return false;
    }
    raw_ = true;
    return write(kEnterScreen);
}

void Terminal::restore() {
    if (!raw_) return;
    write(kLeaveScreen);
    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_) != 0) {
        std::println(stderr, "terminal: restore failed: {}", std::strerror(errno));
    }
    raw_ = false;
}

ScreenSize Terminal::size() const {
    winsize ws{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) != 0 || ws.ws_col == 0) {
        return {};
    }
    return {.rows = ws.ws_row, .cols = ws.ws_col};
}

bool Terminal::write(std::string_view data) {
    while (!data.empty()) {
        ssize_t n = ::write(STDOUT_FILENO, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}
