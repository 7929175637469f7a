#pragma once

#include "ui/transcript_view.hpp"

#include <string_view>
#include <termios.h>

// Raw-mode terminal on stdin/stdout. Restores the original mode, cursor and
// screen on destruction.
class Terminal {
public:
    Terminal() = default;
    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    bool enter_raw();
    void restore();

    ScreenSize size() const;
    bool write(std::string_view data);

    int input_fd() const { return 0; }

private:
    termios saved_{};
    bool raw_ = false;
};
