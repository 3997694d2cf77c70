#include "soundkeys/input/TerminalKeySource.hpp"

#ifdef _WIN32
#include <conio.h>
#else
#include <deque>

#include <sys/select.h>
#include <termios.h>
#include <unistd.h>
#endif

namespace soundkeys::input {

namespace {

constexpr char kEscape = 0x1B;

}  // namespace

std::vector<char> EscapeSequenceFilter::feed(char byte) {
    switch (phase_) {
    case Phase::Ground:
        if (byte == kEscape) {
            phase_ = Phase::Escape;
            return {};
        }
        return {byte};
    case Phase::Escape:
        if (byte == '[') {
            phase_ = Phase::Csi;
            return {};
        }
        if (byte == 'O') {
            phase_ = Phase::Ss3;
            return {};
        }
        if (byte == kEscape) {
            return {kEscape};
        }
        phase_ = Phase::Ground;
        return {kEscape, byte};
    case Phase::Csi:
        // Parameter and intermediate bytes run until a final byte in 0x40-0x7E.
        if (byte >= 0x40 && byte <= 0x7E) {
            phase_ = Phase::Ground;
        }
        return {};
    case Phase::Ss3:
        phase_ = Phase::Ground;
        return {};
    }
    return {};
}

std::optional<char> EscapeSequenceFilter::flush() {
    if (phase_ == Phase::Escape) {
        phase_ = Phase::Ground;
        return kEscape;
    }
    return std::nullopt;
}

#ifdef _WIN32

struct TerminalKeySource::State {};

TerminalKeySource::TerminalKeySource() : state_(std::make_unique<State>()) {}

TerminalKeySource::~TerminalKeySource() = default;

std::optional<char> TerminalKeySource::poll() {
    if (_kbhit() == 0) {
        return std::nullopt;
    }
    const int ch = _getch();
    if (ch == 0 || ch == 0xE0) {
        // Extended key: discard the scan code that follows.
        (void)_getch();
        return std::nullopt;
    }
    return static_cast<char>(ch);
}

#else

namespace {

bool inputPending() {
    fd_set rfds;
    FD_ZERO(&rfds);
    FD_SET(STDIN_FILENO, &rfds);
    timeval tv{0, 0};
    return select(STDIN_FILENO + 1, &rfds, nullptr, nullptr, &tv) > 0 && FD_ISSET(STDIN_FILENO, &rfds);
}

}  // namespace

struct TerminalKeySource::State {
    termios original{};
    bool rawMode = false;
    EscapeSequenceFilter filter;
    std::deque<char> pending;
};

TerminalKeySource::TerminalKeySource() : state_(std::make_unique<State>()) {
    if (isatty(STDIN_FILENO) == 0) {
        return;
    }
    if (tcgetattr(STDIN_FILENO, &state_->original) != 0) {
        return;
    }
    termios raw = state_->original;
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    state_->rawMode = (tcsetattr(STDIN_FILENO, TCSANOW, &raw) == 0);
}

TerminalKeySource::~TerminalKeySource() {
    if (state_ && state_->rawMode) {
        tcsetattr(STDIN_FILENO, TCSANOW, &state_->original);
    }
}

std::optional<char> TerminalKeySource::poll() {
    auto& pending = state_->pending;
    while (pending.empty() && !closed_ && inputPending()) {
        char c = 0;
        const ssize_t n = ::read(STDIN_FILENO, &c, 1);
        if (n == 0) {
            closed_ = true;
            break;
        }
        if (n != 1) {
            break;
        }
        for (const char key : state_->filter.feed(c)) {
            pending.push_back(key);
        }
    }
    if (pending.empty()) {
        if (const auto key = state_->filter.flush(); key.has_value()) {
            pending.push_back(*key);
        }
    }
    if (pending.empty()) {
        return std::nullopt;
    }

    const char key = pending.front();
    pending.pop_front();
    return key;
}

#endif

}  // namespace soundkeys::input
