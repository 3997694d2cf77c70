#pragma once

#include "soundkeys/input/KeySource.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace soundkeys::input {

/// Splits raw terminal bytes into key presses, dropping CSI (`Esc [`) and
/// SS3 (`Esc O`) sequences. An Esc followed by any other byte is reported
/// as Esc plus that key.
class EscapeSequenceFilter {
public:
    /// Returns the keys completed by `byte`, in input order.
    std::vector<char> feed(char byte);

    /// Call when no more input is pending: a dangling Esc is a key press.
    std::optional<char> flush();

private:
    enum class Phase { Ground, Escape, Csi, Ss3 };
    Phase phase_ = Phase::Ground;
};

/// Reads single key presses from the console without waiting for Enter.
///
/// Switches the terminal to unbuffered, no-echo input for its lifetime and
/// restores the previous settings on destruction. Arrow and function key
/// sequences are swallowed through EscapeSequenceFilter.
class TerminalKeySource final : public KeySource {
public:
    struct State;

    TerminalKeySource();
    ~TerminalKeySource() override;

    TerminalKeySource(const TerminalKeySource&) = delete;
    TerminalKeySource& operator=(const TerminalKeySource&) = delete;

    std::optional<char> poll() override;
    bool closed() const override { return closed_; }

private:
    std::unique_ptr<State> state_;
    bool closed_ = false;
};

}  // namespace soundkeys::input
