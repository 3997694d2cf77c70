#pragma once

#include <optional>

namespace soundkeys::input {

/// Non-blocking source of key presses.
class KeySource {
public:
    virtual ~KeySource() = default;

    /// Returns the next pending key, or nullopt when none is waiting. Never blocks.
    virtual std::optional<char> poll() = 0;

    /// True once the source can never produce another key (e.g. stdin hit EOF).
    virtual bool closed() const { return false; }
};

}  // namespace soundkeys::input
