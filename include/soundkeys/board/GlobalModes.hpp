#pragma once

namespace soundkeys::board {

/// Process-wide playback toggles. A group copies these when it is triggered,
/// so flipping a toggle never changes a group that is already playing.
struct GlobalModes {
    bool loop = false;
    bool stack = false;
    bool random = false;  ///< Reserved. Selectable, plays exactly like sequential.

    bool toggleLoop() {
        loop = !loop;
        return loop;
    }

    bool toggleStack() {
        stack = !stack;
        return stack;
    }
};

}  // namespace soundkeys::board
