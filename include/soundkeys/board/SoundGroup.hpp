#pragma once

#include "soundkeys/audio/SoundHandle.hpp"
#include "soundkeys/board/GlobalModes.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace soundkeys::board {

enum class PlaybackMode : uint8_t {
    Sequential,
    Parallel,
    Random,  // reserved, behaves like Sequential
};

std::string_view playbackModeName(PlaybackMode mode);

enum class TriggerResult : uint8_t {
    Started,           ///< A sound was started and lastPlayedIndex points at it
    SequenceComplete,  ///< The last sound was reached; group is idle again
    PlaybackFailed,    ///< State advanced but the player refused to start the sound
    InvalidIndex,      ///< Requested index out of range, nothing changed
};

/// An ordered set of sounds bound to one key, plus its playback state.
///
/// Idle while lastPlayedIndex() == -1, otherwise "playing" the sound at that
/// index. Each sequential trigger advances one step; the trigger after the
/// last sound resets to idle without starting anything.
class SoundGroup {
public:
    SoundGroup(uint32_t orderIndex, std::string name);

    SoundGroup(SoundGroup&&) noexcept = default;
    SoundGroup& operator=(SoundGroup&&) noexcept = default;
    SoundGroup(const SoundGroup&) = delete;
    SoundGroup& operator=(const SoundGroup&) = delete;

    void addSound(std::unique_ptr<audio::SoundHandle> sound);

    uint32_t orderIndex() const { return orderIndex_; }
    const std::string& name() const { return name_; }
    size_t size() const { return sounds_.size(); }
    bool empty() const { return sounds_.empty(); }

    int lastPlayedIndex() const { return lastPlayedIndex_; }
    bool isIdle() const { return lastPlayedIndex_ < 0; }
    bool loopEnabled() const { return loopEnabled_; }
    bool stackEnabled() const { return stackEnabled_; }
    PlaybackMode mode() const { return mode_; }

    audio::SoundHandle& sound(size_t index) { return *sounds_.at(index); }
    const audio::SoundHandle& sound(size_t index) const { return *sounds_.at(index); }

    /// Default key action: advance to the next sound of the sequence.
    TriggerResult triggerNext(const GlobalModes& modes);

    /// Play an explicit sound, bypassing sequence advance.
    TriggerResult triggerAt(size_t index, const GlobalModes& modes);

    /// Loop tick. Restarts every inspected sound that reached its natural end
    /// when looping is enabled. Returns the number of sounds restarted.
    size_t restartFinished();

    /// Halts playback of every sound. Sequence position is kept.
    void stopAll();

    size_t playingCount() const;

private:
    void applyModes(const GlobalModes& modes);
    void stopSound(size_t index);
    bool startSound(size_t index);

    uint32_t orderIndex_ = 0;
    std::string name_;
    std::vector<std::unique_ptr<audio::SoundHandle>> sounds_;
    int lastPlayedIndex_ = -1;
    bool loopEnabled_ = false;
    bool stackEnabled_ = false;
    PlaybackMode mode_ = PlaybackMode::Sequential;
};

}  // namespace soundkeys::board
