#include "soundkeys/board/SoundGroup.hpp"

#include "soundkeys/common/Log.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace soundkeys::board {

std::string_view playbackModeName(PlaybackMode mode) {
    switch (mode) {
    case PlaybackMode::Sequential:
        return "sequential";
    case PlaybackMode::Parallel:
        return "parallel";
    case PlaybackMode::Random:
        return "random";
    }
    return "unknown";
}

SoundGroup::SoundGroup(uint32_t orderIndex, std::string name) : orderIndex_(orderIndex), name_(std::move(name)) {}

void SoundGroup::addSound(std::unique_ptr<audio::SoundHandle> sound) {
    if (sound) {
        sounds_.push_back(std::move(sound));
    }
}

TriggerResult SoundGroup::triggerNext(const GlobalModes& modes) {
    if (sounds_.empty()) {
        return TriggerResult::InvalidIndex;
    }

    applyModes(modes);

    if (lastPlayedIndex_ >= 0) {
        const auto current = static_cast<size_t>(lastPlayedIndex_);
        if (!stackEnabled_) {
            stopSound(current);
        }
        if (current + 1 >= sounds_.size()) {
            lastPlayedIndex_ = -1;
            return TriggerResult::SequenceComplete;
        }
    }

    const auto next = static_cast<size_t>(lastPlayedIndex_ + 1);
    lastPlayedIndex_ = static_cast<int>(next);
    return startSound(next) ? TriggerResult::Started : TriggerResult::PlaybackFailed;
}

TriggerResult SoundGroup::triggerAt(size_t index, const GlobalModes& modes) {
    if (index >= sounds_.size()) {
        return TriggerResult::InvalidIndex;
    }

    applyModes(modes);

    if (lastPlayedIndex_ >= 0 && !stackEnabled_) {
        stopSound(static_cast<size_t>(lastPlayedIndex_));
    }
    lastPlayedIndex_ = static_cast<int>(index);
    return startSound(index) ? TriggerResult::Started : TriggerResult::PlaybackFailed;
}

size_t SoundGroup::restartFinished() {
    if (!loopEnabled_ || lastPlayedIndex_ < 0) {
        return 0;
    }

    const auto last = static_cast<size_t>(lastPlayedIndex_);
    const size_t first = stackEnabled_ ? 0 : last;
    size_t restarted = 0;
    for (size_t i = first; i <= last; ++i) {
        if (!sounds_[i]->isAtEnd()) {
            continue;
        }
        if (startSound(i)) {
            ++restarted;
        }
    }
    return restarted;
}

void SoundGroup::stopAll() {
    for (size_t i = 0; i < sounds_.size(); ++i) {
        stopSound(i);
    }
}

size_t SoundGroup::playingCount() const {
    return static_cast<size_t>(
        std::count_if(sounds_.begin(), sounds_.end(), [](const auto& sound) { return sound->isPlaying(); }));
}

void SoundGroup::applyModes(const GlobalModes& modes) {
    loopEnabled_ = modes.loop;
    stackEnabled_ = modes.stack;
    if (modes.random) {
        mode_ = PlaybackMode::Random;
    } else {
        mode_ = modes.stack ? PlaybackMode::Parallel : PlaybackMode::Sequential;
    }
}

void SoundGroup::stopSound(size_t index) {
    if (auto result = sounds_[index]->stop(); !result.has_value()) {
        common::logError(std::format("[{}] {}", name_, result.error()));
    }
}

bool SoundGroup::startSound(size_t index) {
    auto& sound = *sounds_[index];
    if (auto result = sound.seek(0.0); !result.has_value()) {
        common::logError(std::format("[{}] {}", name_, result.error()));
    }
    if (auto result = sound.play(); !result.has_value()) {
        common::logError(std::format("[{}] {}", name_, result.error()));
        return false;
    }
    return true;
}

}  // namespace soundkeys::board
