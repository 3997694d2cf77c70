#pragma once

#include "soundkeys/audio/SoundHandle.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>

namespace soundkeys::audio {

/// Owns the playback device and the decoder/mixer every sound plays through.
class AudioEngine {
public:
    struct Impl;

    AudioEngine();
    ~AudioEngine();

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    bool initialize();

    /// Every sound opened from this engine must be released before shutdown.
    void shutdown();

    /// Opens a sound file. Decoding continues in the background; poll
    /// SoundHandle::isReady() to know when it finished.
    std::expected<std::unique_ptr<SoundHandle>, std::string> openSound(const std::filesystem::path& path);

    /// Get the device sample rate
    uint32_t sampleRate() const;

private:
    std::unique_ptr<Impl> impl_;
};

}  // namespace soundkeys::audio
