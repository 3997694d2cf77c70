#pragma once

#include <expected>
#include <filesystem>
#include <string>

namespace soundkeys::audio {

/// One decodable audio asset. Owned by exactly one sound group.
///
/// Operations that can fail on a disposed or invalid handle return an error
/// message instead of throwing, so callers can report and carry on.
class SoundHandle {
public:
    virtual ~SoundHandle() = default;

    virtual const std::filesystem::path& path() const = 0;

    virtual std::expected<void, std::string> play() = 0;
    virtual std::expected<void, std::string> stop() = 0;

    /// Move the playback cursor to the given position in seconds.
    virtual std::expected<void, std::string> seek(double seconds) = 0;

    virtual bool isPlaying() const = 0;
    virtual bool isAtStart() const = 0;

    /// True once playback ran to the natural end of the asset.
    virtual bool isAtEnd() const = 0;

    /// True once the asset is decoded far enough to be played.
    virtual bool isReady() const = 0;

    /// Cursor position in seconds (0 when unknown).
    virtual double position() const = 0;

    /// Length in seconds, negative when unknown.
    virtual double duration() const = 0;
};

}  // namespace soundkeys::audio
