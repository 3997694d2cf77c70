#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace soundkeys::board {

/// Metadata carried by a sound filename of the form `PPP_NAME (N).ext`.
struct SoundFileInfo {
    std::string prefix;      ///< Three-digit group order prefix, e.g. "001"
    uint32_t orderIndex = 0; ///< Numeric value of the prefix
    std::string groupName;   ///< Group name, may contain spaces
    uint32_t index = 0;      ///< Parenthesized index, informational only
    std::string extension;   ///< "wav" or "mp3"
    std::filesystem::path path;
};

/// Parses a bare filename against `^(\d{3})_(.+?) \(\d+\)\.(mp3|wav)$`.
/// Returns nullopt for non-conforming names.
std::optional<SoundFileInfo> parseSoundFileName(std::string_view filename);

/// Convenience overload that matches the filename part of a full path and keeps the path.
std::optional<SoundFileInfo> parseSoundFilePath(const std::filesystem::path& path);

/// Lists regular `.wav` / `.mp3` files directly inside `directory`, sorted by name.
/// A missing or unreadable directory is reported and yields an empty list.
std::vector<std::filesystem::path> listSoundFiles(const std::filesystem::path& directory);

}  // namespace soundkeys::board
