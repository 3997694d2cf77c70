#include "soundkeys/board/SoundLibrary.hpp"

#include "soundkeys/common/Log.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <regex>

namespace soundkeys::board {
namespace {

const std::regex& soundFilePattern() {
    static const std::regex pattern(R"(^(\d{3})_(.+?) \((\d+)\)\.(mp3|wav)$)");
    return pattern;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

uint32_t parseUnsigned(const std::string& digits) {
    uint32_t value = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc()) {
        return 0;
    }
    return value;
}

}  // namespace

std::optional<SoundFileInfo> parseSoundFileName(std::string_view filename) {
    const std::string name(filename);
    std::smatch match;
    if (!std::regex_match(name, match, soundFilePattern())) {
        return std::nullopt;
    }

    SoundFileInfo info;
    info.prefix = match[1].str();
    info.orderIndex = parseUnsigned(info.prefix);
    info.groupName = match[2].str();
    info.index = parseUnsigned(match[3].str());
    info.extension = match[4].str();
    info.path = name;
    return info;
}

std::optional<SoundFileInfo> parseSoundFilePath(const std::filesystem::path& path) {
    auto info = parseSoundFileName(path.filename().string());
    if (info.has_value()) {
        info->path = path;
    }
    return info;
}

std::vector<std::filesystem::path> listSoundFiles(const std::filesystem::path& directory) {
    std::vector<std::filesystem::path> files;

    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec) || ec) {
        common::logWarning(std::format("Sound directory '{}' does not exist", directory.string()));
        return files;
    }

    for (std::filesystem::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code typeEc;
        if (!entry.is_regular_file(typeEc) || typeEc) {
            continue;
        }
        const std::string ext = toLower(entry.path().extension().string());
        if (ext != ".wav" && ext != ".mp3") {
            continue;
        }
        files.push_back(entry.path());
    }
    if (ec) {
        common::logWarning(std::format("Failed to read sound directory '{}': {}", directory.string(), ec.message()));
    }

    std::sort(files.begin(), files.end(),
              [](const auto& lhs, const auto& rhs) { return lhs.filename().string() < rhs.filename().string(); });
    return files;
}

}  // namespace soundkeys::board
