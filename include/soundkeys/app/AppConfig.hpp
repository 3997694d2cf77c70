#pragma once

#include "soundkeys/board/Dispatcher.hpp"
#include "soundkeys/board/KeyBindings.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace soundkeys::app {

struct AppConfig {
    std::filesystem::path soundDirectory;  ///< Empty = common::defaultSoundDirectory()
    std::chrono::milliseconds tickInterval{100};
    std::chrono::milliseconds readyTimeout{10000};
    std::string keySet{board::kDefaultKeySet};
    board::CommandKeys commandKeys;
    bool loop = false;
    bool stack = false;
    bool randomMode = false;
    /// nullopt = common::defaultLogPath(), empty path = file logging disabled.
    std::optional<std::filesystem::path> logFile;
};

/// Accepts a single printable character or one of "escape", "space", "tab", "enter".
std::expected<char, std::string> parseKeyName(std::string_view name);

/// Parses a JSON configuration document. Absent fields keep their defaults.
std::expected<AppConfig, std::string> parseAppConfig(std::string_view jsonText);

/// Loads the configuration file at `path`. A missing file yields the defaults.
std::expected<AppConfig, std::string> loadAppConfig(const std::filesystem::path& path);

/// Checks command keys against each other and against the bindable key set.
std::expected<void, std::string> validateAppConfig(const AppConfig& config);

}  // namespace soundkeys::app
