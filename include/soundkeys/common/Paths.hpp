#pragma once

#include <filesystem>

namespace soundkeys::common {

/// Returns the directory containing the running executable.
std::filesystem::path executableDir();

/// Returns the user config directory for soundkeys.
/// On Linux: $XDG_CONFIG_HOME/soundkeys/ or ~/.config/soundkeys/.
/// Returns an empty path when no user config location is available.
std::filesystem::path userConfigDir();

/// Resolves the default configuration file (<userConfigDir>/config.json).
/// Returns an empty path when no user config location is available.
std::filesystem::path userConfigPath();

/// Sound directory used when neither the command line nor the config names one.
/// Search order: $APPDIR/usr/share/soundkeys/sounds -> <exe_dir>/sounds
std::filesystem::path defaultSoundDirectory();

/// Default log file location (<exe_dir>/soundkeys.log).
std::filesystem::path defaultLogPath();

}  // namespace soundkeys::common
