#include "soundkeys/common/Paths.hpp"

#include <cstdlib>

#ifdef _WIN32
#include <Windows.h>
#else
#include <unistd.h>

#include <climits>
#endif

namespace soundkeys::common {
namespace {

#ifdef _WIN32
std::filesystem::path getExecutablePath() {
    wchar_t buf[MAX_PATH];
    const DWORD len = GetModuleFileNameW(nullptr, buf, MAX_PATH);
    if (len == 0 || len >= MAX_PATH) {
        return {};
    }
    return std::filesystem::path(buf);
}
#else
std::filesystem::path getExecutablePath() {
    char buf[PATH_MAX];
    const ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    buf[len] = '\0';
    return std::filesystem::path(buf);
}
#endif

/// Returns the bundled data directory, where read-only resources are installed.
///
/// Search order:
/// 1. $APPDIR/usr/share/soundkeys/  (AppImage on Linux)
/// 2. <exe_dir>/                    (development builds, Windows)
std::filesystem::path bundledDataDir() {
#ifndef _WIN32
    if (const char* appDir = std::getenv("APPDIR"); appDir != nullptr) {
        auto candidate = std::filesystem::path(appDir) / "usr" / "share" / "soundkeys";
        std::error_code ec;
        if (std::filesystem::is_directory(candidate, ec) && !ec) {
            return candidate;
        }
    }
#endif
    return executableDir();
}

}  // namespace

std::filesystem::path executableDir() {
    static const std::filesystem::path dir = getExecutablePath().parent_path();
    return dir;
}

std::filesystem::path userConfigDir() {
#ifdef _WIN32
    if (const char* appData = std::getenv("APPDATA"); appData != nullptr && appData[0] != '\0') {
        return std::filesystem::path(appData) / "soundkeys";
    }
    return {};
#else
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && xdg[0] != '\0') {
        return std::filesystem::path(xdg) / "soundkeys";
    }
    if (const char* home = std::getenv("HOME"); home != nullptr && home[0] != '\0') {
        return std::filesystem::path(home) / ".config" / "soundkeys";
    }
    return {};
#endif
}

std::filesystem::path userConfigPath() {
    const auto dir = userConfigDir();
    if (dir.empty()) {
        return {};
    }
    return dir / "config.json";
}

std::filesystem::path defaultSoundDirectory() {
    auto candidate = bundledDataDir() / "sounds";
    std::error_code ec;
    if (std::filesystem::is_directory(candidate, ec) && !ec) {
        return candidate;
    }
    return executableDir() / "sounds";
}

std::filesystem::path defaultLogPath() {
    return executableDir() / "soundkeys.log";
}

}  // namespace soundkeys::common
