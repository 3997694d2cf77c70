#pragma once

#include <filesystem>
#include <string>

namespace soundkeys::common {

/// Simple logger that appends timestamped diagnostics to a log file.
/// Calls before init() or after a failed open are no-ops.
class Logger {
public:
    static bool init(const std::filesystem::path& logPath);
    static void log(const std::string& message);
    static void logWarning(const std::string& message);
    static void logError(const std::string& message);
    static void shutdown();

private:
    Logger() = default;
};

}  // namespace soundkeys::common
