#pragma once

#include <string_view>

namespace soundkeys::common {

/// Console diagnostics. Each call is also forwarded to Logger.
void logInfo(std::string_view message);
void logWarning(std::string_view message);
void logError(std::string_view message);

}  // namespace soundkeys::common
