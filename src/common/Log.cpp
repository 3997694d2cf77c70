#include "soundkeys/common/Log.hpp"

#include "soundkeys/common/Logger.hpp"

#include <iostream>
#include <string>

namespace soundkeys::common {

void logInfo(std::string_view message) {
    std::cout << "[info] " << message << '\n';
    Logger::log(std::string(message));
}

void logWarning(std::string_view message) {
    std::cout << "[warn] " << message << '\n';
    Logger::logWarning(std::string(message));
}

void logError(std::string_view message) {
    std::cerr << "[error] " << message << '\n';
    Logger::logError(std::string(message));
}

}  // namespace soundkeys::common
