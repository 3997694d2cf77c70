#include "soundkeys/app/AppConfig.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cctype>
#include <cstdint>
#include <exception>
#include <format>
#include <fstream>
#include <sstream>
#include <utility>
using json = nlohmann::json;

namespace soundkeys::app {
namespace {

constexpr int64_t kMaxTickIntervalMs = 5000;
constexpr int64_t kMaxReadyTimeoutMs = 600000;

std::expected<bool, std::string> readBool(const json& root, const char* key, bool fallback) {
    const auto it = root.find(key);
    if (it == root.end()) {
        return fallback;
    }
    if (!it->is_boolean()) {
        return std::unexpected(std::format("Config field '{}' must be a boolean", key));
    }
    return it->get<bool>();
}

std::expected<int64_t, std::string> readInteger(const json& root, const char* key, int64_t fallback, int64_t min,
                                                int64_t max) {
    const auto it = root.find(key);
    if (it == root.end()) {
        return fallback;
    }
    if (!it->is_number_integer()) {
        return std::unexpected(std::format("Config field '{}' must be an integer", key));
    }
    const auto value = it->get<int64_t>();
    if (value < min || value > max) {
        return std::unexpected(std::format("Config field '{}' must be in range {}-{} (got {})", key, min, max, value));
    }
    return value;
}

std::expected<void, std::string> readCommandKey(const json& keys, const char* field, char& target) {
    const auto it = keys.find(field);
    if (it == keys.end()) {
        return {};
    }
    if (!it->is_string()) {
        return std::unexpected(std::format("Command key '{}' must be a string", field));
    }
    auto parsed = parseKeyName(it->get<std::string>());
    if (!parsed.has_value()) {
        return std::unexpected(std::format("Command key '{}': {}", field, parsed.error()));
    }
    target = *parsed;
    return {};
}

}  // namespace

std::expected<char, std::string> parseKeyName(std::string_view name) {
    std::string lowered;
    lowered.reserve(name.size());
    for (const unsigned char ch : name) {
        lowered.push_back(static_cast<char>(std::tolower(ch)));
    }

    if (lowered == "escape" || lowered == "esc") {
        return static_cast<char>(0x1B);
    }
    if (lowered == "space") {
        return ' ';
    }
    if (lowered == "tab") {
        return '\t';
    }
    if (lowered == "enter" || lowered == "return") {
        return '\n';
    }
    if (name.size() == 1 && std::isgraph(static_cast<unsigned char>(name.front())) != 0) {
        return name.front();
    }
    return std::unexpected(std::format("Unknown key name '{}'", name));
}

std::expected<AppConfig, std::string> parseAppConfig(std::string_view jsonText) {
    json root;
    try {
        root = json::parse(jsonText);
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Config is not valid JSON: {}", e.what()));
    }
    if (!root.is_object()) {
        return std::unexpected("Config root must be an object");
    }

    AppConfig config;

    if (const auto it = root.find("soundDirectory"); it != root.end()) {
        if (!it->is_string()) {
            return std::unexpected("Config field 'soundDirectory' must be a string");
        }
        config.soundDirectory = it->get<std::string>();
    }

    if (const auto it = root.find("logFile"); it != root.end()) {
        if (!it->is_string()) {
            return std::unexpected("Config field 'logFile' must be a string");
        }
        config.logFile = std::filesystem::path(it->get<std::string>());
    }

    if (const auto it = root.find("keySet"); it != root.end()) {
        if (!it->is_string()) {
            return std::unexpected("Config field 'keySet' must be a string");
        }
        config.keySet = it->get<std::string>();
    }

    const auto tick = readInteger(root, "tickIntervalMs", config.tickInterval.count(), 1, kMaxTickIntervalMs);
    if (!tick.has_value()) {
        return std::unexpected(tick.error());
    }
    config.tickInterval = std::chrono::milliseconds(*tick);

    const auto ready = readInteger(root, "readyTimeoutMs", config.readyTimeout.count(), 0, kMaxReadyTimeoutMs);
    if (!ready.has_value()) {
        return std::unexpected(ready.error());
    }
    config.readyTimeout = std::chrono::milliseconds(*ready);

    const std::array<std::pair<const char*, bool*>, 3> flags = {{
        {"loop", &config.loop},
        {"stack", &config.stack},
        {"randomMode", &config.randomMode},
    }};
    for (const auto& [key, target] : flags) {
        const auto value = readBool(root, key, *target);
        if (!value.has_value()) {
            return std::unexpected(value.error());
        }
        *target = *value;
    }

    if (const auto it = root.find("commandKeys"); it != root.end()) {
        if (!it->is_object()) {
            return std::unexpected("Config field 'commandKeys' must be an object");
        }
        auto& keys = config.commandKeys;
        for (const auto& [field, target] : std::array<std::pair<const char*, char*>, 5>{{
                 {"quit", &keys.quit},
                 {"stopAll", &keys.stopAll},
                 {"showTable", &keys.showTable},
                 {"toggleLoop", &keys.toggleLoop},
                 {"toggleStack", &keys.toggleStack},
             }}) {
            if (auto result = readCommandKey(*it, field, *target); !result.has_value()) {
                return std::unexpected(result.error());
            }
        }
    }

    if (auto valid = validateAppConfig(config); !valid.has_value()) {
        return std::unexpected(valid.error());
    }
    return config;
}

std::expected<AppConfig, std::string> loadAppConfig(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec) || ec) {
        return AppConfig{};
    }

    std::ifstream in(path);
    if (!in) {
        return std::unexpected(std::format("Failed to open config '{}'", path.string()));
    }
    std::ostringstream contents;
    contents << in.rdbuf();

    auto config = parseAppConfig(contents.str());
    if (!config.has_value()) {
        return std::unexpected(std::format("{}: {}", path.string(), config.error()));
    }
    return config;
}

std::expected<void, std::string> validateAppConfig(const AppConfig& config) {
    const auto& keys = config.commandKeys;
    const std::array<std::pair<const char*, char>, 5> commands = {{
        {"quit", keys.quit},
        {"stopAll", keys.stopAll},
        {"showTable", keys.showTable},
        {"toggleLoop", keys.toggleLoop},
        {"toggleStack", keys.toggleStack},
    }};

    for (size_t i = 0; i < commands.size(); ++i) {
        const auto [name, key] = commands[i];
        if (std::isalnum(static_cast<unsigned char>(key)) != 0) {
            return std::unexpected(std::format("Command key '{}' must not be a letter or digit", name));
        }
        if (config.keySet.find(key) != std::string::npos) {
            return std::unexpected(std::format("Command key '{}' is also in the bindable key set", name));
        }
        for (size_t j = i + 1; j < commands.size(); ++j) {
            if (commands[j].second == key) {
                return std::unexpected(
                    std::format("Command keys '{}' and '{}' use the same key", name, commands[j].first));
            }
        }
    }
    return {};
}

}  // namespace soundkeys::app
