#include "soundkeys/app/App.hpp"
#include "soundkeys/app/AppConfig.hpp"
#include "soundkeys/common/Paths.hpp"

#include <charconv>
#include <chrono>
#include <exception>
#include <expected>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace {

struct CliOptions {
    std::optional<std::filesystem::path> configPath;
    std::optional<std::filesystem::path> soundDirectory;
    std::optional<int> tickMs;
    bool loop = false;
    bool stack = false;
    bool help = false;
};

void printUsage(std::ostream& out, std::string_view programName) {
    out << "Usage:\n";
    out << "  " << programName << " [options] [sound-directory]\n";
    out << "\nSound files must be named 'NNN_Group Name (N).wav' or '.mp3'.\n";
    out << "\nOptions:\n";
    out << "  --config, -c    Configuration file (default: ~/.config/soundkeys/config.json)\n";
    out << "  --tick-ms       Loop tick interval in milliseconds (default: 100)\n";
    out << "  --loop          Start with loop mode on\n";
    out << "  --stack         Start with stack mode on\n";
    out << "  --help, -h      Show this help\n";
}

std::expected<CliOptions, std::string> parseArgs(int argc, char** argv) {
    CliOptions options;

    auto require_value = [&](int& index, std::string_view flag) -> std::expected<std::string, std::string> {
        if (index + 1 >= argc) {
            return std::unexpected(std::format("Missing value for {}", flag));
        }
        ++index;
        return std::string(argv[index]);
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            options.help = true;
            continue;
        }
        if (arg == "--config" || arg == "-c") {
            auto value = require_value(i, arg);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            options.configPath = std::filesystem::path(*value);
            continue;
        }
        if (arg == "--tick-ms") {
            auto value = require_value(i, arg);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            int parsed = 0;
            const auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), parsed);
            if (ec != std::errc() || ptr != value->data() + value->size() || parsed <= 0) {
                return std::unexpected(std::format("Invalid --tick-ms value '{}'", *value));
            }
            options.tickMs = parsed;
            continue;
        }
        if (arg == "--loop") {
            options.loop = true;
            continue;
        }
        if (arg == "--stack") {
            options.stack = true;
            continue;
        }
        if (arg.starts_with("-")) {
            return std::unexpected(std::format("Unknown option '{}'", arg));
        }
        if (options.soundDirectory.has_value()) {
            return std::unexpected("Only one sound directory may be given");
        }
        options.soundDirectory = std::filesystem::path(arg);
    }
    return options;
}

int runApp(const CliOptions& options) {
    try {
        const auto configPath = options.configPath.value_or(soundkeys::common::userConfigPath());
        auto config = soundkeys::app::loadAppConfig(configPath);
        if (!config.has_value()) {
            std::cerr << "Config error: " << config.error() << " (using defaults)\n";
            config = soundkeys::app::AppConfig{};
        }
        if (options.soundDirectory.has_value()) {
            config->soundDirectory = *options.soundDirectory;
        }
        if (options.tickMs.has_value()) {
            config->tickInterval = std::chrono::milliseconds(*options.tickMs);
        }
        config->loop = config->loop || options.loop;
        config->stack = config->stack || options.stack;

        soundkeys::app::App app(std::move(*config));
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << '\n';
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv) {
    auto options = parseArgs(argc, argv);
    if (!options.has_value()) {
        std::cerr << "Error: " << options.error() << '\n';
        printUsage(std::cerr, argc > 0 ? argv[0] : "soundkeys");
        return 1;
    }
    if (options->help) {
        printUsage(std::cout, argc > 0 ? argv[0] : "soundkeys");
        return 0;
    }
    return runApp(*options);
}
