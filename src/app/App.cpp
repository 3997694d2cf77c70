#include "soundkeys/app/App.hpp"

#include "soundkeys/audio/AudioEngine.hpp"
#include "soundkeys/board/Dispatcher.hpp"
#include "soundkeys/board/GroupCatalog.hpp"
#include "soundkeys/board/KeyBindings.hpp"
#include "soundkeys/board/SoundLibrary.hpp"
#include "soundkeys/common/Log.hpp"
#include "soundkeys/common/Logger.hpp"
#include "soundkeys/common/Paths.hpp"
#include "soundkeys/input/TerminalKeySource.hpp"

#include <csignal>
#include <format>
#include <utility>

namespace soundkeys::app {
namespace {

volatile std::sig_atomic_t interruptRequested = 0;

void onInterrupt(int /*signal*/) {
    interruptRequested = 1;
}

}  // namespace

App::App(AppConfig config) : config_(std::move(config)) {}

int App::run() {
    const auto logPath = config_.logFile.value_or(common::defaultLogPath());
    if (!logPath.empty() && !common::Logger::init(logPath)) {
        common::logWarning(std::format("Could not open log file '{}'", logPath.string()));
    }
    common::Logger::log("Starting soundkeys...");

    board::KeyBindings bindings(config_.keySet);

    common::Logger::log("Initializing audio engine...");
    audio::AudioEngine audioEngine;
    if (!audioEngine.initialize()) {
        common::logError("Audio engine failed to initialize");
        common::Logger::shutdown();
        return 1;
    }
    common::Logger::log(std::format("Audio engine initialized ({} Hz)", audioEngine.sampleRate()));

    const auto directory =
        config_.soundDirectory.empty() ? common::defaultSoundDirectory() : config_.soundDirectory;
    common::logInfo(std::format("Scanning '{}'", directory.string()));
    const auto files = board::listSoundFiles(directory);

    board::GroupCatalog catalog;
    const auto report = catalog.build(files, bindings, [&audioEngine](const std::filesystem::path& path) {
        return audioEngine.openSound(path);
    });

    if (catalog.empty()) {
        common::logWarning("No playable sound files found, every key is unbound");
    } else {
        common::logInfo(std::format("Loaded {} sounds in {} groups", report.admittedFiles, catalog.size()));
    }
    if (report.skippedFiles > 0) {
        common::Logger::log(std::format("Ignored {} files not named 'NNN_Name (N).ext'", report.skippedFiles));
    }
    if (!report.droppedGroups.empty()) {
        common::logWarning(std::format("{} groups ({} files) left unbound: only {} keys available",
                                       report.droppedGroups.size(), report.droppedFiles.size(), bindings.capacity()));
    }

    const auto readiness = catalog.waitUntilReady(config_.readyTimeout);
    for (const auto& path : readiness.notReady) {
        common::logWarning(std::format("'{}' not ready after {} ms", path.filename().string(),
                                       config_.readyTimeout.count()));
    }

    catalog.stopAll();

    board::GlobalModes modes{.loop = config_.loop, .stack = config_.stack, .random = config_.randomMode};
    board::Dispatcher dispatcher(catalog, bindings, config_.commandKeys, modes);
    dispatcher.printBindingTable();

    interruptRequested = 0;
    auto previousInt = std::signal(SIGINT, onInterrupt);
    auto previousTerm = std::signal(SIGTERM, onInterrupt);
    {
        input::TerminalKeySource keys;
        dispatcher.run(keys, config_.tickInterval, []() { return interruptRequested != 0; });
    }
    std::signal(SIGINT, previousInt);
    std::signal(SIGTERM, previousTerm);

    common::Logger::log("Shutting down...");
    catalog.stopAll();
    catalog.clear();
    audioEngine.shutdown();
    common::logInfo("Shutdown complete");
    common::Logger::shutdown();
    return 0;
}

}  // namespace soundkeys::app
