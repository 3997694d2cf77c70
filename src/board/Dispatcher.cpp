#include "soundkeys/board/Dispatcher.hpp"

#include "soundkeys/common/Log.hpp"

#include <cctype>
#include <exception>
#include <format>
#include <iostream>
#include <sstream>
#include <thread>

namespace soundkeys::board {

std::string describeKey(char key) {
    switch (key) {
    case 0x1B:
        return "Esc";
    case ' ':
        return "Space";
    case '\t':
        return "Tab";
    case '\n':
    case '\r':
        return "Enter";
    default:
        break;
    }
    if (std::isgraph(static_cast<unsigned char>(key)) != 0) {
        return std::string(1, key);
    }
    return std::format("0x{:02X}", static_cast<unsigned char>(key));
}

Dispatcher::Dispatcher(GroupCatalog& catalog, const KeyBindings& bindings, CommandKeys commandKeys,
                       GlobalModes modes, std::ostream* out)
    : catalog_(catalog), bindings_(bindings), commandKeys_(commandKeys), modes_(modes),
      out_(out != nullptr ? out : &std::cout) {}

KeyAction Dispatcher::classify(char key) const {
    if (key == commandKeys_.quit) {
        return KeyAction::Quit;
    }
    if (key == commandKeys_.stopAll) {
        return KeyAction::StopAll;
    }
    if (key == commandKeys_.showTable) {
        return KeyAction::ShowTable;
    }
    if (key == commandKeys_.toggleLoop) {
        return KeyAction::ToggleLoop;
    }
    if (key == commandKeys_.toggleStack) {
        return KeyAction::ToggleStack;
    }
    if (bindings_.lookup(key).has_value()) {
        return KeyAction::Trigger;
    }
    return KeyAction::Unbound;
}

bool Dispatcher::handleKey(char key) {
    switch (classify(key)) {
    case KeyAction::Quit:
        common::logInfo("Quit requested");
        stopAll();
        return false;
    case KeyAction::StopAll:
        stopAll();
        common::logInfo("All sounds stopped");
        return true;
    case KeyAction::ShowTable:
        printBindingTable();
        return true;
    case KeyAction::ToggleLoop:
        common::logInfo(std::format("Loop mode {}", modes_.toggleLoop() ? "on" : "off"));
        return true;
    case KeyAction::ToggleStack:
        common::logInfo(std::format("Stack mode {}", modes_.toggleStack() ? "on" : "off"));
        return true;
    case KeyAction::Trigger:
        if (const auto groupIndex = bindings_.lookup(key); groupIndex.has_value()) {
            trigger(key, *groupIndex);
        }
        return true;
    case KeyAction::Unbound:
        common::logWarning(std::format("No binding for key '{}'", describeKey(key)));
        return true;
    }
    return true;
}

void Dispatcher::trigger(char key, size_t groupIndex) {
    auto& group = catalog_.at(groupIndex);
    const auto label = describeKey(KeyBindings::normalizeKey(key));

    switch (group.triggerNext(modes_)) {
    case TriggerResult::Started: {
        const auto index = static_cast<size_t>(group.lastPlayedIndex());
        common::logInfo(std::format("[{}] {} {}/{} {}{}", label, group.name(), index + 1, group.size(),
                                    group.sound(index).path().filename().string(),
                                    group.loopEnabled() ? " (loop)" : ""));
        break;
    }
    case TriggerResult::SequenceComplete:
        common::logInfo(std::format("[{}] {}: sequence complete", label, group.name()));
        break;
    case TriggerResult::PlaybackFailed:
        common::logWarning(std::format("[{}] {}: playback failed", label, group.name()));
        break;
    case TriggerResult::InvalidIndex:
        common::logWarning(std::format("[{}] {}: group has no sounds", label, group.name()));
        break;
    }
}

size_t Dispatcher::tick() {
    size_t restarted = 0;
    for (auto& group : catalog_.groups()) {
        try {
            restarted += group.restartFinished();
        } catch (const std::exception& e) {
            common::logError(std::format("[{}] Loop restart failed: {}", group.name(), e.what()));
        }
    }
    return restarted;
}

void Dispatcher::stopAll() {
    catalog_.stopAll();
}

std::string Dispatcher::bindingTable() const {
    std::ostringstream oss;
    oss << std::format("{:<6} {:<32} {:>6}\n", "Key", "Group", "Sounds");
    oss << std::string(46, '-') << '\n';
    for (const auto& binding : bindings_.bindings()) {
        const auto& group = catalog_.at(binding.groupIndex);
        oss << std::format("{:<6} {:<32} {:>6}\n", describeKey(binding.key), group.name(), group.size());
    }
    if (bindings_.bindings().empty()) {
        oss << "(no sounds bound)\n";
    }
    oss << std::format("\nLoop: {}  Stack: {}{}\n", modes_.loop ? "on" : "off", modes_.stack ? "on" : "off",
                       modes_.random ? "  Random: on (reserved)" : "");
    oss << std::format("Keys: {} quit, {} stop all, {} table, {} loop, {} stack\n", describeKey(commandKeys_.quit),
                       describeKey(commandKeys_.stopAll), describeKey(commandKeys_.showTable),
                       describeKey(commandKeys_.toggleLoop), describeKey(commandKeys_.toggleStack));
    return oss.str();
}

void Dispatcher::printBindingTable() const {
    *out_ << bindingTable() << std::flush;
}

void Dispatcher::run(input::KeySource& keys, std::chrono::milliseconds tickInterval,
                     const std::function<bool()>& stopRequested) {
    bool running = true;
    while (running) {
        if (stopRequested && stopRequested()) {
            common::logInfo("Interrupted");
            stopAll();
            break;
        }
        if (keys.closed()) {
            common::logInfo("Input closed");
            stopAll();
            break;
        }

        try {
            if (const auto key = keys.poll(); key.has_value()) {
                running = handleKey(*key);
            }
        } catch (const std::exception& e) {
            common::logError(std::format("Key handling failed: {}", e.what()));
        }
        if (!running) {
            break;
        }

        if (tickInterval.count() > 0) {
            std::this_thread::sleep_for(tickInterval);
        }

        tick();
    }
}

}  // namespace soundkeys::board
