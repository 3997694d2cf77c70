#pragma once

#include "soundkeys/board/GlobalModes.hpp"
#include "soundkeys/board/GroupCatalog.hpp"
#include "soundkeys/board/KeyBindings.hpp"
#include "soundkeys/input/KeySource.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>

namespace soundkeys::board {

/// Reserved keys. None of them may be alphanumeric, or they would shadow a binding.
struct CommandKeys {
    char quit = 0x1B;  // Esc
    char stopAll = ' ';
    char showTable = '?';
    char toggleLoop = '*';
    char toggleStack = '+';
};

enum class KeyAction : uint8_t {
    Quit,
    StopAll,
    ShowTable,
    ToggleLoop,
    ToggleStack,
    Trigger,
    Unbound,
};

/// Human readable key label ("Esc", "Space", "a", ...).
std::string describeKey(char key);

/// The soundboard's main loop: maps key presses to actions and restarts
/// finished looping sounds on every tick.
class Dispatcher {
public:
    Dispatcher(GroupCatalog& catalog, const KeyBindings& bindings, CommandKeys commandKeys = {},
               GlobalModes modes = {}, std::ostream* out = nullptr);

    /// Resolves a key through the command table first, then the bindings.
    KeyAction classify(char key) const;

    /// Handles one key press. Returns false when the quit key was pressed.
    bool handleKey(char key);

    /// Loop tick over every group. Returns how many sounds were restarted.
    size_t tick();

    void stopAll();

    std::string bindingTable() const;
    void printBindingTable() const;

    /// Runs until the quit key, an external stop request or a closed key source.
    /// Always leaves every sound stopped.
    void run(input::KeySource& keys, std::chrono::milliseconds tickInterval,
             const std::function<bool()>& stopRequested = {});

    GlobalModes& modes() { return modes_; }
    const GlobalModes& modes() const { return modes_; }
    const CommandKeys& commandKeys() const { return commandKeys_; }

private:
    void trigger(char key, size_t groupIndex);

    GroupCatalog& catalog_;
    const KeyBindings& bindings_;
    CommandKeys commandKeys_;
    GlobalModes modes_;
    std::ostream* out_;
};

}  // namespace soundkeys::board
