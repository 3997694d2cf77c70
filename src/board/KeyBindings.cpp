#include "soundkeys/board/KeyBindings.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <stdexcept>

namespace soundkeys::board {

KeyBindings::KeyBindings(std::string_view keySet) {
    if (keySet.empty()) {
        throw std::invalid_argument("Key set is empty");
    }

    keySet_.reserve(keySet.size());
    for (const char raw : keySet) {
        if (std::isgraph(static_cast<unsigned char>(raw)) == 0) {
            throw std::invalid_argument(
                std::format("Key set contains a non-printable key (0x{:02X})", static_cast<unsigned char>(raw)));
        }
        const char key = normalizeKey(raw);
        if (keySet_.find(key) != std::string::npos) {
            throw std::invalid_argument(std::format("Key '{}' appears more than once in the key set", key));
        }
        keySet_.push_back(key);
    }
    bindings_.reserve(keySet_.size());
}

std::optional<char> KeyBindings::assign(size_t groupIndex, std::string_view groupName) {
    if (full()) {
        return std::nullopt;
    }
    const char key = keySet_[bindings_.size()];
    bindings_.push_back(KeyBinding{.key = key, .groupIndex = groupIndex, .groupName = std::string(groupName)});
    return key;
}

std::optional<size_t> KeyBindings::lookup(char key) const {
    const char normalized = normalizeKey(key);
    const auto it = std::find_if(bindings_.begin(), bindings_.end(),
                                 [normalized](const KeyBinding& binding) { return binding.key == normalized; });
    if (it == bindings_.end()) {
        return std::nullopt;
    }
    return it->groupIndex;
}

std::optional<char> KeyBindings::lookupByName(std::string_view groupName) const {
    const auto it = std::find_if(bindings_.begin(), bindings_.end(),
                                 [groupName](const KeyBinding& binding) { return binding.groupName == groupName; });
    if (it == bindings_.end()) {
        return std::nullopt;
    }
    return it->key;
}

bool KeyBindings::isBindable(char key) const {
    return keySet_.find(normalizeKey(key)) != std::string::npos;
}

char KeyBindings::normalizeKey(char key) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(key)));
}

}  // namespace soundkeys::board
