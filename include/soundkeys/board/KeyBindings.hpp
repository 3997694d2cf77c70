#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace soundkeys::board {

/// Digit keys first, then letters: 36 bindable slots.
inline constexpr std::string_view kDefaultKeySet = "1234567890abcdefghijklmnopqrstuvwxyz";

struct KeyBinding {
    char key = 0;
    size_t groupIndex = 0;  ///< Index into GroupCatalog::groups()
    std::string groupName;
};

/// Assigns groups to keys in the order they are created.
///
/// The table only stores group indices; the catalog owns the groups. Both
/// lookups are linear scans, the bound set is at most a few dozen entries.
class KeyBindings {
public:
    /// Throws std::invalid_argument if the key set is empty, contains a
    /// duplicate (case-insensitive) or a non-printable character.
    explicit KeyBindings(std::string_view keySet = kDefaultKeySet);

    /// Binds a group to the next unused key. Returns nullopt once all keys are taken.
    std::optional<char> assign(size_t groupIndex, std::string_view groupName);

    /// Letter keys match regardless of case.
    std::optional<size_t> lookup(char key) const;
    std::optional<char> lookupByName(std::string_view groupName) const;

    bool isBindable(char key) const;
    bool full() const { return bindings_.size() >= keySet_.size(); }
    size_t capacity() const { return keySet_.size(); }
    size_t size() const { return bindings_.size(); }

    const std::string& keySet() const { return keySet_; }
    const std::vector<KeyBinding>& bindings() const { return bindings_; }

    static char normalizeKey(char key);

private:
    std::string keySet_;
    std::vector<KeyBinding> bindings_;
};

}  // namespace soundkeys::board
