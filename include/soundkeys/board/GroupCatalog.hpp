#pragma once

#include "soundkeys/audio/SoundHandle.hpp"
#include "soundkeys/board/KeyBindings.hpp"
#include "soundkeys/board/SoundGroup.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace soundkeys::board {

/// Opens one sound file through the player.
using SoundOpener =
    std::function<std::expected<std::unique_ptr<audio::SoundHandle>, std::string>(const std::filesystem::path&)>;

struct CatalogBuildReport {
    size_t admittedFiles = 0;
    size_t skippedFiles = 0;                     ///< Names not matching the sound file grammar
    std::vector<std::string> droppedGroups;      ///< Groups left without a key
    std::vector<std::filesystem::path> droppedFiles;
    std::vector<std::filesystem::path> failedFiles;  ///< Files the player could not open
};

struct ReadinessReport {
    size_t ready = 0;
    std::vector<std::filesystem::path> notReady;
};

/// Owns every sound group, in creation order, and indexes them by name.
class GroupCatalog {
public:
    GroupCatalog() = default;

    GroupCatalog(const GroupCatalog&) = delete;
    GroupCatalog& operator=(const GroupCatalog&) = delete;

    /// Builds groups from name-sorted file paths and binds each new group to
    /// the next free key. Files of a group that could not get a key are
    /// never opened.
    CatalogBuildReport build(std::span<const std::filesystem::path> files, KeyBindings& bindings,
                             const SoundOpener& openSound);

    std::vector<SoundGroup>& groups() { return groups_; }
    const std::vector<SoundGroup>& groups() const { return groups_; }

    size_t size() const { return groups_.size(); }
    bool empty() const { return groups_.empty(); }
    size_t soundCount() const;

    SoundGroup* findByName(std::string_view name);
    const SoundGroup* findByName(std::string_view name) const;

    SoundGroup& at(size_t index) { return groups_.at(index); }
    const SoundGroup& at(size_t index) const { return groups_.at(index); }

    /// Polls every sound until all are ready or the timeout elapses.
    ReadinessReport waitUntilReady(std::chrono::milliseconds timeout,
                                   std::chrono::milliseconds pollInterval = std::chrono::milliseconds(10)) const;

    void stopAll();

    /// Releases every sound handle. Groups are gone afterwards.
    void clear();

private:
    std::vector<SoundGroup> groups_;
    std::unordered_map<std::string, size_t> byName_;
};

}  // namespace soundkeys::board
