#include "soundkeys/board/GroupCatalog.hpp"

#include "soundkeys/board/SoundLibrary.hpp"
#include "soundkeys/common/Log.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <thread>

namespace soundkeys::board {

CatalogBuildReport GroupCatalog::build(std::span<const std::filesystem::path> files, KeyBindings& bindings,
                                       const SoundOpener& openSound) {
    CatalogBuildReport report;

    auto openAt = [&](const SoundFileInfo& info) -> std::unique_ptr<audio::SoundHandle> {
        auto opened = openSound(info.path);
        if (!opened.has_value()) {
            common::logError(opened.error());
            report.failedFiles.push_back(info.path);
            return nullptr;
        }
        auto sound = std::move(*opened);
        if (auto seeked = sound->seek(0.0); !seeked.has_value()) {
            common::logWarning(seeked.error());
        }
        return sound;
    };

    for (const auto& path : files) {
        const auto info = parseSoundFilePath(path);
        if (!info.has_value()) {
            ++report.skippedFiles;
            continue;
        }

        if (const auto it = byName_.find(info->groupName); it != byName_.end()) {
            if (auto sound = openAt(*info)) {
                groups_[it->second].addSound(std::move(sound));
                ++report.admittedFiles;
            }
            continue;
        }

        if (bindings.full()) {
            if (std::find(report.droppedGroups.begin(), report.droppedGroups.end(), info->groupName) ==
                report.droppedGroups.end()) {
                common::logWarning(std::format("No key left for group '{}' ({} keys in use), dropping it",
                                               info->groupName, bindings.capacity()));
                report.droppedGroups.push_back(info->groupName);
            }
            report.droppedFiles.push_back(info->path);
            continue;
        }

        auto sound = openAt(*info);
        if (!sound) {
            continue;
        }

        const size_t index = groups_.size();
        const auto key = bindings.assign(index, info->groupName);
        if (!key.has_value()) {
            // bindings.full() was checked above
            continue;
        }
        groups_.emplace_back(info->orderIndex, info->groupName);
        groups_.back().addSound(std::move(sound));
        byName_.emplace(info->groupName, index);
        ++report.admittedFiles;
    }

    return report;
}

size_t GroupCatalog::soundCount() const {
    size_t count = 0;
    for (const auto& group : groups_) {
        count += group.size();
    }
    return count;
}

SoundGroup* GroupCatalog::findByName(std::string_view name) {
    const auto it = byName_.find(std::string(name));
    return it != byName_.end() ? &groups_[it->second] : nullptr;
}

const SoundGroup* GroupCatalog::findByName(std::string_view name) const {
    const auto it = byName_.find(std::string(name));
    return it != byName_.end() ? &groups_[it->second] : nullptr;
}

ReadinessReport GroupCatalog::waitUntilReady(std::chrono::milliseconds timeout,
                                             std::chrono::milliseconds pollInterval) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    auto allReady = [this]() {
        for (const auto& group : groups_) {
            for (size_t i = 0; i < group.size(); ++i) {
                if (!group.sound(i).isReady()) {
                    return false;
                }
            }
        }
        return true;
    };

    while (!allReady() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(pollInterval);
    }

    ReadinessReport report;
    for (const auto& group : groups_) {
        for (size_t i = 0; i < group.size(); ++i) {
            const auto& sound = group.sound(i);
            if (sound.isReady()) {
                ++report.ready;
            } else {
                report.notReady.push_back(sound.path());
            }
        }
    }
    return report;
}

void GroupCatalog::stopAll() {
    for (auto& group : groups_) {
        try {
            group.stopAll();
        } catch (const std::exception& e) {
            common::logError(std::format("[{}] Stop failed: {}", group.name(), e.what()));
        }
    }
}

void GroupCatalog::clear() {
    byName_.clear();
    groups_.clear();
}

}  // namespace soundkeys::board
