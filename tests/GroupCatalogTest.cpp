#include "soundkeys/board/GroupCatalog.hpp"
#include "SoundkeysTestHelpers.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <format>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace soundkeys::board {
namespace {

using test_helpers::FakeSound;
using test_helpers::FakeSoundState;
using test_helpers::makeSoundState;

/// Opens FakeSounds and remembers their states by filename.
struct FakeOpener {
    std::map<std::string, std::shared_ptr<FakeSoundState>> opened;
    std::set<std::string> failing;

    SoundOpener opener() {
        return [this](const std::filesystem::path& path)
                   -> std::expected<std::unique_ptr<audio::SoundHandle>, std::string> {
            const auto name = path.filename().string();
            if (failing.contains(name)) {
                return std::unexpected(std::format("cannot decode {}", name));
            }
            auto state = makeSoundState(path);
            state->cursor = 0.75;
            opened[name] = state;
            return std::make_unique<FakeSound>(state);
        };
    }
};

std::vector<std::filesystem::path> paths(std::initializer_list<const char*> names) {
    std::vector<std::filesystem::path> result;
    for (const char* name : names) {
        result.emplace_back(std::filesystem::path("sounds") / name);
    }
    return result;
}

TEST(GroupCatalogTest, GroupsFilesByName) {
    const auto files = paths({"001_Birds (1).wav", "001_Birds (2).wav", "002_Drums (1).mp3"});
    FakeOpener fake;
    KeyBindings bindings;
    GroupCatalog catalog;

    const auto report = catalog.build(files, bindings, fake.opener());

    ASSERT_EQ(catalog.size(), 2u);
    EXPECT_EQ(report.admittedFiles, 3u);
    EXPECT_EQ(catalog.soundCount(), 3u);

    const auto& birds = catalog.at(0);
    EXPECT_EQ(birds.name(), "Birds");
    EXPECT_EQ(birds.orderIndex(), 1u);
    EXPECT_EQ(birds.size(), 2u);
    EXPECT_EQ(birds.sound(0).path().filename().string(), "001_Birds (1).wav");
    EXPECT_EQ(birds.sound(1).path().filename().string(), "001_Birds (2).wav");

    const auto& drums = catalog.at(1);
    EXPECT_EQ(drums.name(), "Drums");
    EXPECT_EQ(drums.orderIndex(), 2u);
    EXPECT_EQ(drums.size(), 1u);

    EXPECT_EQ(bindings.lookupByName("Birds"), '1');
    EXPECT_EQ(bindings.lookupByName("Drums"), '2');
    EXPECT_EQ(bindings.lookup('1'), 0u);
    EXPECT_EQ(bindings.lookup('2'), 1u);
}

TEST(GroupCatalogTest, OrderIndexComesFromFirstFile) {
    const auto files = paths({"001_Birds (1).wav", "002_Drums (1).wav", "005_Birds (2).wav"});
    FakeOpener fake;
    KeyBindings bindings;
    GroupCatalog catalog;

    catalog.build(files, bindings, fake.opener());

    const auto* birds = catalog.findByName("Birds");
    ASSERT_NE(birds, nullptr);
    EXPECT_EQ(birds->orderIndex(), 1u);
    EXPECT_EQ(birds->size(), 2u);
    EXPECT_EQ(birds->sound(1).path().filename().string(), "005_Birds (2).wav");
}

TEST(GroupCatalogTest, FilenameIndexDoesNotReorderSounds) {
    const auto files = paths({"001_Birds (2).wav", "001_Birds (1).wav"});
    FakeOpener fake;
    KeyBindings bindings;
    GroupCatalog catalog;

    catalog.build(files, bindings, fake.opener());

    const auto* birds = catalog.findByName("Birds");
    ASSERT_NE(birds, nullptr);
    EXPECT_EQ(birds->sound(0).path().filename().string(), "001_Birds (2).wav");
    EXPECT_EQ(birds->sound(1).path().filename().string(), "001_Birds (1).wav");
}

TEST(GroupCatalogTest, SkipsNonConformingFiles) {
    const auto files = paths({"001_Birds (1).wav", "birdsong.wav", "002_Drums.mp3"});
    FakeOpener fake;
    KeyBindings bindings;
    GroupCatalog catalog;

    const auto report = catalog.build(files, bindings, fake.opener());

    EXPECT_EQ(catalog.size(), 1u);
    EXPECT_EQ(report.skippedFiles, 2u);
    EXPECT_EQ(fake.opened.size(), 1u);
}

TEST(GroupCatalogTest, AdmittedSoundsArePositionedAtStart) {
    const auto files = paths({"001_Birds (1).wav"});
    FakeOpener fake;
    KeyBindings bindings;
    GroupCatalog catalog;

    catalog.build(files, bindings, fake.opener());

    const auto& state = fake.opened.at("001_Birds (1).wav");
    EXPECT_EQ(state->seekCalls, 1);
    EXPECT_TRUE(catalog.at(0).sound(0).isAtStart());
}

TEST(GroupCatalogTest, DropsGroupsBeyondKeyCapacity) {
    std::vector<std::filesystem::path> files;
    for (int i = 1; i <= 37; ++i) {
        files.emplace_back(std::format("{:03}_Group{:02} (1).wav", i, i));
    }
    files.emplace_back("037_Group37 (2).wav");

    FakeOpener fake;
    KeyBindings bindings;
    GroupCatalog catalog;

    const auto report = catalog.build(files, bindings, fake.opener());

    EXPECT_EQ(catalog.size(), 36u);
    EXPECT_EQ(bindings.size(), 36u);
    ASSERT_EQ(report.droppedGroups.size(), 1u);
    EXPECT_EQ(report.droppedGroups.front(), "Group37");
    EXPECT_EQ(report.droppedFiles.size(), 2u);
    EXPECT_EQ(catalog.findByName("Group37"), nullptr);
    EXPECT_FALSE(bindings.lookupByName("Group37").has_value());
    EXPECT_FALSE(fake.opened.contains("037_Group37 (1).wav"));
    EXPECT_FALSE(fake.opened.contains("037_Group37 (2).wav"));
    EXPECT_EQ(bindings.lookupByName("Group36"), 'z');
}

TEST(GroupCatalogTest, ExistingGroupStillGrowsWhenKeysAreExhausted) {
    const auto files = paths({"001_A (1).wav", "002_B (1).wav", "003_C (1).wav", "004_A (2).wav"});
    FakeOpener fake;
    KeyBindings bindings("12");
    GroupCatalog catalog;

    const auto report = catalog.build(files, bindings, fake.opener());

    EXPECT_EQ(catalog.size(), 2u);
    EXPECT_EQ(catalog.findByName("A")->size(), 2u);
    ASSERT_EQ(report.droppedGroups.size(), 1u);
    EXPECT_EQ(report.droppedGroups.front(), "C");
}

TEST(GroupCatalogTest, UnopenableFirstFileDoesNotConsumeKey) {
    const auto files = paths({"001_Birds (1).wav", "001_Birds (2).wav", "002_Drums (1).mp3"});
    FakeOpener fake;
    fake.failing.insert("001_Birds (1).wav");
    KeyBindings bindings;
    GroupCatalog catalog;

    const auto report = catalog.build(files, bindings, fake.opener());

    ASSERT_EQ(report.failedFiles.size(), 1u);
    EXPECT_EQ(report.failedFiles.front().filename().string(), "001_Birds (1).wav");
    ASSERT_EQ(catalog.size(), 2u);
    EXPECT_EQ(catalog.at(0).name(), "Birds");
    EXPECT_EQ(catalog.at(0).size(), 1u);
    EXPECT_EQ(bindings.lookupByName("Birds"), '1');
    EXPECT_EQ(bindings.lookupByName("Drums"), '2');
}

TEST(GroupCatalogTest, EmptyInputYieldsEmptyCatalog) {
    FakeOpener fake;
    KeyBindings bindings;
    GroupCatalog catalog;

    const auto report = catalog.build({}, bindings, fake.opener());

    EXPECT_TRUE(catalog.empty());
    EXPECT_EQ(report.admittedFiles, 0u);
    EXPECT_EQ(bindings.size(), 0u);
}

TEST(GroupCatalogTest, WaitUntilReadyReportsSlowSounds) {
    const auto files = paths({"001_Birds (1).wav", "001_Birds (2).wav"});
    FakeOpener fake;
    KeyBindings bindings;
    GroupCatalog catalog;
    catalog.build(files, bindings, fake.opener());
    fake.opened.at("001_Birds (2).wav")->ready = false;

    const auto report = catalog.waitUntilReady(std::chrono::milliseconds(20), std::chrono::milliseconds(5));

    EXPECT_EQ(report.ready, 1u);
    ASSERT_EQ(report.notReady.size(), 1u);
    EXPECT_EQ(report.notReady.front().filename().string(), "001_Birds (2).wav");
    // The slow sound stays in the catalog.
    EXPECT_EQ(catalog.at(0).size(), 2u);
}

TEST(GroupCatalogTest, StopAllAndClear) {
    const auto files = paths({"001_Birds (1).wav", "002_Drums (1).mp3"});
    FakeOpener fake;
    KeyBindings bindings;
    GroupCatalog catalog;
    catalog.build(files, bindings, fake.opener());

    catalog.at(0).triggerNext(GlobalModes{});
    catalog.at(1).triggerNext(GlobalModes{});
    catalog.stopAll();
    EXPECT_FALSE(fake.opened.at("001_Birds (1).wav")->playing);
    EXPECT_FALSE(fake.opened.at("002_Drums (1).mp3")->playing);

    catalog.clear();
    EXPECT_TRUE(catalog.empty());
    EXPECT_EQ(catalog.findByName("Birds"), nullptr);
    EXPECT_EQ(fake.opened.at("001_Birds (1).wav").use_count(), 1);
}

}  // namespace
}  // namespace soundkeys::board
