#include "soundkeys/board/SoundGroup.hpp"
#include "SoundkeysTestHelpers.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

namespace soundkeys::board {
namespace {

using test_helpers::FakeSoundState;
using test_helpers::makeGroup;

TEST(SoundGroupTest, NewGroupIsIdle) {
    std::vector<std::shared_ptr<FakeSoundState>> states;
    auto group = makeGroup("Birds", 2, states);

    EXPECT_TRUE(group.isIdle());
    EXPECT_EQ(group.lastPlayedIndex(), -1);
    EXPECT_EQ(group.size(), 2u);
    EXPECT_EQ(group.playingCount(), 0u);
}

TEST(SoundGroupTest, SequentialTriggersExhaustThenRestart) {
    std::vector<std::shared_ptr<FakeSoundState>> states;
    auto group = makeGroup("Drums", 3, states);
    const GlobalModes modes;

    EXPECT_EQ(group.triggerNext(modes), TriggerResult::Started);
    EXPECT_EQ(group.lastPlayedIndex(), 0);
    EXPECT_EQ(group.triggerNext(modes), TriggerResult::Started);
    EXPECT_EQ(group.lastPlayedIndex(), 1);
    EXPECT_EQ(group.triggerNext(modes), TriggerResult::Started);
    EXPECT_EQ(group.lastPlayedIndex(), 2);

    const int playsBefore = states[0]->playCalls + states[1]->playCalls + states[2]->playCalls;
    EXPECT_EQ(group.triggerNext(modes), TriggerResult::SequenceComplete);
    EXPECT_EQ(group.lastPlayedIndex(), -1);
    EXPECT_EQ(states[0]->playCalls + states[1]->playCalls + states[2]->playCalls, playsBefore);
    EXPECT_FALSE(states[2]->playing);
    EXPECT_EQ(group.playingCount(), 0u);

    EXPECT_EQ(group.triggerNext(modes), TriggerResult::Started);
    EXPECT_EQ(group.lastPlayedIndex(), 0);
    EXPECT_TRUE(states[0]->playing);
}

TEST(SoundGroupTest, SequentialTriggerStopsPreviousSound) {
    std::vector<std::shared_ptr<FakeSoundState>> states;
    auto group = makeGroup("Voices", 2, states);
    const GlobalModes modes;

    group.triggerNext(modes);
    group.triggerNext(modes);

    EXPECT_FALSE(states[0]->playing);
    EXPECT_TRUE(states[1]->playing);
    EXPECT_EQ(states[0]->stopCalls, 1);
    EXPECT_EQ(group.playingCount(), 1u);
}

TEST(SoundGroupTest, TriggerSeeksSoundToStartBeforePlaying) {
    std::vector<std::shared_ptr<FakeSoundState>> states;
    auto group = makeGroup("Voices", 1, states);
    states[0]->cursor = 1.25;

    group.triggerNext(GlobalModes{});

    EXPECT_EQ(states[0]->seekCalls, 1);
    EXPECT_DOUBLE_EQ(states[0]->cursor, 0.0);
    EXPECT_TRUE(states[0]->playing);
}

TEST(SoundGroupTest, SingleSoundGroupAlternatesBetweenPlayAndIdle) {
    std::vector<std::shared_ptr<FakeSoundState>> states;
    auto group = makeGroup("Gong", 1, states);
    const GlobalModes modes;

    EXPECT_EQ(group.triggerNext(modes), TriggerResult::Started);
    EXPECT_EQ(group.triggerNext(modes), TriggerResult::SequenceComplete);
    EXPECT_FALSE(states[0]->playing);
    EXPECT_EQ(group.triggerNext(modes), TriggerResult::Started);
    EXPECT_TRUE(states[0]->playing);
}

TEST(SoundGroupTest, StackModeOverlaysSounds) {
    std::vector<std::shared_ptr<FakeSoundState>> states;
    auto group = makeGroup("Crowd", 3, states);
    const GlobalModes modes{.stack = true};

    group.triggerNext(modes);
    group.triggerNext(modes);

    EXPECT_TRUE(group.stackEnabled());
    EXPECT_EQ(group.mode(), PlaybackMode::Parallel);
    EXPECT_TRUE(states[0]->playing);
    EXPECT_TRUE(states[1]->playing);
    EXPECT_EQ(states[0]->stopCalls, 0);
    EXPECT_EQ(group.playingCount(), 2u);
}

TEST(SoundGroupTest, StackModeCompletionLeavesEarlierSoundsPlaying) {
    std::vector<std::shared_ptr<FakeSoundState>> states;
    auto group = makeGroup("Crowd", 2, states);
    const GlobalModes modes{.stack = true};

    group.triggerNext(modes);
    group.triggerNext(modes);
    EXPECT_EQ(group.triggerNext(modes), TriggerResult::SequenceComplete);

    EXPECT_TRUE(group.isIdle());
    EXPECT_EQ(group.playingCount(), 2u);
}

TEST(SoundGroupTest, ModesAreSnapshotAtTriggerTime) {
    std::vector<std::shared_ptr<FakeSoundState>> states;
    auto group = makeGroup("Birds", 3, states);
    GlobalModes modes;

    group.triggerNext(modes);
    modes.toggleStack();
    modes.toggleLoop();

    EXPECT_FALSE(group.stackEnabled());
    EXPECT_FALSE(group.loopEnabled());
    EXPECT_EQ(group.mode(), PlaybackMode::Sequential);

    group.triggerNext(modes);
    EXPECT_TRUE(group.stackEnabled());
    EXPECT_TRUE(group.loopEnabled());
    // Stacking was already in effect for this trigger, so sound 0 kept playing.
    EXPECT_TRUE(states[0]->playing);
    EXPECT_TRUE(states[1]->playing);
}

TEST(SoundGroupTest, RandomModeIsSelectableAndPlaysSequentially) {
    std::vector<std::shared_ptr<FakeSoundState>> states;
    auto group = makeGroup("Dice", 3, states);
    const GlobalModes modes{.random = true};

    group.triggerNext(modes);
    EXPECT_EQ(group.mode(), PlaybackMode::Random);
    EXPECT_EQ(group.lastPlayedIndex(), 0);
    group.triggerNext(modes);
    EXPECT_EQ(group.lastPlayedIndex(), 1);
    EXPECT_EQ(playbackModeName(group.mode()), "random");
}

TEST(SoundGroupTest, TriggerAtPlaysRequestedIndex) {
    std::vector<std::shared_ptr<FakeSoundState>> states;
    auto group = makeGroup("Jingles", 4, states);
    const GlobalModes modes;

    EXPECT_EQ(group.triggerAt(2, modes), TriggerResult::Started);
    EXPECT_EQ(group.lastPlayedIndex(), 2);
    EXPECT_TRUE(states[2]->playing);

    EXPECT_EQ(group.triggerAt(0, modes), TriggerResult::Started);
    EXPECT_FALSE(states[2]->playing);
    EXPECT_TRUE(states[0]->playing);

    // Sequential advance continues from the explicitly played index.
    group.triggerNext(modes);
    EXPECT_EQ(group.lastPlayedIndex(), 1);
}

TEST(SoundGroupTest, TriggerAtOutOfRangeChangesNothing) {
    std::vector<std::shared_ptr<FakeSoundState>> states;
    auto group = makeGroup("Jingles", 2, states);
    group.triggerNext(GlobalModes{});

    EXPECT_EQ(group.triggerAt(2, GlobalModes{.loop = true}), TriggerResult::InvalidIndex);
    EXPECT_EQ(group.lastPlayedIndex(), 0);
    EXPECT_FALSE(group.loopEnabled());
    EXPECT_TRUE(states[0]->playing);
}

TEST(SoundGroupTest, TriggerAtInStackModeKeepsCurrentSound) {
    std::vector<std::shared_ptr<FakeSoundState>> states;
    auto group = makeGroup("Jingles", 3, states);
    const GlobalModes modes{.stack = true};

    group.triggerAt(0, modes);
    group.triggerAt(2, modes);

    EXPECT_TRUE(states[0]->playing);
    EXPECT_TRUE(states[2]->playing);
    EXPECT_EQ(group.lastPlayedIndex(), 2);
}

TEST(SoundGroupTest, LoopTickRestartsFinishedSound) {
    std::vector<std::shared_ptr<FakeSoundState>> states;
    auto group = makeGroup("Rain", 2, states);
    group.triggerNext(GlobalModes{.loop = true});
    ASSERT_EQ(states[0]->playCalls, 1);

    states[0]->finish();
    EXPECT_EQ(group.restartFinished(), 1u);
    EXPECT_TRUE(states[0]->playing);
    EXPECT_EQ(states[0]->playCalls, 2);
    EXPECT_DOUBLE_EQ(states[0]->cursor, 0.0);
}

TEST(SoundGroupTest, LoopTickIsIdempotentWhileNotAtEnd) {
    std::vector<std::shared_ptr<FakeSoundState>> states;
    auto group = makeGroup("Rain", 1, states);
    group.triggerNext(GlobalModes{.loop = true});
    states[0]->cursor = 0.5;

    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(group.restartFinished(), 0u);
    }
    EXPECT_EQ(states[0]->playCalls, 1);
    EXPECT_EQ(states[0]->seekCalls, 1);
    EXPECT_DOUBLE_EQ(states[0]->cursor, 0.5);
    EXPECT_EQ(group.lastPlayedIndex(), 0);
}

TEST(SoundGroupTest, LoopTickIgnoresGroupsWithoutLoop) {
    std::vector<std::shared_ptr<FakeSoundState>> states;
    auto group = makeGroup("Rain", 1, states);
    group.triggerNext(GlobalModes{});
    states[0]->finish();

    EXPECT_EQ(group.restartFinished(), 0u);
    EXPECT_FALSE(states[0]->playing);
}

TEST(SoundGroupTest, LoopTickNonStackedInspectsOnlyCurrentSound) {
    std::vector<std::shared_ptr<FakeSoundState>> states;
    auto group = makeGroup("Wind", 3, states);
    const GlobalModes modes{.loop = true};
    group.triggerNext(modes);
    group.triggerNext(modes);

    states[0]->finish();
    EXPECT_EQ(group.restartFinished(), 0u);
    EXPECT_FALSE(states[0]->playing);

    states[1]->finish();
    EXPECT_EQ(group.restartFinished(), 1u);
    EXPECT_TRUE(states[1]->playing);
}

TEST(SoundGroupTest, LoopTickStackedInspectsEveryTriggeredSound) {
    std::vector<std::shared_ptr<FakeSoundState>> states;
    auto group = makeGroup("Wind", 3, states);
    const GlobalModes modes{.loop = true, .stack = true};
    group.triggerNext(modes);
    group.triggerNext(modes);

    states[0]->finish();
    states[1]->finish();
    states[2]->finish();  // never triggered, outside 0..lastPlayedIndex
    EXPECT_EQ(group.restartFinished(), 2u);
    EXPECT_TRUE(states[0]->playing);
    EXPECT_TRUE(states[1]->playing);
    EXPECT_FALSE(states[2]->playing);
}

TEST(SoundGroupTest, StopAllKeepsSequencePosition) {
    std::vector<std::shared_ptr<FakeSoundState>> states;
    auto group = makeGroup("Birds", 3, states);
    const GlobalModes modes;
    group.triggerNext(modes);
    group.triggerNext(modes);

    group.stopAll();
    EXPECT_EQ(group.playingCount(), 0u);
    EXPECT_EQ(group.lastPlayedIndex(), 1);

    group.triggerNext(modes);
    EXPECT_EQ(group.lastPlayedIndex(), 2);
    EXPECT_TRUE(states[2]->playing);
}

TEST(SoundGroupTest, PlaybackFailureStillAdvances) {
    std::vector<std::shared_ptr<FakeSoundState>> states;
    auto group = makeGroup("Broken", 2, states);
    states[0]->failPlay = true;
    const GlobalModes modes;

    EXPECT_EQ(group.triggerNext(modes), TriggerResult::PlaybackFailed);
    EXPECT_EQ(group.lastPlayedIndex(), 0);
    EXPECT_EQ(group.triggerNext(modes), TriggerResult::Started);
    EXPECT_EQ(group.lastPlayedIndex(), 1);
}

TEST(SoundGroupTest, StopFailureDoesNotBlockNextSound) {
    std::vector<std::shared_ptr<FakeSoundState>> states;
    auto group = makeGroup("Broken", 2, states);
    states[0]->failStop = true;
    const GlobalModes modes;

    group.triggerNext(modes);
    EXPECT_EQ(group.triggerNext(modes), TriggerResult::Started);
    EXPECT_TRUE(states[1]->playing);
}

TEST(SoundGroupTest, EmptyGroupRejectsTriggers) {
    SoundGroup group(7, "Empty");
    EXPECT_EQ(group.triggerNext(GlobalModes{}), TriggerResult::InvalidIndex);
    EXPECT_TRUE(group.isIdle());
    EXPECT_EQ(group.restartFinished(), 0u);
}

}  // namespace
}  // namespace soundkeys::board
