#include <gtest/gtest.h>
#include <unistd.h>
#include "common/errors.h"
#include "shmem/shmem_provider.h"
#include "transport/event_config.h"
#include "transport/state_store.h"

using namespace Flotilla;

class StateStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        configuration_ = "state_test_" + std::to_string(getpid());
    }

    void TearDown() override {
        StateStore(provider_, configuration_, CoreId(0), kSlotSize).Clear();
        StateStore(provider_, configuration_, CoreId(1), kSlotSize).Clear();
    }

    static constexpr size_t kSlotSize = 4096;
    PosixShMemProvider provider_{"state_test"};
    std::string configuration_;
};

TEST_F(StateStoreTest, FirstLaunchHasNoState) {
    StateStore store(provider_, configuration_, CoreId(0), kSlotSize);
    EXPECT_FALSE(store.Load().has_value());
}

TEST_F(StateStoreTest, NextIncarnationSeesSavedState) {
    {
        StateStore store(provider_, configuration_, CoreId(0), kSlotSize);
        store.Save("corpus:17");
    }
    StateStore restarted(provider_, configuration_, CoreId(0), kSlotSize);
    auto state = restarted.Load();
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(*state, "corpus:17");
}

TEST_F(StateStoreTest, SlotsArePerCore) {
    StateStore core0(provider_, configuration_, CoreId(0), kSlotSize);
    StateStore core1(provider_, configuration_, CoreId(1), kSlotSize);
    core0.Save("zero");

    EXPECT_NE(core0.slot_name(), core1.slot_name());
    EXPECT_FALSE(core1.Load().has_value());
}

TEST_F(StateStoreTest, ClearForgetsState) {
    StateStore store(provider_, configuration_, CoreId(0), kSlotSize);
    store.Save("something");
    store.Clear();

    StateStore next(provider_, configuration_, CoreId(0), kSlotSize);
    EXPECT_FALSE(next.Load().has_value());
}

TEST_F(StateStoreTest, OversizedStateIsRejected) {
    StateStore store(provider_, configuration_, CoreId(0), kSlotSize);
    std::string huge(store.capacity() + 1, 'x');
    EXPECT_THROW(store.Save(huge), ResourceError);
    EXPECT_NO_THROW(store.Save(std::string(store.capacity(), 'y')));
}

TEST_F(StateStoreTest, TinySlotIsAConfigError) {
    EXPECT_THROW(StateStore(provider_, configuration_, CoreId(0), 8), ConfigError);
}

TEST(ShouldSaveStateTest, ParseAndPolicies) {
    EXPECT_EQ(ParseShouldSaveState("always"), ShouldSaveState::Always);
    EXPECT_EQ(ParseShouldSaveState("never"), ShouldSaveState::Never);
    EXPECT_THROW(ParseShouldSaveState("Always"), ConfigError);

    EXPECT_TRUE(SavesOnExit(ShouldSaveState::Always));
    EXPECT_FALSE(SavesOnExit(ShouldSaveState::OnRestart));
    EXPECT_TRUE(SavesOnRestart(ShouldSaveState::OnRestart));
    EXPECT_FALSE(SavesOnRestart(ShouldSaveState::Never));
}
