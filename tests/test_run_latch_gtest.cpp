/**
 * @file test_run_latch_gtest.cpp
 * @brief Google Test suite for the debounced run/stop push-button latch
 */
#include <gtest/gtest.h>
#include <RunLatch.hpp>

class RunLatchTest : public ::testing::Test {
protected:
    // Press (high->low) then release 10 ms later.
    bool click(uint32_t atMs, bool heating = true) {
        const bool toggled = latch.sample(true, atMs, heating);
        latch.sample(false, atMs + 10, heating);
        return toggled;
    }

    RunLatch latch{80};
};

TEST_F(RunLatchTest, PressTogglesOnEdgeOnly) {
    EXPECT_TRUE(latch.sample(true, 0, true)) << "First press toggles";
    EXPECT_TRUE(latch.active());
    EXPECT_FALSE(latch.sample(true, 200, true)) << "Holding the button does nothing";
    EXPECT_FALSE(latch.sample(false, 300, true)) << "Release does nothing";
    EXPECT_TRUE(latch.active());
}

TEST_F(RunLatchTest, Debounce) {
    EXPECT_TRUE(click(0));
    EXPECT_FALSE(click(50)) << "Second press inside 80 ms is bounce";
    EXPECT_TRUE(latch.active());
    EXPECT_TRUE(click(100)) << "Press 100 ms after the last accepted one toggles";
    EXPECT_FALSE(latch.active());
}

TEST_F(RunLatchTest, IgnoredOutsideHeatingModes) {
    EXPECT_FALSE(click(0, false)) << "Idle/Cooldown presses are ignored";
    EXPECT_FALSE(latch.active());
    EXPECT_TRUE(click(500, true));
}

TEST_F(RunLatchTest, CancelReportsPreviousState) {
    EXPECT_FALSE(latch.cancel()) << "Cancelling an idle latch reports false";
    click(0);
    EXPECT_TRUE(latch.cancel()) << "Cancelling a running latch reports true";
    EXPECT_FALSE(latch.active());
}
