/**
 * @file test_pi_controller_gtest.cpp
 * @brief Google Test suite for the PI controller used by both loops
 */
#include <gtest/gtest.h>
#include <PiController.hpp>

class PiControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        pi.setGains(2.0f, 1.0f);
        pi.setOutputLimits(-100.0f, 100.0f);
        pi.setIntegralLimits(-10.0f, 10.0f);
        pi.reset();
    }

    PiController pi;
};

TEST_F(PiControllerTest, ProportionalPlusIntegral) {
    const float out = pi.update(10.0f, 5.0f, 0.1f);
    // e = 5, I = 5 * 1 * 0.1 = 0.5, P = 10
    EXPECT_NEAR(pi.getIntegral(), 0.5f, 1e-5f) << "Integral should accumulate e*Ki*dt";
    EXPECT_NEAR(out, 10.5f, 1e-5f) << "Output should be Kp*e + I";
    EXPECT_NEAR(pi.getLastOutput(), out, 1e-6f) << "Last output should be remembered";
}

TEST_F(PiControllerTest, IntegralIsBounded) {
    for (int k = 0; k < 1000; ++k) {
        pi.update(100.0f, 0.0f, 0.1f);
    }
    EXPECT_FLOAT_EQ(pi.getIntegral(), 10.0f) << "Integral must stop at its upper bound";

    for (int k = 0; k < 1000; ++k) {
        pi.update(-100.0f, 0.0f, 0.1f);
    }
    EXPECT_FLOAT_EQ(pi.getIntegral(), -10.0f) << "Integral must stop at its lower bound";
}

TEST_F(PiControllerTest, OutputIsClamped) {
    EXPECT_FLOAT_EQ(pi.update(1000.0f, 0.0f, 0.01f), 100.0f) << "Output must respect max";
    EXPECT_FLOAT_EQ(pi.update(-1000.0f, 0.0f, 0.01f), -100.0f) << "Output must respect min";
}

TEST_F(PiControllerTest, ErrorFloorLimitsNegativeError) {
    pi.setErrorFloor(-1.0f);
    const float out = pi.update(0.0f, 50.0f, 0.1f);
    // e floored to -1: P = -2, I = -0.1
    EXPECT_NEAR(out, -2.1f, 1e-5f) << "Large negative error should be floored";
}

TEST_F(PiControllerTest, IncrementalModeWalksFromLastOutput) {
    pi.setGains(10.0f, 0.0f);
    pi.setOutputLimits(26000.0f, 32000.0f);
    pi.setIncremental(true);
    pi.reset(0.0f, 29700.0f);

    EXPECT_FLOAT_EQ(pi.update(5.0f, 5.0f, 0.01f), 29700.0f) << "Zero error keeps the frequency";
    EXPECT_FLOAT_EQ(pi.update(6.0f, 5.0f, 0.01f), 29710.0f) << "Positive error adds Kp*e";
    EXPECT_FLOAT_EQ(pi.update(6.0f, 5.0f, 0.01f), 29720.0f) << "Steps accumulate on the last output";
}

TEST_F(PiControllerTest, ResetClampsIntoLimits) {
    pi.reset(50.0f, 500.0f);
    EXPECT_FLOAT_EQ(pi.getIntegral(), 10.0f) << "Reset integral must be clamped";
    EXPECT_FLOAT_EQ(pi.getLastOutput(), 100.0f) << "Reset output must be clamped";

    pi.reset(NAN, NAN);
    EXPECT_FLOAT_EQ(pi.getIntegral(), 0.0f) << "Non-finite reset values become 0";
    EXPECT_FLOAT_EQ(pi.getLastOutput(), 0.0f);
}

TEST_F(PiControllerTest, BadInputsHoldLastOutput) {
    const float first = pi.update(10.0f, 5.0f, 0.1f);
    EXPECT_FLOAT_EQ(pi.update(NAN, 5.0f, 0.1f), first) << "NaN setpoint must be ignored";
    EXPECT_FLOAT_EQ(pi.update(10.0f, INFINITY, 0.1f), first) << "Inf measurement must be ignored";
    EXPECT_FLOAT_EQ(pi.update(10.0f, 5.0f, 0.0f), first) << "Zero dt must be ignored";
    EXPECT_NEAR(pi.getIntegral(), 0.5f, 1e-5f) << "Ignored updates must not touch the integral";
}

TEST_F(PiControllerTest, SwappedLimitsAreNormalised) {
    pi.setOutputLimits(5.0f, -5.0f);
    EXPECT_FLOAT_EQ(pi.update(1000.0f, 0.0f, 0.1f), 5.0f) << "Swapped limits should be reordered";
}
