/**
 * @file test_control_logic_gtest.cpp
 * @brief Google Test suite for the control tick (mode handling, run latch, PI cascade)
 */
#include <gtest/gtest.h>
#include <ControlLogic.hpp>
#include "mocks/FakePowerStage.hpp"

class ControlLogicTest : public ::testing::Test {
protected:
    void SetUp() override {
        logic.begin(stage);
        settings = ControlSettings();   // ManualPower, 5 kW, 120 C
        meas = Measurements();
        meas.valid = true;
        nowMs = 1000;
    }

    ControlStatus tick(bool buttonLow = false, FaultCode fault = FaultCode::None) {
        nowMs += CONTROL_PERIOD_MS;
        return logic.tick(settings, fault, meas, buttonLow, nowMs, stage, &events);
    }

    // Press and release the run button across two ticks.
    ControlStatus pressRun(FaultCode fault = FaultCode::None) {
        tick(true, fault);
        nowMs += 200;
        return tick(false, fault);
    }

    FakePowerStage  stage;
    ControlLogic    logic;
    ControlSettings settings;
    Measurements    meas;
    ControlEvents   events;
    uint32_t        nowMs = 0;
};

TEST_F(ControlLogicTest, BeginDrivesOutputsSafe) {
    EXPECT_FALSE(stage.highSide) << "High-side enable must be low after begin";
    EXPECT_FALSE(stage.lowSide) << "Low-side enable must be low after begin";
    EXPECT_FALSE(stage.solenoid) << "Solenoid must be off after begin";
    EXPECT_FALSE(stage.running) << "PWM must be stopped after begin";
    EXPECT_FALSE(logic.runActive());
    EXPECT_EQ(stage.configureCalls, 0) << "PWM timer is not set up until the first heating tick";
}

TEST_F(ControlLogicTest, IdleTicksNeverConfigurePwm) {
    settings.mode = ControlMode::Idle;
    for (int k = 0; k < 5; ++k) tick(k == 0);
    EXPECT_EQ(stage.configureCalls, 0) << "Only heating configures the timer";
    EXPECT_EQ(stage.enableCalls, 0);
    EXPECT_GT(stage.disableCalls, 0) << "Idle keeps asking the stage to stay off";
    EXPECT_FALSE(stage.highSide) << "Enable lines hold the gate driver off";
    EXPECT_FALSE(stage.lowSide);
}

TEST_F(ControlLogicTest, NoHeatingWithoutRunLatch) {
    const ControlStatus st = tick();
    EXPECT_EQ(st.mode, ControlMode::ManualPower);
    EXPECT_FALSE(st.heatingEnabled) << "Heating requires the run latch";
    EXPECT_FLOAT_EQ(st.powerSetpointKw, 5.0f) << "Setpoint is still reported";
    EXPECT_FALSE(stage.running);
    EXPECT_FALSE(stage.highSide);
}

TEST_F(ControlLogicTest, ManualRunAtSetpointHoldsBaseFrequency) {
    meas.coilPowerKw = 5.0f;
    const ControlStatus st = tick(true);

    EXPECT_TRUE(events.runToggled) << "Button edge should toggle the latch";
    EXPECT_TRUE(st.runActive);
    EXPECT_TRUE(st.heatingEnabled) << "Run + no fault + manual mode heats";
    EXPECT_FLOAT_EQ(st.switchingFreqHz, 29700.0f) << "Zero power error keeps the base frequency";
    EXPECT_EQ(stage.lastFreqHz, 29700u);
    EXPECT_EQ(stage.lastDeadtimeNs, (uint32_t)DEFAULT_DEADTIME_NS);
    EXPECT_TRUE(stage.running);
    EXPECT_TRUE(stage.highSide) << "Enable lines go high while heating";
    EXPECT_TRUE(stage.lowSide);
    EXPECT_FALSE(stage.solenoid);
}

TEST_F(ControlLogicTest, PowerErrorRaisesFrequency) {
    meas.coilPowerKw = 2.0f;
    tick(true);
    const float f1 = logic.powerController().getLastOutput();
    tick(false);
    const float f2 = logic.powerController().getLastOutput();
    EXPECT_GT(f1, 29700.0f) << "Power below setpoint moves the frequency up";
    EXPECT_GT(f2, f1) << "Incremental loop keeps walking while the error persists";
    EXPECT_LE(f2, DEFAULT_MAX_FREQ_HZ);
}

TEST_F(ControlLogicTest, ModeChangeResetsEverything) {
    meas.coilPowerKw = 0.0f;
    tick(true);
    for (int k = 0; k < 10; ++k) tick();
    ASSERT_NE(logic.powerController().getIntegral(), 0.0f);
    ASSERT_TRUE(logic.runActive());

    settings.mode = ControlMode::Temperature;
    const ControlStatus st = tick();
    EXPECT_TRUE(events.modeChanged);
    EXPECT_EQ(events.previousMode, ControlMode::ManualPower);
    EXPECT_FLOAT_EQ(logic.powerController().getIntegral(), 0.0f) << "Power integrator reset";
    EXPECT_FLOAT_EQ(logic.powerController().getLastOutput(), 29700.0f) << "Frequency back to base";
    EXPECT_FALSE(st.runActive) << "Mode change cancels the run latch";
    EXPECT_FALSE(st.heatingEnabled);
    EXPECT_FALSE(stage.running) << "PWM stopped on mode change";
}

TEST_F(ControlLogicTest, LeavingTemperatureModeResetsBothIntegrators) {
    settings.mode = ControlMode::Temperature;
    settings.targetTempC = 120.0f;
    meas.objectTempC = 20.0f;
    meas.coilPowerKw = 0.0f;
    tick(true);
    for (int k = 0; k < 20; ++k) tick();
    ASSERT_GT(logic.temperatureController().getIntegral(), 0.0f);
    ASSERT_NE(logic.powerController().getIntegral(), 0.0f);
    ASSERT_TRUE(logic.runActive());
    ASSERT_TRUE(stage.running);

    settings.mode = ControlMode::ManualPower;
    const ControlStatus st = tick();
    EXPECT_TRUE(events.modeChanged);
    EXPECT_EQ(events.previousMode, ControlMode::Temperature);
    EXPECT_FLOAT_EQ(logic.temperatureController().getIntegral(), 0.0f) << "Temperature integrator reset";
    EXPECT_FLOAT_EQ(logic.powerController().getIntegral(), 0.0f) << "Power integrator reset";
    EXPECT_FALSE(st.runActive) << "Run latch cancelled on the transition tick";
    EXPECT_FALSE(st.heatingEnabled) << "No heating on the transition tick";
    EXPECT_FALSE(stage.running);
}

TEST_F(ControlLogicTest, TargetReachedUsesTolerance) {
    settings.mode = ControlMode::Temperature;
    settings.targetTempC = 120.0f;

    meas.objectTempC = 119.0f;
    EXPECT_TRUE(tick().targetReached) << "119 C is within 2 C of 120 C";

    meas.objectTempC = 117.9f;
    EXPECT_FALSE(tick().targetReached) << "117.9 C is outside the tolerance";
}

TEST_F(ControlLogicTest, TemperatureLoopSetpointBounds) {
    settings.mode = ControlMode::Temperature;
    settings.targetTempC = 350.0f;
    meas.objectTempC = 20.0f;
    EXPECT_FLOAT_EQ(tick().powerSetpointKw, DEFAULT_POWER_LIMIT_KW)
        << "Large error saturates at the power limit";

    settings.targetTempC = 120.0f;
    meas.objectTempC = 400.0f;
    ControlStatus st;
    for (int k = 0; k < 5; ++k) st = tick();
    EXPECT_FLOAT_EQ(st.powerSetpointKw, 0.0f) << "Overshoot never asks for negative power";
}

TEST_F(ControlLogicTest, FaultCancelsRunAndStopsPwm) {
    meas.coilPowerKw = 5.0f;
    tick(true);
    ASSERT_TRUE(stage.running);

    const ControlStatus st = tick(false, FaultCode::CoilOverTemp);
    EXPECT_TRUE(events.runCancelled) << "Active fault cancels the run latch";
    EXPECT_FALSE(st.runActive);
    EXPECT_FALSE(st.heatingEnabled);
    EXPECT_EQ(st.fault, FaultCode::CoilOverTemp) << "Status mirrors the fault";
    EXPECT_FALSE(stage.running) << "PWM must stop on fault";
    EXPECT_FALSE(stage.highSide);
    EXPECT_FALSE(stage.lowSide);
}

TEST_F(ControlLogicTest, RunCannotStartDuringFault) {
    const ControlStatus st = tick(true, FaultCode::InterlockOpen);
    EXPECT_FALSE(st.runActive) << "Latch is forced off while a fault is active";
    EXPECT_FALSE(stage.running);
}

TEST_F(ControlLogicTest, CooldownOpensSolenoid) {
    settings.mode = ControlMode::Cooldown;
    const ControlStatus st = tick(true);
    EXPECT_TRUE(st.cooldownActive);
    EXPECT_TRUE(stage.solenoid) << "Cooldown turns the coolant solenoid on";
    EXPECT_FALSE(stage.running);
    EXPECT_FALSE(st.runActive) << "Run button is ignored in cooldown";
    EXPECT_FLOAT_EQ(st.switchingFreqHz, 0.0f);

    settings.mode = ControlMode::Idle;
    tick();
    EXPECT_FALSE(stage.solenoid) << "Leaving cooldown closes the solenoid";
}

TEST_F(ControlLogicTest, SecondPressStopsHeating) {
    meas.coilPowerKw = 5.0f;
    pressRun();
    ASSERT_TRUE(stage.running);

    nowMs += 500;
    const ControlStatus st = tick(true);
    EXPECT_TRUE(events.runToggled);
    EXPECT_FALSE(st.runActive);
    EXPECT_FALSE(st.heatingEnabled);
    EXPECT_FALSE(stage.running) << "Stop press disables PWM";
    EXPECT_FALSE(stage.highSide);
}
