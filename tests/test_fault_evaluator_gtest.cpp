/**
 * @file test_fault_evaluator_gtest.cpp
 * @brief Google Test suite for the safety fault table and watchdog log gate
 */
#include <gtest/gtest.h>
#include <FaultEvaluator.hpp>
#include "mocks/StdMutexLock.hpp"

class FaultEvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        meas = Measurements();
        meas.coilTempC   = 30.0f;
        meas.moduleTempC = 25.0f;
        meas.pcbTempC    = 30.0f;
        meas.valid       = true;
        in = SafetyInputs();
    }

    FaultEvaluator eval;     // default limits: 10 kW, 150 A, 80/35/85 C
    Measurements   meas;
    SafetyInputs   in;
};

TEST_F(FaultEvaluatorTest, HealthyMachineHasNoFault) {
    EXPECT_EQ(eval.evaluate(in, meas), FaultCode::None) << "Nominal readings should not trip";
}

TEST_F(FaultEvaluatorTest, InterlockBeatsOverTemperature) {
    in.interlockOpen = true;
    meas.coilTempC   = 95.0f;
    EXPECT_EQ(eval.evaluate(in, meas), FaultCode::InterlockOpen)
        << "Interlock must win over a simultaneous coil over-temp";
}

TEST_F(FaultEvaluatorTest, PriorityOrderIsFixed) {
    const FaultEvaluator::Rule* rules = FaultEvaluator::rules();
    ASSERT_EQ(FaultEvaluator::ruleCount(), 9u);
    const FaultCode expected[] = {
        FaultCode::InterlockOpen,   FaultCode::GateDriverFault, FaultCode::GateDriverNotReady,
        FaultCode::SensorFault,     FaultCode::CoilOverTemp,    FaultCode::ModuleOverTemp,
        FaultCode::PcbOverTemp,     FaultCode::PowerLimit,      FaultCode::CurrentLimit,
    };
    for (size_t k = 0; k < 9; ++k) {
        EXPECT_EQ(rules[k].code, expected[k]) << "Rule " << k << " out of order";
    }
}

TEST_F(FaultEvaluatorTest, GateDriverInputs) {
    in.gateDriverNotReady = true;
    EXPECT_EQ(eval.evaluate(in, meas), FaultCode::GateDriverNotReady);
    in.gateDriverFault = true;
    EXPECT_EQ(eval.evaluate(in, meas), FaultCode::GateDriverFault)
        << "Driver fault outranks driver not ready";
}

TEST_F(FaultEvaluatorTest, DisconnectedCoilSensorIsSensorFault) {
    meas.coilTempDisconnected = true;
    meas.moduleTempC = 40.0f;
    EXPECT_EQ(eval.evaluate(in, meas), FaultCode::SensorFault)
        << "Lost coil NTC outranks temperature faults";
}

TEST_F(FaultEvaluatorTest, TemperatureLimitsAreStrict) {
    meas.coilTempC = 80.0f;
    EXPECT_EQ(eval.evaluate(in, meas), FaultCode::None) << "Exactly at the limit is not a fault";
    meas.coilTempC = 80.1f;
    EXPECT_EQ(eval.evaluate(in, meas), FaultCode::CoilOverTemp);

    meas.coilTempC   = 30.0f;
    meas.moduleTempC = 36.0f;
    EXPECT_EQ(eval.evaluate(in, meas), FaultCode::ModuleOverTemp);

    meas.moduleTempC = 25.0f;
    meas.pcbTempC    = 90.0f;
    EXPECT_EQ(eval.evaluate(in, meas), FaultCode::PcbOverTemp);
}

TEST_F(FaultEvaluatorTest, PowerLimitHasMargin) {
    meas.coilPowerKw = 10.4f;
    EXPECT_EQ(eval.evaluate(in, meas), FaultCode::None) << "Inside the 5% margin must not trip";
    meas.coilPowerKw = 10.6f;
    EXPECT_EQ(eval.evaluate(in, meas), FaultCode::PowerLimit) << "Beyond limit*1.05 must trip";
}

TEST_F(FaultEvaluatorTest, CurrentLimit) {
    meas.coilCurrentRmsA = 151.0f;
    EXPECT_EQ(eval.evaluate(in, meas), FaultCode::CurrentLimit);
}

TEST_F(FaultEvaluatorTest, ElectricalChecksNeedValidWindow) {
    meas.valid           = false;
    meas.coilPowerKw     = 50.0f;
    meas.coilCurrentRmsA = 500.0f;
    EXPECT_EQ(eval.evaluate(in, meas), FaultCode::None)
        << "Power/current are ignored until the first RMS window completes";
}

TEST_F(FaultEvaluatorTest, CustomLimitsApply) {
    MachineLimits lim;
    lim.moduleTempLimitC = 60.0f;
    eval.setLimits(lim);
    meas.moduleTempC = 50.0f;
    EXPECT_EQ(eval.evaluate(in, meas), FaultCode::None) << "Raised module limit should be honoured";
}

TEST(FaultTransitionTest, Classification) {
    EXPECT_EQ(classifyFaultTransition(FaultCode::None, FaultCode::None), FaultTransition::Unchanged);
    EXPECT_EQ(classifyFaultTransition(FaultCode::None, FaultCode::PcbOverTemp), FaultTransition::Detected);
    EXPECT_EQ(classifyFaultTransition(FaultCode::PcbOverTemp, FaultCode::None), FaultTransition::Cleared);
    EXPECT_EQ(classifyFaultTransition(FaultCode::PcbOverTemp, FaultCode::InterlockOpen),
              FaultTransition::Changed);
    EXPECT_EQ(classifyFaultTransition(FaultCode::InterlockOpen, FaultCode::InterlockOpen),
              FaultTransition::Unchanged);
}

class SafetyWatchdogTest : public ::testing::Test {
protected:
    MachineLimits  lim;
    Measurements   meas;
    SafetyWatchdog dog{2000};
};

TEST_F(SafetyWatchdogTest, QuietWhenFarFromLimits) {
    meas.coilTempC = 40.0f;
    EXPECT_FALSE(SafetyWatchdog::nearLimits(FaultCode::None, meas, lim));
    EXPECT_FALSE(dog.due(0, FaultCode::None, meas, lim)) << "Nothing to report far from limits";
}

TEST_F(SafetyWatchdogTest, NearLimitBands) {
    meas.coilTempC = 75.0f;
    EXPECT_TRUE(SafetyWatchdog::nearLimits(FaultCode::None, meas, lim)) << "Within 5 C of coil limit";

    meas = Measurements();
    meas.valid       = true;
    meas.coilPowerKw = 9.0f;
    EXPECT_TRUE(SafetyWatchdog::nearLimits(FaultCode::None, meas, lim)) << "At 90% of power limit";

    meas.valid = false;
    EXPECT_FALSE(SafetyWatchdog::nearLimits(FaultCode::None, meas, lim)) << "Invalid power is ignored";

    EXPECT_TRUE(SafetyWatchdog::nearLimits(FaultCode::SensorFault, Measurements(), lim))
        << "An active fault always counts";
}

TEST_F(SafetyWatchdogTest, RateLimited) {
    meas.pcbTempC = 84.0f;
    EXPECT_TRUE(dog.due(100, FaultCode::None, meas, lim)) << "First near-limit poll logs";
    EXPECT_FALSE(dog.due(125, FaultCode::None, meas, lim)) << "Next poll is inside the interval";
    EXPECT_FALSE(dog.due(2099, FaultCode::None, meas, lim));
    EXPECT_TRUE(dog.due(2100, FaultCode::None, meas, lim)) << "Logs again after the interval";
}

class FaultPollTest : public ::testing::Test {
protected:
    void SetUp() override {
        Measurements m;
        m.coilTempC   = 30.0f;
        m.moduleTempC = 25.0f;
        m.pcbTempC    = 30.0f;
        store.measurements.replace(m);
    }

    void setCoilTemp(float c) {
        store.measurements.update([c](Measurements& m) { m.coilTempC = c; });
    }

    FaultEvaluator           eval;
    StateStore<StdMutexLock> store;
    SafetyInputs             in;
};

TEST_F(FaultPollTest, DetectsAndStores) {
    setCoilTemp(90.0f);
    const FaultPollResult r = eval.poll(in, store);
    EXPECT_EQ(r.transition, FaultTransition::Detected);
    EXPECT_TRUE(r.written);
    EXPECT_EQ(store.currentFault(), FaultCode::CoilOverTemp) << "New fault must reach the record";
}

TEST_F(FaultPollTest, UnchangedCodeIsNotRewritten) {
    setCoilTemp(90.0f);
    eval.poll(in, store);
    const FaultPollResult r = eval.poll(in, store);
    EXPECT_EQ(r.transition, FaultTransition::Unchanged);
    EXPECT_FALSE(r.written) << "Same code on the next poll must not rewrite the record";
    EXPECT_EQ(store.currentFault(), FaultCode::CoilOverTemp);
}

TEST_F(FaultPollTest, ClearsItselfWhenConditionResolves) {
    setCoilTemp(90.0f);
    eval.poll(in, store);

    setCoilTemp(60.0f);
    const FaultPollResult r = eval.poll(in, store);
    EXPECT_EQ(r.transition, FaultTransition::Cleared);
    EXPECT_EQ(r.stored, FaultCode::CoilOverTemp);
    EXPECT_EQ(store.currentFault(), FaultCode::None) << "Resolved condition clears without operator action";
}

TEST_F(FaultPollTest, ClearedFaultReassertsWhileCausePersists) {
    in.interlockOpen = true;
    eval.poll(in, store);
    store.clearFault();
    ASSERT_EQ(store.currentFault(), FaultCode::None);

    const FaultPollResult r = eval.poll(in, store);
    EXPECT_EQ(r.transition, FaultTransition::Detected);
    EXPECT_EQ(store.currentFault(), FaultCode::InterlockOpen)
        << "Acknowledged fault comes back on the next poll if still present";
}

TEST_F(FaultPollTest, ChangedFaultIsReplaced) {
    setCoilTemp(90.0f);
    eval.poll(in, store);
    in.interlockOpen = true;
    const FaultPollResult r = eval.poll(in, store);
    EXPECT_EQ(r.transition, FaultTransition::Changed);
    EXPECT_EQ(store.currentFault(), FaultCode::InterlockOpen) << "Higher priority fault takes over";
}

TEST(FaultPollLockTest, UnchangedPollOnlyReads) {
    StateStore<CountingLock> store;
    FaultEvaluator eval;
    SafetyInputs in;

    CountingLock::acquisitions = 0;
    eval.poll(in, store);
    EXPECT_EQ(CountingLock::acquisitions, 2)
        << "Healthy poll takes the measurement and fault locks once each, no write";

    in.gateDriverFault = true;
    CountingLock::acquisitions = 0;
    eval.poll(in, store);
    EXPECT_EQ(CountingLock::acquisitions, 3) << "A changed code adds exactly one write";
}
