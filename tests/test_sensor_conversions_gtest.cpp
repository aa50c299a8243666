/**
 * @file test_sensor_conversions_gtest.cpp
 * @brief Google Test suite for raw-to-physical conversions and the RMS / duty decoders
 */
#include <gtest/gtest.h>
#include <SensorConversions.hpp>
#include <RmsWindow.hpp>
#include <DutyTempDecoder.hpp>

// ---------------------------------------------------------------------------
// NTC model
// ---------------------------------------------------------------------------

TEST(NtcModelTest, NominalResistanceGivesNominalTemperature) {
    NtcBetaParams p;   // 10k / 25 C / 3950
    EXPECT_NEAR(NtcModel::betaTempC(10000.0f, p), 25.0f, 0.01f) << "R0 must map to T0";
}

TEST(NtcModelTest, HotterMeansLowerResistance) {
    NtcBetaParams p;
    const float r80 = NtcModel::betaResistance(80.0f, p);
    EXPECT_LT(r80, 10000.0f) << "NTC resistance drops with temperature";
    EXPECT_NEAR(NtcModel::betaTempC(r80, p), 80.0f, 0.05f) << "Beta model should invert cleanly";
}

TEST(NtcModelTest, NonPhysicalInputsAreNan) {
    NtcBetaParams p;
    EXPECT_TRUE(isnan(NtcModel::betaTempC(0.0f, p)));
    EXPECT_TRUE(isnan(NtcModel::betaTempC(-5.0f, p)));
    EXPECT_TRUE(isnan(NtcModel::dividerResistance(0.0f, 5.0f, 10000.0f)));
    EXPECT_TRUE(isnan(NtcModel::dividerResistance(5.0f, 5.0f, 10000.0f)));
}

// ---------------------------------------------------------------------------
// Board sensors
// ---------------------------------------------------------------------------

TEST(CoilTempTest, MidRailIsNominal) {
    CoilSenseParams p;
    const CoilTempReading r = SensorConv::coilTemp(2.5f, p);
    EXPECT_FALSE(r.disconnected);
    EXPECT_NEAR(r.tempC, 25.0f, 0.05f) << "Equal divider legs mean R = R0";
}

TEST(CoilTempTest, RailsFlagDisconnect) {
    CoilSenseParams p;
    const CoilTempReading low  = SensorConv::coilTemp(SensorConv::boardAdcToVolts(0), p);
    const CoilTempReading high = SensorConv::coilTemp(SensorConv::boardAdcToVolts(4095), p);
    EXPECT_TRUE(low.disconnected) << "Sense line at ground must flag the sensor";
    EXPECT_TRUE(high.disconnected) << "Sense line at the reference must flag the sensor";
    EXPECT_TRUE(isnan(low.tempC)) << "No temperature is invented for a broken sensor";
}

TEST(PcbTempTest, LinearSensor) {
    EXPECT_NEAR(SensorConv::pcbTemp(0.75f), 25.0f, 1e-4f) << "0.5 V offset, 10 mV per C";
    EXPECT_FLOAT_EQ(SensorConv::pcbTemp(5.0f), PCB_TEMP_MAX_C) << "Result is clamped";
}

TEST(IrTempTest, RawWordScale) {
    // 0.02 K per LSB: 14908 * 0.02 = 298.16 K
    EXPECT_NEAR(SensorConv::irRawToC(14908), 25.01f, 0.01f);
    EXPECT_FLOAT_EQ(SensorConv::irRawToC(0x7FFF), IR_TEMP_MAX_C) << "Out of range is clamped";
}

// ---------------------------------------------------------------------------
// Power front-end
// ---------------------------------------------------------------------------

TEST(PowerFrontEndTest, CurrentCentredOnZero) {
    PowerFrontEndParams p;
    EXPECT_NEAR(SensorConv::coilCurrent(1.25f, p), 0.0f, 1e-3f) << "Center voltage is zero amps";
    EXPECT_NEAR(SensorConv::coilCurrent(1.875f, p), 800.0f, 0.1f) << "+0.625 V is 800 A";
    EXPECT_FLOAT_EQ(SensorConv::coilCurrent(3.3f, p), MAX_COIL_CURRENT_A);
}

TEST(PowerFrontEndTest, BusVoltageClamped) {
    PowerFrontEndParams p;
    EXPECT_GE(SensorConv::busVoltage(3.3f, p), 0.0f);
    EXPECT_LE(SensorConv::busVoltage(3.3f, p), MAX_BUS_VOLTAGE_V);
    EXPECT_FLOAT_EQ(SensorConv::busVoltage(NAN, p), 0.0f) << "Bad sample reads as 0 V";
}

TEST(RmsWindowTest, ConstantSignals) {
    RmsWindow w(16);
    RmsWindow::Result r;
    for (int k = 0; k < 15; ++k) {
        EXPECT_FALSE(w.addPair(100.0f, 10.0f, r)) << "Window not complete at pair " << k;
    }
    ASSERT_TRUE(w.addPair(100.0f, 10.0f, r));
    EXPECT_NEAR(r.vRms, 100.0f, 1e-3f);
    EXPECT_NEAR(r.iRms, 10.0f, 1e-4f);
    EXPECT_NEAR(r.powerKw, 1.0f, 1e-5f) << "100 V * 10 A = 1 kW";
    EXPECT_EQ(r.pairs, 16u);
    EXPECT_EQ(w.pending(), 0u) << "Window restarts after completion";
}

TEST(RmsWindowTest, AntiPhaseIsZeroPower) {
    RmsWindow w(4);
    RmsWindow::Result r;
    const float v[] = { 100.0f, -100.0f, 100.0f, -100.0f };
    const float i[] = { -10.0f,   10.0f, -10.0f,   10.0f };
    ASSERT_EQ(w.addPairs(v, i, 4, r), 1u);
    EXPECT_FLOAT_EQ(r.powerKw, 0.0f) << "Negative real power is reported as 0";
    EXPECT_NEAR(r.iRms, 10.0f, 1e-4f);
}

// ---------------------------------------------------------------------------
// Duty-encoded module temperature
// ---------------------------------------------------------------------------

TEST(DutyTempDecoderTest, MappingIsInverted) {
    EXPECT_NEAR(DutyTempDecoder::dutyToVoltage(MOD_DUTY_LOW), MOD_V_AT_LOW_DUTY, 1e-4f);
    EXPECT_NEAR(DutyTempDecoder::dutyToVoltage(MOD_DUTY_HIGH), MOD_V_AT_HIGH_DUTY, 1e-4f);

    DutyTempDecoder dec;
    EXPECT_GT(dec.decodeDuty(0.8f), dec.decodeDuty(0.2f))
        << "Higher duty means lower voltage, lower resistance, hotter module";
}

TEST(DutyTempDecoderTest, DutyIsClamped) {
    EXPECT_FLOAT_EQ(DutyTempDecoder::clampDuty(0.0f), MOD_DUTY_MIN);
    EXPECT_FLOAT_EQ(DutyTempDecoder::clampDuty(1.0f), MOD_DUTY_MAX);
    EXPECT_FLOAT_EQ(DutyTempDecoder::clampDuty(NAN), MOD_DUTY_MIN);
}

TEST(DutyTempDecoderTest, ReportsOncePerBatch) {
    ModuleSenseParams p;
    p.samplesPerUpdate = 4;
    DutyTempDecoder dec(p);

    float t = -1.0f;
    EXPECT_FALSE(dec.addCycle(500, 1000, t));
    EXPECT_FALSE(dec.addCycle(500, 1000, t));
    EXPECT_FALSE(dec.addCycle(500, 1000, t));
    ASSERT_TRUE(dec.addCycle(500, 1000, t)) << "Fourth cycle completes the batch";
    EXPECT_NEAR(t, dec.decodeDuty(0.5f), 1e-4f) << "Batch result is the mean duty decoded";
    EXPECT_EQ(dec.collected(), 0) << "Decoder restarts after a batch";
}

TEST(DutyTempDecoderTest, ZeroPeriodIsIgnored) {
    ModuleSenseParams p;
    p.samplesPerUpdate = 1;
    DutyTempDecoder dec(p);
    float t = 0.0f;
    EXPECT_FALSE(dec.addCycle(10, 0, t)) << "Degenerate cycle must not count";
    EXPECT_EQ(dec.collected(), 0);
}
