/**
 * @file test_measurement_fusion_gtest.cpp
 * @brief Google Test suite for merging sensor results into the measurement record
 */
#include <gtest/gtest.h>
#include <MeasurementFusion.hpp>

TEST(SmoothValueTest, FirstSampleIsAdopted) {
    EXPECT_FLOAT_EQ(smoothValue(0.0f, 200.0f, 0.2f), 200.0f) << "No history: take the sample as is";
    EXPECT_FLOAT_EQ(smoothValue(NAN, 200.0f, 0.2f), 200.0f);
}

TEST(SmoothValueTest, ExponentialBlend) {
    EXPECT_FLOAT_EQ(smoothValue(100.0f, 200.0f, 0.2f), 120.0f) << "prev + alpha*(next-prev)";
    EXPECT_FLOAT_EQ(smoothValue(100.0f, NAN, 0.2f), 100.0f) << "Bad sample keeps previous";
}

class FusionTest : public ::testing::Test {
protected:
    Measurements m;
};

TEST_F(FusionTest, PowerWindowOwnsElectricalFields) {
    m.objectTempC = 55.0f;
    RmsWindow::Result r;
    r.vRms = 540.0f;
    r.iRms = 18.0f;
    r.powerKw = 4.2f;

    EXPECT_FALSE(m.valid);
    Fusion::applyPowerWindow(m, r, 0.2f);
    EXPECT_TRUE(m.valid) << "First completed window validates electrical readings";
    EXPECT_FLOAT_EQ(m.dcVoltageV, 540.0f);
    EXPECT_FLOAT_EQ(m.coilCurrentRmsA, 18.0f);
    EXPECT_FLOAT_EQ(m.coilPowerKw, 4.2f);
    EXPECT_FLOAT_EQ(m.objectTempC, 55.0f) << "Power sampler must not touch temperatures";
}

TEST_F(FusionTest, BoardTempsKeepLastGoodCoilValue) {
    CoilTempReading good;
    good.tempC = 40.0f;
    Fusion::applyBoardTemps(m, good, 35.0f, 0.2f);
    EXPECT_FLOAT_EQ(m.coilTempC, 40.0f);
    EXPECT_FLOAT_EQ(m.pcbTempC, 35.0f);
    EXPECT_FALSE(m.coilTempDisconnected);

    CoilTempReading broken;
    broken.disconnected = true;
    Fusion::applyBoardTemps(m, broken, 35.0f, 0.2f);
    EXPECT_TRUE(m.coilTempDisconnected) << "Disconnect flag follows the latest reading";
    EXPECT_FLOAT_EQ(m.coilTempC, 40.0f) << "Broken sensor keeps the last good temperature";

    Fusion::applyBoardTemps(m, good, NAN, 0.2f);
    EXPECT_FALSE(m.coilTempDisconnected) << "Flag clears when the sensor comes back";
    EXPECT_FLOAT_EQ(m.pcbTempC, 35.0f) << "NaN PCB reading is dropped";
}

TEST_F(FusionTest, ObjectAndModuleIgnoreNan) {
    Fusion::applyObjectTemp(m, 80.0f, 0.5f);
    Fusion::applyObjectTemp(m, NAN, 0.5f);
    EXPECT_FLOAT_EQ(m.objectTempC, 80.0f);
    Fusion::applyObjectTemp(m, 100.0f, 0.5f);
    EXPECT_FLOAT_EQ(m.objectTempC, 90.0f);

    Fusion::applyModuleTemp(m, 30.0f, 0.2f);
    Fusion::applyModuleTemp(m, NAN, 0.2f);
    EXPECT_FLOAT_EQ(m.moduleTempC, 30.0f);
    EXPECT_FALSE(m.valid) << "Temperature paths must not validate electrical readings";
}
