#include <SensorConversions.hpp>

namespace {

inline float clampf_(float v, float lo, float hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

} // namespace

namespace SensorConv {

float powerAdcToVolts(uint16_t code) {
    float c = static_cast<float>(code);
    if (c > PWR_ADC_MAX) c = PWR_ADC_MAX;
    return c * (PWR_ADC_REF_V / PWR_ADC_MAX);
}

float busVoltage(float adcVolts, const PowerFrontEndParams& p) {
    if (!isfinite(adcVolts) || !isfinite(p.vdcGain) || p.vdcGain <= 0.0f) return 0.0f;
    return clampf_(adcVolts / p.vdcGain, 0.0f, MAX_BUS_VOLTAGE_V);
}

float coilCurrent(float adcVolts, const PowerFrontEndParams& p) {
    if (!isfinite(adcVolts)) return 0.0f;
    const float amps = (adcVolts - p.currentCenterV) * p.currentAPerV;
    return clampf_(amps, -MAX_COIL_CURRENT_A, MAX_COIL_CURRENT_A);
}

float boardAdcToVolts(uint16_t code) {
    float c = static_cast<float>(code);
    if (c > BOARD_ADC_MAX) c = BOARD_ADC_MAX;
    return (c / BOARD_ADC_MAX) * BOARD_ADC_REF_V;
}

CoilTempReading coilTemp(float volts, const CoilSenseParams& p) {
    CoilTempReading out;
    if (!isfinite(volts) ||
        volts <= COIL_NTC_RAIL_MARGIN_V ||
        volts >= BOARD_ADC_REF_V - COIL_NTC_RAIL_MARGIN_V) {
        out.disconnected = true;
        return out;
    }

    const float r = NtcModel::dividerResistance(volts, BOARD_ADC_REF_V, p.seriesOhm);
    const float t = NtcModel::betaTempC(r, p.ntc);
    if (!isfinite(t)) {
        out.disconnected = true;
        return out;
    }
    out.tempC = clampf_(t, COIL_TEMP_MIN_C, COIL_TEMP_MAX_C);
    return out;
}

float pcbTemp(float volts) {
    if (!isfinite(volts)) return NAN;
    return clampf_((volts - PCB_SENSOR_OFFSET_V) / PCB_SENSOR_V_PER_C,
                   PCB_TEMP_MIN_C, PCB_TEMP_MAX_C);
}

float irRawToC(uint16_t raw) {
    return irClamp(static_cast<float>(raw) * IR_RAW_SCALE_K - 273.15f);
}

float irClamp(float tempC) {
    if (!isfinite(tempC)) return NAN;
    return clampf_(tempC, IR_TEMP_MIN_C, IR_TEMP_MAX_C);
}

} // namespace SensorConv
