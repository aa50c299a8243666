/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef SENSOR_CONVERSIONS_HPP
#define SENSOR_CONVERSIONS_HPP

#include <stdint.h>
#include <NtcModel.hpp>

// ============================================================================
// Raw transducer value -> physical unit conversions
// ============================================================================
//
// Every function clamps its result to the physical range of the signal.
// Functions that can see a broken sensor return NAN (or flag it) instead of
// inventing a value; callers drop those samples.
// ============================================================================

// Bus voltage / coil current front-end (on-chip ADC, 12 bit, 3.3 V).
struct PowerFrontEndParams {
    float vdcGain        = DEFAULT_VDC_GAIN;          // ADC volts per bus volt
    float currentCenterV = DEFAULT_CURRENT_CENTER_V;  // zero-current output
    float currentAPerV   = DEFAULT_CURRENT_A_PER_V;
};

// Coil NTC on the board ADC (pull-up divider).
struct CoilSenseParams {
    NtcBetaParams ntc{DEFAULT_COIL_NTC_BETA, DEFAULT_COIL_NTC_R0_OHMS, DEFAULT_COIL_NTC_T0_C};
    float seriesOhm = DEFAULT_COIL_NTC_SERIES_OHMS;
};

struct CoilTempReading {
    float tempC        = NAN;
    bool  disconnected = false;   // sense voltage at a rail (open or shorted)
};

namespace SensorConv {

float powerAdcToVolts(uint16_t code);
float busVoltage(float adcVolts, const PowerFrontEndParams& p);
float coilCurrent(float adcVolts, const PowerFrontEndParams& p);

float boardAdcToVolts(uint16_t code);
CoilTempReading coilTemp(float volts, const CoilSenseParams& p);
float pcbTemp(float volts);

// MLX90614 RAM word (0.02 K per LSB).
float irRawToC(uint16_t raw);
float irClamp(float tempC);

} // namespace SensorConv

#endif // SENSOR_CONVERSIONS_HPP
