/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef NTC_MODEL_HPP
#define NTC_MODEL_HPP

#include <ConfigNVS.hpp>

// Beta model: 1/T = 1/T0 + ln(R/R0)/beta
struct NtcBetaParams {
    float beta  = DEFAULT_COIL_NTC_BETA;
    float r0Ohm = DEFAULT_COIL_NTC_R0_OHMS;
    float t0C   = DEFAULT_COIL_NTC_T0_C;
};

namespace NtcModel {

// Resistance [ohms] -> temperature [C]. NAN for non-physical input.
float betaTempC(float rOhm, const NtcBetaParams& p);

// Inverse of betaTempC(); used for calibration and tests.
float betaResistance(float tempC, const NtcBetaParams& p);

// NTC as the lower leg of a divider fed from vRef through rSeriesOhm:
//   R = rSeries * V / (vRef - V)
// NAN when V is outside (0, vRef).
float dividerResistance(float volts, float vRef, float rSeriesOhm);

// Divider voltage that an NTC of rOhm produces (inverse of dividerResistance).
float dividerVoltage(float rOhm, float vRef, float rSeriesOhm);

} // namespace NtcModel

#endif // NTC_MODEL_HPP
