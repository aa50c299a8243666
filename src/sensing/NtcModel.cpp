#include <NtcModel.hpp>

namespace NtcModel {

float betaTempC(float rOhm, const NtcBetaParams& p) {
    if (!isfinite(rOhm) || rOhm <= 0.0f) return NAN;
    if (!isfinite(p.r0Ohm) || p.r0Ohm <= 0.0f) return NAN;
    if (!isfinite(p.beta) || p.beta <= 0.0f) return NAN;

    const float t0K = p.t0C + 273.15f;
    if (t0K <= 0.0f) return NAN;

    const float lnRatio = logf(rOhm / p.r0Ohm);
    const float invT = (1.0f / t0K) + (lnRatio / p.beta);
    if (invT <= 0.0f) return NAN;
    const float tempK = 1.0f / invT;
    return tempK - 273.15f;
}

float betaResistance(float tempC, const NtcBetaParams& p) {
    const float tK  = tempC + 273.15f;
    const float t0K = p.t0C + 273.15f;
    if (!isfinite(tK) || tK <= 0.0f || t0K <= 0.0f) return NAN;
    if (!isfinite(p.beta) || p.beta <= 0.0f) return NAN;
    return p.r0Ohm * expf(p.beta * (1.0f / tK - 1.0f / t0K));
}

float dividerResistance(float volts, float vRef, float rSeriesOhm) {
    if (!isfinite(volts) || volts <= 0.0f || volts >= vRef) return NAN;
    const float denom = (vRef - volts);
    if (denom <= 0.0f) return NAN;
    return (rSeriesOhm * volts) / denom;
}

float dividerVoltage(float rOhm, float vRef, float rSeriesOhm) {
    if (!isfinite(rOhm) || rOhm < 0.0f) return NAN;
    const float total = rOhm + rSeriesOhm;
    if (total <= 0.0f) return NAN;
    return vRef * rOhm / total;
}

} // namespace NtcModel
