#include <TuningValidation.hpp>

namespace {

// v must be finite and inside [lo, hi].
bool fixRange_(float& v, float lo, float hi, float def) {
    if (isfinite(v) && v >= lo && v <= hi) return false;
    v = def;
    return true;
}

bool fixRangeU_(uint32_t& v, uint32_t lo, uint32_t hi, uint32_t def) {
    if (v >= lo && v <= hi) return false;
    v = def;
    return true;
}

} // namespace

namespace Tuning {

uint8_t sanitizeLimits(MachineLimits& lim) {
    uint8_t n = 0;
    n += fixRange_(lim.powerLimitKw,     0.5f,  MAX_COIL_POWER_KW,  DEFAULT_POWER_LIMIT_KW);
    n += fixRange_(lim.currentLimitA,    1.0f,  MAX_COIL_CURRENT_A, DEFAULT_CURRENT_LIMIT_A);
    n += fixRange_(lim.coilTempLimitC,   20.0f, COIL_TEMP_MAX_C,    DEFAULT_COIL_TEMP_LIMIT_C);
    n += fixRange_(lim.moduleTempLimitC, 20.0f, MODULE_TEMP_MAX_C,  DEFAULT_MODULE_TEMP_LIMIT_C);
    n += fixRange_(lim.pcbTempLimitC,    20.0f, PCB_TEMP_MAX_C,     DEFAULT_PCB_TEMP_LIMIT_C);
    return n;
}

uint8_t sanitizeControl(ControlTuningParams& p) {
    uint8_t n = 0;
    n += fixRange_(p.powerKp,       0.0f, 10000.0f, (float)DEFAULT_POWER_KP);
    n += fixRange_(p.powerKi,       0.0f, 10000.0f, (float)DEFAULT_POWER_KI);
    n += fixRange_(p.powerILimitHz, 0.0f, 20000.0f, DEFAULT_POWER_I_LIMIT_HZ);
    n += fixRange_(p.minFreqHz,     1000.0f, 200000.0f, DEFAULT_MIN_FREQ_HZ);
    n += fixRange_(p.maxFreqHz,     1000.0f, 200000.0f, DEFAULT_MAX_FREQ_HZ);

    // An inverted window is unusable as a whole.
    if (p.minFreqHz >= p.maxFreqHz) {
        p.minFreqHz = DEFAULT_MIN_FREQ_HZ;
        p.maxFreqHz = DEFAULT_MAX_FREQ_HZ;
        n += 2;
    }
    if (!isfinite(p.baseFreqHz) || p.baseFreqHz < p.minFreqHz || p.baseFreqHz > p.maxFreqHz) {
        p.baseFreqHz = DEFAULT_BASE_FREQ_HZ;
        if (p.baseFreqHz < p.minFreqHz || p.baseFreqHz > p.maxFreqHz) {
            p.baseFreqHz = 0.5f * (p.minFreqHz + p.maxFreqHz);
        }
        n++;
    }
    n += fixRangeU_(p.deadtimeNs, 50, 5000, DEFAULT_DEADTIME_NS);

    n += fixRange_(p.tempKp,           0.0f, 100.0f, (float)DEFAULT_TEMP_KP);
    n += fixRange_(p.tempKi,           0.0f, 100.0f, (float)DEFAULT_TEMP_KI);
    n += fixRange_(p.tempErrorFloorC,  -1000.0f, 0.0f, TEMP_ERROR_FLOOR_C);
    n += fixRange_(p.targetToleranceC, 0.0f, 50.0f, DEFAULT_TEMP_TOLERANCE_C);

    n += fixRange_(p.powerLimitKw, 0.5f, MAX_COIL_POWER_KW, DEFAULT_POWER_LIMIT_KW);
    n += fixRangeU_(p.runDebounceMs, 10, 2000, DEFAULT_RUN_DEBOUNCE_MS);
    return n;
}

uint8_t sanitizeSensing(SensingTuning& s) {
    uint8_t n = 0;
    n += fixRange_(s.smoothAlpha, 0.01f, 1.0f, DEFAULT_SMOOTH_ALPHA);
    n += fixRangeU_(s.rmsWindowPairs, 16, 65536, DEFAULT_RMS_WINDOW_PAIRS);

    n += fixRange_(s.power.vdcGain,        1e-6f, 1.0f,    DEFAULT_VDC_GAIN);
    n += fixRange_(s.power.currentCenterV, 0.0f,  PWR_ADC_REF_V, DEFAULT_CURRENT_CENTER_V);
    n += fixRange_(s.power.currentAPerV,   1.0f,  100000.0f, DEFAULT_CURRENT_A_PER_V);

    n += fixRange_(s.coil.ntc.beta,  500.0f, 10000.0f, DEFAULT_COIL_NTC_BETA);
    n += fixRange_(s.coil.ntc.r0Ohm, 10.0f,  1e7f,     DEFAULT_COIL_NTC_R0_OHMS);
    n += fixRange_(s.coil.seriesOhm, 10.0f,  1e7f,     DEFAULT_COIL_NTC_SERIES_OHMS);

    n += fixRange_(s.module.ntc.beta,  500.0f, 10000.0f, DEFAULT_MOD_NTC_BETA);
    n += fixRange_(s.module.ntc.r0Ohm, 10.0f,  1e7f,     DEFAULT_MOD_NTC_R0_OHMS);
    n += fixRange_(s.module.seriesOhm, 0.0f,   1e5f,     DEFAULT_MOD_SERIES_OHMS);
    if (s.module.samplesPerUpdate == 0 || s.module.samplesPerUpdate > 4096) {
        s.module.samplesPerUpdate = DEFAULT_MOD_DUTY_SAMPLES;
        n++;
    }
    return n;
}

} // namespace Tuning
