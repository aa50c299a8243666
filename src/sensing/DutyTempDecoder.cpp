#include <DutyTempDecoder.hpp>

DutyTempDecoder::DutyTempDecoder(const ModuleSenseParams& params)
    : _params(params)
{
    if (_params.samplesPerUpdate == 0) _params.samplesPerUpdate = 1;
}

bool DutyTempDecoder::addCycle(uint32_t highUs, uint32_t periodUs, float& outTempC) {
    if (periodUs == 0) {
        return false;
    }

    const float duty = clampDuty(static_cast<float>(highUs) / static_cast<float>(periodUs));
    _dutySum += duty;
    _collected++;

    if (_collected < _params.samplesPerUpdate) {
        return false;
    }

    const float avg = clampDuty(_dutySum / static_cast<float>(_collected));
    reset();

    outTempC = decodeDuty(avg);
    return true;
}

void DutyTempDecoder::reset() {
    _dutySum   = 0.0f;
    _collected = 0;
}

float DutyTempDecoder::decodeDuty(float duty) const {
    const float volts = dutyToVoltage(clampDuty(duty));
    const float r = voltageToResistance(volts);
    if (!isfinite(r) || r <= MOD_MIN_RESISTANCE_OHMS) {
        return NAN;
    }

    const float t = NtcModel::betaTempC(r, _params.ntc);
    if (!isfinite(t)) return NAN;
    if (t < MODULE_TEMP_MIN_C) return MODULE_TEMP_MIN_C;
    if (t > MODULE_TEMP_MAX_C) return MODULE_TEMP_MAX_C;
    return t;
}

float DutyTempDecoder::clampDuty(float duty) {
    if (!isfinite(duty)) return MOD_DUTY_MIN;
    if (duty < MOD_DUTY_MIN) return MOD_DUTY_MIN;
    if (duty > MOD_DUTY_MAX) return MOD_DUTY_MAX;
    return duty;
}

float DutyTempDecoder::dutyToVoltage(float duty) {
    // Two-point line through (LOW duty, HIGH volts) and (HIGH duty, LOW volts).
    const float slope = (MOD_V_AT_HIGH_DUTY - MOD_V_AT_LOW_DUTY) / (MOD_DUTY_HIGH - MOD_DUTY_LOW);
    return MOD_V_AT_LOW_DUTY + slope * (duty - MOD_DUTY_LOW);
}

float DutyTempDecoder::voltageToResistance(float volts) const {
    if (!isfinite(volts)) return NAN;
    return volts / MOD_SENSE_CURRENT_A - _params.seriesOhm;
}
