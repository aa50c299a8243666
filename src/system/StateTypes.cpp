#include <StateTypes.hpp>

const char* faultMessage(FaultCode code) {
    switch (code) {
        case FaultCode::None:               return "OK";
        case FaultCode::PowerLimit:         return "Power limit exceeded";
        case FaultCode::CoilOverTemp:       return "Coil over-temp";
        case FaultCode::ModuleOverTemp:     return "SiC module over-temp";
        case FaultCode::PcbOverTemp:        return "PCB over-temp";
        case FaultCode::InterlockOpen:      return "Interlock open";
        case FaultCode::GateDriverFault:    return "Gate driver fault";
        case FaultCode::GateDriverNotReady: return "Gate driver not ready";
        case FaultCode::SensorFault:        return "Sensor fault";
        case FaultCode::CurrentLimit:       return "Current limit exceeded";
    }
    return "Unknown";
}

const char* modeName(ControlMode mode) {
    switch (mode) {
        case ControlMode::Idle:        return "Idle";
        case ControlMode::ManualPower: return "Manual";
        case ControlMode::Temperature: return "Temp";
        case ControlMode::Cooldown:    return "Cooldown";
    }
    return "Unknown";
}

static float clampf_(float v, float lo, float hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

float clampManualPowerKw(float kw, float powerLimitKw) {
    if (!isfinite(kw)) return 0.0f;
    return clampf_(kw, 0.0f, powerLimitKw);
}

float clampTargetTempC(float tempC) {
    if (!isfinite(tempC)) return DEFAULT_TARGET_TEMP_C;
    return clampf_(tempC, TARGET_TEMP_MIN_C, TARGET_TEMP_MAX_C);
}

float stepManualPowerKw(float currentKw, int direction, float powerLimitKw) {
    const float step = (direction > 0) ? MANUAL_STEP_KW
                     : (direction < 0) ? -MANUAL_STEP_KW : 0.0f;
    return clampManualPowerKw(currentKw + step, powerLimitKw);
}

float stepTargetTempC(float currentC, int direction) {
    const float step = (direction > 0) ? TARGET_STEP_C
                     : (direction < 0) ? -TARGET_STEP_C : 0.0f;
    return clampTargetTempC(currentC + step);
}
