#include <FaultEvaluator.hpp>

namespace {

bool interlockOpen_(const SafetyInputs& in, const Measurements&, const MachineLimits&) {
    return in.interlockOpen;
}

bool gateFault_(const SafetyInputs& in, const Measurements&, const MachineLimits&) {
    return in.gateDriverFault;
}

bool gateNotReady_(const SafetyInputs& in, const Measurements&, const MachineLimits&) {
    return in.gateDriverNotReady;
}

bool coilSensorLost_(const SafetyInputs&, const Measurements& m, const MachineLimits&) {
    return m.coilTempDisconnected;
}

bool coilOverTemp_(const SafetyInputs&, const Measurements& m, const MachineLimits& lim) {
    return m.coilTempC > lim.coilTempLimitC;
}

bool moduleOverTemp_(const SafetyInputs&, const Measurements& m, const MachineLimits& lim) {
    return m.moduleTempC > lim.moduleTempLimitC;
}

bool pcbOverTemp_(const SafetyInputs&, const Measurements& m, const MachineLimits& lim) {
    return m.pcbTempC > lim.pcbTempLimitC;
}

bool overPower_(const SafetyInputs&, const Measurements& m, const MachineLimits& lim) {
    return m.valid && m.coilPowerKw > lim.powerLimitKw * POWER_OVERSHOOT_MARGIN;
}

bool overCurrent_(const SafetyInputs&, const Measurements& m, const MachineLimits& lim) {
    return m.valid && m.coilCurrentRmsA > lim.currentLimitA;
}

const FaultEvaluator::Rule kRules[] = {
    { FaultCode::InterlockOpen,      interlockOpen_  },
    { FaultCode::GateDriverFault,    gateFault_      },
    { FaultCode::GateDriverNotReady, gateNotReady_   },
    { FaultCode::SensorFault,        coilSensorLost_ },
    { FaultCode::CoilOverTemp,       coilOverTemp_   },
    { FaultCode::ModuleOverTemp,     moduleOverTemp_ },
    { FaultCode::PcbOverTemp,        pcbOverTemp_    },
    { FaultCode::PowerLimit,         overPower_      },
    { FaultCode::CurrentLimit,       overCurrent_    },
};

constexpr size_t kRuleCount = sizeof(kRules) / sizeof(kRules[0]);

} // namespace

FaultEvaluator::FaultEvaluator(const MachineLimits& limits)
    : _limits(limits)
{
}

FaultCode FaultEvaluator::evaluate(const SafetyInputs& in, const Measurements& m) const {
    for (size_t k = 0; k < kRuleCount; ++k) {
        if (kRules[k].tripped(in, m, _limits)) {
            return kRules[k].code;
        }
    }
    return FaultCode::None;
}

const FaultEvaluator::Rule* FaultEvaluator::rules() {
    return kRules;
}

size_t FaultEvaluator::ruleCount() {
    return kRuleCount;
}

FaultTransition classifyFaultTransition(FaultCode stored, FaultCode evaluated) {
    if (stored == evaluated)          return FaultTransition::Unchanged;
    if (stored == FaultCode::None)    return FaultTransition::Detected;
    if (evaluated == FaultCode::None) return FaultTransition::Cleared;
    return FaultTransition::Changed;
}

// ============================================================================
// SafetyWatchdog
// ============================================================================

SafetyWatchdog::SafetyWatchdog(uint32_t intervalMs)
    : _intervalMs(intervalMs)
{
}

bool SafetyWatchdog::nearLimits(FaultCode active, const Measurements& m, const MachineLimits& lim) {
    if (active != FaultCode::None) return true;

    if (m.coilTempC   >= lim.coilTempLimitC   - SAFETY_WARN_MARGIN_C) return true;
    if (m.moduleTempC >= lim.moduleTempLimitC - SAFETY_WARN_MARGIN_C) return true;
    if (m.pcbTempC    >= lim.pcbTempLimitC    - SAFETY_WARN_MARGIN_C) return true;
    if (m.valid && m.coilPowerKw >= lim.powerLimitKw * SAFETY_WARN_POWER_RATIO) return true;
    return false;
}

bool SafetyWatchdog::due(uint32_t nowMs, FaultCode active, const Measurements& m, const MachineLimits& lim) {
    if (!nearLimits(active, m, lim)) return false;

    if (_everLogged && (nowMs - _lastLogMs) < _intervalMs) {
        return false;
    }
    _lastLogMs  = nowMs;
    _everLogged = true;
    return true;
}
