/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef STATE_TYPES_HPP
#define STATE_TYPES_HPP

#include <stdint.h>
#include <ConfigNVS.hpp>

// ***********************************************
// Operating modes selected by the menu layer
// ***********************************************
enum class ControlMode : uint8_t {
    Idle,
    ManualPower,
    Temperature,
    Cooldown
};

// ***********************************************
// Safety faults (one active at a time)
// ***********************************************
enum class FaultCode : uint8_t {
    None,
    PowerLimit,
    CoilOverTemp,
    ModuleOverTemp,
    PcbOverTemp,
    InterlockOpen,
    GateDriverFault,
    GateDriverNotReady,
    SensorFault,
    CurrentLimit
};

const char* faultMessage(FaultCode code);
const char* modeName(ControlMode mode);

// Heating is only possible in these two modes.
inline bool isHeatingMode(ControlMode mode) {
    return mode == ControlMode::ManualPower || mode == ControlMode::Temperature;
}

// Written by the sensor tasks only.
struct Measurements {
    float dcVoltageV       = 0.0f;
    float coilCurrentRmsA  = 0.0f;
    float coilPowerKw      = 0.0f;
    float coilTempC        = 0.0f;
    float pcbTempC         = 0.0f;
    float moduleTempC      = 0.0f;
    float objectTempC      = 0.0f;
    bool  valid            = false;  // first RMS window completed
    bool  coilTempDisconnected = false;
};

// Written by the menu layer only.
struct ControlSettings {
    ControlMode mode        = ControlMode::ManualPower;
    float       manualPowerKw = DEFAULT_MANUAL_POWER_KW;
    float       targetTempC   = DEFAULT_TARGET_TEMP_C;
};

// Written by the control task only.
struct ControlStatus {
    ControlMode mode           = ControlMode::Idle;
    bool  heatingEnabled       = false;
    bool  runActive            = false;
    bool  targetReached        = false;
    bool  cooldownActive       = false;
    float powerSetpointKw      = 0.0f;
    float switchingFreqHz      = 0.0f;
    FaultCode fault            = FaultCode::None;
};

// Written by the safety task (and cleared by the menu layer).
struct FaultState {
    FaultCode code = FaultCode::None;
};

// ***********************************************
// Machine limits shared by safety and control
// ***********************************************
struct MachineLimits {
    float powerLimitKw      = DEFAULT_POWER_LIMIT_KW;
    float currentLimitA     = DEFAULT_CURRENT_LIMIT_A;
    float coilTempLimitC    = DEFAULT_COIL_TEMP_LIMIT_C;
    float moduleTempLimitC  = DEFAULT_MODULE_TEMP_LIMIT_C;
    float pcbTempLimitC     = DEFAULT_PCB_TEMP_LIMIT_C;
};

// Menu-side setting helpers (all results are clamped).
float clampManualPowerKw(float kw, float powerLimitKw);
float clampTargetTempC(float tempC);
float stepManualPowerKw(float currentKw, int direction, float powerLimitKw);
float stepTargetTempC(float currentC, int direction);

#endif // STATE_TYPES_HPP
