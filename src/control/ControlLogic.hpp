/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef CONTROL_LOGIC_HPP
#define CONTROL_LOGIC_HPP

#include <StateTypes.hpp>
#include <PiController.hpp>
#include <RunLatch.hpp>
#include <PowerStage.hpp>

// Tunables of the control loop (loaded from NVS by ControlTuning).
struct ControlTuningParams {
    // Inner loop: coil power [kW] -> switching frequency [Hz]
    float    powerKp       = (float)DEFAULT_POWER_KP;
    float    powerKi       = (float)DEFAULT_POWER_KI;
    float    powerILimitHz = DEFAULT_POWER_I_LIMIT_HZ;
    float    baseFreqHz    = DEFAULT_BASE_FREQ_HZ;
    float    minFreqHz     = DEFAULT_MIN_FREQ_HZ;
    float    maxFreqHz     = DEFAULT_MAX_FREQ_HZ;
    uint32_t deadtimeNs    = DEFAULT_DEADTIME_NS;

    // Outer loop: object temperature [C] -> power setpoint [kW]
    float    tempKp           = (float)DEFAULT_TEMP_KP;
    float    tempKi           = (float)DEFAULT_TEMP_KI;
    float    tempErrorFloorC  = TEMP_ERROR_FLOOR_C;
    float    targetToleranceC = DEFAULT_TEMP_TOLERANCE_C;

    float    powerLimitKw  = DEFAULT_POWER_LIMIT_KW;
    uint32_t runDebounceMs = DEFAULT_RUN_DEBOUNCE_MS;
    float    dtSec         = CONTROL_PERIOD_MS / 1000.0f;
};

// What happened during one tick, for the caller to log.
struct ControlEvents {
    bool        modeChanged  = false;
    ControlMode previousMode = ControlMode::Idle;
    bool        runToggled   = false;
    bool        runCancelled = false;   // latch forced off by fault or mode
};

/*
 * ControlLogic
 *
 * One control tick: mode state machine, run latch and the cascaded PI pair
 * (temperature -> power -> frequency). Reads are passed in, outputs go to
 * the PowerStage, the returned ControlStatus fully replaces the status record.
 */
class ControlLogic {
public:
    explicit ControlLogic(const ControlTuningParams& params = ControlTuningParams());

    // Drive every output to the safe state (PWM off, enables low, solenoid off).
    void begin(PowerStage& stage);

    ControlStatus tick(const ControlSettings& settings,
                       FaultCode fault,
                       const Measurements& meas,
                       bool runButtonLow,
                       uint32_t nowMs,
                       PowerStage& stage,
                       ControlEvents* events = nullptr);

    const ControlTuningParams& params() const { return _params; }
    const PiController& powerController() const { return _powerPi; }
    const PiController& temperatureController() const { return _tempPi; }
    bool runActive() const  { return _run.active(); }
    bool pwmRunning() const { return _pwmRunning; }

private:
    void configureControllers_();
    void resetControllers_();
    void stopPwm_(PowerStage& stage);

    ControlTuningParams _params;
    PiController        _powerPi;
    PiController        _tempPi;
    RunLatch            _run;
    ControlMode         _lastMode   = ControlMode::Idle;
    bool                _pwmRunning = false;
};

#endif // CONTROL_LOGIC_HPP
