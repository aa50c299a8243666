/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#include <ControlLogic.hpp>

ControlLogic::ControlLogic(const ControlTuningParams& params)
    : _params(params),
      _run(params.runDebounceMs)
{
    configureControllers_();
    resetControllers_();
}

void ControlLogic::configureControllers_() {
    // Power loop walks the frequency from the base value.
    _powerPi.setGains(_params.powerKp, _params.powerKi);
    _powerPi.setIntegralLimits(-_params.powerILimitHz, _params.powerILimitHz);
    _powerPi.setOutputLimits(_params.minFreqHz, _params.maxFreqHz);
    _powerPi.setIncremental(true);

    _tempPi.setGains(_params.tempKp, _params.tempKi);
    _tempPi.setIntegralLimits(0.0f, _params.powerLimitKw);
    _tempPi.setOutputLimits(0.0f, _params.powerLimitKw);
    _tempPi.setErrorFloor(_params.tempErrorFloorC);
    _tempPi.setIncremental(false);
}

void ControlLogic::resetControllers_() {
    _powerPi.reset(0.0f, _params.baseFreqHz);
    _tempPi.reset(0.0f, 0.0f);
}

void ControlLogic::stopPwm_(PowerStage& stage) {
    stage.disable();
    _pwmRunning = false;
}

void ControlLogic::begin(PowerStage& stage) {
    stage.setEnableLines(false, false);
    stage.setSolenoid(false);
    stopPwm_(stage);
    _run.cancel();
    _lastMode = ControlMode::Idle;
    resetControllers_();
}

ControlStatus ControlLogic::tick(const ControlSettings& settings,
                                 FaultCode fault,
                                 const Measurements& meas,
                                 bool runButtonLow,
                                 uint32_t nowMs,
                                 PowerStage& stage,
                                 ControlEvents* events)
{
    ControlEvents ev;
    const ControlMode mode = settings.mode;

    // ------------------------------------------------------------------
    // Mode change: fresh controllers, latch off, PWM off
    // ------------------------------------------------------------------
    if (mode != _lastMode) {
        ev.modeChanged  = true;
        ev.previousMode = _lastMode;
        resetControllers_();
        _run.cancel();
        stopPwm_(stage);
        _lastMode = mode;
    }

    const bool heatingMode = isHeatingMode(mode);
    ev.runToggled = _run.sample(runButtonLow, nowMs, heatingMode);

    if (fault != FaultCode::None || !heatingMode) {
        ev.runCancelled = _run.cancel();
    }

    float powerSetpointKw = 0.0f;
    float switchingFreqHz = 0.0f;
    bool  heating         = false;
    bool  targetReached   = false;

    switch (mode) {
        case ControlMode::Cooldown:
            stage.setSolenoid(true);
            stopPwm_(stage);
            stage.setEnableLines(false, false);
            break;

        case ControlMode::ManualPower:
        case ControlMode::Temperature: {
            stage.setSolenoid(false);
            heating = _run.active() && fault == FaultCode::None;

            if (mode == ControlMode::ManualPower) {
                powerSetpointKw = clampManualPowerKw(settings.manualPowerKw, _params.powerLimitKw);
            } else {
                targetReached = meas.objectTempC >= settings.targetTempC - _params.targetToleranceC;
                powerSetpointKw = _tempPi.update(settings.targetTempC, meas.objectTempC, _params.dtSec);
            }

            if (heating) {
                const float freq = _powerPi.update(powerSetpointKw, meas.coilPowerKw, _params.dtSec);
                stage.configure(_params.deadtimeNs, (uint32_t)freq);
                stage.enable();
                _pwmRunning = true;
                stage.setEnableLines(true, true);
            } else {
                if (_pwmRunning) {
                    stopPwm_(stage);
                }
                stage.setEnableLines(false, false);
            }
            switchingFreqHz = _powerPi.getLastOutput();
            break;
        }

        case ControlMode::Idle:
        default:
            stage.setSolenoid(false);
            stopPwm_(stage);
            stage.setEnableLines(false, false);
            break;
    }

    ControlStatus st;
    st.mode            = mode;
    st.heatingEnabled  = heating && _pwmRunning;
    st.runActive       = _run.active();
    st.targetReached   = targetReached;
    st.cooldownActive  = (mode == ControlMode::Cooldown);
    st.powerSetpointKw = powerSetpointKw;
    st.switchingFreqHz = switchingFreqHz;
    st.fault           = fault;

    if (events) *events = ev;
    return st;
}
