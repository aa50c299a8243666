/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#include <PiController.hpp>

PiController::PiController() = default;

void PiController::setGains(float kp, float ki) {
    _kp = isfinite(kp) ? kp : 0.0f;
    _ki = isfinite(ki) ? ki : 0.0f;
}

void PiController::setOutputLimits(float minOut, float maxOut) {
    if (!isfinite(minOut)) minOut = -INFINITY;
    if (!isfinite(maxOut)) maxOut = INFINITY;
    if (minOut > maxOut) {
        float tmp = minOut;
        minOut = maxOut;
        maxOut = tmp;
    }
    _outMin = minOut;
    _outMax = maxOut;
    _lastOutput = clamp_(_lastOutput, _outMin, _outMax);
}

void PiController::setIntegralLimits(float minI, float maxI) {
    if (!isfinite(minI)) minI = -INFINITY;
    if (!isfinite(maxI)) maxI = INFINITY;
    if (minI > maxI) {
        float tmp = minI;
        minI = maxI;
        maxI = tmp;
    }
    _iMin = minI;
    _iMax = maxI;
    _integral = clamp_(_integral, _iMin, _iMax);
}

void PiController::setErrorFloor(float floor) {
    _errorFloor = isfinite(floor) ? floor : -INFINITY;
}

void PiController::setIncremental(bool incremental) {
    _incremental = incremental;
}

void PiController::reset(float integral, float lastOutput) {
    if (!isfinite(integral))   integral = 0.0f;
    if (!isfinite(lastOutput)) lastOutput = 0.0f;
    _integral   = clamp_(integral, _iMin, _iMax);
    _lastOutput = clamp_(lastOutput, _outMin, _outMax);
}

float PiController::update(float setpoint, float measured, float dtSec) {
    if (!isfinite(setpoint) || !isfinite(measured)) {
        return _lastOutput;
    }
    if (!isfinite(dtSec) || dtSec <= 0.0f) {
        return _lastOutput;
    }

    float error = setpoint - measured;
    if (error < _errorFloor) error = _errorFloor;

    _integral = clamp_(_integral + error * _ki * dtSec, _iMin, _iMax);

    const float base = _incremental ? _lastOutput : 0.0f;
    _lastOutput = clamp_(base + _kp * error + _integral, _outMin, _outMax);
    return _lastOutput;
}

float PiController::getKp() const {
    return _kp;
}

float PiController::getKi() const {
    return _ki;
}

float PiController::getIntegral() const {
    return _integral;
}

float PiController::getLastOutput() const {
    return _lastOutput;
}

bool PiController::isIncremental() const {
    return _incremental;
}

float PiController::clamp_(float v, float lo, float hi) const {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}
