/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef PI_CONTROLLER_HPP
#define PI_CONTROLLER_HPP

#include <math.h>

/*
 * PiController
 *
 *   error    = max(setpoint - measured, errorFloor)
 *   integral = clamp(integral + error * Ki * dt, iMin, iMax)
 *   output   = clamp(base + Kp * error + integral, outMin, outMax)
 *
 * base is 0 in absolute mode; in incremental mode it is the previous output
 * (the controller walks its output from the value it was reset to).
 */
class PiController {
public:
    PiController();

    void setGains(float kp, float ki);
    void setOutputLimits(float minOut, float maxOut);
    void setIntegralLimits(float minI, float maxI);
    void setErrorFloor(float floor);
    void setIncremental(bool incremental);

    void reset(float integral = 0.0f, float lastOutput = 0.0f);

    float update(float setpoint, float measured, float dtSec);

    float getKp() const;
    float getKi() const;
    float getIntegral() const;
    float getLastOutput() const;
    bool  isIncremental() const;

private:
    float clamp_(float v, float lo, float hi) const;

    float _kp         = 0.0f;
    float _ki         = 0.0f;
    float _integral   = 0.0f;
    float _lastOutput = 0.0f;

    float _outMin     = -INFINITY;
    float _outMax     = INFINITY;
    float _iMin       = -INFINITY;
    float _iMax       = INFINITY;
    float _errorFloor = -INFINITY;

    bool  _incremental = false;
};

#endif // PI_CONTROLLER_HPP
