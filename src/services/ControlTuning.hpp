/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef CONTROL_TUNING_HPP
#define CONTROL_TUNING_HPP

#include <Arduino.h>
#include <NVSManager.hpp>
#include <TuningValidation.hpp>

class ControlTuning {
public:
    static void Init();
    static ControlTuning* Get();

    void begin();

    const MachineLimits&       limits() const  { return _limits; }
    const ControlTuningParams& control() const { return _control; }
    const SensingTuning&       sensing() const { return _sensing; }

private:
    ControlTuning() = default;
    void loadFromNvs();

    static ControlTuning* s_instance;

    MachineLimits       _limits;
    ControlTuningParams _control;
    SensingTuning       _sensing;
};

#define TUNING ControlTuning::Get()

#endif // CONTROL_TUNING_HPP
