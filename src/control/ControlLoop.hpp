/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef CONTROL_LOOP_HPP
#define CONTROL_LOOP_HPP

#include <Utils.hpp>
#include <ControlLogic.hpp>

// ============================================================================
// Control task (10 ms): snapshot inputs, run ControlLogic, publish status.
// ============================================================================
class ControlLoop {
public:
    ControlLoop(PowerStage& stage, const ControlTuningParams& params);

    bool begin();

private:
    static void _taskThunk(void* arg);
    void _taskLoop();
    void _tickOnce(uint32_t nowMs);
    void _logEvents(const ControlEvents& ev, const ControlStatus& st, FaultCode fault);

    PowerStage&  _stage;
    ControlLogic _logic;
    TaskHandle_t _taskHandle = nullptr;
};

#endif // CONTROL_LOOP_HPP
