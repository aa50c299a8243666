/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef SAFETY_MONITOR_HPP
#define SAFETY_MONITOR_HPP

#include <Utils.hpp>
#include <FaultEvaluator.hpp>

// ============================================================================
// Safety monitor task (25 ms)
// ============================================================================
//
// Reads the active-low interlock / gate-driver inputs and the measurements,
// evaluates the fault table and rewrites the fault record only when the
// evaluated code differs from the stored one.
// ============================================================================
class SafetyMonitor {
public:
    static void Init();
    static SafetyMonitor* Get();

    bool begin(const MachineLimits& limits);

private:
    SafetyMonitor() = default;

    static void _taskThunk(void* arg);
    void _taskLoop();
    void _pollOnce(uint32_t nowMs);
    SafetyInputs _readInputs() const;

    static SafetyMonitor* s_instance;

    FaultEvaluator _evaluator;
    SafetyWatchdog _watchdog;
    TaskHandle_t   _taskHandle = nullptr;
};

#define SAFETY SafetyMonitor::Get()

#endif // SAFETY_MONITOR_HPP
