/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#include <SafetyMonitor.hpp>
#include <SharedState.hpp>

SafetyMonitor* SafetyMonitor::s_instance = nullptr;

void SafetyMonitor::Init() {
    (void)SafetyMonitor::Get();
}

SafetyMonitor* SafetyMonitor::Get() {
    if (!s_instance) {
        s_instance = new SafetyMonitor();
    }
    return s_instance;
}

bool SafetyMonitor::begin(const MachineLimits& limits) {
    DEBUGGSTART();
    DEBUG_PRINTLN("###########################################################");
    DEBUG_PRINTLN("#                 Starting Safety Monitor                 #");
    DEBUG_PRINTLN("###########################################################");
    DEBUGGSTOP();

    _evaluator.setLimits(limits);

    pinMode(INTERLOCK_IN_PIN,  INPUT_PULLUP);
    pinMode(GATE_FAULT_IN_PIN, INPUT_PULLUP);
    pinMode(GATE_READY_IN_PIN, INPUT_PULLUP);

    if (_taskHandle != nullptr) return true;

    BaseType_t ok = xTaskCreatePinnedToCore(
        _taskThunk,
        "SafetyMonitor",
        SAFETY_TASK_STACK_SIZE,
        this,
        SAFETY_TASK_PRIORITY,
        &_taskHandle,
        SAFETY_TASK_CORE
    );
    if (ok != pdPASS) {
        _taskHandle = nullptr;
        DEBUG_PRINTLN("[Safety] ERROR: Failed to start monitor task");
        return false;
    }
    return true;
}

void SafetyMonitor::_taskThunk(void* arg) {
    static_cast<SafetyMonitor*>(arg)->_taskLoop();
}

void SafetyMonitor::_taskLoop() {
    TickType_t lastWake = xTaskGetTickCount();
    for (;;) {
        _pollOnce(millis());
        vTaskDelayUntil(&lastWake, pdMS_TO_TICKS(SAFETY_POLL_MS));
    }
}

SafetyInputs SafetyMonitor::_readInputs() const {
    SafetyInputs in;
    in.interlockOpen      = digitalRead(INTERLOCK_IN_PIN)  == LOW;
    in.gateDriverFault    = digitalRead(GATE_FAULT_IN_PIN) == LOW;
    in.gateDriverNotReady = digitalRead(GATE_READY_IN_PIN) == LOW;
    return in;
}

void SafetyMonitor::_pollOnce(uint32_t nowMs) {
    const FaultPollResult r = _evaluator.poll(_readInputs(), *STATE);

    switch (r.transition) {
        case FaultTransition::Unchanged:
            break;
        case FaultTransition::Detected:
            DEBUG_PRINTF("[Safety] Fault detected: %s\n", faultMessage(r.evaluated));
            break;
        case FaultTransition::Cleared:
            DEBUG_PRINTF("[Safety] Fault cleared: %s\n", faultMessage(r.stored));
            break;
        case FaultTransition::Changed:
            DEBUG_PRINTF("[Safety] Fault changed: %s -> %s\n",
                         faultMessage(r.stored), faultMessage(r.evaluated));
            break;
    }

    const Measurements&  meas = r.meas;
    const MachineLimits& lim  = _evaluator.limits();
    if (_watchdog.due(nowMs, r.evaluated, meas, lim)) {
        DEBUG_PRINTF("[Safety] %s | coil %.1f/%.0f C | module %.1f/%.0f C | pcb %.1f/%.0f C | P %.2f/%.1f kW | I %.0f/%.0f A\n",
                     faultMessage(r.evaluated),
                     meas.coilTempC, lim.coilTempLimitC,
                     meas.moduleTempC, lim.moduleTempLimitC,
                     meas.pcbTempC, lim.pcbTempLimitC,
                     meas.coilPowerKw, lim.powerLimitKw,
                     meas.coilCurrentRmsA, lim.currentLimitA);
    }
}
