#include <ControlLoop.hpp>
#include <SharedState.hpp>

ControlLoop::ControlLoop(PowerStage& stage, const ControlTuningParams& params)
    : _stage(stage), _logic(params)
{
}

bool ControlLoop::begin() {
    DEBUGGSTART();
    DEBUG_PRINTLN("###########################################################");
    DEBUG_PRINTLN("#                  Starting Control Loop                  #");
    DEBUG_PRINTLN("###########################################################");
    DEBUGGSTOP();

    pinMode(RUN_BUTTON_PIN, INPUT_PULLUP);
    _logic.begin(_stage);

    if (_taskHandle != nullptr) return true;

    BaseType_t ok = xTaskCreatePinnedToCore(
        _taskThunk,
        "ControlLoop",
        CONTROL_TASK_STACK_SIZE,
        this,
        CONTROL_TASK_PRIORITY,
        &_taskHandle,
        CONTROL_TASK_CORE
    );
    if (ok != pdPASS) {
        _taskHandle = nullptr;
        DEBUG_PRINTLN("[Control] ERROR: Failed to start control task");
        return false;
    }
    return true;
}

void ControlLoop::_taskThunk(void* arg) {
    static_cast<ControlLoop*>(arg)->_taskLoop();
}

void ControlLoop::_taskLoop() {
    TickType_t lastWake = xTaskGetTickCount();
    for (;;) {
        _tickOnce(millis());
        vTaskDelayUntil(&lastWake, pdMS_TO_TICKS(CONTROL_TASK_PERIOD_MS));
    }
}

void ControlLoop::_tickOnce(uint32_t nowMs) {
    const ControlSettings settings = STATE->settings.snapshot();
    const FaultCode       fault    = STATE->currentFault();
    const Measurements    meas     = STATE->measurements.snapshot();
    const bool buttonLow = digitalRead(RUN_BUTTON_PIN) == LOW;

    ControlEvents ev;
    const ControlStatus st = _logic.tick(settings, fault, meas, buttonLow, nowMs, _stage, &ev);
    STATE->status.replace(st);

    _logEvents(ev, st, fault);
}

void ControlLoop::_logEvents(const ControlEvents& ev, const ControlStatus& st, FaultCode fault) {
    if (ev.modeChanged) {
        DEBUG_PRINTF("[Control] Mode %s -> %s\n", modeName(ev.previousMode), modeName(st.mode));
    }
    if (ev.runToggled) {
        DEBUG_PRINTF("[Control] Run button toggled -> %s\n", st.runActive ? "RUN" : "STOP");
    }
    if (ev.runCancelled) {
        if (fault != FaultCode::None) {
            DEBUG_PRINTF("[Control] Run cancelled: %s\n", faultMessage(fault));
        } else {
            DEBUG_PRINTLN("[Control] Run cancelled: mode change");
        }
    }
}
