#include <ModuleTempSampler.hpp>
#include <SharedState.hpp>
#include <MeasurementFusion.hpp>

ModuleTempSampler* ModuleTempSampler::s_instance = nullptr;

void ModuleTempSampler::Init() {
    (void)ModuleTempSampler::Get();
}

ModuleTempSampler* ModuleTempSampler::Get() {
    if (!s_instance) {
        s_instance = new ModuleTempSampler();
    }
    return s_instance;
}

bool ModuleTempSampler::begin(const ModuleSenseParams& params, float smoothAlpha) {
    _decoder = DutyTempDecoder(params);
    _alpha   = smoothAlpha;

    if (!_cycleQ) {
        _cycleQ = xQueueCreate(MODULE_EDGE_QUEUE_DEPTH, sizeof(Cycle));
        if (!_cycleQ) {
            DEBUG_PRINTLN("[ModuleTemp] ERROR: Failed to create capture queue");
            return false;
        }
    }

    pinMode(MODULE_TEMP_PWM_PIN, INPUT);
    attachInterrupt(digitalPinToInterrupt(MODULE_TEMP_PWM_PIN), _edgeIsr, CHANGE);

    if (_taskHandle != nullptr) return true;

    BaseType_t ok = xTaskCreatePinnedToCore(
        _taskThunk,
        "ModuleTemp",
        MODULE_TEMP_TASK_STACK_SIZE,
        this,
        MODULE_TEMP_TASK_PRIORITY,
        &_taskHandle,
        MODULE_TEMP_TASK_CORE
    );
    if (ok != pdPASS) {
        _taskHandle = nullptr;
        detachInterrupt(digitalPinToInterrupt(MODULE_TEMP_PWM_PIN));
        DEBUG_PRINTLN("[ModuleTemp] ERROR: Failed to start task");
        return false;
    }

    DEBUG_PRINTF("[ModuleTemp] Capture on GPIO%d, %u cycles per update\n",
                 MODULE_TEMP_PWM_PIN, (unsigned)params.samplesPerUpdate);
    return true;
}

void IRAM_ATTR ModuleTempSampler::_edgeIsr() {
    ModuleTempSampler* self = s_instance;
    if (!self || !self->_cycleQ) return;

    const uint32_t now = micros();
    BaseType_t woken = pdFALSE;

    if (digitalRead(MODULE_TEMP_PWM_PIN) == HIGH) {
        if (self->_haveRise && self->_haveFall) {
            Cycle c;
            c.highUs   = self->_fallUs - self->_riseUs;
            c.periodUs = now - self->_riseUs;
            xQueueSendFromISR(self->_cycleQ, &c, &woken);
        }
        self->_riseUs   = now;
        self->_haveRise = true;
        self->_haveFall = false;
    } else if (self->_haveRise) {
        self->_fallUs   = now;
        self->_haveFall = true;
    }

    if (woken == pdTRUE) {
        portYIELD_FROM_ISR();
    }
}

void ModuleTempSampler::_taskThunk(void* arg) {
    static_cast<ModuleTempSampler*>(arg)->_taskLoop();
}

void ModuleTempSampler::_taskLoop() {
    bool signalLost = false;

    for (;;) {
        Cycle c;
        if (xQueueReceive(_cycleQ, &c, pdMS_TO_TICKS(MODULE_CAPTURE_TIMEOUT_MS)) != pdTRUE) {
            if (!signalLost) {
                signalLost = true;
                DEBUG_PRINTLN("[ModuleTemp] No duty signal, keeping last value");
            }
            continue;
        }
        if (signalLost) {
            signalLost = false;
            DEBUG_PRINTLN("[ModuleTemp] Duty signal back");
        }

        float tempC = NAN;
        if (!_decoder.addCycle(c.highUs, c.periodUs, tempC)) {
            continue;
        }

        if (isfinite(tempC)) {
            const float alpha = _alpha;
            STATE->measurements.update([tempC, alpha](Measurements& m) {
                Fusion::applyModuleTemp(m, tempC, alpha);
            });
        } else {
            DEBUG_PRINTLN("[ModuleTemp] Batch dropped: resistance out of range");
        }

        vTaskDelay(pdMS_TO_TICKS(MODULE_TEMP_GAP_MS));
        xQueueReset(_cycleQ);
        _decoder.reset();
    }
}
