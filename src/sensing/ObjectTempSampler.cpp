#include <ObjectTempSampler.hpp>
#include <SharedState.hpp>
#include <MeasurementFusion.hpp>

ObjectTempSampler::ObjectTempSampler(Mlx90614& ir, float smoothAlpha)
    : _ir(ir), _alpha(smoothAlpha)
{
}

bool ObjectTempSampler::begin() {
    if (!_ir.begin()) {
        DEBUG_PRINTF("[ObjectTemp] MLX90614 @0x%02X not responding (err %u), will retry\n",
                     MLX90614_I2C_ADDR, (unsigned)_ir.lastError());
    }

    if (_taskHandle != nullptr) return true;

    BaseType_t ok = xTaskCreatePinnedToCore(
        _taskThunk,
        "ObjectTemp",
        OBJECT_TEMP_TASK_STACK_SIZE,
        this,
        OBJECT_TEMP_TASK_PRIORITY,
        &_taskHandle,
        OBJECT_TEMP_TASK_CORE
    );
    if (ok != pdPASS) {
        _taskHandle = nullptr;
        DEBUG_PRINTLN("[ObjectTemp] ERROR: Failed to start task");
        return false;
    }
    return true;
}

void ObjectTempSampler::_taskThunk(void* arg) {
    static_cast<ObjectTempSampler*>(arg)->_taskLoop();
}

void ObjectTempSampler::_taskLoop() {
    TickType_t lastWake = xTaskGetTickCount();
    for (;;) {
        float t = NAN;
        if (_ir.readObjectTemperature(t)) {
            const float alpha = _alpha;
            STATE->measurements.update([t, alpha](Measurements& m) {
                Fusion::applyObjectTemp(m, t, alpha);
            });
        } else {
            _errorCount++;
            DEBUG_PRINTF("[ObjectTemp] MLX90614 read error (err %u, total %lu)\n",
                         (unsigned)_ir.lastError(), (unsigned long)_errorCount);
        }
        vTaskDelayUntil(&lastWake, pdMS_TO_TICKS(OBJECT_TEMP_PERIOD_MS));
    }
}
