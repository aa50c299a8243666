/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#include <PowerSampler.hpp>
#include <SharedState.hpp>
#include <SensorConversions.hpp>
#include <MeasurementFusion.hpp>

PowerSampler* PowerSampler::s_instance = nullptr;

void PowerSampler::Init() {
    (void)PowerSampler::Get();
}

PowerSampler* PowerSampler::Get() {
    if (!s_instance) {
        s_instance = new PowerSampler();
    }
    return s_instance;
}

bool PowerSampler::begin(const SensingTuning& tuning) {
    DEBUGGSTART();
    DEBUG_PRINTLN("###########################################################");
    DEBUG_PRINTLN("#               Starting Coil Power Sampler               #");
    DEBUG_PRINTLN("###########################################################");
    DEBUG_PRINTF("[Power] RMS window %lu pairs, alpha %.2f\n",
                 (unsigned long)tuning.rmsWindowPairs, tuning.smoothAlpha);
    DEBUGGSTOP();

    _tuning = tuning;
    _window = RmsWindow(tuning.rmsWindowPairs);

    analogReadResolution(12);
    pinMode(VDC_ADC_PIN, INPUT);
    pinMode(COIL_CURRENT_ADC_PIN, INPUT);

    if (_taskHandle != nullptr) {
        return true;
    }

    BaseType_t ok = xTaskCreatePinnedToCore(
        _samplingTaskThunk,
        "PowerSampler",
        POWER_SAMPLER_TASK_STACK_SIZE,
        this,
        POWER_SAMPLER_TASK_PRIORITY,
        &_taskHandle,
        POWER_SAMPLER_TASK_CORE
    );
    if (ok != pdPASS) {
        _taskHandle = nullptr;
        DEBUG_PRINTLN("[Power] ERROR: Failed to start sampling task");
        return false;
    }
    return true;
}

void PowerSampler::_samplingTaskThunk(void* arg) {
    auto* self = static_cast<PowerSampler*>(arg);
    self->_samplingTaskLoop();
}

void PowerSampler::_samplingTaskLoop() {
    RmsWindow::Result result;

    for (;;) {
        for (size_t k = 0; k < POWER_SAMPLER_BATCH_PAIRS; ++k) {
            const uint16_t vCode = (uint16_t)analogRead(VDC_ADC_PIN);
            const uint16_t iCode = (uint16_t)analogRead(COIL_CURRENT_ADC_PIN);
            _volts[k] = SensorConv::busVoltage(SensorConv::powerAdcToVolts(vCode), _tuning.power);
            _amps[k]  = SensorConv::coilCurrent(SensorConv::powerAdcToVolts(iCode), _tuning.power);
        }

        if (_window.addPairs(_volts, _amps, POWER_SAMPLER_BATCH_PAIRS, result) > 0) {
            _publish(result, millis());
        }

        // Let equal/lower priority tasks on this core run between batches.
        vTaskDelay(1);
    }
}

void PowerSampler::_publish(const RmsWindow::Result& r, uint32_t nowMs) {
    const float alpha = _tuning.smoothAlpha;
    STATE->measurements.update([&r, alpha](Measurements& m) {
        Fusion::applyPowerWindow(m, r, alpha);
    });

    if (nowMs - _lastLogMs >= POWER_LOG_PERIOD_MS) {
        _lastLogMs = nowMs;
        DEBUG_PRINTF("[Power] Vdc: %.1f V, Icoil: %.1f A, Pcoil: %.2f kW\n",
                     r.vRms, r.iRms, r.powerKw);
    }
}
