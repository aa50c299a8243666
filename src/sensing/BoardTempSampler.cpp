#include <BoardTempSampler.hpp>
#include <SharedState.hpp>
#include <SensorConversions.hpp>
#include <MeasurementFusion.hpp>

BoardTempSampler::BoardTempSampler(Ads7828& adc, const SensingTuning& tuning)
    : _adc(adc), _tuning(tuning)
{
}

bool BoardTempSampler::begin() {
    if (!_adc.begin()) {
        DEBUG_PRINTF("[BoardTemp] ADS7828 @0x%02X not responding (err %u), will retry\n",
                     ADS7828_I2C_ADDR, (unsigned)_adc.lastError());
    }

    if (_taskHandle != nullptr) return true;

    BaseType_t ok = xTaskCreatePinnedToCore(
        _taskThunk,
        "BoardTemp",
        BOARD_TEMP_TASK_STACK_SIZE,
        this,
        BOARD_TEMP_TASK_PRIORITY,
        &_taskHandle,
        BOARD_TEMP_TASK_CORE
    );
    if (ok != pdPASS) {
        _taskHandle = nullptr;
        DEBUG_PRINTLN("[BoardTemp] ERROR: Failed to start task");
        return false;
    }
    return true;
}

void BoardTempSampler::_taskThunk(void* arg) {
    static_cast<BoardTempSampler*>(arg)->_taskLoop();
}

void BoardTempSampler::_taskLoop() {
    TickType_t lastWake = xTaskGetTickCount();
    for (;;) {
        _sampleOnce();
        vTaskDelayUntil(&lastWake, pdMS_TO_TICKS(BOARD_TEMP_PERIOD_MS));
    }
}

void BoardTempSampler::_sampleOnce() {
    uint16_t raw[Ads7828::CHANNELS] = {0};
    if (!_adc.readAllChannels(raw)) {
        DEBUG_PRINTF("[BoardTemp] ADS7828 read error (err %u)\n", (unsigned)_adc.lastError());
        return;
    }

    const CoilTempReading coil =
        SensorConv::coilTemp(SensorConv::boardAdcToVolts(raw[COIL_TEMP_ADC_CHANNEL]), _tuning.coil);
    const float pcbC =
        SensorConv::pcbTemp(SensorConv::boardAdcToVolts(raw[PCB_TEMP_ADC_CHANNEL]));

    const float alpha = _tuning.smoothAlpha;
    STATE->measurements.update([&coil, pcbC, alpha](Measurements& m) {
        Fusion::applyBoardTemps(m, coil, pcbC, alpha);
    });

    if (coil.disconnected != _wasDisconnected) {
        _wasDisconnected = coil.disconnected;
        DEBUG_PRINTLN(coil.disconnected ? "[BoardTemp] Coil NTC disconnected"
                                        : "[BoardTemp] Coil NTC reconnected");
    }
}
