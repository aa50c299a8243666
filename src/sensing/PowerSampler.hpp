/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef POWER_SAMPLER_HPP
#define POWER_SAMPLER_HPP

#include <Utils.hpp>
#include <RmsWindow.hpp>
#include <TuningValidation.hpp>

// ============================================================================
// Coil power sampler
// ============================================================================
//
// Reads DC-bus / coil-current pairs from the on-chip ADC as fast as the task
// allows, in bulk batches, and folds them into an RmsWindow. Every completed
// window is smoothed into the measurements record (power fields only).
// ============================================================================
class PowerSampler {
public:
    static void Init();
    static PowerSampler* Get();

    bool begin(const SensingTuning& tuning);

private:
    PowerSampler() = default;

    static void _samplingTaskThunk(void* arg);
    void _samplingTaskLoop();
    void _publish(const RmsWindow::Result& r, uint32_t nowMs);

    static PowerSampler* s_instance;

    SensingTuning _tuning;
    RmsWindow     _window;
    TaskHandle_t  _taskHandle = nullptr;
    uint32_t      _lastLogMs  = 0;

    float _volts[POWER_SAMPLER_BATCH_PAIRS];
    float _amps[POWER_SAMPLER_BATCH_PAIRS];
};

#define POWER_SAMPLER PowerSampler::Get()

#endif // POWER_SAMPLER_HPP
