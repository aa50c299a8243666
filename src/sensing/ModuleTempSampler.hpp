/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef MODULE_TEMP_SAMPLER_HPP
#define MODULE_TEMP_SAMPLER_HPP

#include <Utils.hpp>
#include <freertos/queue.h>
#include <DutyTempDecoder.hpp>

// ============================================================================
// SiC module temperature (duty-cycle encoded)
// ============================================================================
//
// A CHANGE interrupt timestamps edges with micros(). Each rising edge closes
// one cycle (high time, period) which is pushed to a queue from the ISR.
// The task feeds the decoder; after every completed batch it publishes,
// pauses MODULE_TEMP_GAP_MS and restarts with a fresh capture.
// ============================================================================
class ModuleTempSampler {
public:
    static void Init();
    static ModuleTempSampler* Get();

    bool begin(const ModuleSenseParams& params, float smoothAlpha);

private:
    struct Cycle {
        uint32_t highUs;
        uint32_t periodUs;
    };

    ModuleTempSampler() = default;

    static void IRAM_ATTR _edgeIsr();
    static void _taskThunk(void* arg);
    void _taskLoop();

    static ModuleTempSampler* s_instance;

    DutyTempDecoder _decoder;
    float           _alpha      = DEFAULT_SMOOTH_ALPHA;
    QueueHandle_t   _cycleQ     = nullptr;
    TaskHandle_t    _taskHandle = nullptr;

    // ISR state
    volatile uint32_t _riseUs   = 0;
    volatile uint32_t _fallUs   = 0;
    volatile bool     _haveRise = false;
    volatile bool     _haveFall = false;
};

#endif // MODULE_TEMP_SAMPLER_HPP
