/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef BOARD_TEMP_SAMPLER_HPP
#define BOARD_TEMP_SAMPLER_HPP

#include <Utils.hpp>
#include <Ads7828.hpp>
#include <TuningValidation.hpp>

// Coil NTC (channel 6) and PCB sensor (channel 3) from the ADS7828, 50 ms.
class BoardTempSampler {
public:
    BoardTempSampler(Ads7828& adc, const SensingTuning& tuning);

    bool begin();

private:
    static void _taskThunk(void* arg);
    void _taskLoop();
    void _sampleOnce();

    Ads7828&      _adc;
    SensingTuning _tuning;
    TaskHandle_t  _taskHandle  = nullptr;
    bool          _wasDisconnected = false;
};

#endif // BOARD_TEMP_SAMPLER_HPP
