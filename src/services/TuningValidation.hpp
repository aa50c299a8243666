/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef TUNING_VALIDATION_HPP
#define TUNING_VALIDATION_HPP

#include <StateTypes.hpp>
#include <ControlLogic.hpp>
#include <SensorConversions.hpp>
#include <DutyTempDecoder.hpp>

// Sensor-side tunables loaded together with the control tunables.
struct SensingTuning {
    float               smoothAlpha    = DEFAULT_SMOOTH_ALPHA;
    uint32_t            rmsWindowPairs = DEFAULT_RMS_WINDOW_PAIRS;
    PowerFrontEndParams power;
    CoilSenseParams     coil;
    ModuleSenseParams   module;
};

// Each sanitize* replaces non-finite or out-of-range fields with their
// defaults and returns how many fields it replaced (0 = stored set was sane).
namespace Tuning {

uint8_t sanitizeLimits(MachineLimits& lim);
uint8_t sanitizeControl(ControlTuningParams& p);
uint8_t sanitizeSensing(SensingTuning& s);

} // namespace Tuning

#endif // TUNING_VALIDATION_HPP
