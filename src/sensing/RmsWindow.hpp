/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef RMS_WINDOW_HPP
#define RMS_WINDOW_HPP

#include <stddef.h>
#include <stdint.h>
#include <ConfigNVS.hpp>

/*
 * RmsWindow
 *
 * Accumulates sum(v^2), sum(i^2) and sum(v*i) over a fixed number of
 * voltage/current pairs. When the window is full it produces
 *   vRms    = sqrt(mean(v^2))
 *   iRms    = sqrt(mean(i^2))
 *   powerKw = clamp(mean(v*i) / 1000, 0, MAX_COIL_POWER_KW)
 * and starts over.
 */
class RmsWindow {
public:
    struct Result {
        float    vRms    = 0.0f;
        float    iRms    = 0.0f;
        float    powerKw = 0.0f;
        uint32_t pairs   = 0;
    };

    explicit RmsWindow(uint32_t pairsPerWindow = DEFAULT_RMS_WINDOW_PAIRS);

    // Returns true when this pair completed a window; out holds the result.
    bool addPair(float volts, float amps, Result& out);

    // Bulk variant. Returns the number of windows completed; out holds the
    // last one.
    size_t addPairs(const float* volts, const float* amps, size_t count, Result& out);

    void     reset();
    uint32_t pairsPerWindow() const { return _pairsPerWindow; }
    uint32_t pending() const        { return _count; }

private:
    Result finish_();

    uint32_t _pairsPerWindow;
    uint32_t _count = 0;
    double   _sumVSq = 0.0;
    double   _sumISq = 0.0;
    double   _sumVI  = 0.0;
};

#endif // RMS_WINDOW_HPP
