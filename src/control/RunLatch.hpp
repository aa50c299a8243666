/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef RUN_LATCH_HPP
#define RUN_LATCH_HPP

#include <stdint.h>
#include <ConfigNVS.hpp>

/*
 * RunLatch
 *
 * Run button (active low) as a debounced toggle. A press is the high->low
 * edge; it qualifies when at least debounceMs passed since the previous
 * qualifying press. A qualifying press only flips the latch when heating is
 * allowed by the current mode, but it always restarts the debounce window.
 */
class RunLatch {
public:
    explicit RunLatch(uint32_t debounceMs = DEFAULT_RUN_DEBOUNCE_MS);

    // Returns true when the latch flipped on this sample.
    bool sample(bool buttonLow, uint32_t nowMs, bool heatingMode);

    // Forces the latch off. Returns true if it was on.
    bool cancel();

    bool     active() const     { return _active; }
    uint32_t debounceMs() const { return _debounceMs; }

private:
    uint32_t _debounceMs;
    bool     _active       = false;
    bool     _lastLow      = false;
    bool     _everPressed  = false;
    uint32_t _lastPressMs  = 0;
};

#endif // RUN_LATCH_HPP
