/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef POWER_STAGE_HPP
#define POWER_STAGE_HPP

#include <stdint.h>

/*
 * PowerStage
 *
 * Outputs driven by the control loop: complementary half-bridge PWM,
 * gate-driver enable lines (high side + low side) and the cooling solenoid.
 * configure() + enable() run every heating tick; a running stage retunes
 * its frequency in place.
 */
class PowerStage {
public:
    virtual ~PowerStage() = default;

    virtual void configure(uint32_t deadtimeNs, uint32_t freqHz) = 0;
    virtual void enable() = 0;
    virtual void disable() = 0;
    virtual void setEnableLines(bool highSide, bool lowSide) = 0;
    virtual void setSolenoid(bool on) = 0;
};

#endif // POWER_STAGE_HPP
