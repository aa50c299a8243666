/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef MCPWM_POWER_STAGE_HPP
#define MCPWM_POWER_STAGE_HPP

#include <Utils.hpp>
#include <PowerStage.hpp>
#include <driver/mcpwm.h>

// Deadtime generator resolution of the legacy MCPWM driver.
#define MCPWM_DEADTIME_RES_NS          100

/*
 * McpwmPowerStage
 *
 * Half-bridge on one MCPWM timer: A = high side, B = complementary low side
 * with rising/falling edge delay. Enable lines and the solenoid are plain
 * GPIO outputs. Only the control task calls into this object.
 */
class McpwmPowerStage : public PowerStage {
public:
    McpwmPowerStage() = default;

    // Enable lines and solenoid low, PWM pins routed. Call once before any
    // task starts.
    void begin();

    void configure(uint32_t deadtimeNs, uint32_t freqHz) override;
    void enable() override;
    void disable() override;
    void setEnableLines(bool highSide, bool lowSide) override;
    void setSolenoid(bool on) override;

    bool     running() const { return _running; }
    uint32_t frequencyHz() const { return _freqHz; }

private:
    bool check_(esp_err_t err, const char* what);
    void parkOutputs_();

    bool     _initialized = false;
    bool     _running     = false;
    uint32_t _freqHz      = 0;
    uint32_t _deadtimeNs  = 0;
    bool     _errorLogged = false;
};

#endif // MCPWM_POWER_STAGE_HPP
