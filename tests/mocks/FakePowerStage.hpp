#ifndef FAKE_POWER_STAGE_HPP
#define FAKE_POWER_STAGE_HPP

#include <PowerStage.hpp>

// Records what the control logic asked the half-bridge to do.
class FakePowerStage : public PowerStage {
public:
    void configure(uint32_t deadtimeNs, uint32_t freqHz) override {
        configureCalls++;
        lastDeadtimeNs = deadtimeNs;
        lastFreqHz     = freqHz;
    }

    void enable() override {
        enableCalls++;
        running = true;
    }

    void disable() override {
        disableCalls++;
        running = false;
    }

    void setEnableLines(bool hs, bool ls) override {
        highSide = hs;
        lowSide  = ls;
    }

    void setSolenoid(bool on) override {
        solenoid = on;
    }

    void clearCounters() {
        configureCalls = 0;
        enableCalls    = 0;
        disableCalls   = 0;
    }

    bool     running        = false;
    bool     highSide       = true;   // start "wrong" so begin() is observable
    bool     lowSide        = true;
    bool     solenoid       = true;
    uint32_t lastFreqHz     = 0;
    uint32_t lastDeadtimeNs = 0;
    int      configureCalls = 0;
    int      enableCalls    = 0;
    int      disableCalls   = 0;
};

#endif // FAKE_POWER_STAGE_HPP
