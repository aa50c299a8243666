/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef DUTY_TEMP_DECODER_HPP
#define DUTY_TEMP_DECODER_HPP

#include <stdint.h>
#include <NtcModel.hpp>

// ============================================================================
// Duty-cycle encoded module temperature
// ============================================================================
//
// The gate-driver board converts the SiC module NTC into a square wave.
// Per observed cycle we get (high, period). A batch of duties is averaged,
// mapped to the sense voltage (inverted: higher duty -> lower voltage),
// converted to resistance through the known sense current and finally to
// Celsius with the module NTC beta model.
// ============================================================================

struct ModuleSenseParams {
    NtcBetaParams ntc{DEFAULT_MOD_NTC_BETA, DEFAULT_MOD_NTC_R0_OHMS, DEFAULT_MOD_NTC_T0_C};
    float    seriesOhm        = DEFAULT_MOD_SERIES_OHMS;
    uint16_t samplesPerUpdate = DEFAULT_MOD_DUTY_SAMPLES;
};

class DutyTempDecoder {
public:
    explicit DutyTempDecoder(const ModuleSenseParams& params = ModuleSenseParams());

    // Feed one cycle. Returns true when a batch completed; outTempC is the
    // batch temperature, or NAN when the batch decoded to a non-physical value.
    bool addCycle(uint32_t highUs, uint32_t periodUs, float& outTempC);

    void reset();

    uint16_t collected() const { return _collected; }

    float decodeDuty(float duty) const;

    static float clampDuty(float duty);
    static float dutyToVoltage(float duty);
    float voltageToResistance(float volts) const;

private:
    ModuleSenseParams _params;
    float    _dutySum   = 0.0f;
    uint16_t _collected = 0;
};

#endif // DUTY_TEMP_DECODER_HPP
