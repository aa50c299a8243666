/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#include <ControlTuning.hpp>

ControlTuning* ControlTuning::s_instance = nullptr;

void ControlTuning::Init() {
    (void)ControlTuning::Get();
}

ControlTuning* ControlTuning::Get() {
    if (!s_instance) {
        s_instance = new ControlTuning();
    }
    return s_instance;
}

void ControlTuning::begin() {
    loadFromNvs();

    DEBUGGSTART();
    DEBUG_PRINTF("[Tuning] Limits : P %.1f kW | I %.0f A | coil %.0f C | module %.0f C | pcb %.0f C\n",
                 _limits.powerLimitKw, _limits.currentLimitA, _limits.coilTempLimitC,
                 _limits.moduleTempLimitC, _limits.pcbTempLimitC);
    DEBUG_PRINTF("[Tuning] Power PI : Kp %.2f Ki %.2f | %.0f..%.0f Hz | deadtime %lu ns\n",
                 _control.powerKp, _control.powerKi, _control.minFreqHz, _control.maxFreqHz,
                 (unsigned long)_control.deadtimeNs);
    DEBUG_PRINTF("[Tuning] Temp PI  : Kp %.3f Ki %.3f | tolerance %.1f C\n",
                 _control.tempKp, _control.tempKi, _control.targetToleranceC);
    DEBUGGSTOP();
}

void ControlTuning::loadFromNvs() {
    if (!CONF) return;

    _limits.powerLimitKw     = CONF->GetFloat(POWER_LIMIT_KEY,       DEFAULT_POWER_LIMIT_KW);
    _limits.currentLimitA    = CONF->GetFloat(CURR_LIMIT_KEY,        DEFAULT_CURRENT_LIMIT_A);
    _limits.coilTempLimitC   = CONF->GetFloat(COIL_TEMP_LIMIT_KEY,   DEFAULT_COIL_TEMP_LIMIT_C);
    _limits.moduleTempLimitC = CONF->GetFloat(MODULE_TEMP_LIMIT_KEY, DEFAULT_MODULE_TEMP_LIMIT_C);
    _limits.pcbTempLimitC    = CONF->GetFloat(PCB_TEMP_LIMIT_KEY,    DEFAULT_PCB_TEMP_LIMIT_C);

    _control.powerKp          = (float)CONF->GetDouble(POWER_KP_KEY, DEFAULT_POWER_KP);
    _control.powerKi          = (float)CONF->GetDouble(POWER_KI_KEY, DEFAULT_POWER_KI);
    _control.powerILimitHz    = CONF->GetFloat(POWER_I_LIMIT_KEY, DEFAULT_POWER_I_LIMIT_HZ);
    _control.baseFreqHz       = CONF->GetFloat(BASE_FREQ_KEY,     DEFAULT_BASE_FREQ_HZ);
    _control.minFreqHz        = CONF->GetFloat(MIN_FREQ_KEY,      DEFAULT_MIN_FREQ_HZ);
    _control.maxFreqHz        = CONF->GetFloat(MAX_FREQ_KEY,      DEFAULT_MAX_FREQ_HZ);
    _control.deadtimeNs       = (uint32_t)CONF->GetInt(DEADTIME_NS_KEY, DEFAULT_DEADTIME_NS);
    _control.tempKp           = (float)CONF->GetDouble(TEMP_KP_KEY, DEFAULT_TEMP_KP);
    _control.tempKi           = (float)CONF->GetDouble(TEMP_KI_KEY, DEFAULT_TEMP_KI);
    _control.targetToleranceC = CONF->GetFloat(TEMP_TOLERANCE_KEY, DEFAULT_TEMP_TOLERANCE_C);
    _control.runDebounceMs    = (uint32_t)CONF->GetInt(RUN_DEBOUNCE_KEY, DEFAULT_RUN_DEBOUNCE_MS);

    _sensing.smoothAlpha           = CONF->GetFloat(SMOOTH_ALPHA_KEY, DEFAULT_SMOOTH_ALPHA);
    _sensing.rmsWindowPairs        = (uint32_t)CONF->GetInt(RMS_WINDOW_KEY, DEFAULT_RMS_WINDOW_PAIRS);
    _sensing.power.vdcGain         = CONF->GetFloat(VDC_GAIN_KEY,    DEFAULT_VDC_GAIN);
    _sensing.power.currentCenterV  = CONF->GetFloat(CURR_CENTER_KEY, DEFAULT_CURRENT_CENTER_V);
    _sensing.power.currentAPerV    = CONF->GetFloat(CURR_SENS_KEY,   DEFAULT_CURRENT_A_PER_V);
    _sensing.coil.ntc.beta         = CONF->GetFloat(COIL_NTC_BETA_KEY,   DEFAULT_COIL_NTC_BETA);
    _sensing.coil.ntc.r0Ohm        = CONF->GetFloat(COIL_NTC_R0_KEY,     DEFAULT_COIL_NTC_R0_OHMS);
    _sensing.coil.seriesOhm        = CONF->GetFloat(COIL_NTC_SERIES_KEY, DEFAULT_COIL_NTC_SERIES_OHMS);
    _sensing.module.ntc.beta       = CONF->GetFloat(MOD_NTC_BETA_KEY, DEFAULT_MOD_NTC_BETA);
    _sensing.module.ntc.r0Ohm      = CONF->GetFloat(MOD_NTC_R0_KEY,   DEFAULT_MOD_NTC_R0_OHMS);
    _sensing.module.seriesOhm      = CONF->GetFloat(MOD_SERIES_KEY,   DEFAULT_MOD_SERIES_OHMS);
    _sensing.module.samplesPerUpdate =
        (uint16_t)CONF->GetInt(MOD_DUTY_SAMPLES_KEY, DEFAULT_MOD_DUTY_SAMPLES);

    const uint8_t fixedLimits  = Tuning::sanitizeLimits(_limits);

    // The temperature loop output is capped by the machine power limit.
    _control.powerLimitKw = _limits.powerLimitKw;
    const uint8_t fixedControl = Tuning::sanitizeControl(_control);
    const uint8_t fixedSensing = Tuning::sanitizeSensing(_sensing);

    if (fixedLimits || fixedControl || fixedSensing) {
        DEBUG_PRINTF("[Tuning] Replaced invalid stored values with defaults (limits %u, control %u, sensing %u)\n",
                     (unsigned)fixedLimits, (unsigned)fixedControl, (unsigned)fixedSensing);
    }
}
