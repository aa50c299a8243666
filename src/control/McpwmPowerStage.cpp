#include <McpwmPowerStage.hpp>

void McpwmPowerStage::begin() {
    pinMode(HS_ENABLE_PIN, OUTPUT);
    pinMode(LS_ENABLE_PIN, OUTPUT);
    pinMode(SOLENOID_PIN, OUTPUT);
    setEnableLines(false, false);
    setSolenoid(false);

    // Outputs are parked once the timer exists (first configure()); until
    // then the low enable lines keep the gate driver off.
    check_(mcpwm_gpio_init(PWM_MCPWM_UNIT, MCPWM0A, PWM_HS_PIN), "gpio A");
    check_(mcpwm_gpio_init(PWM_MCPWM_UNIT, MCPWM0B, PWM_LS_PIN), "gpio B");

    DEBUG_PRINTF("[PowerStage] MCPWM A=GPIO%d B=GPIO%d, enables HS=GPIO%d LS=GPIO%d\n",
                 PWM_HS_PIN, PWM_LS_PIN, HS_ENABLE_PIN, LS_ENABLE_PIN);
}

bool McpwmPowerStage::check_(esp_err_t err, const char* what) {
    if (err == ESP_OK) return true;
    if (!_errorLogged) {
        _errorLogged = true;
        DEBUG_PRINTF("[PowerStage] MCPWM %s failed: %s\n", what, esp_err_to_name(err));
    }
    return false;
}

void McpwmPowerStage::parkOutputs_() {
    if (!_initialized) return;
    check_(mcpwm_set_signal_low(PWM_MCPWM_UNIT, PWM_MCPWM_TIMER, MCPWM_OPR_A), "park A");
    check_(mcpwm_set_signal_low(PWM_MCPWM_UNIT, PWM_MCPWM_TIMER, MCPWM_OPR_B), "park B");
}

void McpwmPowerStage::configure(uint32_t deadtimeNs, uint32_t freqHz) {
    if (freqHz == 0) return;

    if (!_initialized) {
        mcpwm_config_t cfg = {};
        cfg.frequency    = freqHz;
        cfg.cmpr_a       = PWM_DUTY_PERCENT;
        cfg.cmpr_b       = PWM_DUTY_PERCENT;
        cfg.counter_mode = MCPWM_UP_COUNTER;
        cfg.duty_mode    = MCPWM_DUTY_MODE_0;
        if (!check_(mcpwm_init(PWM_MCPWM_UNIT, PWM_MCPWM_TIMER, &cfg), "init")) return;
        // init starts the timer; it only runs after enable()
        check_(mcpwm_stop(PWM_MCPWM_UNIT, PWM_MCPWM_TIMER), "stop");
        _initialized = true;
        parkOutputs_();
        _freqHz      = freqHz;
        _deadtimeNs  = 0;
    } else if (freqHz != _freqHz) {
        if (check_(mcpwm_set_frequency(PWM_MCPWM_UNIT, PWM_MCPWM_TIMER, freqHz), "frequency")) {
            _freqHz = freqHz;
        }
    }

    if (deadtimeNs != _deadtimeNs) {
        const uint32_t ticks = (deadtimeNs + MCPWM_DEADTIME_RES_NS - 1) / MCPWM_DEADTIME_RES_NS;
        if (check_(mcpwm_deadtime_enable(PWM_MCPWM_UNIT, PWM_MCPWM_TIMER,
                                         MCPWM_ACTIVE_HIGH_COMPLIMENT_MODE, ticks, ticks),
                   "deadtime")) {
            _deadtimeNs = deadtimeNs;
        }
    }
}

void McpwmPowerStage::enable() {
    if (!_initialized || _running) return;

    check_(mcpwm_set_duty(PWM_MCPWM_UNIT, PWM_MCPWM_TIMER, MCPWM_OPR_A, PWM_DUTY_PERCENT), "duty A");
    check_(mcpwm_set_duty_type(PWM_MCPWM_UNIT, PWM_MCPWM_TIMER, MCPWM_OPR_A, MCPWM_DUTY_MODE_0), "mode A");
    if (check_(mcpwm_start(PWM_MCPWM_UNIT, PWM_MCPWM_TIMER), "start")) {
        _running = true;
    }
}

void McpwmPowerStage::disable() {
    if (_initialized && _running) {
        check_(mcpwm_stop(PWM_MCPWM_UNIT, PWM_MCPWM_TIMER), "stop");
    }
    parkOutputs_();
    _running = false;
}

void McpwmPowerStage::setEnableLines(bool highSide, bool lowSide) {
    digitalWrite(HS_ENABLE_PIN, highSide ? HIGH : LOW);
    digitalWrite(LS_ENABLE_PIN, lowSide ? HIGH : LOW);
}

void McpwmPowerStage::setSolenoid(bool on) {
    digitalWrite(SOLENOID_PIN, on ? HIGH : LOW);
}
