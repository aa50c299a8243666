#include <NVSManager.hpp>

// ======================================================
// Static singleton pointer
// ======================================================
NVS* NVS::s_instance = nullptr;


// ======================================================
// Singleton Init() and Get()
// ======================================================
void NVS::Init() {
    (void)NVS::Get();
}

NVS* NVS::Get() {
    if (!s_instance) {
        s_instance = new NVS();
    }
    return s_instance;
}


// ======================================================
// ctor / dtor
// ======================================================
NVS::NVS()
: namespaceName(CONFIG_PARTITION) {
    mutex_ = xSemaphoreCreateRecursiveMutex();
}

NVS::~NVS() {
    end();
    if (mutex_) {
        vSemaphoreDelete(mutex_);
        mutex_ = nullptr;
    }
}

inline void NVS::sleepMs_(uint32_t ms) {
    if (xTaskGetSchedulerState() != taskSCHEDULER_NOT_STARTED) {
        vTaskDelay(pdMS_TO_TICKS(ms));
    } else {
        delay(ms);
    }
}

inline void NVS::lock_()   { if (mutex_) xSemaphoreTakeRecursive(mutex_, portMAX_DELAY); }
inline void NVS::unlock_() { if (mutex_) xSemaphoreGiveRecursive(mutex_); }


// ======================================================
// Preferences open state helpers
// - Lazy open RO or RW
// - RO -> RW requires a reopen
// ======================================================
void NVS::ensureOpenRO_() {
    if (!is_open_) {
        preferences.begin(namespaceName, /*readOnly=*/true);
        is_open_ = true;
        open_rw_ = false;
    }
}

void NVS::ensureOpenRW_() {
    if (!is_open_) {
        preferences.begin(namespaceName, /*readOnly=*/false);
        is_open_ = true;
        open_rw_ = true;
    } else if (!open_rw_) {
        preferences.end();
        preferences.begin(namespaceName, /*readOnly=*/false);
        is_open_ = true;
        open_rw_ = true;
    }
}

void NVS::end() {
    lock_();
    if (is_open_) {
        preferences.end();
        is_open_ = false;
        open_rw_ = false;
    }
    unlock_();
}


// ======================================================
// begin()
// - first boot: write every default and reboot
// - later boots: backfill keys added by newer firmware
// ======================================================
void NVS::begin() {
    DEBUGGSTART();
    DEBUG_PRINTLN("###########################################################");
    DEBUG_PRINTLN("#                 Starting NVS Manager                    #");
    DEBUG_PRINTLN("###########################################################");
    DEBUGGSTOP();

    if (getResetFlag()) {
        DEBUG_PRINTLN("[NVS] Initializing the device... ");
        initializeDefaults();
        RestartSysDelay(3000);
    } else {
        DEBUG_PRINTLN("[NVS] Using existing configuration...");
        ensureMissingDefaults();
    }
}

bool NVS::getResetFlag() {
    esp_task_wdt_reset();
    lock_();
    ensureOpenRO_();
    bool v = preferences.getBool(RESET_FLAG, true);
    unlock_();
    return v;
}

void NVS::initializeDefaults() {
    initializeVariables();
}

void NVS::initializeVariables() {
    PutBool(RESET_FLAG, false);

    PutString(DEV_SW_KEY, DEVICE_SW_VERSION);
    PutString(DEV_HW_KEY, DEVICE_HW_VERSION);

    // Machine limits
    PutFloat(POWER_LIMIT_KEY,       DEFAULT_POWER_LIMIT_KW);
    PutFloat(CURR_LIMIT_KEY,        DEFAULT_CURRENT_LIMIT_A);
    PutFloat(COIL_TEMP_LIMIT_KEY,   DEFAULT_COIL_TEMP_LIMIT_C);
    PutFloat(MODULE_TEMP_LIMIT_KEY, DEFAULT_MODULE_TEMP_LIMIT_C);
    PutFloat(PCB_TEMP_LIMIT_KEY,    DEFAULT_PCB_TEMP_LIMIT_C);

    // Power loop
    PutDouble(POWER_KP_KEY,     DEFAULT_POWER_KP);
    PutDouble(POWER_KI_KEY,     DEFAULT_POWER_KI);
    PutFloat (POWER_I_LIMIT_KEY, DEFAULT_POWER_I_LIMIT_HZ);
    PutFloat (BASE_FREQ_KEY,    DEFAULT_BASE_FREQ_HZ);
    PutFloat (MIN_FREQ_KEY,     DEFAULT_MIN_FREQ_HZ);
    PutFloat (MAX_FREQ_KEY,     DEFAULT_MAX_FREQ_HZ);
    PutInt   (DEADTIME_NS_KEY,  DEFAULT_DEADTIME_NS);

    // Temperature loop
    PutDouble(TEMP_KP_KEY,        DEFAULT_TEMP_KP);
    PutDouble(TEMP_KI_KEY,        DEFAULT_TEMP_KI);
    PutFloat (TEMP_TOLERANCE_KEY, DEFAULT_TEMP_TOLERANCE_C);
    PutInt   (RUN_DEBOUNCE_KEY,   DEFAULT_RUN_DEBOUNCE_MS);

    // Sensing
    PutFloat(SMOOTH_ALPHA_KEY,    DEFAULT_SMOOTH_ALPHA);
    PutInt  (RMS_WINDOW_KEY,      DEFAULT_RMS_WINDOW_PAIRS);
    PutFloat(VDC_GAIN_KEY,        DEFAULT_VDC_GAIN);
    PutFloat(CURR_CENTER_KEY,     DEFAULT_CURRENT_CENTER_V);
    PutFloat(CURR_SENS_KEY,       DEFAULT_CURRENT_A_PER_V);
    PutFloat(COIL_NTC_BETA_KEY,   DEFAULT_COIL_NTC_BETA);
    PutFloat(COIL_NTC_R0_KEY,     DEFAULT_COIL_NTC_R0_OHMS);
    PutFloat(COIL_NTC_SERIES_KEY, DEFAULT_COIL_NTC_SERIES_OHMS);
    PutFloat(MOD_NTC_BETA_KEY,    DEFAULT_MOD_NTC_BETA);
    PutFloat(MOD_NTC_R0_KEY,      DEFAULT_MOD_NTC_R0_OHMS);
    PutFloat(MOD_SERIES_KEY,      DEFAULT_MOD_SERIES_OHMS);
    PutInt  (MOD_DUTY_SAMPLES_KEY, DEFAULT_MOD_DUTY_SAMPLES);
}

void NVS::ensureMissingDefaults() {
    lock_();
    ensureOpenRW_();

    auto ensureInt = [&](const char* key, int value) {
        if (!preferences.isKey(key)) preferences.putInt(key, value);
    };
    auto ensureFloat = [&](const char* key, float value) {
        if (!preferences.isKey(key)) preferences.putFloat(key, value);
    };
    auto ensureDouble = [&](const char* key, double value) {
        if (!preferences.isKey(key)) preferences.putBytes(key, &value, sizeof(value));
    };
    auto ensureString = [&](const char* key, const char* value) {
        if (!preferences.isKey(key)) preferences.putString(key, value);
    };

    ensureString(DEV_SW_KEY, DEVICE_SW_VERSION);
    ensureString(DEV_HW_KEY, DEVICE_HW_VERSION);

    ensureFloat(POWER_LIMIT_KEY,       DEFAULT_POWER_LIMIT_KW);
    ensureFloat(CURR_LIMIT_KEY,        DEFAULT_CURRENT_LIMIT_A);
    ensureFloat(COIL_TEMP_LIMIT_KEY,   DEFAULT_COIL_TEMP_LIMIT_C);
    ensureFloat(MODULE_TEMP_LIMIT_KEY, DEFAULT_MODULE_TEMP_LIMIT_C);
    ensureFloat(PCB_TEMP_LIMIT_KEY,    DEFAULT_PCB_TEMP_LIMIT_C);

    ensureDouble(POWER_KP_KEY,     DEFAULT_POWER_KP);
    ensureDouble(POWER_KI_KEY,     DEFAULT_POWER_KI);
    ensureFloat (POWER_I_LIMIT_KEY, DEFAULT_POWER_I_LIMIT_HZ);
    ensureFloat (BASE_FREQ_KEY,    DEFAULT_BASE_FREQ_HZ);
    ensureFloat (MIN_FREQ_KEY,     DEFAULT_MIN_FREQ_HZ);
    ensureFloat (MAX_FREQ_KEY,     DEFAULT_MAX_FREQ_HZ);
    ensureInt   (DEADTIME_NS_KEY,  DEFAULT_DEADTIME_NS);

    ensureDouble(TEMP_KP_KEY,        DEFAULT_TEMP_KP);
    ensureDouble(TEMP_KI_KEY,        DEFAULT_TEMP_KI);
    ensureFloat (TEMP_TOLERANCE_KEY, DEFAULT_TEMP_TOLERANCE_C);
    ensureInt   (RUN_DEBOUNCE_KEY,   DEFAULT_RUN_DEBOUNCE_MS);

    ensureFloat(SMOOTH_ALPHA_KEY,    DEFAULT_SMOOTH_ALPHA);
    ensureInt  (RMS_WINDOW_KEY,      DEFAULT_RMS_WINDOW_PAIRS);
    ensureFloat(VDC_GAIN_KEY,        DEFAULT_VDC_GAIN);
    ensureFloat(CURR_CENTER_KEY,     DEFAULT_CURRENT_CENTER_V);
    ensureFloat(CURR_SENS_KEY,       DEFAULT_CURRENT_A_PER_V);
    ensureFloat(COIL_NTC_BETA_KEY,   DEFAULT_COIL_NTC_BETA);
    ensureFloat(COIL_NTC_R0_KEY,     DEFAULT_COIL_NTC_R0_OHMS);
    ensureFloat(COIL_NTC_SERIES_KEY, DEFAULT_COIL_NTC_SERIES_OHMS);
    ensureFloat(MOD_NTC_BETA_KEY,    DEFAULT_MOD_NTC_BETA);
    ensureFloat(MOD_NTC_R0_KEY,      DEFAULT_MOD_NTC_R0_OHMS);
    ensureFloat(MOD_SERIES_KEY,      DEFAULT_MOD_SERIES_OHMS);
    ensureInt  (MOD_DUTY_SAMPLES_KEY, DEFAULT_MOD_DUTY_SAMPLES);

    unlock_();
}


// ======================================================
// Reads (auto-open RO)
// ======================================================
int NVS::GetInt(const char* key, int defaultValue) {
    esp_task_wdt_reset();
    lock_();
    ensureOpenRO_();
    int v = preferences.getInt(key, defaultValue);
    unlock_();
    return v;
}

float NVS::GetFloat(const char* key, float defaultValue) {
    esp_task_wdt_reset();
    lock_();
    ensureOpenRO_();
    float v = preferences.getFloat(key, defaultValue);
    unlock_();
    return v;
}

// Doubles are stored as raw bytes; older float entries are still accepted.
double NVS::GetDouble(const char* key, double defaultValue) {
    esp_task_wdt_reset();
    lock_();
    ensureOpenRO_();
    double v = defaultValue;
    if (preferences.isKey(key)) {
        size_t len = preferences.getBytes(key, &v, sizeof(v));
        if (len != sizeof(v)) {
            float f = preferences.getFloat(key, NAN);
            v = isfinite(f) ? static_cast<double>(f) : defaultValue;
        }
    }
    unlock_();
    return v;
}



// ======================================================
// Writes (auto-open RW, key removed first to guarantee type)
// ======================================================
void NVS::PutBool(const char* key, bool value) {
    esp_task_wdt_reset();
    lock_();
    ensureOpenRW_();
    if (preferences.isKey(key)) preferences.remove(key);
    preferences.putBool(key, value);
    unlock_();
}

void NVS::PutInt(const char* key, int value) {
    esp_task_wdt_reset();
    lock_();
    ensureOpenRW_();
    if (preferences.isKey(key)) preferences.remove(key);
    preferences.putInt(key, value);
    unlock_();
}

void NVS::PutFloat(const char* key, float value) {
    esp_task_wdt_reset();
    lock_();
    ensureOpenRW_();
    if (preferences.isKey(key)) preferences.remove(key);
    preferences.putFloat(key, value);
    unlock_();
}

void NVS::PutDouble(const char* key, double value) {
    esp_task_wdt_reset();
    lock_();
    ensureOpenRW_();
    if (preferences.isKey(key)) preferences.remove(key);
    preferences.putBytes(key, &value, sizeof(value));
    unlock_();
}

void NVS::PutString(const char* key, const String& value) {
    esp_task_wdt_reset();
    lock_();
    ensureOpenRW_();
    if (preferences.isKey(key)) preferences.remove(key);
    preferences.putString(key, value);
    unlock_();
}


void NVS::RestartSysDelay(unsigned long delayTime) {
    DEBUGGSTART();
    DEBUG_PRINTLN("###########################################################");
    DEBUG_PRINTF("#           Restarting the Device in: %lu Sec               #\n",
                 delayTime / 1000UL);
    DEBUG_PRINTLN("###########################################################");
    DEBUGGSTOP();

    const unsigned long interval = delayTime / 30;
    for (int i = 0; i < 30; i++) {
        sleepMs_(interval);
        esp_task_wdt_reset();
    }
    DEBUG_PRINTLN("[NVS] Restarting now...");
    sleepMs_(50);
    ESP.restart();
}
