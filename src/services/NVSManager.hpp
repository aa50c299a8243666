/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef NVS_MANAGER_HPP
#define NVS_MANAGER_HPP

#include <Preferences.h>
#include <esp_task_wdt.h>
#include <Utils.hpp>

/*
 * NVS
 *
 * Preferences wrapper holding the controller tunables (limits, PI gains,
 * sensor calibration). Lazily opened RO/RW behind a recursive mutex.
 *
 * Usage at startup:
 *     NVS::Init();
 *     CONF->begin();
 */
class NVS {
public:
    static void Init();
    static NVS* Get();

    void begin();
    void end();

    bool getResetFlag();
    void initializeDefaults();
    void ensureMissingDefaults();

    int      GetInt   (const char* key, int defaultValue);
    float    GetFloat (const char* key, float defaultValue);
    double   GetDouble(const char* key, double defaultValue);

    void PutBool  (const char* key, bool value);
    void PutInt   (const char* key, int value);
    void PutFloat (const char* key, float value);
    void PutDouble(const char* key, double value);
    void PutString(const char* key, const String& value);

    void RestartSysDelay(unsigned long delayTime);

private:
    NVS();
    ~NVS();
    NVS(const NVS&) = delete;
    NVS& operator=(const NVS&) = delete;

    void initializeVariables();

    void ensureOpenRO_();
    void ensureOpenRW_();
    inline void lock_();
    inline void unlock_();
    inline void sleepMs_(uint32_t ms);

    static NVS* s_instance;

    Preferences       preferences;
    const char*       namespaceName;
    SemaphoreHandle_t mutex_   = nullptr;
    bool              is_open_ = false;
    bool              open_rw_ = false;
};

#define CONF NVS::Get()

#endif // NVS_MANAGER_HPP
