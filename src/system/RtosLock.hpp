/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef RTOS_LOCK_HPP
#define RTOS_LOCK_HPP

#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

// FreeRTOS mutex with the lock()/unlock() shape LockedRecord expects.
class RtosLock {
public:
    RtosLock() : _mtx(xSemaphoreCreateMutex()) {}
    ~RtosLock() {
        if (_mtx) vSemaphoreDelete(_mtx);
    }

    RtosLock(const RtosLock&) = delete;
    RtosLock& operator=(const RtosLock&) = delete;

    inline bool lock() const {
        if (_mtx == nullptr) return true;
        return xSemaphoreTake(_mtx, portMAX_DELAY) == pdTRUE;
    }

    inline void unlock() const {
        if (_mtx) xSemaphoreGive(_mtx);
    }

private:
    SemaphoreHandle_t _mtx;
};

#endif // RTOS_LOCK_HPP
