/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef STATE_STORE_HPP
#define STATE_STORE_HPP

#include <StateTypes.hpp>
#include <LockedRecord.hpp>

/*
 * StateStore<Lock>
 *
 * The four shared records, each behind its own lock, plus the menu-side
 * setting operations. Writers:
 *
 *   measurements : sensor tasks (each through its own Fusion::apply*)
 *   settings     : menu layer
 *   status       : control task
 *   fault        : safety task, clearFault() from the menu layer
 */
template <typename Lock>
class StateStore {
public:
    explicit StateStore(float powerLimitKw = DEFAULT_POWER_LIMIT_KW)
        : _powerLimitKw(powerLimitKw) {}

    LockedRecord<Measurements,    Lock> measurements;
    LockedRecord<ControlSettings, Lock> settings;
    LockedRecord<ControlStatus,   Lock> status;
    LockedRecord<FaultState,      Lock> fault;

    // ---------------- Menu layer ----------------

    void setMode(ControlMode mode) {
        settings.update([mode](ControlSettings& s) { s.mode = mode; });
    }

    void setManualPowerKw(float kw) {
        const float v = clampManualPowerKw(kw, _powerLimitKw);
        settings.update([v](ControlSettings& s) { s.manualPowerKw = v; });
    }

    void setTargetTempC(float tempC) {
        const float v = clampTargetTempC(tempC);
        settings.update([v](ControlSettings& s) { s.targetTempC = v; });
    }

    void stepManualPower(int direction) {
        const float limit = _powerLimitKw;
        settings.update([direction, limit](ControlSettings& s) {
            s.manualPowerKw = stepManualPowerKw(s.manualPowerKw, direction, limit);
        });
    }

    void stepTargetTemp(int direction) {
        settings.update([direction](ControlSettings& s) {
            s.targetTempC = stepTargetTempC(s.targetTempC, direction);
        });
    }

    // Re-asserted by the safety task on its next poll if the cause persists.
    void clearFault() {
        fault.replace(FaultState());
    }

    FaultCode currentFault() const {
        return fault.snapshot().code;
    }

    float powerLimitKw() const { return _powerLimitKw; }

private:
    float _powerLimitKw;
};

#endif // STATE_STORE_HPP
