/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef FAULT_EVALUATOR_HPP
#define FAULT_EVALUATOR_HPP

#include <stddef.h>
#include <StateTypes.hpp>
#include <StateStore.hpp>

// Digital safety inputs, already decoded from their active-low pins.
struct SafetyInputs {
    bool interlockOpen     = false;
    bool gateDriverFault   = false;
    bool gateDriverNotReady = false;
};

enum class FaultTransition : uint8_t {
    Unchanged,
    Detected,   // None -> X
    Cleared,    // X -> None
    Changed     // X -> Y
};

FaultTransition classifyFaultTransition(FaultCode stored, FaultCode evaluated);

// One safety poll as seen by the caller (for logging).
struct FaultPollResult {
    Measurements    meas;
    FaultCode       stored     = FaultCode::None;
    FaultCode       evaluated  = FaultCode::None;
    FaultTransition transition = FaultTransition::Unchanged;
    bool            written    = false;
};

/*
 * FaultEvaluator
 *
 * Ordered table of predicate -> code rows, evaluated top to bottom, first
 * match wins. Order: digital safety > sensor integrity > thermal > electrical.
 * Power and current rows only apply once the RMS window produced a result.
 */
class FaultEvaluator {
public:
    explicit FaultEvaluator(const MachineLimits& limits = MachineLimits());

    FaultCode evaluate(const SafetyInputs& in, const Measurements& m) const;

    // Snapshot measurements, evaluate, and rewrite the fault record only when
    // the evaluated code differs from the stored one. A resolved condition
    // clears itself; a cleared but still present one is written back.
    template <typename Lock>
    FaultPollResult poll(const SafetyInputs& in, StateStore<Lock>& store) const {
        FaultPollResult r;
        r.meas       = store.measurements.snapshot();
        r.evaluated  = evaluate(in, r.meas);
        r.stored     = store.currentFault();
        r.transition = classifyFaultTransition(r.stored, r.evaluated);
        if (r.transition != FaultTransition::Unchanged) {
            FaultState fs;
            fs.code = r.evaluated;
            store.fault.replace(fs);
            r.written = true;
        }
        return r;
    }

    void setLimits(const MachineLimits& limits) { _limits = limits; }
    const MachineLimits& limits() const { return _limits; }

    struct Rule {
        FaultCode code;
        bool (*tripped)(const SafetyInputs&, const Measurements&, const MachineLimits&);
    };

    static const Rule*  rules();
    static size_t       ruleCount();

private:
    MachineLimits _limits;
};

/*
 * SafetyWatchdog
 *
 * Rate-limited observability: due() returns true at most once per interval
 * while a fault is active, any temperature is inside the warning band below
 * its limit, or power runs above the warning ratio of its cap.
 */
class SafetyWatchdog {
public:
    explicit SafetyWatchdog(uint32_t intervalMs = SAFETY_WATCHDOG_LOG_MS);

    static bool nearLimits(FaultCode active, const Measurements& m, const MachineLimits& lim);

    bool due(uint32_t nowMs, FaultCode active, const Measurements& m, const MachineLimits& lim);

private:
    uint32_t _intervalMs;
    uint32_t _lastLogMs  = 0;
    bool     _everLogged = false;
};

#endif // FAULT_EVALUATOR_HPP
