/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef SHARED_STATE_HPP
#define SHARED_STATE_HPP

#include <StateStore.hpp>
#include <RtosLock.hpp>

// Process-wide store. Created once in setup() and never destroyed.
class SharedState : public StateStore<RtosLock> {
public:
    static void         Init(float powerLimitKw);
    static SharedState* Get();

private:
    explicit SharedState(float powerLimitKw);

    static SharedState* s_instance;
};

#define STATE SharedState::Get()

#endif // SHARED_STATE_HPP
