#include <SharedState.hpp>

SharedState* SharedState::s_instance = nullptr;

SharedState::SharedState(float powerLimitKw)
    : StateStore<RtosLock>(powerLimitKw)
{
}

void SharedState::Init(float powerLimitKw) {
    if (!s_instance) {
        s_instance = new SharedState(powerLimitKw);
    }
}

SharedState* SharedState::Get() {
    if (!s_instance) {
        s_instance = new SharedState(DEFAULT_POWER_LIMIT_KW);
    }
    return s_instance;
}
