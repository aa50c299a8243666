#include <RunLatch.hpp>

RunLatch::RunLatch(uint32_t debounceMs)
    : _debounceMs(debounceMs)
{
}

bool RunLatch::sample(bool buttonLow, uint32_t nowMs, bool heatingMode) {
    if (buttonLow == _lastLow) {
        return false;
    }
    _lastLow = buttonLow;
    if (!buttonLow) {
        return false;   // release
    }

    if (_everPressed && (nowMs - _lastPressMs) < _debounceMs) {
        return false;
    }
    _everPressed = true;
    _lastPressMs = nowMs;

    if (!heatingMode) {
        return false;
    }
    _active = !_active;
    return true;
}

bool RunLatch::cancel() {
    const bool wasActive = _active;
    _active = false;
    return wasActive;
}
