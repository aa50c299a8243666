#include <RmsWindow.hpp>

RmsWindow::RmsWindow(uint32_t pairsPerWindow)
    : _pairsPerWindow(pairsPerWindow == 0 ? 1 : pairsPerWindow)
{
}

bool RmsWindow::addPair(float volts, float amps, Result& out) {
    if (!isfinite(volts)) volts = 0.0f;
    if (!isfinite(amps))  amps  = 0.0f;

    _sumVSq += static_cast<double>(volts) * volts;
    _sumISq += static_cast<double>(amps) * amps;
    _sumVI  += static_cast<double>(volts) * amps;
    _count++;

    if (_count < _pairsPerWindow) {
        return false;
    }

    out = finish_();
    return true;
}

size_t RmsWindow::addPairs(const float* volts, const float* amps, size_t count, Result& out) {
    if (!volts || !amps) return 0;

    size_t windows = 0;
    for (size_t k = 0; k < count; ++k) {
        if (addPair(volts[k], amps[k], out)) {
            windows++;
        }
    }
    return windows;
}

void RmsWindow::reset() {
    _count  = 0;
    _sumVSq = 0.0;
    _sumISq = 0.0;
    _sumVI  = 0.0;
}

RmsWindow::Result RmsWindow::finish_() {
    Result r;
    const double n = static_cast<double>(_count);
    r.pairs = _count;

    const double meanVSq = _sumVSq / n;
    const double meanISq = _sumISq / n;
    const double meanVI  = _sumVI / n;

    r.vRms = static_cast<float>(sqrt(meanVSq > 0.0 ? meanVSq : 0.0));
    r.iRms = static_cast<float>(sqrt(meanISq > 0.0 ? meanISq : 0.0));

    float kw = static_cast<float>(meanVI / 1000.0);
    if (!(kw > 0.0f)) kw = 0.0f;
    if (kw > MAX_COIL_POWER_KW) kw = MAX_COIL_POWER_KW;
    r.powerKw = kw;

    reset();
    return r;
}
