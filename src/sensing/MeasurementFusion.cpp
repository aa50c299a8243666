#include <MeasurementFusion.hpp>

float smoothValue(float previous, float next, float alpha) {
    if (!isfinite(next)) return previous;
    if (!isfinite(previous) || previous == 0.0f) return next;
    return previous + alpha * (next - previous);
}

namespace Fusion {

void applyPowerWindow(Measurements& m, const RmsWindow::Result& r, float alpha) {
    m.dcVoltageV      = smoothValue(m.dcVoltageV, r.vRms, alpha);
    m.coilCurrentRmsA = smoothValue(m.coilCurrentRmsA, r.iRms, alpha);
    m.coilPowerKw     = smoothValue(m.coilPowerKw, r.powerKw, alpha);
    m.valid           = true;
}

void applyBoardTemps(Measurements& m, const CoilTempReading& coil, float pcbTempC, float alpha) {
    // A broken coil sensor keeps the last good temperature.
    m.coilTempDisconnected = coil.disconnected;
    if (!coil.disconnected && isfinite(coil.tempC)) {
        m.coilTempC = smoothValue(m.coilTempC, coil.tempC, alpha);
    }
    if (isfinite(pcbTempC)) {
        m.pcbTempC = smoothValue(m.pcbTempC, pcbTempC, alpha);
    }
}

void applyObjectTemp(Measurements& m, float tempC, float alpha) {
    if (!isfinite(tempC)) return;
    m.objectTempC = smoothValue(m.objectTempC, tempC, alpha);
}

void applyModuleTemp(Measurements& m, float tempC, float alpha) {
    if (!isfinite(tempC)) return;
    m.moduleTempC = smoothValue(m.moduleTempC, tempC, alpha);
}

} // namespace Fusion
