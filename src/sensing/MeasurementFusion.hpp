/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef MEASUREMENT_FUSION_HPP
#define MEASUREMENT_FUSION_HPP

#include <StateTypes.hpp>
#include <SensorConversions.hpp>
#include <RmsWindow.hpp>

// Exponential smoothing. A zero or non-finite previous value means "no
// history yet" and the new value is adopted as is.
float smoothValue(float previous, float next, float alpha = DEFAULT_SMOOTH_ALPHA);

/*
 * Each sensor task owns a disjoint set of Measurements fields and only
 * writes those through its apply* function:
 *
 *   applyPowerWindow  : dcVoltageV, coilCurrentRmsA, coilPowerKw, valid
 *   applyBoardTemps   : coilTempC, coilTempDisconnected, pcbTempC
 *   applyObjectTemp   : objectTempC
 *   applyModuleTemp   : moduleTempC
 */
namespace Fusion {

void applyPowerWindow(Measurements& m, const RmsWindow::Result& r, float alpha);
void applyBoardTemps(Measurements& m, const CoilTempReading& coil, float pcbTempC, float alpha);
void applyObjectTemp(Measurements& m, float tempC, float alpha);
void applyModuleTemp(Measurements& m, float tempC, float alpha);

} // namespace Fusion

#endif // MEASUREMENT_FUSION_HPP
