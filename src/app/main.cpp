#include <Arduino.h>
#include <Wire.h>
#include <Config.hpp>

// **************************************************************
//                       Module Includes
// **************************************************************
#include <Utils.hpp>
#include <NVSManager.hpp>
#include <ControlTuning.hpp>
#include <SharedState.hpp>
#include <McpwmPowerStage.hpp>
#include <Ads7828.hpp>
#include <Mlx90614.hpp>
#include <PowerSampler.hpp>
#include <BoardTempSampler.hpp>
#include <ObjectTempSampler.hpp>
#include <ModuleTempSampler.hpp>
#include <SafetyMonitor.hpp>
#include <ControlLoop.hpp>

// **************************************************************
//                   Global Object Pointers
// **************************************************************

// Shared by both I2C devices (ADS7828 + MLX90614 on one bus)
RtosLock i2cBusLock;

McpwmPowerStage    powerStage;
Ads7828*           boardAdc     = nullptr;
Mlx90614*          irSensor     = nullptr;
BoardTempSampler*  boardTemps   = nullptr;
ObjectTempSampler* objectTemp   = nullptr;
ControlLoop*       controlLoop  = nullptr;

static void haltForever_(const char* why) {
  DEBUG_PRINTF("[FATAL] %s\n", why);
  powerStage.disable();
  powerStage.setEnableLines(false, false);
  while (true) {
    delay(500);
  }
}

// **************************************************************
//                           setup()
// **************************************************************
void setup() {
  // --------------------------------------------------
  // 1) Debug / Diagnostics FIRST
  // --------------------------------------------------
  Debug::begin(SERIAL_BAUD_RATE);
  DEBUG_PRINTLN();
  DEBUG_PRINTLN("==================================================");
  DEBUG_PRINTF("[Setup] Shrink-fit induction heater boot (SW %s / HW %s)\n",
               DEVICE_SW_VERSION, DEVICE_HW_VERSION);
  DEBUG_PRINTLN("==================================================");

  // --------------------------------------------------
  // 2) Force the power stage into a SAFE/OFF state
  //    Nothing may energize the coil during boot.
  // --------------------------------------------------
  powerStage.begin();

  // --------------------------------------------------
  // 3) Persistent storage + tunables
  // --------------------------------------------------
  NVS::Init();
  CONF->begin();
  ControlTuning::Init();
  TUNING->begin();
  DEBUG_PRINTLN("[Setup] NVS + tuning loaded.");

  // --------------------------------------------------
  // 4) Close the interlock loop (read back by the safety monitor)
  // --------------------------------------------------
  pinMode(INTERLOCK_LOOP_OUT_PIN, OUTPUT);
  digitalWrite(INTERLOCK_LOOP_OUT_PIN, HIGH);

  // --------------------------------------------------
  // 5) Shared records (defaults: ManualPower, 5 kW, 120 C)
  // --------------------------------------------------
  SharedState::Init(TUNING->limits().powerLimitKw);

  // --------------------------------------------------
  // 6) Safety first, then sensors, then control
  // --------------------------------------------------
  SafetyMonitor::Init();
  if (!SAFETY->begin(TUNING->limits())) {
    haltForever_("Safety monitor did not start");
  }

  Wire.begin(I2C_SDA_PIN, I2C_SCL_PIN, I2C_CLOCK_HZ);
  boardAdc = new Ads7828(Wire, i2cBusLock);
  irSensor = new Mlx90614(Wire, i2cBusLock);

  const SensingTuning& sensing = TUNING->sensing();

  PowerSampler::Init();
  if (!POWER_SAMPLER->begin(sensing)) {
    haltForever_("Power sampler did not start");
  }

  boardTemps = new BoardTempSampler(*boardAdc, sensing);
  if (!boardTemps->begin()) {
    haltForever_("Board temperature task did not start");
  }

  objectTemp = new ObjectTempSampler(*irSensor, sensing.smoothAlpha);
  if (!objectTemp->begin()) {
    haltForever_("Object temperature task did not start");
  }

  ModuleTempSampler::Init();
  if (!ModuleTempSampler::Get()->begin(sensing.module, sensing.smoothAlpha)) {
    haltForever_("Module temperature capture did not start");
  }

  controlLoop = new ControlLoop(powerStage, TUNING->control());
  if (!controlLoop->begin()) {
    haltForever_("Control loop did not start");
  }

  DEBUG_PRINTLN("[Setup] All tasks running.");
}

// **************************************************************
//                            loop()
// **************************************************************
void loop() {
  // Everything runs in FreeRTOS tasks.
  vTaskDelay(pdMS_TO_TICKS(1000));
}
