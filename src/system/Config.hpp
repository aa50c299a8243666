/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <Arduino.h>
#include <ConfigNVS.hpp>

// ==================================================
// Half-bridge PWM (MCPWM, complementary A/B)
// ==================================================

#define PWM_HS_PIN                     1                    // Gate A (high side)
#define PWM_LS_PIN                     2                    // Gate B (low side)
#define PWM_MCPWM_UNIT                 MCPWM_UNIT_0
#define PWM_MCPWM_TIMER                MCPWM_TIMER_0
#define PWM_DUTY_PERCENT               50.0f                // symmetric bridge

// ==================================================
// Gate driver, solenoid and interlock
// ==================================================

#define HS_ENABLE_PIN                  5                    // gate driver enable, high side
#define LS_ENABLE_PIN                  9                    // gate driver enable, low side
#define SOLENOID_PIN                   10                   // cooling solenoid valve
#define INTERLOCK_LOOP_OUT_PIN         15                   // drives the interlock loop high

#define INTERLOCK_IN_PIN               16                   // low = loop open
#define GATE_FAULT_IN_PIN              17                   // low = driver fault
#define GATE_READY_IN_PIN              18                   // low = driver not ready
#define RUN_BUTTON_PIN                 21                   // low = pressed

// ==================================================
// Analog front end / sensors
// ==================================================

#define VDC_ADC_PIN                    3                    // DC bus divider (ADC1)
#define COIL_CURRENT_ADC_PIN           4                    // coil current sensor (ADC1)
#define MODULE_TEMP_PWM_PIN            11                   // SiC module duty-encoded NTC

#define I2C_SDA_PIN                    8
#define I2C_SCL_PIN                    7
#define I2C_CLOCK_HZ                   100000

#define ADS7828_I2C_ADDR               0x48
#define MLX90614_I2C_ADDR              0x5A

// ==================================================
//  RTOS CONFIGURATION: Task Priorities
// ==================================================
#define SAFETY_TASK_PRIORITY              5
#define CONTROL_TASK_PRIORITY             4
#define POWER_SAMPLER_TASK_PRIORITY       3
#define MODULE_TEMP_TASK_PRIORITY         2
#define BOARD_TEMP_TASK_PRIORITY          2
#define OBJECT_TEMP_TASK_PRIORITY         2
#define DEBUG_TASK_PRIORITY               1

// ==================================================
//  RTOS CONFIGURATION: Core Assignments
// ==================================================
#define SAFETY_TASK_CORE                  APP_CPU_NUM
#define CONTROL_TASK_CORE                 APP_CPU_NUM
#define POWER_SAMPLER_TASK_CORE           PRO_CPU_NUM
#define MODULE_TEMP_TASK_CORE             PRO_CPU_NUM
#define BOARD_TEMP_TASK_CORE              PRO_CPU_NUM
#define OBJECT_TEMP_TASK_CORE             PRO_CPU_NUM

// ==================================================
//  RTOS CONFIGURATION: Stack Sizes (in words = 4 bytes)
// ==================================================
#define SAFETY_TASK_STACK_SIZE            4096
#define CONTROL_TASK_STACK_SIZE           4096
#define POWER_SAMPLER_TASK_STACK_SIZE     4096
#define MODULE_TEMP_TASK_STACK_SIZE       3072
#define BOARD_TEMP_TASK_STACK_SIZE        3072
#define OBJECT_TEMP_TASK_STACK_SIZE       3072
#define DEBUG_TASK_STACK_SIZE             3072

// ==================================================
//  RTOS CONFIGURATION: Task Delay Intervals & Timing (ms)
// ==================================================
#define SAFETY_POLL_MS                    25
#define CONTROL_TASK_PERIOD_MS            CONTROL_PERIOD_MS
#define BOARD_TEMP_PERIOD_MS              50
#define OBJECT_TEMP_PERIOD_MS             100
#define MODULE_TEMP_GAP_MS                50      // pause after each duty batch
#define MODULE_CAPTURE_TIMEOUT_MS         500     // no edges: sensor missing
#define POWER_SAMPLER_BATCH_PAIRS         64      // pairs read between yields
#define POWER_LOG_PERIOD_MS               1000
#define MODULE_EDGE_QUEUE_DEPTH           32

#endif // CONFIG_HPP
