/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef CONFIG_NVS_HPP
#define CONFIG_NVS_HPP

#include <math.h>

#define CONFIG_PARTITION               "config"    // NVS partition name

// ==================================================
// Device Configuration Keys & Defaults for Preferences
// ==================================================

#define RESET_FLAG                     "RTFLG"     // Preferences reset flag
#define DEV_SW_KEY                     "DEVSW"     // Firmware version string
#define DEV_HW_KEY                     "DEVHW"     // Hardware revision string

#define DEVICE_SW_VERSION              "1.2.0"
#define DEVICE_HW_VERSION              "SF-IND-B"

// ---------- Machine limits ----------
#define POWER_LIMIT_KEY                "PWRLIM"    // float: coil power cap [kW]
#define CURR_LIMIT_KEY                 "CURRLT"    // float: coil current trip [A rms]
#define COIL_TEMP_LIMIT_KEY            "COILLT"    // float: coil over-temp trip [C]
#define MODULE_TEMP_LIMIT_KEY          "MODLT"     // float: SiC module over-temp trip [C]
#define PCB_TEMP_LIMIT_KEY             "PCBLT"     // float: PCB over-temp trip [C]

#define DEFAULT_POWER_LIMIT_KW         10.0f
#define DEFAULT_CURRENT_LIMIT_A        150.0f
#define DEFAULT_COIL_TEMP_LIMIT_C      80.0f
#define DEFAULT_MODULE_TEMP_LIMIT_C    35.0f
#define DEFAULT_PCB_TEMP_LIMIT_C       85.0f

// ---------- Safety monitor ----------
#define POWER_OVERSHOOT_MARGIN         1.05f       // trip at limit * margin
#define SAFETY_WARN_MARGIN_C           5.0f        // early-warning band below temp limits
#define SAFETY_WARN_POWER_RATIO        0.90f       // early-warning power ratio
#define SAFETY_WATCHDOG_LOG_MS         2000        // bounded watchdog log rate

// ---------- Menu settings ----------
#define DEFAULT_MANUAL_POWER_KW        5.0f
#define DEFAULT_TARGET_TEMP_C          120.0f
#define MANUAL_STEP_KW                 0.5f
#define TARGET_STEP_C                  5.0f
#define TARGET_TEMP_MIN_C              40.0f
#define TARGET_TEMP_MAX_C              350.0f

// ---------- Power (frequency) PI ----------
#define POWER_KP_KEY                   "PWRKP"     // double: Hz per kW
#define POWER_KI_KEY                   "PWRKI"     // double: Hz per kW*s
#define POWER_I_LIMIT_KEY              "PWRIL"     // float: integrator bound [Hz]
#define BASE_FREQ_KEY                  "FBASE"     // float: reset frequency [Hz]
#define MIN_FREQ_KEY                   "FMIN"      // float: lowest switching frequency [Hz]
#define MAX_FREQ_KEY                   "FMAX"      // float: highest switching frequency [Hz]
#define DEADTIME_NS_KEY                "DTNS"      // int: bridge deadtime [ns]

#define DEFAULT_POWER_KP               60.0
#define DEFAULT_POWER_KI               8.0
#define DEFAULT_POWER_I_LIMIT_HZ       2000.0f
#define DEFAULT_BASE_FREQ_HZ           29700.0f
#define DEFAULT_MIN_FREQ_HZ            26000.0f
#define DEFAULT_MAX_FREQ_HZ            32000.0f
#define DEFAULT_DEADTIME_NS            512

// ---------- Temperature PI ----------
#define TEMP_KP_KEY                    "TMPKP"     // double: kW per C
#define TEMP_KI_KEY                    "TMPKI"     // double: kW per C*s
#define TEMP_TOLERANCE_KEY             "TMPTOL"    // float: target-reached band [C]

#define DEFAULT_TEMP_KP                0.08
#define DEFAULT_TEMP_KI                0.03
#define DEFAULT_TEMP_TOLERANCE_C       2.0f
#define TEMP_ERROR_FLOOR_C             -20.0f

// ---------- Run button ----------
#define RUN_DEBOUNCE_KEY               "RUNDB"     // int: min time between toggles [ms]
#define DEFAULT_RUN_DEBOUNCE_MS        80
#define CONTROL_PERIOD_MS              10          // control tick, also the PI dt

// ---------- Smoothing / RMS window ----------
#define SMOOTH_ALPHA_KEY               "SMALP"     // float: EMA factor
#define RMS_WINDOW_KEY                 "RMSWIN"    // int: pairs per RMS window

#define DEFAULT_SMOOTH_ALPHA           0.2f
#define DEFAULT_RMS_WINDOW_PAIRS       1024

// ---------- Bus voltage / coil current front-end ----------
#define PWR_ADC_REF_V                  3.3f
#define PWR_ADC_MAX                    4095.0f
#define VDC_GAIN_KEY                   "VDCGN"     // float: ADC volts per bus volt
#define CURR_CENTER_KEY                "ICTR"      // float: sensor zero [V]
#define CURR_SENS_KEY                  "ISENS"     // float: sensor scale [A/V]

#define DEFAULT_VDC_GAIN               0.0018615088f
#define DEFAULT_CURRENT_CENTER_V       1.25f
#define DEFAULT_CURRENT_A_PER_V        1280.0f     // 0.625 V -> 800 A
#define MAX_BUS_VOLTAGE_V              1000.0f
#define MAX_COIL_CURRENT_A             900.0f
#define MAX_COIL_POWER_KW              20.0f

// ---------- Board ADC (ADS7828) ----------
#define BOARD_ADC_REF_V                5.0f
#define BOARD_ADC_MAX                  4095.0f
#define COIL_TEMP_ADC_CHANNEL          6
#define PCB_TEMP_ADC_CHANNEL           3

// ---------- Coil NTC (pull-up divider) ----------
#define COIL_NTC_BETA_KEY              "CNTCBT"    // float: coil NTC beta
#define COIL_NTC_R0_KEY                "CNTCR0"    // float: coil NTC R0 [ohms]
#define COIL_NTC_SERIES_KEY            "CNTCRS"    // float: divider series resistor [ohms]

#define DEFAULT_COIL_NTC_BETA          3950.0f
#define DEFAULT_COIL_NTC_R0_OHMS       10000.0f
#define DEFAULT_COIL_NTC_T0_C          25.0f
#define DEFAULT_COIL_NTC_SERIES_OHMS   10000.0f
#define COIL_NTC_RAIL_MARGIN_V         0.01f       // open/short detection band
#define COIL_TEMP_MIN_C                -40.0f
#define COIL_TEMP_MAX_C                250.0f

// ---------- PCB linear sensor ----------
#define PCB_SENSOR_OFFSET_V            0.5f
#define PCB_SENSOR_V_PER_C             0.01f
#define PCB_TEMP_MIN_C                 -40.0f
#define PCB_TEMP_MAX_C                 150.0f

// ---------- IR object sensor (MLX90614) ----------
#define IR_RAW_SCALE_K                 0.02f
#define IR_TEMP_MIN_C                  -70.0f
#define IR_TEMP_MAX_C                  380.0f

// ---------- Duty-encoded module temperature ----------
#define MOD_NTC_BETA_KEY               "MNTCBT"    // float: module NTC beta
#define MOD_NTC_R0_KEY                 "MNTCR0"    // float: module NTC R0 [ohms]
#define MOD_SERIES_KEY                 "MNTCRS"    // float: series resistance removed [ohms]
#define MOD_DUTY_SAMPLES_KEY           "MDSMP"     // int: duty samples per update

#define DEFAULT_MOD_NTC_BETA           3468.0f
#define DEFAULT_MOD_NTC_R0_OHMS        5000.0f
#define DEFAULT_MOD_NTC_T0_C           25.0f
#define DEFAULT_MOD_SERIES_OHMS        0.0f
#define DEFAULT_MOD_DUTY_SAMPLES       128
#define MOD_SENSE_CURRENT_A            0.000203f   // current source [A]
#define MOD_DUTY_MIN                   0.05f
#define MOD_DUTY_MAX                   0.95f
#define MOD_DUTY_LOW                   0.10f       // calibration point: low duty
#define MOD_DUTY_HIGH                  0.88f       // calibration point: high duty
#define MOD_V_AT_LOW_DUTY              4.5f
#define MOD_V_AT_HIGH_DUTY             0.6f
#define MOD_MIN_RESISTANCE_OHMS        10.0f
#define MODULE_TEMP_MIN_C              -40.0f
#define MODULE_TEMP_MAX_C              200.0f

#endif // CONFIG_NVS_HPP
