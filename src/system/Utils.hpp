/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/

#ifndef UTILS_HPP
#define UTILS_HPP

/**
 * @file Utils.hpp
 * @brief Thread-safe debug printing for the controller tasks.
 *
 * Provides:
 *  - Non-blocking debug output: callers format into a fixed line and push it
 *    by value to a queue drained by a low-priority print task.
 *  - Atomic "grouped" printing (Debug::groupStart/Stop/Cancel) for banners.
 *  - A drop-oldest policy: the 10 ms control task never waits on Serial.
 */

#include <Config.hpp>

// ===================== Global debug switch =====================

#ifndef DEBUGMODE
#define DEBUGMODE true          ///< Compile-time enable/disable debug output
#endif

#ifndef SERIAL_BAUD_RATE
#define SERIAL_BAUD_RATE 921600 ///< Default Serial baud rate for Debug::begin()
#endif

// ===================== Thread-safe debug API =====================

namespace Debug {
    // Initialization (auto-called on first print)
    void begin(unsigned long baud = SERIAL_BAUD_RATE);

    void print(const char* s);
    void println(const char* s);
    void println();

    // printf-style, one queued line per call
    void printf(const char* fmt, ...);

    // Number of lines dropped because the queue was full.
    uint32_t droppedLines();

    // ===== Grouped printing (atomic burst) =====

    /**
     * @brief Start a grouped print section owned by the calling task.
     *
     * Prints from the owner are appended to a static buffer until
     * groupStop/Cancel; other tasks block on the group gate meanwhile.
     */
    void groupStart();

    /**
     * @brief Flush grouped content as a contiguous burst and release ownership.
     */
    void groupStop(bool addTrailingNewline = false);

    void groupCancel();
}

// ===================== Debug macros =====================

#if DEBUGMODE

    #define DEBUG_PRINT(...)      Debug::print(__VA_ARGS__)
    #define DEBUG_PRINTLN(...)    Debug::println(__VA_ARGS__)
    #define DEBUG_PRINTF(...)     Debug::printf(__VA_ARGS__)

    #ifndef DEBUGGSTART
    #define DEBUGGSTART()         Debug::groupStart()
    #endif

    #ifndef DEBUGGSTOP
    #define DEBUGGSTOP()          Debug::groupStop(false)
    #endif

#else

    #define DEBUG_PRINT(...)      do {} while (0)
    #define DEBUG_PRINTLN(...)    do {} while (0)
    #define DEBUG_PRINTF(...)     do {} while (0)
    #define DEBUGGSTART()         do {} while (0)
    #define DEBUGGSTOP()          do {} while (0)

#endif // DEBUGMODE

#endif // UTILS_HPP
