/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/

#include <Utils.hpp>
#include <stdarg.h>
#include <string.h>

// ===================== Internal config =====================

// Max characters per queued line (excluding trailing newline).
#ifndef DBG_LINE_MAX
#define DBG_LINE_MAX        160
#endif

// Queue depth in lines. Lines are copied by value.
#ifndef DBG_QUEUE_DEPTH
#define DBG_QUEUE_DEPTH     48
#endif

// Max bytes for a single grouped burst.
#ifndef DBG_GROUP_MAX
#define DBG_GROUP_MAX       1024
#endif

static_assert(DBG_LINE_MAX >= 32,        "DBG_LINE_MAX too small");
static_assert(DBG_GROUP_MAX >= DBG_LINE_MAX,
              "DBG_GROUP_MAX must be >= DBG_LINE_MAX");

// ===================== Debug implementation =====================

namespace {

struct DebugLine {
    uint16_t len;
    bool     addNewline;
    char     text[DBG_LINE_MAX];
};

QueueHandle_t     s_dbgQ        = nullptr; // Queue of DebugLine (by value)
TaskHandle_t      s_dbgTask     = nullptr; // Background writer task
bool              s_started     = false;
volatile uint32_t s_dropped     = 0;

// Grouping (atomic bursts)
SemaphoreHandle_t s_groupGate   = nullptr; // Recursive gate protecting group state
TaskHandle_t      s_groupOwner  = nullptr;
bool              s_groupActive = false;

static char   s_groupBuf[DBG_GROUP_MAX];
static size_t s_groupLen = 0;

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------

void printTask_(void*) {
    DebugLine line;
    for (;;) {
        if (xQueueReceive(s_dbgQ, &line, portMAX_DELAY) != pdTRUE) {
            continue;
        }
        Serial.write(reinterpret_cast<const uint8_t*>(line.text), line.len);
        if (line.addNewline) {
            Serial.write(reinterpret_cast<const uint8_t*>("\n"), 1);
        }
    }
}

// Enqueue by value; if full, drop oldest (never block writers).
void enqueueLine_(const char* s, size_t n, bool nl) {
    if (!s_dbgQ) return;

    DebugLine line;
    if (n > DBG_LINE_MAX) n = DBG_LINE_MAX;
    line.len        = static_cast<uint16_t>(n);
    line.addNewline = nl;
    if (n) memcpy(line.text, s, n);

    if (xQueueSend(s_dbgQ, &line, 0) == pdTRUE) {
        return;
    }

    DebugLine old;
    if (xQueueReceive(s_dbgQ, &old, 0) == pdTRUE) {
        s_dropped = s_dropped + 1;
        if (xQueueSend(s_dbgQ, &line, 0) == pdTRUE) {
            return;
        }
    }
    s_dropped = s_dropped + 1;
}

void ensureDebugStart_(unsigned long baud = SERIAL_BAUD_RATE) {
    if (s_started) return;

    if (!s_groupGate) {
        s_groupGate = xSemaphoreCreateRecursiveMutex();
    }
    if (!s_dbgQ) {
        s_dbgQ = xQueueCreate(DBG_QUEUE_DEPTH, sizeof(DebugLine));
    }
    if (!Serial) {
        Serial.begin(baud);
    }
    if (!s_dbgTask && s_dbgQ) {
        xTaskCreatePinnedToCore(
            printTask_,
            "DebugPrintTask",
            DEBUG_TASK_STACK_SIZE,
            nullptr,
            DEBUG_TASK_PRIORITY,
            &s_dbgTask,
            tskNO_AFFINITY
        );
    }

    s_started = true;
}

inline void gateTake_() {
    if (s_groupGate) xSemaphoreTakeRecursive(s_groupGate, portMAX_DELAY);
}

inline void gateGive_() {
    if (s_groupGate) xSemaphoreGiveRecursive(s_groupGate);
}

// Flush group buffer to queue in line-sized chunks.
void flushGroup_(bool addTrailingNewline) {
    size_t offset = 0;
    while (offset < s_groupLen) {
        size_t slice = s_groupLen - offset;
        if (slice > DBG_LINE_MAX) slice = DBG_LINE_MAX;
        enqueueLine_(s_groupBuf + offset, slice, false);
        offset += slice;
    }
    if (addTrailingNewline) {
        enqueueLine_("", 0, true);
    }
    s_groupLen = 0;
}

void groupAppend_(const char* data, size_t n, bool nl) {
    while (n > 0) {
        size_t space = DBG_GROUP_MAX - s_groupLen;
        if (space == 0) {
            flushGroup_(false);
            space = DBG_GROUP_MAX;
        }
        const size_t chunk = (n < space) ? n : space;
        memcpy(s_groupBuf + s_groupLen, data, chunk);
        s_groupLen += chunk;
        data       += chunk;
        n          -= chunk;
    }
    if (nl) {
        if (s_groupLen >= DBG_GROUP_MAX) flushGroup_(false);
        s_groupBuf[s_groupLen++] = '\n';
    }
}

inline bool iOwnGroup_() {
    return s_groupActive && (xTaskGetCurrentTaskHandle() == s_groupOwner);
}

void emit_(const char* s, bool nl) {
    ensureDebugStart_();
    if (!s) s = "";
    const size_t n = strnlen(s, DBG_LINE_MAX);

    gateTake_();
    if (iOwnGroup_()) {
        groupAppend_(s, n, nl);
    } else {
        enqueueLine_(s, n, nl);
    }
    gateGive_();
}

} // namespace (internal)


// ===================== Public Debug namespace =====================

namespace Debug {

void begin(unsigned long baud) {
    ensureDebugStart_(baud);
}

void print(const char* s)   { emit_(s, false); }
void println(const char* s) { emit_(s, true); }
void println()              { emit_("", true); }

void printf(const char* fmt, ...) {
    char buf[DBG_LINE_MAX + 1];
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(buf, sizeof(buf), fmt ? fmt : "", ap);
    va_end(ap);
    emit_(buf, false);
}

uint32_t droppedLines() {
    return s_dropped;
}

void groupStart() {
    ensureDebugStart_();
    gateTake_();
    s_groupOwner  = xTaskGetCurrentTaskHandle();
    s_groupActive = true;
    s_groupLen    = 0;
}

void groupStop(bool addTrailingNewline) {
    ensureDebugStart_();
    flushGroup_(addTrailingNewline);
    s_groupActive = false;
    s_groupOwner  = nullptr;
    gateGive_();
}

void groupCancel() {
    ensureDebugStart_();
    s_groupActive = false;
    s_groupOwner  = nullptr;
    s_groupLen    = 0;
    gateGive_();
}

} // namespace Debug
