#pragma once

#include <cstdint>

// Lightweight abstraction to allow host builds to compile while enabling
// hardware watchdog wiring on MCU targets (ESP-IDF task WDT).
// timeout_ms of 0 lets the platform choose a default.
void watchdog_init(uint32_t timeout_ms);
void watchdog_register_task(const char* name);
void watchdog_feed(const char* name);

// Host builds keep a record of strokes so tests can check the discipline.
uint32_t watchdog_feed_count();

// Milliseconds since boot. Wraps after ~49 days; compare with subtraction.
uint32_t uptime_ms();
