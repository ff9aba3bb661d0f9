#pragma once

#include <cstdint>

namespace sim {

class TraceLogger;

// Simulated clock behind host_time::millis()/delay() (see sim_clock.cpp).
// delay() advances this clock instead of sleeping.
uint64_t now_ms();
void advance_ms(uint64_t ms);

// Back to t=0 and drop the trace log. Tests call this between cases.
void reset_clock();

// Number of host_time::delay() calls since reset_clock().
uint64_t delay_calls();

// Open a CSV trace for the current simulation executable. Device models log
// every register access into it. Pass nullptr to stop tracing.
void set_log_path(const char *path);

// Current trace sink, or nullptr when tracing is off.
TraceLogger *trace_logger();

// Log a point-event into the trace at the current simulated time.
// Intended for high-level step markers, e.g. "STEP_UNLOCK_BEGIN".
void log_step(const char *name);

} // namespace sim
