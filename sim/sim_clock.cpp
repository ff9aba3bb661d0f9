#include "sim_api.h"

#include <memory>

#include "host_time.h"
#include "logger.h"

namespace sim {

struct Runtime {
  uint64_t t_ms = 0;
  uint64_t delay_calls = 0;
  std::unique_ptr<TraceLogger> logger;
};

static Runtime &rt() {
  // Function-local static so the trace file is flushed at program exit.
  static Runtime r;
  return r;
}

uint64_t now_ms() { return rt().t_ms; }

void advance_ms(uint64_t ms) { rt().t_ms += ms; }

void reset_clock() {
  Runtime &r = rt();
  r.t_ms = 0;
  r.delay_calls = 0;
  r.logger.reset();
}

uint64_t delay_calls() { return rt().delay_calls; }

void set_log_path(const char *path) {
  Runtime &r = rt();
  if (!path || !path[0]) {
    r.logger.reset();
    return;
  }
  r.logger = std::make_unique<TraceLogger>(path);
}

TraceLogger *trace_logger() { return rt().logger.get(); }

void log_step(const char *name) {
  Runtime &r = rt();
  if (!name || !name[0] || !r.logger) return;
  r.logger->log_event(r.t_ms, name);
}

} // namespace sim

// ===== host_time implementation on simulated time =====

namespace host_time {

uint32_t millis() { return (uint32_t)sim::rt().t_ms; }

void delay(uint32_t ms) {
  sim::Runtime &r = sim::rt();
  r.delay_calls++;
  r.t_ms += ms;
}

} // namespace host_time
