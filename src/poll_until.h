#pragma once

#include <cstdint>

#include "host_time.h"

// Sleep-and-recheck loop shared by every wait point.
//
// The check callback performs one read and returns:
//   Step::Done    - condition reached, stop
//   Step::Pending - not yet, sleep interval_ms and check again
//   Step::Failed  - the read itself failed (caller holds the cause), stop
//
// A Policy with timeout_ms == k_no_timeout never gives up. The NVMC READY
// waits use it on purpose: the controller has no documented worst case, so a
// controller that never reports ready blocks the run.
namespace poll_until {

static constexpr uint32_t k_no_timeout = 0xFFFFFFFFu;

enum class Step : uint8_t { Done, Pending, Failed };

enum class Outcome : uint8_t { Satisfied, TimedOut, Failed };

// When a bounded wait gives up:
//   Reached  - once elapsed >= timeout_ms (a check landing on the deadline is the last one)
//   Exceeded - only once elapsed > timeout_ms (a check landing on the deadline gets one more try)
enum class Deadline : uint8_t { Reached, Exceeded };

struct Policy {
  uint32_t interval_ms;
  uint32_t timeout_ms;
  Deadline deadline;

  bool bounded() const { return timeout_ms != k_no_timeout; }

  bool expired(uint32_t elapsed_ms) const {
    if (!bounded()) return false;
    return (deadline == Deadline::Exceeded) ? elapsed_ms > timeout_ms : elapsed_ms >= timeout_ms;
  }
};

inline Policy every(uint32_t interval_ms, uint32_t timeout_ms, Deadline deadline = Deadline::Reached) {
  Policy p;
  p.interval_ms = interval_ms;
  p.timeout_ms = timeout_ms;
  p.deadline = deadline;
  return p;
}

inline Policy every_forever(uint32_t interval_ms) { return every(interval_ms, k_no_timeout); }

inline const char *outcome_to_str(Outcome o) {
  switch (o) {
    case Outcome::Satisfied: return "satisfied";
    case Outcome::TimedOut: return "timed out";
    case Outcome::Failed: return "failed";
    default: return "(unknown)";
  }
}

// Runs check until it is Done or Failed, or until the policy's deadline has
// passed (see Deadline). The deadline is tested after a Pending check, so a
// condition that becomes true exactly at the deadline is still seen.
//
// start_ms lets the caller anchor the deadline at an earlier event (e.g. the
// moment the erase command was issued) rather than at the first check.
template <typename Check>
Outcome run_from(uint32_t start_ms, const Policy &p, Check check, uint32_t *elapsed_ms_out = nullptr) {
  for (;;) {
    const Step s = check();
    const uint32_t elapsed = (uint32_t)(host_time::millis() - start_ms);
    if (elapsed_ms_out) *elapsed_ms_out = elapsed;

    if (s == Step::Done) return Outcome::Satisfied;
    if (s == Step::Failed) return Outcome::Failed;
    if (p.expired(elapsed)) return Outcome::TimedOut;

    host_time::delay(p.interval_ms);
  }
}

template <typename Check>
Outcome run(const Policy &p, Check check, uint32_t *elapsed_ms_out = nullptr) {
  return run_from(host_time::millis(), p, check, elapsed_ms_out);
}

}  // namespace poll_until
