#include "src/poll_until.h"

#include "sim/sim_api.h"

#include <assert.h>
#include <stdio.h>

using poll_until::Outcome;
using poll_until::Step;

static void test_done_immediately() {
  sim::reset_clock();
  unsigned checks = 0;
  uint32_t elapsed = 99;
  const Outcome o = poll_until::run(poll_until::every(100, 1000), [&]() {
    checks++;
    return Step::Done;
  }, &elapsed);
  assert(o == Outcome::Satisfied);
  assert(checks == 1);
  assert(elapsed == 0);
  assert(sim::delay_calls() == 0);
}

static void test_bounded_times_out() {
  sim::reset_clock();
  unsigned checks = 0;
  const Outcome o = poll_until::run(poll_until::every(100, 500), [&]() {
    checks++;
    return Step::Pending;
  });
  assert(o == Outcome::TimedOut);
  // Checks at t = 0, 100, ..., 500; the deadline is tested after the check.
  assert(checks == 6);
  assert(sim::now_ms() == 500);
}

static void test_condition_at_deadline_is_seen() {
  sim::reset_clock();
  const Outcome o = poll_until::run(poll_until::every(100, 500), [&]() {
    return (sim::now_ms() >= 500) ? Step::Done : Step::Pending;
  });
  assert(o == Outcome::Satisfied);
}

static void test_exceeded_deadline_checks_once_more() {
  sim::reset_clock();
  unsigned checks = 0;
  const Outcome o = poll_until::run(poll_until::every(100, 500, poll_until::Deadline::Exceeded), [&]() {
    checks++;
    return Step::Pending;
  });
  assert(o == Outcome::TimedOut);
  // The check at t=500 is exactly on the deadline, so t=600 is checked too.
  assert(checks == 7);
  assert(sim::now_ms() == 600);

  const poll_until::Policy p = poll_until::every(1, 500, poll_until::Deadline::Exceeded);
  assert(!p.expired(500));
  assert(p.expired(501));
  assert(poll_until::every(1, 500).expired(500));
  assert(!poll_until::every_forever(1).expired(0xFFFFFFFEu));
}

static void test_unbounded_waits_past_any_deadline() {
  sim::reset_clock();
  const Outcome o = poll_until::run(poll_until::every_forever(1000), [&]() {
    return (sim::now_ms() >= 3600000) ? Step::Done : Step::Pending;
  });
  assert(o == Outcome::Satisfied);
  assert(sim::now_ms() == 3600000);
  assert(!poll_until::every_forever(1).bounded());
  assert(poll_until::every(1, 0xFFFFFFFEu).bounded());
}

static void test_failed_stops() {
  sim::reset_clock();
  unsigned checks = 0;
  const Outcome o = poll_until::run(poll_until::every_forever(10), [&]() {
    checks++;
    return (checks == 3) ? Step::Failed : Step::Pending;
  });
  assert(o == Outcome::Failed);
  assert(checks == 3);
  assert(sim::now_ms() == 20);
}

static void test_run_from_earlier_anchor() {
  sim::reset_clock();
  sim::advance_ms(400);
  unsigned checks = 0;
  uint32_t elapsed = 0;
  // Anchored at t=0: only 100 ms of the 500 ms budget remain.
  const Outcome o = poll_until::run_from(0, poll_until::every(50, 500), [&]() {
    checks++;
    return Step::Pending;
  }, &elapsed);
  assert(o == Outcome::TimedOut);
  assert(checks == 3);
  assert(elapsed == 500);
}

int main() {
  test_done_immediately();
  test_bounded_times_out();
  test_condition_at_deadline_is_seen();
  test_exceeded_deadline_checks_once_more();
  test_unbounded_waits_past_any_deadline();
  test_failed_stops();
  test_run_from_earlier_anchor();

  assert(poll_until::outcome_to_str(Outcome::TimedOut)[0] == 't');

  printf("OK\n");
  return 0;
}
