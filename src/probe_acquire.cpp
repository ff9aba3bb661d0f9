#include "probe_acquire.h"

#include <string>

#include "poll_until.h"
#include "recover_log.h"

namespace probe_acquire {

std::unique_ptr<probe_transport::Probe> open_with_retry(probe_transport::ProbeLister &lister,
                                                        const probe_transport::ProbeSelector &sel,
                                                        uint32_t timeout_ms, recover_error::Error *err) {
  std::unique_ptr<probe_transport::Probe> probe;
  std::string last_cause;
  uint32_t attempts = 0;

  // Open failures are expected while the probe enumerates; only the deadline is fatal.
  const poll_until::Outcome o = poll_until::run(poll_until::every(k_retry_interval_ms, timeout_ms), [&]() {
    attempts++;
    probe = lister.open(sel, &last_cause);
    return probe ? poll_until::Step::Done : poll_until::Step::Pending;
  });

  if (o != poll_until::Outcome::Satisfied) {
    recover_log::info("probe %04x:%04x%s%s not found after %lu attempts (last: %s)", (unsigned)sel.vendor_id,
                      (unsigned)sel.product_id, sel.has_serial ? " serial " : "",
                      sel.has_serial ? sel.serial.c_str() : "", (unsigned long)attempts,
                      last_cause.empty() ? "no match" : last_cause.c_str());
    (void)recover_error::fail(err, recover_error::Kind::ProbeTimeout, "Timeout connecting to probe after %lums",
                              (unsigned long)timeout_ms);
    return nullptr;
  }
  return probe;
}

}  // namespace probe_acquire
