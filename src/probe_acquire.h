#pragma once

#include <cstdint>
#include <memory>

#include "probe_transport.h"
#include "recover_error.h"

namespace probe_acquire {

static constexpr uint32_t k_retry_interval_ms = 100;

// Open the first probe matching sel, retrying every k_retry_interval_ms until
// timeout_ms has elapsed. The probe may be plugged in (or finish enumerating)
// while we wait. Returns nullptr with Kind::ProbeTimeout on expiry.
std::unique_ptr<probe_transport::Probe> open_with_retry(probe_transport::ProbeLister &lister,
                                                        const probe_transport::ProbeSelector &sel,
                                                        uint32_t timeout_ms, recover_error::Error *err);

}  // namespace probe_acquire
