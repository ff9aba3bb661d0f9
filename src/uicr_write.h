#pragma once

#include <cstdint>

#include "nrf91_regs.h"
#include "poll_until.h"
#include "probe_transport.h"
#include "recover_error.h"

namespace uicr_write {

struct Timing {
  uint32_t ready_poll_ms = 1;
  // NVMC.READY has no documented worst case; default is to wait forever.
  uint32_t ready_timeout_ms = poll_until::k_no_timeout;
};

// UICR is NOR flash: programming can only clear bits. A word can be written
// without an erase iff it is still erased or every bit of `desired` is already
// set in `current`.
inline bool can_program_without_erase(uint32_t current, uint32_t desired) {
  return current == nrf91_regs::k_erased_word || (current & desired) == desired;
}

// Program one UICR word through the NVMC.
//
// Sequence (each step strictly after the previous one):
//   read current word; reject with UicrNeedsErase if it would need an erase
//   NVMC.CONFIG = WEN   -> wait READY
//   *addr = value       -> wait READY
//   NVMC.CONFIG = REN   -> wait READY
//
// A rejected write issues no register writes at all.
bool write_word(probe_transport::CoreHandle &core, uint32_t addr, uint32_t value, const nrf91_regs::Family &family,
                const Timing &timing, recover_error::Error *err);

// Convenience wrapper: core 0 of the session.
bool write_word(probe_transport::TargetSession &session, uint32_t addr, uint32_t value,
                const nrf91_regs::Family &family, const Timing &timing, recover_error::Error *err);

}  // namespace uicr_write
