#pragma once

#include <cstdint>

#include "nrf91_regs.h"
#include "probe_transport.h"
#include "recover_error.h"

namespace ctrl_ap_unlock {

// Timing of the CTRL-AP recovery sequence. The defaults are the bench values
// the tool has always used; they have no documented derivation, so they are
// parameters rather than constants.
struct Timing {
  uint32_t erase_timeout_ms = 15000;   // ERASEALLSTATUS ceiling, measured from ERASEALL
  uint32_t erase_poll_ms = 500;
  uint32_t pre_reset_settle_ms = 10;
  uint32_t post_reset_settle_ms = 20;
  uint32_t verify_window_ms = 1000;    // DbgStatus may stay 0 this long after RESET
  uint32_t verify_poll_ms = 100;
};

enum class Result : uint8_t {
  AlreadyUnlocked,  // DbgStatus was 1 and force was not set; nothing erased
  Unlocked,         // ERASEALL + reset performed, DbgStatus now 1
};

struct Report {
  Result result = Result::AlreadyUnlocked;
  uint32_t csw_before = 0;
  uint32_t ctrl_ap_idr = 0;
  bool erase_completed = false;  // false: ceiling hit, sequence continued anyway
  uint32_t erase_ms = 0;
  uint32_t csw_after = 0;
};

// Bring a debug-locked device into a debuggable state via the CTRL-AP.
//
// Sequence:
//   1) attach unspecified, raw AP access at the default DP
//   2) MEM-AP CSW.DbgStatus == 1 and !force -> done, no erase
//   3) CTRL-AP IDR must be non-zero (0 = wrong AP index, fatal)
//   4) ERASEALL = 1
//   5) poll ERASEALLSTATUS == 0 (ceiling: log and continue)
//   6) RESET = 1, RESET = 0
//   7) poll CSW.DbgStatus == 1 within the verify window
//
// DESTRUCTIVE: ERASEALL wipes flash, RAM and UICR.
//
// On return the raw interface has been released and the probe can be attached
// to a named target. Errors: CtrlApInvalid, NeverUnlocked, Transport.
bool unlock(probe_transport::Probe &probe, bool force, const nrf91_regs::Family &family, const Timing &timing,
            Report *report, recover_error::Error *err);

// Same sequence on an already-attached raw interface (the caller releases it).
bool unlock_on(probe_transport::RawApInterface &iface, bool force, const nrf91_regs::Family &family,
               const Timing &timing, Report *report, recover_error::Error *err);

}  // namespace ctrl_ap_unlock
