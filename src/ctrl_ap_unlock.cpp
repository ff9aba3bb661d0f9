#include "ctrl_ap_unlock.h"

#include <string>

#include "host_time.h"
#include "poll_until.h"
#include "recover_log.h"

namespace ctrl_ap_unlock {

using probe_transport::ApAddress;
using recover_error::Kind;

static const char *dbg_str(bool enabled) { return enabled ? "1" : "0"; }

static bool read_csw(probe_transport::RawApInterface &iface, const nrf91_regs::Family &f, uint32_t *csw_out,
                     recover_error::Error *err) {
  std::string cause;
  if (!iface.read_ap_register(ApAddress::on_default_dp(f.mem_ap), f.mem_ap_csw, csw_out, &cause)) {
    return recover_error::fail(err, Kind::Transport, "MEM-AP CSW read failed: %s", cause.c_str());
  }
  recover_log::info("CSW: 0x%x, DbgStatus: %s", (unsigned)*csw_out, dbg_str(nrf91_regs::csw_debug_enabled(f, *csw_out)));
  return true;
}

static bool ctrl_ap_write(probe_transport::RawApInterface &iface, const nrf91_regs::Family &f, uint8_t reg,
                          uint32_t val, const char *what, recover_error::Error *err) {
  std::string cause;
  if (!iface.write_ap_register(ApAddress::on_default_dp(f.ctrl_ap), reg, val, &cause)) {
    return recover_error::fail(err, Kind::Transport, "CTRL-AP %s write failed: %s", what, cause.c_str());
  }
  return true;
}

bool unlock_on(probe_transport::RawApInterface &iface, bool force, const nrf91_regs::Family &f, const Timing &timing,
               Report *report, recover_error::Error *err) {
  Report local;
  Report &r = report ? *report : local;
  r = Report();

  const ApAddress ctrl_ap = ApAddress::on_default_dp(f.ctrl_ap);

  // Step 1: is debug access already enabled?
  if (!read_csw(iface, f, &r.csw_before, err)) return false;
  if (nrf91_regs::csw_debug_enabled(f, r.csw_before) && !force) {
    r.result = Result::AlreadyUnlocked;
    r.csw_after = r.csw_before;
    return true;
  }

  // Step 2: CTRL-AP identity. A read that fails is treated like IDR == 0: either
  // way the AP index does not point at a CTRL-AP and erasing blind is not safe.
  std::string cause;
  uint32_t idr = 0;
  const bool idr_ok = iface.read_ap_register(ctrl_ap, f.ctrl_ap_idr, &idr, &cause);
  r.ctrl_ap_idr = idr_ok ? idr : 0;
  recover_log::info("CTRL-AP IDR: 0x%x", (unsigned)r.ctrl_ap_idr);
  if (!idr_ok) {
    return recover_error::fail(err, Kind::CtrlApInvalid, "Invalid CTRL-AP IDR, check AP index (read failed: %s)",
                               cause.c_str());
  }
  if (idr == 0) {
    return recover_error::fail(err, Kind::CtrlApInvalid, "Invalid CTRL-AP IDR, check AP index");
  }

  // Step 3: erase all.
  if (!ctrl_ap_write(iface, f, f.ctrl_ap_eraseall, 1u, "ERASEALL", err)) return false;
  const uint32_t erase_start = host_time::millis();
  recover_log::info("Started ERASEALL");

  // Step 4: wait for ERASEALLSTATUS == 0. Hitting the ceiling is not an error:
  // some silicon revisions never report completion on this register.
  std::string status_cause;
  const poll_until::Outcome erase = poll_until::run_from(
      erase_start, poll_until::every(timing.erase_poll_ms, timing.erase_timeout_ms),
      [&]() {
        uint32_t status = 0;
        if (!iface.read_ap_register(ctrl_ap, f.ctrl_ap_eraseallstatus, &status, &status_cause)) {
          return poll_until::Step::Failed;
        }
        return (status == 0) ? poll_until::Step::Done : poll_until::Step::Pending;
      },
      &r.erase_ms);

  if (erase == poll_until::Outcome::Failed) {
    return recover_error::fail(err, Kind::Transport, "CTRL-AP ERASEALLSTATUS read failed: %s", status_cause.c_str());
  }
  r.erase_completed = (erase == poll_until::Outcome::Satisfied);
  if (r.erase_completed) {
    recover_log::info("Erase completed");
  } else {
    recover_log::info("Erase timeout after %lums", (unsigned long)r.erase_ms);
  }
  recover_log::info("Time used to erase: %lums", (unsigned long)r.erase_ms);

  // Step 5: soft reset pulse through the CTRL-AP (nRF91x1; nRF9160 needs a pin reset).
  host_time::delay(timing.pre_reset_settle_ms);
  if (!ctrl_ap_write(iface, f, f.ctrl_ap_reset, 1u, "RESET", err)) return false;
  if (!ctrl_ap_write(iface, f, f.ctrl_ap_reset, 0u, "RESET", err)) return false;
  const uint32_t reset_at = host_time::millis();
  host_time::delay(timing.post_reset_settle_ms);
  recover_log::info("Issued soft reset");

  // Step 6: DbgStatus must come up within the verify window. Only a DbgStatus
  // that stays 0 for longer than the window is a failure.
  recover_error::Error csw_err;
  const poll_until::Outcome verify = poll_until::run_from(
      reset_at, poll_until::every(timing.verify_poll_ms, timing.verify_window_ms, poll_until::Deadline::Exceeded),
      [&]() {
        if (!read_csw(iface, f, &r.csw_after, &csw_err)) return poll_until::Step::Failed;
        return nrf91_regs::csw_debug_enabled(f, r.csw_after) ? poll_until::Step::Done : poll_until::Step::Pending;
      });

  if (verify == poll_until::Outcome::Failed) {
    if (err) *err = csw_err;
    return false;
  }
  if (verify == poll_until::Outcome::TimedOut) {
    return recover_error::fail(err, Kind::NeverUnlocked, "Debug status = 0, access port not enabled");
  }

  r.result = Result::Unlocked;
  return true;
}

bool unlock(probe_transport::Probe &probe, bool force, const nrf91_regs::Family &family, const Timing &timing,
            Report *report, recover_error::Error *err) {
  std::string cause;
  std::unique_ptr<probe_transport::RawApInterface> iface = probe.attach_unspecified(&cause);
  if (!iface) {
    return recover_error::fail(err, Kind::Transport, "raw AP attach failed: %s", cause.c_str());
  }

  Report local;
  Report &r = report ? *report : local;
  const bool ok = unlock_on(*iface, force, family, timing, &r, err);

  // Release the raw interface before the caller attaches to the named target.
  iface.reset();

  if (!ok) return false;
  if (r.result == Result::AlreadyUnlocked) {
    recover_log::milestone("Device already unlocked!");
  } else {
    recover_log::milestone("Unlocked device!");
  }
  return true;
}

}  // namespace ctrl_ap_unlock
