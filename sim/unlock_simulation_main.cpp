#include <cstdio>

#include "ctrl_ap_unlock.h"
#include "recover_log.h"

#include "nrf91_target.h"
#include "sim_api.h"
#include "sim_probe.h"

// Standalone CTRL-AP unlock of a locked nRF9151, printing every AP access.
int main() {
  sim::set_log_path("unlock_simulation.csv");
  recover_log::set_verbose(true);

  const nrf91_regs::Family &f = nrf91_regs::k_nrf91x1;

  std::printf("unlock_simulation: starting\n");
  std::printf("Goal: recover a debug-locked nRF9151 via CTRL-AP ERASEALL + RESET, then check DbgStatus.\n\n");

  sim::Nrf91Config cfg;
  cfg.locked = true;
  cfg.uicr_initial = 0xFFFFFF00u;  // protected UICR, should read erased afterwards
  sim::Nrf91Target target(cfg);
  target.set_flash_word(0x0, 0x20001000u);

  sim::SimProbeLister lister(target);
  lister.add_probe(sim::ProbeEntry());

  // Step 0: open the probe.
  sim::log_step("STEP_0_OPEN_BEGIN");
  std::string cause;
  std::unique_ptr<probe_transport::Probe> probe = lister.open(probe_transport::ProbeSelector(), &cause);
  if (!probe) {
    std::printf("open failed: %s\n", cause.c_str());
    return 2;
  }

  // Step 1: unlock.
  sim::log_step("STEP_1_UNLOCK_BEGIN");
  std::printf("Step 1: CTRL-AP unlock (AP%u), MEM-AP DbgStatus on AP%u.\n", f.ctrl_ap, f.mem_ap);
  ctrl_ap_unlock::Report report;
  recover_error::Error err;
  const bool ok = ctrl_ap_unlock::unlock(*probe, /*force=*/false, f, ctrl_ap_unlock::Timing(), &report, &err);
  sim::log_step(ok ? "STEP_1_UNLOCK_OK" : "STEP_1_UNLOCK_FAIL");

  // Step 2: access trace.
  std::printf("\nStep 2: AP access trace.\n");
  for (const sim::Access &a : target.trace()) {
    std::printf("  t=%6llu ms  %-9s AP%u reg 0x%02X = 0x%08X\n", (unsigned long long)a.t_ms,
                sim::access_kind_to_str(a.kind), a.ap, a.addr, a.value);
  }

  std::printf("\n");
  if (ok) {
    std::printf("Unlock OK (%s).\n",
                report.result == ctrl_ap_unlock::Result::Unlocked ? "erased + reset" : "already unlocked");
    std::printf("CSW before=0x%08X after=0x%08X, CTRL-AP IDR=0x%08X\n", report.csw_before, report.csw_after,
                report.ctrl_ap_idr);
    std::printf("Erase %s in %lu ms, CTRL-AP resets: %u\n", report.erase_completed ? "completed" : "timed out",
                (unsigned long)report.erase_ms, target.ctrl_ap_resets());
    std::printf("Erased check (flash[0] and UICR APPROTECT read 0xFFFFFFFF): %s\n",
                (target.flash_word(0x0) == nrf91_regs::k_erased_word &&
                 target.uicr_word(f.uicr_approtect) == nrf91_regs::k_erased_word)
                    ? "PASS"
                    : "FAIL");
  } else {
    std::printf("Unlock failed (%s): %s\n", recover_error::kind_to_str(err.kind), err.message.c_str());
  }

  std::printf("Wrote log: unlock_simulation.csv\n");
  return ok ? 0 : 2;
}
