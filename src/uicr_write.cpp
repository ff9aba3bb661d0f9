#include "uicr_write.h"

#include <string>

#include "recover_log.h"

namespace uicr_write {

using recover_error::Kind;

static bool wait_nvmc_ready(probe_transport::CoreHandle &core, const nrf91_regs::Family &f, const Timing &timing,
                            const char *after, recover_error::Error *err) {
  std::string cause;
  const poll_until::Outcome o =
      poll_until::run(poll_until::every(timing.ready_poll_ms, timing.ready_timeout_ms), [&]() {
        uint32_t ready = 0;
        if (!core.read_word32(f.nvmc_ready, &ready, &cause)) return poll_until::Step::Failed;
        return (ready & f.nvmc_ready_bit) ? poll_until::Step::Done : poll_until::Step::Pending;
      });

  switch (o) {
    case poll_until::Outcome::Satisfied:
      return true;
    case poll_until::Outcome::TimedOut:
      return recover_error::fail(err, Kind::Timeout, "NVMC not ready %lums after %s",
                                 (unsigned long)timing.ready_timeout_ms, after);
    case poll_until::Outcome::Failed:
    default:
      return recover_error::fail(err, Kind::Transport, "NVMC.READY read failed after %s: %s", after, cause.c_str());
  }
}

static bool write_reg(probe_transport::CoreHandle &core, uint32_t addr, uint32_t val, const char *what,
                      recover_error::Error *err) {
  std::string cause;
  if (!core.write_word32(addr, val, &cause)) {
    return recover_error::fail(err, Kind::Transport, "%s write failed: %s", what, cause.c_str());
  }
  return true;
}

bool write_word(probe_transport::CoreHandle &core, uint32_t addr, uint32_t value, const nrf91_regs::Family &f,
                const Timing &timing, recover_error::Error *err) {
  // Step 1: read current value and check the write is possible.
  std::string cause;
  uint32_t current = 0;
  if (!core.read_word32(addr, &current, &cause)) {
    return recover_error::fail(err, Kind::Transport, "UICR read at 0x%08lX failed: %s", (unsigned long)addr,
                               cause.c_str());
  }
  recover_log::info("UICR[0x%08lX] = 0x%08lX, want 0x%08lX", (unsigned long)addr, (unsigned long)current,
                    (unsigned long)value);
  if (!can_program_without_erase(current, value)) {
    return recover_error::fail(err, Kind::UicrNeedsErase, "UICR write needs mass erase (0x%08lX holds 0x%08lX)",
                               (unsigned long)addr, (unsigned long)current);
  }

  // Step 2: enable write.
  if (!write_reg(core, f.nvmc_config, f.nvmc_config_wen, "NVMC.CONFIG=WEN", err)) return false;
  if (!wait_nvmc_ready(core, f, timing, "CONFIG=WEN", err)) return false;

  // Step 3: program the word.
  if (!write_reg(core, addr, value, "UICR word", err)) return false;
  if (!wait_nvmc_ready(core, f, timing, "UICR word write", err)) return false;

  // Step 4: back to read-only.
  if (!write_reg(core, f.nvmc_config, f.nvmc_config_ren, "NVMC.CONFIG=REN", err)) return false;
  if (!wait_nvmc_ready(core, f, timing, "CONFIG=REN", err)) return false;

  recover_log::info("UICR[0x%08lX] written", (unsigned long)addr);
  return true;
}

bool write_word(probe_transport::TargetSession &session, uint32_t addr, uint32_t value,
                const nrf91_regs::Family &family, const Timing &timing, recover_error::Error *err) {
  std::string cause;
  probe_transport::CoreHandle *core = session.core(0, &cause);
  if (!core) return recover_error::fail(err, Kind::Transport, "core 0 unavailable: %s", cause.c_str());
  return write_word(*core, addr, value, family, timing, err);
}

}  // namespace uicr_write
