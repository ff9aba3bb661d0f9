#include "recovery.h"

#include <sys/stat.h>

#include <memory>
#include <utility>

#include "probe_acquire.h"
#include "recover_log.h"

namespace recovery {

using recover_error::Kind;

const char *stage_to_str(Stage s) {
  switch (s) {
    case Stage::Image: return "image";
    case Stage::Probe: return "probe";
    case Stage::Unlock: return "unlock";
    case Stage::Attach: return "attach";
    case Stage::Flash: return "flash";
    case Stage::Uicr: return "uicr";
    case Stage::Reset: return "reset";
    case Stage::Done: return "done";
    default: return "(unknown)";
  }
}

// Wording of the one-line failure diagnostic per stage.
static const char *stage_failure_text(Stage s) {
  switch (s) {
    case Stage::Image: return "checking image file";
    case Stage::Probe: return "connecting to probe";
    case Stage::Unlock: return "unlocking device";
    case Stage::Attach: return "attaching to device";
    case Stage::Flash: return "flashing file";
    case Stage::Uicr: return "writing UICR";
    case Stage::Reset: return "resetting device";
    default: return "running recovery";
  }
}

static bool is_regular_file(const std::string &path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) return false;
  return S_ISREG(st.st_mode);
}

static Outcome failed(Stage stage, const recover_error::Error &err) {
  recover_log::error("Error %s: %s", stage_failure_text(stage), err.message.c_str());
  Outcome o;
  o.stage = stage;
  o.error = err;
  return o;
}

// Reset core 0 and release the session. Takes ownership: the session is gone
// after this call whether or not the reset succeeded.
static bool reset_and_release(std::unique_ptr<probe_transport::TargetSession> session, recover_error::Error *err) {
  std::string cause;
  probe_transport::CoreHandle *core = session->core(0, &cause);
  if (!core) return recover_error::fail(err, Kind::Transport, "core 0 unavailable: %s", cause.c_str());
  if (!core->reset(&cause)) return recover_error::fail(err, Kind::Transport, "core reset failed: %s", cause.c_str());
  return true;
}

Outcome run(const Options &opts, const Backend &backend, const nrf91_regs::Family &family) {
  recover_error::Error err;
  if (!backend.lister || !backend.programmer) {
    (void)recover_error::fail(&err, Kind::Transport, "no probe backend configured");
    return failed(Stage::Probe, err);
  }

  // Stage: image. Checked before touching the probe so a typo never erases a device.
  if (!is_regular_file(opts.image_path)) {
    (void)recover_error::fail(&err, Kind::FileNotFound, "File not found: %s", opts.image_path.c_str());
    return failed(Stage::Image, err);
  }

  // Stage: probe.
  std::unique_ptr<probe_transport::Probe> probe =
      probe_acquire::open_with_retry(*backend.lister, opts.selector, opts.connect_timeout_ms, &err);
  if (!probe) return failed(Stage::Probe, err);
  recover_log::milestone("Got probe!");

  std::string cause;
  if (!probe->set_speed(opts.speed_khz, &cause)) {
    // Not fatal: the probe keeps its default clock.
    recover_log::info("set_speed(%lu kHz) failed: %s", (unsigned long)opts.speed_khz, cause.c_str());
  }

  // Stage: unlock.
  if (!ctrl_ap_unlock::unlock(*probe, opts.force, family, opts.unlock_timing, /*report=*/nullptr, &err)) {
    return failed(Stage::Unlock, err);
  }

  // Stage: attach.
  std::unique_ptr<probe_transport::TargetSession> session = probe->attach(family.target_name, &cause);
  if (!session) {
    (void)recover_error::fail(&err, Kind::Attach, "%s", cause.c_str());
    return failed(Stage::Attach, err);
  }
  recover_log::milestone("Created session!");

  // Stage: flash.
  probe_transport::DownloadOptions dl;
  dl.preverify = true;
  if (!backend.programmer->download_file(*session, opts.image_path, probe_transport::ImageFormat::Hex, dl, &cause)) {
    (void)recover_error::fail(&err, Kind::Flashing, "%s", cause.c_str());
    return failed(Stage::Flash, err);
  }
  recover_log::milestone("Done flashing!");

  // Stage: UICR protection words.
  const uint32_t words[] = {family.uicr_approtect, family.uicr_secureapprotect};
  for (uint32_t addr : words) {
    if (!uicr_write::write_word(*session, addr, family.uicr_protect_value, family, opts.uicr_timing, &err)) {
      return failed(Stage::Uicr, err);
    }
  }

  // Stage: reset. Consumes the session.
  if (!reset_and_release(std::move(session), &err)) return failed(Stage::Reset, err);

  recover_log::milestone("Done!");
  Outcome o;
  o.stage = Stage::Done;
  return o;
}

int exit_code(const Outcome &o) { return o.ok() ? 0 : 1; }

}  // namespace recovery
