#include "src/recover_log.h"
#include "src/recovery.h"

#include "sim/nrf91_target.h"
#include "sim/sim_api.h"
#include "sim/sim_probe.h"

#include <assert.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <memory>
#include <string>
#include <vector>

using recover_log::Channel;
using sim::Access;

static const nrf91_regs::Family &F = nrf91_regs::k_nrf91x1;

static std::string g_image;

static const char k_hex[] = ":020000040000FA\n:0400000000100020CC\n:00000001FF\n";
static const size_t k_hex_len = sizeof(k_hex) - 1;

static std::string make_image() {
  char path[] = "/tmp/nrf91_recover_test_XXXXXX";
  const int fd = mkstemp(path);
  assert(fd >= 0);
  const ssize_t n = write(fd, k_hex, k_hex_len);
  assert(n == (ssize_t)k_hex_len);
  close(fd);
  return path;
}

// Target + one probe + programmer, wired into a recovery::Backend.
struct Rig {
  sim::Nrf91Target target;
  sim::SimProbeLister lister;
  sim::SimImageProgrammer programmer;
  recovery::Backend backend;

  explicit Rig(const sim::Nrf91Config &cfg, bool with_probe = true)
      : target((sim::reset_clock(), cfg)), lister(target), programmer(target) {
    if (with_probe) lister.add_probe(sim::ProbeEntry());
    backend.lister = &lister;
    backend.programmer = &programmer;
  }
};

static recovery::Options options(const std::string &image) {
  recovery::Options o;
  o.image_path = image;
  return o;
}

static sim::Nrf91Config locked() {
  sim::Nrf91Config c;
  c.locked = true;
  return c;
}

static size_t uicr_protect_writes(const sim::Nrf91Target &t) {
  size_t n = 0;
  for (const auto &w : t.mem_writes()) {
    if ((w.first == F.uicr_approtect || w.first == F.uicr_secureapprotect) && w.second == F.uicr_protect_value) n++;
  }
  return n;
}

static void test_happy_path_locked_device() {
  Rig rig(locked());
  recover_log::ScopedCapture cap;

  const recovery::Outcome o = recovery::run(options(g_image), rig.backend);
  assert(o.ok());
  assert(recovery::exit_code(o) == 0);

  const std::vector<std::string> want = {"Got probe!", "Unlocked device!", "Created session!", "Done flashing!",
                                         "Done!"};
  assert(cap.texts(Channel::Milestone) == want);
  assert(cap.texts(Channel::Error).empty());

  assert(uicr_protect_writes(rig.target) == 2);
  assert(rig.target.uicr_word(F.uicr_approtect) == 0x50FA50FAu);
  assert(rig.target.uicr_word(F.uicr_secureapprotect) == 0x50FA50FAu);
  assert(rig.target.nvmc_violations() == 0);
  assert(rig.target.core_resets() == 1);

  // The core reset is the last access of the run.
  assert(rig.target.trace().back().kind == Access::Kind::CoreReset);

  assert(rig.programmer.calls() == 1);
  assert(rig.programmer.last_path() == g_image);
  assert(rig.programmer.last_format() == probe_transport::ImageFormat::Hex);
  assert(rig.programmer.last_preverify());
  assert(rig.lister.stats().speed_khz == 12000);
  assert(rig.lister.stats().last_target_name == "nRF9151_xxAA");
}

static void test_preverify_skips_matching_flash() {
  Rig rig(locked());
  recover_log::ScopedCapture cap;
  assert(recovery::run(options(g_image), rig.backend).ok());
  assert(!rig.programmer.last_skipped());
  assert(rig.programmer.last_bytes() == k_hex_len);

  // Flash now holds the image: a second preverified download writes nothing.
  std::string cause;
  std::unique_ptr<probe_transport::Probe> probe = rig.lister.open(probe_transport::ProbeSelector(), &cause);
  assert(probe);
  std::unique_ptr<probe_transport::TargetSession> session = probe->attach(F.target_name, &cause);
  assert(session);
  const uint64_t before = sim::now_ms();
  probe_transport::DownloadOptions opts;
  opts.preverify = true;
  assert(rig.programmer.download_file(*session, g_image, probe_transport::ImageFormat::Hex, opts, &cause));
  assert(rig.programmer.last_skipped());
  assert(rig.programmer.last_bytes() == k_hex_len);
  assert(sim::now_ms() == before);

  // Without preverify the same image is written again.
  opts.preverify = false;
  assert(rig.programmer.download_file(*session, g_image, probe_transport::ImageFormat::Hex, opts, &cause));
  assert(!rig.programmer.last_skipped());
  assert(sim::now_ms() > before);
}

static void test_happy_path_unlocked_device() {
  sim::Nrf91Config cfg;
  cfg.locked = false;
  Rig rig(cfg);
  recover_log::ScopedCapture cap;

  const recovery::Outcome o = recovery::run(options(g_image), rig.backend);
  assert(o.ok());
  assert(cap.texts(Channel::Milestone)[1] == "Device already unlocked!");
  assert(rig.target.count(Access::Kind::ApWrite, F.ctrl_ap, F.ctrl_ap_eraseall) == 0);
  assert(uicr_protect_writes(rig.target) == 2);
}

static void test_missing_image_stops_before_probe() {
  Rig rig(locked());
  recover_log::ScopedCapture cap;

  const recovery::Outcome o = recovery::run(options("/nonexistent/dir/fw.hex"), rig.backend);
  assert(!o.ok());
  assert(recovery::exit_code(o) != 0);
  assert(o.stage == recovery::Stage::Image);
  assert(o.error.kind == recover_error::Kind::FileNotFound);
  assert(rig.lister.stats().open_calls == 0);
  assert(rig.target.trace().empty());
  assert(cap.contains(Channel::Error, "Error checking image file: File not found: /nonexistent/dir/fw.hex"));

  // A directory is not an image either.
  const recovery::Outcome d = recovery::run(options("/tmp"), rig.backend);
  assert(d.stage == recovery::Stage::Image);
}

static void test_probe_timeout() {
  Rig rig(locked(), /*with_probe=*/false);
  recover_log::ScopedCapture cap;
  recovery::Options opts = options(g_image);
  opts.connect_timeout_ms = 500;

  const recovery::Outcome o = recovery::run(opts, rig.backend);
  assert(!o.ok());
  assert(o.stage == recovery::Stage::Probe);
  assert(o.error.kind == recover_error::Kind::ProbeTimeout);
  assert(o.error.message == "Timeout connecting to probe after 500ms");
  assert(cap.contains(Channel::Error, "Timeout connecting to probe after 500ms"));
  assert(cap.texts(Channel::Milestone).empty());
  assert(rig.target.trace().empty());
  assert(sim::now_ms() == 500);
  assert(rig.lister.stats().open_calls == 6);
}

static void test_probe_appears_late() {
  Rig rig(locked(), /*with_probe=*/false);
  sim::ProbeEntry e;
  e.appears_at_ms = 1200;
  rig.lister.add_probe(e);
  recover_log::ScopedCapture cap;

  const recovery::Outcome o = recovery::run(options(g_image), rig.backend);
  assert(o.ok());
  assert(rig.lister.stats().open_calls == 13);
}

static void test_serial_selector() {
  Rig rig(locked());
  recover_log::ScopedCapture cap;
  recovery::Options opts = options(g_image);
  opts.selector.has_serial = true;
  opts.selector.serial = "NOT-THIS-ONE";
  opts.connect_timeout_ms = 300;

  recovery::Outcome o = recovery::run(opts, rig.backend);
  assert(o.stage == recovery::Stage::Probe);

  Rig rig2(locked());
  opts.selector.serial = sim::ProbeEntry().serial;
  o = recovery::run(opts, rig2.backend);
  assert(o.ok());
}

static void test_vendor_mismatch() {
  Rig rig(locked());
  recover_log::ScopedCapture cap;
  recovery::Options opts = options(g_image);
  opts.selector.vendor_id = 0x1366;
  opts.connect_timeout_ms = 200;

  const recovery::Outcome o = recovery::run(opts, rig.backend);
  assert(o.stage == recovery::Stage::Probe);
}

static void test_unlock_failure_is_fatal() {
  sim::Nrf91Config cfg = locked();
  cfg.ctrl_ap_idr = 0;
  Rig rig(cfg);
  recover_log::ScopedCapture cap;

  const recovery::Outcome o = recovery::run(options(g_image), rig.backend);
  assert(o.stage == recovery::Stage::Unlock);
  assert(o.error.kind == recover_error::Kind::CtrlApInvalid);
  assert(cap.contains(Channel::Error, "Error unlocking device: Invalid CTRL-AP IDR, check AP index"));
  assert(cap.texts(Channel::Milestone).size() == 1);
  assert(rig.programmer.calls() == 0);
  assert(rig.lister.stats().session_attaches == 0);
}

static void test_never_unlocks() {
  sim::Nrf91Config cfg = locked();
  cfg.never_unlocks = true;
  Rig rig(cfg);
  recover_log::ScopedCapture cap;

  const recovery::Outcome o = recovery::run(options(g_image), rig.backend);
  assert(o.stage == recovery::Stage::Unlock);
  assert(o.error.kind == recover_error::Kind::NeverUnlocked);
  assert(rig.programmer.calls() == 0);
}

static void test_flash_failure_skips_uicr() {
  Rig rig(locked());
  rig.programmer.fail_with("verify failed at 0x00001000");
  recover_log::ScopedCapture cap;

  const recovery::Outcome o = recovery::run(options(g_image), rig.backend);
  assert(o.stage == recovery::Stage::Flash);
  assert(o.error.kind == recover_error::Kind::Flashing);
  assert(cap.contains(Channel::Error, "Error flashing file: verify failed at 0x00001000"));
  assert(rig.target.mem_writes().empty());
  assert(rig.target.core_resets() == 0);
}

static void test_uicr_rejection_without_force() {
  // Unlocked but UICR already programmed with a conflicting value: no erase
  // happens, so the protection write must refuse.
  sim::Nrf91Config cfg;
  cfg.locked = false;
  cfg.uicr_initial = 0x00000000u;
  Rig rig(cfg);
  recover_log::ScopedCapture cap;

  const recovery::Outcome o = recovery::run(options(g_image), rig.backend);
  assert(o.stage == recovery::Stage::Uicr);
  assert(o.error.kind == recover_error::Kind::UicrNeedsErase);
  assert(rig.target.core_resets() == 0);
  assert(cap.texts(Channel::Milestone).back() == "Done flashing!");

  // With force the device is erased first and the same run succeeds.
  Rig rig2(cfg);
  recovery::Options opts = options(g_image);
  opts.force = true;
  assert(recovery::run(opts, rig2.backend).ok());
}

static void test_failure_ends_with_error_line() {
  sim::Nrf91Config cfg = locked();
  cfg.never_unlocks = true;
  Rig rig(cfg);
  recover_log::ScopedCapture cap;

  assert(!recover_log::verbose_enabled());
  assert(!recovery::run(options(g_image), rig.backend).ok());
  assert(!cap.lines().empty());
  assert(cap.lines().front().channel == Channel::Milestone);
  assert(cap.lines().back().channel == Channel::Error);
  assert(cap.lines().back().text == "Error unlocking device: Debug status = 0, access port not enabled");

  // Info lines are captured with verbose off and reach the console only with it on.
  recover_log::set_verbose(true);
  assert(recover_log::verbose_enabled());
  recover_log::set_verbose(false);
  assert(!cap.texts(Channel::Info).empty());
}

static void test_missing_backend() {
  recover_log::ScopedCapture cap;
  const recovery::Outcome o = recovery::run(options(g_image), recovery::Backend());
  assert(!o.ok());
  assert(o.stage == recovery::Stage::Probe);
}

int main() {
  recover_log::set_console_enabled(false);
  g_image = make_image();

  test_happy_path_locked_device();
  test_preverify_skips_matching_flash();
  test_happy_path_unlocked_device();
  test_missing_image_stops_before_probe();
  test_probe_timeout();
  test_probe_appears_late();
  test_serial_selector();
  test_vendor_mismatch();
  test_unlock_failure_is_fatal();
  test_never_unlocks();
  test_flash_failure_skips_uicr();
  test_uicr_rejection_without_force();
  test_failure_ends_with_error_line();
  test_missing_backend();

  unlink(g_image.c_str());
  printf("OK\n");
  return 0;
}
