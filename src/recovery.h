#pragma once

#include <cstdint>
#include <string>

#include "ctrl_ap_unlock.h"
#include "nrf91_regs.h"
#include "probe_transport.h"
#include "recover_error.h"
#include "uicr_write.h"

namespace recovery {

struct Options {
  std::string image_path;
  probe_transport::ProbeSelector selector;
  uint32_t connect_timeout_ms = 2000;
  bool force = false;
  uint32_t speed_khz = 12000;

  ctrl_ap_unlock::Timing unlock_timing;
  uicr_write::Timing uicr_timing;
};

// Where a run stopped. Stage::Done means every stage succeeded.
enum class Stage : uint8_t { Image, Probe, Unlock, Attach, Flash, Uicr, Reset, Done };

const char *stage_to_str(Stage s);

struct Outcome {
  Stage stage = Stage::Image;
  recover_error::Error error;

  bool ok() const { return stage == Stage::Done; }
};

// Backend capabilities for one run. Both must outlive run().
struct Backend {
  probe_transport::ProbeLister *lister = nullptr;
  probe_transport::ImageProgrammer *programmer = nullptr;
};

// Full recovery sequence, fail-fast:
//   image exists -> acquire probe -> CTRL-AP unlock -> attach -> download image
//   (preverify) -> UICR APPROTECT + SECUREAPPROTECT -> core reset
//
// Prints the milestone line of each stage on success and one
// "Error <stage>: <cause>" line on failure. Nothing is rolled back: a failed run
// can leave the device erased but not reprogrammed.
Outcome run(const Options &opts, const Backend &backend, const nrf91_regs::Family &family = nrf91_regs::k_nrf91x1);

// Process exit status for an outcome (0 on success).
int exit_code(const Outcome &o);

}  // namespace recovery
