#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include "cli_args.h"
#include "recover_log.h"
#include "recovery.h"

#include "nrf91_target.h"
#include "sim_api.h"
#include "sim_probe.h"

// Full recovery run (same CLI as the tool) against the simulated nRF9151.
// --sim-* options configure the device and probe and are removed before the
// normal command line is parsed.

struct SimFlags {
  bool locked = false;
  bool no_probe = false;
  uint32_t probe_delay_ms = 0;
  bool has_probe_serial = false;
  std::string probe_serial;
  bool has_ctrl_ap_idr = false;
  uint32_t ctrl_ap_idr = 0;
  bool has_erase_ms = false;
  uint32_t erase_ms = 0;
  bool stuck_erase = false;
  bool never_unlock = false;
  bool has_uicr = false;
  uint32_t uicr = 0;
  std::string trace_path;
};

// Value of "--name v" or "--name=v". Advances *i past a separate value.
static bool take_value(int argc, char **argv, int *i, const char *name, const char **val) {
  const char *a = argv[*i];
  const size_t n = std::strlen(name);
  if (std::strncmp(a, name, n) != 0) return false;
  if (a[n] == '=') {
    *val = a + n + 1;
    return true;
  }
  if (a[n] != '\0') return false;
  *val = (*i + 1 < argc) ? argv[++*i] : nullptr;
  return true;
}

static bool sim_number(const char *name, const char *val, uint32_t *out, std::string *err) {
  if (val && cli_args::parse_u32(val, 0xFFFFFFFFu, out)) return true;
  *err = std::string("invalid value '") + (val ? val : "") + "' for " + name;
  return false;
}

// Split argv into simulator options and the tool's own arguments.
// rest keeps argv[0] and ends with a nullptr entry (getopt expects one).
static bool strip_sim_flags(int argc, char **argv, SimFlags *sf, std::vector<char *> *rest, std::string *err) {
  rest->clear();
  rest->push_back(argv[0]);

  for (int i = 1; i < argc; i++) {
    const char *a = argv[i];
    const char *val = nullptr;

    if (std::strncmp(a, "--sim-", 6) != 0) {
      rest->push_back(argv[i]);
      continue;
    }

    if (std::strcmp(a, "--sim-locked") == 0) {
      sf->locked = true;
    } else if (std::strcmp(a, "--sim-no-probe") == 0) {
      sf->no_probe = true;
    } else if (std::strcmp(a, "--sim-stuck-erase") == 0) {
      sf->stuck_erase = true;
    } else if (std::strcmp(a, "--sim-never-unlock") == 0) {
      sf->never_unlock = true;
    } else if (take_value(argc, argv, &i, "--sim-probe-delay", &val)) {
      if (!sim_number("--sim-probe-delay", val, &sf->probe_delay_ms, err)) return false;
    } else if (take_value(argc, argv, &i, "--sim-probe-serial", &val)) {
      if (!val) {
        *err = "missing value for --sim-probe-serial";
        return false;
      }
      sf->has_probe_serial = true;
      sf->probe_serial = val;
    } else if (take_value(argc, argv, &i, "--sim-ctrl-ap-idr", &val)) {
      if (!sim_number("--sim-ctrl-ap-idr", val, &sf->ctrl_ap_idr, err)) return false;
      sf->has_ctrl_ap_idr = true;
    } else if (take_value(argc, argv, &i, "--sim-erase-ms", &val)) {
      if (!sim_number("--sim-erase-ms", val, &sf->erase_ms, err)) return false;
      sf->has_erase_ms = true;
    } else if (take_value(argc, argv, &i, "--sim-uicr", &val)) {
      if (!sim_number("--sim-uicr", val, &sf->uicr, err)) return false;
      sf->has_uicr = true;
    } else if (take_value(argc, argv, &i, "--sim-trace", &val)) {
      if (!val || !*val) {
        *err = "missing value for --sim-trace";
        return false;
      }
      sf->trace_path = val;
    } else {
      *err = std::string("unknown simulator option '") + a + "'";
      return false;
    }
  }

  rest->push_back(nullptr);
  return true;
}

static sim::Nrf91Config device_config(const SimFlags &sf) {
  sim::Nrf91Config cfg;
  cfg.locked = sf.locked;
  if (sf.has_ctrl_ap_idr) cfg.ctrl_ap_idr = sf.ctrl_ap_idr;
  if (sf.has_erase_ms) cfg.erase_duration_ms = sf.erase_ms;
  cfg.erase_status_stuck = sf.stuck_erase;
  cfg.never_unlocks = sf.never_unlock;
  if (sf.has_uicr) cfg.uicr_initial = sf.uicr;
  return cfg;
}

int main(int argc, char **argv) {
  SimFlags sf;
  std::vector<char *> args;
  std::string err;
  const char *prog = (argc > 0) ? argv[0] : "recover_simulation";

  if (!strip_sim_flags(argc, argv, &sf, &args, &err)) {
    std::fprintf(stderr, "error: %s\n", err.c_str());
    return 2;
  }

  cli_args::Parsed parsed;
  if (!cli_args::parse((int)args.size() - 1, args.data(), &parsed, &err)) {
    std::fprintf(stderr, "error: %s\n\n%s", err.c_str(), cli_args::usage(prog).c_str());
    return 2;
  }
  if (parsed.action == cli_args::Action::Help) {
    std::printf("%s", cli_args::usage(prog).c_str());
    return 0;
  }
  if (parsed.action == cli_args::Action::Version) {
    std::printf("nrf91_recover %s (simulator)\n", cli_args::k_version);
    return 0;
  }

  recover_log::set_verbose(parsed.verbose);
  if (!sf.trace_path.empty()) sim::set_log_path(sf.trace_path.c_str());

  sim::Nrf91Target target(device_config(sf));
  sim::SimProbeLister lister(target);
  if (!sf.no_probe) {
    sim::ProbeEntry e;
    e.appears_at_ms = sf.probe_delay_ms;
    if (sf.has_probe_serial) e.serial = sf.probe_serial;
    lister.add_probe(e);
  }
  sim::SimImageProgrammer programmer(target);

  recovery::Backend backend;
  backend.lister = &lister;
  backend.programmer = &programmer;

  sim::log_step("RECOVERY_BEGIN");
  const recovery::Outcome outcome = recovery::run(parsed.opts, backend);
  sim::log_step(outcome.ok() ? "RECOVERY_OK" : "RECOVERY_FAIL");

  // Device summary after the run.
  if (recover_log::verbose_enabled()) {
    const nrf91_regs::Family &f = nrf91_regs::k_nrf91x1;
    recover_log::info("simulated time: %llu ms, stage reached: %s", (unsigned long long)sim::now_ms(),
                      recovery::stage_to_str(outcome.stage));
    recover_log::info("UICR APPROTECT=0x%08X SECUREAPPROTECT=0x%08X, core resets: %u, NVMC violations: %u",
                      target.uicr_word(f.uicr_approtect), target.uicr_word(f.uicr_secureapprotect),
                      target.core_resets(), target.nvmc_violations());
    if (!sf.trace_path.empty()) recover_log::info("wrote trace: %s", sf.trace_path.c_str());
  }

  return recovery::exit_code(outcome);
}
