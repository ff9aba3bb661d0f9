#include "nrf91_target.h"

#include "logger.h"
#include "sim_api.h"

namespace sim {

namespace {
// Short alias for the register table; the model follows the same map as the tool.
const nrf91_regs::Family &F = nrf91_regs::k_nrf91x1;
}  // namespace

const char *access_kind_to_str(Access::Kind k) {
  switch (k) {
    case Access::Kind::ApRead: return "AP_READ";
    case Access::Kind::ApWrite: return "AP_WRITE";
    case Access::Kind::MemRead: return "MEM_READ";
    case Access::Kind::MemWrite: return "MEM_WRITE";
    case Access::Kind::CoreReset: return "CORE_RESET";
    default: return "(unknown)";
  }
}

Nrf91Target::Nrf91Target(const Nrf91Config &cfg) { power_on(cfg); }

void Nrf91Target::power_on(const Nrf91Config &cfg) {
  cfg_ = cfg;
  fault_.clear();

  locked_ = cfg.locked;
  erased_ = false;
  held_in_reset_ = false;
  debug_ready_at_ms_ = now();

  erase_running_ = false;
  erase_done_at_ms_ = 0;
  ctrl_ap_resets_ = 0;

  nvmc_config_ = F.nvmc_config_ren;
  nvmc_busy_until_ms_ = 0;
  nvmc_violations_ = 0;

  uicr_.clear();
  flash_.clear();
  uicr_[F.uicr_approtect] = cfg.uicr_initial;
  uicr_[F.uicr_secureapprotect] = cfg.uicr_initial;

  core_resets_ = 0;
  trace_.clear();
}

uint64_t Nrf91Target::now() const { return sim::now_ms(); }

void Nrf91Target::record(Access::Kind k, uint8_t ap, uint32_t addr, uint32_t value) {
  Access a;
  a.kind = k;
  a.t_ms = now();
  a.ap = ap;
  a.addr = addr;
  a.value = value;
  trace_.push_back(a);

  if (TraceLogger *log = sim::trace_logger()) {
    const bool is_ap = (k == Access::Kind::ApRead || k == Access::Kind::ApWrite);
    log->log_access(a.t_ms, access_kind_to_str(k), is_ap ? (int)ap : -1, addr, value);
  }
}

void Nrf91Target::update() {
  // Mass erase completes in the background once its duration has elapsed.
  if (erase_running_ && now() >= erase_done_at_ms_) {
    erase_running_ = false;
    erase_all_now();
  }
}

void Nrf91Target::erase_all_now() {
  flash_.clear();
  for (auto &kv : uicr_) kv.second = nrf91_regs::k_erased_word;
  nvmc_config_ = F.nvmc_config_ren;
  erased_ = true;
}

void Nrf91Target::nvmc_start_busy(uint32_t ms) {
  const uint64_t until = now() + ms;
  if (until > nvmc_busy_until_ms_) nvmc_busy_until_ms_ = until;
}

bool Nrf91Target::debug_enabled() {
  update();
  return !locked_ && !held_in_reset_ && now() >= debug_ready_at_ms_;
}

// ===== Debug port =====

uint32_t Nrf91Target::mem_ap_read(uint8_t reg) {
  if (reg == F.mem_ap_csw) {
    return k_csw_base | (debug_enabled() ? (1u << F.csw_dbgstatus_bit) : 0u);
  }
  if (reg == F.mem_ap_idr) return cfg_.mem_ap_idr;
  return 0;
}

uint32_t Nrf91Target::ctrl_ap_read(uint8_t reg) {
  if (reg == F.ctrl_ap_idr) return cfg_.ctrl_ap_idr;
  if (reg == F.ctrl_ap_eraseallstatus) {
    if (cfg_.erase_status_stuck && erased_) return 1;
    return erase_running_ ? 1u : 0u;
  }
  if (reg == F.ctrl_ap_reset) return held_in_reset_ ? 1u : 0u;
  return 0;
}

void Nrf91Target::ctrl_ap_write(uint8_t reg, uint32_t v) {
  if (reg == F.ctrl_ap_eraseall) {
    if ((v & 1u) && !erase_running_) {
      erase_running_ = true;
      erase_done_at_ms_ = now() + cfg_.erase_duration_ms;
      // Erasing stops the CPU; debug access is gone until the next reset.
      held_in_reset_ = true;
    }
    return;
  }

  if (reg == F.ctrl_ap_reset) {
    if (v & 1u) {
      held_in_reset_ = true;
      return;
    }
    if (!held_in_reset_) return;

    // Reset released.
    held_in_reset_ = false;
    ctrl_ap_resets_++;
    debug_ready_at_ms_ = now() + cfg_.debug_enable_delay_ms;

    // An erased UICR leaves APPROTECT open; a reset without erase changes nothing.
    if (cfg_.never_unlocks) {
      locked_ = true;
    } else if (erased_) {
      locked_ = false;
    }
  }
}

bool Nrf91Target::ap_read(uint8_t ap, uint8_t reg, uint32_t &out, std::string *err) {
  if (!fault_.empty()) {
    if (err) *err = fault_;
    return false;
  }
  update();

  if (ap == F.mem_ap) {
    out = mem_ap_read(reg);
  } else if (ap == F.ctrl_ap) {
    out = ctrl_ap_read(reg);
  } else {
    // Unimplemented AP: reads as zero (IDR == 0 means "no AP here").
    out = 0;
  }
  record(Access::Kind::ApRead, ap, reg, out);
  return true;
}

bool Nrf91Target::ap_write(uint8_t ap, uint8_t reg, uint32_t v, std::string *err) {
  if (!fault_.empty()) {
    if (err) *err = fault_;
    return false;
  }
  update();
  record(Access::Kind::ApWrite, ap, reg, v);

  if (ap == F.ctrl_ap) ctrl_ap_write(reg, v);
  // MEM-AP CSW/TAR writes and writes to absent APs have no modelled effect.
  return true;
}

// ===== AHB =====

bool Nrf91Target::mem_read32(uint32_t addr, uint32_t &out, std::string *err) {
  if (!fault_.empty()) {
    if (err) *err = fault_;
    return false;
  }
  if (!debug_enabled()) {
    if (err) *err = "AHB-AP access denied (APPROTECT)";
    return false;
  }

  if (addr == F.nvmc_ready) {
    out = nvmc_ready() ? F.nvmc_ready_bit : 0u;
  } else if (addr == F.nvmc_config) {
    out = nvmc_config_;
  } else if (addr >= k_uicr_base && addr < k_uicr_end) {
    out = uicr_word(addr);
  } else if (addr < k_flash_end) {
    out = flash_word(addr);
  } else {
    out = 0;
  }
  record(Access::Kind::MemRead, 0, addr, out);
  return true;
}

bool Nrf91Target::mem_write32(uint32_t addr, uint32_t v, std::string *err) {
  if (!fault_.empty()) {
    if (err) *err = fault_;
    return false;
  }
  if (!debug_enabled()) {
    if (err) *err = "AHB-AP access denied (APPROTECT)";
    return false;
  }
  record(Access::Kind::MemWrite, 0, addr, v);

  if (addr == F.nvmc_config) {
    if (!nvmc_ready()) nvmc_violations_++;
    nvmc_config_ = v;
    nvmc_start_busy(cfg_.nvmc_config_busy_ms);
    return true;
  }

  const bool is_uicr = (addr >= k_uicr_base && addr < k_uicr_end);
  const bool is_flash = (addr < k_flash_end);
  if (is_uicr || is_flash) {
    // Programming needs CONFIG=WEN and an idle controller; otherwise the write
    // is dropped (like the real bus, which does not report it).
    if (nvmc_config_ != F.nvmc_config_wen || !nvmc_ready()) {
      nvmc_violations_++;
      return true;
    }
    std::map<uint32_t, uint32_t> &mem = is_uicr ? uicr_ : flash_;
    const uint32_t old = is_uicr ? uicr_word(addr) : flash_word(addr);
    mem[addr] = old & v;  // NOR: bits only go 1 -> 0
    nvmc_start_busy(cfg_.nvmc_write_busy_ms);
    return true;
  }

  // Other peripherals: accepted and ignored.
  return true;
}

bool Nrf91Target::core_reset(std::string *err) {
  if (!fault_.empty()) {
    if (err) *err = fault_;
    return false;
  }
  record(Access::Kind::CoreReset, 0, 0, 0);
  core_resets_++;
  nvmc_config_ = F.nvmc_config_ren;
  return true;
}

// ===== Observers =====

uint32_t Nrf91Target::uicr_word(uint32_t addr) const {
  auto it = uicr_.find(addr);
  return (it == uicr_.end()) ? nrf91_regs::k_erased_word : it->second;
}

uint32_t Nrf91Target::flash_word(uint32_t addr) const {
  auto it = flash_.find(addr);
  return (it == flash_.end()) ? nrf91_regs::k_erased_word : it->second;
}

size_t Nrf91Target::count(Access::Kind k, uint8_t ap, uint32_t addr) const {
  const bool is_ap = (k == Access::Kind::ApRead || k == Access::Kind::ApWrite);
  size_t n = 0;
  for (const Access &a : trace_) {
    if (a.kind != k || a.addr != addr) continue;
    if (is_ap && a.ap != ap) continue;
    n++;
  }
  return n;
}

std::vector<std::pair<uint32_t, uint32_t>> Nrf91Target::mem_writes() const {
  std::vector<std::pair<uint32_t, uint32_t>> out;
  for (const Access &a : trace_) {
    if (a.kind == Access::Kind::MemWrite) out.push_back(std::make_pair(a.addr, a.value));
  }
  return out;
}

} // namespace sim
