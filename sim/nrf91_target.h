#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "nrf91_regs.h"

namespace sim {

// Knobs for one simulated device. Defaults: a locked nRF9151 with erased UICR
// that recovers normally.
struct Nrf91Config {
  bool locked = true;                     // APPROTECT enforced at power-on
  uint32_t ctrl_ap_idr = 0x12880000u;     // 0 simulates a wrong CTRL-AP index
  uint32_t mem_ap_idr = 0x84770001u;
  uint32_t erase_duration_ms = 2500;
  bool erase_status_stuck = false;        // ERASEALLSTATUS never drops to 0 (erase still happens)
  bool never_unlocks = false;             // debug stays disabled after ERASEALL + reset
  uint32_t debug_enable_delay_ms = 50;    // DbgStatus comes up this long after RESET release
  uint32_t nvmc_write_busy_ms = 3;        // READY low after a UICR/flash word write
  uint32_t nvmc_config_busy_ms = 0;       // READY low after a CONFIG change
  uint32_t uicr_initial = nrf91_regs::k_erased_word;
};

// One recorded register access.
struct Access {
  enum class Kind : uint8_t { ApRead, ApWrite, MemRead, MemWrite, CoreReset };

  Kind kind;
  uint64_t t_ms;
  uint8_t ap;      // AP accesses only
  uint32_t addr;   // AP register offset or AHB address
  uint32_t value;
};

const char *access_kind_to_str(Access::Kind k);

// nRF91x1 debug/flash model at register level:
// - MEM-AP (AP0): CSW with DbgStatus (bit 6), IDR
// - CTRL-AP (AP4): RESET, ERASEALL, ERASEALLSTATUS, IDR
// - AHB: NVMC.READY/CONFIG, UICR words (bits only clear, only while CONFIG=WEN), flash
//
// Time comes from the simulated clock (sim::now_ms()); state that depends on
// elapsed time (erase completion, NVMC busy, DbgStatus after reset) is brought
// up to date lazily on each access.
class Nrf91Target {
public:
  explicit Nrf91Target(const Nrf91Config &cfg = Nrf91Config());

  // Power-on with a new configuration. Clears the trace.
  void power_on(const Nrf91Config &cfg);

  // --- Debug port view (raw AP access at the default DP) ---
  bool ap_read(uint8_t ap, uint8_t reg, uint32_t &out, std::string *err);
  bool ap_write(uint8_t ap, uint8_t reg, uint32_t v, std::string *err);

  // --- AHB view through the MEM-AP (needs debug access) ---
  bool mem_read32(uint32_t addr, uint32_t &out, std::string *err);
  bool mem_write32(uint32_t addr, uint32_t v, std::string *err);
  bool core_reset(std::string *err);

  // --- Fault injection ---
  // Every access fails with cause (empty string clears the fault).
  void set_transport_fault(const std::string &cause) { fault_ = cause; }

  // --- Observers ---
  bool debug_enabled();
  bool erased() const { return erased_; }
  uint32_t uicr_word(uint32_t addr) const;
  uint32_t flash_word(uint32_t addr) const;
  void set_flash_word(uint32_t addr, uint32_t v) { flash_[addr] = v; }
  uint32_t core_resets() const { return core_resets_; }
  uint32_t ctrl_ap_resets() const { return ctrl_ap_resets_; }
  uint32_t nvmc_violations() const { return nvmc_violations_; }
  uint32_t nvmc_config() const { return nvmc_config_; }

  const std::vector<Access> &trace() const { return trace_; }
  void clear_trace() { trace_.clear(); }

  // Number of recorded accesses of kind k at (ap, addr). ap is ignored for AHB kinds.
  size_t count(Access::Kind k, uint8_t ap, uint32_t addr) const;

  // Recorded AHB writes, in order, as (addr, value) pairs.
  std::vector<std::pair<uint32_t, uint32_t>> mem_writes() const;

private:
  static constexpr uint32_t k_csw_base = 0x23000012u;  // 32-bit, auto-increment
  static constexpr uint32_t k_uicr_base = 0x00FF8000u;
  static constexpr uint32_t k_uicr_end = 0x00FF9000u;
  static constexpr uint32_t k_flash_end = 0x00100000u;

  void record(Access::Kind k, uint8_t ap, uint32_t addr, uint32_t value);
  void update();

  bool nvmc_ready() const { return now() >= nvmc_busy_until_ms_; }
  void nvmc_start_busy(uint32_t ms);
  void erase_all_now();

  uint64_t now() const;

  uint32_t mem_ap_read(uint8_t reg);
  uint32_t ctrl_ap_read(uint8_t reg);
  void ctrl_ap_write(uint8_t reg, uint32_t v);

  Nrf91Config cfg_;
  std::string fault_;

  // Protection / debug state
  bool locked_ = true;
  bool erased_ = false;
  bool held_in_reset_ = false;
  uint64_t debug_ready_at_ms_ = 0;

  // CTRL-AP
  bool erase_running_ = false;
  uint64_t erase_done_at_ms_ = 0;
  uint32_t ctrl_ap_resets_ = 0;

  // NVMC
  uint32_t nvmc_config_ = 0;
  uint64_t nvmc_busy_until_ms_ = 0;
  uint32_t nvmc_violations_ = 0;

  // Non-volatile memory (sparse; missing words read as erased)
  std::map<uint32_t, uint32_t> uicr_;
  std::map<uint32_t, uint32_t> flash_;

  uint32_t core_resets_ = 0;
  std::vector<Access> trace_;
};

} // namespace sim
