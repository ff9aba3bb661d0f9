#pragma once

#include <cstdint>

namespace nrf91_regs {

// Register map for one target family.
//
// Everything the unlock / UICR state machines need to know about the silicon
// lives here, so adding a family means adding a table, not touching the
// sequencing code.
struct Family {
  const char *target_name;  // name passed to Probe::attach()

  // Access port indices on the default DP.
  uint8_t mem_ap;   // AHB-AP used for CSW.DbgStatus
  uint8_t ctrl_ap;  // vendor CTRL-AP (erase-all + soft reset)

  // MEM-AP registers
  uint8_t mem_ap_csw;
  uint8_t mem_ap_idr;
  uint8_t csw_dbgstatus_bit;

  // CTRL-AP registers
  uint8_t ctrl_ap_reset;
  uint8_t ctrl_ap_eraseall;
  uint8_t ctrl_ap_eraseallstatus;
  uint8_t ctrl_ap_idr;

  // NVMC (flash controller), absolute addresses on the AHB bus
  uint32_t nvmc_ready;
  uint32_t nvmc_config;
  uint32_t nvmc_ready_bit;
  uint32_t nvmc_config_wen;  // write enable
  uint32_t nvmc_config_ren;  // read only

  // UICR protection words
  uint32_t uicr_approtect;
  uint32_t uicr_secureapprotect;
  uint32_t uicr_protect_value;
};

// Erased flash / UICR word.
static constexpr uint32_t k_erased_word = 0xFFFFFFFFu;

// nRF91x1 (nRF9151 / nRF9161). CTRL-AP is AP4, the application MEM-AP is AP0.
// nRF9160 uses the same CTRL-AP layout but wants a pin reset after ERASEALL.
static constexpr Family k_nrf91x1 = {
    "nRF9151_xxAA",
    /*mem_ap=*/0,
    /*ctrl_ap=*/4,
    /*mem_ap_csw=*/0x00,
    /*mem_ap_idr=*/0xFC,
    /*csw_dbgstatus_bit=*/6,
    /*ctrl_ap_reset=*/0x00,
    /*ctrl_ap_eraseall=*/0x04,
    /*ctrl_ap_eraseallstatus=*/0x08,
    /*ctrl_ap_idr=*/0xFC,
    /*nvmc_ready=*/0x50039400u,
    /*nvmc_config=*/0x50039504u,
    /*nvmc_ready_bit=*/(1u << 0),
    /*nvmc_config_wen=*/1u,
    /*nvmc_config_ren=*/0u,
    /*uicr_approtect=*/0x00FF8000u,
    /*uicr_secureapprotect=*/0x00FF802Cu,
    /*uicr_protect_value=*/0x50FA50FAu,
};

inline bool csw_debug_enabled(const Family &f, uint32_t csw) { return ((csw >> f.csw_dbgstatus_bit) & 1u) != 0; }

}  // namespace nrf91_regs
