#include "sim_probe.h"

#include <fstream>
#include <iterator>

#include "host_time.h"
#include "sim_api.h"

namespace sim {

namespace {

using probe_transport::ApAddress;

// Probe-side attachment state. Only one attachment (raw or named) at a time.
struct Link {
  Nrf91Target &target;
  ProbeStats &stats;
  bool attached = false;

  Link(Nrf91Target &t, ProbeStats &s) : target(t), stats(s) {}
};

static bool check_default_dp(const ApAddress &ap, std::string *err) {
  if (ap.default_dp) return true;
  if (err) *err = "multi-drop DP not supported by this probe";
  return false;
}

class SimRawAp : public probe_transport::RawApInterface {
 public:
  explicit SimRawAp(Link &link) : link_(link) { link_.attached = true; }
  ~SimRawAp() override { link_.attached = false; }

  bool read_ap_register(const ApAddress &ap, uint8_t reg, uint32_t *val_out, std::string *err) override {
    if (!check_default_dp(ap, err)) return false;
    uint32_t v = 0;
    if (!link_.target.ap_read(ap.ap, reg, v, err)) return false;
    if (val_out) *val_out = v;
    return true;
  }

  bool write_ap_register(const ApAddress &ap, uint8_t reg, uint32_t val, std::string *err) override {
    if (!check_default_dp(ap, err)) return false;
    return link_.target.ap_write(ap.ap, reg, val, err);
  }

 private:
  Link &link_;
};

class SimCore : public probe_transport::CoreHandle {
 public:
  explicit SimCore(Nrf91Target &t) : target_(t) {}

  bool read_word32(uint32_t addr, uint32_t *val_out, std::string *err) override {
    uint32_t v = 0;
    if (!target_.mem_read32(addr, v, err)) return false;
    if (val_out) *val_out = v;
    return true;
  }

  bool write_word32(uint32_t addr, uint32_t val, std::string *err) override {
    return target_.mem_write32(addr, val, err);
  }

  bool reset(std::string *err) override { return target_.core_reset(err); }

 private:
  Nrf91Target &target_;
};

class SimSession : public probe_transport::TargetSession {
 public:
  explicit SimSession(Link &link) : link_(link), core_(link.target) { link_.attached = true; }
  ~SimSession() override { link_.attached = false; }

  probe_transport::CoreHandle *core(unsigned index, std::string *err) override {
    if (index == 0) return &core_;
    if (err) *err = "core " + std::to_string(index) + " does not exist";
    return nullptr;
  }

 private:
  Link &link_;
  SimCore core_;
};

class SimProbe : public probe_transport::Probe {
 public:
  SimProbe(Nrf91Target &t, ProbeStats &s) : link_(t, s) {}

  bool set_speed(uint32_t khz, std::string *err) override {
    if (khz == 0) {
      if (err) *err = "invalid SWD clock 0 kHz";
      return false;
    }
    link_.stats.speed_khz = khz;
    return true;
  }

  std::unique_ptr<probe_transport::RawApInterface> attach_unspecified(std::string *err) override {
    if (link_.attached) {
      if (err) *err = "probe already attached";
      return nullptr;
    }
    link_.stats.raw_attaches++;
    return std::make_unique<SimRawAp>(link_);
  }

  std::unique_ptr<probe_transport::TargetSession> attach(const char *target_name, std::string *err) override {
    const std::string name = target_name ? target_name : "";
    if (link_.attached) {
      if (err) *err = "probe already attached";
      return nullptr;
    }
    if (name != nrf91_regs::k_nrf91x1.target_name) {
      if (err) *err = "unknown target '" + name + "'";
      return nullptr;
    }
    // Named attach halts the core through the AHB-AP, which APPROTECT blocks.
    if (!link_.target.debug_enabled()) {
      if (err) *err = "target is locked (APPROTECT), AHB-AP not accessible";
      return nullptr;
    }
    link_.stats.session_attaches++;
    link_.stats.last_target_name = name;
    return std::make_unique<SimSession>(link_);
  }

 private:
  Link link_;
};

}  // namespace

// ===== SimProbeLister =====

std::unique_ptr<probe_transport::Probe> SimProbeLister::open(const probe_transport::ProbeSelector &sel,
                                                             std::string *err) {
  stats_.open_calls++;
  const uint64_t t = sim::now_ms();

  for (const ProbeEntry &e : probes_) {
    if (t < e.appears_at_ms) continue;  // not enumerated yet
    if (e.vendor_id != sel.vendor_id || e.product_id != sel.product_id) continue;
    if (sel.has_serial && e.serial != sel.serial) continue;

    stats_.probes_opened++;
    return std::make_unique<SimProbe>(target_, stats_);
  }

  if (err) *err = "no matching probe";
  return nullptr;
}

// ===== SimImageProgrammer =====

bool SimImageProgrammer::download_file(probe_transport::TargetSession &session, const std::string &path,
                                       probe_transport::ImageFormat format,
                                       const probe_transport::DownloadOptions &opts, std::string *err) {
  calls_++;
  last_path_ = path;
  last_format_ = format;
  last_preverify_ = opts.preverify;
  last_bytes_ = 0;
  last_skipped_ = false;

  if (!fail_cause_.empty()) {
    if (err) *err = fail_cause_;
    return false;
  }

  if (!session.core(0, err)) return false;

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (err) *err = "cannot open " + path;
    return false;
  }
  const std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  last_bytes_ = bytes.size();

  // Pack little-endian words, padding the tail with 0xFF like erased flash.
  std::vector<uint32_t> words((bytes.size() + 3) / 4, nrf91_regs::k_erased_word);
  for (size_t i = 0; i < bytes.size(); i++) {
    const uint32_t shift = (uint32_t)(i % 4) * 8;
    words[i / 4] &= ~(0xFFu << shift);
    words[i / 4] |= (uint32_t)bytes[i] << shift;
  }

  if (opts.preverify) {
    bool same = true;
    for (size_t i = 0; i < words.size() && same; i++) {
      if (target_.flash_word((uint32_t)(i * 4)) != words[i]) same = false;
    }
    if (same) {
      last_skipped_ = true;
      return true;
    }
  }

  for (size_t i = 0; i < words.size(); i++) target_.set_flash_word((uint32_t)(i * 4), words[i]);
  host_time::delay(k_download_ms);
  return true;
}

}  // namespace sim
