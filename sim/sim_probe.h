#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "nrf91_target.h"
#include "probe_transport.h"

// probe_transport backend on top of the nRF91 device model.
//
// One lister, one (or more) USB probe entries, all wired to the same target.
// Probes "appear" on the bus at a configurable simulated time so connection
// retries can be exercised.
namespace sim {

struct ProbeEntry {
  uint16_t vendor_id = 0x2e8a;
  uint16_t product_id = 0x000c;
  std::string serial = "E6614103E7176A23";
  uint64_t appears_at_ms = 0;
};

// What the backend saw, for tests and the simulation report.
struct ProbeStats {
  unsigned open_calls = 0;
  unsigned probes_opened = 0;
  unsigned raw_attaches = 0;
  unsigned session_attaches = 0;
  uint32_t speed_khz = 0;  // last set_speed(), 0 = never set
  std::string last_target_name;
};

class SimProbeLister : public probe_transport::ProbeLister {
 public:
  explicit SimProbeLister(Nrf91Target &target) : target_(target) {}

  void add_probe(const ProbeEntry &e) { probes_.push_back(e); }

  const ProbeStats &stats() const { return stats_; }

  std::unique_ptr<probe_transport::Probe> open(const probe_transport::ProbeSelector &sel,
                                               std::string *err) override;

 private:
  Nrf91Target &target_;
  std::vector<ProbeEntry> probes_;
  ProbeStats stats_;
};

// Test double for the flash algorithm. It checks the image can be read, stores
// its raw bytes at flash address 0 (the file is not parsed) and records how it
// was called.
class SimImageProgrammer : public probe_transport::ImageProgrammer {
 public:
  explicit SimImageProgrammer(Nrf91Target &target) : target_(target) {}

  // Make the next download_file() calls fail with cause (empty = succeed).
  void fail_with(const std::string &cause) { fail_cause_ = cause; }

  bool download_file(probe_transport::TargetSession &session, const std::string &path,
                     probe_transport::ImageFormat format, const probe_transport::DownloadOptions &opts,
                     std::string *err) override;

  unsigned calls() const { return calls_; }
  const std::string &last_path() const { return last_path_; }
  probe_transport::ImageFormat last_format() const { return last_format_; }
  bool last_preverify() const { return last_preverify_; }
  size_t last_bytes() const { return last_bytes_; }
  // True if preverify found flash already matching and nothing was written.
  bool last_skipped() const { return last_skipped_; }

 private:
  // Simulated time spent per download.
  static constexpr uint32_t k_download_ms = 200;

  Nrf91Target &target_;
  std::string fail_cause_;

  unsigned calls_ = 0;
  std::string last_path_;
  probe_transport::ImageFormat last_format_ = probe_transport::ImageFormat::Hex;
  bool last_preverify_ = false;
  size_t last_bytes_ = 0;
  bool last_skipped_ = false;
};

}  // namespace sim
