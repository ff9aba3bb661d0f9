#pragma once

#include <cstdint>
#include <memory>
#include <string>

// Capabilities the recovery sequence consumes from a debug probe backend.
//
// The recovery code only ever talks to these interfaces. The shipped backend is
// the register-level device model in sim/; a hardware backend (CMSIS-DAP, J-Link,
// ...) implements the same classes.
//
// Error convention: every fallible call returns false and, if err is non-null,
// writes a short human-readable cause into *err.
namespace probe_transport {

// Fully qualified AP address: debug port + AP index (APSEL).
struct ApAddress {
  // DP selector. default_dp = true means "the only DP on the wire"; otherwise
  // dp_targetsel is the SWD multi-drop TARGETSEL value.
  bool default_dp;
  uint32_t dp_targetsel;
  uint8_t ap;

  constexpr ApAddress(uint8_t ap_, bool default_dp_ = true, uint32_t targetsel = 0)
      : default_dp(default_dp_), dp_targetsel(targetsel), ap(ap_) {}

  static constexpr ApAddress on_default_dp(uint8_t ap_) { return ApAddress(ap_); }
};

// Probe selection by USB identity.
struct ProbeSelector {
  uint16_t vendor_id = 0x2e8a;   // Raspberry Pi debugprobe
  uint16_t product_id = 0x000c;
  bool has_serial = false;
  std::string serial;
};

// Raw AP register access at the default DP, usable before a target is named.
// Destroying the interface releases it (the probe goes back to idle and can be
// attached again).
class RawApInterface {
 public:
  virtual ~RawApInterface() = default;
  virtual bool read_ap_register(const ApAddress &ap, uint8_t reg, uint32_t *val_out, std::string *err) = 0;
  virtual bool write_ap_register(const ApAddress &ap, uint8_t reg, uint32_t val, std::string *err) = 0;
};

// One CPU core of an attached target.
class CoreHandle {
 public:
  virtual ~CoreHandle() = default;
  virtual bool read_word32(uint32_t addr, uint32_t *val_out, std::string *err) = 0;
  virtual bool write_word32(uint32_t addr, uint32_t val, std::string *err) = 0;
  virtual bool reset(std::string *err) = 0;
};

// Attached, addressable view of a named target. Released on destruction.
class TargetSession {
 public:
  virtual ~TargetSession() = default;
  // Returns nullptr (and fills err) if the index is not a core of this target.
  // The handle is owned by the session.
  virtual CoreHandle *core(unsigned index, std::string *err) = 0;
};

class Probe {
 public:
  virtual ~Probe() = default;

  virtual bool set_speed(uint32_t khz, std::string *err) = 0;

  // Attach without naming a target (raw AP access only).
  // The probe must outlive the returned interface.
  virtual std::unique_ptr<RawApInterface> attach_unspecified(std::string *err) = 0;

  // Attach to a named target. The probe must outlive the returned session.
  virtual std::unique_ptr<TargetSession> attach(const char *target_name, std::string *err) = 0;
};

class ProbeLister {
 public:
  virtual ~ProbeLister() = default;
  // Returns nullptr if no probe matches (yet).
  virtual std::unique_ptr<Probe> open(const ProbeSelector &sel, std::string *err) = 0;
};

enum class ImageFormat : uint8_t { Hex, Bin, Elf };

struct DownloadOptions {
  // Compare flash against the image first and skip unchanged sectors.
  bool preverify = false;
};

// Writes an image file into target flash. Flashing algorithms are provided by
// the backend; the recovery sequence only orders the call.
class ImageProgrammer {
 public:
  virtual ~ImageProgrammer() = default;
  virtual bool download_file(TargetSession &session, const std::string &path, ImageFormat format,
                             const DownloadOptions &opts, std::string *err) = 0;
};

}  // namespace probe_transport
