#pragma once

#include <cstdint>
#include <fstream>
#include <string>

namespace sim {

// CSV trace of every register access the device model sees, plus step markers.
// Columns: t_ms,event,ap,addr,value (ap = -1 for AHB accesses and markers).
class TraceLogger {
public:
  explicit TraceLogger(const std::string &path);

  bool ok() const { return out_.good(); }

  void log_access(uint64_t t_ms, const char *event, int ap, uint32_t addr, uint32_t value);

  // Point event (no address/value), e.g. "STEP_UNLOCK_BEGIN".
  void log_event(uint64_t t_ms, const std::string &name);

private:
  std::ofstream out_;
};

} // namespace sim
