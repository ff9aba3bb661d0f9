#include "logger.h"

#include <iomanip>

namespace sim {

TraceLogger::TraceLogger(const std::string &path) : out_(path) {
  out_ << "t_ms,event,ap,addr,value\n";
}

void TraceLogger::log_access(uint64_t t_ms, const char *event, int ap, uint32_t addr, uint32_t value) {
  out_ << t_ms << "," << event << "," << ap << ",0x" << std::hex << std::setw(8) << std::setfill('0') << addr
       << ",0x" << std::setw(8) << value << std::dec << std::setfill(' ') << "\n";
}

void TraceLogger::log_event(uint64_t t_ms, const std::string &name) {
  out_ << t_ms << "," << name << ",-1,,\n";
}

} // namespace sim
