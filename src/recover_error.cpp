#include "recover_error.h"

#include <cstdarg>
#include <cstdio>

namespace recover_error {

const char *kind_to_str(Kind k) {
  switch (k) {
    case Kind::None: return "none";
    case Kind::FileNotFound: return "file_not_found";
    case Kind::ProbeTimeout: return "probe_timeout";
    case Kind::Transport: return "transport";
    case Kind::CtrlApInvalid: return "ctrl_ap_invalid";
    case Kind::NeverUnlocked: return "never_unlocked";
    case Kind::Attach: return "attach";
    case Kind::Flashing: return "flashing";
    case Kind::UicrNeedsErase: return "uicr_needs_erase";
    case Kind::Timeout: return "timeout";
    default: return "(unknown)";
  }
}

bool fail(Error *err, Kind kind, const char *fmt, ...) {
  if (!err) return false;
  err->kind = kind;

  char buf[256];
  va_list args;
  va_start(args, fmt);
  const int n = std::vsnprintf(buf, sizeof(buf), fmt, args);
  va_end(args);
  err->message = (n < 0) ? std::string("(format error)") : std::string(buf);
  return false;
}

}  // namespace recover_error
