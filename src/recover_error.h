#pragma once

#include <cstdint>
#include <string>

namespace recover_error {

enum class Kind : uint8_t {
  None = 0,
  FileNotFound,    // image path missing
  ProbeTimeout,    // no matching probe within the connect timeout
  Transport,       // probe / AP / memory access failed
  CtrlApInvalid,   // CTRL-AP IDR reads 0 (wrong AP index)
  NeverUnlocked,   // DbgStatus stayed 0 after ERASEALL + reset
  Attach,          // named-target attach failed
  Flashing,        // image programmer failed
  UicrNeedsErase,  // requested UICR value would set bits
  Timeout,         // optional bounded wait expired
};

struct Error {
  Kind kind = Kind::None;
  std::string message;
};

// Short stable name for logs / tests ("ctrl_ap_invalid", ...).
const char *kind_to_str(Kind k);

// Fill *err (if non-null) with kind + printf-style message. Always returns false
// so call sites can write `return recover_error::fail(err, ...);`.
bool fail(Error *err, Kind kind, const char *fmt, ...) __attribute__((format(printf, 3, 4)));

}  // namespace recover_error
