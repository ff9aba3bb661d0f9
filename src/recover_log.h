#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Console output for the recovery tool.
//
// Three channels:
//   milestone() -> stdout, always (the user-facing progress lines)
//   error()     -> stderr, always
//   info()      -> stderr, only when verbose is enabled (register-level diagnostics)
//
// Everything printed can also be captured into RAM (see ScopedCapture), which is
// how tests check the order of milestone lines.
namespace recover_log {

enum class Channel : uint8_t { Milestone, Error, Info };

struct Line {
  Channel channel;
  std::string text;
};

// Verbose register diagnostics (default: off).
void set_verbose(bool enabled);
bool verbose_enabled();

// Suppress console output while still capturing (tests keep their output short).
void set_console_enabled(bool enabled);

void milestone(const char *fmt, ...) __attribute__((format(printf, 1, 2)));
void error(const char *fmt, ...) __attribute__((format(printf, 1, 2)));
void info(const char *fmt, ...) __attribute__((format(printf, 1, 2)));

// Captures every line emitted while alive. Captures do not nest; the inner one
// wins and the outer one resumes when it is destroyed.
class ScopedCapture {
 public:
  ScopedCapture();
  ~ScopedCapture();

  const std::vector<Line> &lines() const { return lines_; }

  // Texts of one channel, in order.
  std::vector<std::string> texts(Channel ch) const;

  // True if any line on ch contains needle.
  bool contains(Channel ch, const char *needle) const;

 private:
  friend void emit(Channel ch, const char *text);

  ScopedCapture(const ScopedCapture &) = delete;
  ScopedCapture &operator=(const ScopedCapture &) = delete;

  std::vector<Line> lines_;
  ScopedCapture *prev_ = nullptr;
};

}  // namespace recover_log
