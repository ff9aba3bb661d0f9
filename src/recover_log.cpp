#include "recover_log.h"

#include <cstdarg>
#include <cstdio>
#include <cstring>

namespace recover_log {

static bool g_verbose = false;
static bool g_console = true;
static ScopedCapture *g_capture = nullptr;

void set_verbose(bool enabled) { g_verbose = enabled; }
bool verbose_enabled() { return g_verbose; }

void set_console_enabled(bool enabled) { g_console = enabled; }

void emit(Channel ch, const char *text) {
  if (g_console) {
    switch (ch) {
      case Channel::Milestone:
        std::fprintf(stdout, "%s\n", text);
        std::fflush(stdout);
        break;
      case Channel::Error:
        std::fprintf(stderr, "%s\n", text);
        break;
      case Channel::Info:
        std::fprintf(stderr, "[info] %s\n", text);
        break;
    }
  }
  if (g_capture) {
    Line l;
    l.channel = ch;
    l.text = text;
    g_capture->lines_.push_back(l);
  }
}

static void vemit(Channel ch, const char *fmt, va_list args) {
  char buf[512];
  const int n = std::vsnprintf(buf, sizeof(buf), fmt, args);
  if (n < 0) {
    emit(ch, "(format error)");
    return;
  }
  emit(ch, buf);
}

void milestone(const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vemit(Channel::Milestone, fmt, args);
  va_end(args);
}

void error(const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vemit(Channel::Error, fmt, args);
  va_end(args);
}

void info(const char *fmt, ...) {
  // Captured even when not verbose: tests assert on diagnostics without
  // turning on console noise.
  if (!g_verbose && !g_capture) return;

  va_list args;
  va_start(args, fmt);
  if (g_verbose) {
    vemit(Channel::Info, fmt, args);
  } else {
    const bool console = g_console;
    g_console = false;
    vemit(Channel::Info, fmt, args);
    g_console = console;
  }
  va_end(args);
}

ScopedCapture::ScopedCapture() : prev_(g_capture) { g_capture = this; }

ScopedCapture::~ScopedCapture() { g_capture = prev_; }

std::vector<std::string> ScopedCapture::texts(Channel ch) const {
  std::vector<std::string> out;
  for (const Line &l : lines_) {
    if (l.channel == ch) out.push_back(l.text);
  }
  return out;
}

bool ScopedCapture::contains(Channel ch, const char *needle) const {
  for (const Line &l : lines_) {
    if (l.channel == ch && std::strstr(l.text.c_str(), needle) != nullptr) return true;
  }
  return false;
}

}  // namespace recover_log
