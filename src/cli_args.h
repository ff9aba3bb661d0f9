#pragma once

#include <cstdint>
#include <string>

#include "recovery.h"

namespace cli_args {

static constexpr const char *k_version = "0.3.0";

enum class Action : uint8_t { Run, Help, Version };

struct Parsed {
  Action action = Action::Run;
  bool verbose = false;
  recovery::Options opts;
};

// Parse argv (argv[0] is the program name). Returns false and fills err on a
// usage error; the caller prints usage() and exits 2.
//
// Numbers accept decimal or 0x-prefixed hex.
bool parse(int argc, char **argv, Parsed *out, std::string *err);

// Full usage text for --help / usage errors.
std::string usage(const char *prog);

// Strict unsigned parse ("12", "0x2e8a"). Rejects empty strings, trailing
// garbage and values above max.
bool parse_u32(const char *s, uint32_t max, uint32_t *out);

}  // namespace cli_args
