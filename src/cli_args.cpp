#include "cli_args.h"

#include <getopt.h>

#include <cerrno>
#include <cstdlib>

namespace cli_args {

enum LongOnly : int {
  OPT_VENDOR_ID = 0x100,
  OPT_PRODUCT_ID,
  OPT_SPEED,
  OPT_ERASE_TIMEOUT,
  OPT_UNLOCK_WINDOW,
};

bool parse_u32(const char *s, uint32_t max, uint32_t *out) {
  if (!s || !*s || *s == '-' || *s == '+') return false;
  errno = 0;
  char *end = nullptr;
  const unsigned long long v = std::strtoull(s, &end, 0);
  if (errno != 0 || !end || *end != '\0') return false;
  if (v > max) return false;
  *out = (uint32_t)v;
  return true;
}

std::string usage(const char *prog) {
  std::string u;
  u += "nRF91x1 recovery tool ";
  u += k_version;
  u += "\n\nUsage: ";
  u += (prog && *prog) ? prog : "nrf91_recover";
  u += " [OPTIONS] <IMAGE>\n\n";
  u += "Arguments:\n";
  u += "  <IMAGE>                   Path to the hex file to flash\n\n";
  u += "Options:\n";
  u += "  -t, --timeout <MS>        Timeout in milliseconds for probe connection [default: 2000]\n";
  u += "  -f, --force               Force unlock even if device appears unlocked\n";
  u += "      --vendor-id <ID>      Vendor ID for debug probe [default: 0x2e8a]\n";
  u += "      --product-id <ID>     Product ID for debug probe [default: 0x000c]\n";
  u += "  -s, --serial <SN>         Serial number of debug probe\n";
  u += "      --speed <KHZ>         SWD clock in kHz [default: 12000]\n";
  u += "      --erase-timeout <MS>  ERASEALLSTATUS ceiling [default: 15000]\n";
  u += "      --unlock-window <MS>  Time allowed for DbgStatus after reset [default: 1000]\n";
  u += "  -v, --verbose             Print register-level diagnostics\n";
  u += "  -h, --help                Print help\n";
  u += "  -V, --version             Print version\n";
  return u;
}

static bool bad_value(std::string *err, const char *opt, const char *val) {
  if (err) {
    *err = "invalid value '";
    *err += val ? val : "";
    *err += "' for ";
    *err += opt;
  }
  return false;
}

bool parse(int argc, char **argv, Parsed *out, std::string *err) {
  static const struct option k_long[] = {
      {"timeout", required_argument, nullptr, 't'},
      {"force", no_argument, nullptr, 'f'},
      {"vendor-id", required_argument, nullptr, OPT_VENDOR_ID},
      {"product-id", required_argument, nullptr, OPT_PRODUCT_ID},
      {"serial", required_argument, nullptr, 's'},
      {"speed", required_argument, nullptr, OPT_SPEED},
      {"erase-timeout", required_argument, nullptr, OPT_ERASE_TIMEOUT},
      {"unlock-window", required_argument, nullptr, OPT_UNLOCK_WINDOW},
      {"verbose", no_argument, nullptr, 'v'},
      {"help", no_argument, nullptr, 'h'},
      {"version", no_argument, nullptr, 'V'},
      {nullptr, 0, nullptr, 0},
  };

  Parsed p;

  // getopt keeps global state; reset it so parse() can be called repeatedly.
  optind = 0;
  opterr = 0;

  for (;;) {
    const int c = getopt_long(argc, argv, "t:fs:vhV", k_long, nullptr);
    if (c == -1) break;

    uint32_t v = 0;
    switch (c) {
      case 't':
        if (!parse_u32(optarg, 0xFFFFFFFEu, &v)) return bad_value(err, "--timeout", optarg);
        p.opts.connect_timeout_ms = v;
        break;
      case 'f':
        p.opts.force = true;
        break;
      case OPT_VENDOR_ID:
        if (!parse_u32(optarg, 0xFFFFu, &v)) return bad_value(err, "--vendor-id", optarg);
        p.opts.selector.vendor_id = (uint16_t)v;
        break;
      case OPT_PRODUCT_ID:
        if (!parse_u32(optarg, 0xFFFFu, &v)) return bad_value(err, "--product-id", optarg);
        p.opts.selector.product_id = (uint16_t)v;
        break;
      case 's':
        p.opts.selector.has_serial = true;
        p.opts.selector.serial = optarg;
        break;
      case OPT_SPEED:
        if (!parse_u32(optarg, 0xFFFFFFFFu, &v) || v == 0) return bad_value(err, "--speed", optarg);
        p.opts.speed_khz = v;
        break;
      case OPT_ERASE_TIMEOUT:
        if (!parse_u32(optarg, 0xFFFFFFFEu, &v)) return bad_value(err, "--erase-timeout", optarg);
        p.opts.unlock_timing.erase_timeout_ms = v;
        break;
      case OPT_UNLOCK_WINDOW:
        if (!parse_u32(optarg, 0xFFFFFFFEu, &v)) return bad_value(err, "--unlock-window", optarg);
        p.opts.unlock_timing.verify_window_ms = v;
        break;
      case 'v':
        p.verbose = true;
        break;
      case 'h':
        p.action = Action::Help;
        break;
      case 'V':
        p.action = Action::Version;
        break;
      case '?':
      default:
        if (err) {
          *err = "unrecognized or incomplete option '";
          *err += (optind > 0 && optind <= argc) ? argv[optind - 1] : "?";
          *err += "'";
        }
        return false;
    }
  }

  if (p.action == Action::Run) {
    if (optind >= argc) {
      if (err) *err = "missing required argument <IMAGE>";
      return false;
    }
    if (argc - optind > 1) {
      if (err) *err = std::string("unexpected argument '") + argv[optind + 1] + "'";
      return false;
    }
    p.opts.image_path = argv[optind];
  }

  *out = p;
  return true;
}

}  // namespace cli_args
