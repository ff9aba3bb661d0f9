#include "src/cli_args.h"

#include <assert.h>
#include <stdio.h>
#include <string.h>

#include <initializer_list>
#include <string>
#include <vector>

// getopt wants mutable, nullptr-terminated argv.
struct Argv {
  std::vector<std::string> storage;
  std::vector<char *> ptrs;

  explicit Argv(std::initializer_list<const char *> args) {
    storage.push_back("nrf91_recover");
    for (const char *a : args) storage.push_back(a);
    for (std::string &s : storage) ptrs.push_back(&s[0]);
    ptrs.push_back(nullptr);
  }

  int argc() const { return (int)storage.size(); }
  char **argv() { return ptrs.data(); }
};

static cli_args::Parsed ok(std::initializer_list<const char *> args) {
  Argv a(args);
  cli_args::Parsed p;
  std::string err;
  if (!cli_args::parse(a.argc(), a.argv(), &p, &err)) {
    fprintf(stderr, "Expected OK but got error: %s\n", err.c_str());
    assert(false);
  }
  return p;
}

static std::string bad(std::initializer_list<const char *> args) {
  Argv a(args);
  cli_args::Parsed p;
  std::string err;
  if (cli_args::parse(a.argc(), a.argv(), &p, &err)) {
    fprintf(stderr, "Expected FAIL but parse succeeded\n");
    assert(false);
  }
  assert(!err.empty());
  return err;
}

static void test_defaults() {
  const cli_args::Parsed p = ok({"fw.hex"});
  assert(p.action == cli_args::Action::Run);
  assert(!p.verbose);
  assert(p.opts.image_path == "fw.hex");
  assert(p.opts.connect_timeout_ms == 2000);
  assert(!p.opts.force);
  assert(p.opts.selector.vendor_id == 0x2e8a);
  assert(p.opts.selector.product_id == 0x000c);
  assert(!p.opts.selector.has_serial);
  assert(p.opts.speed_khz == 12000);
  assert(p.opts.unlock_timing.erase_timeout_ms == 15000);
  assert(p.opts.unlock_timing.verify_window_ms == 1000);
  assert(p.opts.uicr_timing.ready_timeout_ms == poll_until::k_no_timeout);
}

static void test_all_options() {
  const cli_args::Parsed p = ok({"-f", "-t", "500", "--vendor-id", "0x1366", "--product-id=0x0105", "-s", "000123",
                                 "--speed", "4000", "--erase-timeout", "20000", "--unlock-window", "2500", "-v",
                                 "out/merged.hex"});
  assert(p.opts.force);
  assert(p.verbose);
  assert(p.opts.connect_timeout_ms == 500);
  assert(p.opts.selector.vendor_id == 0x1366);
  assert(p.opts.selector.product_id == 0x0105);
  assert(p.opts.selector.has_serial);
  assert(p.opts.selector.serial == "000123");
  assert(p.opts.speed_khz == 4000);
  assert(p.opts.unlock_timing.erase_timeout_ms == 20000);
  assert(p.opts.unlock_timing.verify_window_ms == 2500);
  assert(p.opts.image_path == "out/merged.hex");
}

static void test_options_after_image() {
  const cli_args::Parsed p = ok({"fw.hex", "--timeout=0x1f4", "--force"});
  assert(p.opts.image_path == "fw.hex");
  assert(p.opts.connect_timeout_ms == 500);
  assert(p.opts.force);
}

static void test_help_and_version() {
  assert(ok({"-h"}).action == cli_args::Action::Help);
  assert(ok({"--version"}).action == cli_args::Action::Version);

  const std::string u = cli_args::usage("nrf91_recover");
  assert(strstr(u.c_str(), "Usage: nrf91_recover [OPTIONS] <IMAGE>") != nullptr);
  assert(strstr(u.c_str(), "--vendor-id") != nullptr);
}

static void test_errors() {
  assert(bad({}).find("<IMAGE>") != std::string::npos);
  assert(bad({"a.hex", "b.hex"}).find("b.hex") != std::string::npos);
  assert(bad({"-t", "abc", "fw.hex"}).find("--timeout") != std::string::npos);
  bad({"-t", "-5", "fw.hex"});
  bad({"-t", "0xFFFFFFFF", "fw.hex"});
  bad({"--vendor-id", "0x10000", "fw.hex"});
  bad({"--speed", "0", "fw.hex"});
  bad({"--bogus", "fw.hex"});
  bad({"fw.hex", "-t"});
}

static void test_parse_u32() {
  uint32_t v = 0;
  assert(cli_args::parse_u32("12", 100, &v) && v == 12);
  assert(cli_args::parse_u32("0x2e8a", 0xFFFF, &v) && v == 0x2e8a);
  assert(cli_args::parse_u32("0", 0, &v) && v == 0);
  assert(!cli_args::parse_u32("", 100, &v));
  assert(!cli_args::parse_u32("12ms", 100, &v));
  assert(!cli_args::parse_u32("+1", 100, &v));
  assert(!cli_args::parse_u32("101", 100, &v));
  assert(!cli_args::parse_u32("99999999999999999999999", 0xFFFFFFFFu, &v));
}

int main() {
  test_defaults();
  test_all_options();
  test_options_after_image();
  test_help_and_version();
  test_errors();
  test_parse_u32();

  // parse() resets getopt state, so running it again gives the same answer.
  assert(ok({"-t", "700", "fw.hex"}).opts.connect_timeout_ms == 700);

  printf("OK\n");
  return 0;
}
