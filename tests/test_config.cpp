/**
 * @file test_config.cpp
 * @brief Tests for config.hpp - INI store, command line and validation.
 */

#include "mcping/config.hpp"

#include <catch2/catch.hpp>

#include <stdlib.h>
#include <unistd.h>

#include <cstdio>
#include <cstring>
#include <initializer_list>
#include <string>
#include <vector>

namespace {

/** Mutable argv built from literals; argv[0] is the program name. */
class Args {
 public:
  Args(std::initializer_list<const char*> list) {
    storage_.emplace_back("mcping");
    for (const char* s : list) storage_.emplace_back(s);
    for (auto& s : storage_) ptrs_.push_back(&s[0]);
    ptrs_.push_back(nullptr);
  }
  int argc() const { return static_cast<int>(storage_.size()); }
  char** argv() { return ptrs_.data(); }

 private:
  std::vector<std::string> storage_;
  std::vector<char*> ptrs_;
};

}  // namespace

// ============================================================================
// Defaults / command line
// ============================================================================

TEST_CASE("config - defaults", "[config]") {
  mcping::ProbeConfig cfg;
  REQUIRE(cfg.role == mcping::Role::kClient);
  REQUIRE(cfg.group == "ff12c909:3199:e8ba:6f6f:7d23:e6ae:d85d");
  REQUIRE(cfg.port == 3000);
  REQUIRE(cfg.interval_ms == 1000U);
  REQUIRE(cfg.timeout_ms == 500);
  REQUIRE(cfg.ifname.empty());
  REQUIRE(cfg.count == 0U);
  REQUIRE(cfg.report_ms == 5000U);
  REQUIRE(cfg.reply_mode == mcping::ReplyMode::kEcho);
  REQUIRE(cfg.loopback);
  REQUIRE(mcping::Validate(cfg).has_value());
}

TEST_CASE("config - short flags", "[config][cli]") {
  Args args{"-s", "-a", "ff02::1", "-p", "4000", "-n", "250", "-t", "100",
            "-I", "eth0", "-c", "10", "-r", "2000", "-m", "sequence", "-v"};
  mcping::ProbeConfig cfg;
  REQUIRE(mcping::ParseCommandLine(args.argc(), args.argv(), cfg).has_value());
  REQUIRE(cfg.role == mcping::Role::kServer);
  REQUIRE(cfg.group == "ff02::1");
  REQUIRE(cfg.port == 4000);
  REQUIRE(cfg.interval_ms == 250U);
  REQUIRE(cfg.timeout_ms == 100);
  REQUIRE(cfg.ifname == "eth0");
  REQUIRE(cfg.count == 10U);
  REQUIRE(cfg.report_ms == 2000U);
  REQUIRE(cfg.reply_mode == mcping::ReplyMode::kSequence);
  REQUIRE(cfg.log_level == mcping::log::Level::kDebug);
}

TEST_CASE("config - long flags", "[config][cli]") {
  Args args{"--server", "--maddr", "ff05::2", "--port", "5000", "--interval",
            "10", "--timeout", "20", "--ifname", "3", "--count", "1",
            "--report", "30", "--reply", "fixed", "--no-loop", "--help"};
  mcping::ProbeConfig cfg;
  REQUIRE(mcping::ParseCommandLine(args.argc(), args.argv(), cfg).has_value());
  REQUIRE(cfg.role == mcping::Role::kServer);
  REQUIRE(cfg.group == "ff05::2");
  REQUIRE(cfg.port == 5000);
  REQUIRE(cfg.interval_ms == 10U);
  REQUIRE(cfg.ifname == "3");
  REQUIRE(cfg.reply_mode == mcping::ReplyMode::kFixed);
  REQUIRE(!cfg.loopback);
  REQUIRE(cfg.show_help);
}

TEST_CASE("config - unknown option", "[config][cli]") {
  Args args{"--frobnicate"};
  mcping::ProbeConfig cfg;
  auto r = mcping::ParseCommandLine(args.argc(), args.argv(), cfg);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == mcping::ConfigError::kUnknownOption);
}

TEST_CASE("config - missing value", "[config][cli]") {
  Args args{"-p"};
  mcping::ProbeConfig cfg;
  auto r = mcping::ParseCommandLine(args.argc(), args.argv(), cfg);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == mcping::ConfigError::kMissingValue);
}

TEST_CASE("config - malformed numbers", "[config][cli]") {
  const char* bad[] = {"abc", "-1", "70000", "12x", ""};
  for (const char* v : bad) {
    Args args{"--port", v};
    mcping::ProbeConfig cfg;
    auto r = mcping::ParseCommandLine(args.argc(), args.argv(), cfg);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == mcping::ConfigError::kInvalidValue);
    REQUIRE(cfg.port == mcping::kDefaultPort);
  }
}

TEST_CASE("config - bad reply mode", "[config][cli]") {
  Args args{"-m", "loud"};
  mcping::ProbeConfig cfg;
  auto r = mcping::ParseCommandLine(args.argc(), args.argv(), cfg);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == mcping::ConfigError::kInvalidValue);
}

TEST_CASE("config - FindConfigPath", "[config][cli]") {
  Args with{"-s", "--config", "probe.ini"};
  REQUIRE(std::strcmp(mcping::FindConfigPath(with.argc(), with.argv()),
                      "probe.ini") == 0);
  Args short_form{"-f", "a.ini"};
  REQUIRE(std::strcmp(
              mcping::FindConfigPath(short_form.argc(), short_form.argv()),
              "a.ini") == 0);
  Args without{"-s", "-f"};
  REQUIRE(mcping::FindConfigPath(without.argc(), without.argv()) == nullptr);
}

TEST_CASE("config - Validate rejects zero intervals", "[config]") {
  mcping::ProbeConfig cfg;
  cfg.interval_ms = 0U;
  REQUIRE(mcping::Validate(cfg).get_error() ==
          mcping::ConfigError::kInvalidValue);

  cfg = mcping::ProbeConfig();
  cfg.timeout_ms = 0;
  REQUIRE(!mcping::Validate(cfg).has_value());

  cfg = mcping::ProbeConfig();
  cfg.report_ms = 0U;
  REQUIRE(!mcping::Validate(cfg).has_value());

  cfg = mcping::ProbeConfig();
  cfg.workers = 0U;
  REQUIRE(!mcping::Validate(cfg).has_value());
}

TEST_CASE("config - Validate caps reply pool sizing", "[config]") {
  mcping::ProbeConfig cfg;
  cfg.queue_depth = mcping::kMaxWorkerQueueDepth;
  cfg.workers = mcping::kMaxWorkerNum;
  REQUIRE(mcping::Validate(cfg).has_value());

  cfg.queue_depth = mcping::kMaxWorkerQueueDepth + 1U;
  REQUIRE(mcping::Validate(cfg).get_error() ==
          mcping::ConfigError::kInvalidValue);
  cfg.queue_depth = 4294967295U;
  REQUIRE(!mcping::Validate(cfg).has_value());

  cfg = mcping::ProbeConfig();
  cfg.workers = mcping::kMaxWorkerNum + 1U;
  REQUIRE(mcping::Validate(cfg).get_error() ==
          mcping::ConfigError::kInvalidValue);
}

TEST_CASE("config - PrintUsage lists every flag", "[config]") {
  char buf[4096] = {};
  FILE* f = ::fmemopen(buf, sizeof(buf) - 1U, "w");
  REQUIRE(f != nullptr);
  mcping::PrintUsage("mcping", f);
  std::fclose(f);
  const std::string text(buf);
  for (const char* flag : {"--server", "--maddr", "--port", "--interval",
                           "--timeout", "--ifname", "--count", "--report",
                           "--reply", "--no-loop", "--config", "--verbose"}) {
    REQUIRE(text.find(flag) != std::string::npos);
  }
}

// ============================================================================
// ConfigStore / INI
// ============================================================================

TEST_CASE("config - ConfigStore lookups are case-insensitive", "[config]") {
  mcping::IniConfig store;
  REQUIRE(store.AddEntry("Probe", "Port", "4000"));
  REQUIRE(store.AddEntry("probe", "port", "4001"));
  REQUIRE(store.EntryCount() == 1U);
  REQUIRE(std::strcmp(store.GetString("PROBE", "PORT"), "4001") == 0);
  REQUIRE(store.HasSection("probe"));
  REQUIRE(!store.HasKey("probe", "group"));
  REQUIRE(std::strcmp(store.GetString("x", "y", "dflt"), "dflt") == 0);
}

TEST_CASE("config - ApplyConfigStore maps sections", "[config]") {
  mcping::IniConfig store;
  store.AddEntry("probe", "group", "ff02::9");
  store.AddEntry("probe", "port", "3100");
  store.AddEntry("probe", "interval_ms", "200");
  store.AddEntry("probe", "count", "4");
  store.AddEntry("server", "reply", "sequence");
  store.AddEntry("server", "loopback", "off");
  store.AddEntry("server", "workers", "3");
  store.AddEntry("log", "level", "warn");

  mcping::ProbeConfig cfg;
  REQUIRE(mcping::ApplyConfigStore(store, cfg).has_value());
  REQUIRE(cfg.group == "ff02::9");
  REQUIRE(cfg.port == 3100);
  REQUIRE(cfg.interval_ms == 200U);
  REQUIRE(cfg.count == 4U);
  REQUIRE(cfg.timeout_ms == 500);
  REQUIRE(cfg.reply_mode == mcping::ReplyMode::kSequence);
  REQUIRE(!cfg.loopback);
  REQUIRE(cfg.workers == 3U);
  REQUIRE(cfg.log_level == mcping::log::Level::kWarn);
}

TEST_CASE("config - ApplyConfigStore rejects bad values", "[config]") {
  mcping::IniConfig store;
  store.AddEntry("log", "level", "chatty");
  mcping::ProbeConfig cfg;
  auto r = mcping::ApplyConfigStore(store, cfg);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == mcping::ConfigError::kInvalidValue);
}

#ifdef MCPING_CONFIG_INI_ENABLED

TEST_CASE("config - INI LoadBuffer then flags override", "[config][ini]") {
  const char* ini_data =
      "[probe]\n"
      "group = ff02::7\n"
      "port = 3300\n"
      "timeout_ms = 250\n"
      "[server]\n"
      "reply = fixed\n";

  mcping::IniConfig ini;
  REQUIRE(ini.LoadBuffer(ini_data).has_value());
  mcping::ProbeConfig cfg;
  REQUIRE(mcping::ApplyConfigStore(ini, cfg).has_value());
  REQUIRE(cfg.port == 3300);
  REQUIRE(cfg.timeout_ms == 250);

  Args args{"-p", "3400"};
  REQUIRE(mcping::ParseCommandLine(args.argc(), args.argv(), cfg).has_value());
  REQUIRE(cfg.port == 3400);
  REQUIRE(cfg.group == "ff02::7");
  REQUIRE(cfg.reply_mode == mcping::ReplyMode::kFixed);
}

TEST_CASE("config - INI LoadFile", "[config][ini]") {
  char path[] = "/tmp/mcping_test_XXXXXX.ini";
  const int fd = ::mkstemps(path, 4);
  REQUIRE(fd >= 0);
  FILE* f = ::fdopen(fd, "w");
  REQUIRE(f != nullptr);
  std::fputs("[probe]\ninterval_ms = 50\n[log]\nlevel = error\n", f);
  std::fclose(f);

  mcping::ProbeConfig cfg;
  REQUIRE(mcping::LoadConfigFile(path, cfg).has_value());
  REQUIRE(cfg.interval_ms == 50U);
  REQUIRE(cfg.log_level == mcping::log::Level::kError);
  REQUIRE(cfg.config_path == path);
  std::remove(path);
}

TEST_CASE("config - INI missing file", "[config][ini]") {
  mcping::ProbeConfig cfg;
  auto r = mcping::LoadConfigFile("/nonexistent/mcping.ini", cfg);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == mcping::ConfigError::kFileNotFound);
}

TEST_CASE("config - INI syntax error", "[config][ini]") {
  mcping::IniConfig ini;
  auto r = ini.LoadBuffer("[probe\nport = 1\n");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == mcping::ConfigError::kParseError);
}

#else

TEST_CASE("config - INI support compiled out", "[config][ini]") {
  mcping::ProbeConfig cfg;
  auto r = mcping::LoadConfigFile("mcping.ini", cfg);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == mcping::ConfigError::kFormatNotSupported);
}

#endif
