/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "mcping/log.hpp"

#include <catch2/catch.hpp>

#include <string>

TEST_CASE("Log level defaults", "[log]") {
#ifdef NDEBUG
  REQUIRE(mcping::log::GetLevel() == mcping::log::Level::kInfo);
#else
  REQUIRE(mcping::log::GetLevel() == mcping::log::Level::kDebug);
#endif
}

TEST_CASE("Log SetLevel", "[log]") {
  auto prev = mcping::log::GetLevel();
  mcping::log::SetLevel(mcping::log::Level::kError);
  REQUIRE(mcping::log::GetLevel() == mcping::log::Level::kError);
  mcping::log::SetLevel(prev);
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  auto prev = mcping::log::GetLevel();
  REQUIRE(!mcping::log::IsInitialized());
  mcping::log::Init(mcping::log::Level::kWarn);
  REQUIRE(mcping::log::IsInitialized());
  REQUIRE(mcping::log::GetLevel() == mcping::log::Level::kWarn);
  mcping::log::Shutdown();
  REQUIRE(!mcping::log::IsInitialized());
  mcping::log::SetLevel(prev);
}

TEST_CASE("Log ParseLevel accepts names case-insensitively", "[log]") {
  mcping::log::Level lv = mcping::log::Level::kOff;
  REQUIRE(mcping::log::ParseLevel("debug", lv));
  REQUIRE(lv == mcping::log::Level::kDebug);
  REQUIRE(mcping::log::ParseLevel("INFO", lv));
  REQUIRE(lv == mcping::log::Level::kInfo);
  REQUIRE(mcping::log::ParseLevel("Warning", lv));
  REQUIRE(lv == mcping::log::Level::kWarn);
  REQUIRE(mcping::log::ParseLevel("off", lv));
  REQUIRE(lv == mcping::log::Level::kOff);
}

TEST_CASE("Log ParseLevel rejects unknown names", "[log]") {
  mcping::log::Level lv = mcping::log::Level::kInfo;
  REQUIRE(!mcping::log::ParseLevel("verbose", lv));
  REQUIRE(!mcping::log::ParseLevel("", lv));
  REQUIRE(!mcping::log::ParseLevel(nullptr, lv));
  REQUIRE(!mcping::log::ParseLevel("informational", lv));
  REQUIRE(lv == mcping::log::Level::kInfo);
}

TEST_CASE("Log macros compile and run", "[log]") {
  mcping::log::SetLevel(mcping::log::Level::kDebug);
  MCPING_LOG_DEBUG("Test", "debug %d", 1);
  MCPING_LOG_INFO("Test", "info %s", "msg");
  MCPING_LOG_WARN("Test", "warn");
  MCPING_LOG_ERROR("Test", "error %d %d", 1, 2);
  REQUIRE(true);
}

TEST_CASE("Log runtime level filtering", "[log]") {
  mcping::log::SetLevel(mcping::log::Level::kOff);
  MCPING_LOG_DEBUG("Test", "should not appear");
  MCPING_LOG_ERROR("Test", "should not appear");
  mcping::log::SetLevel(mcping::log::Level::kDebug);
  REQUIRE(true);
}

TEST_CASE("Log with message longer than the line buffer", "[log]") {
  mcping::log::SetLevel(mcping::log::Level::kDebug);
  std::string long_msg(MCPING_LOG_LINE_SIZE * 2U, 'x');
  MCPING_LOG_INFO("Test", "%s", long_msg.c_str());
  REQUIRE(true);
}
