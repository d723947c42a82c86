/**
 * @file test_endpoint.cpp
 * @brief Tests for endpoint.hpp - bind factories, Send/Receive, membership.
 */

#include "mcping/endpoint.hpp"

#include "test_helpers.hpp"

#include <catch2/catch.hpp>

#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <cstring>
#include <string>
#include <thread>

namespace {

/** Redirects fd 2 into a temporary file for the lifetime of the object. */
class StderrCapture {
 public:
  StderrCapture() : file_(std::tmpfile()), saved_(-1) {
    if (file_ != nullptr) {
      std::fflush(stderr);
      saved_ = ::dup(STDERR_FILENO);
      (void)::dup2(::fileno(file_), STDERR_FILENO);
    }
  }

  ~StderrCapture() {
    Restore();
    if (file_ != nullptr) std::fclose(file_);
  }

  std::string Text() {
    Restore();
    std::string text;
    if (file_ == nullptr) return text;
    std::rewind(file_);
    char buf[256];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), file_)) > 0) {
      text.append(buf, n);
    }
    return text;
  }

 private:
  void Restore() {
    if (saved_ >= 0) {
      std::fflush(stderr);
      (void)::dup2(saved_, STDERR_FILENO);
      ::close(saved_);
      saved_ = -1;
    }
  }

  FILE* file_;
  int saved_;
};

}  // namespace

TEST_CASE("endpoint - BindUnicast on ephemeral port", "[endpoint]") {
  auto ep = mcping::Endpoint::BindUnicast(0);
  REQUIRE(ep.has_value());
  REQUIRE(ep.value().IsValid());
  REQUIRE(ep.value().LocalPort() > 0);
  REQUIRE(!ep.value().IsJoined());
}

TEST_CASE("endpoint - BindClient with default interface", "[endpoint]") {
  auto ep = mcping::Endpoint::BindClient();
  REQUIRE(ep.has_value());
  REQUIRE(ep.value().LocalPort() > 0);
  REQUIRE(ep.value().Interface().IsDefault());
}

TEST_CASE("endpoint - BindClient with unknown interface index fails",
          "[endpoint]") {
  auto ep = mcping::Endpoint::BindClient(mcping::InterfaceRef(0x7fffffffU));
  REQUIRE(!ep.has_value());
  REQUIRE(ep.get_error() == mcping::SocketError::kBindFailed);
}

TEST_CASE("endpoint - Receive reports timeout, not failure", "[endpoint]") {
  auto ep = mcping::Endpoint::BindUnicast(0);
  REQUIRE(ep.has_value());

  char buf[16];
  mcping::SocketAddress src;
  auto start = std::chrono::steady_clock::now();
  auto r = ep.value().Receive(buf, sizeof(buf), src, 50);
  auto elapsed = std::chrono::steady_clock::now() - start;
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == mcping::SocketError::kTimeout);
  REQUIRE(elapsed >= std::chrono::milliseconds(40));
}

TEST_CASE("endpoint - Send and Receive over loopback", "[endpoint]") {
  MCPING_REQUIRE_IPV6_LOOPBACK();

  auto a = mcping::Endpoint::BindUnicast(0);
  auto b = mcping::Endpoint::BindClient();
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());

  const auto dest = mcping::SocketAddress::Loopback(a.value().LocalPort());
  const char* msg = "PING 7";
  auto sent = b.value().Send(msg, std::strlen(msg), dest);
  REQUIRE(sent.has_value());

  char buf[mcping::kMaxDatagramSize];
  mcping::SocketAddress src;
  auto got = a.value().Receive(buf, sizeof(buf), src, 1000);
  REQUIRE(got.has_value());
  REQUIRE(got.value() == static_cast<int32_t>(std::strlen(msg)));
  REQUIRE(std::memcmp(buf, msg, std::strlen(msg)) == 0);
  REQUIRE(src.Port() == b.value().LocalPort());
}

TEST_CASE("endpoint - concurrent send and receive on one endpoint",
          "[endpoint]") {
  MCPING_REQUIRE_IPV6_LOOPBACK();

  auto self = mcping::Endpoint::BindUnicast(0);
  REQUIRE(self.has_value());
  mcping::Endpoint& ep = self.value();
  const auto dest = mcping::SocketAddress::Loopback(ep.LocalPort());

  constexpr int kCount = 20;
  int received = 0;
  std::thread rx([&]() {
    char buf[64];
    mcping::SocketAddress src;
    while (received < kCount) {
      auto r = ep.Receive(buf, sizeof(buf), src, 1000);
      if (!r.has_value()) break;
      ++received;
    }
  });

  bool all_sent = true;
  for (int i = 0; i < kCount; ++i) {
    const char msg[] = "x";
    all_sent = ep.Send(msg, 1, dest).has_value() && all_sent;
  }
  rx.join();
  REQUIRE(all_sent);
  REQUIRE(received == kCount);
}

TEST_CASE("endpoint - move transfers ownership", "[endpoint]") {
  auto r = mcping::Endpoint::BindUnicast(0);
  REQUIRE(r.has_value());
  const uint16_t port = r.value().LocalPort();

  mcping::Endpoint moved = static_cast<mcping::Endpoint&&>(r.value());
  REQUIRE(moved.IsValid());
  REQUIRE(moved.LocalPort() == port);
  REQUIRE(!r.value().IsValid());
}

TEST_CASE("endpoint - BindServer joins and leaves the group",
          "[endpoint][multicast]") {
  auto group = mcping::ParseMulticastAddress("ff12::c909:1");
  REQUIRE(group.has_value());

  auto ep = mcping::Endpoint::BindServer(0, group.value(),
                                         mcping::InterfaceRef::Default());
  if (!ep.has_value()) {
    WARN("multicast join unavailable: " << mcping::ToString(ep.get_error()));
    return;
  }
  REQUIRE(ep.value().IsJoined());
  REQUIRE(ep.value().Group() == group.value());

  REQUIRE(ep.value().LeaveGroup().has_value());
  REQUIRE(!ep.value().IsJoined());
  // Second leave is a no-op.
  REQUIRE(ep.value().LeaveGroup().has_value());
}

TEST_CASE("endpoint - two servers share one port", "[endpoint][multicast]") {
  auto group = mcping::ParseMulticastAddress("ff12::c909:2");
  REQUIRE(group.has_value());

  auto first = mcping::Endpoint::BindServer(0, group.value(),
                                            mcping::InterfaceRef::Default());
  if (!first.has_value()) {
    WARN("multicast join unavailable: " << mcping::ToString(first.get_error()));
    return;
  }
  const uint16_t port = first.value().LocalPort();
  auto second = mcping::Endpoint::BindServer(port, group.value(),
                                             mcping::InterfaceRef::Default());
  REQUIRE(second.has_value());
  REQUIRE(second.value().LocalPort() == port);
}

TEST_CASE("endpoint - join log names the bound port", "[endpoint][multicast]") {
  auto group = mcping::ParseMulticastAddress("ff12::c909:3");
  REQUIRE(group.has_value());

  const mcping::log::Level prev = mcping::log::GetLevel();
  mcping::log::SetLevel(mcping::log::Level::kInfo);
  StderrCapture capture;
  auto ep = mcping::Endpoint::BindServer(0, group.value(),
                                         mcping::InterfaceRef::Default());
  const std::string text = capture.Text();
  mcping::log::SetLevel(prev);
  if (!ep.has_value()) {
    WARN("multicast join unavailable: " << mcping::ToString(ep.get_error()));
    return;
  }

  const uint16_t port = ep.value().LocalPort();
  REQUIRE(port != 0U);
  REQUIRE(text.find("on port " + std::to_string(port) + " ") !=
          std::string::npos);
  REQUIRE(text.find("on port 0 ") == std::string::npos);
}
