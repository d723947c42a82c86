/**
 * @file main.cpp
 * @brief mcping -- IPv6 multicast reachability prober.
 *
 * Server role joins the group and answers every probe with a unicast reply.
 * Client role sends "PING <seq>" to the group and reports the share of
 * probes that were answered, per responding peer.
 *
 * Usage:
 *   mcping -s [-a group] [-p port] [-I ifname]
 *   mcping    [-a group] [-p port] [-I ifname] [-n ms] [-t ms] [-c n]
 *
 * Exit codes: 0 ok, 1 startup failure, 2 usage error.
 */

#include "mcping/address.hpp"
#include "mcping/client.hpp"
#include "mcping/config.hpp"
#include "mcping/endpoint.hpp"
#include "mcping/log.hpp"
#include "mcping/server.hpp"
#include "mcping/shutdown.hpp"
#include "mcping/stats.hpp"

#include <cstdint>
#include <cstdio>
#include <thread>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void AnnounceSignal(int signo) {
  if (signo != 0) {
    std::printf("Ctrl-C received, printing stats...\n");
    std::fflush(stdout);
  }
}

void StopServer(int signo, void* ctx) {
  AnnounceSignal(signo);
  static_cast<mcping::ProbeServer*>(ctx)->Stop();
}

void StopClient(int signo, void* ctx) {
  AnnounceSignal(signo);
  static_cast<mcping::ProbeClient*>(ctx)->Stop();
}

void InstallShutdown(mcping::ShutdownManager& mgr, mcping::ShutdownFn fn,
                     void* ctx) {
  auto reg = mgr.Register(fn, ctx);
  if (!reg.has_value()) {
    MCPING_LOG_WARN("main", "shutdown callback not registered: %s",
                    mcping::ToString(reg.get_error()));
    return;
  }
  auto sig = mgr.InstallSignalHandlers();
  if (!sig.has_value()) {
    MCPING_LOG_WARN("main", "signal handlers not installed: %s",
                    mcping::ToString(sig.get_error()));
  }
}

int RunServer(const mcping::ProbeConfig& cfg, const mcping::GroupAddress& group,
              mcping::InterfaceRef iface) {
  std::printf("Starting server: joining multicast %s on port %u (if_index=%u)\n",
              group.ToString().c_str(), static_cast<unsigned>(cfg.port),
              iface.Index());
  std::fflush(stdout);

  auto ep = mcping::Endpoint::BindServer(cfg.port, group, iface, cfg.loopback);
  if (!ep.has_value()) {
    MCPING_LOG_ERROR("main", "cannot open server endpoint: %s",
                     mcping::ToString(ep.get_error()));
    return kExitFailure;
  }

  mcping::ServerOptions opts;
  opts.reply_mode = cfg.reply_mode;
  opts.reply_workers = cfg.workers;
  opts.reply_queue_depth = cfg.queue_depth;
  mcping::ProbeServer server(ep.value(), opts);

  mcping::ShutdownManager mgr;
  InstallShutdown(mgr, &StopServer, &server);

  server.Start();
  mgr.WaitForShutdown();
  server.Stop();

  const mcping::ServerStats s = server.GetStats();
  std::printf("FINAL: received=%llu replies=%llu failed=%llu dropped=%llu\n",
              static_cast<unsigned long long>(s.received),
              static_cast<unsigned long long>(s.replies_sent),
              static_cast<unsigned long long>(s.reply_failures),
              static_cast<unsigned long long>(s.replies_dropped));
  return kExitOk;
}

int RunClient(const mcping::ProbeConfig& cfg, const mcping::GroupAddress& group,
              mcping::InterfaceRef iface) {
  auto ep = mcping::Endpoint::BindClient(iface);
  if (!ep.has_value()) {
    MCPING_LOG_ERROR("main", "cannot open client endpoint: %s",
                     mcping::ToString(ep.get_error()));
    return kExitFailure;
  }

  const mcping::SocketAddress dest =
      mcping::SocketAddress::FromIn6(group.Raw(), cfg.port, iface.Index());
  std::printf("Starting client: sending to %s every %u ms, timeout %d ms\n",
              dest.ToString().c_str(), cfg.interval_ms, cfg.timeout_ms);
  std::fflush(stdout);

  mcping::ClientOptions opts;
  opts.interval_ms = cfg.interval_ms;
  opts.timeout_ms = cfg.timeout_ms;
  opts.report_interval_ms = cfg.report_ms;
  opts.count = cfg.count;

  mcping::StatsAggregator stats;
  mcping::ProbeClient client(ep.value(), dest, stats, opts);

  // Start before the stop callback can run.
  client.Start();

  mcping::ShutdownManager mgr;
  InstallShutdown(mgr, &StopClient, &client);
  std::thread waiter([&mgr]() { mgr.WaitForShutdown(); });

  client.Wait();
  mgr.Quit();
  waiter.join();

  client.PrintFinal();
  return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
  mcping::ProbeConfig cfg;

  const char* ini_path = mcping::FindConfigPath(argc, argv);
  if (ini_path != nullptr &&
      !mcping::LoadConfigFile(ini_path, cfg).has_value()) {
    return kExitFailure;
  }
  if (!mcping::ParseCommandLine(argc, argv, cfg).has_value()) {
    mcping::PrintUsage(argv[0], stderr);
    return kExitUsage;
  }
  if (cfg.show_help) {
    mcping::PrintUsage(argv[0], stdout);
    return kExitOk;
  }
  if (!mcping::Validate(cfg).has_value()) {
    return kExitUsage;
  }

  mcping::log::Init(cfg.log_level);

  auto group = mcping::ParseMulticastAddress(cfg.group.c_str());
  if (!group.has_value()) {
    MCPING_LOG_ERROR("main", "bad multicast address '%s': %s",
                     cfg.group.c_str(), mcping::ToString(group.get_error()));
    mcping::log::Shutdown();
    return kExitFailure;
  }

  auto iface = mcping::ResolveInterface(cfg.ifname.c_str());
  if (!iface.has_value()) {
    mcping::log::Shutdown();
    return kExitFailure;
  }

  const int rc = (cfg.role == mcping::Role::kServer)
                     ? RunServer(cfg, group.value(), iface.value())
                     : RunClient(cfg, group.value(), iface.value());
  mcping::log::Shutdown();
  return rc;
}
