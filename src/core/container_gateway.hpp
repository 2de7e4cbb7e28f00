// core/container_gateway.hpp - Validated access to managed containers
#pragma once

#include "orchestrator.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sparkbox {

struct ContainerStats {
  double cpu_percent = 0.0;
  uint64_t memory_usage = 0;
  uint64_t memory_limit = 0;
  double memory_percent = 0.0;
  std::map<std::string, NetworkCounters> networks;
};

struct HostStats {
  double cpu_percent = 0.0;
  int cpu_cores = 0;
  uint64_t memory_total = 0;
  uint64_t memory_used = 0;
  double memory_percent = 0.0;
  uint64_t disk_total = 0;
  uint64_t disk_used = 0;
  double disk_percent = 0.0;
  uint64_t uptime_seconds = 0;
};

double round_to(double value, int decimals);

// cpu% = (dcpu / dsystem) * online_cpus * 100, mem% = usage / limit * 100,
// both rounded to two decimals.
ContainerStats compute_stats(const StatsSample &sample);

// Host CPU, memory, disk and uptime from /proc and statvfs.
HostStats read_host_stats();

// Every operation resolves the identifier against the current enumeration of
// prefixed containers first and throws NotFoundError when it does not match.
// Reads take no locks and may be polled from any number of sessions.
class ContainerGateway {
public:
  ContainerGateway(Orchestrator &orchestrator, std::string prefix);

  std::vector<ContainerInfo> list() const;
  ContainerInfo resolve(const std::string &identifier) const;

  ContainerStats stats(const std::string &identifier) const;
  void start(const std::string &identifier);
  void stop(const std::string &identifier);
  void restart(const std::string &identifier);
  std::unique_ptr<LogStream> open_logs(const std::string &identifier,
                                       int tail);

  SystemInfo system_info() const;
  const std::string &prefix() const { return prefix_; }

private:
  Orchestrator &orchestrator_;
  std::string prefix_;
};

} // namespace sparkbox
