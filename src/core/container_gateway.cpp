// core/container_gateway.cpp - Managed container access implementation
#include "container_gateway.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include <chrono>
#include <cmath>
#include <fstream>
#include <sstream>
#include <sys/statvfs.h>
#include <thread>

namespace sparkbox {

double round_to(double value, int decimals) {
  double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

ContainerStats compute_stats(const StatsSample &sample) {
  ContainerStats stats;

  double cpu_delta = static_cast<double>(sample.cpu.total_usage) -
                     static_cast<double>(sample.precpu.total_usage);
  double system_delta = static_cast<double>(sample.cpu.system_usage) -
                        static_cast<double>(sample.precpu.system_usage);
  uint32_t cpus = sample.cpu.online_cpus > 0 ? sample.cpu.online_cpus : 1;

  double cpu_percent = 0.0;
  if (system_delta > 0.0 && cpu_delta > 0.0) {
    cpu_percent = (cpu_delta / system_delta) * cpus * 100.0;
  }
  stats.cpu_percent = round_to(cpu_percent, 2);

  stats.memory_usage = sample.memory_usage;
  stats.memory_limit = sample.memory_limit > 0 ? sample.memory_limit : 1;
  stats.memory_percent = round_to(static_cast<double>(stats.memory_usage) /
                                      static_cast<double>(stats.memory_limit) *
                                      100.0,
                                  2);
  stats.networks = sample.networks;
  return stats;
}

struct CpuTimes {
  uint64_t idle = 0;
  uint64_t total = 0;
  int cores = 0;
};

static CpuTimes read_cpu_times() {
  CpuTimes times;
  std::ifstream file("/proc/stat");
  std::string line;
  while (std::getline(file, line)) {
    if (starts_with(line, "cpu ")) {
      std::istringstream ss(line.substr(4));
      uint64_t value = 0;
      int column = 0;
      while (ss >> value) {
        times.total += value;
        // idle + iowait
        if (column == 3 || column == 4)
          times.idle += value;
        ++column;
      }
    } else if (starts_with(line, "cpu")) {
      ++times.cores;
    }
  }
  return times;
}

HostStats read_host_stats() {
  HostStats stats;

  CpuTimes first = read_cpu_times();
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  CpuTimes second = read_cpu_times();

  stats.cpu_cores = second.cores;
  uint64_t total_delta = second.total - first.total;
  uint64_t idle_delta = second.idle - first.idle;
  if (total_delta > 0) {
    stats.cpu_percent = round_to(
        (1.0 - static_cast<double>(idle_delta) / total_delta) * 100.0, 1);
  }

  std::ifstream meminfo("/proc/meminfo");
  std::string key;
  uint64_t value = 0;
  std::string unit;
  uint64_t available = 0;
  while (meminfo >> key >> value >> unit) {
    if (key == "MemTotal:")
      stats.memory_total = value * 1024;
    else if (key == "MemAvailable:")
      available = value * 1024;
  }
  if (stats.memory_total > 0) {
    stats.memory_used = stats.memory_total - available;
    stats.memory_percent = round_to(static_cast<double>(stats.memory_used) /
                                        stats.memory_total * 100.0,
                                    1);
  }

  struct statvfs vfs;
  if (statvfs("/", &vfs) == 0) {
    stats.disk_total = static_cast<uint64_t>(vfs.f_blocks) * vfs.f_frsize;
    uint64_t free_bytes = static_cast<uint64_t>(vfs.f_bfree) * vfs.f_frsize;
    stats.disk_used = stats.disk_total - free_bytes;
    if (stats.disk_total > 0) {
      stats.disk_percent = round_to(static_cast<double>(stats.disk_used) /
                                        stats.disk_total * 100.0,
                                    1);
    }
  } else {
    LOG_WARN("statvfs(/) failed");
  }

  std::ifstream uptime("/proc/uptime");
  double uptime_seconds = 0.0;
  if (uptime >> uptime_seconds) {
    stats.uptime_seconds = static_cast<uint64_t>(uptime_seconds);
  }

  return stats;
}

ContainerGateway::ContainerGateway(Orchestrator &orchestrator,
                                   std::string prefix)
    : orchestrator_(orchestrator), prefix_(std::move(prefix)) {}

std::vector<ContainerInfo> ContainerGateway::list() const {
  std::vector<ContainerInfo> managed;
  for (auto &c : orchestrator_.list_containers()) {
    if (starts_with(c.name, prefix_))
      managed.push_back(std::move(c));
  }
  return managed;
}

ContainerInfo ContainerGateway::resolve(const std::string &identifier) const {
  if (identifier.empty()) {
    throw NotFoundError("Container not found");
  }

  const ContainerInfo *match = nullptr;
  auto containers = list();
  for (const auto &c : containers) {
    if (c.name == identifier)
      return c;
    if (starts_with(c.id, identifier)) {
      if (match) {
        throw NotFoundError("Container id prefix is ambiguous: " + identifier);
      }
      match = &c;
    }
  }

  if (!match) {
    throw NotFoundError("Container not found: " + identifier);
  }
  return *match;
}

ContainerStats ContainerGateway::stats(const std::string &identifier) const {
  ContainerInfo c = resolve(identifier);
  return compute_stats(orchestrator_.sample_stats(c.id));
}

void ContainerGateway::start(const std::string &identifier) {
  ContainerInfo c = resolve(identifier);
  LOG_INFO("Starting container " + c.name);
  orchestrator_.start_container(c.id);
}

void ContainerGateway::stop(const std::string &identifier) {
  ContainerInfo c = resolve(identifier);
  LOG_INFO("Stopping container " + c.name);
  orchestrator_.stop_container(c.id);
}

void ContainerGateway::restart(const std::string &identifier) {
  ContainerInfo c = resolve(identifier);
  LOG_INFO("Restarting container " + c.name);
  orchestrator_.restart_container(c.id);
}

std::unique_ptr<LogStream>
ContainerGateway::open_logs(const std::string &identifier, int tail) {
  ContainerInfo c = resolve(identifier);
  return orchestrator_.open_logs(c.id, tail);
}

SystemInfo ContainerGateway::system_info() const {
  return orchestrator_.system_info();
}

} // namespace sparkbox
