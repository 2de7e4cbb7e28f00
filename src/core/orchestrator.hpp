// core/orchestrator.hpp - Container runtime and deployment interface
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sparkbox {

struct PortBinding {
  int private_port = 0;
  int public_port = 0;
  std::string type;
};

struct ContainerInfo {
  std::string id; // full runtime id
  std::string name;
  std::string image;
  std::string state;
  std::string status;
  std::vector<PortBinding> ports; // published ports only
  int64_t created = 0;
};

struct CpuCounters {
  uint64_t total_usage = 0;
  uint64_t system_usage = 0;
  uint32_t online_cpus = 0;
};

struct NetworkCounters {
  uint64_t rx_bytes = 0;
  uint64_t tx_bytes = 0;
  uint64_t rx_packets = 0;
  uint64_t tx_packets = 0;
};

// Raw cumulative counters as buffered by the runtime: the current sample and
// the one before it.
struct StatsSample {
  CpuCounters cpu;
  CpuCounters precpu;
  uint64_t memory_usage = 0;
  uint64_t memory_limit = 0;
  std::map<std::string, NetworkCounters> networks;
};

struct SystemInfo {
  int containers = 0;
  int containers_running = 0;
  int containers_stopped = 0;
  int images = 0;
  std::string server_version;
  std::string operating_system;
  std::string architecture;
  int cpus = 0;
  int64_t memory = 0;
  std::string hostname;
};

// A followed log stream. read() blocks until data arrives and returns false
// once the stream ended or was closed. close() may be called from another
// thread and unblocks a pending read().
class LogStream {
public:
  virtual ~LogStream() = default;
  virtual bool read(std::string &chunk) = 0;
  virtual void close() = 0;
};

// Everything that reaches outside the process: the deployment script and the
// container engine.
class Orchestrator {
public:
  virtual ~Orchestrator() = default;

  // Re-applies the desired deployment after module_id was enabled.
  virtual void deploy(const std::string &module_id) = 0;
  // Pulls images and recreates all enabled modules.
  virtual void update_all() = 0;

  virtual std::vector<ContainerInfo> list_containers() = 0;
  virtual StatsSample sample_stats(const std::string &container) = 0;
  virtual void start_container(const std::string &container) = 0;
  virtual void stop_container(const std::string &container) = 0;
  virtual void restart_container(const std::string &container) = 0;
  virtual void remove_container(const std::string &container) = 0;
  virtual std::unique_ptr<LogStream> open_logs(const std::string &container,
                                               int tail) = 0;
  virtual SystemInfo system_info() = 0;
};

} // namespace sparkbox
