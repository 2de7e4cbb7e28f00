// core/docker_orchestrator.hpp - Orchestrator backed by the Docker engine
#pragma once

#include "docker_client.hpp"
#include "orchestrator.hpp"
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace sparkbox {

class DockerOrchestrator : public Orchestrator {
public:
  DockerOrchestrator(const std::string &socket_path, fs::path root,
                     fs::path deploy_script);

  void deploy(const std::string &module_id) override;
  void update_all() override;

  std::vector<ContainerInfo> list_containers() override;
  StatsSample sample_stats(const std::string &container) override;
  void start_container(const std::string &container) override;
  void stop_container(const std::string &container) override;
  void restart_container(const std::string &container) override;
  void remove_container(const std::string &container) override;
  std::unique_ptr<LogStream> open_logs(const std::string &container,
                                       int tail) override;
  SystemInfo system_info() override;

private:
  void run_script(const std::string &action, const std::string &module_id);
  void container_action(const std::string &method, const std::string &target,
                        const std::string &container);

  DockerClient client_;
  fs::path root_;
  fs::path deploy_script_;
};

// Decoders for engine responses, exposed for tests.
std::vector<ContainerInfo> parse_container_list(const std::string &json);
StatsSample parse_stats(const std::string &json);
SystemInfo parse_system_info(const std::string &json);

} // namespace sparkbox
