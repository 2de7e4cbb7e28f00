// core/docker_orchestrator.cpp - Docker engine orchestrator implementation
#include "docker_orchestrator.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include <initializer_list>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sparkbox {

static json parse_json(const std::string &text) {
  try {
    return json::parse(text);
  } catch (const json::parse_error &e) {
    throw RuntimeError("Invalid JSON from container engine: " +
                       std::string(e.what()));
  }
}

// Walks nested objects; missing or non-numeric values read as 0.
static uint64_t u64_at(const json &j, std::initializer_list<const char *> path) {
  const json *node = &j;
  for (const char *key : path) {
    if (!node->is_object())
      return 0;
    auto it = node->find(key);
    if (it == node->end())
      return 0;
    node = &*it;
  }
  if (node->is_number_unsigned())
    return node->get<uint64_t>();
  if (node->is_number_integer()) {
    auto v = node->get<int64_t>();
    return v < 0 ? 0 : static_cast<uint64_t>(v);
  }
  if (node->is_number_float()) {
    auto v = node->get<double>();
    return v < 0 ? 0 : static_cast<uint64_t>(v);
  }
  return 0;
}

static std::string str_at(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string())
    return "";
  return it->get<std::string>();
}

static int int_at(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number())
    return 0;
  return it->get<int>();
}

std::vector<ContainerInfo> parse_container_list(const std::string &text) {
  json doc = parse_json(text);
  std::vector<ContainerInfo> containers;
  if (!doc.is_array())
    throw RuntimeError("Unexpected container list from container engine");

  for (const auto &c : doc) {
    ContainerInfo info;
    info.id = str_at(c, "Id");
    auto names = c.find("Names");
    if (names != c.end() && names->is_array() && !names->empty() &&
        names->front().is_string()) {
      info.name = names->front().get<std::string>();
      if (!info.name.empty() && info.name[0] == '/')
        info.name.erase(0, 1);
    }
    info.image = str_at(c, "Image");
    info.state = str_at(c, "State");
    info.status = str_at(c, "Status");
    auto created = c.find("Created");
    if (created != c.end() && created->is_number())
      info.created = created->get<int64_t>();

    auto ports = c.find("Ports");
    if (ports != c.end() && ports->is_array()) {
      for (const auto &p : *ports) {
        PortBinding binding;
        binding.private_port = int_at(p, "PrivatePort");
        binding.public_port = int_at(p, "PublicPort");
        binding.type = str_at(p, "Type");
        if (binding.public_port != 0)
          info.ports.push_back(binding);
      }
    }
    containers.push_back(info);
  }
  return containers;
}

static CpuCounters parse_cpu(const json &doc, const char *key) {
  CpuCounters cpu;
  auto it = doc.find(key);
  if (it == doc.end() || !it->is_object())
    return cpu;
  cpu.total_usage = u64_at(*it, {"cpu_usage", "total_usage"});
  cpu.system_usage = u64_at(*it, {"system_cpu_usage"});
  cpu.online_cpus = static_cast<uint32_t>(u64_at(*it, {"online_cpus"}));
  return cpu;
}

StatsSample parse_stats(const std::string &text) {
  json doc = parse_json(text);
  StatsSample sample;
  sample.cpu = parse_cpu(doc, "cpu_stats");
  sample.precpu = parse_cpu(doc, "precpu_stats");
  sample.memory_usage = u64_at(doc, {"memory_stats", "usage"});
  sample.memory_limit = u64_at(doc, {"memory_stats", "limit"});

  auto networks = doc.find("networks");
  if (networks != doc.end() && networks->is_object()) {
    for (auto it = networks->begin(); it != networks->end(); ++it) {
      NetworkCounters counters;
      counters.rx_bytes = u64_at(it.value(), {"rx_bytes"});
      counters.tx_bytes = u64_at(it.value(), {"tx_bytes"});
      counters.rx_packets = u64_at(it.value(), {"rx_packets"});
      counters.tx_packets = u64_at(it.value(), {"tx_packets"});
      sample.networks[it.key()] = counters;
    }
  }
  return sample;
}

SystemInfo parse_system_info(const std::string &text) {
  json doc = parse_json(text);
  SystemInfo info;
  info.containers = int_at(doc, "Containers");
  info.containers_running = int_at(doc, "ContainersRunning");
  info.containers_stopped = int_at(doc, "ContainersStopped");
  info.images = int_at(doc, "Images");
  info.server_version = str_at(doc, "ServerVersion");
  info.operating_system = str_at(doc, "OperatingSystem");
  info.architecture = str_at(doc, "Architecture");
  info.cpus = int_at(doc, "NCPU");
  info.memory = static_cast<int64_t>(u64_at(doc, {"MemTotal"}));
  info.hostname = str_at(doc, "Name");
  return info;
}

static std::string engine_message(const HttpResponse &response) {
  try {
    json doc = json::parse(response.body);
    if (doc.is_object() && doc.contains("message") &&
        doc["message"].is_string())
      return doc["message"].get<std::string>();
  } catch (const json::parse_error &) {
  }
  return "HTTP " + std::to_string(response.status);
}

DockerOrchestrator::DockerOrchestrator(const std::string &socket_path,
                                       fs::path root, fs::path deploy_script)
    : client_(socket_path), root_(std::move(root)),
      deploy_script_(std::move(deploy_script)) {}

void DockerOrchestrator::run_script(const std::string &action,
                                    const std::string &module_id) {
  if (!fs::exists(deploy_script_)) {
    throw RuntimeError("Deployment script not found: " +
                       deploy_script_.string());
  }

  std::vector<std::string> env = {"SB_ROOT=" + root_.string()};
  if (!module_id.empty())
    env.push_back("SB_MODULE=" + module_id);

  LOG_INFO("Running " + deploy_script_.string() + " " + action);
  CommandResult result =
      run_command({"bash", deploy_script_.string(), action}, root_, env);
  if (result.exit_code != 0) {
    LOG_ERROR("Deployment '" + action + "' failed (exit " +
              std::to_string(result.exit_code) + "): " + result.output);
    throw RuntimeError("Deployment '" + action + "' failed (exit " +
                       std::to_string(result.exit_code) + ")");
  }
  LOG_DEBUG(result.output);
}

void DockerOrchestrator::deploy(const std::string &module_id) {
  run_script("up", module_id);
}

void DockerOrchestrator::update_all() { run_script("update", ""); }

std::vector<ContainerInfo> DockerOrchestrator::list_containers() {
  HttpResponse response = client_.request("GET", "/containers/json?all=1");
  if (response.status != 200) {
    throw RuntimeError("Failed to list containers: " +
                       engine_message(response));
  }
  return parse_container_list(response.body);
}

StatsSample DockerOrchestrator::sample_stats(const std::string &container) {
  HttpResponse response = client_.request(
      "GET", "/containers/" + container + "/stats?stream=false");
  if (response.status == 404) {
    throw NotFoundError("Container not found: " + container);
  }
  if (response.status != 200) {
    throw RuntimeError("Failed to read stats for " + container + ": " +
                       engine_message(response));
  }
  return parse_stats(response.body);
}

void DockerOrchestrator::container_action(const std::string &method,
                                          const std::string &target,
                                          const std::string &container) {
  HttpResponse response = client_.request(method, target);
  // 304: already in the requested state
  if (response.status == 204 || response.status == 304 ||
      response.status == 200) {
    return;
  }
  if (response.status == 404) {
    throw NotFoundError("Container not found: " + container);
  }
  throw RuntimeError(method + " " + target + " failed: " +
                     engine_message(response));
}

void DockerOrchestrator::start_container(const std::string &container) {
  container_action("POST", "/containers/" + container + "/start", container);
}

void DockerOrchestrator::stop_container(const std::string &container) {
  container_action("POST", "/containers/" + container + "/stop", container);
}

void DockerOrchestrator::restart_container(const std::string &container) {
  container_action("POST", "/containers/" + container + "/restart", container);
}

void DockerOrchestrator::remove_container(const std::string &container) {
  container_action("DELETE", "/containers/" + container, container);
}

std::unique_ptr<LogStream>
DockerOrchestrator::open_logs(const std::string &container, int tail) {
  // TTY containers send raw output, everything else is framed
  HttpResponse inspect =
      client_.request("GET", "/containers/" + container + "/json");
  if (inspect.status == 404) {
    throw NotFoundError("Container not found: " + container);
  }
  if (inspect.status != 200) {
    throw RuntimeError("Failed to inspect " + container + ": " +
                       engine_message(inspect));
  }
  json doc = parse_json(inspect.body);
  bool tty = false;
  if (doc.contains("Config") && doc["Config"].is_object()) {
    tty = doc["Config"].value("Tty", false);
  }

  int status = 0;
  auto stream = client_.open_stream(
      "/containers/" + container +
          "/logs?follow=1&stdout=1&stderr=1&timestamps=1&tail=" +
          std::to_string(tail),
      !tty, status);
  if (!stream) {
    if (status == 404)
      throw NotFoundError("Container not found: " + container);
    throw RuntimeError("Failed to open logs for " + container + " (HTTP " +
                       std::to_string(status) + ")");
  }
  return stream;
}

SystemInfo DockerOrchestrator::system_info() {
  HttpResponse response = client_.request("GET", "/info");
  if (response.status != 200) {
    throw RuntimeError("Failed to read engine info: " +
                       engine_message(response));
  }
  return parse_system_info(response.body);
}

} // namespace sparkbox
