// core/serialize.cpp - JSON views implementation
#include "serialize.hpp"

using json = nlohmann::json;

namespace sparkbox {

void to_json(json &j, const EnvVarSpec &v) {
  j = json{{"key", v.key},
           {"type", to_string(v.type)},
           {"label", v.label},
           {"prompt", v.prompt},
           {"default", v.default_value},
           {"config_editable", v.config_editable},
           {"dangerous", v.dangerous}};
}

void to_json(json &j, const ServiceInfo &s) {
  j = json{{"key", s.key},
           {"friendly_name", s.friendly_name},
           {"description", s.description},
           {"port_map", s.port_map},
           {"https", s.https},
           {"tip", s.tip}};
}

void to_json(json &j, const ModuleDescriptor &d) {
  j = json{{"id", d.id},
           {"title", d.title},
           {"tagline", d.tagline},
           {"description", d.description},
           {"category", d.category},
           {"icon", d.icon},
           {"ram", d.ram},
           {"required", d.required},
           {"default", d.default_enabled},
           {"tips", d.tips},
           {"services", d.services},
           {"env_vars", d.env_vars},
           {"critical_services", d.critical_services},
           {"containers", d.container_names}};

  if (d.theme) {
    j["theme"] = {{"emoji", d.theme->emoji},
                  {"color", d.theme->color},
                  {"bg", d.theme->bg}};
  } else {
    j["theme"] = nullptr;
  }

  json templates = json::array();
  for (const auto &t : d.setup_templates)
    templates.push_back({{"source", t.source}, {"dest", t.dest}});
  j["setup"] = {{"templates", templates}};
}

void to_json(json &j, const DiscoveryFailure &f) {
  j = json{{"module_dir", f.module_dir}, {"reason", f.reason}};
}

void to_json(json &j, const DisableResult &r) {
  j = json{{"module", r.module_id},
           {"changed", r.changed},
           {"removed_containers", r.removed_containers},
           {"failed_containers", r.failed_containers},
           {"partial_failure", r.partial_failure()}};
}

void to_json(json &j, const ConfigField &f) {
  j = json{{"key", f.key},
           {"label", f.label},
           {"prompt", f.prompt},
           {"type", to_string(f.type)},
           {"dangerous", f.dangerous},
           {"config_editable", f.config_editable},
           {"read_only", f.read_only()}};
}

void to_json(json &j, const ConfigGroup &g) {
  j = json{{"id", g.id}, {"title", g.title}, {"fields", g.fields}};
}

void to_json(json &j, const PortBinding &p) {
  j = json{{"private", p.private_port},
           {"public", p.public_port},
           {"type", p.type}};
}

void to_json(json &j, const ContainerInfo &c) {
  j = json{{"id", c.id.substr(0, 12)},
           {"name", c.name},
           {"image", c.image},
           {"state", c.state},
           {"status", c.status},
           {"ports", c.ports},
           {"created", c.created}};
}

void to_json(json &j, const NetworkCounters &n) {
  j = json{{"rx_bytes", n.rx_bytes},
           {"tx_bytes", n.tx_bytes},
           {"rx_packets", n.rx_packets},
           {"tx_packets", n.tx_packets}};
}

void to_json(json &j, const ContainerStats &s) {
  j = json{{"cpu_percent", s.cpu_percent},
           {"memory",
            {{"usage", s.memory_usage},
             {"limit", s.memory_limit},
             {"percent", s.memory_percent}}},
           {"networks", s.networks}};
}

void to_json(json &j, const HostStats &s) {
  j = json{{"cpu", {{"percent", s.cpu_percent}, {"cores", s.cpu_cores}}},
           {"memory",
            {{"total", s.memory_total},
             {"used", s.memory_used},
             {"percent", s.memory_percent}}},
           {"disk",
            {{"total", s.disk_total},
             {"used", s.disk_used},
             {"percent", s.disk_percent}}},
           {"uptime", s.uptime_seconds}};
}

void to_json(json &j, const SystemInfo &s) {
  j = json{{"containers", s.containers},
           {"containers_running", s.containers_running},
           {"containers_stopped", s.containers_stopped},
           {"images", s.images},
           {"server_version", s.server_version},
           {"operating_system", s.operating_system},
           {"architecture", s.architecture},
           {"cpus", s.cpus},
           {"memory", s.memory},
           {"hostname", s.hostname}};
}

void to_json(json &j, const BackupInfo &b) {
  j = json{{"filename", b.filename},
           {"size", b.size},
           {"created", b.created},
           {"encrypted", b.encrypted}};
}

json module_summary(const ModuleListing &listing) {
  json modules = json::array();
  for (const auto &m : listing.modules) {
    modules.push_back({{"id", m.descriptor.id},
                       {"title", m.descriptor.title},
                       {"category", m.descriptor.category},
                       {"enabled", m.enabled},
                       {"required", m.required}});
  }
  return {{"modules", modules},
          {"unknown_enabled", listing.unknown_enabled},
          {"failures", listing.failures}};
}

json module_store(const ModuleListing &listing) {
  json modules = json::array();
  for (const auto &m : listing.modules) {
    json entry = m.descriptor;
    entry["enabled"] = m.enabled;
    entry["required"] = m.required;
    modules.push_back(std::move(entry));
  }
  return {{"modules", modules}, {"failures", listing.failures}};
}

} // namespace sparkbox
