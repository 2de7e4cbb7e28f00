// core/serialize.hpp - JSON views of the control plane types
#pragma once

#include "backup.hpp"
#include "config_schema.hpp"
#include "container_gateway.hpp"
#include "lifecycle.hpp"
#include <nlohmann/json.hpp>

namespace sparkbox {

void to_json(nlohmann::json &j, const EnvVarSpec &v);
void to_json(nlohmann::json &j, const ServiceInfo &s);
void to_json(nlohmann::json &j, const ModuleDescriptor &d);
void to_json(nlohmann::json &j, const DiscoveryFailure &f);
void to_json(nlohmann::json &j, const DisableResult &r);
void to_json(nlohmann::json &j, const ConfigField &f);
void to_json(nlohmann::json &j, const ConfigGroup &g);
void to_json(nlohmann::json &j, const PortBinding &p);
void to_json(nlohmann::json &j, const ContainerInfo &c);
void to_json(nlohmann::json &j, const NetworkCounters &n);
void to_json(nlohmann::json &j, const ContainerStats &s);
void to_json(nlohmann::json &j, const HostStats &s);
void to_json(nlohmann::json &j, const SystemInfo &s);
void to_json(nlohmann::json &j, const BackupInfo &b);

// Summary view: id, title, category, enabled, required.
nlohmann::json module_summary(const ModuleListing &listing);
// Store view: the full descriptor of every module plus its flags.
nlohmann::json module_store(const ModuleListing &listing);

} // namespace sparkbox
