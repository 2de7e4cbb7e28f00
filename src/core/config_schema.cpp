// core/config_schema.cpp - Editable configuration surface implementation
#include "config_schema.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "errors.hpp"

namespace sparkbox {

const std::set<std::string> &ConfigSchemaBuilder::system_keys() {
  static const std::set<std::string> keys = {"SB_DOMAIN", "TZ",
                                             "SB_ADMIN_PASSWORD_HASH"};
  return keys;
}

static std::vector<ConfigField> system_fields() {
  return {
      {"SB_DOMAIN", "Server Address", "IP address or domain name",
       EnvVarType::Text, false, true},
      {"TZ", "Timezone", "Continent/City, e.g. Europe/Berlin",
       EnvVarType::Text, false, true},
      {SESSION_SECRET_VAR, "Session Secret", "", EnvVarType::Secret, true,
       false},
      {BACKUP_KEY_VAR, "Backup Encryption Key", "", EnvVarType::Secret, true,
       false},
  };
}

ConfigSchemaBuilder::ConfigSchemaBuilder(
    const ModuleLifecycleManager &lifecycle)
    : lifecycle_(lifecycle) {}

std::vector<ModuleDescriptor> ConfigSchemaBuilder::enabled_descriptors() const {
  std::vector<ModuleDescriptor> result;
  ModuleListing listing = lifecycle_.list();
  for (auto &status : listing.modules) {
    if (status.enabled)
      result.push_back(std::move(status.descriptor));
  }
  return result;
}

std::set<std::string> ConfigSchemaBuilder::allowed_keys() const {
  std::set<std::string> keys = system_keys();
  for (const auto &desc : enabled_descriptors()) {
    for (const auto &var : desc.env_vars) {
      if (var.config_editable)
        keys.insert(var.key);
    }
  }
  return keys;
}

std::vector<ConfigGroup> ConfigSchemaBuilder::schema() const {
  std::vector<ConfigGroup> groups;
  groups.push_back({"system", "System", system_fields()});

  for (const auto &desc : enabled_descriptors()) {
    if (desc.env_vars.empty())
      continue;

    ConfigGroup group{desc.id, desc.title, {}};
    for (const auto &var : desc.env_vars) {
      group.fields.push_back({var.key, var.label, var.prompt, var.type,
                              var.dangerous, var.config_editable});
    }
    groups.push_back(std::move(group));
  }
  return groups;
}

void ConfigSchemaBuilder::validate_update(const ConfigValues &updates) const {
  std::set<std::string> allowed = allowed_keys();
  for (const auto &[key, value] : updates) {
    if (allowed.count(key) == 0) {
      throw ValidationError("Configuration key \"" + key +
                            "\" is not allowed");
    }
    ConfigStore::validate_value(key, value);
  }
}

void ConfigSchemaBuilder::apply_update(ConfigStore &store,
                                       const ConfigValues &updates) const {
  validate_update(updates);
  store.update(updates);
}

} // namespace sparkbox
