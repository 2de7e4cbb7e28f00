// core/config_schema.hpp - Editable configuration surface
#pragma once

#include "../conf/config_store.hpp"
#include "descriptor.hpp"
#include "lifecycle.hpp"
#include <set>
#include <string>
#include <vector>

namespace sparkbox {

struct ConfigField {
  std::string key;
  std::string label;
  std::string prompt;
  EnvVarType type = EnvVarType::Text;
  bool dangerous = false;
  bool config_editable = true;

  // Dangerous fields are never editable.
  bool read_only() const { return dangerous || !config_editable; }
};

struct ConfigGroup {
  std::string id;
  std::string title;
  std::vector<ConfigField> fields;
};

// Derived on every call from the registry and the enabled set, so toggling a
// module changes what is writable immediately.
class ConfigSchemaBuilder {
public:
  explicit ConfigSchemaBuilder(const ModuleLifecycleManager &lifecycle);

  std::set<std::string> allowed_keys() const;
  std::vector<ConfigGroup> schema() const;

  // Throws ValidationError on the first key outside the allowlist or value
  // that cannot be stored.
  void validate_update(const ConfigValues &updates) const;

  // Validates, then writes through the store.
  void apply_update(ConfigStore &store, const ConfigValues &updates) const;

  static const std::set<std::string> &system_keys();

private:
  std::vector<ModuleDescriptor> enabled_descriptors() const;

  const ModuleLifecycleManager &lifecycle_;
};

} // namespace sparkbox
