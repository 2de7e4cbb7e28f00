// core/descriptor.cpp - Module descriptor parsing
#include "descriptor.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <yaml-cpp/yaml.h>

namespace sparkbox {

static const EnvVarTraits ENV_VAR_TABLE[] = {
    {EnvVarType::Text, "text", false, false, false, ""},
    {EnvVarType::Password, "password", true, false, true, ""},
    {EnvVarType::Secret, "secret", true, true, true, ""},
    {EnvVarType::Boolean, "boolean", false, false, false, "false"},
    {EnvVarType::Path, "path", false, false, false, ""},
};

const EnvVarTraits &env_var_traits(EnvVarType type) {
  for (const auto &traits : ENV_VAR_TABLE) {
    if (traits.type == type)
      return traits;
  }
  return ENV_VAR_TABLE[0];
}

std::optional<EnvVarType> parse_env_var_type(const std::string &name) {
  for (const auto &traits : ENV_VAR_TABLE) {
    if (name == traits.name)
      return traits.type;
  }
  return std::nullopt;
}

const char *to_string(EnvVarType type) { return env_var_traits(type).name; }

const EnvVarSpec *ModuleDescriptor::find_env_var(const std::string &key) const {
  for (const auto &var : env_vars) {
    if (var.key == key)
      return &var;
  }
  return nullptr;
}

static std::string scalar_or(const YAML::Node &node, const char *key,
                             const std::string &fallback) {
  const YAML::Node value = node[key];
  if (!value || value.IsNull())
    return fallback;
  if (!value.IsScalar())
    throw DescriptorError(std::string("field '") + key + "' must be a scalar");
  return value.as<std::string>();
}

static bool bool_or(const YAML::Node &node, const char *key, bool fallback) {
  const YAML::Node value = node[key];
  if (!value || value.IsNull())
    return fallback;
  try {
    return value.as<bool>();
  } catch (const YAML::BadConversion &) {
    throw DescriptorError(std::string("field '") + key + "' must be a boolean");
  }
}

static std::vector<std::string> normalize_tips(const YAML::Node &tips) {
  std::vector<std::string> result;
  if (!tips || tips.IsNull())
    return result;

  if (tips.IsSequence()) {
    for (const auto &tip : tips)
      result.push_back(tip.as<std::string>());
  } else if (tips.IsMap()) {
    for (const auto &kv : tips)
      result.push_back(kv.second.as<std::string>());
  } else {
    result.push_back(tips.as<std::string>());
  }
  return result;
}

static std::vector<EnvVarSpec> parse_env_vars(const YAML::Node &node) {
  std::vector<EnvVarSpec> vars;
  if (!node || node.IsNull())
    return vars;
  if (!node.IsMap())
    throw DescriptorError("env_vars must be a mapping");

  for (const auto &kv : node) {
    EnvVarSpec var;
    var.key = kv.first.as<std::string>();
    const YAML::Node &spec = kv.second;

    if (spec && spec.IsMap()) {
      std::string type_name = scalar_or(spec, "type", "text");
      auto type = parse_env_var_type(type_name);
      if (!type) {
        throw DescriptorError("env var " + var.key + " has unknown type '" +
                              type_name + "'");
      }
      var.type = *type;
      var.label = scalar_or(spec, "label", var.key);
      var.prompt = scalar_or(spec, "prompt", "");
      var.default_value = scalar_or(spec, "default", "");
      var.config_editable = bool_or(spec, "config_editable", true);
      var.dangerous = bool_or(spec, "dangerous", false);
    } else if (spec && !spec.IsNull()) {
      throw DescriptorError("env var " + var.key + " must be a mapping");
    } else {
      var.label = var.key;
    }
    vars.push_back(var);
  }
  return vars;
}

static std::vector<ServiceInfo> parse_services(const YAML::Node &node) {
  std::vector<ServiceInfo> services;
  if (!node || node.IsNull())
    return services;
  if (!node.IsMap())
    throw DescriptorError("services must be a mapping");

  for (const auto &kv : node) {
    ServiceInfo svc;
    svc.key = kv.first.as<std::string>();
    const YAML::Node &spec = kv.second;
    if (spec && spec.IsMap()) {
      svc.friendly_name = scalar_or(spec, "friendly_name", svc.key);
      svc.description = scalar_or(spec, "description", "");
      svc.port_map = scalar_or(spec, "port_map", "");
      svc.https = bool_or(spec, "https", false);
      svc.tip = scalar_or(spec, "tip", "");
    } else {
      svc.friendly_name = svc.key;
    }
    services.push_back(svc);
  }
  return services;
}

static std::vector<SetupTemplate> parse_setup(const YAML::Node &node) {
  std::vector<SetupTemplate> templates;
  if (!node || !node.IsMap())
    return templates;

  const YAML::Node list = node["templates"];
  if (!list || list.IsNull())
    return templates;
  if (!list.IsSequence())
    throw DescriptorError("setup.templates must be a list");

  for (const auto &entry : list) {
    if (!entry.IsMap())
      throw DescriptorError("setup template entries must be mappings");
    SetupTemplate t;
    t.source = scalar_or(entry, "source", "");
    t.dest = scalar_or(entry, "dest", "");
    if (t.source.empty() || t.dest.empty())
      throw DescriptorError("setup template needs source and dest");
    templates.push_back(t);
  }
  return templates;
}

static std::vector<std::string> compose_container_names(const YAML::Node &doc) {
  std::vector<std::string> names;
  const YAML::Node services = doc["services"];
  if (!services || !services.IsMap())
    return names;

  for (const auto &kv : services) {
    if (!kv.second.IsMap())
      continue;
    std::string name = scalar_or(kv.second, "container_name", "");
    if (!name.empty())
      names.push_back(name);
  }
  return names;
}

ModuleDescriptor parse_descriptor(const YAML::Node &doc,
                                  const std::string &module_dir_name) {
  if (!doc.IsMap())
    throw DescriptorError("declaration file is not a mapping");

  const YAML::Node meta = doc[DESCRIPTOR_EXTENSION_KEY];
  if (!meta || !meta.IsMap())
    throw DescriptorError(std::string("missing ") + DESCRIPTOR_EXTENSION_KEY +
                          " block");

  try {
    ModuleDescriptor desc;
    desc.id = module_dir_name;

    std::string declared_id = scalar_or(meta, "id", module_dir_name);
    if (declared_id != module_dir_name) {
      LOG_WARN("Module " + module_dir_name + " declares id '" + declared_id +
               "', using directory name");
    }

    desc.title = scalar_or(meta, "title", desc.id);
    desc.tagline = scalar_or(meta, "tagline", "");
    desc.description = scalar_or(meta, "description", "");
    desc.category = scalar_or(meta, "category", "other");
    desc.icon = scalar_or(meta, "icon", "package");
    desc.ram = scalar_or(meta, "ram", "?");
    desc.required = bool_or(meta, "required", false);
    desc.default_enabled = bool_or(meta, "default", false);

    const YAML::Node theme = meta["theme"];
    if (theme && theme.IsMap()) {
      desc.theme = Theme{scalar_or(theme, "emoji", ""),
                         scalar_or(theme, "color", ""),
                         scalar_or(theme, "bg", "")};
    }

    desc.tips = normalize_tips(meta["tips"]);
    desc.env_vars = parse_env_vars(meta["env_vars"]);
    desc.services = parse_services(meta["services"]);

    const YAML::Node critical = meta["critical_services"];
    if (critical && critical.IsSequence()) {
      for (const auto &name : critical)
        desc.critical_services.insert(name.as<std::string>());
    }

    desc.setup_templates = parse_setup(meta["setup"]);
    desc.container_names = compose_container_names(doc);
    return desc;
  } catch (const YAML::Exception &e) {
    throw DescriptorError(e.what());
  }
}

ModuleDescriptor load_descriptor(const fs::path &compose_path) {
  YAML::Node doc;
  try {
    doc = YAML::LoadFile(compose_path.string());
  } catch (const YAML::Exception &e) {
    throw DescriptorError(e.what());
  }

  ModuleDescriptor desc =
      parse_descriptor(doc, compose_path.parent_path().filename().string());
  desc.source_path = compose_path;
  return desc;
}

} // namespace sparkbox
