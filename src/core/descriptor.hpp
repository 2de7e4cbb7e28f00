// core/descriptor.hpp - Module descriptor model
#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace fs = std::filesystem;

namespace sparkbox {

enum class EnvVarType { Text, Password, Secret, Boolean, Path };

// How each env var type is treated by the config surface and by first-run
// provisioning.
struct EnvVarTraits {
  EnvVarType type;
  const char *name;
  bool masked;             // value never shown in clear text
  bool always_generated;   // value is generated, never prompted
  bool generate_if_blank;  // a blank answer gets a generated value
  const char *blank_value; // value used when left blank and not generated
};

const EnvVarTraits &env_var_traits(EnvVarType type);
std::optional<EnvVarType> parse_env_var_type(const std::string &name);
const char *to_string(EnvVarType type);

struct EnvVarSpec {
  std::string key;
  EnvVarType type = EnvVarType::Text;
  std::string label;
  std::string prompt;
  std::string default_value;
  bool config_editable = true;
  bool dangerous = false;
};

struct ServiceInfo {
  std::string key;
  std::string friendly_name;
  std::string description;
  std::string port_map;
  bool https = false;
  std::string tip;
};

struct Theme {
  std::string emoji;
  std::string color;
  std::string bg;
};

struct SetupTemplate {
  std::string source;
  std::string dest;
};

struct ModuleDescriptor {
  std::string id;
  std::string title;
  std::string tagline;
  std::string description;
  std::string category = "other";
  std::string icon = "package";
  std::string ram = "?";
  bool required = false;
  bool default_enabled = false;
  std::optional<Theme> theme;
  std::vector<std::string> tips;
  std::vector<ServiceInfo> services;
  std::vector<EnvVarSpec> env_vars; // declaration order
  std::set<std::string> critical_services;
  std::vector<SetupTemplate> setup_templates;
  std::vector<std::string> container_names; // compose services.*.container_name
  fs::path source_path;

  const EnvVarSpec *find_env_var(const std::string &key) const;
};

class DescriptorError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Builds a descriptor from a parsed compose document. All defaults are
// applied here. Throws DescriptorError when the extension block is missing
// or malformed.
ModuleDescriptor parse_descriptor(const YAML::Node &doc,
                                  const std::string &module_dir_name);

// Loads and parses a declaration file. Throws DescriptorError.
ModuleDescriptor load_descriptor(const fs::path &compose_path);

} // namespace sparkbox
