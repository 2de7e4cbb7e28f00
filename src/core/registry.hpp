// core/registry.hpp - Module discovery
#pragma once

#include "descriptor.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace sparkbox {

struct DiscoveryFailure {
  std::string module_dir;
  std::string reason;
};

struct DiscoveryResult {
  std::vector<ModuleDescriptor> modules; // sorted by id
  std::vector<DiscoveryFailure> failures;
};

// Descriptors are read from disk on every call so that edits to the
// declaration files are picked up without a restart.
class ModuleRegistry {
public:
  explicit ModuleRegistry(fs::path modules_dir);

  DiscoveryResult discover() const;
  std::optional<ModuleDescriptor> find(const std::string &id) const;

  fs::path descriptor_path(const std::string &id) const;
  const fs::path &modules_dir() const { return modules_dir_; }

  static bool is_valid_id(const std::string &id);

private:
  fs::path modules_dir_;
};

// Reads one scalar from the extension block without a YAML parse. Returns
// nullopt when the file, the block or the field is absent.
std::optional<std::string> read_field(const fs::path &descriptor_path,
                                      const std::string &field);

} // namespace sparkbox
