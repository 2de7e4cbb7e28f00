// core/lifecycle.hpp - Module enable/disable
#pragma once

#include "orchestrator.hpp"
#include "registry.hpp"
#include "state.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace sparkbox {

struct ModuleStatus {
  ModuleDescriptor descriptor;
  bool enabled = false;
  bool required = false;
};

struct ModuleListing {
  std::vector<ModuleStatus> modules;
  // Enabled ids with no loadable descriptor. They stay in the persisted set.
  std::vector<std::string> unknown_enabled;
  std::vector<DiscoveryFailure> failures;
};

struct DisableResult {
  std::string module_id;
  bool changed = false;
  std::vector<std::string> removed_containers;
  // Containers that could not be stopped or removed. The module is disabled
  // regardless.
  std::vector<std::string> failed_containers;

  bool partial_failure() const { return !failed_containers.empty(); }
};

class ModuleLifecycleManager {
public:
  ModuleLifecycleManager(const ModuleRegistry &registry,
                         Orchestrator &orchestrator, fs::path state_file);

  ModuleListing list() const;
  EnabledModuleSet enabled() const;

  // Core modules and descriptors marked required. Either source is enough.
  static bool is_required(const std::string &id, const ModuleDescriptor *desc);

  // Returns true if the module was newly enabled. Throws ValidationError for
  // unknown ids, FatalError if the state cannot be saved and RuntimeError if
  // deployment fails.
  bool enable(const std::string &id);

  // Throws PreconditionError for required modules, ValidationError for
  // unknown ids and FatalError if the state cannot be saved.
  DisableResult disable(const std::string &id);

private:
  std::shared_ptr<std::mutex> module_lock(const std::string &id);

  const ModuleRegistry &registry_;
  Orchestrator &orchestrator_;
  fs::path state_file_;

  // Guards the read-modify-write of the state file.
  mutable std::mutex state_mutex_;

  std::mutex locks_mutex_;
  std::map<std::string, std::shared_ptr<std::mutex>> module_locks_;
};

} // namespace sparkbox
