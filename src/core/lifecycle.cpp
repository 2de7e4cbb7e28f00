// core/lifecycle.cpp - Module enable/disable implementation
#include "lifecycle.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include <algorithm>

namespace sparkbox {

ModuleLifecycleManager::ModuleLifecycleManager(const ModuleRegistry &registry,
                                               Orchestrator &orchestrator,
                                               fs::path state_file)
    : registry_(registry), orchestrator_(orchestrator),
      state_file_(std::move(state_file)) {}

std::shared_ptr<std::mutex>
ModuleLifecycleManager::module_lock(const std::string &id) {
  std::lock_guard<std::mutex> lock(locks_mutex_);
  auto &entry = module_locks_[id];
  if (!entry)
    entry = std::make_shared<std::mutex>();
  return entry;
}

bool ModuleLifecycleManager::is_required(const std::string &id,
                                         const ModuleDescriptor *desc) {
  return is_core_module(id) || (desc && desc->required);
}

EnabledModuleSet ModuleLifecycleManager::enabled() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return EnabledModuleSet::load(state_file_);
}

ModuleListing ModuleLifecycleManager::list() const {
  ModuleListing listing;
  DiscoveryResult discovered = registry_.discover();
  EnabledModuleSet set = enabled();

  for (auto &desc : discovered.modules) {
    ModuleStatus status;
    status.enabled = set.contains(desc.id);
    status.required = is_required(desc.id, &desc);
    status.descriptor = std::move(desc);
    listing.modules.push_back(std::move(status));
  }

  for (const auto &id : set.ids()) {
    bool known = std::any_of(
        listing.modules.begin(), listing.modules.end(),
        [&id](const ModuleStatus &s) { return s.descriptor.id == id; });
    if (!known) {
      LOG_WARN("Enabled module has no descriptor: " + id);
      listing.unknown_enabled.push_back(id);
    }
  }

  listing.failures = std::move(discovered.failures);
  return listing;
}

bool ModuleLifecycleManager::enable(const std::string &id) {
  auto desc = registry_.find(id);
  if (!desc) {
    throw ValidationError("Unknown module: " + id);
  }

  auto guard = module_lock(id);
  std::lock_guard<std::mutex> module_guard(*guard);

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    EnabledModuleSet set = EnabledModuleSet::load(state_file_);
    if (!set.add(id)) {
      LOG_DEBUG("Module already enabled: " + id);
      return false;
    }
    set.save(state_file_);
  }

  LOG_INFO("Enabled module " + id + ", deploying");
  orchestrator_.deploy(id);
  LOG_INFO("Module " + id + " deployed");
  return true;
}

DisableResult ModuleLifecycleManager::disable(const std::string &id) {
  if (is_core_module(id)) {
    throw PreconditionError("Cannot disable core module: " + id);
  }

  auto desc = registry_.find(id);
  if (desc && desc->required) {
    throw PreconditionError("Module " + id + " is required");
  }

  auto guard = module_lock(id);
  std::lock_guard<std::mutex> module_guard(*guard);

  DisableResult result;
  result.module_id = id;

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    EnabledModuleSet set = EnabledModuleSet::load(state_file_);
    if (!desc && !set.contains(id)) {
      throw ValidationError("Unknown module: " + id);
    }
    if (!set.remove(id)) {
      LOG_DEBUG("Module already disabled: " + id);
      return result;
    }
    set.save(state_file_);
  }
  result.changed = true;
  LOG_INFO("Disabled module " + id);

  if (!desc) {
    LOG_WARN("No descriptor for " + id + ", no containers to stop");
    return result;
  }

  // Volumes and config directories stay so a re-enable keeps the data
  for (const auto &name : desc->container_names) {
    try {
      orchestrator_.stop_container(name);
      orchestrator_.remove_container(name);
      result.removed_containers.push_back(name);
    } catch (const std::exception &e) {
      LOG_WARN("Failed to stop container " + name + " of module " + id +
               ": " + e.what());
      result.failed_containers.push_back(name);
    }
  }

  if (result.partial_failure()) {
    LOG_WARN("Module " + id + " disabled with " +
             std::to_string(result.failed_containers.size()) +
             " container(s) left behind");
  }
  return result;
}

} // namespace sparkbox
