// core/state.cpp - Enabled module set implementation
#include "state.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include <algorithm>
#include <sstream>

namespace sparkbox {

bool is_core_module(const std::string &id) {
  return std::find(CORE_MODULES.begin(), CORE_MODULES.end(), id) !=
         CORE_MODULES.end();
}

EnabledModuleSet::EnabledModuleSet() : ids_(CORE_MODULES) {}

bool EnabledModuleSet::contains(const std::string &id) const {
  return std::find(ids_.begin(), ids_.end(), id) != ids_.end();
}

bool EnabledModuleSet::add(const std::string &id) {
  if (contains(id))
    return false;
  ids_.push_back(id);
  return true;
}

bool EnabledModuleSet::remove(const std::string &id) {
  if (is_core_module(id))
    return false;
  auto it = std::find(ids_.begin(), ids_.end(), id);
  if (it == ids_.end())
    return false;
  ids_.erase(it);
  return true;
}

EnabledModuleSet EnabledModuleSet::load(const fs::path &path) {
  EnabledModuleSet set;

  std::string content;
  if (!read_file(path, content)) {
    LOG_DEBUG("No enabled module file at " + path.string() +
              ", using core modules");
    return set;
  }

  std::vector<std::string> ids;
  std::istringstream ss(content);
  std::string line;
  while (std::getline(ss, line)) {
    line = trim(line);
    if (line.empty())
      continue;
    if (std::find(ids.begin(), ids.end(), line) == ids.end())
      ids.push_back(line);
  }

  // Core modules cannot be dropped by editing the file
  for (auto it = CORE_MODULES.rbegin(); it != CORE_MODULES.rend(); ++it) {
    if (std::find(ids.begin(), ids.end(), *it) == ids.end())
      ids.insert(ids.begin(), *it);
  }

  set.ids_ = ids;
  return set;
}

void EnabledModuleSet::save(const fs::path &path) const {
  std::string content;
  for (const auto &id : ids_) {
    content += id + "\n";
  }

  if (!write_file_atomic(path, content)) {
    throw FatalError("Failed to save enabled modules to " + path.string());
  }
}

} // namespace sparkbox
