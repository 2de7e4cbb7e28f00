// core/state.hpp - Enabled module set persistence
#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace sparkbox {

bool is_core_module(const std::string &id);

// Ordered set of enabled module ids. The core modules are always present.
class EnabledModuleSet {
public:
  EnabledModuleSet();

  bool contains(const std::string &id) const;
  // Returns false if already present.
  bool add(const std::string &id);
  // Returns false if absent. Core modules are never removed.
  bool remove(const std::string &id);

  const std::vector<std::string> &ids() const { return ids_; }

  // Missing file yields the initial {core, dashboard} set.
  static EnabledModuleSet load(const fs::path &path);
  // Throws FatalError when the file cannot be written.
  void save(const fs::path &path) const;

private:
  std::vector<std::string> ids_;
};

} // namespace sparkbox
