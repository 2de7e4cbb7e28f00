// core/registry.cpp - Module discovery implementation
#include "registry.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <algorithm>
#include <fstream>

namespace sparkbox {

ModuleRegistry::ModuleRegistry(fs::path modules_dir)
    : modules_dir_(std::move(modules_dir)) {}

bool ModuleRegistry::is_valid_id(const std::string &id) {
  if (id.empty() || id == "." || id == "..")
    return false;
  return id.find_first_of("/\\\0", 0, 3) == std::string::npos;
}

fs::path ModuleRegistry::descriptor_path(const std::string &id) const {
  return modules_dir_ / id / DESCRIPTOR_FILE_NAME;
}

DiscoveryResult ModuleRegistry::discover() const {
  DiscoveryResult result;
  std::error_code ec;

  if (!fs::is_directory(modules_dir_, ec)) {
    LOG_WARN("Modules directory not found: " + modules_dir_.string());
    return result;
  }

  fs::directory_iterator it(modules_dir_, ec);
  if (ec) {
    LOG_ERROR("Failed to scan modules: " + ec.message());
    return result;
  }

  // A module we cannot stat is skipped like a broken one; the scan goes on
  for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
    std::string dir_name = it->path().filename().string();
    std::error_code entry_ec;
    if (!it->is_directory(entry_ec)) {
      continue;
    }
    if (dir_name == "lost+found" || dir_name == ".git") {
      continue;
    }

    fs::path compose = it->path() / DESCRIPTOR_FILE_NAME;
    bool present = fs::exists(compose, entry_ec);
    if (entry_ec) {
      LOG_WARN("Skipping module " + dir_name + ": " + entry_ec.message());
      result.failures.push_back({dir_name, entry_ec.message()});
      continue;
    }
    if (!present) {
      continue;
    }

    try {
      result.modules.push_back(load_descriptor(compose));
    } catch (const DescriptorError &e) {
      LOG_WARN("Skipping module " + dir_name + ": " + e.what());
      result.failures.push_back({dir_name, e.what()});
    }
  }
  if (ec) {
    LOG_ERROR("Module scan stopped early: " + ec.message());
  }

  std::sort(result.modules.begin(), result.modules.end(),
            [](const ModuleDescriptor &a, const ModuleDescriptor &b) {
              return a.id < b.id;
            });

  return result;
}

std::optional<ModuleDescriptor>
ModuleRegistry::find(const std::string &id) const {
  if (!is_valid_id(id)) {
    return std::nullopt;
  }

  fs::path compose = descriptor_path(id);
  std::error_code ec;
  if (!fs::exists(compose, ec)) {
    return std::nullopt;
  }

  try {
    return load_descriptor(compose);
  } catch (const DescriptorError &e) {
    LOG_WARN("Module " + id + " has an unreadable descriptor: " + e.what());
    return std::nullopt;
  }
}

std::optional<std::string> read_field(const fs::path &descriptor_path,
                                      const std::string &field) {
  std::ifstream file(descriptor_path);
  if (!file.is_open()) {
    return std::nullopt;
  }

  const std::string section = std::string(DESCRIPTOR_EXTENSION_KEY) + ":";
  const std::string wanted = "  " + field + ":";

  bool in_section = false;
  std::string line;
  while (std::getline(file, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();

    if (!in_section) {
      if (starts_with(line, section) && trim(line) == section)
        in_section = true;
      continue;
    }

    // Next top-level key ends the block
    if (!line.empty() && line[0] != ' ' && line[0] != '\t' && line[0] != '#')
      break;

    if (!starts_with(line, wanted))
      continue;

    std::string value = trim(line.substr(wanted.size()));
    auto comment = value.find(" #");
    if (comment != std::string::npos && value[0] != '"' && value[0] != '\'')
      value = trim(value.substr(0, comment));
    return strip_quotes(value);
  }

  return std::nullopt;
}

} // namespace sparkbox
