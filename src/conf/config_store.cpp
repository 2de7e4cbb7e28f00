// conf/config_store.cpp - .env store implementation
#include "config_store.hpp"
#include "../core/errors.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <set>
#include <sstream>
#include <vector>

namespace sparkbox {

ConfigStore::ConfigStore(fs::path env_file) : env_file_(std::move(env_file)) {}

static bool parse_line(const std::string &line, std::string &key,
                       std::string &value) {
  std::string trimmed = trim(line);
  if (trimmed.empty() || trimmed[0] == '#')
    return false;

  auto eq_pos = trimmed.find('=');
  if (eq_pos == std::string::npos)
    return false;

  key = trimmed.substr(0, eq_pos);
  value = trimmed.substr(eq_pos + 1);
  return true;
}

ConfigValues ConfigStore::read_locked() const {
  ConfigValues values;

  std::string content;
  if (!read_file(env_file_, content)) {
    return values;
  }

  std::istringstream ss(content);
  std::string line;
  while (std::getline(ss, line)) {
    std::string key, value;
    if (parse_line(line, key, value)) {
      values[key] = value;
    }
  }
  return values;
}

ConfigValues ConfigStore::read() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return read_locked();
}

std::optional<std::string> ConfigStore::get(const std::string &key) const {
  auto values = read();
  auto it = values.find(key);
  if (it == values.end())
    return std::nullopt;
  return it->second;
}

bool ConfigStore::is_sensitive_key(const std::string &key) {
  static const char *markers[] = {"PASSWORD", "SECRET", "TOKEN", "KEY"};
  for (const char *marker : markers) {
    if (key.find(marker) != std::string::npos)
      return true;
  }
  return false;
}

ConfigValues ConfigStore::read_masked() const {
  ConfigValues values = read();
  for (auto &[key, value] : values) {
    if (is_sensitive_key(key)) {
      value = value.empty() ? "" : MASKED_VALUE;
    }
  }
  return values;
}

void ConfigStore::validate_value(const std::string &key,
                                 const std::string &value) {
  if (value.find_first_of("\n\r`$") != std::string::npos) {
    throw ValidationError("Invalid characters in value for \"" + key + "\"");
  }
}

void ConfigStore::update(const ConfigValues &updates) {
  for (const auto &[key, value] : updates) {
    if (key.empty() || key.find_first_of("=\n\r# \t") != std::string::npos) {
      throw ValidationError("Invalid configuration key \"" + key + "\"");
    }
    validate_value(key, value);
  }

  std::lock_guard<std::mutex> lock(mutex_);

  std::string content;
  read_file(env_file_, content);

  std::vector<std::string> lines;
  std::istringstream ss(content);
  std::string line;
  while (std::getline(ss, line)) {
    lines.push_back(line);
  }

  std::set<std::string> updated_keys;
  for (auto &l : lines) {
    std::string key, value;
    if (!parse_line(l, key, value))
      continue;
    auto it = updates.find(key);
    if (it != updates.end()) {
      l = key + "=" + it->second;
      updated_keys.insert(key);
    }
  }

  for (const auto &[key, value] : updates) {
    if (updated_keys.count(key) == 0) {
      lines.push_back(key + "=" + value);
    }
  }

  std::string out;
  for (const auto &l : lines) {
    out += l + "\n";
  }

  if (!write_file_atomic(env_file_, out)) {
    throw FatalError("Failed to write " + env_file_.string());
  }

  LOG_INFO("Updated " + std::to_string(updates.size()) +
           " configuration key(s)");
}

std::string ConfigStore::backup_secret() const {
  auto values = read();
  auto it = values.find(BACKUP_KEY_VAR);
  if (it != values.end() && !it->second.empty())
    return it->second;
  it = values.find(SESSION_SECRET_VAR);
  if (it != values.end() && !it->second.empty())
    return it->second;
  return "";
}

} // namespace sparkbox
