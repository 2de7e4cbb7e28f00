// conf/config.cpp - Configuration implementation
#include "config.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <fstream>
#include <stdexcept>

namespace sparkbox {

fs::path Config::modules_dir() const {
  return moduledir.empty() ? root / MODULES_DIR_NAME : moduledir;
}

fs::path Config::state_dir() const { return root / STATE_DIR_NAME; }

fs::path Config::enabled_modules_file() const {
  return state_dir() / ENABLED_MODULES_FILE;
}

fs::path Config::env_file() const { return root / ENV_FILE_NAME; }

fs::path Config::backups_dir() const { return root / BACKUPS_DIR_NAME; }

fs::path Config::deploy_script() const { return root / DEPLOY_SCRIPT_NAME; }

static int parse_positive(const std::string &key, const std::string &value,
                          int fallback) {
  try {
    int parsed = std::stoi(value);
    if (parsed > 0)
      return parsed;
  } catch (const std::exception &) {
  }
  LOG_WARN("Ignoring invalid value for " + key + ": " + value);
  return fallback;
}

Config Config::load_default(const fs::path &root) {
  Config config;
  config.root = root;
  // Try to load from default location if exists
  fs::path default_path = root / DAEMON_CONFIG_FILE;
  if (fs::exists(default_path)) {
    try {
      Config loaded = from_file(default_path);
      if (loaded.root.empty())
        loaded.root = root;
      return loaded;
    } catch (const std::exception &e) {
      LOG_WARN("Failed to load default config, using defaults: " +
               std::string(e.what()));
    }
  }
  return config;
}

// root stays empty unless the file sets it; the caller fills it in.
Config Config::from_file(const fs::path &path) {
  Config config;
  config.root.clear();

  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file " + path.string());
  }

  std::string line;
  while (std::getline(file, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#')
      continue;

    auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos)
      continue;

    std::string key = trim(line.substr(0, eq_pos));
    std::string value = strip_quotes(trim(line.substr(eq_pos + 1)));

    if (key == "root")
      config.root = value;
    else if (key == "moduledir")
      config.moduledir = value;
    else if (key == "docker_socket")
      config.docker_socket = value;
    else if (key == "container_prefix")
      config.container_prefix = value;
    else if (key == "log_file")
      config.log_file = value;
    else if (key == "verbose")
      config.verbose = (value == "true");
    else if (key == "decrypt_ttl")
      config.decrypt_ttl = parse_positive(key, value, config.decrypt_ttl);
    else if (key == "status_interval")
      config.status_interval =
          parse_positive(key, value, config.status_interval);
    else if (key == "hoststats_interval")
      config.hoststats_interval =
          parse_positive(key, value, config.hoststats_interval);
    else if (key == "log_tail")
      config.log_tail = parse_positive(key, value, config.log_tail);
    else
      LOG_DEBUG("Unknown config key: " + key);
  }

  return config;
}

bool Config::save_to_file(const fs::path &path) const {
  std::ofstream file(path);
  if (!file.is_open()) {
    return false;
  }

  file << "# SparkBox Configuration\n";
  file << "root = \"" << root.string() << "\"\n";
  if (!moduledir.empty()) {
    file << "moduledir = \"" << moduledir.string() << "\"\n";
  }
  file << "docker_socket = \"" << docker_socket << "\"\n";
  file << "container_prefix = \"" << container_prefix << "\"\n";
  if (!log_file.empty()) {
    file << "log_file = \"" << log_file.string() << "\"\n";
  }
  file << "verbose = " << (verbose ? "true" : "false") << "\n";
  file << "decrypt_ttl = " << decrypt_ttl << "\n";
  file << "status_interval = " << status_interval << "\n";
  file << "hoststats_interval = " << hoststats_interval << "\n";
  file << "log_tail = " << log_tail << "\n";

  return file.good();
}

void Config::merge_with_cli(const fs::path &root_override,
                            const std::string &socket_override,
                            const fs::path &log_override,
                            bool verbose_override) {
  if (!root_override.empty()) {
    root = root_override;
  }
  if (!socket_override.empty()) {
    docker_socket = socket_override;
  }
  if (!log_override.empty()) {
    log_file = log_override;
  }
  if (verbose_override) {
    verbose = true;
  }
}

} // namespace sparkbox
