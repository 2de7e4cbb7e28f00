// conf/config.hpp - Configuration management
#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace sparkbox {

struct Config {
  fs::path root = "/opt/sparkbox";
  fs::path moduledir; // empty: <root>/modules
  std::string docker_socket = "/var/run/docker.sock";
  std::string container_prefix = "sb-";
  fs::path log_file;
  bool verbose = false;
  int decrypt_ttl = 60;
  int status_interval = 5;
  int hoststats_interval = 3;
  int log_tail = 200;

  fs::path modules_dir() const;
  fs::path state_dir() const;
  fs::path enabled_modules_file() const;
  fs::path env_file() const;
  fs::path backups_dir() const;
  fs::path deploy_script() const;

  static Config load_default(const fs::path &root);
  static Config from_file(const fs::path &path);
  bool save_to_file(const fs::path &path) const;

  void merge_with_cli(const fs::path &root_override,
                      const std::string &socket_override,
                      const fs::path &log_override, bool verbose_override);
};

} // namespace sparkbox
