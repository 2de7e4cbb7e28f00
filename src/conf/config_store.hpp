// conf/config_store.hpp - Live key/value configuration (.env) store
#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace sparkbox {

using ConfigValues = std::map<std::string, std::string>;

// Owns the .env file. All reads and writes of live configuration go through
// one instance; nothing is mirrored into the process environment.
class ConfigStore {
public:
  explicit ConfigStore(fs::path env_file);

  ConfigValues read() const;
  std::optional<std::string> get(const std::string &key) const;

  // Same as read() with sensitive values replaced by a fixed mask.
  ConfigValues read_masked() const;

  // Rewrites existing KEY= lines in place and appends new keys. Comments and
  // unrelated lines are preserved. Throws ValidationError for values that
  // could break the file format, FatalError if the file cannot be written.
  void update(const ConfigValues &updates);

  // SB_BACKUP_KEY, falling back to SB_SESSION_SECRET. Empty when neither set.
  std::string backup_secret() const;

  const fs::path &path() const { return env_file_; }

  static bool is_sensitive_key(const std::string &key);
  static void validate_value(const std::string &key, const std::string &value);

private:
  ConfigValues read_locked() const;

  fs::path env_file_;
  mutable std::mutex mutex_;
};

} // namespace sparkbox
