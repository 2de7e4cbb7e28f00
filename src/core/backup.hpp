// core/backup.hpp - Backup archive creation, listing and decryption
#pragma once

#include "../conf/config_store.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace sparkbox {

struct BackupInfo {
  std::string filename;
  fs::path path;
  uint64_t size = 0;
  int64_t created = 0; // mtime, seconds since epoch
  bool encrypted = false;
};

// Deletes files once their deadline passes. Files still pending when the
// scheduler is destroyed are deleted immediately.
class CleanupScheduler {
public:
  CleanupScheduler();
  ~CleanupScheduler();

  CleanupScheduler(const CleanupScheduler &) = delete;
  CleanupScheduler &operator=(const CleanupScheduler &) = delete;

  void schedule(const fs::path &path, std::chrono::milliseconds delay);
  size_t pending() const;

private:
  void run();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::multimap<std::chrono::steady_clock::time_point, fs::path> queue_;
  bool stop_ = false;
  std::thread worker_;
};

class BackupEngine {
public:
  BackupEngine(fs::path root, fs::path backups_dir, const ConfigStore &store,
               std::chrono::milliseconds decrypt_ttl);

  // Archives state/, .env and modules/*/config. Encrypts when a secret is
  // configured and encrypt is set. Only one create runs at a time; a second
  // caller gets PreconditionError. Existing archives are never overwritten:
  // a second backup within the same second gets a -N suffix.
  BackupInfo create(bool encrypt = true);

  // Newest first. Files not following the naming pattern are ignored.
  std::vector<BackupInfo> list() const;

  // Throws ValidationError for anything but a plain backup filename and
  // NotFoundError if it does not exist.
  fs::path get_path(const std::string &filename) const;

  // Decrypts into a fresh file under backups/.tmp/ and schedules removal of
  // exactly that file after the configured ttl. Concurrent calls for the same
  // backup get separate copies.
  fs::path decrypt(const std::string &filename);

  void remove(const std::string &filename);

  // Deletes all but the newest `keep` archives. Returns deleted filenames.
  std::vector<std::string> prune(size_t keep);

  static bool is_backup_filename(const std::string &name);
  static bool is_encrypted_filename(const std::string &name);

  size_t pending_cleanups() const { return cleanup_.pending(); }

private:
  std::vector<std::string> archive_entries() const;
  fs::path next_archive_path() const;
  BackupInfo describe(const fs::path &path, int64_t *mtime_ns = nullptr) const;

  fs::path root_;
  fs::path backups_dir_;
  const ConfigStore &store_;
  std::chrono::milliseconds decrypt_ttl_;

  std::mutex create_mutex_;
  CleanupScheduler cleanup_;
};

} // namespace sparkbox
