// core/backup.cpp - Backup engine implementation
#include "backup.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "backup_crypto.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstring>
#include <cerrno>
#include <cstdlib>
#include <sys/stat.h>
#include <unistd.h>

namespace sparkbox {

// CleanupScheduler

CleanupScheduler::CleanupScheduler() : worker_([this]() { run(); }) {}

CleanupScheduler::~CleanupScheduler() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable())
    worker_.join();

  for (const auto &entry : queue_) {
    if (remove_file_quiet(entry.second))
      LOG_DEBUG("Removed decrypted backup " + entry.second.string());
  }
}

void CleanupScheduler::schedule(const fs::path &path,
                                std::chrono::milliseconds delay) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.emplace(std::chrono::steady_clock::now() + delay, path);
  }
  cv_.notify_all();
}

size_t CleanupScheduler::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void CleanupScheduler::run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stop_) {
    if (queue_.empty()) {
      cv_.wait(lock, [this]() { return stop_ || !queue_.empty(); });
      continue;
    }

    auto next = queue_.begin()->first;
    if (std::chrono::steady_clock::now() < next) {
      cv_.wait_until(lock, next);
      continue;
    }

    fs::path path = queue_.begin()->second;
    queue_.erase(queue_.begin());
    lock.unlock();
    if (remove_file_quiet(path))
      LOG_INFO("Removed decrypted backup " + path.filename().string());
    lock.lock();
  }
}

// BackupEngine

BackupEngine::BackupEngine(fs::path root, fs::path backups_dir,
                           const ConfigStore &store,
                           std::chrono::milliseconds decrypt_ttl)
    : root_(std::move(root)), backups_dir_(std::move(backups_dir)),
      store_(store), decrypt_ttl_(decrypt_ttl) {}

bool BackupEngine::is_backup_filename(const std::string &name) {
  if (name.find('/') != std::string::npos || name == "." || name == "..")
    return false;
  if (!starts_with(name, BACKUP_PREFIX))
    return false;
  return ends_with(name, BACKUP_SUFFIX) ||
         ends_with(name, std::string(BACKUP_SUFFIX) + ENCRYPTED_SUFFIX);
}

bool BackupEngine::is_encrypted_filename(const std::string &name) {
  return is_backup_filename(name) &&
         ends_with(name, std::string(BACKUP_SUFFIX) + ENCRYPTED_SUFFIX);
}

std::vector<std::string> BackupEngine::archive_entries() const {
  std::vector<std::string> entries;
  std::error_code ec;

  if (fs::exists(root_ / STATE_DIR_NAME, ec))
    entries.push_back(STATE_DIR_NAME);
  if (fs::exists(root_ / ENV_FILE_NAME, ec))
    entries.push_back(ENV_FILE_NAME);

  fs::path modules = root_ / MODULES_DIR_NAME;
  if (fs::is_directory(modules, ec)) {
    std::vector<std::string> configs;
    for (const auto &entry : fs::directory_iterator(modules, ec)) {
      if (!entry.is_directory(ec))
        continue;
      if (fs::is_directory(entry.path() / MODULE_CONFIG_DIR_NAME, ec)) {
        configs.push_back(std::string(MODULES_DIR_NAME) + "/" +
                          entry.path().filename().string() + "/" +
                          MODULE_CONFIG_DIR_NAME);
      }
    }
    std::sort(configs.begin(), configs.end());
    entries.insert(entries.end(), configs.begin(), configs.end());
  }
  return entries;
}

fs::path BackupEngine::next_archive_path() const {
  std::string stamp = std::string(BACKUP_PREFIX) + timestamp_for_filename();
  std::error_code ec;
  for (int n = 0;; ++n) {
    std::string base = n == 0 ? stamp : stamp + "-" + std::to_string(n);
    fs::path tar_path = backups_dir_ / (base + BACKUP_SUFFIX);
    fs::path enc_path = tar_path;
    enc_path += ENCRYPTED_SUFFIX;
    if (!fs::exists(tar_path, ec) && !fs::exists(enc_path, ec))
      return tar_path;
  }
}

BackupInfo BackupEngine::describe(const fs::path &path,
                                  int64_t *mtime_ns) const {
  BackupInfo info;
  info.filename = path.filename().string();
  info.path = path;
  info.encrypted = is_encrypted_filename(info.filename);

  struct stat st;
  if (stat(path.c_str(), &st) == 0) {
    info.size = static_cast<uint64_t>(st.st_size);
    info.created = static_cast<int64_t>(st.st_mtime);
    if (mtime_ns)
      *mtime_ns = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL +
                  st.st_mtim.tv_nsec;
  }
  return info;
}

BackupInfo BackupEngine::create(bool encrypt) {
  std::unique_lock<std::mutex> gate(create_mutex_, std::try_to_lock);
  if (!gate.owns_lock()) {
    throw PreconditionError("A backup is already in progress");
  }

  if (!ensure_dir_exists(backups_dir_)) {
    throw FatalError("Cannot create backup directory " + backups_dir_.string());
  }

  std::vector<std::string> entries = archive_entries();
  if (entries.empty()) {
    throw PreconditionError("Nothing to back up under " + root_.string());
  }

  // Only creators pick names and they hold create_mutex_
  fs::path tar_path = next_archive_path();
  std::string base = tar_path.filename().string();

  LOG_INFO("Creating backup " + base);
  std::vector<std::string> argv = {"tar", "-czf", tar_path.string(), "-C",
                                   root_.string()};
  argv.insert(argv.end(), entries.begin(), entries.end());
  CommandResult result = run_command(argv);
  if (result.exit_code != 0) {
    remove_file_quiet(tar_path);
    LOG_ERROR("tar failed: " + trim(result.output));
    throw RuntimeError("Failed to create backup archive: " +
                       trim(result.output));
  }

  std::string secret = store_.backup_secret();
  if (!encrypt || secret.empty()) {
    if (encrypt)
      LOG_WARN("No backup key configured, keeping " + base + " unencrypted");
    return describe(tar_path);
  }

  fs::path enc_path = tar_path;
  enc_path += ENCRYPTED_SUFFIX;
  try {
    encrypt_file(tar_path, enc_path, secret);
  } catch (const std::exception &e) {
    LOG_ERROR("Encryption failed, plaintext archive kept: " +
              std::string(e.what()));
    throw;
  }

  if (!remove_file_quiet(tar_path)) {
    LOG_WARN("Plaintext archive could not be removed: " + tar_path.string());
  }
  LOG_INFO("Backup encrypted: " + enc_path.filename().string());
  return describe(enc_path);
}

std::vector<BackupInfo> BackupEngine::list() const {
  struct Entry {
    BackupInfo info;
    int64_t mtime_ns = 0;
  };
  std::vector<Entry> entries;
  std::vector<BackupInfo> backups;
  std::error_code ec;
  if (!fs::is_directory(backups_dir_, ec))
    return backups;

  for (const auto &entry : fs::directory_iterator(backups_dir_, ec)) {
    if (!entry.is_regular_file(ec))
      continue;
    std::string name = entry.path().filename().string();
    if (!is_backup_filename(name))
      continue;
    Entry e;
    e.info = describe(entry.path(), &e.mtime_ns);
    entries.push_back(std::move(e));
  }

  std::sort(entries.begin(), entries.end(), [](const Entry &a, const Entry &b) {
    if (a.mtime_ns != b.mtime_ns)
      return a.mtime_ns > b.mtime_ns;
    return a.info.filename > b.info.filename;
  });
  for (auto &e : entries)
    backups.push_back(std::move(e.info));
  return backups;
}

fs::path BackupEngine::get_path(const std::string &filename) const {
  if (!is_backup_filename(filename)) {
    throw ValidationError("Invalid backup filename");
  }
  fs::path path = backups_dir_ / filename;
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw NotFoundError("Backup not found: " + filename);
  }
  return path;
}

fs::path BackupEngine::decrypt(const std::string &filename) {
  if (!is_encrypted_filename(filename)) {
    throw ValidationError("Backup is not encrypted: " + filename);
  }

  std::string secret = store_.backup_secret();
  if (secret.empty()) {
    throw PreconditionError("No decryption key available");
  }

  fs::path source = get_path(filename);
  fs::path tmp_dir = backups_dir_ / DECRYPT_DIR_NAME;
  if (!ensure_dir_exists(tmp_dir)) {
    throw FatalError("Cannot create " + tmp_dir.string());
  }

  // <name>-XXXXXX.tar.gz, reserved with O_EXCL so every caller owns its copy
  std::string stem = filename.substr(
      0, filename.size() - std::strlen(BACKUP_SUFFIX) -
             std::strlen(ENCRYPTED_SUFFIX));
  std::string tmpl = (tmp_dir / (stem + "-XXXXXX" + BACKUP_SUFFIX)).string();
  int fd = mkstemps(tmpl.data(), static_cast<int>(std::strlen(BACKUP_SUFFIX)));
  if (fd < 0) {
    throw FatalError("Cannot create decrypted file in " + tmp_dir.string() +
                     ": " + std::strerror(errno));
  }
  ::close(fd);
  fs::path dest = tmpl;

  try {
    decrypt_file(source, dest, secret);
  } catch (const AuthenticationError &e) {
    remove_file_quiet(dest);
    LOG_WARN("Decryption of " + filename + " rejected: " + e.what());
    throw;
  } catch (const std::exception &e) {
    remove_file_quiet(dest);
    LOG_ERROR("Decryption of " + filename + " failed: " + e.what());
    throw;
  }

  cleanup_.schedule(dest, decrypt_ttl_);
  LOG_INFO("Decrypted " + filename + " to " + dest.filename().string() +
           ", removal in " +
           std::to_string(decrypt_ttl_.count()) + "ms");
  return dest;
}

void BackupEngine::remove(const std::string &filename) {
  fs::path path = get_path(filename);
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    throw FatalError("Failed to delete " + filename + ": " + ec.message());
  }
  LOG_INFO("Deleted backup " + filename);
}

std::vector<std::string> BackupEngine::prune(size_t keep) {
  std::vector<std::string> deleted;
  std::vector<BackupInfo> backups = list();
  for (size_t i = keep; i < backups.size(); ++i) {
    if (remove_file_quiet(backups[i].path)) {
      LOG_INFO("Pruned backup " + backups[i].filename);
      deleted.push_back(backups[i].filename);
    }
  }
  return deleted;
}

} // namespace sparkbox
