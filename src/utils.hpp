// utils.hpp - Utility functions
#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace sparkbox {

// Logging
class Logger {
public:
  static Logger &getInstance();
  void init(bool verbose, const fs::path &log_path);
  void log(const std::string &level, const std::string &message);

private:
  Logger() = default;
  bool verbose_ = false;
  std::mutex mutex_;
  std::unique_ptr<std::ofstream> log_file_;
};

#define LOG_INFO(msg) Logger::getInstance().log("INFO", msg)
#define LOG_WARN(msg) Logger::getInstance().log("WARN", msg)
#define LOG_ERROR(msg) Logger::getInstance().log("ERROR", msg)
#define LOG_DEBUG(msg) Logger::getInstance().log("DEBUG", msg)

// File system utilities
bool ensure_dir_exists(const fs::path &path);
bool read_file(const fs::path &path, std::string &content);
bool write_file_atomic(const fs::path &path, const std::string &content);
bool remove_file_quiet(const fs::path &path);

// String utilities
std::string trim(const std::string &s);
std::string strip_quotes(const std::string &s);
bool starts_with(const std::string &s, const std::string &prefix);
bool ends_with(const std::string &s, const std::string &suffix);

// Process utilities
struct CommandResult {
  int exit_code = -1;
  std::string output;
};

// Runs argv[0] from PATH without a shell, capturing stdout and stderr.
CommandResult run_command(const std::vector<std::string> &argv,
                          const fs::path &cwd = {},
                          const std::vector<std::string> &extra_env = {});

// Time
std::string timestamp_for_filename();

} // namespace sparkbox
