// utils.cpp - Utility functions implementation
#include "utils.hpp"
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <iostream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace sparkbox {

// Logger implementation
Logger &Logger::getInstance() {
  static Logger instance;
  return instance;
}

void Logger::init(bool verbose, const fs::path &log_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  verbose_ = verbose;

  if (!log_path.empty()) {
    std::error_code ec;
    if (log_path.has_parent_path()) {
      fs::create_directories(log_path.parent_path(), ec);
    }
    log_file_ = std::make_unique<std::ofstream>(log_path, std::ios::app);
  }
}

void Logger::log(const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);

  // Skip DEBUG messages if not in verbose mode
  if (level == "DEBUG" && !verbose_) {
    return;
  }

  auto now = std::time(nullptr);
  std::tm tm_buf{};
  localtime_r(&now, &tm_buf);
  char time_buf[64];
  std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", &tm_buf);

  std::string log_line =
      std::string("[") + time_buf + "] [" + level + "] " + message + "\n";

  if (log_file_ && log_file_->is_open()) {
    *log_file_ << log_line;
    log_file_->flush();
  }

  std::cerr << log_line;
}

// File system utilities
bool ensure_dir_exists(const fs::path &path) {
  try {
    if (!fs::exists(path)) {
      fs::create_directories(path);
    }
    return true;
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to create directory " + path.string() + ": " + e.what());
    return false;
  }
}

bool read_file(const fs::path &path, std::string &content) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return false;
  }
  content.assign((std::istreambuf_iterator<char>(file)),
                 std::istreambuf_iterator<char>());
  return !file.bad();
}

bool write_file_atomic(const fs::path &path, const std::string &content) {
  if (path.has_parent_path() && !ensure_dir_exists(path.parent_path())) {
    return false;
  }

  fs::path tmp_path = path;
  tmp_path += ".tmp";

  int fd = open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                0600);
  if (fd < 0) {
    LOG_ERROR("Failed to open " + tmp_path.string() + ": " + strerror(errno));
    return false;
  }

  const char *data = content.data();
  size_t remaining = content.size();
  while (remaining > 0) {
    ssize_t n = write(fd, data, remaining);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      LOG_ERROR("Failed to write " + tmp_path.string() + ": " +
                strerror(errno));
      close(fd);
      unlink(tmp_path.c_str());
      return false;
    }
    data += n;
    remaining -= static_cast<size_t>(n);
  }

  if (fsync(fd) != 0 || close(fd) != 0) {
    LOG_ERROR("Failed to flush " + tmp_path.string() + ": " + strerror(errno));
    unlink(tmp_path.c_str());
    return false;
  }

  if (rename(tmp_path.c_str(), path.c_str()) != 0) {
    LOG_ERROR("Failed to replace " + path.string() + ": " + strerror(errno));
    unlink(tmp_path.c_str());
    return false;
  }

  return true;
}

bool remove_file_quiet(const fs::path &path) {
  std::error_code ec;
  bool removed = fs::remove(path, ec);
  if (ec) {
    LOG_WARN("Failed to remove " + path.string() + ": " + ec.message());
    return false;
  }
  return removed;
}

// String utilities
std::string trim(const std::string &s) {
  auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos)
    return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string strip_quotes(const std::string &s) {
  if (s.size() >= 2 && ((s.front() == '"' && s.back() == '"') ||
                        (s.front() == '\'' && s.back() == '\''))) {
    return s.substr(1, s.size() - 2);
  }
  return s;
}

bool starts_with(const std::string &s, const std::string &prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Process utilities
CommandResult run_command(const std::vector<std::string> &argv,
                          const fs::path &cwd,
                          const std::vector<std::string> &extra_env) {
  CommandResult result;
  if (argv.empty()) {
    return result;
  }

  // Everything the child needs is built before fork
  std::vector<char *> args;
  for (const auto &a : argv) {
    args.push_back(const_cast<char *>(a.c_str()));
  }
  args.push_back(nullptr);

  std::vector<char *> envp;
  for (char **e = environ; e && *e; ++e) {
    std::string entry(*e);
    std::string name = entry.substr(0, entry.find('='));
    bool overridden = false;
    for (const auto &x : extra_env) {
      if (starts_with(x, name + "=")) {
        overridden = true;
        break;
      }
    }
    if (!overridden)
      envp.push_back(*e);
  }
  for (const auto &e : extra_env) {
    envp.push_back(const_cast<char *>(e.c_str()));
  }
  envp.push_back(nullptr);

  int pipefd[2];
  if (pipe2(pipefd, O_CLOEXEC) != 0) {
    LOG_ERROR("pipe failed: " + std::string(strerror(errno)));
    return result;
  }

  pid_t pid = fork();
  if (pid < 0) {
    LOG_ERROR("fork failed: " + std::string(strerror(errno)));
    close(pipefd[0]);
    close(pipefd[1]);
    return result;
  }

  if (pid == 0) {
    dup2(pipefd[1], STDOUT_FILENO);
    dup2(pipefd[1], STDERR_FILENO);
    if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
      _exit(126);
    }
    execvpe(args[0], args.data(), envp.data());
    _exit(127);
  }

  close(pipefd[1]);
  char buf[4096];
  while (true) {
    ssize_t n = read(pipefd[0], buf, sizeof(buf));
    if (n > 0) {
      result.output.append(buf, static_cast<size_t>(n));
    } else if (n < 0 && errno == EINTR) {
      continue;
    } else {
      break;
    }
  }
  close(pipefd[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      LOG_ERROR("waitpid failed: " + std::string(strerror(errno)));
      return result;
    }
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  }
  return result;
}

// Time
std::string timestamp_for_filename() {
  auto now = std::time(nullptr);
  std::tm tm_buf{};
  gmtime_r(&now, &tm_buf);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H-%M-%S", &tm_buf);
  return buf;
}

} // namespace sparkbox
