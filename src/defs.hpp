// Constants and definitions
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace sparkbox {

// Directories
constexpr const char *DEFAULT_ROOT = "/opt/sparkbox";
constexpr const char *MODULES_DIR_NAME = "modules";
constexpr const char *STATE_DIR_NAME = "state";
constexpr const char *BACKUPS_DIR_NAME = "backups";
constexpr const char *DECRYPT_DIR_NAME = ".tmp";
constexpr const char *MODULE_CONFIG_DIR_NAME = "config";

// Files
constexpr const char *ENABLED_MODULES_FILE = "modules.conf";
constexpr const char *ENV_FILE_NAME = ".env";
constexpr const char *DAEMON_CONFIG_FILE = "sparkbox.conf";
constexpr const char *DEPLOY_SCRIPT_NAME = "sparkbox";
constexpr const char *DESCRIPTOR_FILE_NAME = "docker-compose.yml";
constexpr const char *DESCRIPTOR_EXTENSION_KEY = "x-sparkbox";

// Modules that are always enabled
const std::vector<std::string> CORE_MODULES = {"core", "dashboard"};

// Containers
constexpr const char *CONTAINER_PREFIX = "sb-";
constexpr const char *DOCKER_SOCKET = "/var/run/docker.sock";
constexpr const char *DOCKER_API_VERSION = "v1.41";
constexpr int DEFAULT_LOG_TAIL = 200;
constexpr int DEFAULT_STATUS_INTERVAL_SEC = 5;

// Config store keys
constexpr const char *BACKUP_KEY_VAR = "SB_BACKUP_KEY";
constexpr const char *SESSION_SECRET_VAR = "SB_SESSION_SECRET";
constexpr const char *MASKED_VALUE = "********";

// Backups
constexpr const char *BACKUP_PREFIX = "sparkbox-backup-";
constexpr const char *BACKUP_SUFFIX = ".tar.gz";
constexpr const char *ENCRYPTED_SUFFIX = ".enc";
constexpr const char *BACKUP_SALT = "sparkbox-backup-salt";
constexpr int DEFAULT_DECRYPT_TTL_SEC = 60;

// AES-256-GCM file layout: [IV][auth tag][ciphertext]
constexpr std::size_t BACKUP_KEY_LENGTH = 32;
constexpr std::size_t BACKUP_IV_LENGTH = 16;
constexpr std::size_t BACKUP_TAG_LENGTH = 16;

// scrypt cost parameters
constexpr unsigned long long SCRYPT_N = 16384;
constexpr unsigned long long SCRYPT_R = 8;
constexpr unsigned long long SCRYPT_P = 1;
constexpr unsigned long long SCRYPT_MAXMEM = 64ULL * 1024 * 1024;

} // namespace sparkbox
