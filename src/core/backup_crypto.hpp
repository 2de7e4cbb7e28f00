// core/backup_crypto.hpp - Backup archive encryption (scrypt + AES-256-GCM)
#pragma once

#include "../defs.hpp"
#include <array>
#include <cstdint>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace sparkbox {

using BackupKey = std::array<uint8_t, BACKUP_KEY_LENGTH>;

// scrypt(secret, fixed salt). Throws RuntimeError if the KDF fails.
BackupKey derive_backup_key(const std::string &secret);

// Writes [IV][tag][ciphertext] of source to dest. dest is only created once
// the whole file was written and synced; on error nothing is left at dest.
void encrypt_file(const fs::path &source, const fs::path &dest,
                  const std::string &secret);

// Reverse of encrypt_file. Throws AuthenticationError if the tag does not
// verify or the file is truncated; dest is only created after verification.
void decrypt_file(const fs::path &source, const fs::path &dest,
                  const std::string &secret);

} // namespace sparkbox
