// core/backup_crypto.cpp - Backup archive encryption implementation
#include "backup_crypto.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include <fcntl.h>
#include <fstream>
#include <memory>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <unistd.h>
#include <vector>

namespace sparkbox {

namespace {

using CipherCtx =
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

constexpr size_t CHUNK_SIZE = 1 << 15;

// Wipes the derived key on scope exit.
struct KeyGuard {
  BackupKey key;
  ~KeyGuard() { OPENSSL_cleanse(key.data(), key.size()); }
};

CipherCtx new_gcm_context(bool encrypt, const BackupKey &key,
                          const unsigned char *iv) {
  CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  if (!ctx) {
    throw RuntimeError("Failed to allocate cipher context");
  }

  int ok = encrypt ? EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr,
                                        nullptr, nullptr)
                   : EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr,
                                        nullptr, nullptr);
  if (ok != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(BACKUP_IV_LENGTH), nullptr) != 1) {
    throw RuntimeError("Failed to initialize AES-256-GCM");
  }

  ok = encrypt ? EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv)
               : EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv);
  if (ok != 1) {
    throw RuntimeError("Failed to set cipher key");
  }
  return ctx;
}

void sync_file(const fs::path &path) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    throw FatalError("Failed to open for sync: " + path.string());
  }
  int rc = ::fsync(fd);
  ::close(fd);
  if (rc != 0) {
    throw FatalError("Failed to sync: " + path.string());
  }
}

fs::path partial_path(const fs::path &dest) {
  fs::path tmp = dest;
  tmp += ".part";
  return tmp;
}

} // namespace

BackupKey derive_backup_key(const std::string &secret) {
  BackupKey key{};
  if (EVP_PBE_scrypt(secret.data(), secret.size(),
                     reinterpret_cast<const unsigned char *>(BACKUP_SALT),
                     std::char_traits<char>::length(BACKUP_SALT), SCRYPT_N,
                     SCRYPT_R, SCRYPT_P, SCRYPT_MAXMEM, key.data(),
                     key.size()) != 1) {
    throw RuntimeError("scrypt key derivation failed");
  }
  return key;
}

void encrypt_file(const fs::path &source, const fs::path &dest,
                  const std::string &secret) {
  std::ifstream in(source, std::ios::binary);
  if (!in.is_open()) {
    throw RuntimeError("Failed to open archive: " + source.string());
  }

  std::array<unsigned char, BACKUP_IV_LENGTH> iv{};
  if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
    throw RuntimeError("Failed to generate IV");
  }

  KeyGuard guard{derive_backup_key(secret)};
  CipherCtx ctx = new_gcm_context(true, guard.key, iv.data());

  fs::path tmp = partial_path(dest);
  try {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw FatalError("Failed to create " + tmp.string());
    }

    // The tag is only known after the last block; reserve its slot.
    std::array<unsigned char, BACKUP_TAG_LENGTH> tag{};
    out.write(reinterpret_cast<const char *>(iv.data()), iv.size());
    out.write(reinterpret_cast<const char *>(tag.data()), tag.size());

    std::vector<char> buffer(CHUNK_SIZE);
    std::vector<unsigned char> cipher(CHUNK_SIZE + EVP_MAX_BLOCK_LENGTH);
    while (in) {
      in.read(buffer.data(), buffer.size());
      std::streamsize got = in.gcount();
      if (got <= 0)
        break;
      int len = 0;
      if (EVP_EncryptUpdate(ctx.get(), cipher.data(), &len,
                            reinterpret_cast<unsigned char *>(buffer.data()),
                            static_cast<int>(got)) != 1) {
        throw RuntimeError("Encryption failed");
      }
      out.write(reinterpret_cast<const char *>(cipher.data()), len);
    }
    if (!in.eof()) {
      throw RuntimeError("Failed while reading " + source.string());
    }

    int len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), cipher.data(), &len) != 1) {
      throw RuntimeError("Encryption failed");
    }
    out.write(reinterpret_cast<const char *>(cipher.data()), len);

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(tag.size()), tag.data()) != 1) {
      throw RuntimeError("Failed to read authentication tag");
    }
    out.seekp(static_cast<std::streamoff>(BACKUP_IV_LENGTH));
    out.write(reinterpret_cast<const char *>(tag.data()), tag.size());
    out.flush();
    if (!out) {
      throw FatalError("Failed to write " + tmp.string());
    }
    out.close();

    sync_file(tmp);
    std::error_code ec;
    fs::rename(tmp, dest, ec);
    if (ec) {
      throw FatalError("Failed to move encrypted backup into place: " +
                       ec.message());
    }
  } catch (...) {
    remove_file_quiet(tmp);
    throw;
  }
}

void decrypt_file(const fs::path &source, const fs::path &dest,
                  const std::string &secret) {
  std::ifstream in(source, std::ios::binary);
  if (!in.is_open()) {
    throw NotFoundError("Backup not found: " + source.filename().string());
  }

  std::array<unsigned char, BACKUP_IV_LENGTH> iv{};
  std::array<unsigned char, BACKUP_TAG_LENGTH> tag{};
  in.read(reinterpret_cast<char *>(iv.data()), iv.size());
  in.read(reinterpret_cast<char *>(tag.data()), tag.size());
  if (!in) {
    throw AuthenticationError("Encrypted backup is truncated");
  }

  KeyGuard guard{derive_backup_key(secret)};
  CipherCtx ctx = new_gcm_context(false, guard.key, iv.data());

  fs::path tmp = partial_path(dest);
  try {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw FatalError("Failed to create " + tmp.string());
    }

    std::vector<char> buffer(CHUNK_SIZE);
    std::vector<unsigned char> plain(CHUNK_SIZE + EVP_MAX_BLOCK_LENGTH);
    while (in) {
      in.read(buffer.data(), buffer.size());
      std::streamsize got = in.gcount();
      if (got <= 0)
        break;
      int len = 0;
      if (EVP_DecryptUpdate(ctx.get(), plain.data(), &len,
                            reinterpret_cast<unsigned char *>(buffer.data()),
                            static_cast<int>(got)) != 1) {
        throw AuthenticationError("Backup decryption failed");
      }
      out.write(reinterpret_cast<const char *>(plain.data()), len);
    }
    if (!in.eof()) {
      throw RuntimeError("Failed while reading " + source.string());
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(tag.size()), tag.data()) != 1) {
      throw RuntimeError("Failed to set authentication tag");
    }
    int len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plain.data(), &len) != 1) {
      throw AuthenticationError(
          "Backup authentication failed: wrong key or corrupted file");
    }
    out.write(reinterpret_cast<const char *>(plain.data()), len);
    out.flush();
    if (!out) {
      throw FatalError("Failed to write " + tmp.string());
    }
    out.close();

    std::error_code ec;
    fs::rename(tmp, dest, ec);
    if (ec) {
      throw FatalError("Failed to move decrypted backup into place: " +
                       ec.message());
    }
  } catch (...) {
    remove_file_quiet(tmp);
    throw;
  }
}

} // namespace sparkbox
