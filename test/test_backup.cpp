/**
 * @file test_backup.cpp
 * @brief Backup archives, encryption and download cleanup
 *
 * Tests:
 * - Encrypt/decrypt round trip with the right key, AuthenticationError otherwise
 * - Truncated and tampered files never yield plaintext
 * - Filenames are checked before the filesystem is touched
 * - Encrypted create leaves exactly one archive and no plaintext
 * - Without a secret the plaintext archive is kept
 * - Decrypted copies are removed after the ttl and at shutdown
 * - Listing order, deletion and pruning
 * - Back-to-back creates keep both archives
 * - Overlapping decrypts get their own copies and deadlines
 * - Only one create runs at a time
 */

#include "core/backup.hpp"
#include "core/backup_crypto.hpp"
#include "core/errors.hpp"
#include "test_support.hpp"
#include "utils.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>

using namespace sparkbox;
using namespace sparkbox::test;
using namespace std::chrono_literals;

namespace {

// A SparkBox root with state, secrets and one module config directory.
struct Fixture {
  TempDir tmp;
  fs::path root;
  fs::path backups;
  ConfigStore store;

  explicit Fixture(const std::string &env = "SB_BACKUP_KEY=abc\n")
      : root(tmp.path()), backups(tmp.path() / "backups"),
        store(tmp.path() / ".env") {
    write_text(root / ".env", env);
    write_text(root / "state" / "modules.conf", "core\ndashboard\nprivacy\n");
    write_text(root / "modules" / "privacy" / "config" / "unbound.conf", "server:\n");
    write_text(root / "modules" / "privacy" / "data" / "huge.db", "volume data");
    write_text(root / "modules" / "privacy" / "docker-compose.yml", "x-sparkbox: {}\n");
  }
};

std::vector<std::string> dir_entries(const fs::path &dir) {
  std::vector<std::string> names;
  std::error_code ec;
  for (const auto &e : fs::directory_iterator(dir, ec))
    names.push_back(e.path().filename().string());
  return names;
}

std::string archive_listing(const fs::path &archive) {
  CommandResult result = run_command({"tar", "-tzf", archive.string()});
  assert(result.exit_code == 0);
  return result.output;
}

template <typename Cond> bool eventually(Cond cond) {
  for (int i = 0; i < 300; ++i) {
    if (cond())
      return true;
    std::this_thread::sleep_for(10ms);
  }
  return cond();
}

void set_age(const fs::path &path, std::chrono::hours age) {
  fs::last_write_time(path, fs::file_time_type::clock::now() - age);
}

} // namespace

static void test_crypto_round_trip() {
  TempDir tmp;
  std::string original;
  for (int i = 0; i < 100000; ++i)
    original += static_cast<char>(i * 7 % 256);
  write_text(tmp.path() / "archive.tar.gz", original);

  fs::path enc = tmp.path() / "archive.tar.gz.enc";
  encrypt_file(tmp.path() / "archive.tar.gz", enc, "abc");
  std::string sealed = read_text(enc);
  assert(sealed.size() ==
         original.size() + BACKUP_IV_LENGTH + BACKUP_TAG_LENGTH);
  assert(sealed.find(original.substr(0, 64)) == std::string::npos);

  fs::path out = tmp.path() / "restored.tar.gz";
  decrypt_file(enc, out, "abc");
  assert(read_text(out) == original);

  fs::path wrong = tmp.path() / "wrong.tar.gz";
  assert(throws<AuthenticationError>([&]() { decrypt_file(enc, wrong, "xyz"); }));
  assert(!fs::exists(wrong));
  assert(!fs::exists(tmp.path() / "wrong.tar.gz.part"));
}

static void test_fresh_iv_per_encryption() {
  TempDir tmp;
  write_text(tmp.path() / "a", "same plaintext");
  encrypt_file(tmp.path() / "a", tmp.path() / "one.enc", "abc");
  encrypt_file(tmp.path() / "a", tmp.path() / "two.enc", "abc");
  std::string one = read_text(tmp.path() / "one.enc");
  std::string two = read_text(tmp.path() / "two.enc");
  assert(one.substr(0, BACKUP_IV_LENGTH) != two.substr(0, BACKUP_IV_LENGTH));
  assert(one != two);
}

static void test_tampered_and_truncated() {
  TempDir tmp;
  write_text(tmp.path() / "plain", "backup contents that matter");
  fs::path enc = tmp.path() / "sealed.enc";
  encrypt_file(tmp.path() / "plain", enc, "abc");

  std::string sealed = read_text(enc);
  sealed[sealed.size() - 1] ^= 0x01;
  write_text(tmp.path() / "tampered.enc", sealed);
  assert(throws<AuthenticationError>(
      [&]() { decrypt_file(tmp.path() / "tampered.enc", tmp.path() / "t.out", "abc"); }));
  assert(!fs::exists(tmp.path() / "t.out"));

  write_text(tmp.path() / "short.enc", sealed.substr(0, 20));
  assert(throws<AuthenticationError>(
      [&]() { decrypt_file(tmp.path() / "short.enc", tmp.path() / "s.out", "abc"); }));
  assert(!fs::exists(tmp.path() / "s.out"));
}

static void test_encrypt_failure_leaves_nothing() {
  TempDir tmp;
  write_text(tmp.path() / "plain", "data");
  fs::path dest = tmp.path() / "missing-dir" / "plain.enc";
  assert(throws<FatalError>([&]() { encrypt_file(tmp.path() / "plain", dest, "abc"); }));
  assert(!fs::exists(dest));
  assert(fs::exists(tmp.path() / "plain"));
}

static void test_filename_validation() {
  Fixture f;
  BackupEngine engine(f.root, f.backups, f.store, 60s);

  assert(throws<ValidationError>([&]() { engine.get_path("../../etc/passwd"); }));
  assert(throws<ValidationError>([&]() { engine.get_path("not-a-backup.txt"); }));
  assert(throws<ValidationError>(
      [&]() { engine.get_path("sparkbox-backup-x/../../.env.tar.gz"); }));
  assert(throws<ValidationError>([&]() { engine.get_path(""); }));
  assert(throws<NotFoundError>(
      [&]() { engine.get_path("sparkbox-backup-2024-01-01T00-00-00.tar.gz"); }));

  assert(BackupEngine::is_encrypted_filename("sparkbox-backup-1.tar.gz.enc"));
  assert(!BackupEngine::is_encrypted_filename("sparkbox-backup-1.tar.gz"));
  assert(!BackupEngine::is_backup_filename("sparkbox-backup-1.zip"));
}

static void test_create_encrypted() {
  Fixture f;
  BackupEngine engine(f.root, f.backups, f.store, 60s);

  BackupInfo info = engine.create(true);
  assert(info.encrypted);
  assert(BackupEngine::is_encrypted_filename(info.filename));
  assert(info.size > BACKUP_IV_LENGTH + BACKUP_TAG_LENGTH);

  auto listed = engine.list();
  assert(listed.size() == 1);
  assert(listed[0].filename == info.filename);
  assert(listed[0].encrypted);

  // Only the encrypted archive remains
  auto entries = dir_entries(f.backups);
  assert(entries.size() == 1);
  assert(entries[0] == info.filename);
}

static void test_decrypt_created_backup() {
  Fixture f;
  BackupEngine engine(f.root, f.backups, f.store, 60s);
  BackupInfo info = engine.create(true);

  fs::path plain = engine.decrypt(info.filename);
  assert(plain.parent_path() == f.backups / ".tmp");
  std::string stem = info.filename.substr(0, info.filename.size() - 11);
  assert(plain.filename().string().rfind(stem + "-", 0) == 0);
  assert(ends_with(plain.filename().string(), ".tar.gz"));

  std::string listing = archive_listing(plain);
  assert(listing.find("state/modules.conf") != std::string::npos);
  assert(listing.find(".env") != std::string::npos);
  assert(listing.find("modules/privacy/config/unbound.conf") != std::string::npos);
  assert(listing.find("huge.db") == std::string::npos);
  assert(listing.find("docker-compose.yml") == std::string::npos);

  // The secret is read at call time
  f.store.update({{"SB_BACKUP_KEY", "xyz"}});
  fs::remove(plain);
  assert(throws<AuthenticationError>([&]() { engine.decrypt(info.filename); }));
  assert(!fs::exists(plain));
  assert(dir_entries(f.backups / ".tmp").empty());
}

static void test_create_without_secret_keeps_plaintext() {
  Fixture f("SB_DOMAIN=box.local\n");
  BackupEngine engine(f.root, f.backups, f.store, 60s);

  BackupInfo info = engine.create(true);
  assert(!info.encrypted);
  assert(fs::exists(info.path));
  assert(archive_listing(info.path).find("state/modules.conf") != std::string::npos);

  assert(throws<ValidationError>([&]() { engine.decrypt(info.filename); }));

  std::string enc_name = info.filename + ".enc";
  write_text(f.backups / enc_name, std::string(64, 'x'));
  assert(throws<PreconditionError>([&]() { engine.decrypt(enc_name); }));
}

static void test_session_secret_fallback() {
  Fixture f("SB_SESSION_SECRET=fallback\n");
  BackupEngine engine(f.root, f.backups, f.store, 60s);
  BackupInfo info = engine.create(true);
  assert(info.encrypted);
  fs::path plain = engine.decrypt(info.filename);
  assert(fs::exists(plain));
}

static void test_plain_create_on_request() {
  Fixture f;
  BackupEngine engine(f.root, f.backups, f.store, 60s);
  BackupInfo info = engine.create(false);
  assert(!info.encrypted);
  assert(!BackupEngine::is_encrypted_filename(info.filename));
}

static void test_decrypted_copy_expires() {
  Fixture f;
  BackupEngine engine(f.root, f.backups, f.store, 100ms);
  BackupInfo info = engine.create(true);

  fs::path plain = engine.decrypt(info.filename);
  assert(fs::exists(plain));
  assert(engine.pending_cleanups() == 1);
  assert(eventually([&]() { return !fs::exists(plain); }));
  assert(engine.pending_cleanups() == 0);
  // The encrypted archive itself is untouched
  assert(fs::exists(info.path));
}

static void test_pending_cleanup_runs_at_shutdown() {
  Fixture f;
  fs::path plain;
  {
    BackupEngine engine(f.root, f.backups, f.store, std::chrono::hours(1));
    BackupInfo info = engine.create(true);
    plain = engine.decrypt(info.filename);
    assert(fs::exists(plain));
  }
  assert(!fs::exists(plain));
}

static void test_list_order_and_filtering() {
  Fixture f;
  BackupEngine engine(f.root, f.backups, f.store, 60s);

  const std::string oldest = "sparkbox-backup-2024-01-01T00-00-00.tar.gz";
  const std::string middle = "sparkbox-backup-2024-02-01T00-00-00.tar.gz.enc";
  const std::string newest = "sparkbox-backup-2024-03-01T00-00-00.tar.gz";
  write_text(f.backups / oldest, "a");
  write_text(f.backups / middle, "bb");
  write_text(f.backups / newest, "ccc");
  write_text(f.backups / "notes.txt", "ignored");
  write_text(f.backups / "sparkbox-backup-x.zip", "ignored");
  fs::create_directories(f.backups / ".tmp");
  set_age(f.backups / oldest, std::chrono::hours(72));
  set_age(f.backups / middle, std::chrono::hours(48));
  set_age(f.backups / newest, std::chrono::hours(24));

  auto listed = engine.list();
  assert(listed.size() == 3);
  assert(listed[0].filename == newest);
  assert(listed[1].filename == middle);
  assert(listed[1].encrypted);
  assert(listed[1].size == 2);
  assert(listed[2].filename == oldest);
  assert(listed[0].created > listed[2].created);

  engine.remove(middle);
  assert(!fs::exists(f.backups / middle));
  assert(throws<NotFoundError>([&]() { engine.remove(middle); }));
  assert(throws<ValidationError>([&]() { engine.remove("notes.txt"); }));

  auto pruned = engine.prune(1);
  assert(pruned.size() == 1);
  assert(pruned[0] == oldest);
  assert(engine.list().size() == 1);
  assert(fs::exists(f.backups / "notes.txt"));
}

static void test_back_to_back_creates_keep_both() {
  Fixture f;
  BackupEngine engine(f.root, f.backups, f.store, 60s);

  BackupInfo first = engine.create(true);
  write_text(f.root / "state" / "modules.conf", "core\ndashboard\n");
  BackupInfo second = engine.create(true);
  BackupInfo third = engine.create(false);

  assert(first.filename != second.filename);
  assert(BackupEngine::is_encrypted_filename(second.filename));
  assert(BackupEngine::is_backup_filename(third.filename));
  assert(fs::exists(first.path));

  auto listed = engine.list();
  assert(listed.size() == 3);
  assert(listed[0].filename == third.filename);
  assert(listed[1].filename == second.filename);
  assert(listed[2].filename == first.filename);

  // The first archive still holds the state it was taken from
  fs::path plain = engine.decrypt(first.filename);
  fs::path extract = f.tmp.path() / "extract";
  fs::create_directories(extract);
  CommandResult result =
      run_command({"tar", "-xzf", plain.string(), "-C", extract.string()});
  assert(result.exit_code == 0);
  assert(read_text(extract / "state" / "modules.conf") ==
         "core\ndashboard\nprivacy\n");
}

static void test_overlapping_decrypts_have_own_copies() {
  Fixture f;
  BackupEngine engine(f.root, f.backups, f.store, 400ms);
  BackupInfo info = engine.create(true);

  fs::path a = engine.decrypt(info.filename);
  std::this_thread::sleep_for(150ms);
  fs::path b = engine.decrypt(info.filename);
  assert(a != b);
  assert(read_text(a) == read_text(b));
  assert(engine.pending_cleanups() == 2);

  // a's deadline passes first and leaves b alone
  assert(eventually([&]() { return !fs::exists(a); }));
  assert(fs::exists(b));
  assert(eventually([&]() { return !fs::exists(b); }));
}

static void test_concurrent_create_is_rejected() {
  Fixture f;
  BackupEngine engine(f.root, f.backups, f.store, 60s);

  // A tar on PATH that signals it started and then stalls
  fs::path bin = f.tmp.path() / "slowbin";
  fs::path started = f.tmp.path() / "tar-started";
  const char *orig = std::getenv("PATH");
  std::string orig_path = orig ? orig : "/usr/bin:/bin";
  write_text(bin / "tar", "#!/bin/sh\n"
                          "touch '" + started.string() + "'\n"
                          "sleep 1\n"
                          "PATH='" + orig_path + "' exec tar \"$@\"\n");
  fs::permissions(bin / "tar", fs::perms::owner_all);
  setenv("PATH", (bin.string() + ":" + orig_path).c_str(), 1);

  std::atomic<bool> first_ok{false};
  std::thread first([&]() {
    engine.create(false);
    first_ok = true;
  });
  assert(eventually([&]() { return fs::exists(started); }));

  assert(throws<PreconditionError>([&]() { engine.create(false); }));
  first.join();
  setenv("PATH", orig_path.c_str(), 1);

  assert(first_ok.load());
  assert(engine.list().size() == 1);
  assert(dir_entries(f.backups).size() == 1);
}

int main() {
  std::cout << "=== Backup Tests ===" << std::endl;

  RUN_TEST(test_crypto_round_trip);
  RUN_TEST(test_fresh_iv_per_encryption);
  RUN_TEST(test_tampered_and_truncated);
  RUN_TEST(test_encrypt_failure_leaves_nothing);
  RUN_TEST(test_filename_validation);
  RUN_TEST(test_create_encrypted);
  RUN_TEST(test_decrypt_created_backup);
  RUN_TEST(test_create_without_secret_keeps_plaintext);
  RUN_TEST(test_session_secret_fallback);
  RUN_TEST(test_plain_create_on_request);
  RUN_TEST(test_decrypted_copy_expires);
  RUN_TEST(test_pending_cleanup_runs_at_shutdown);
  RUN_TEST(test_list_order_and_filtering);
  RUN_TEST(test_back_to_back_creates_keep_both);
  RUN_TEST(test_overlapping_decrypts_have_own_copies);
  RUN_TEST(test_concurrent_create_is_rejected);

  std::cout << "=== All backup tests passed ===" << std::endl;
  return 0;
}
