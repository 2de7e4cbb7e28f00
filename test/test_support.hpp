// test/test_support.hpp - Temporary SparkBox roots and fixture writers
#pragma once

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace sparkbox::test {

// Creates a unique directory under the system temp dir, removed on scope exit.
class TempDir {
public:
  TempDir() {
    std::string tmpl = (fs::temp_directory_path() / "sparkbox-test-XXXXXX").string();
    char *created = mkdtemp(tmpl.data());
    assert(created != nullptr);
    path_ = created;
  }

  ~TempDir() {
    std::error_code ec;
    fs::permissions(path_, fs::perms::owner_all, fs::perm_options::add, ec);
    fs::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return path_; }

private:
  fs::path path_;
};

inline void write_text(const fs::path &path, const std::string &content) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
  assert(out.good());
}

inline std::string read_text(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}

// Writes modules/<id>/docker-compose.yml with the given compose services
// block (may be empty) followed by the x-sparkbox block.
inline fs::path write_module(const fs::path &root, const std::string &id,
                             const std::string &extension,
                             const std::string &services = "") {
  fs::path compose = root / "modules" / id / "docker-compose.yml";
  std::string doc;
  if (!services.empty())
    doc += "services:\n" + services;
  doc += "x-sparkbox:\n" + extension;
  write_text(compose, doc);
  return compose;
}

// The three-container module used by the lifecycle scenarios.
inline fs::path write_privacy_module(const fs::path &root) {
  return write_module(root, "privacy",
                      "  id: privacy\n"
                      "  title: Privacy\n"
                      "  category: network\n"
                      "  env_vars:\n"
                      "    PIHOLE_PASSWORD:\n"
                      "      type: password\n"
                      "      label: Pi-hole password\n"
                      "    WG_HOST:\n"
                      "      type: text\n"
                      "    WG_PRIVATE_KEY:\n"
                      "      type: secret\n"
                      "      dangerous: true\n",
                      "  pihole:\n"
                      "    image: pihole/pihole\n"
                      "    container_name: sb-pihole\n"
                      "  unbound:\n"
                      "    image: mvance/unbound\n"
                      "    container_name: sb-unbound\n"
                      "  wireguard:\n"
                      "    image: weejewel/wg-easy\n"
                      "    container_name: sb-wireguard\n");
}

inline void write_core_modules(const fs::path &root) {
  write_module(root, "core", "  title: Core\n  required: true\n",
               "  caddy:\n    image: caddy\n    container_name: sb-caddy\n");
  write_module(root, "dashboard", "  title: Dashboard\n  required: true\n",
               "  dashboard:\n    image: sparkbox/dashboard\n"
               "    container_name: sb-dashboard\n");
}

#define RUN_TEST(fn)                                                           \
  do {                                                                         \
    std::cout << "  " #fn "... " << std::flush;                                \
    fn();                                                                      \
    std::cout << "PASS" << std::endl;                                          \
  } while (0)

template <typename Exception, typename Fn> bool throws(Fn &&fn) {
  try {
    fn();
  } catch (const Exception &) {
    return true;
  }
  return false;
}

} // namespace sparkbox::test
