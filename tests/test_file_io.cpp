#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "storyloom/util/file_io.h"

#define SL_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_file_io() {
  namespace fs = std::filesystem;

  struct CwdGuard {
    fs::path saved;
    explicit CwdGuard(fs::path p) : saved(std::move(p)) {}
    ~CwdGuard() {
      std::error_code ec_restore;
      fs::current_path(saved, ec_restore);
    }
  };

  // Prefer the system temp dir, but fall back to the working directory.
  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  if (ec || dir.empty()) dir = fs::path(".");

  const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
  dir /= "storyloom_test_file_io";
  dir /= std::to_string(static_cast<long long>(nonce));

  fs::create_directories(dir, ec);
  SL_ASSERT(!ec);

  const fs::path target = dir / "nested" / "atomic.txt";

  storyloom::util::write_text_file(target.string(), "hello\n");
  SL_ASSERT(storyloom::util::file_exists(target.string()));
  SL_ASSERT(storyloom::util::read_text_file(target.string()) == "hello\n");

  // Overwrites go through a temp file and a rename.
  storyloom::util::write_text_file(target.string(), "world\n");
  SL_ASSERT(storyloom::util::read_text_file(target.string()) == "world\n");

  bool threw = false;
  try {
    (void)storyloom::util::read_text_file((dir / "missing.txt").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  SL_ASSERT(threw);

  // Relative data paths resolve from other working directories too.
  const fs::path old_cwd = fs::current_path(ec);
  SL_ASSERT(!ec);
  CwdGuard cwd_guard(old_cwd);
  fs::current_path(dir, ec);
  SL_ASSERT(!ec);

  const std::string world = storyloom::util::read_text_file("data/worlds/hollow_vale.json");
  SL_ASSERT(world.find("\"Hollow Vale\"") != std::string::npos);

  fs::current_path(old_cwd, ec);
  SL_ASSERT(!ec);

  // No temp siblings are left behind.
  const std::string tmp_prefix = target.filename().string() + ".tmp";
  for (const auto& entry : fs::directory_iterator(target.parent_path())) {
    const std::string name = entry.path().filename().string();
    const bool starts_with = name.rfind(tmp_prefix, 0) == 0;
    SL_ASSERT(!starts_with);
  }

  fs::remove_all(dir, ec);
  return 0;
}
