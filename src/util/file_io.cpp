#include "storyloom/util/file_io.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace storyloom::util {
namespace fs = std::filesystem;
namespace {

// Removes the temp file unless the write was committed.
class PendingFile {
 public:
  explicit PendingFile(fs::path p) : path_(std::move(p)) {}
  ~PendingFile() {
    if (committed_) return;
    std::error_code ec;
    fs::remove(path_, ec);
  }
  PendingFile(const PendingFile&) = delete;
  PendingFile& operator=(const PendingFile&) = delete;

  const fs::path& path() const { return path_; }
  void commit() { committed_ = true; }

 private:
  fs::path path_;
  bool committed_{false};
};

fs::path temp_sibling(const fs::path& target) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  for (int attempt = 0;; ++attempt) {
    fs::path candidate = target;
    candidate += ".tmp." + std::to_string(stamp) + "." + std::to_string(attempt);
    std::error_code ec;
    if (attempt >= 64 || !fs::exists(candidate, ec)) return candidate;
  }
}

fs::path locate(const fs::path& requested) {
  std::error_code ec;
  if (requested.empty() || requested.is_absolute() || fs::exists(requested, ec)) return requested;

  std::vector<fs::path> roots;
#ifdef STORYLOOM_SOURCE_DIR
  roots.emplace_back(STORYLOOM_SOURCE_DIR);
#endif
  fs::path cur = fs::current_path(ec);
  for (int depth = 0; !ec && depth < 8 && !cur.empty(); ++depth) {
    roots.push_back(cur);
    if (cur.parent_path() == cur) break;
    cur = cur.parent_path();
  }

  for (const auto& root : roots) {
    const fs::path candidate = root / requested;
    if (fs::exists(candidate, ec)) return candidate;
  }
  return requested;
}

} // namespace

std::string read_text_file(const std::string& path) {
  const fs::path resolved = locate(fs::path(path));
  std::ifstream in(resolved, std::ios::in | std::ios::binary);
  if (!in) throw std::runtime_error("Failed to open file for reading: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_text_file(const std::string& path, const std::string& contents) {
  const fs::path target(path);
  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("Failed to create directory: " + target.parent_path().string() + " (" +
                               ec.message() + ")");
    }
  }

  PendingFile tmp(temp_sibling(target));
  {
    std::ofstream out(tmp.path(), std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.path().string());
    out << contents;
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + tmp.path().string());
  }

  fs::rename(tmp.path(), target, ec);
  if (ec) {
    // Some platforms refuse to rename over an existing file.
    std::error_code rm_ec;
    fs::remove(target, rm_ec);
    ec.clear();
    fs::rename(tmp.path(), target, ec);
  }
  if (ec) throw std::runtime_error("Failed to replace file: " + path + " (" + ec.message() + ")");
  tmp.commit();
}

bool file_exists(const std::string& path) {
  std::error_code ec;
  return fs::exists(fs::path(path), ec) && !ec;
}

} // namespace storyloom::util
