#pragma once

#include <string>

namespace storyloom::util {

// Reads a whole file. Relative paths that do not exist from the working
// directory are also looked up under the source tree and its parents.
// Throws std::runtime_error on failure.
std::string read_text_file(const std::string& path);

// Writes a file through a sibling temp file and a rename, so readers never
// observe a partially written file. Parent directories are created.
void write_text_file(const std::string& path, const std::string& contents);

bool file_exists(const std::string& path);

} // namespace storyloom::util
