#include "storyloom/core/errors.h"

#include <sstream>

namespace storyloom {
namespace {

std::string summarize(const std::vector<std::string>& problems) {
  std::ostringstream ss;
  ss << "invalid world configuration";
  if (problems.empty()) return ss.str();
  ss << " (" << problems.size() << " problem" << (problems.size() == 1 ? "" : "s") << "): " << problems.front();
  if (problems.size() > 1) ss << "; ...";
  return ss.str();
}

} // namespace

ConfigurationError::ConfigurationError(std::vector<std::string> problems)
    : std::runtime_error(summarize(problems)), problems_(std::move(problems)) {}

} // namespace storyloom
