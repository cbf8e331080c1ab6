#include "storyloom/core/persistence.h"

#include "storyloom/core/errors.h"
#include "storyloom/core/serialization.h"
#include "storyloom/util/file_io.h"
#include "storyloom/util/log.h"

namespace storyloom {

void JsonFilePersistence::save_or_throw(const WorldState& snapshot) {
  try {
    util::write_text_file(path_, serialize_world_to_json(snapshot));
  } catch (const std::runtime_error& e) {
    throw PersistenceError(std::string("save to ") + path_ + " failed: " + e.what());
  }
}

bool JsonFilePersistence::save(const WorldState& snapshot) {
  try {
    save_or_throw(snapshot);
    return true;
  } catch (const PersistenceError& e) {
    log::warn(e.what());
    return false;
  }
}

std::optional<WorldState> JsonFilePersistence::load() {
  if (!util::file_exists(path_)) return std::nullopt;

  std::string text;
  try {
    text = util::read_text_file(path_);
  } catch (const std::runtime_error& e) {
    log::warn(std::string("load from ") + path_ + " failed: " + e.what());
    return std::nullopt;
  }

  std::string why;
  auto state = deserialize_world_from_json(text, &why);
  if (!state) log::warn("Discarding saved state in " + path_ + ": " + why);
  return state;
}

} // namespace storyloom
