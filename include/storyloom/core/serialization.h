#pragma once

#include <optional>
#include <string>

#include "storyloom/core/sim_config.h"
#include "storyloom/core/world_state.h"
#include "storyloom/util/json.h"

namespace storyloom {

constexpr int kCurrentSnapshotVersion = 1;

// --- world snapshots ---

json::Value serialize_world_to_json_value(const WorldState& state);

// Pretty-printed, keys sorted: equal states produce equal text.
std::string serialize_world_to_json(const WorldState& state);

// Parse a snapshot. The document must have the expected shape (finite
// non-negative "time", "nodes"/"characters"/"interactions" arrays and a
// "resources" object) or nothing is returned and `error` says why.
//
// Individual malformed entries are dropped or defaulted rather than failing
// the whole load: entries without an id are skipped, out-of-range values are
// clamped, and characters pointing at a missing node move to the first node.
std::optional<WorldState> deserialize_world_from_json(const std::string& json_text, std::string* error = nullptr);

// --- authored world ---

// Throws ConfigurationError on JSON syntax errors or a missing top-level
// shape. Semantic checks are left to validate_world_config().
WorldConfig world_config_from_json(const std::string& json_text);
WorldConfig load_world_config_file(const std::string& path);

// --- engine tuning ---

// Unknown keys are ignored; missing keys keep their defaults.
SimConfig sim_config_from_json(const std::string& json_text);
std::string sim_config_to_json(const SimConfig& cfg);

} // namespace storyloom
