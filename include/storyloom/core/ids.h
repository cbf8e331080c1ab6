#pragma once

#include <cstdint>

namespace storyloom {

// Runtime-assigned identifiers (wars, battles, encounter instances).
// Authored content (nodes, characters, interactions) is keyed by string ids.
using Id = std::uint64_t;
constexpr Id kInvalidId = 0;

// Turn counter value meaning "never happened".
constexpr std::int64_t kNever = -1;

} // namespace storyloom
