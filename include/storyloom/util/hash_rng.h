#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>

namespace storyloom::util {

// splitmix64 step (Sebastiano Vigna). Deterministic, not cryptographically secure.
inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

// Top 53 bits mapped to [0,1).
inline double u01_from_u64(std::uint64_t x) {
  return static_cast<double>(x >> 11) * (1.0 / 9007199254740992.0);
}

// Seedable random source handed to everything that draws randomness. The
// whole generator state is one word, so copying a HashRng forks the stream.
class HashRng {
 public:
  explicit HashRng(std::uint64_t seed = 0) : state_(seed) {}

  std::uint64_t next_u64() {
    state_ = splitmix64(state_);
    return state_;
  }

  // Uniform in [0,1).
  double next_u01() { return u01_from_u64(next_u64()); }

  // Uniform integer in [lo, hi], rejection sampled to avoid modulo bias.
  int range_int(int lo, int hi) {
    if (hi < lo) std::swap(lo, hi);
    const std::uint64_t span = static_cast<std::uint64_t>(static_cast<std::int64_t>(hi) - lo) + 1ULL;
    return lo + static_cast<int>(bounded(span));
  }

  // Uniform index in [0, n).
  std::size_t index(std::size_t n) {
    if (n <= 1) return 0;
    return static_cast<std::size_t>(bounded(static_cast<std::uint64_t>(n)));
  }

  std::uint64_t state() const { return state_; }
  void reseed(std::uint64_t seed) { state_ = seed; }

 private:
  std::uint64_t bounded(std::uint64_t bound) {
    if (bound <= 1) return 0;
    const std::uint64_t threshold = (0ULL - bound) % bound;
    for (;;) {
      const std::uint64_t r = next_u64();
      if (r >= threshold) return r % bound;
    }
  }

  std::uint64_t state_;
};

} // namespace storyloom::util
