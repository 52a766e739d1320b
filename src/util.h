#pragma once

#include <cstdint>
#include <vector>

namespace util {

// Tiny, deterministic RNG (xorshift64*) for reproducible inputs.
struct Rng {
  std::uint64_t state;
  explicit Rng(std::uint64_t seed = 0x12345678ULL) : state(seed ? seed : 0x12345678ULL) {}

  std::uint64_t next_u64();
  std::uint32_t next_u32();
  float next_f01(); // [0,1)
  float uniform(float lo, float hi);
  bool bernoulli(float p);
};

// Smallest power of two >= n (n >= 1).
int next_power_of_2(int n);
bool is_power_of_2(int n);

// Fills with uniform values in [lo, hi).
void fill_uniform(std::vector<float>& v, float lo, float hi, Rng& rng);

} // namespace util
