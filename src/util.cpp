#include "util.h"

#include <stdexcept>

namespace util {

std::uint64_t Rng::next_u64() {
  // xorshift64*
  std::uint64_t x = state;
  x ^= x >> 12;
  x ^= x << 25;
  x ^= x >> 27;
  state = x;
  return x * 2685821657736338717ULL;
}

std::uint32_t Rng::next_u32() {
  return static_cast<std::uint32_t>(next_u64() >> 32);
}

float Rng::next_f01() {
  // 24-bit mantissa -> float in [0,1)
  const std::uint32_t u = next_u32() >> 8;
  return static_cast<float>(u) * (1.0f / 16777216.0f);
}

float Rng::uniform(float lo, float hi) {
  if (hi < lo) {
    throw std::runtime_error("uniform: invalid range");
  }
  return lo + (hi - lo) * next_f01();
}

bool Rng::bernoulli(float p) {
  return next_f01() < p;
}

int next_power_of_2(int n) {
  if (n <= 0) throw std::runtime_error("next_power_of_2: n must be > 0");
  int p = 1;
  while (p < n) {
    if (p > (1 << 29)) throw std::runtime_error("next_power_of_2: overflow");
    p <<= 1;
  }
  return p;
}

bool is_power_of_2(int n) {
  return n > 0 && (n & (n - 1)) == 0;
}

void fill_uniform(std::vector<float>& v, float lo, float hi, Rng& rng) {
  for (float& x : v) x = rng.uniform(lo, hi);
}

} // namespace util
