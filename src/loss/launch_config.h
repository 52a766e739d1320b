#pragma once

#include <stdexcept>
#include <string>

#include "backend/backend.h"

namespace loss {

// Largest row width the fused loss handles in a single chunked reduction.
constexpr int kMaxFusedSize = 65536;

// Raised when a row is too wide for the fused reduction. Thrown before any
// row is touched.
class LaunchConfigError : public std::runtime_error {
 public:
  LaunchConfigError(int n_cols, int max_cols);

  int n_cols() const { return n_cols_; }
  int max_cols() const { return max_cols_; }

 private:
  int n_cols_;
  int max_cols_;
};

struct LaunchSettings {
  int block_size = 0; // chunk width, power of two
  int num_warps = 0;  // parallelism hint for device backends
};

// block_size: next power of two >= n_cols, capped at kMaxFusedSize.
// num_warps: 4 / 8 / 16 / 32 stepping at 2048, 8192 and 32768; halved on HIP.
LaunchSettings calculate_settings(int n_cols, backend::DeviceType device = backend::DeviceType::Cpu);

} // namespace loss
