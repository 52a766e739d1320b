#include "loss/launch_config.h"

#include "util.h"

namespace loss {

LaunchConfigError::LaunchConfigError(int n_cols, int max_cols)
    : std::runtime_error("log_softmax_loss: row width n = " + std::to_string(n_cols) +
                         " exceeds the maximum fused block size " + std::to_string(max_cols)),
      n_cols_(n_cols),
      max_cols_(max_cols) {}

LaunchSettings calculate_settings(int n_cols, backend::DeviceType device) {
  if (n_cols <= 0) {
    throw std::runtime_error("calculate_settings: row width must be > 0, got " + std::to_string(n_cols));
  }
  if (n_cols > kMaxFusedSize) {
    throw LaunchConfigError(n_cols, kMaxFusedSize);
  }

  LaunchSettings s;
  s.block_size = util::next_power_of_2(n_cols);

  s.num_warps = 4;
  if (s.block_size >= 32768) {
    s.num_warps = 32;
  } else if (s.block_size >= 8192) {
    s.num_warps = 16;
  } else if (s.block_size >= 2048) {
    s.num_warps = 8;
  }

  // AMD wavefronts are twice as wide.
  if (device == backend::DeviceType::Hip) {
    s.num_warps /= 2;
  }
  return s;
}

} // namespace loss
