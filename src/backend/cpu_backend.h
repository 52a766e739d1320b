#pragma once

#include "backend/backend.h"

namespace backend {

// Row-parallel CPU kernels (OpenMP, one row per loop iteration).
class CpuBackend final : public KernelBackend {
 public:
  // num_threads <= 0 uses the OpenMP default.
  explicit CpuBackend(int num_threads = 0) : num_threads_(num_threads) {}

  Device device() const override { return Device{DeviceType::Cpu, 0}; }
  int num_threads() const;

  void log_softmax_loss_fwd(int rows,
                            int cols,
                            int block_size,
                            const float* logits,
                            const float* target,
                            const std::uint8_t* active,
                            float* loss_rows,
                            float* row_max,
                            float* row_partition) override;

  void log_softmax_loss_bwd(int rows,
                            int cols,
                            int block_size,
                            float* logits_inout,
                            const float* target,
                            const std::uint8_t* active,
                            float grad_scale,
                            const float* row_max,
                            const float* row_partition) override;

 private:
  int num_threads_;
};

} // namespace backend
