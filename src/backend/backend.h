#pragma once

#include <cstdint>

// Backend boundary.
//
// Intent:
// - Keep loss semantics and autograd wiring stable in `nn::*` / `loss::*`.
// - Route the row kernels through a backend without touching callers.
//
// Contract notes:
// - All buffers are row-major contiguous float, `rows x cols`.
// - `active` holds one byte per row; zero means the row is masked out.
// - Rows are independent: an implementation may run them in any order or
//   concurrently.
// - Arguments are validated by the caller before a backend is invoked.

namespace backend {

enum class DeviceType {
  Cpu,
  Cuda,
  Hip,
};

struct Device {
  DeviceType type = DeviceType::Cpu;
  int device_id = 0;
};

struct KernelBackend {
  virtual ~KernelBackend() = default;

  virtual Device device() const = 0;

  // Forward reducer. For each active row r:
  //   loss_rows[r] = -sum_i target[r,i] * log_softmax(logits[r,:])_i
  //   row_max[r], row_partition[r] = streaming softmax statistics
  // Inactive rows get loss_rows[r] = 0 and their statistics are not written.
  virtual void log_softmax_loss_fwd(int rows,
                                    int cols,
                                    int block_size,
                                    const float* logits,
                                    const float* target,
                                    const std::uint8_t* active,
                                    float* loss_rows,
                                    float* row_max,
                                    float* row_partition) = 0;

  // Backward reconstructor, in place: `logits_inout` holds the scores on
  // entry and dL/dlogits on return. Inactive rows become zero and their
  // statistics are not read. `grad_scale` is the upstream gradient already
  // multiplied by the 1/rows averaging factor.
  virtual void log_softmax_loss_bwd(int rows,
                                    int cols,
                                    int block_size,
                                    float* logits_inout,
                                    const float* target,
                                    const std::uint8_t* active,
                                    float grad_scale,
                                    const float* row_max,
                                    const float* row_partition) = 0;
};

} // namespace backend
