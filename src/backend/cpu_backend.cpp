#include "backend/cpu_backend.h"

#include <cstddef>

#include <omp.h>

#include "loss/fused_kernels.h"

namespace backend {

int CpuBackend::num_threads() const {
  return num_threads_ > 0 ? num_threads_ : omp_get_max_threads();
}

void CpuBackend::log_softmax_loss_fwd(int rows,
                                      int cols,
                                      int block_size,
                                      const float* logits,
                                      const float* target,
                                      const std::uint8_t* active,
                                      float* loss_rows,
                                      float* row_max,
                                      float* row_partition) {
  const int nt = num_threads();
#pragma omp parallel for schedule(static) num_threads(nt)
  for (int r = 0; r < rows; ++r) {
    if (!active[r]) {
      loss_rows[r] = 0.0f;
      continue;
    }
    const std::size_t off = static_cast<std::size_t>(r) * static_cast<std::size_t>(cols);
    const loss::RowForward f = loss::forward_row(logits + off, target + off, cols, block_size);
    loss_rows[r] = f.loss;
    row_max[r] = f.row_max;
    row_partition[r] = f.row_partition;
  }
}

void CpuBackend::log_softmax_loss_bwd(int rows,
                                      int cols,
                                      int block_size,
                                      float* logits_inout,
                                      const float* target,
                                      const std::uint8_t* active,
                                      float grad_scale,
                                      const float* row_max,
                                      const float* row_partition) {
  const int nt = num_threads();
#pragma omp parallel for schedule(static) num_threads(nt)
  for (int r = 0; r < rows; ++r) {
    const std::size_t off = static_cast<std::size_t>(r) * static_cast<std::size_t>(cols);
    if (!active[r]) {
      loss::zero_row(logits_inout + off, cols, block_size);
      continue;
    }
    loss::backward_row(logits_inout + off, target + off, cols, block_size, row_max[r], row_partition[r], grad_scale);
  }
}

} // namespace backend
