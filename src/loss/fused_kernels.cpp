#include "loss/fused_kernels.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "loss/row_stats.h"
#include "util.h"

namespace loss {

void check_block_size(int block_size, const char* op) {
  if (!util::is_power_of_2(block_size)) {
    throw std::runtime_error(std::string(op) + ": block size must be a power of two, got " +
                             std::to_string(block_size));
  }
}

RowForward forward_row(const float* logits, const float* target, int n_cols, int block_size) {
  OnlineSoftmax norm;
  for (int start = 0; start < n_cols; start += block_size) {
    const int n = std::min(block_size, n_cols - start);
    norm.update(logits + start, n);
  }

  const acc_t m = norm.running_max;
  const acc_t log_d = norm.log_partition();

  acc_t weighted = 0.0;
  for (int start = 0; start < n_cols; start += block_size) {
    const int n = std::min(block_size, n_cols - start);
    const float* x = logits + start;
    const float* t = target + start;
    acc_t block_sum = 0.0;
    for (int i = 0; i < n; ++i) {
      const acc_t log_softmax = (static_cast<acc_t>(x[i]) - m) - log_d;
      block_sum += static_cast<acc_t>(t[i]) * log_softmax;
    }
    weighted += block_sum;
  }

  RowForward out;
  out.loss = static_cast<float>(-weighted);
  out.row_max = static_cast<float>(m);
  out.row_partition = static_cast<float>(norm.running_sum);
  return out;
}

void backward_row(float* logits_inout,
                  const float* target,
                  int n_cols,
                  int block_size,
                  float row_max,
                  float row_partition,
                  float grad_scale) {
  const acc_t g = grad_scale;

  // Row-wide reduction first: every output element depends on it.
  acc_t target_grad_sum = 0.0;
  for (int start = 0; start < n_cols; start += block_size) {
    const int n = std::min(block_size, n_cols - start);
    const float* t = target + start;
    acc_t block_sum = 0.0;
    for (int i = 0; i < n; ++i) block_sum += static_cast<acc_t>(t[i]) * g;
    target_grad_sum += block_sum;
  }

  const acc_t m = row_max;
  const acc_t d = row_partition;
  for (int start = 0; start < n_cols; start += block_size) {
    const int n = std::min(block_size, n_cols - start);
    float* x = logits_inout + start;
    const float* t = target + start;
    for (int i = 0; i < n; ++i) {
      const acc_t softmax_prob = std::exp(static_cast<acc_t>(x[i]) - m) / d;
      const acc_t grad = -(static_cast<acc_t>(t[i]) * g - softmax_prob * target_grad_sum);
      x[i] = static_cast<float>(grad);
    }
  }
}

void zero_row(float* out, int n_cols, int block_size) {
  for (int start = 0; start < n_cols; start += block_size) {
    const int n = std::min(block_size, n_cols - start);
    std::fill(out + start, out + start + n, 0.0f);
  }
}

} // namespace loss
