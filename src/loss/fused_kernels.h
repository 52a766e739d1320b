#pragma once

// Per-row kernels of the fused log-softmax loss.
//
// Each call touches one row only and keeps no state between calls, so rows
// can run in any order or concurrently. A row is walked in contiguous chunks
// of `block_size` (a power of two); the tail chunk is shorter.

namespace loss {

struct RowForward {
  float loss = 0.0f;          // -sum_i target_i * log_softmax_i
  float row_max = 0.0f;       // m
  float row_partition = 0.0f; // d = sum_i exp(x_i - m)
};

// Pass 1 folds the chunks into (m, d); pass 2 accumulates
// target * ((x - m) - log(d)) with the final (m, d).
RowForward forward_row(const float* logits, const float* target, int n_cols, int block_size);

// Overwrites `logits_inout` (the row's scores) with
//   grad_i = -(target_i * g - softmax_i * sum_j(target_j * g))
// where softmax_i = exp(x_i - row_max) / row_partition and g = grad_scale.
// Needs the (row_max, row_partition) pair the forward pass produced for
// this exact row.
void backward_row(float* logits_inout,
                  const float* target,
                  int n_cols,
                  int block_size,
                  float row_max,
                  float row_partition,
                  float grad_scale);

// Gradient of an inactive row.
void zero_row(float* out, int n_cols, int block_size);

// Throws unless block_size is a power of two.
void check_block_size(int block_size, const char* op);

} // namespace loss
