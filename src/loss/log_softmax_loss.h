#pragma once

#include <cstdint>
#include <vector>

#include "loss/row_stats.h"

namespace loss {

// Fused masked log-softmax loss over a flattened batch of `rows` rows of
// width `cols`:
//
//   loss = -(1/rows) * sum_{active r} sum_i target[r,i] * log_softmax(logits[r,:])_i
//
// The divisor is the total row count, masked rows included.

struct ForwardResult {
  float loss = 0.0f;
  std::vector<float> row_losses; // 0 for inactive rows
  RowStatsStore stats;           // hand to the matching backward, once
};

// `active` has one entry per row (non-zero = participates); logits and
// target are rows x cols. block_size 0 picks calculate_settings(cols).
// Throws LaunchConfigError for rows wider than kMaxFusedSize and
// std::runtime_error for size mismatches, before any row is processed.
ForwardResult log_softmax_loss_forward(const std::vector<float>& logits,
                                       const std::vector<float>& target,
                                       const std::vector<std::uint8_t>& active,
                                       int cols,
                                       int block_size = 0);

// Destructively consumes `logits` (the same scores given to the forward
// call) and `stats` (that call's statistics) and returns the logits storage
// holding dL/dlogits for the upstream scalar `grad_output`. Inactive rows
// come back as zeros. The scores are gone afterwards; a second backward for
// the same forward is rejected because `stats` has been consumed.
std::vector<float> log_softmax_loss_backward(std::vector<float>&& logits,
                                             const std::vector<float>& target,
                                             const std::vector<std::uint8_t>& active,
                                             int cols,
                                             RowStatsStore&& stats,
                                             float grad_output,
                                             int block_size = 0);

} // namespace loss
