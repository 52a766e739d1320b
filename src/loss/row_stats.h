#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

namespace loss {

// Accumulation type inside a row. Inputs and saved statistics are float.
using acc_t = double;

// Streaming softmax normalizer over a row processed chunk by chunk.
//
// Folding a chunk whose local maximum is b:
//   m' = max(m, b)
//   d' = d * exp(m - m') + sum_i exp(x_i - m')
//
// exp() only ever sees values <= 0, so nothing overflows, and the global
// maximum is never needed up front.
struct OnlineSoftmax {
  acc_t running_max = -std::numeric_limits<acc_t>::infinity();
  acc_t running_sum = 0.0;

  void update(const float* chunk, int n);

  // log(d); log_softmax(x) = (x - m) - log(d).
  acc_t log_partition() const { return std::log(running_sum); }
};

// Per-row (row_max, row_partition) saved by the forward pass for the
// matching backward pass. Move-only; one instance belongs to exactly one
// forward/backward pair.
//
// Entries for inactive rows stay quiet NaN and must not be read. seal()
// records which rows were active so backward cannot read them.
class RowStatsStore {
 public:
  RowStatsStore() = default;
  RowStatsStore(int rows, int cols);

  RowStatsStore(RowStatsStore&& other) noexcept;
  RowStatsStore& operator=(RowStatsStore&& other) noexcept;
  RowStatsStore(const RowStatsStore&) = delete;
  RowStatsStore& operator=(const RowStatsStore&) = delete;

  int rows() const { return rows_; }
  int cols() const { return cols_; }

  // True between seal() (end of forward) and release().
  bool sealed() const { return sealed_; }
  void seal(const std::vector<std::uint8_t>& active);
  void release();

  float row_max(int row) const;
  float row_partition(int row) const;

  // Raw columns for kernel backends; written once per active row.
  float* row_max_data() { return row_max_.data(); }
  float* row_partition_data() { return row_partition_.data(); }
  const float* row_max_data() const { return row_max_.data(); }
  const float* row_partition_data() const { return row_partition_.data(); }

  // Throws unless this store is sealed, was produced for active.size() x cols
  // and the forward call saw the same active rows.
  void check_matches(const std::vector<std::uint8_t>& active, int cols, const char* op) const;

 private:
  int rows_ = 0;
  int cols_ = 0;
  bool sealed_ = false;
  std::vector<std::uint8_t> active_;
  std::vector<float> row_max_;
  std::vector<float> row_partition_;
};

} // namespace loss
