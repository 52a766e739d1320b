#include "loss/row_stats.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace loss {

void OnlineSoftmax::update(const float* chunk, int n) {
  acc_t block_max = -std::numeric_limits<acc_t>::infinity();
  for (int i = 0; i < n; ++i) {
    block_max = std::max(block_max, static_cast<acc_t>(chunk[i]));
  }
  // A chunk of -inf scores adds exp(-inf) = 0; skipping it avoids (-inf) - (-inf).
  if (block_max == -std::numeric_limits<acc_t>::infinity()) return;

  const acc_t m_new = std::max(running_max, block_max);
  acc_t block_sum = 0.0;
  for (int i = 0; i < n; ++i) {
    block_sum += std::exp(static_cast<acc_t>(chunk[i]) - m_new);
  }
  running_sum = running_sum * std::exp(running_max - m_new) + block_sum;
  running_max = m_new;
}

RowStatsStore::RowStatsStore(int rows, int cols) : rows_(rows), cols_(cols) {
  if (rows <= 0 || cols <= 0) {
    throw std::runtime_error("RowStatsStore: invalid size " + std::to_string(rows) + "x" + std::to_string(cols));
  }
  const float nan = std::numeric_limits<float>::quiet_NaN();
  row_max_.assign(static_cast<std::size_t>(rows), nan);
  row_partition_.assign(static_cast<std::size_t>(rows), nan);
}

RowStatsStore::RowStatsStore(RowStatsStore&& other) noexcept
    : rows_(other.rows_),
      cols_(other.cols_),
      sealed_(other.sealed_),
      active_(std::move(other.active_)),
      row_max_(std::move(other.row_max_)),
      row_partition_(std::move(other.row_partition_)) {
  other.release();
}

RowStatsStore& RowStatsStore::operator=(RowStatsStore&& other) noexcept {
  if (this != &other) {
    rows_ = other.rows_;
    cols_ = other.cols_;
    sealed_ = other.sealed_;
    active_ = std::move(other.active_);
    row_max_ = std::move(other.row_max_);
    row_partition_ = std::move(other.row_partition_);
    other.release();
  }
  return *this;
}

void RowStatsStore::seal(const std::vector<std::uint8_t>& active) {
  if (rows_ == 0) throw std::runtime_error("RowStatsStore: cannot seal an empty store");
  if (sealed_) throw std::runtime_error("RowStatsStore: statistics already recorded");
  if (active.size() != static_cast<std::size_t>(rows_)) {
    throw std::runtime_error("RowStatsStore: " + std::to_string(active.size()) + " active flags for " +
                             std::to_string(rows_) + " rows");
  }
  active_ = active;
  sealed_ = true;
}

void RowStatsStore::release() {
  rows_ = 0;
  cols_ = 0;
  sealed_ = false;
  active_.clear();
  active_.shrink_to_fit();
  row_max_.clear();
  row_max_.shrink_to_fit();
  row_partition_.clear();
  row_partition_.shrink_to_fit();
}

float RowStatsStore::row_max(int row) const {
  if (row < 0 || row >= rows_) throw std::runtime_error("RowStatsStore: row out of range");
  return row_max_[static_cast<std::size_t>(row)];
}

float RowStatsStore::row_partition(int row) const {
  if (row < 0 || row >= rows_) throw std::runtime_error("RowStatsStore: row out of range");
  return row_partition_[static_cast<std::size_t>(row)];
}

void RowStatsStore::check_matches(const std::vector<std::uint8_t>& active, int cols, const char* op) const {
  const int rows = static_cast<int>(active.size());
  if (!sealed_) {
    throw std::runtime_error(std::string(op) +
                             ": row statistics are missing or already consumed (backward needs a fresh forward)");
  }
  if (rows != rows_ || cols != cols_) {
    throw std::runtime_error(std::string(op) + ": row statistics were recorded for " + std::to_string(rows_) + "x" +
                             std::to_string(cols_) + " but backward got " + std::to_string(rows) + "x" +
                             std::to_string(cols));
  }
  for (int r = 0; r < rows; ++r) {
    const bool was_active = active_[static_cast<std::size_t>(r)] != 0;
    const bool is_active = active[static_cast<std::size_t>(r)] != 0;
    if (was_active != is_active) {
      throw std::runtime_error(std::string(op) + ": active rows differ from the forward call (row " +
                               std::to_string(r) + ")");
    }
  }
}

} // namespace loss
