#include "loss/log_softmax_loss.h"

#include <stdexcept>
#include <string>
#include <utility>

#include "backend/registry.h"
#include "loss/fused_kernels.h"
#include "loss/launch_config.h"

namespace loss {

static int resolve_block_size(int cols, int block_size, const char* op) {
  // Width is checked even when the caller forces a block size.
  const LaunchSettings s = calculate_settings(cols, backend::current_device().type);
  if (block_size == 0) return s.block_size;
  check_block_size(block_size, op);
  return block_size;
}

static int check_rows(std::size_t logits_size,
                      std::size_t target_size,
                      std::size_t active_size,
                      int cols,
                      const char* op) {
  if (cols <= 0) throw std::runtime_error(std::string(op) + ": cols must be > 0");
  if (active_size == 0) throw std::runtime_error(std::string(op) + ": empty batch");
  const std::size_t expected = active_size * static_cast<std::size_t>(cols);
  if (logits_size != expected) {
    throw std::runtime_error(std::string(op) + ": logits has " + std::to_string(logits_size) + " values, expected " +
                             std::to_string(active_size) + "x" + std::to_string(cols));
  }
  if (target_size != expected) {
    throw std::runtime_error(std::string(op) + ": target has " + std::to_string(target_size) + " values, expected " +
                             std::to_string(active_size) + "x" + std::to_string(cols));
  }
  return static_cast<int>(active_size);
}

ForwardResult log_softmax_loss_forward(const std::vector<float>& logits,
                                       const std::vector<float>& target,
                                       const std::vector<std::uint8_t>& active,
                                       int cols,
                                       int block_size) {
  const char* op = "log_softmax_loss_forward";
  const int block = resolve_block_size(cols, block_size, op);
  const int rows = check_rows(logits.size(), target.size(), active.size(), cols, op);

  ForwardResult out;
  out.row_losses.assign(static_cast<std::size_t>(rows), 0.0f);
  out.stats = RowStatsStore(rows, cols);

  backend::get().log_softmax_loss_fwd(rows,
                                      cols,
                                      block,
                                      logits.data(),
                                      target.data(),
                                      active.data(),
                                      out.row_losses.data(),
                                      out.stats.row_max_data(),
                                      out.stats.row_partition_data());
  out.stats.seal(active);

  // Fixed-order sum keeps the result independent of the thread count.
  double total = 0.0;
  for (float l : out.row_losses) total += l;
  out.loss = static_cast<float>(total / static_cast<double>(rows));
  return out;
}

std::vector<float> log_softmax_loss_backward(std::vector<float>&& logits,
                                             const std::vector<float>& target,
                                             const std::vector<std::uint8_t>& active,
                                             int cols,
                                             RowStatsStore&& stats,
                                             float grad_output,
                                             int block_size) {
  const char* op = "log_softmax_loss_backward";
  const int block = resolve_block_size(cols, block_size, op);
  const int rows = check_rows(logits.size(), target.size(), active.size(), cols, op);

  // Take ownership so the statistics die with this call.
  RowStatsStore saved = std::move(stats);
  saved.check_matches(active, cols, op);

  std::vector<float> grad = std::move(logits);
  const float grad_scale = grad_output * (1.0f / static_cast<float>(rows));
  backend::get().log_softmax_loss_bwd(rows,
                                      cols,
                                      block,
                                      grad.data(),
                                      target.data(),
                                      active.data(),
                                      grad_scale,
                                      saved.row_max_data(),
                                      saved.row_partition_data());
  saved.release();
  return grad;
}

} // namespace loss
