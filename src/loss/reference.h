#pragma once

#include "tensor.h"

namespace loss {

// Naive masked log-softmax loss built from generic autograd ops:
//   -mean_rows(mask * sum_v(target * log_softmax(logits)))
// Materializes the full log-softmax tensor; used only to validate the
// fused path. Gradients come from the ordinary autograd graph.
nn::Tensor reference_log_softmax_loss(const nn::Tensor& logits, const nn::Tensor& target, const nn::Tensor& mask);

} // namespace loss
