#pragma once

#include <vector>

#include "tensor.h"

namespace nn {

Tensor mul(const Tensor& a, const Tensor& b);
Tensor mul_scalar(const Tensor& a, float s);

Tensor reshape(const Tensor& x, const std::vector<int>& new_shape);

// Stable log-softmax over the last dim (materializes the full output).
Tensor log_softmax_lastdim(const Tensor& x);

// [..., D] -> [...] (a 1-D input reduces to [1]).
Tensor sum_lastdim(const Tensor& x);

// Mean of all elements -> [1].
Tensor mean(const Tensor& x);

// Fused masked log-softmax loss with a streaming softmax normalizer.
//   logits: [..., V], target: same shape, mask: one value per row
//   ([B,T] or [B,T,1] for [B,T,V] logits).
// Returns the scalar
//   -(1/rows) * sum_{active rows} sum_v target * log_softmax(logits)
// where rows counts masked rows too.
//
// Backward is destructive: it turns logits.data into dL/dlogits in place,
// accumulates that into logits.grad and leaves the gradient values in
// logits.data. Do not read the scores after backward. Target and mask get
// no gradient. Backward can run once per forward.
Tensor log_softmax_loss(const Tensor& logits, const Tensor& target, const Tensor& mask);

} // namespace nn
