#include "loss/reference.h"

#include "ops.h"

namespace loss {

nn::Tensor reference_log_softmax_loss(const nn::Tensor& logits, const nn::Tensor& target, const nn::Tensor& mask) {
  nn::Tensor logp = nn::log_softmax_lastdim(logits);
  nn::Tensor plogp = nn::mul(target, logp);
  nn::Tensor row_sum = nn::sum_lastdim(plogp);
  nn::Tensor masked = nn::mul(nn::reshape(mask, row_sum.shape), row_sum);
  return nn::mul_scalar(nn::mean(masked), -1.0f);
}

} // namespace loss
