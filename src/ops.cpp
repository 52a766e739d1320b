#include "ops.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "loss/log_softmax_loss.h"
#include "loss/row_stats.h"

namespace nn {

static bool want_grad(const Tensor& t) {
  return is_grad_enabled() && t.requires_grad;
}

static void ensure_same_shape(const Tensor& a, const Tensor& b, const char* op) {
  if (a.shape != b.shape) {
    throw std::runtime_error(std::string(op) + ": shape mismatch " + shape_str(a.shape) + " vs " + shape_str(b.shape));
  }
}

Tensor mul(const Tensor& a, const Tensor& b) {
  ensure_same_shape(a, b, "mul");
  Tensor out = Tensor::zeros(a.shape, want_grad(a) || want_grad(b));
  const std::size_t n = out.numel();
  for (std::size_t i = 0; i < n; ++i) {
    (*out.data)[i] = (*a.data)[i] * (*b.data)[i];
  }
  if (out.requires_grad) {
    out.node = std::make_shared<Node>();
    out.node->parents = {a, b};
    out.node->backward = [](Tensor& o) {
      const Tensor& pa = o.node->parents[0];
      const Tensor& pb = o.node->parents[1];
      const std::size_t n2 = o.numel();
      if (pa.requires_grad) {
        for (std::size_t i = 0; i < n2; ++i) (*pa.grad)[i] += (*o.grad)[i] * (*pb.data)[i];
      }
      if (pb.requires_grad) {
        for (std::size_t i = 0; i < n2; ++i) (*pb.grad)[i] += (*o.grad)[i] * (*pa.data)[i];
      }
    };
  }
  return out;
}

Tensor mul_scalar(const Tensor& a, float s) {
  Tensor out = Tensor::zeros(a.shape, want_grad(a));
  const std::size_t n = out.numel();
  for (std::size_t i = 0; i < n; ++i) (*out.data)[i] = (*a.data)[i] * s;
  if (out.requires_grad) {
    out.node = std::make_shared<Node>();
    out.node->parents = {a};
    out.node->backward = [s](Tensor& o) {
      const Tensor& pa = o.node->parents[0];
      if (!pa.requires_grad) return;
      const std::size_t n2 = o.numel();
      for (std::size_t i = 0; i < n2; ++i) (*pa.grad)[i] += (*o.grad)[i] * s;
    };
  }
  return out;
}

Tensor reshape(const Tensor& x, const std::vector<int>& new_shape) {
  const std::size_t n0 = x.numel();
  const std::size_t n1 = numel_of(new_shape);
  if (n0 != n1) {
    throw std::runtime_error("reshape: numel mismatch " + shape_str(x.shape) + " -> " + shape_str(new_shape));
  }

  Tensor out;
  out.data = x.data; // view: share storage
  out.shape = new_shape;
  out.requires_grad = want_grad(x);
  if (out.requires_grad) {
    out.grad = std::make_shared<std::vector<float>>(n1, 0.0f);
    out.node = std::make_shared<Node>();
    out.node->parents = {x};
    out.node->backward = [](Tensor& o) {
      const Tensor& px = o.node->parents[0];
      if (!px.requires_grad) return;
      const std::size_t n = o.numel();
      for (std::size_t i = 0; i < n; ++i) {
        (*px.grad)[i] += (*o.grad)[i];
      }
    };
  }
  return out;
}

Tensor log_softmax_lastdim(const Tensor& x) {
  // y_i = (x_i - max(x)) - log(sum_j exp(x_j - max(x)))
  // Backward: dL/dx = dL/dy - softmax(x) * sum(dL/dy), softmax(x) = exp(y).
  if (x.shape.empty()) throw std::runtime_error("log_softmax: empty shape");
  const int D = x.shape.back();
  const std::size_t outer = x.numel() / static_cast<std::size_t>(D);

  Tensor out = Tensor::zeros(x.shape, want_grad(x));
  for (std::size_t o = 0; o < outer; ++o) {
    const float* xr = x.data->data() + o * static_cast<std::size_t>(D);
    float* yr = out.data->data() + o * static_cast<std::size_t>(D);
    float mx = -std::numeric_limits<float>::infinity();
    for (int i = 0; i < D; ++i) mx = std::max(mx, xr[i]);
    double denom = 0.0;
    for (int i = 0; i < D; ++i) denom += std::exp(static_cast<double>(xr[i]) - mx);
    const double log_denom = std::log(denom);
    for (int i = 0; i < D; ++i) yr[i] = static_cast<float>((static_cast<double>(xr[i]) - mx) - log_denom);
  }

  if (out.requires_grad) {
    out.node = std::make_shared<Node>();
    out.node->parents = {x};
    out.node->backward = [D](Tensor& o) {
      const Tensor& px = o.node->parents[0];
      if (!px.requires_grad) return;
      const std::size_t outer2 = o.numel() / static_cast<std::size_t>(D);
      for (std::size_t outi = 0; outi < outer2; ++outi) {
        const std::size_t base = outi * static_cast<std::size_t>(D);
        double sum_dy = 0.0;
        for (int i = 0; i < D; ++i) sum_dy += (*o.grad)[base + i];
        for (int i = 0; i < D; ++i) {
          const double p = std::exp(static_cast<double>((*o.data)[base + i]));
          (*px.grad)[base + i] += static_cast<float>((*o.grad)[base + i] - p * sum_dy);
        }
      }
    };
  }

  return out;
}

Tensor sum_lastdim(const Tensor& x) {
  if (x.shape.empty()) throw std::runtime_error("sum_lastdim: empty shape");
  const int D = x.shape.back();
  std::vector<int> out_shape(x.shape.begin(), x.shape.end() - 1);
  if (out_shape.empty()) out_shape.push_back(1);
  const std::size_t outer = x.numel() / static_cast<std::size_t>(D);

  Tensor out = Tensor::zeros(out_shape, want_grad(x));
  for (std::size_t o = 0; o < outer; ++o) {
    double s = 0.0;
    for (int i = 0; i < D; ++i) s += (*x.data)[o * D + static_cast<std::size_t>(i)];
    (*out.data)[o] = static_cast<float>(s);
  }

  if (out.requires_grad) {
    out.node = std::make_shared<Node>();
    out.node->parents = {x};
    out.node->backward = [D](Tensor& o) {
      const Tensor& px = o.node->parents[0];
      if (!px.requires_grad) return;
      const std::size_t outer2 = o.numel();
      for (std::size_t outi = 0; outi < outer2; ++outi) {
        const float g = (*o.grad)[outi];
        for (int i = 0; i < D; ++i) (*px.grad)[outi * D + static_cast<std::size_t>(i)] += g;
      }
    };
  }
  return out;
}

Tensor mean(const Tensor& x) {
  const std::size_t n = x.numel();
  if (n == 0) throw std::runtime_error("mean: empty tensor");
  Tensor out = Tensor::zeros({1}, want_grad(x));
  double s = 0.0;
  for (float v : *x.data) s += v;
  (*out.data)[0] = static_cast<float>(s / static_cast<double>(n));

  if (out.requires_grad) {
    out.node = std::make_shared<Node>();
    out.node->parents = {x};
    out.node->backward = [n](Tensor& o) {
      const Tensor& px = o.node->parents[0];
      if (!px.requires_grad) return;
      const float g = (*o.grad)[0] / static_cast<float>(n);
      for (std::size_t i = 0; i < n; ++i) (*px.grad)[i] += g;
    };
  }
  return out;
}

namespace {

// State the loss node carries from forward to backward.
struct SavedLossState {
  loss::RowStatsStore stats;
  std::vector<std::uint8_t> active;
  int cols = 0;
};

// One flag per row of `mask` (non-zero = active).
std::vector<std::uint8_t> active_rows_from_mask(const Tensor& mask, int rows) {
  if (mask.numel() != static_cast<std::size_t>(rows)) {
    throw std::runtime_error("log_softmax_loss: mask " + shape_str(mask.shape) + " does not have one value per row (" +
                             std::to_string(rows) + " rows)");
  }
  std::vector<std::uint8_t> active(static_cast<std::size_t>(rows));
  for (int r = 0; r < rows; ++r) {
    active[static_cast<std::size_t>(r)] = (*mask.data)[static_cast<std::size_t>(r)] != 0.0f ? 1 : 0;
  }
  return active;
}

void check_mask_shape(const Tensor& logits, const Tensor& mask) {
  // Leading dims of logits, optionally followed by a trailing 1.
  const std::vector<int> lead(logits.shape.begin(), logits.shape.end() - 1);
  std::vector<int> lead_one = lead;
  lead_one.push_back(1);
  if (mask.shape != lead && mask.shape != lead_one) {
    throw std::runtime_error("log_softmax_loss: mask shape " + shape_str(mask.shape) + " does not match logits " +
                             shape_str(logits.shape));
  }
}

} // namespace

Tensor log_softmax_loss(const Tensor& logits, const Tensor& target, const Tensor& mask) {
  if (logits.shape.size() < 2) {
    throw std::runtime_error("log_softmax_loss: logits must be [..., V], got " + shape_str(logits.shape));
  }
  ensure_same_shape(logits, target, "log_softmax_loss");
  check_mask_shape(logits, mask);

  const int V = logits.shape.back();
  const int rows = static_cast<int>(logits.numel() / static_cast<std::size_t>(V));

  auto state = std::make_shared<SavedLossState>();
  state->active = active_rows_from_mask(mask, rows);
  state->cols = V;

  loss::ForwardResult fwd = loss::log_softmax_loss_forward(*logits.data, *target.data, state->active, V);

  Tensor out = Tensor::zeros({1}, want_grad(logits));
  (*out.data)[0] = fwd.loss;

  if (out.requires_grad) {
    state->stats = std::move(fwd.stats);
    out.node = std::make_shared<Node>();
    out.node->parents = {logits, target};
    out.node->backward = [state](Tensor& o) {
      Tensor& px = o.node->parents[0];
      const Tensor& pt = o.node->parents[1];
      if (!px.requires_grad) return;

      std::vector<float> g = loss::log_softmax_loss_backward(
          std::move(*px.data), *pt.data, state->active, state->cols, std::move(state->stats), (*o.grad)[0]);

      const std::size_t n = g.size();
      for (std::size_t i = 0; i < n; ++i) (*px.grad)[i] += g[i];
      // The score storage now holds the gradient.
      *px.data = std::move(g);
    };
  }

  return out;
}

} // namespace nn
