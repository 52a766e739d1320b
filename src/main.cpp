#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "backend/cpu_backend.h"
#include "backend/registry.h"
#include "loss/launch_config.h"
#include "loss/reference.h"
#include "ops.h"
#include "tensor.h"
#include "util.h"

struct Args {
  int batch = 1;
  int seq = 1024;
  int vocab = 16000;
  std::uint64_t seed = 1;
  float mask_prob = 0.0f; // fraction of rows masked out
  int iters = 3;
  float tol = 1e-4f;
  int threads = 0; // 0 = OpenMP default
};

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string k = argv[i];
    auto need = [&](const char* name) -> std::string {
      if (i + 1 >= argc) throw std::runtime_error(std::string("missing value for ") + name);
      return std::string(argv[++i]);
    };

    if (k == "--batch") a.batch = std::stoi(need("--batch"));
    else if (k == "--seq") a.seq = std::stoi(need("--seq"));
    else if (k == "--vocab") a.vocab = std::stoi(need("--vocab"));
    else if (k == "--seed") a.seed = static_cast<std::uint64_t>(std::stoull(need("--seed")));
    else if (k == "--mask-prob") a.mask_prob = std::stof(need("--mask-prob"));
    else if (k == "--iters") a.iters = std::stoi(need("--iters"));
    else if (k == "--tol") a.tol = std::stof(need("--tol"));
    else if (k == "--threads") a.threads = std::stoi(need("--threads"));
    else if (k == "--help" || k == "-h") {
      std::cout
          << "Usage:\n"
          << "  xent_check [--batch B] [--seq T] [--vocab V] [--seed S] [--mask-prob P] [--iters N] [--tol X] [--threads N]\n\n"
          << "Compares the fused log-softmax loss against the naive reference on random\n"
          << "[B,T,V] logits and reports loss/gradient error and timings.\n"
          << "Exit code: 0 match, 3 mismatch, 1 error.\n";
      std::exit(0);
    } else {
      throw std::runtime_error("unknown arg: " + k);
    }
  }
  if (a.batch <= 0 || a.seq <= 0 || a.vocab <= 0) throw std::runtime_error("--batch, --seq and --vocab must be > 0");
  if (a.mask_prob < 0.0f || a.mask_prob > 1.0f) throw std::runtime_error("--mask-prob must be in [0,1]");
  if (a.iters < 0) throw std::runtime_error("--iters must be >= 0");
  if (a.tol <= 0.0f) throw std::runtime_error("--tol must be > 0");
  return a;
}

struct Inputs {
  nn::Tensor logits;
  nn::Tensor target;
  nn::Tensor mask;
};

static Inputs make_inputs(const Args& a) {
  Inputs in;
  in.logits = nn::Tensor::randn({a.batch, a.seq, a.vocab}, 1.0f, a.seed, true);

  util::Rng rng(a.seed ^ 0x7A26E7ULL);
  in.target = nn::Tensor::zeros({a.batch, a.seq, a.vocab}, false);
  util::fill_uniform(*in.target.data, 0.0f, 1.0f, rng);

  in.mask = nn::Tensor::zeros({a.batch, a.seq, 1}, false);
  for (float& m : *in.mask.data) m = rng.bernoulli(a.mask_prob) ? 0.0f : 1.0f;
  return in;
}

static nn::Tensor clone_leaf(const nn::Tensor& t) {
  return nn::Tensor::from_data(t.shape, *t.data, t.requires_grad);
}

static bool is_close(float a, float b, float tol) {
  return std::fabs(a - b) <= tol + tol * std::fabs(b);
}

// Runs forward + backward on a fresh copy of the logits; returns seconds.
template <typename LossFn>
static double time_fwd_bwd(const Inputs& in, int iters, LossFn fn) {
  if (iters == 0) return 0.0;
  double total = 0.0;
  for (int i = 0; i < iters; ++i) {
    nn::Tensor logits = clone_leaf(in.logits);
    const auto t0 = std::chrono::high_resolution_clock::now();
    nn::Tensor loss = fn(logits, in.target, in.mask);
    loss.backward();
    const auto t1 = std::chrono::high_resolution_clock::now();
    total += std::chrono::duration<double>(t1 - t0).count();
  }
  return total / static_cast<double>(iters);
}

int main(int argc, char** argv) {
  try {
    const Args args = parse_args(argc, argv);

    if (args.threads > 0) {
      backend::set(std::make_unique<backend::CpuBackend>(args.threads));
    }

    const loss::LaunchSettings s = loss::calculate_settings(args.vocab, backend::current_device().type);
    std::cout << "shape=[" << args.batch << "," << args.seq << "," << args.vocab << "]  block_size=" << s.block_size
              << "  num_warps=" << s.num_warps << "  mask_prob=" << args.mask_prob << "\n";

    const Inputs in = make_inputs(args);

    nn::Tensor fused_logits = clone_leaf(in.logits);
    nn::Tensor fused = nn::log_softmax_loss(fused_logits, in.target, in.mask);
    fused.backward();

    nn::Tensor ref_logits = clone_leaf(in.logits);
    nn::Tensor ref = loss::reference_log_softmax_loss(ref_logits, in.target, in.mask);
    ref.backward();

    const float lf = (*fused.data)[0];
    const float lr = (*ref.data)[0];
    bool ok = is_close(lf, lr, args.tol);

    float max_grad_diff = 0.0f;
    const std::vector<float>& gf = *fused_logits.grad;
    const std::vector<float>& gr = *ref_logits.grad;
    for (std::size_t i = 0; i < gf.size(); ++i) {
      max_grad_diff = std::max(max_grad_diff, std::fabs(gf[i] - gr[i]));
      if (!is_close(gf[i], gr[i], args.tol)) ok = false;
    }

    std::cout << "loss fused=" << lf << "  reference=" << lr << "  |diff|=" << std::fabs(lf - lr) << "\n";
    std::cout << "grad max |diff|=" << max_grad_diff << "\n";

    const double t_fused = time_fwd_bwd(in, args.iters, nn::log_softmax_loss);
    const double t_ref = time_fwd_bwd(in, args.iters, loss::reference_log_softmax_loss);
    if (args.iters > 0) {
      std::cout << "fwd+bwd fused=" << t_fused * 1e3 << "ms  reference=" << t_ref * 1e3 << "ms  (" << args.iters
                << " iters)\n";
    }

    if (!ok) {
      std::cerr << "MISMATCH (tol=" << args.tol << ")\n";
      return 3;
    }
    std::cout << "OK\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
