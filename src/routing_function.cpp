/// @file routing_function.cpp
/// @brief Implementation of RoutingFunction.

#include "arc/routing_function.h"

#include <cmath>
#include <utility>

#include "arc/initializer.h"
#include "arc/tensor_ops.h"

namespace arc {

namespace {

constexpr float kRoutingInitStd = 0.02f;

ops::ConvGeometry DepthwiseGeometry(int channels) {
  ops::ConvGeometry geom;
  geom.stride = 1;
  geom.padding = 1;
  geom.dilation = 1;
  geom.groups = channels;
  return geom;
}

int CheckedKernelNumber(int kernel_number) {
  CHECK_GE(kernel_number, 1) << "kernel_number must be >= 1";
  return kernel_number;
}

}  // anonymous namespace

RoutingFunction::RoutingFunction(int in_channels, int kernel_number,
                                 const RoutingConfig& config, uint32_t seed)
    : in_channels_(in_channels),
      kernel_number_(CheckedKernelNumber(kernel_number)),
      config_(config),
      rng_(seed),
      dwc_(in_channels, in_channels, kKernelSize,
           DepthwiseGeometry(in_channels), /*bias=*/false, rng_),
      norm_(in_channels),
      fc_alpha_(in_channels, kernel_number_, /*bias=*/true, rng_),
      fc_theta_(in_channels, kernel_number_, /*bias=*/false, rng_) {
  CHECK(config.dropout_rate >= 0.0f && config.dropout_rate < 1.0f)
      << "dropout_rate must be in [0, 1), got " << config.dropout_rate;

  trunc_normal(dwc_.Weight(), kRoutingInitStd, rng_);
  trunc_normal(fc_alpha_.Weight(), kRoutingInitStd, rng_);
  trunc_normal(fc_theta_.Weight(), kRoutingInitStd, rng_);
}

RoutingSignal RoutingFunction::Forward(const Tensor4& x) const {
  CHECK_EQ(x.dimension(1), in_channels_)
      << fmt::format("Shape mismatch: routing expects {} channels, got {}",
                     in_channels_, x.dimension(1));
  const Eigen::Index batch = x.dimension(0);

  Tensor4 h = dwc_.Forward(x);
  h = norm_.Forward(h);
  ops::ReluInPlace(&h);
  const Tensor4 pooled = ops::GlobalAvgPool(h);
  const FloatRowMat features = as_matrix(pooled.data(), batch, in_channels_);

  RoutingSignal signal;

  FloatRowMat alphas = features;
  if (training_) {
    ops::DropoutInPlace(&alphas, config_.dropout_rate, &rng_);
  }
  signal.gating = fc_alpha_.Forward(alphas);
  ops::SigmoidInPlace(&signal.gating);

  FloatRowMat angles = features;
  if (training_) {
    ops::DropoutInPlace(&angles, config_.dropout_rate, &rng_);
  }
  signal.angle = fc_theta_.Forward(angles);
  ops::SoftsignInPlace(&signal.angle);
  signal.angle *= MaxAngle();

  // softsign rounds to exactly 1 in float for large logits; keep |angle| < Amax
  const float limit = std::nextafter(MaxAngle(), 0.0f);
  float* angle = signal.angle.data();
  for (Eigen::Index i = 0; i < signal.angle.size(); ++i) {
    if (std::abs(angle[i]) > limit) {
      angle[i] = std::copysign(limit, angle[i]);
    }
  }

  return signal;
}

void RoutingFunction::save(std::ofstream& output) const {
  dwc_.save(output);
  norm_.save(output);
  fc_alpha_.save(output);
  fc_theta_.save(output);
}

bool RoutingFunction::load(std::ifstream& input) {
  // A rejected record leaves every parameter untouched.
  Conv2d dwc = dwc_;
  ChannelNorm norm = norm_;
  Linear fc_alpha = fc_alpha_;
  Linear fc_theta = fc_theta_;
  if (!(dwc.load(input) && norm.load(input) && fc_alpha.load(input) &&
        fc_theta.load(input))) {
    return false;
  }
  dwc_ = std::move(dwc);
  norm_ = std::move(norm);
  fc_alpha_ = std::move(fc_alpha);
  fc_theta_ = std::move(fc_theta);
  return true;
}

void RoutingFunction::CopyParametersFrom(const RoutingFunction& other) {
  CHECK_EQ(other.in_channels_, in_channels_)
      << "Shape mismatch: routing function channel count";
  CHECK_EQ(other.kernel_number_, kernel_number_)
      << "Shape mismatch: routing function kernel_number";
  dwc_ = other.dwc_;
  norm_ = other.norm_;
  fc_alpha_ = other.fc_alpha_;
  fc_theta_ = other.fc_theta_;
}

}  // namespace arc
