/// @file layers.cpp
/// @brief Implementation of the parameter-owning layers.

#include "arc/layers.h"

#include "arc/initializer.h"
#include "arc/io_utils.h"

namespace arc {

// ---------------------------------------------------------------------------
// Conv2d
// ---------------------------------------------------------------------------

Conv2d::Conv2d(int in_channels, int out_channels, int kernel_size,
               const ops::ConvGeometry& geom, bool bias, std::mt19937& rng)
    : in_channels_(in_channels),
      out_channels_(out_channels),
      geom_(geom),
      has_bias_(bias) {
  CHECK_GT(geom.groups, 0);
  CHECK_EQ(in_channels % geom.groups, 0)
      << fmt::format("in_channels {} not divisible by groups {}", in_channels,
                     geom.groups);
  CHECK_EQ(out_channels % geom.groups, 0)
      << fmt::format("out_channels {} not divisible by groups {}",
                     out_channels, geom.groups);

  weight_.resize(out_channels, in_channels / geom.groups, kernel_size,
                 kernel_size);
  const auto fan_in = compute_fans(weight_).first;
  uniform_fan_in(weight_, fan_in, rng);
  if (has_bias_) {
    bias_.resize(out_channels);
    uniform_fan_in(bias_, fan_in, rng);
  }
}

Tensor4 Conv2d::Forward(const Tensor4& x) const {
  return ops::Conv2dForward(x, weight_, has_bias_ ? &bias_ : nullptr, geom_);
}

void Conv2d::save(std::ofstream& output) const {
  save_tensor(output, weight_);
  if (has_bias_) {
    save_tensor(output, bias_);
  }
}

bool Conv2d::load(std::ifstream& input) {
  if (!load_tensor(input, weight_)) return false;
  return !has_bias_ || load_tensor(input, bias_);
}

// ---------------------------------------------------------------------------
// Linear
// ---------------------------------------------------------------------------

Linear::Linear(int in_features, int out_features, bool bias,
               std::mt19937& rng)
    : has_bias_(bias), weight_(out_features, in_features) {
  uniform_fan_in(weight_, in_features, rng);
  if (has_bias_) {
    bias_.resize(out_features);
    uniform_fan_in(bias_, in_features, rng);
  }
}

FloatRowMat Linear::Forward(const FloatRowMat& x) const {
  return ops::LinearForward(x, weight_, has_bias_ ? &bias_ : nullptr);
}

void Linear::save(std::ofstream& output) const {
  save_tensor(output, weight_);
  if (has_bias_) {
    save_tensor(output, bias_);
  }
}

bool Linear::load(std::ifstream& input) {
  if (!load_tensor(input, weight_)) return false;
  return !has_bias_ || load_tensor(input, bias_);
}

// ---------------------------------------------------------------------------
// ChannelNorm
// ---------------------------------------------------------------------------

ChannelNorm::ChannelNorm(int channels) : gamma_(channels), beta_(channels) {
  gamma_.setConstant(1.0f);
  beta_.setZero();
}

Tensor4 ChannelNorm::Forward(const Tensor4& x) const {
  return ops::ChannelLayerNorm(x, gamma_, beta_);
}

void ChannelNorm::save(std::ofstream& output) const {
  save_tensor(output, gamma_);
  save_tensor(output, beta_);
}

bool ChannelNorm::load(std::ifstream& input) {
  return load_tensor(input, gamma_) && load_tensor(input, beta_);
}

// ---------------------------------------------------------------------------
// BatchNorm2d
// ---------------------------------------------------------------------------

BatchNorm2d::BatchNorm2d(int channels)
    : gamma_(channels),
      beta_(channels),
      running_mean_(channels),
      running_var_(channels) {
  gamma_.setConstant(1.0f);
  beta_.setZero();
  running_mean_.setZero();
  running_var_.setConstant(1.0f);
}

Tensor4 BatchNorm2d::Forward(const Tensor4& x, bool training) const {
  return ops::BatchNorm2dForward(x, gamma_, beta_, running_mean_,
                                 running_var_, training);
}

void BatchNorm2d::save(std::ofstream& output) const {
  save_tensor(output, gamma_);
  save_tensor(output, beta_);
  save_tensor(output, running_mean_);
  save_tensor(output, running_var_);
}

bool BatchNorm2d::load(std::ifstream& input) {
  return load_tensor(input, gamma_) && load_tensor(input, beta_) &&
         load_tensor(input, running_mean_) && load_tensor(input, running_var_);
}

}  // namespace arc
