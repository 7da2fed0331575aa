#pragma once

/// @file layers.h
/// @brief Parameter-owning layers: Conv2d, Linear, ChannelNorm, BatchNorm2d.
///
/// Each layer initializes its parameters at construction, exposes a const
/// Forward, and persists its parameters as binary records (see io_utils.h).

#include <fstream>
#include <random>
#include <string>

#include "arc/defines.h"
#include "arc/tensor_ops.h"

namespace arc {

/// @brief 2-D convolution with square kernel, default uniform init.
class Conv2d {
 public:
  Conv2d(int in_channels, int out_channels, int kernel_size,
         const ops::ConvGeometry& geom, bool bias, std::mt19937& rng);

  Tensor4 Forward(const Tensor4& x) const;

  Tensor4& Weight() { return weight_; }
  const Tensor4& Weight() const { return weight_; }
  const ops::ConvGeometry& Geometry() const { return geom_; }
  int InChannels() const { return in_channels_; }
  int OutChannels() const { return out_channels_; }

  void save(std::ofstream& output) const;
  bool load(std::ifstream& input);

 private:
  int in_channels_;
  int out_channels_;
  ops::ConvGeometry geom_;
  bool has_bias_;
  Tensor4 weight_;  // (Cout, Cin / groups, k, k)
  Tensor1 bias_;    // (Cout), empty without bias
};

/// @brief Dense projection y = x W^T + b.
class Linear {
 public:
  Linear(int in_features, int out_features, bool bias, std::mt19937& rng);

  /// @param x (N, in_features).
  FloatRowMat Forward(const FloatRowMat& x) const;

  Tensor2& Weight() { return weight_; }
  const Tensor2& Weight() const { return weight_; }
  Tensor1& Bias() { return bias_; }

  void save(std::ofstream& output) const;
  bool load(std::ifstream& input);

 private:
  bool has_bias_;
  Tensor2 weight_;  // (out, in)
  Tensor1 bias_;    // (out)
};

/// @brief LayerNorm over the channel axis of an NCHW map.
class ChannelNorm {
 public:
  explicit ChannelNorm(int channels);

  Tensor4 Forward(const Tensor4& x) const;

  void save(std::ofstream& output) const;
  bool load(std::ifstream& input);

 private:
  Tensor1 gamma_;
  Tensor1 beta_;
};

/// @brief BatchNorm over (N, H, W). Running statistics are parameters
///        owned by the external training procedure.
class BatchNorm2d {
 public:
  explicit BatchNorm2d(int channels);

  /// @param training Use batch statistics instead of running statistics.
  Tensor4 Forward(const Tensor4& x, bool training) const;

  void save(std::ofstream& output) const;
  bool load(std::ifstream& input);

 private:
  Tensor1 gamma_;
  Tensor1 beta_;
  Tensor1 running_mean_;
  Tensor1 running_var_;
};

}  // namespace arc
