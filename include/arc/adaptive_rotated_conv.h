#pragma once

/// @file adaptive_rotated_conv.h
/// @brief Adaptive Rotated Convolution: a 3x3 convolution whose kernels are
///        rotated and gated per sample from a shared bank of kernel variants.
///
/// Forward:
///   1. (gating, angle) = routing(x)                           [B, n] each
///   2. weights = SynthesizeWeights(bank, gating, angle)       [B*n*Cout, Cin/g, 3, 3]
///   3. x repeated n times and folded into channels            [1, B*n*Cin, H, W]
///   4. one convolution with groups = g * B * n                [B, n, Cout, H', W']
///   5. channel attention over the n variant outputs, softmax over the
///      variant axis, weighted sum                             [B, Cout, H', W']

#include <fstream>
#include <memory>
#include <random>
#include <string>

#include "arc/config.h"
#include "arc/conv3x3.h"
#include "arc/defines.h"
#include "arc/layers.h"
#include "arc/routing_function.h"

namespace arc {

class AdaptiveRotatedConv : public Conv3x3 {
 public:
  /// @brief Construct with a routing function built from @p routing_config.
  explicit AdaptiveRotatedConv(
      const ArcConvConfig& config,
      const RoutingConfig& routing_config = RoutingConfig());

  /// @brief Construct with a caller-built routing function. Its channel
  ///        count and kernel_number must match @p config.
  AdaptiveRotatedConv(const ArcConvConfig& config,
                      std::unique_ptr<RoutingFunction> routing);

  // Non-copyable
  AdaptiveRotatedConv(const AdaptiveRotatedConv&) = delete;
  AdaptiveRotatedConv& operator=(const AdaptiveRotatedConv&) = delete;

  /// @param x (B, Cin, H, W).
  /// @return (B, Cout, H', W').
  Tensor4 Forward(const Tensor4& x) const override;

  /// @brief Forward with an externally supplied routing signal.
  /// @param gating (B, n).
  /// @param angle  (B, n), radians.
  Tensor4 ForwardWithRouting(const Tensor4& x, const FloatRowMat& gating,
                             const FloatRowMat& angle) const;

  /// @brief Validate an input before running it.
  /// @return Empty string if @p x can be processed, otherwise the shape
  ///         mismatch description Forward would fail with.
  std::string CheckInputShape(const Tensor4& x) const;

  ConvKind Kind() const override { return ConvKind::Adaptive; }
  int InChannels() const override { return config_.in_channels; }
  int OutChannels() const override { return config_.out_channels; }
  int KernelNumber() const { return config_.kernel_number; }
  const ArcConvConfig& Config() const { return config_; }

  void SetTraining(bool training) override;

  std::string toString() const override { return config_.toString(); }

  /// (kernel_number, Cout, Cin / groups, 3, 3)
  Tensor5& KernelBank() { return weight_; }
  const Tensor5& KernelBank() const { return weight_; }

  RoutingFunction& Routing() { return *routing_; }
  const RoutingFunction& Routing() const { return *routing_; }

  void save(std::ofstream& output) const override;
  bool load(std::ifstream& input) override;

 private:
  /// Variant weights from the summed variant outputs (B, Cout, H', W').
  /// Row b holds (n, Cout) row-major, softmax-normalized over n.
  FloatRowMat VariantAttention(const Tensor4& summed) const;

  ArcConvConfig config_;
  bool training_ = false;
  std::mt19937 rng_;

  Tensor5 weight_;
  std::unique_ptr<RoutingFunction> routing_;

  Conv2d fc1_;  // Cout -> d, 1x1
  BatchNorm2d fc1_norm_;
  Conv2d fc2_;  // d -> Cout * n, 1x1
};

}  // namespace arc
