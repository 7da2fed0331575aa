#pragma once

/// @file routing_function.h
/// @brief Content-derived routing signal (gating + rotation angle) for the
///        kernel variants of an adaptive rotated convolution.

#include <cstdint>
#include <fstream>
#include <random>
#include <string>

#include "arc/config.h"
#include "arc/defines.h"
#include "arc/layers.h"

namespace arc {

/// @brief Per-sample gating values in (0, 1) and angles in (-Amax, Amax).
struct RoutingSignal {
  FloatRowMat gating;  // (B, n)
  FloatRowMat angle;   // (B, n), radians
};

/// @brief Maps a feature map to one (gating, angle) pair per kernel variant.
///
/// depthwise 3x3 conv -> channel LayerNorm -> ReLU -> global average pool,
/// then two heads on the pooled vector:
///   gating: dropout -> Linear(Cin, n, bias)    -> sigmoid
///   angle:  dropout -> Linear(Cin, n, no bias) -> softsign -> * Amax
class RoutingFunction {
 public:
  RoutingFunction(int in_channels, int kernel_number,
                  const RoutingConfig& config = RoutingConfig(),
                  uint32_t seed = 42);

  // Non-copyable
  RoutingFunction(const RoutingFunction&) = delete;
  RoutingFunction& operator=(const RoutingFunction&) = delete;

  /// @param x (B, Cin, H, W).
  RoutingSignal Forward(const Tensor4& x) const;

  /// @brief Dropout is active only in training mode.
  void SetTraining(bool training) { training_ = training; }
  bool IsTraining() const { return training_; }

  int InChannels() const { return in_channels_; }
  int KernelNumber() const { return kernel_number_; }

  /// Angle bound Amax in radians.
  float MaxAngle() const { return config_.max_angle(); }
  const RoutingConfig& Config() const { return config_; }

  Linear& GatingHead() { return fc_alpha_; }
  Linear& AngleHead() { return fc_theta_; }

  std::string toString() const {
    return fmt::format("kernel_number={}", kernel_number_);
  }

  void save(std::ofstream& output) const;
  /// @brief False if a stored record does not match; nothing is modified then.
  bool load(std::ifstream& input);

  /// @brief Take over the learnable parameters of a same-shaped function.
  void CopyParametersFrom(const RoutingFunction& other);

 private:
  int in_channels_;
  int kernel_number_;
  RoutingConfig config_;
  bool training_ = false;

  mutable std::mt19937 rng_;  // initialization, then dropout masks

  Conv2d dwc_;
  ChannelNorm norm_;
  Linear fc_alpha_;
  Linear fc_theta_;
};

}  // namespace arc
