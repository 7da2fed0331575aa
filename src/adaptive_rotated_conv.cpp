/// @file adaptive_rotated_conv.cpp
/// @brief Implementation of AdaptiveRotatedConv.

#include "arc/adaptive_rotated_conv.h"

#include <utility>

#include "arc/initializer.h"
#include "arc/io_utils.h"
#include "arc/tensor_ops.h"
#include "arc/weight_synthesizer.h"

namespace arc {

namespace {

const ArcConvConfig& Validated(const ArcConvConfig& config) {
  const std::string err = config.Validate();
  CHECK(err.empty()) << "Shape mismatch: " << err;
  return config;
}

ops::ConvGeometry PointwiseGeometry() {
  ops::ConvGeometry geom;
  geom.stride = 1;
  geom.padding = 0;
  geom.dilation = 1;
  geom.groups = 1;
  return geom;
}

}  // anonymous namespace

AdaptiveRotatedConv::AdaptiveRotatedConv(const ArcConvConfig& config,
                                         const RoutingConfig& routing_config)
    : AdaptiveRotatedConv(
          config, std::make_unique<RoutingFunction>(
                      Validated(config).in_channels, config.kernel_number,
                      routing_config, config.seed)) {}

AdaptiveRotatedConv::AdaptiveRotatedConv(
    const ArcConvConfig& config, std::unique_ptr<RoutingFunction> routing)
    : config_(Validated(config)),
      rng_(config.seed),
      weight_(config.kernel_number, config.out_channels,
              config.in_channels / config.groups, kKernelSize, kKernelSize),
      routing_(std::move(routing)),
      fc1_(config.out_channels, config.attention_channels(), 1,
           PointwiseGeometry(), /*bias=*/false, rng_),
      fc1_norm_(config.attention_channels()),
      fc2_(config.attention_channels(),
           config.out_channels * config.kernel_number, 1, PointwiseGeometry(),
           /*bias=*/false, rng_) {
  CHECK(routing_ != nullptr) << "AdaptiveRotatedConv needs a routing function";
  CHECK_EQ(routing_->InChannels(), config_.in_channels)
      << "Shape mismatch: routing function channel count";
  CHECK_EQ(routing_->KernelNumber(), config_.kernel_number)
      << "Shape mismatch: routing function kernel_number";

  kaiming_normal_fan_out(weight_, rng_);

  const int d = config_.attention_channels();
  LOG(INFO) << fmt::format("AdaptiveRotatedConv({}) attention_channels={} {}",
                           toString(), d, routing_->Config().toString());
  LOG_IF(WARNING, d > config_.out_channels) << fmt::format(
      "Attention bottleneck ({} channels) is wider than out_channels ({})", d,
      config_.out_channels);
}

std::string AdaptiveRotatedConv::CheckInputShape(const Tensor4& x) const {
  if (x.dimension(1) != config_.in_channels) {
    return fmt::format("expected {} input channels, got {}",
                       config_.in_channels, x.dimension(1));
  }
  if (weight_.dimension(2) * config_.groups != config_.in_channels) {
    return fmt::format("kernel bank holds {} channels per group, expected {}",
                       weight_.dimension(2),
                       config_.in_channels / config_.groups);
  }
  const int out_h = ops::ConvOutputSize(static_cast<int>(x.dimension(2)),
                                        kKernelSize, config_.stride,
                                        config_.padding, config_.dilation);
  const int out_w = ops::ConvOutputSize(static_cast<int>(x.dimension(3)),
                                        kKernelSize, config_.stride,
                                        config_.padding, config_.dilation);
  if (out_h <= 0 || out_w <= 0) {
    return fmt::format("input {}x{} too small for the configured geometry",
                       x.dimension(2), x.dimension(3));
  }
  return "";
}

Tensor4 AdaptiveRotatedConv::Forward(const Tensor4& x) const {
  const std::string err = CheckInputShape(x);
  CHECK(err.empty()) << "Shape mismatch: " << err;

  const RoutingSignal signal = routing_->Forward(x);
  return ForwardWithRouting(x, signal.gating, signal.angle);
}

Tensor4 AdaptiveRotatedConv::ForwardWithRouting(const Tensor4& x,
                                                const FloatRowMat& gating,
                                                const FloatRowMat& angle) const {
  const std::string err = CheckInputShape(x);
  CHECK(err.empty()) << "Shape mismatch: " << err;

  const Eigen::Index batch = x.dimension(0);
  const Eigen::Index n = config_.kernel_number;
  const Eigen::Index cin = config_.in_channels;
  const Eigen::Index cout = config_.out_channels;
  CHECK_EQ(gating.rows(), batch) << "Shape mismatch: gating batch size";
  CHECK_EQ(angle.rows(), batch) << "Shape mismatch: angle batch size";

  // [B*n*Cout, Cin/g, 3, 3]
  const Tensor4 weights = SynthesizeWeights(weight_, gating, angle);

  // [B, Cin, H, W] -> [B, n, Cin, H, W] -> [1, B*n*Cin, H, W]
  const Tensor5 tiled =
      x.reshape(Eigen::array<Eigen::Index, 5>{
                    {batch, 1, cin, x.dimension(2), x.dimension(3)}})
          .broadcast(Eigen::array<Eigen::Index, 5>{{1, n, 1, 1, 1}});
  const Tensor4 stacked = tiled.reshape(Eigen::array<Eigen::Index, 4>{
      {1, batch * n * cin, x.dimension(2), x.dimension(3)}});

  ops::ConvGeometry geom;
  geom.stride = config_.stride;
  geom.padding = config_.padding;
  geom.dilation = config_.dilation;
  geom.groups = config_.groups * static_cast<int>(batch * n);
  // [1, B*n*Cout, H', W'], read as [B, n, Cout, H', W']
  const Tensor4 variants = ops::Conv2dForward(stacked, weights, nullptr, geom);

  const Eigen::Index out_h = variants.dimension(2);
  const Eigen::Index out_w = variants.dimension(3);
  const Eigen::Index plane = out_h * out_w;
  VLOG(1) << fmt::format("ARC forward: batch={} variants={} output={}x{}x{}",
                         batch, n, cout, out_h, out_w);

  Tensor4 summed(batch, cout, out_h, out_w);
  summed.setZero();
  for (Eigen::Index b = 0; b < batch; ++b) {
    auto dst = as_matrix(summed.data() + b * cout * plane, cout, plane);
    for (Eigen::Index v = 0; v < n; ++v) {
      dst += as_matrix(variants.data() + (b * n + v) * cout * plane, cout, plane);
    }
  }

  const FloatRowMat attention = VariantAttention(summed);

  Tensor4 output(batch, cout, out_h, out_w);
  output.setZero();
  for (Eigen::Index b = 0; b < batch; ++b) {
    auto dst = as_matrix(output.data() + b * cout * plane, cout, plane);
    for (Eigen::Index v = 0; v < n; ++v) {
      dst.noalias() +=
          attention.row(b).segment(v * cout, cout).asDiagonal() *
          as_matrix(variants.data() + (b * n + v) * cout * plane, cout, plane);
    }
  }
  return output;
}

FloatRowMat AdaptiveRotatedConv::VariantAttention(const Tensor4& summed) const {
  const Eigen::Index batch = summed.dimension(0);
  const Eigen::Index n = config_.kernel_number;
  const Eigen::Index cout = config_.out_channels;

  Tensor4 h = fc1_.Forward(ops::GlobalAvgPool(summed));
  h = fc1_norm_.Forward(h, training_);
  ops::ReluInPlace(&h);
  const Tensor4 logits = fc2_.Forward(h);  // [B, n*Cout, 1, 1]

  FloatRowMat attention = as_matrix(logits.data(), batch, n * cout);
  ops::SoftmaxMiddleAxis(attention.data(), batch, n, cout);
  return attention;
}

void AdaptiveRotatedConv::SetTraining(bool training) {
  training_ = training;
  routing_->SetTraining(training);
}

void AdaptiveRotatedConv::save(std::ofstream& output) const {
  save_tensor(output, weight_);
  routing_->save(output);
  fc1_.save(output);
  fc1_norm_.save(output);
  fc2_.save(output);
}

bool AdaptiveRotatedConv::load(std::ifstream& input) {
  // Every record is read into a staging copy and committed only when all match.
  Tensor5 weight = weight_;
  RoutingFunction routing(routing_->InChannels(), routing_->KernelNumber(),
                          routing_->Config());
  Conv2d fc1 = fc1_;
  BatchNorm2d fc1_norm = fc1_norm_;
  Conv2d fc2 = fc2_;
  if (!(load_tensor(input, weight) && routing.load(input) && fc1.load(input) &&
        fc1_norm.load(input) && fc2.load(input))) {
    return false;
  }
  weight_ = std::move(weight);
  routing_->CopyParametersFrom(routing);
  fc1_ = std::move(fc1);
  fc1_norm_ = std::move(fc1_norm);
  fc2_ = std::move(fc2);
  return true;
}

}  // namespace arc
