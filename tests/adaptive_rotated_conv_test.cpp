#include "arc/adaptive_rotated_conv.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "arc/rotation_operator.h"
#include "arc/tensor_ops.h"

namespace {

constexpr float kEpsilon = 1e-4f;

arc::Tensor4 RandomInput(int batch, int channels, int height, int width,
                         uint32_t seed) {
  arc::Tensor4 x(batch, channels, height, width);
  std::mt19937 rng(seed);
  std::normal_distribution<float> normal(0.0f, 1.0f);
  for (Eigen::Index i = 0; i < x.size(); ++i) {
    x.data()[i] = normal(rng);
  }
  return x;
}

arc::ArcConvConfig MakeConfig(int in, int out, int n) {
  arc::ArcConvConfig config;
  config.in_channels = in;
  config.out_channels = out;
  config.kernel_number = n;
  return config;
}

arc::ops::ConvGeometry GeometryOf(const arc::ArcConvConfig& config) {
  arc::ops::ConvGeometry geom;
  geom.stride = config.stride;
  geom.padding = config.padding;
  geom.dilation = config.dilation;
  geom.groups = config.groups;
  return geom;
}

float MaxAbsDiff(const arc::Tensor4& a, const arc::Tensor4& b) {
  float err = 0.0f;
  for (Eigen::Index i = 0; i < a.size(); ++i) {
    err = std::max(err, std::abs(a.data()[i] - b.data()[i]));
  }
  return err;
}

/// Output of variant v for sample b: conv(x_b, gate * W_v R(theta)^T).
arc::Tensor4 VariantOutput(const arc::AdaptiveRotatedConv& conv,
                           const arc::Tensor4& x, int b, int v, float gate,
                           float theta) {
  const arc::Tensor5& bank = conv.KernelBank();
  const Eigen::Index cout = bank.dimension(1);
  const Eigen::Index cin = bank.dimension(2);
  const Eigen::Index oc = cout * cin;

  arc::Tensor4 w(cout, cin, 3, 3);
  const arc::FloatRowMat r = arc::RotationOperator(theta);
  arc::as_matrix(w.data(), oc, 9) =
      gate * (arc::as_matrix(bank.data() + v * oc * 9, oc, 9) * r.transpose());

  const Eigen::array<Eigen::Index, 4> offsets{{b, 0, 0, 0}};
  const Eigen::array<Eigen::Index, 4> extents{
      {1, x.dimension(1), x.dimension(2), x.dimension(3)}};
  const arc::Tensor4 xb = x.slice(offsets, extents);
  return arc::ops::Conv2dForward(xb, w, nullptr, GeometryOf(conv.Config()));
}

// Test 1: one variant, gating 1, angle 0 is a plain convolution with bank[0]
bool TestSingleVariantIsPlainConv() {
  std::cout << "TestSingleVariantIsPlainConv: ";

  arc::AdaptiveRotatedConv conv(MakeConfig(4, 4, 1));
  const arc::Tensor4 x = RandomInput(2, 4, 5, 5, 1);
  const arc::FloatRowMat gating = arc::FloatRowMat::Ones(2, 1);
  const arc::FloatRowMat angle = arc::FloatRowMat::Zero(2, 1);

  const arc::Tensor4 got = conv.ForwardWithRouting(x, gating, angle);
  const arc::Tensor4 w0 = conv.KernelBank().chip(0, 0);
  const arc::Tensor4 expected =
      arc::ops::Conv2dForward(x, w0, nullptr, GeometryOf(conv.Config()));

  if (got.dimension(0) != 2 || got.dimension(1) != 4 || got.dimension(2) != 5 ||
      got.dimension(3) != 5) {
    std::cout << "FAILED - wrong output shape\n";
    return false;
  }
  const float err = MaxAbsDiff(got, expected);
  if (err > kEpsilon) {
    std::cout << "FAILED - max error " << err << "\n";
    return false;
  }

  std::cout << "OK\n";
  return true;
}

// Test 2: grouped single-variant convolution matches a grouped plain conv
bool TestGroupedSingleVariant() {
  std::cout << "TestGroupedSingleVariant: ";

  arc::ArcConvConfig config = MakeConfig(4, 6, 1);
  config.groups = 2;
  arc::AdaptiveRotatedConv conv(config);
  if (conv.KernelBank().dimension(2) != 2) {
    std::cout << "FAILED - bank holds " << conv.KernelBank().dimension(2)
              << " channels per group\n";
    return false;
  }

  const arc::Tensor4 x = RandomInput(3, 4, 6, 5, 2);
  const arc::Tensor4 got = conv.ForwardWithRouting(
      x, arc::FloatRowMat::Ones(3, 1), arc::FloatRowMat::Zero(3, 1));
  const arc::Tensor4 w0 = conv.KernelBank().chip(0, 0);
  const arc::Tensor4 expected =
      arc::ops::Conv2dForward(x, w0, nullptr, GeometryOf(config));

  const float err = MaxAbsDiff(got, expected);
  if (err > kEpsilon) {
    std::cout << "FAILED - max error " << err << "\n";
    return false;
  }

  std::cout << "OK\n";
  return true;
}

// Test 3: output extent depends only on the geometry
bool TestOutputShape() {
  std::cout << "TestOutputShape: ";

  struct Case {
    int stride, padding, dilation;
  };
  const Case cases[] = {{1, 1, 1}, {2, 1, 1}, {1, 2, 2}, {1, 0, 1}, {2, 0, 2}};

  for (const Case& c : cases) {
    arc::ArcConvConfig config = MakeConfig(4, 8, 4);
    config.stride = c.stride;
    config.padding = c.padding;
    config.dilation = c.dilation;
    arc::AdaptiveRotatedConv conv(config);

    const arc::Tensor4 y = conv.Forward(RandomInput(3, 4, 9, 7, 3));
    const int h = arc::ops::ConvOutputSize(9, 3, c.stride, c.padding, c.dilation);
    const int w = arc::ops::ConvOutputSize(7, 3, c.stride, c.padding, c.dilation);
    if (y.dimension(0) != 3 || y.dimension(1) != 8 || y.dimension(2) != h ||
        y.dimension(3) != w) {
      std::cout << "FAILED - stride=" << c.stride << " padding=" << c.padding
                << " dilation=" << c.dilation << " gave [" << y.dimension(0)
                << ", " << y.dimension(1) << ", " << y.dimension(2) << ", "
                << y.dimension(3) << "]\n";
      return false;
    }
  }

  std::cout << "OK\n";
  return true;
}

// Test 4: identical variants collapse to a single rotated convolution
bool TestIdenticalVariantsCollapse() {
  std::cout << "TestIdenticalVariantsCollapse: ";

  const int n = 3;
  arc::AdaptiveRotatedConv conv(MakeConfig(4, 4, n));
  arc::Tensor5& bank = conv.KernelBank();
  const Eigen::Index slice = bank.size() / n;
  for (int v = 1; v < n; ++v) {
    std::copy(bank.data(), bank.data() + slice, bank.data() + v * slice);
  }

  const arc::Tensor4 x = RandomInput(2, 4, 6, 6, 4);
  arc::FloatRowMat gating(2, n);
  gating << 0.7f, 0.7f, 0.7f,
            0.2f, 0.2f, 0.2f;
  arc::FloatRowMat angle(2, n);
  angle << 0.3f, 0.3f, 0.3f,
           -0.45f, -0.45f, -0.45f;

  const arc::Tensor4 got = conv.ForwardWithRouting(x, gating, angle);
  const Eigen::Index per_sample = got.size() / 2;
  for (int b = 0; b < 2; ++b) {
    const arc::Tensor4 expected =
        VariantOutput(conv, x, b, 0, gating(b, 0), angle(b, 0));
    for (Eigen::Index i = 0; i < per_sample; ++i) {
      const float diff =
          std::abs(got.data()[b * per_sample + i] - expected.data()[i]);
      if (diff > kEpsilon) {
        std::cout << "FAILED - sample " << b << " differs by " << diff << "\n";
        return false;
      }
    }
  }

  std::cout << "OK\n";
  return true;
}

// Test 5: with distinct variants every output is a convex combination of
// the per-variant outputs at the same (sample, channel, pixel)
bool TestConvexCombinationOfVariants() {
  std::cout << "TestConvexCombinationOfVariants: ";

  for (int n : {3, 2}) {
    arc::ArcConvConfig config = MakeConfig(4, 6, n);
    config.seed = 17 + n;
    arc::AdaptiveRotatedConv conv(config);

    const int batch = 2;
    const arc::Tensor4 x = RandomInput(batch, 4, 5, 6, 5 + n);
    const arc::RoutingSignal signal = conv.Routing().Forward(x);
    const arc::Tensor4 got = conv.Forward(x);
    const Eigen::Index per_sample = got.size() / batch;

    bool distinct = false;
    for (int b = 0; b < batch; ++b) {
      std::vector<arc::Tensor4> variants;
      for (int v = 0; v < n; ++v) {
        variants.push_back(VariantOutput(conv, x, b, v, signal.gating(b, v),
                                         signal.angle(b, v)));
      }
      for (Eigen::Index i = 0; i < per_sample; ++i) {
        float lo = variants[0].data()[i];
        float hi = lo;
        for (int v = 1; v < n; ++v) {
          lo = std::min(lo, variants[v].data()[i]);
          hi = std::max(hi, variants[v].data()[i]);
        }
        if (hi - lo > 1e-3f) distinct = true;
        const float y = got.data()[b * per_sample + i];
        if (y < lo - kEpsilon || y > hi + kEpsilon) {
          std::cout << "FAILED - n=" << n << " output " << y
                    << " outside variant range [" << lo << ", " << hi << "]\n";
          return false;
        }
      }
    }
    if (!distinct) {
      std::cout << "FAILED - n=" << n << " variants are not distinct\n";
      return false;
    }
  }

  std::cout << "OK\n";
  return true;
}

// Test 6: eval forwards are deterministic; equal seeds give equal modules
bool TestDeterministic() {
  std::cout << "TestDeterministic: ";

  arc::AdaptiveRotatedConv a(MakeConfig(4, 8, 2));
  arc::AdaptiveRotatedConv b(MakeConfig(4, 8, 2));
  const arc::Tensor4 x = RandomInput(2, 4, 6, 6, 6);

  const arc::Tensor4 first = a.Forward(x);
  const arc::Tensor4 second = a.Forward(x);
  const arc::Tensor4 other = b.Forward(x);
  if (MaxAbsDiff(first, second) != 0.0f || MaxAbsDiff(first, other) != 0.0f) {
    std::cout << "FAILED - outputs differ\n";
    return false;
  }

  std::cout << "OK\n";
  return true;
}

// Test 7: input validation reports channel and size mismatches
bool TestCheckInputShape() {
  std::cout << "TestCheckInputShape: ";

  arc::ArcConvConfig config = MakeConfig(4, 4, 2);
  config.padding = 0;
  arc::AdaptiveRotatedConv conv(config);

  if (!conv.CheckInputShape(RandomInput(1, 4, 5, 5, 7)).empty()) {
    std::cout << "FAILED - valid input rejected\n";
    return false;
  }
  const std::string channels = conv.CheckInputShape(RandomInput(1, 3, 5, 5, 7));
  if (channels != "expected 4 input channels, got 3") {
    std::cout << "FAILED - channel mismatch message '" << channels << "'\n";
    return false;
  }
  if (conv.CheckInputShape(RandomInput(1, 4, 2, 5, 7)).empty()) {
    std::cout << "FAILED - input smaller than the kernel accepted\n";
    return false;
  }

  std::cout << "OK\n";
  return true;
}

// Test 8: construction details
bool TestConstruction() {
  std::cout << "TestConstruction: ";

  arc::ArcConvConfig config = MakeConfig(16, 32, 4);
  arc::AdaptiveRotatedConv conv(config);
  if (conv.Kind() != arc::ConvKind::Adaptive || conv.InChannels() != 16 ||
      conv.OutChannels() != 32 || conv.KernelNumber() != 4) {
    std::cout << "FAILED - accessors\n";
    return false;
  }

  const std::string expected =
      "16, 32, kernel_number=4, kernel_size=3, stride=1, bias=False, padding=1";
  if (conv.toString() != expected) {
    std::cout << "FAILED - description '" << conv.toString() << "'\n";
    return false;
  }

  arc::ArcConvConfig grouped = MakeConfig(8, 8, 2);
  grouped.padding = 2;
  grouped.dilation = 2;
  grouped.groups = 2;
  if (grouped.toString() !=
      "8, 8, kernel_number=2, kernel_size=3, stride=1, bias=False, padding=2, "
      "dilation=2, groups=2") {
    std::cout << "FAILED - description '" << grouped.toString() << "'\n";
    return false;
  }

  // Kaiming normal on the 5-D bank, fan_out = n * (Cin / groups) * 9
  const arc::Tensor5& bank = conv.KernelBank();
  double sq = 0.0;
  for (Eigen::Index i = 0; i < bank.size(); ++i) {
    sq += static_cast<double>(bank.data()[i]) * bank.data()[i];
  }
  const double stddev = std::sqrt(sq / bank.size());
  const double expected_std = std::sqrt(2.0 / (4 * 16 * 9));
  if (std::abs(stddev - expected_std) > 0.1 * expected_std) {
    std::cout << "FAILED - bank std " << stddev << " expected " << expected_std
              << "\n";
    return false;
  }

  conv.SetTraining(true);
  if (!conv.Routing().IsTraining()) {
    std::cout << "FAILED - training mode not propagated\n";
    return false;
  }

  auto routing = std::make_unique<arc::RoutingFunction>(8, 2);
  arc::AdaptiveRotatedConv custom(MakeConfig(8, 8, 2), std::move(routing));
  if (custom.Routing().KernelNumber() != 2) {
    std::cout << "FAILED - supplied routing function not used\n";
    return false;
  }

  arc::ArcConvConfig bad = MakeConfig(6, 4, 1);
  bad.groups = 4;
  if (bad.Validate().empty()) {
    std::cout << "FAILED - indivisible groups accepted\n";
    return false;
  }
  arc::ArcConvConfig no_kernels = MakeConfig(4, 4, 0);
  if (no_kernels.Validate().empty()) {
    std::cout << "FAILED - kernel_number 0 accepted\n";
    return false;
  }

  std::cout << "OK\n";
  return true;
}

}  // namespace

int main() {
  int failed = 0;

  if (!TestSingleVariantIsPlainConv()) ++failed;
  if (!TestGroupedSingleVariant()) ++failed;
  if (!TestOutputShape()) ++failed;
  if (!TestIdenticalVariantsCollapse()) ++failed;
  if (!TestConvexCombinationOfVariants()) ++failed;
  if (!TestDeterministic()) ++failed;
  if (!TestCheckInputShape()) ++failed;
  if (!TestConstruction()) ++failed;

  if (failed == 0) {
    std::cout << "\nAll adaptive rotated conv tests passed!\n";
    return 0;
  } else {
    std::cout << "\n" << failed << " test(s) failed.\n";
    return 1;
  }
}
