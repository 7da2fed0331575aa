#include "arc/tensor_ops.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>
#include <vector>

namespace {

constexpr float kEpsilon = 1e-4f;

void FillNormal(float* data, Eigen::Index size, uint32_t seed) {
  std::mt19937 rng(seed);
  std::normal_distribution<float> normal(0.0f, 1.0f);
  for (Eigen::Index i = 0; i < size; ++i) {
    data[i] = normal(rng);
  }
}

/// Direct nested-loop convolution.
arc::Tensor4 ReferenceConv(const arc::Tensor4& x, const arc::Tensor4& w,
                           const arc::Tensor1* bias,
                           const arc::ops::ConvGeometry& g) {
  const int batch = static_cast<int>(x.dimension(0));
  const int h = static_cast<int>(x.dimension(2));
  const int wd = static_cast<int>(x.dimension(3));
  const int cout = static_cast<int>(w.dimension(0));
  const int cg = static_cast<int>(w.dimension(1));
  const int k = static_cast<int>(w.dimension(2));
  const int ho = arc::ops::ConvOutputSize(h, k, g.stride, g.padding, g.dilation);
  const int wo = arc::ops::ConvOutputSize(wd, k, g.stride, g.padding, g.dilation);
  const int out_per_group = cout / g.groups;

  arc::Tensor4 y(batch, cout, ho, wo);
  for (int n = 0; n < batch; ++n) {
    for (int oc = 0; oc < cout; ++oc) {
      const int group = oc / out_per_group;
      for (int oy = 0; oy < ho; ++oy) {
        for (int ox = 0; ox < wo; ++ox) {
          double acc = bias != nullptr ? (*bias)(oc) : 0.0;
          for (int ic = 0; ic < cg; ++ic) {
            for (int ki = 0; ki < k; ++ki) {
              for (int kj = 0; kj < k; ++kj) {
                const int iy = oy * g.stride - g.padding + ki * g.dilation;
                const int ix = ox * g.stride - g.padding + kj * g.dilation;
                if (iy < 0 || iy >= h || ix < 0 || ix >= wd) continue;
                acc += static_cast<double>(w(oc, ic, ki, kj)) *
                       x(n, group * cg + ic, iy, ix);
              }
            }
          }
          y(n, oc, oy, ox) = static_cast<float>(acc);
        }
      }
    }
  }
  return y;
}

// Test 1: output extent formula
bool TestConvOutputSize() {
  std::cout << "TestConvOutputSize: ";

  if (arc::ops::ConvOutputSize(5, 3, 1, 1, 1) != 5 ||
      arc::ops::ConvOutputSize(7, 3, 2, 1, 1) != 4 ||
      arc::ops::ConvOutputSize(9, 3, 1, 2, 2) != 9 ||
      arc::ops::ConvOutputSize(4, 3, 1, 0, 1) != 2) {
    std::cout << "FAILED\n";
    return false;
  }

  std::cout << "OK\n";
  return true;
}

// Test 2: im2col convolution against the direct loops
bool TestConvMatchesReference() {
  std::cout << "TestConvMatchesReference: ";

  struct Case {
    int groups, stride, padding, dilation;
    bool bias;
  };
  const Case cases[] = {
      {1, 1, 1, 1, false}, {2, 1, 1, 1, true}, {1, 2, 1, 1, false},
      {2, 1, 2, 2, false}, {4, 2, 0, 1, true}, {1, 1, 0, 1, true},
  };

  uint32_t seed = 100;
  for (const Case& c : cases) {
    arc::ops::ConvGeometry geom;
    geom.groups = c.groups;
    geom.stride = c.stride;
    geom.padding = c.padding;
    geom.dilation = c.dilation;

    arc::Tensor4 x(2, 4, 7, 6);
    arc::Tensor4 w(8, 4 / c.groups, 3, 3);
    arc::Tensor1 b(8);
    FillNormal(x.data(), x.size(), seed++);
    FillNormal(w.data(), w.size(), seed++);
    FillNormal(b.data(), b.size(), seed++);
    const arc::Tensor1* bias = c.bias ? &b : nullptr;

    const arc::Tensor4 got = arc::ops::Conv2dForward(x, w, bias, geom);
    const arc::Tensor4 expected = ReferenceConv(x, w, bias, geom);
    for (int d = 0; d < 4; ++d) {
      if (got.dimension(d) != expected.dimension(d)) {
        std::cout << "FAILED - shape mismatch on axis " << d << "\n";
        return false;
      }
    }
    float err = 0.0f;
    for (Eigen::Index i = 0; i < got.size(); ++i) {
      err = std::max(err, std::abs(got.data()[i] - expected.data()[i]));
    }
    if (err > kEpsilon) {
      std::cout << "FAILED - groups=" << c.groups << " stride=" << c.stride
                << " padding=" << c.padding << " dilation=" << c.dilation
                << " error " << err << "\n";
      return false;
    }
  }

  std::cout << "OK\n";
  return true;
}

// Test 3: channel LayerNorm gives zero mean, unit variance at every pixel
bool TestChannelLayerNorm() {
  std::cout << "TestChannelLayerNorm: ";

  arc::Tensor4 x(2, 6, 3, 4);
  FillNormal(x.data(), x.size(), 7);
  arc::Tensor1 gamma(6);
  arc::Tensor1 beta(6);
  gamma.setConstant(1.0f);
  beta.setZero();

  const arc::Tensor4 y = arc::ops::ChannelLayerNorm(x, gamma, beta);
  for (int n = 0; n < 2; ++n) {
    for (int i = 0; i < 3; ++i) {
      for (int j = 0; j < 4; ++j) {
        double mean = 0.0;
        double sq = 0.0;
        for (int c = 0; c < 6; ++c) {
          mean += y(n, c, i, j);
          sq += static_cast<double>(y(n, c, i, j)) * y(n, c, i, j);
        }
        mean /= 6.0;
        const double var = sq / 6.0 - mean * mean;
        if (std::abs(mean) > 1e-4 || std::abs(var - 1.0) > 1e-2) {
          std::cout << "FAILED - mean " << mean << " var " << var << "\n";
          return false;
        }
      }
    }
  }

  std::cout << "OK\n";
  return true;
}

// Test 4: BatchNorm with default running statistics is the identity,
// with batch statistics it normalizes each channel
bool TestBatchNorm() {
  std::cout << "TestBatchNorm: ";

  arc::Tensor4 x(3, 2, 4, 4);
  FillNormal(x.data(), x.size(), 8);
  arc::Tensor1 gamma(2), beta(2), mean(2), var(2);
  gamma.setConstant(1.0f);
  beta.setZero();
  mean.setZero();
  var.setConstant(1.0f);

  const arc::Tensor4 eval =
      arc::ops::BatchNorm2dForward(x, gamma, beta, mean, var, false, 0.0f);
  for (Eigen::Index i = 0; i < x.size(); ++i) {
    if (std::abs(eval.data()[i] - x.data()[i]) > kEpsilon) {
      std::cout << "FAILED - eval mode changed the input\n";
      return false;
    }
  }

  const arc::Tensor4 train =
      arc::ops::BatchNorm2dForward(x, gamma, beta, mean, var, true);
  for (int c = 0; c < 2; ++c) {
    double sum = 0.0;
    for (int n = 0; n < 3; ++n) {
      for (int i = 0; i < 4; ++i) {
        for (int j = 0; j < 4; ++j) {
          sum += train(n, c, i, j);
        }
      }
    }
    if (std::abs(sum / 48.0) > 1e-4) {
      std::cout << "FAILED - channel " << c << " mean " << sum / 48.0 << "\n";
      return false;
    }
  }

  std::cout << "OK\n";
  return true;
}

// Test 5: softmax over the middle axis sums to one along that axis
bool TestSoftmaxMiddleAxis() {
  std::cout << "TestSoftmaxMiddleAxis: ";

  const int outer = 2, axis = 3, inner = 4;
  std::vector<float> data(outer * axis * inner);
  FillNormal(data.data(), static_cast<Eigen::Index>(data.size()), 9);
  data[5] = 80.0f;  // large logit must not overflow

  arc::ops::SoftmaxMiddleAxis(data.data(), outer, axis, inner);
  for (int o = 0; o < outer; ++o) {
    for (int i = 0; i < inner; ++i) {
      float sum = 0.0f;
      for (int a = 0; a < axis; ++a) {
        const float v = data[(o * axis + a) * inner + i];
        if (!(v >= 0.0f && v <= 1.0f)) {
          std::cout << "FAILED - probability " << v << "\n";
          return false;
        }
        sum += v;
      }
      if (std::abs(sum - 1.0f) > 1e-5f) {
        std::cout << "FAILED - sum " << sum << "\n";
        return false;
      }
    }
  }

  std::cout << "OK\n";
  return true;
}

// Test 6: pooling, activations, dropout and linear projection
bool TestPointwiseAndDense() {
  std::cout << "TestPointwiseAndDense: ";

  arc::Tensor4 x(1, 2, 2, 2);
  x.setValues({{{{1.0f, 2.0f}, {3.0f, 4.0f}}, {{-1.0f, -1.0f}, {1.0f, 1.0f}}}});
  const arc::Tensor4 pooled = arc::ops::GlobalAvgPool(x);
  if (std::abs(pooled(0, 0, 0, 0) - 2.5f) > kEpsilon ||
      std::abs(pooled(0, 1, 0, 0)) > kEpsilon) {
    std::cout << "FAILED - GlobalAvgPool\n";
    return false;
  }

  arc::ops::ReluInPlace(&x);
  if (x(0, 1, 0, 0) != 0.0f || x(0, 0, 1, 1) != 4.0f) {
    std::cout << "FAILED - ReluInPlace\n";
    return false;
  }

  arc::FloatRowMat m(1, 3);
  m << 0.0f, 1.0f, -3.0f;
  arc::FloatRowMat s = m;
  arc::ops::SigmoidInPlace(&s);
  arc::ops::SoftsignInPlace(&m);
  if (std::abs(s(0, 0) - 0.5f) > kEpsilon ||
      std::abs(s(0, 1) - 1.0f / (1.0f + std::exp(-1.0f))) > kEpsilon ||
      std::abs(m(0, 1) - 0.5f) > kEpsilon ||
      std::abs(m(0, 2) + 0.75f) > kEpsilon) {
    std::cout << "FAILED - sigmoid/softsign\n";
    return false;
  }

  std::mt19937 rng(3);
  arc::FloatRowMat ones = arc::FloatRowMat::Ones(4, 50);
  arc::ops::DropoutInPlace(&ones, 0.0f, &rng);
  if (ones.sum() != 200.0f) {
    std::cout << "FAILED - dropout with p=0 changed values\n";
    return false;
  }
  arc::ops::DropoutInPlace(&ones, 0.5f, &rng);
  for (Eigen::Index i = 0; i < ones.size(); ++i) {
    const float v = ones.data()[i];
    if (v != 0.0f && std::abs(v - 2.0f) > kEpsilon) {
      std::cout << "FAILED - dropout survivor not rescaled: " << v << "\n";
      return false;
    }
  }

  arc::Tensor2 weight(2, 3);
  weight.setValues({{1.0f, 0.0f, 2.0f}, {0.0f, -1.0f, 1.0f}});
  arc::Tensor1 bias(2);
  bias.setValues({0.5f, -0.5f});
  arc::FloatRowMat in(1, 3);
  in << 1.0f, 2.0f, 3.0f;
  const arc::FloatRowMat out = arc::ops::LinearForward(in, weight, &bias);
  if (std::abs(out(0, 0) - 7.5f) > kEpsilon ||
      std::abs(out(0, 1) - 0.5f) > kEpsilon) {
    std::cout << "FAILED - LinearForward gave " << out << "\n";
    return false;
  }

  std::cout << "OK\n";
  return true;
}

}  // namespace

int main() {
  int failed = 0;

  if (!TestConvOutputSize()) ++failed;
  if (!TestConvMatchesReference()) ++failed;
  if (!TestChannelLayerNorm()) ++failed;
  if (!TestBatchNorm()) ++failed;
  if (!TestSoftmaxMiddleAxis()) ++failed;
  if (!TestPointwiseAndDense()) ++failed;

  if (failed == 0) {
    std::cout << "\nAll tensor op tests passed!\n";
    return 0;
  } else {
    std::cout << "\n" << failed << " test(s) failed.\n";
    return 1;
  }
}
