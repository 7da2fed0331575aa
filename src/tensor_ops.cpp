/// @file tensor_ops.cpp
/// @brief Numeric kernels: grouped convolution, normalization, activations.

#include "arc/tensor_ops.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

#ifdef ARC_USE_OPENMP
#include <omp.h>
#endif

namespace arc {
namespace ops {

namespace {

/// @brief Unfold one group of one sample into a (Cg*kh*kw, Ho*Wo) matrix.
void Im2Col(const float* src, Eigen::Index channels, Eigen::Index height,
            Eigen::Index width, Eigen::Index kh, Eigen::Index kw,
            const ConvGeometry& geom, Eigen::Index out_h, Eigen::Index out_w,
            float* cols) {
  const Eigen::Index plane = out_h * out_w;
  for (Eigen::Index c = 0; c < channels; ++c) {
    const float* channel = src + c * height * width;
    for (Eigen::Index ki = 0; ki < kh; ++ki) {
      for (Eigen::Index kj = 0; kj < kw; ++kj) {
        float* row = cols + ((c * kh + ki) * kw + kj) * plane;
        for (Eigen::Index oy = 0; oy < out_h; ++oy) {
          const Eigen::Index iy =
              oy * geom.stride - geom.padding + ki * geom.dilation;
          for (Eigen::Index ox = 0; ox < out_w; ++ox) {
            const Eigen::Index ix =
                ox * geom.stride - geom.padding + kj * geom.dilation;
            const bool inside =
                iy >= 0 && iy < height && ix >= 0 && ix < width;
            row[oy * out_w + ox] = inside ? channel[iy * width + ix] : 0.0f;
          }
        }
      }
    }
  }
}

}  // anonymous namespace

int ConvOutputSize(int in, int kernel, int stride, int padding, int dilation) {
  const int span = in + 2 * padding - dilation * (kernel - 1) - 1;
  if (span < 0) return 0;  // kernel does not fit
  return span / stride + 1;
}

Tensor4 Conv2dForward(const Tensor4& input, const Tensor4& weight,
                      const Tensor1* bias, const ConvGeometry& geom) {
  const Eigen::Index batch = input.dimension(0);
  const Eigen::Index channels = input.dimension(1);
  const Eigen::Index height = input.dimension(2);
  const Eigen::Index width = input.dimension(3);

  const Eigen::Index out_channels = weight.dimension(0);
  const Eigen::Index group_in = weight.dimension(1);
  const Eigen::Index kh = weight.dimension(2);
  const Eigen::Index kw = weight.dimension(3);

  CHECK_GT(geom.groups, 0);
  CHECK_GT(geom.stride, 0);
  CHECK_EQ(channels, group_in * geom.groups)
      << fmt::format("Shape mismatch: input has {} channels, weight expects {} x {} groups",
                     channels, group_in, geom.groups);
  CHECK_EQ(out_channels % geom.groups, 0)
      << fmt::format("Shape mismatch: {} output channels not divisible by {} groups",
                     out_channels, geom.groups);
  if (bias != nullptr) {
    CHECK_EQ(bias->dimension(0), out_channels) << "Bias size mismatch";
  }

  const int out_h = ConvOutputSize(static_cast<int>(height), static_cast<int>(kh),
                                   geom.stride, geom.padding, geom.dilation);
  const int out_w = ConvOutputSize(static_cast<int>(width), static_cast<int>(kw),
                                   geom.stride, geom.padding, geom.dilation);
  CHECK(out_h > 0 && out_w > 0)
      << fmt::format("Empty convolution output for input {}x{}", height, width);

  const Eigen::Index group_out = out_channels / geom.groups;
  const Eigen::Index patch = group_in * kh * kw;
  const Eigen::Index plane = static_cast<Eigen::Index>(out_h) * out_w;

  Tensor4 output(batch, out_channels, out_h, out_w);
  const Eigen::Index tasks = batch * geom.groups;

#ifdef ARC_USE_OPENMP
  #pragma omp parallel for schedule(static)
#endif
  for (Eigen::Index t = 0; t < tasks; ++t) {
    const Eigen::Index n = t / geom.groups;
    const Eigen::Index g = t % geom.groups;

    FloatRowMat cols(patch, plane);
    Im2Col(input.data() + (n * channels + g * group_in) * height * width,
           group_in, height, width, kh, kw, geom, out_h, out_w, cols.data());

    auto w = as_matrix(weight.data() + g * group_out * patch, group_out, patch);
    auto out = as_matrix(output.data() + (n * out_channels + g * group_out) * plane,
                         group_out, plane);
    out.noalias() = w * cols;

    if (bias != nullptr) {
      for (Eigen::Index oc = 0; oc < group_out; ++oc) {
        out.row(oc).array() += (*bias)(g * group_out + oc);
      }
    }
  }
  return output;
}

Tensor4 ChannelLayerNorm(const Tensor4& x, const Tensor1& gamma,
                         const Tensor1& beta, float eps) {
  const Eigen::Index batch = x.dimension(0);
  const Eigen::Index channels = x.dimension(1);
  const Eigen::Index plane = x.dimension(2) * x.dimension(3);
  CHECK_EQ(gamma.dimension(0), channels) << "LayerNorm weight size mismatch";
  CHECK_EQ(beta.dimension(0), channels) << "LayerNorm bias size mismatch";

  Tensor4 y(x.dimensions());
  for (Eigen::Index n = 0; n < batch; ++n) {
    // (C, HW) view: statistics per column
    auto in = as_matrix(x.data() + n * channels * plane, channels, plane);
    auto out = as_matrix(y.data() + n * channels * plane, channels, plane);
    const Eigen::RowVectorXf mean = in.colwise().mean();
    const Eigen::RowVectorXf var =
        (in.rowwise() - mean).array().square().colwise().mean().matrix();
    const Eigen::RowVectorXf inv_std = (var.array() + eps).rsqrt().matrix();
    for (Eigen::Index c = 0; c < channels; ++c) {
      out.row(c) = ((in.row(c) - mean).array() * inv_std.array() * gamma(c) +
                    beta(c)).matrix();
    }
  }
  return y;
}

Tensor4 BatchNorm2dForward(const Tensor4& x, const Tensor1& gamma,
                           const Tensor1& beta, const Tensor1& running_mean,
                           const Tensor1& running_var, bool use_batch_stats,
                           float eps) {
  const Eigen::Index batch = x.dimension(0);
  const Eigen::Index channels = x.dimension(1);
  const Eigen::Index plane = x.dimension(2) * x.dimension(3);
  CHECK_EQ(gamma.dimension(0), channels) << "BatchNorm weight size mismatch";

  std::vector<double> mean(channels, 0.0);
  std::vector<double> var(channels, 0.0);
  if (use_batch_stats) {
    const double count = static_cast<double>(batch * plane);
    for (Eigen::Index n = 0; n < batch; ++n) {
      for (Eigen::Index c = 0; c < channels; ++c) {
        const float* p = x.data() + (n * channels + c) * plane;
        for (Eigen::Index i = 0; i < plane; ++i) {
          mean[c] += p[i];
        }
      }
    }
    for (auto& m : mean) m /= count;
    for (Eigen::Index n = 0; n < batch; ++n) {
      for (Eigen::Index c = 0; c < channels; ++c) {
        const float* p = x.data() + (n * channels + c) * plane;
        for (Eigen::Index i = 0; i < plane; ++i) {
          const double d = p[i] - mean[c];
          var[c] += d * d;
        }
      }
    }
    for (auto& v : var) v /= count;
  } else {
    for (Eigen::Index c = 0; c < channels; ++c) {
      mean[c] = running_mean(c);
      var[c] = running_var(c);
    }
  }

  Tensor4 y(x.dimensions());
  for (Eigen::Index n = 0; n < batch; ++n) {
    for (Eigen::Index c = 0; c < channels; ++c) {
      const float scale =
          gamma(c) / static_cast<float>(std::sqrt(var[c] + eps));
      const float shift = beta(c) - static_cast<float>(mean[c]) * scale;
      const float* src = x.data() + (n * channels + c) * plane;
      float* dst = y.data() + (n * channels + c) * plane;
      for (Eigen::Index i = 0; i < plane; ++i) {
        dst[i] = src[i] * scale + shift;
      }
    }
  }
  return y;
}

void SigmoidInPlace(FloatRowMat* x) {
  x->array() = (1.0f + (-x->array()).exp()).inverse();
}

void SoftsignInPlace(FloatRowMat* x) {
  x->array() = x->array() / (1.0f + x->array().abs());
}

void SoftmaxMiddleAxis(float* data, Eigen::Index outer, Eigen::Index axis,
                       Eigen::Index inner) {
  for (Eigen::Index o = 0; o < outer; ++o) {
    float* base = data + o * axis * inner;
    for (Eigen::Index i = 0; i < inner; ++i) {
      float max_val = -std::numeric_limits<float>::infinity();
      for (Eigen::Index a = 0; a < axis; ++a) {
        max_val = std::max(max_val, base[a * inner + i]);
      }
      float sum = 0.0f;
      for (Eigen::Index a = 0; a < axis; ++a) {
        float& v = base[a * inner + i];
        v = std::exp(v - max_val);
        sum += v;
      }
      const float inv = 1.0f / sum;
      for (Eigen::Index a = 0; a < axis; ++a) {
        base[a * inner + i] *= inv;
      }
    }
  }
}

Tensor4 GlobalAvgPool(const Tensor4& x) {
  const Eigen::Index rows = x.dimension(0) * x.dimension(1);
  const Eigen::Index plane = x.dimension(2) * x.dimension(3);
  Tensor4 pooled(x.dimension(0), x.dimension(1), 1, 1);
  as_matrix(pooled.data(), rows, 1) =
      as_matrix(x.data(), rows, plane).rowwise().mean();
  return pooled;
}

void DropoutInPlace(FloatRowMat* x, float p, std::mt19937* rng) {
  if (p <= 0.0f) {
    return;
  }
  if (p >= 1.0f) {
    x->setZero();
    return;
  }
  std::bernoulli_distribution keep(1.0 - p);
  const float scale = 1.0f / (1.0f - p);
  float* data = x->data();
  for (Eigen::Index i = 0; i < x->size(); ++i) {
    data[i] = keep(*rng) ? data[i] * scale : 0.0f;
  }
}

FloatRowMat LinearForward(const FloatRowMat& x, const Tensor2& weight,
                          const Tensor1* bias) {
  const Eigen::Index out_features = weight.dimension(0);
  const Eigen::Index in_features = weight.dimension(1);
  CHECK_EQ(x.cols(), in_features)
      << fmt::format("Linear expects {} features, got {}", in_features, x.cols());

  FloatRowMat y = x * as_matrix(weight.data(), out_features, in_features).transpose();
  if (bias != nullptr) {
    CHECK_EQ(bias->dimension(0), out_features) << "Linear bias size mismatch";
    y.rowwise() += Eigen::Map<const FloatVec>(bias->data(), out_features);
  }
  return y;
}

}  // namespace ops
}  // namespace arc
