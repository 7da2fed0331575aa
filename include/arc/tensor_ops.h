#pragma once

/// @file tensor_ops.h
/// @brief Numeric kernels the convolution modules are built on.
///
/// Provides:
/// - Grouped 2-D convolution (stride / padding / dilation) via im2col + GEMM
/// - Channel LayerNorm and BatchNorm over NCHW feature maps
/// - Pointwise activations, softmax over an axis, global average pooling
/// - Dropout and dense linear projection
///
/// Feature maps are row-major NCHW. Shape inconsistencies are fatal.

#include <cstdint>
#include <random>

#include "arc/defines.h"

namespace arc {
namespace ops {

// ============================================================================
// Convolution
// ============================================================================

/// @brief Convolution hyper-parameters shared by both spatial axes.
struct ConvGeometry {
  int stride = 1;
  int padding = 0;
  int dilation = 1;
  int groups = 1;
};

/// @brief Standard convolution output extent:
///        floor((in + 2*padding - dilation*(kernel-1) - 1) / stride) + 1.
int ConvOutputSize(int in, int kernel, int stride, int padding, int dilation);

/// @brief Grouped 2-D convolution.
/// @param input  (N, C, H, W).
/// @param weight (Cout, C / groups, kh, kw).
/// @param bias   Optional (Cout).
/// @param geom   Stride, padding, dilation and group count.
/// @return (N, Cout, H', W').
Tensor4 Conv2dForward(const Tensor4& input, const Tensor4& weight,
                      const Tensor1* bias, const ConvGeometry& geom);

// ============================================================================
// Normalization
// ============================================================================

/// @brief LayerNorm over the channel axis, independently at every (n, h, w).
Tensor4 ChannelLayerNorm(const Tensor4& x, const Tensor1& gamma,
                         const Tensor1& beta, float eps = kNormEps);

/// @brief BatchNorm over (N, H, W) per channel.
/// @param use_batch_stats If true normalize with the statistics of @p x,
///        otherwise with the running statistics.
Tensor4 BatchNorm2dForward(const Tensor4& x, const Tensor1& gamma,
                           const Tensor1& beta, const Tensor1& running_mean,
                           const Tensor1& running_var, bool use_batch_stats,
                           float eps = kNormEps);

// ============================================================================
// Activations / pooling
// ============================================================================

template <int Rank>
void ReluInPlace(FloatTensor<Rank>* x) {
  float* p = x->data();
  for (Eigen::Index i = 0; i < x->size(); ++i) {
    p[i] = p[i] > 0.0f ? p[i] : 0.0f;
  }
}

void SigmoidInPlace(FloatRowMat* x);

/// x / (1 + |x|)
void SoftsignInPlace(FloatRowMat* x);

/// @brief Softmax of a buffer viewed as (outer, axis, inner), over the
///        middle axis.
void SoftmaxMiddleAxis(float* data, Eigen::Index outer, Eigen::Index axis,
                       Eigen::Index inner);

/// @brief Spatial mean, (N, C, H, W) -> (N, C, 1, 1).
Tensor4 GlobalAvgPool(const Tensor4& x);

// ============================================================================
// Dense
// ============================================================================

/// @brief Inverted dropout: zero with probability @p p, scale survivors
///        by 1 / (1 - p).
void DropoutInPlace(FloatRowMat* x, float p, std::mt19937* rng);

/// @brief y = x * W^T (+ b).
/// @param x      (N, in).
/// @param weight (out, in).
/// @param bias   Optional (out).
FloatRowMat LinearForward(const FloatRowMat& x, const Tensor2& weight,
                          const Tensor1* bias);

}  // namespace ops
}  // namespace arc
