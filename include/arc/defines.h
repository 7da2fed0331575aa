#pragma once
#define EIGEN_DONT_PARALLELIZE

#include <stdint.h>

#include <Eigen/Dense>
#include <Eigen/Core>
#include <unsupported/Eigen/CXX11/Tensor>

#include <glog/logging.h>
#include <gflags/gflags.h>
#include <fmt/core.h>

namespace arc {

constexpr double kPi = 3.14159265358979323846;
constexpr int kKernelSize = 3;
constexpr int kKernelTaps = kKernelSize * kKernelSize; // flattened 3x3 tap space
constexpr float kDefaultProportionDeg = 40.0f;         // default angle bound, degrees
constexpr float kDefaultDropoutRate = 0.2f;
constexpr int kAttentionReduction = 16;
constexpr int kAttentionMinChannels = 32;
constexpr float kNormEps = 1e-5f;

using FloatRowMat = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using FloatVec = Eigen::Matrix<float, 1, Eigen::Dynamic>;

/// Dense row-major float tensor. Feature maps are NCHW.
template <int Rank>
using FloatTensor = Eigen::Tensor<float, Rank, Eigen::RowMajor>;

using Tensor1 = FloatTensor<1>;
using Tensor2 = FloatTensor<2>;
using Tensor4 = FloatTensor<4>; // (N, C, H, W) or (Cout, Cin, kh, kw)
using Tensor5 = FloatTensor<5>; // kernel bank (n, Cout, Cin, kh, kw)

/// Per-(sample, kernel variant) 9x9 operators, shape (B, n, 9, 9).
using OperatorBatch = FloatTensor<4>;

/// Row-major view of a contiguous float buffer as a (rows x cols) matrix.
inline Eigen::Map<FloatRowMat> as_matrix(float *data, Eigen::Index rows, Eigen::Index cols) {
    return Eigen::Map<FloatRowMat>(data, rows, cols);
}

inline Eigen::Map<const FloatRowMat> as_matrix(const float *data, Eigen::Index rows, Eigen::Index cols) {
    return Eigen::Map<const FloatRowMat>(data, rows, cols);
}

enum class ConvKind {
    Standard, // plain 3x3 convolution
    Adaptive, // adaptive rotated convolution
};

} // namespace arc
