/// @file rotation_operator.cpp
/// @brief Symbolic rotation templates and their batched evaluation.

#include "arc/rotation_operator.h"

#include <array>
#include <cmath>

namespace arc {

namespace {

/// Coefficients of one template entry over the basis {1, x, y, a, b, c}.
struct Coeff {
    float one, x, y, a, b, c;
};

constexpr int kBasisSize = 6;
constexpr int kEntries = kKernelTaps * kKernelTaps;

constexpr Coeff k0{0, 0, 0, 0, 0, 0};
constexpr Coeff k1{1, 0, 0, 0, 0, 0};
constexpr Coeff kA{0, 0, 0, 1, 0, 0};      // a
constexpr Coeff k1mA{1, 0, 0, -1, 0, 0};   // 1 - a
constexpr Coeff kB{0, 0, 0, 0, 1, 0};      // b
constexpr Coeff kNB{0, 0, 0, 0, -1, 0};    // -b
constexpr Coeff kC{0, 0, 0, 0, 0, 1};      // c
constexpr Coeff k1mC{1, 0, 0, 0, 0, -1};   // 1 - c
constexpr Coeff kXmB{0, 1, 0, 0, -1, 0};   // x - b
constexpr Coeff kYmB{0, 0, 1, 0, -1, 0};   // y - b
constexpr Coeff kXpB{0, 1, 0, 0, 1, 0};    // x + b
constexpr Coeff kBmY{0, 0, -1, 0, 1, 0};   // b - y
constexpr Coeff k1mCpB{1, 0, 0, 0, 1, -1}; // 1 - c + b
constexpr Coeff k1mAmB{1, 0, 0, -1, -1, 0}; // 1 - a - b

using Template = std::array<Coeff, kEntries>;

// clang-format off
// row = destination tap, column = source tap
constexpr Template kPositive = {{
    kA,  k1mA, k0,  k0,   k0,     k0,   k0, k0,   k0,
    k0,  kXmB, kB,  k0,   k1mCpB, kYmB, k0, k0,   k0,
    k0,  k0,   kA,  k0,   k0,     k1mA, k0, k0,   k0,
    kB,  kYmB, k0,  kXmB, k1mCpB, k0,   k0, k0,   k0,
    k0,  k0,   k0,  k0,   k1,     k0,   k0, k0,   k0,
    k0,  k0,   k0,  k0,   k1mCpB, kXmB, k0, kYmB, kB,
    k0,  k0,   k0,  k1mA, k0,     k0,   kA, k0,   k0,
    k0,  k0,   k0,  kYmB, k1mCpB, k0,   kB, kXmB, k0,
    k0,  k0,   k0,  k0,   k0,     k0,   k0, k1mA, kA,
}};

constexpr Template kNegative = {{
    kC,  k0,   k0,  k1mC, k0,     k0,   k0,  k0,   k0,
    kNB, kXpB, k0,  kBmY, k1mAmB, k0,   k0,  k0,   k0,
    k0,  k1mC, kC,  k0,   k0,     k0,   k0,  k0,   k0,
    k0,  k0,   k0,  kXpB, k1mAmB, k0,   kNB, kBmY, k0,
    k0,  k0,   k0,  k0,   k1,     k0,   k0,  k0,   k0,
    k0,  kBmY, kNB, k0,   k1mAmB, kXpB, k0,  k0,   k0,
    k0,  k0,   k0,  k0,   k0,     k0,   kC,  k1mC, k0,
    k0,  k0,   k0,  k0,   k1mAmB, kBmY, k0,  kXpB, kNB,
    k0,  k0,   k0,  k0,   k0,     k1mC, k0,  k0,   kC,
}};
// clang-format on

/// (81 x 6) coefficient matrix of a template.
FloatRowMat TemplateMatrix(const Template &tpl) {
    FloatRowMat m(kEntries, kBasisSize);
    for (int e = 0; e < kEntries; ++e) {
        m.row(e) << tpl[e].one, tpl[e].x, tpl[e].y, tpl[e].a, tpl[e].b, tpl[e].c;
    }
    return m;
}

const FloatRowMat &PositiveMatrix() {
    static const FloatRowMat m = TemplateMatrix(kPositive);
    return m;
}

const FloatRowMat &NegativeMatrix() {
    static const FloatRowMat m = TemplateMatrix(kNegative);
    return m;
}

/// Basis values, or their derivatives w.r.t. theta, one column per angle.
FloatRowMat EvaluateBasis(const FloatRowMat &angles, bool derivative) {
    const Eigen::Index count = angles.size();
    Eigen::Map<const Eigen::RowVectorXf> theta(angles.data(), count);
    const Eigen::ArrayXXf x = theta.array().cos();
    const Eigen::ArrayXXf y = theta.array().sin();
    const Eigen::ArrayXXf a = x - y;
    const Eigen::ArrayXXf c = x + y;

    FloatRowMat basis(kBasisSize, count);
    if (!derivative) {
        basis.row(0).setOnes();
        basis.row(1) = x.matrix();
        basis.row(2) = y.matrix();
        basis.row(3) = a.matrix();
        basis.row(4) = (x * y).matrix();
        basis.row(5) = c.matrix();
    } else {
        // dx = -y, dy = x, da = -c, db = x^2 - y^2, dc = a
        basis.row(0).setZero();
        basis.row(1) = (-y).matrix();
        basis.row(2) = x.matrix();
        basis.row(3) = (-c).matrix();
        basis.row(4) = (x * x - y * y).matrix();
        basis.row(5) = a.matrix();
    }
    return basis;
}

OperatorBatch Evaluate(const FloatRowMat &angles, bool derivative) {
    const Eigen::Index batch = angles.rows();
    const Eigen::Index variants = angles.cols();
    const Eigen::Index count = batch * variants;

    const FloatRowMat basis = EvaluateBasis(angles, derivative);
    Eigen::Map<const Eigen::RowVectorXf> theta(angles.data(), count);
    const Eigen::RowVectorXf mask = (theta.array() >= 0.0f).cast<float>().matrix();
    const Eigen::RowVectorXf inv_mask = Eigen::RowVectorXf::Ones(count) - mask;

    // (81, count): one column of template entries per angle
    FloatRowMat blended = ((PositiveMatrix() * basis).array().rowwise() * mask.array()).matrix();
    blended.array() += (NegativeMatrix() * basis).array().rowwise() * inv_mask.array();

    OperatorBatch result(batch, variants, kKernelTaps, kKernelTaps);
    as_matrix(result.data(), count, kEntries) = blended.transpose();
    return result;
}

} // anonymous namespace

OperatorBatch BuildRotationOperators(const FloatRowMat &angles) {
    return Evaluate(angles, false);
}

OperatorBatch BuildRotationOperatorDerivatives(const FloatRowMat &angles) {
    return Evaluate(angles, true);
}

FloatRowMat RotationOperator(float theta) {
    FloatRowMat angle(1, 1);
    angle(0, 0) = theta;
    const OperatorBatch op = BuildRotationOperators(angle);
    return as_matrix(op.data(), kKernelTaps, kKernelTaps);
}

} // namespace arc
