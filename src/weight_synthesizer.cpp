/// @file weight_synthesizer.cpp
/// @brief Batched rotation + gating of the kernel bank.

#include "arc/weight_synthesizer.h"

#include <algorithm>
#include <string>

#include "arc/rotation_operator.h"

namespace arc {

std::string CheckSynthesisInputs(const Tensor5 &bank, const FloatRowMat &gating, const FloatRowMat &angle) {
    if (bank.dimension(3) != kKernelSize || bank.dimension(4) != kKernelSize) {
        return fmt::format("kernel bank must hold 3x3 kernels, got {}x{}", bank.dimension(3), bank.dimension(4));
    }
    if (gating.rows() != angle.rows() || gating.cols() != angle.cols()) {
        return fmt::format("gating {}x{} and angle {}x{} differ in shape", gating.rows(), gating.cols(),
                           angle.rows(), angle.cols());
    }
    if (gating.cols() != bank.dimension(0)) {
        return fmt::format("routing signal has {} variants, kernel bank has {}", gating.cols(), bank.dimension(0));
    }
    return "";
}

Tensor4 SynthesizeWeights(const Tensor5 &bank, const FloatRowMat &gating, const FloatRowMat &angle) {
    const std::string err = CheckSynthesisInputs(bank, gating, angle);
    CHECK(err.empty()) << "Shape mismatch: " << err;

    const Eigen::Index batch = gating.rows();
    const Eigen::Index n = bank.dimension(0);
    const Eigen::Index cout = bank.dimension(1);
    const Eigen::Index cin = bank.dimension(2);
    const Eigen::Index oc = cout * cin;

    // Stage 1: rotation operators [B, n, 9, 9]
    OperatorBatch rot = BuildRotationOperators(angle);

    // Stage 2: gate each operator by its scalar (gating is row-major [B, n])
    for (Eigen::Index bv = 0; bv < batch * n; ++bv) {
        as_matrix(rot.data() + bv * kKernelTaps * kKernelTaps, kKernelTaps, kKernelTaps) *= gating.data()[bv];
    }

    // Stage 3: [B, n, 9, 9] -> [B, 9, n, 9] -> [B*9, n*9]
    Tensor4 gated = rot.shuffle(Eigen::array<int, 4>{{0, 2, 1, 3}});
    auto gated_flat = as_matrix(gated.data(), batch * kKernelTaps, n * kKernelTaps);

    // Stage 4: [n, Cout, Cin, 3, 3] -> [n, 3, 3, Cout, Cin] -> [n*9, Cout*Cin]
    Tensor5 bank_perm = bank.shuffle(Eigen::array<int, 5>{{0, 3, 4, 1, 2}});
    auto bank_flat = as_matrix(bank_perm.data(), n * kKernelTaps, oc);

    // Stage 5: per-variant products, stacked as [B*9, n, Cout*Cin].
    // A single [B*9, n*9] x [n*9, Cout*Cin] product would sum over variants.
    FloatTensor<3> stacked(batch * kKernelTaps, n, oc);
    for (Eigen::Index i = 0; i < n; ++i) {
        const FloatRowMat prod =
            gated_flat.middleCols(i * kKernelTaps, kKernelTaps) * bank_flat.middleRows(i * kKernelTaps, kKernelTaps);
        for (Eigen::Index r = 0; r < prod.rows(); ++r) {
            std::copy(prod.row(r).data(), prod.row(r).data() + oc, stacked.data() + (r * n + i) * oc);
        }
    }

    // Stage 6: [B, 3, 3, n, Cout, Cin] -> [B, n, Cout, Cin, 3, 3] -> [B*n*Cout, Cin, 3, 3]
    Eigen::TensorMap<FloatTensor<6>> view(stacked.data(), batch, kKernelSize, kKernelSize, n, cout, cin);
    FloatTensor<6> permuted = view.shuffle(Eigen::array<int, 6>{{0, 3, 4, 5, 1, 2}});
    Tensor4 weights = permuted.reshape(
        Eigen::array<Eigen::Index, 4>{{batch * n * cout, cin, kKernelSize, kKernelSize}});

    VLOG(1) << fmt::format("synthesized weights [{}, {}, 3, 3] from {} samples x {} variants",
                           weights.dimension(0), weights.dimension(1), batch, n);
    return weights;
}

SynthesisGradients SynthesizeWeightsBackward(const Tensor5 &bank, const FloatRowMat &gating,
                                             const FloatRowMat &angle, const Tensor4 &grad_weights) {
    const std::string err = CheckSynthesisInputs(bank, gating, angle);
    CHECK(err.empty()) << "Shape mismatch: " << err;

    const Eigen::Index batch = gating.rows();
    const Eigen::Index n = bank.dimension(0);
    const Eigen::Index cout = bank.dimension(1);
    const Eigen::Index cin = bank.dimension(2);
    const Eigen::Index oc = cout * cin;
    CHECK_EQ(grad_weights.dimension(0), batch * n * cout);
    CHECK_EQ(grad_weights.dimension(1), cin);

    const OperatorBatch rot = BuildRotationOperators(angle);
    const OperatorBatch drot = BuildRotationOperatorDerivatives(angle);

    SynthesisGradients grads;
    grads.bank.resize(bank.dimensions());
    grads.bank.setZero();
    grads.gating.resize(batch, n);
    grads.angle.resize(batch, n);

    constexpr Eigen::Index kOpSize = kKernelTaps * kKernelTaps;
    for (Eigen::Index b = 0; b < batch; ++b) {
        for (Eigen::Index v = 0; v < n; ++v) {
            const Eigen::Index bv = b * n + v;
            const float gate = gating(b, v);
            // Each [Cout, Cin, 3, 3] slice viewed as [Cout*Cin, 9]; Y = gate * W * R^T
            auto r = as_matrix(rot.data() + bv * kOpSize, kKernelTaps, kKernelTaps);
            auto dr = as_matrix(drot.data() + bv * kOpSize, kKernelTaps, kKernelTaps);
            auto w = as_matrix(bank.data() + v * oc * kKernelTaps, oc, kKernelTaps);
            auto dy = as_matrix(grad_weights.data() + bv * oc * kKernelTaps, oc, kKernelTaps);
            auto dw = as_matrix(grads.bank.data() + v * oc * kKernelTaps, oc, kKernelTaps);

            dw.noalias() += gate * (dy * r);
            const FloatRowMat rotated = w * r.transpose();
            grads.gating(b, v) = (dy.array() * rotated.array()).sum();
            const FloatRowMat d_op = dy.transpose() * w;
            grads.angle(b, v) = gate * (d_op.array() * dr.array()).sum();
        }
    }
    return grads;
}

} // namespace arc
