#pragma once

/// @file weight_synthesizer.h
/// @brief Materializes per-sample, per-variant 3x3 weights from the shared
///        kernel bank, the gating values and the rotation angles.

#include <string>

#include "arc/defines.h"

namespace arc {

/// @brief Gradients of a scalar loss w.r.t. the synthesis inputs.
struct SynthesisGradients {
    Tensor5 bank;       ///< (n, Cout, Cin, 3, 3)
    FloatRowMat gating; ///< (B, n)
    FloatRowMat angle;  ///< (B, n)
};

/// @brief Check that bank, gating and angle agree.
/// @return Empty string if consistent, otherwise a description.
std::string CheckSynthesisInputs(const Tensor5 &bank, const FloatRowMat &gating, const FloatRowMat &angle);

/// @brief Rotate and gate every kernel variant for every sample.
///
/// Per (sample b, variant v) the result is
///   gating(b, v) * R(angle(b, v)) applied to the 9 taps of bank[v].
///
/// @param bank   (n, Cout, Cin, 3, 3) shared kernels.
/// @param gating (B, n).
/// @param angle  (B, n) radians.
/// @return (B * n * Cout, Cin, 3, 3), directly usable as the weight of one
///         convolution with B * n * groups groups.
Tensor4 SynthesizeWeights(const Tensor5 &bank, const FloatRowMat &gating, const FloatRowMat &angle);

/// @brief Back-propagate a gradient on the synthesized weights.
/// @param grad_weights dL/d(SynthesizeWeights(...)), (B * n * Cout, Cin, 3, 3).
SynthesisGradients SynthesizeWeightsBackward(const Tensor5 &bank, const FloatRowMat &gating,
                                             const FloatRowMat &angle, const Tensor4 &grad_weights);

} // namespace arc
