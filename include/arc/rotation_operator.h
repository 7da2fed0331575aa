#pragma once

/// @file rotation_operator.h
/// @brief 9x9 operators approximating in-plane rotation of a 3x3 kernel.
///
/// Rotating a 3x3 kernel by theta about its center moves the mass of every
/// tap to (at most) four neighbouring taps with bilinear weights. Flattening
/// the taps in row-major order turns this redistribution into a 9x9 matrix R
/// with rotated[i] = sum_j R(i, j) * kernel[j].
///
/// The matrix entries are fixed symbolic expressions in x = cos(theta),
/// y = sin(theta), a = x - y, b = x * y, c = x + y. There is one template
/// for theta >= 0 and one for theta < 0; both reduce to the identity at
/// theta = 0 and every row sums to 1.

#include "arc/defines.h"

namespace arc {

/// @brief Build rotation operators for a batch of angles.
/// @param angles (B, n) angles in radians.
/// @return (B, n, 9, 9) operators.
///
/// The template choice is an elementwise mask blend
/// mask * positive + (1 - mask) * negative evaluated for all angles at once.
OperatorBatch BuildRotationOperators(const FloatRowMat &angles);

/// @brief d R / d theta for a batch of angles, same layout as
///        BuildRotationOperators.
OperatorBatch BuildRotationOperatorDerivatives(const FloatRowMat &angles);

/// @brief Single 9x9 operator for one angle.
FloatRowMat RotationOperator(float theta);

} // namespace arc
