#pragma once

/// @file initializer.h
/// @brief Parameter initialization policies for the convolution modules.
///
/// Fan computation follows the usual deep-learning convention:
/// fan_in = size(1) * receptive, fan_out = size(0) * receptive, where
/// receptive is the product of all dims after the first two.

#include <cmath>
#include <random>
#include <utility>

#include <glog/logging.h>

#include "arc/defines.h"

namespace arc {

/// @brief (fan_in, fan_out) of a parameter tensor.
template <int Rank>
std::pair<Eigen::Index, Eigen::Index> compute_fans(const FloatTensor<Rank> &t) {
    static_assert(Rank >= 2, "fan computation needs at least 2 dims");
    Eigen::Index receptive = 1;
    for (int i = 2; i < Rank; ++i) {
        receptive *= t.dimension(i);
    }
    return {t.dimension(1) * receptive, t.dimension(0) * receptive};
}

/// @brief Normal(0, std) samples truncated to [lo, hi] by rejection.
template <int Rank>
void trunc_normal(FloatTensor<Rank> &t, float std, std::mt19937 &rng, float lo = -2.0f, float hi = 2.0f) {
    CHECK_LT(lo, hi);
    std::normal_distribution<float> normal(0.0f, std);
    float *p = t.data();
    for (Eigen::Index i = 0; i < t.size(); ++i) {
        float v = normal(rng);
        while (v < lo || v > hi) {
            v = normal(rng);
        }
        p[i] = v;
    }
}

/// @brief He initialization, mode fan_out, ReLU gain sqrt(2).
template <int Rank>
void kaiming_normal_fan_out(FloatTensor<Rank> &t, std::mt19937 &rng) {
    const auto fan_out = compute_fans(t).second;
    CHECK_GT(fan_out, 0);
    const float std = std::sqrt(2.0f) / std::sqrt(static_cast<float>(fan_out));
    std::normal_distribution<float> normal(0.0f, std);
    float *p = t.data();
    for (Eigen::Index i = 0; i < t.size(); ++i) {
        p[i] = normal(rng);
    }
}

/// @brief U(-1/sqrt(fan_in), 1/sqrt(fan_in)), the default for conv and
///        linear weights and biases.
template <int Rank>
void uniform_fan_in(FloatTensor<Rank> &t, Eigen::Index fan_in, std::mt19937 &rng) {
    CHECK_GT(fan_in, 0);
    const float bound = 1.0f / std::sqrt(static_cast<float>(fan_in));
    std::uniform_real_distribution<float> uniform(-bound, bound);
    float *p = t.data();
    for (Eigen::Index i = 0; i < t.size(); ++i) {
        p[i] = uniform(rng);
    }
}

} // namespace arc
