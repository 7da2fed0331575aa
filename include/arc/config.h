#pragma once

#include <algorithm>
#include <cstdint>
#include <string>

#include <fmt/core.h>

#include "arc/defines.h"

namespace arc {

struct RoutingConfig {
    float dropout_rate = kDefaultDropoutRate; // dropout before both projections
    float proportion = kDefaultProportionDeg; // angle bound Amax, in degrees

    /// Angle bound in radians.
    float max_angle() const { return proportion / 180.0f * static_cast<float>(kPi); }

    std::string toString() const {
        return fmt::format("dropout_rate={}, proportion={}", dropout_rate, proportion);
    }
};

struct ArcConvConfig {
    int in_channels = 0;
    int out_channels = 0;
    int kernel_size = kKernelSize; // only 3 is supported
    int stride = 1;
    int padding = 1;
    int dilation = 1;
    int groups = 1;
    int kernel_number = 1;
    uint32_t seed = 42; // parameter initialization seed

    /// Attention bottleneck width: max(Cout / 16, 32).
    int attention_channels() const {
        return std::max(out_channels / kAttentionReduction, kAttentionMinChannels);
    }

    /// @brief Check construction-time consistency.
    /// @return Empty string if valid, otherwise a shape mismatch description.
    std::string Validate() const {
        if (kernel_number < 1) {
            return fmt::format("kernel_number must be >= 1, got {}", kernel_number);
        }
        if (kernel_size != kKernelSize) {
            return fmt::format("kernel_size must be {}, got {}", kKernelSize, kernel_size);
        }
        if (in_channels <= 0 || out_channels <= 0) {
            return fmt::format("channels must be positive, got in={} out={}", in_channels, out_channels);
        }
        if (groups <= 0) {
            return fmt::format("groups must be positive, got {}", groups);
        }
        if (in_channels % groups != 0) {
            return fmt::format("in_channels {} not divisible by groups {}", in_channels, groups);
        }
        if (out_channels % groups != 0) {
            return fmt::format("out_channels {} not divisible by groups {}", out_channels, groups);
        }
        if (stride <= 0 || dilation <= 0 || padding < 0) {
            return fmt::format("invalid geometry stride={} padding={} dilation={}", stride, padding, dilation);
        }
        return "";
    }

    /// Same layout as the reference layer description.
    std::string toString() const {
        std::string s = fmt::format("{}, {}, kernel_number={}, kernel_size={}, stride={}, bias=False",
                                    in_channels, out_channels, kernel_number, kernel_size, stride);
        if (padding != 0) {
            s += fmt::format(", padding={}", padding);
        }
        if (dilation != 1) {
            s += fmt::format(", dilation={}", dilation);
        }
        if (groups != 1) {
            s += fmt::format(", groups={}", groups);
        }
        return s;
    }
};

} // namespace arc
