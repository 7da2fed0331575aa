/// @file conv3x3.cpp
/// @brief StandardConv3x3.

#include "arc/conv3x3.h"

namespace arc {

namespace {

ops::ConvGeometry GeometryOf(const ArcConvConfig &config) {
    const std::string err = config.Validate();
    CHECK(err.empty()) << "Shape mismatch: " << err;
    ops::ConvGeometry geom;
    geom.stride = config.stride;
    geom.padding = config.padding;
    geom.dilation = config.dilation;
    geom.groups = config.groups;
    return geom;
}

} // namespace

StandardConv3x3::StandardConv3x3(const ArcConvConfig &config)
    : rng_(config.seed),
      conv_(config.in_channels, config.out_channels, kKernelSize, GeometryOf(config), /*bias=*/false, rng_) {}

std::string StandardConv3x3::toString() const {
    const auto &geom = conv_.Geometry();
    std::string s = fmt::format("{}, {}, kernel_size=(3, 3), stride=({}, {})", conv_.InChannels(),
                                conv_.OutChannels(), geom.stride, geom.stride);
    if (geom.padding != 0) {
        s += fmt::format(", padding=({}, {})", geom.padding, geom.padding);
    }
    if (geom.dilation != 1) {
        s += fmt::format(", dilation=({}, {})", geom.dilation, geom.dilation);
    }
    if (geom.groups != 1) {
        s += fmt::format(", groups={}", geom.groups);
    }
    return s + ", bias=False";
}

} // namespace arc
