/// @file arc_bindings.cpp
/// @brief Python bindings for the adaptive rotated convolution using pybind11.
///
/// Wraps the config structs, the routing function and the convolution
/// modules. Feature maps cross the boundary as float32 NCHW numpy arrays,
/// routing signals as (B, n) matrices via pybind11/eigen.h.

#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "arc/adaptive_rotated_conv.h"
#include "arc/config.h"
#include "arc/conv_plan.h"
#include "arc/defines.h"
#include "arc/rotation_operator.h"
#include "arc/weight_synthesizer.h"

namespace py = pybind11;
using namespace arc;

namespace {

using FloatArray = py::array_t<float, py::array::c_style | py::array::forcecast>;

template <int Rank>
FloatTensor<Rank> ToTensor(const FloatArray &array, const char *name) {
    py::buffer_info buf = array.request();
    if (buf.ndim != Rank) {
        throw std::runtime_error(fmt::format("{} must be {}-D, got {}-D", name, Rank, buf.ndim));
    }
    Eigen::array<Eigen::Index, Rank> dims;
    for (int i = 0; i < Rank; ++i) {
        dims[i] = static_cast<Eigen::Index>(buf.shape[i]);
    }
    FloatTensor<Rank> t(dims);
    const float *src = static_cast<const float *>(buf.ptr);
    std::copy(src, src + t.size(), t.data());
    return t;
}

template <int Rank>
FloatArray ToArray(const FloatTensor<Rank> &t) {
    std::vector<py::ssize_t> shape(Rank);
    for (int i = 0; i < Rank; ++i) {
        shape[i] = static_cast<py::ssize_t>(t.dimension(i));
    }
    FloatArray array(shape);
    std::copy(t.data(), t.data() + t.size(), array.mutable_data());
    return array;
}

/// Report a shape problem as a Python exception instead of a fatal check.
void RequireValid(const std::string &err) {
    if (!err.empty()) {
        throw std::invalid_argument("Shape mismatch: " + err);
    }
}

} // namespace

PYBIND11_MODULE(_arc_core, m) {
    m.doc() = "ARC: adaptive rotated convolution (C++ core)";

    // ---- Enums ----
    py::enum_<ConvKind>(m, "ConvKind")
        .value("Standard", ConvKind::Standard)
        .value("Adaptive", ConvKind::Adaptive)
        .export_values();

    // ---- RoutingConfig ----
    py::class_<RoutingConfig>(m, "RoutingConfig")
        .def(py::init<>())
        .def_readwrite("dropout_rate", &RoutingConfig::dropout_rate)
        .def_readwrite("proportion", &RoutingConfig::proportion)
        .def_property_readonly("max_angle", &RoutingConfig::max_angle)
        .def("__repr__", &RoutingConfig::toString);

    // ---- ArcConvConfig ----
    py::class_<ArcConvConfig>(m, "ArcConvConfig")
        .def(py::init<>())
        .def_readwrite("in_channels", &ArcConvConfig::in_channels)
        .def_readwrite("out_channels", &ArcConvConfig::out_channels)
        .def_readwrite("kernel_size", &ArcConvConfig::kernel_size)
        .def_readwrite("stride", &ArcConvConfig::stride)
        .def_readwrite("padding", &ArcConvConfig::padding)
        .def_readwrite("dilation", &ArcConvConfig::dilation)
        .def_readwrite("groups", &ArcConvConfig::groups)
        .def_readwrite("kernel_number", &ArcConvConfig::kernel_number)
        .def_readwrite("seed", &ArcConvConfig::seed)
        .def("validate", &ArcConvConfig::Validate,
             "Empty string if consistent, otherwise the mismatch description.")
        .def("__repr__", &ArcConvConfig::toString);

    // ---- RoutingFunction ----
    py::class_<RoutingFunction>(m, "RoutingFunction")
        .def(py::init<int, int, const RoutingConfig &, uint32_t>(),
             py::arg("in_channels"), py::arg("kernel_number"),
             py::arg("config") = RoutingConfig(), py::arg("seed") = 42)
        .def("forward",
             [](const RoutingFunction &self, const FloatArray &x) {
                 const Tensor4 input = ToTensor<4>(x, "x");
                 if (input.dimension(1) != self.InChannels()) {
                     RequireValid(fmt::format("expected {} input channels, got {}", self.InChannels(),
                                              input.dimension(1)));
                 }
                 RoutingSignal signal;
                 {
                     py::gil_scoped_release release;
                     signal = self.Forward(input);
                 }
                 return py::make_tuple(signal.gating, signal.angle);
             },
             py::arg("x"), "Returns (gating, angle), each of shape (B, kernel_number).")
        .def("set_training", &RoutingFunction::SetTraining, py::arg("training"))
        .def_property_readonly("kernel_number", &RoutingFunction::KernelNumber)
        .def_property_readonly("max_angle", &RoutingFunction::MaxAngle)
        .def("__repr__", &RoutingFunction::toString);

    // ---- AdaptiveRotatedConv ----
    py::class_<AdaptiveRotatedConv>(m, "AdaptiveRotatedConv")
        .def(py::init([](const ArcConvConfig &config, const RoutingConfig &routing_config) {
                 RequireValid(config.Validate());
                 return std::make_unique<AdaptiveRotatedConv>(config, routing_config);
             }),
             py::arg("config"), py::arg("routing_config") = RoutingConfig())
        .def("forward",
             [](const AdaptiveRotatedConv &self, const FloatArray &x) {
                 const Tensor4 input = ToTensor<4>(x, "x");
                 RequireValid(self.CheckInputShape(input));
                 Tensor4 y;
                 {
                     py::gil_scoped_release release;
                     y = self.Forward(input);
                 }
                 return ToArray(y);
             },
             py::arg("x"), "Input (B, Cin, H, W), returns (B, Cout, H', W').")
        .def("forward_with_routing",
             [](const AdaptiveRotatedConv &self, const FloatArray &x, const FloatRowMat &gating,
                const FloatRowMat &angle) {
                 const Tensor4 input = ToTensor<4>(x, "x");
                 RequireValid(self.CheckInputShape(input));
                 RequireValid(CheckSynthesisInputs(self.KernelBank(), gating, angle));
                 if (gating.rows() != input.dimension(0)) {
                     RequireValid("gating batch size differs from the input");
                 }
                 Tensor4 y;
                 {
                     py::gil_scoped_release release;
                     y = self.ForwardWithRouting(input, gating, angle);
                 }
                 return ToArray(y);
             },
             py::arg("x"), py::arg("gating"), py::arg("angle"),
             "Forward with an explicit (B, n) routing signal.")
        .def("check_input_shape",
             [](const AdaptiveRotatedConv &self, const FloatArray &x) {
                 return self.CheckInputShape(ToTensor<4>(x, "x"));
             },
             py::arg("x"), "Empty string if x can be processed, otherwise the mismatch description.")
        .def("set_training", &AdaptiveRotatedConv::SetTraining, py::arg("training"))
        .def_property(
            "kernel_bank", [](const AdaptiveRotatedConv &self) { return ToArray(self.KernelBank()); },
            [](AdaptiveRotatedConv &self, const FloatArray &bank) {
                Tensor5 t = ToTensor<5>(bank, "kernel_bank");
                for (int i = 0; i < 5; ++i) {
                    if (t.dimension(i) != self.KernelBank().dimension(i)) {
                        RequireValid(fmt::format("kernel_bank axis {} is {}, expected {}", i, t.dimension(i),
                                                 self.KernelBank().dimension(i)));
                    }
                }
                self.KernelBank() = t;
            })
        .def("routing",
             [](const AdaptiveRotatedConv &self, const FloatArray &x) {
                 const Tensor4 input = ToTensor<4>(x, "x");
                 RequireValid(self.CheckInputShape(input));
                 const RoutingSignal signal = self.Routing().Forward(input);
                 return py::make_tuple(signal.gating, signal.angle);
             },
             py::arg("x"))
        .def("save", &AdaptiveRotatedConv::SaveToFile, py::arg("filename"))
        .def("load", &AdaptiveRotatedConv::LoadFromFile, py::arg("filename"),
             "Returns False if the checkpoint does not match the parameter shapes.")
        .def_property_readonly("kernel_number", &AdaptiveRotatedConv::KernelNumber)
        .def_property_readonly("in_channels", &AdaptiveRotatedConv::InChannels)
        .def_property_readonly("out_channels", &AdaptiveRotatedConv::OutChannels)
        .def("__repr__", &AdaptiveRotatedConv::toString);

    // ---- Replace lists ----
    m.def("parse_replace_list",
          [](const std::string &list) {
              BlockConvPlan plan;
              std::string error;
              if (!BlockConvPlan::FromReplaceList(list, &plan, &error)) {
                  throw std::invalid_argument(error);
              }
              std::vector<int> adaptive;
              for (const auto &[index, kind] : plan.Entries()) {
                  if (kind == ConvKind::Adaptive) adaptive.push_back(index);
              }
              return adaptive;
          },
          py::arg("replace"), "Sorted indices of the adaptive blocks in a replace list.");

    // ---- Utility functions ----
    m.def("rotation_operator", &RotationOperator, py::arg("theta"),
          "9x9 operator rotating a flattened 3x3 kernel by theta radians.");

    m.def("synthesize_weights",
          [](const FloatArray &bank, const FloatRowMat &gating, const FloatRowMat &angle) {
              const Tensor5 t = ToTensor<5>(bank, "bank");
              RequireValid(CheckSynthesisInputs(t, gating, angle));
              return ToArray(SynthesizeWeights(t, gating, angle));
          },
          py::arg("bank"), py::arg("gating"), py::arg("angle"),
          "Returns (B * n * Cout, Cin, 3, 3) rotated and gated weights.");
}
