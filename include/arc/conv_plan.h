#pragma once

/// @file conv_plan.h
/// @brief Which residual blocks of a stage use the adaptive rotated 3x3
///        convolution, and the factory that builds the selected kind.

#include <map>
#include <string>
#include <vector>

#include "arc/config.h"
#include "arc/conv3x3.h"
#include "arc/defines.h"

namespace arc {

/// @brief Explicit block index -> ConvKind map for one stage. Blocks that
///        are not listed use the standard convolution.
class BlockConvPlan {
 public:
  BlockConvPlan() = default;

  /// @brief Parse a comma separated list of adaptive block indices, e.g.
  ///        "0,2". Whitespace around tokens is ignored; an empty string
  ///        yields an all-standard plan.
  /// @return false and a description in @p error on malformed input.
  static bool FromReplaceList(const std::string& list, BlockConvPlan* plan,
                              std::string* error);

  void Set(int block_index, ConvKind kind);
  ConvKind KindOf(int block_index) const;

  const std::map<int, ConvKind>& Entries() const { return kinds_; }
  int NumAdaptive() const;

  std::string toString() const;

 private:
  std::map<int, ConvKind> kinds_;
};

/// @brief One BlockConvPlan per stage of a backbone.
class StageConvPlan {
 public:
  /// @brief Parse per-stage replace lists separated by ';', e.g.
  ///        "0,2;1;;0" (stage 2 has no adaptive block).
  static bool Parse(const std::string& text, StageConvPlan* plan,
                    std::string* error);

  /// Empty (all-standard) plan for stages past the parsed ones.
  const BlockConvPlan& Stage(int stage_index) const;
  int NumStages() const { return static_cast<int>(stages_.size()); }

 private:
  std::vector<BlockConvPlan> stages_;
  BlockConvPlan empty_;
};

/// @brief Build the 3x3 convolution of block @p block_index.
///
/// Adaptive blocks get a routing function with config.in_channels inputs
/// and config.kernel_number variants; standard blocks ignore
/// kernel_number and @p routing_config.
Conv3x3Ptr MakeConv3x3(const BlockConvPlan& plan, int block_index,
                       const ArcConvConfig& config,
                       const RoutingConfig& routing_config = RoutingConfig());

}  // namespace arc
