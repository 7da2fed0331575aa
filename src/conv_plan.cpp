/// @file conv_plan.cpp
/// @brief Replace-list parsing and the 3x3 convolution factory.

#include "arc/conv_plan.h"

#include <charconv>
#include <memory>
#include <string_view>

#include "arc/adaptive_rotated_conv.h"

namespace arc {

namespace {

std::string_view Trim(std::string_view s) {
  const auto first = s.find_first_not_of(" \t");
  if (first == std::string_view::npos) return {};
  const auto last = s.find_last_not_of(" \t");
  return s.substr(first, last - first + 1);
}

/// Split on @p sep, keeping empty fields.
std::vector<std::string_view> Split(std::string_view s, char sep) {
  std::vector<std::string_view> fields;
  size_t start = 0;
  while (true) {
    const size_t pos = s.find(sep, start);
    if (pos == std::string_view::npos) {
      fields.push_back(s.substr(start));
      break;
    }
    fields.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  return fields;
}

}  // anonymous namespace

// ---------------------------------------------------------------------------
// BlockConvPlan
// ---------------------------------------------------------------------------

bool BlockConvPlan::FromReplaceList(const std::string& list,
                                    BlockConvPlan* plan, std::string* error) {
  CHECK(plan != nullptr);
  BlockConvPlan parsed;
  for (std::string_view field : Split(list, ',')) {
    const std::string_view token = Trim(field);
    if (token.empty()) continue;

    int index = -1;
    const auto [end, ec] =
        std::from_chars(token.data(), token.data() + token.size(), index);
    if (ec != std::errc() || end != token.data() + token.size()) {
      if (error != nullptr) {
        *error = fmt::format("invalid block index '{}' in replace list '{}'",
                             std::string(token), list);
      }
      return false;
    }
    if (index < 0) {
      if (error != nullptr) {
        *error = fmt::format("negative block index {} in replace list '{}'",
                             index, list);
      }
      return false;
    }
    parsed.Set(index, ConvKind::Adaptive);
  }
  *plan = std::move(parsed);
  return true;
}

void BlockConvPlan::Set(int block_index, ConvKind kind) {
  CHECK_GE(block_index, 0);
  kinds_[block_index] = kind;
}

ConvKind BlockConvPlan::KindOf(int block_index) const {
  const auto it = kinds_.find(block_index);
  return it == kinds_.end() ? ConvKind::Standard : it->second;
}

int BlockConvPlan::NumAdaptive() const {
  int count = 0;
  for (const auto& [index, kind] : kinds_) {
    if (kind == ConvKind::Adaptive) ++count;
  }
  return count;
}

std::string BlockConvPlan::toString() const {
  std::string s;
  for (const auto& [index, kind] : kinds_) {
    if (kind != ConvKind::Adaptive) continue;
    if (!s.empty()) s += ",";
    s += std::to_string(index);
  }
  return s;
}

// ---------------------------------------------------------------------------
// StageConvPlan
// ---------------------------------------------------------------------------

bool StageConvPlan::Parse(const std::string& text, StageConvPlan* plan,
                          std::string* error) {
  CHECK(plan != nullptr);
  StageConvPlan parsed;
  if (!Trim(text).empty()) {
    for (std::string_view field : Split(text, ';')) {
      BlockConvPlan stage;
      if (!BlockConvPlan::FromReplaceList(std::string(field), &stage, error)) {
        return false;
      }
      parsed.stages_.push_back(std::move(stage));
    }
  }
  *plan = std::move(parsed);
  return true;
}

const BlockConvPlan& StageConvPlan::Stage(int stage_index) const {
  if (stage_index < 0 || stage_index >= NumStages()) {
    return empty_;
  }
  return stages_[stage_index];
}

// ---------------------------------------------------------------------------
// Factory
// ---------------------------------------------------------------------------

Conv3x3Ptr MakeConv3x3(const BlockConvPlan& plan, int block_index,
                       const ArcConvConfig& config,
                       const RoutingConfig& routing_config) {
  switch (plan.KindOf(block_index)) {
    case ConvKind::Adaptive:
      return std::make_unique<AdaptiveRotatedConv>(config, routing_config);
    case ConvKind::Standard:
      break;
  }
  return std::make_unique<StandardConv3x3>(config);
}

}  // namespace arc
