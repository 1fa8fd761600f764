#pragma once

/**
 * @file thermal_state.hpp
 * @brief 85-node temperature vector with named layer views.
 */

#include <vector>

#include <bodytherm/core/constants.hpp>
#include <bodytherm/core/segments.hpp>

namespace bodytherm {
namespace core {

class ThermalState {
public:
  ThermalState() { temps_.fill(constants::BODY_TEMP_INITIAL_C); }
  explicit ThermalState(const NodeArray &temps) : temps_(temps) {}

  NodeArray &nodes() { return temps_; }
  const NodeArray &nodes() const { return temps_; }

  double central_blood() const {
    return temps_[node_layout().central_blood];
  }

  SegmentArray skin() const { return gather(node_layout().skin); }
  SegmentArray core() const { return gather(node_layout().core); }
  SegmentArray artery() const { return gather(node_layout().artery); }
  SegmentArray vein() const { return gather(node_layout().vein); }

  // Sparse layers, in canonical segment order of their owners
  std::vector<double> sfvein() const {
    return gather(node_layout().sfvein, node_layout().sfvein_segments);
  }
  std::vector<double> muscle() const {
    return gather(node_layout().muscle, node_layout().muscle_segments);
  }
  std::vector<double> fat() const {
    return gather(node_layout().fat, node_layout().fat_segments);
  }

private:
  SegmentArray gather(const std::array<int, NUM_SEGMENTS> &index) const {
    SegmentArray out;
    for (size_t i = 0; i < NUM_SEGMENTS; ++i)
      out[i] = temps_[static_cast<size_t>(index[i])];
    return out;
  }

  std::vector<double> gather(const std::array<int, NUM_SEGMENTS> &index,
                             const std::vector<size_t> &segments) const {
    std::vector<double> out;
    out.reserve(segments.size());
    for (size_t s : segments)
      out.push_back(temps_[static_cast<size_t>(index[s])]);
    return out;
  }

  NodeArray temps_;
};

} // namespace core
} // namespace bodytherm
