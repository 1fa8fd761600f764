/**
 * @file segments.cpp
 * @brief Node layout construction.
 */

#include <bodytherm/core/segments.hpp>

namespace bodytherm {
namespace core {

namespace {

bool is_limb(size_t s) { return s >= idx(Segment::L_SHOULDER); }

bool has_deep_layers(size_t s) {
  return s == idx(Segment::HEAD) || s == idx(Segment::PELVIS);
}

NodeLayout build_layout() {
  NodeLayout layout;
  layout.central_blood = 0;

  int next = 1;
  for (size_t s = 0; s < NUM_SEGMENTS; ++s) {
    layout.artery[s] = next++;
    layout.vein[s] = next++;

    if (is_limb(s)) {
      layout.sfvein[s] = next++;
      layout.sfvein_segments.push_back(s);
    } else {
      layout.sfvein[s] = NO_NODE;
    }

    layout.core[s] = next++;

    if (has_deep_layers(s)) {
      layout.muscle[s] = next++;
      layout.fat[s] = next++;
      layout.muscle_segments.push_back(s);
      layout.fat_segments.push_back(s);
    } else {
      layout.muscle[s] = NO_NODE;
      layout.fat[s] = NO_NODE;
    }

    layout.skin[s] = next++;
  }

  return layout;
}

} // namespace

int NodeLayout::index(Segment s, Layer layer) const {
  size_t i = idx(s);
  switch (layer) {
  case Layer::ARTERY:
    return artery[i];
  case Layer::VEIN:
    return vein[i];
  case Layer::SFVEIN:
    return sfvein[i];
  case Layer::CORE:
    return core[i];
  case Layer::MUSCLE:
    return muscle[i];
  case Layer::FAT:
    return fat[i];
  case Layer::SKIN:
    return skin[i];
  }
  return NO_NODE;
}

const NodeLayout &node_layout() {
  static const NodeLayout layout = build_layout();
  return layout;
}

std::string node_name(size_t node) {
  const auto &layout = node_layout();
  if (node == layout.central_blood)
    return "CB";

  static const std::array<const char *, 7> layer_names = {
      "artery", "vein", "sfvein", "core", "muscle", "fat", "skin"};

  for (size_t s = 0; s < NUM_SEGMENTS; ++s) {
    for (size_t l = 0; l < layer_names.size(); ++l) {
      int n = layout.index(static_cast<Segment>(s), static_cast<Layer>(l));
      if (n != NO_NODE && static_cast<size_t>(n) == node) {
        return std::string(SEGMENT_NAMES[s]) + "." + layer_names[l];
      }
    }
  }
  return "unknown";
}

} // namespace core
} // namespace bodytherm
