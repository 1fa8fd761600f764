#pragma once

/**
 * @file segments.hpp
 * @brief 17-segment body topology and the 85-node state layout.
 *
 * Every segment has an artery, a vein, a core and a skin node. Limb
 * segments add a superficial vein; Head and Pelvis add muscle and fat.
 * Node 0 is the central blood pool. The (segment, layer) -> node table is
 * built once and shared read-only.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bodytherm {
namespace core {

constexpr size_t NUM_SEGMENTS = 17;
constexpr size_t NUM_NODES = 85;
constexpr size_t NUM_SFVEIN = 12;
constexpr size_t NUM_MUSCLE = 2;
constexpr size_t NUM_FAT = 2;

/**
 * @brief Body segments in canonical order.
 */
enum class Segment : uint8_t {
  HEAD = 0,
  NECK,
  CHEST,
  BACK,
  PELVIS,
  L_SHOULDER,
  L_ARM,
  L_HAND,
  R_SHOULDER,
  R_ARM,
  R_HAND,
  L_THIGH,
  L_LEG,
  L_FOOT,
  R_THIGH,
  R_LEG,
  R_FOOT
};

/**
 * @brief Tissue layers, in node numbering order within a segment.
 */
enum class Layer : uint8_t { ARTERY, VEIN, SFVEIN, CORE, MUSCLE, FAT, SKIN };

/// One value per segment, canonical order.
using SegmentArray = std::array<double, NUM_SEGMENTS>;

/// Full temperature state.
using NodeArray = std::array<double, NUM_NODES>;

constexpr std::array<const char *, NUM_SEGMENTS> SEGMENT_NAMES = {
    "Head",   "Neck",      "Chest",  "Back",  "Pelvis",    "LShoulder",
    "LArm",   "LHand",     "RShoulder", "RArm", "RHand",   "LThigh",
    "LLeg",   "LFoot",     "RThigh", "RLeg",  "RFoot"};

constexpr int NO_NODE = -1;

inline constexpr size_t idx(Segment s) { return static_cast<size_t>(s); }

/**
 * @brief Index table mapping (segment, layer) to state-vector offsets.
 */
struct NodeLayout {
  size_t central_blood = 0;

  std::array<int, NUM_SEGMENTS> artery{};
  std::array<int, NUM_SEGMENTS> vein{};
  std::array<int, NUM_SEGMENTS> sfvein{};
  std::array<int, NUM_SEGMENTS> core{};
  std::array<int, NUM_SEGMENTS> muscle{};
  std::array<int, NUM_SEGMENTS> fat{};
  std::array<int, NUM_SEGMENTS> skin{};

  // Segments owning the optional layers, canonical order
  std::vector<size_t> sfvein_segments;
  std::vector<size_t> muscle_segments;
  std::vector<size_t> fat_segments;

  int index(Segment s, Layer layer) const;
  bool has(Segment s, Layer layer) const { return index(s, layer) != NO_NODE; }
};

/**
 * @brief Shared layout, built on first use.
 */
const NodeLayout &node_layout();

/**
 * @brief Human-readable node name, e.g. "LHand.sfvein" or "CB".
 */
std::string node_name(size_t node);

// === Small helpers over segment arrays ===

inline SegmentArray filled(double value) {
  SegmentArray a;
  a.fill(value);
  return a;
}

inline double sum(const SegmentArray &a) {
  double s = 0.0;
  for (double v : a)
    s += v;
  return s;
}

inline double weighted_mean(const SegmentArray &values,
                            const SegmentArray &weights) {
  double num = 0.0;
  double den = 0.0;
  for (size_t i = 0; i < NUM_SEGMENTS; ++i) {
    num += values[i] * weights[i];
    den += weights[i];
  }
  return den > 0.0 ? num / den : 0.0;
}

} // namespace core
} // namespace bodytherm
