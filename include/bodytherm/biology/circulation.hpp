#pragma once

/**
 * @file circulation.hpp
 * @brief Segmental blood flow distribution and the vessel network.
 *
 * Tissue flows are set from basal values, vasomotion and muscular heat,
 * then rescaled so that their sum equals cardiac output. The vessel tree
 * carries cumulative arterial flow down from the central blood pool;
 * deep veins return the non-AVA flow and superficial limb veins return the
 * AVA flow.
 */

#include <vector>

#include <bodytherm/biology/anthropometry.hpp>
#include <bodytherm/biology/metabolism.hpp>
#include <bodytherm/biology/thermoregulation.hpp>
#include <bodytherm/core/segments.hpp>

namespace bodytherm {
namespace biology {

/**
 * @brief Directed blood transfer between two state nodes [L/h].
 */
struct BloodFlowEdge {
  int from;
  int to;
  double flow_lh;
};

struct BloodFlowState {
  core::SegmentArray core_lh{};
  core::SegmentArray muscle_lh{};
  core::SegmentArray fat_lh{};
  core::SegmentArray skin_lh{};
  double ava_hand_lh = 0.0; // per hand
  double ava_foot_lh = 0.0; // per foot

  core::SegmentArray segment_lh{}; // local total including AVA
  core::SegmentArray artery_lh{};  // entering each segment artery
  core::SegmentArray vein_lh{};    // leaving each segment vein
  core::SegmentArray sfvein_lh{};  // leaving each superficial vein

  double cardiac_output_lh = 0.0;
  double scale = 1.0; // renormalisation factor applied

  std::vector<BloodFlowEdge> edges;
};

class BloodFlowDistributor {
public:
  explicit BloodFlowDistributor(const Anthropometry &anthro);

  /**
   * @brief Flows for one step.
   * @param signals Skin and AVA flows from the controller
   * @param production Work and shivering heat driving muscular flow
   */
  BloodFlowState distribute(const ControlSignals &signals,
                            const HeatProduction &production) const;

  double cardiac_output() const { return cardiac_output_lh_; }

private:
  void build_network(BloodFlowState &state) const;

  double cardiac_output_lh_;
  double bloodflow_ratio_;
};

} // namespace biology
} // namespace bodytherm
