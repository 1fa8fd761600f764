/**
 * @file circulation.cpp
 * @brief Blood flow renormalisation and vessel network construction.
 */

#include <bodytherm/biology/circulation.hpp>
#include <bodytherm/biology/tissue_tables.hpp>
#include <bodytherm/core/constants.hpp>

namespace bodytherm {
namespace biology {

namespace {

using core::NUM_SEGMENTS;
using core::NO_NODE;
using core::Segment;
using core::SegmentArray;
using core::idx;

constexpr int seg(Segment s) { return static_cast<int>(s); }

const std::array<int, NUM_SEGMENTS> PARENT = {
    seg(Segment::NECK),       // Head
    NO_NODE,                  // Neck
    NO_NODE,                  // Chest
    NO_NODE,                  // Back
    NO_NODE,                  // Pelvis
    NO_NODE,                  // LShoulder
    seg(Segment::L_SHOULDER), // LArm
    seg(Segment::L_ARM),      // LHand
    NO_NODE,                  // RShoulder
    seg(Segment::R_SHOULDER), // RArm
    seg(Segment::R_ARM),      // RHand
    seg(Segment::PELVIS),     // LThigh
    seg(Segment::L_THIGH),    // LLeg
    seg(Segment::L_LEG),      // LFoot
    seg(Segment::PELVIS),     // RThigh
    seg(Segment::R_THIGH),    // RLeg
    seg(Segment::R_LEG)       // RFoot
};

bool is_hand(size_t s) {
  return s == idx(Segment::L_HAND) || s == idx(Segment::R_HAND);
}

bool is_foot(size_t s) {
  return s == idx(Segment::L_FOOT) || s == idx(Segment::R_FOOT);
}

bool is_arm_chain(size_t s) {
  return s >= idx(Segment::L_SHOULDER) && s <= idx(Segment::R_HAND);
}

} // namespace

BloodFlowDistributor::BloodFlowDistributor(const Anthropometry &anthro)
    : cardiac_output_lh_(anthro.cardiac_output_lh),
      bloodflow_ratio_(anthro.bloodflow_ratio) {}

BloodFlowState
BloodFlowDistributor::distribute(const ControlSignals &signals,
                                 const HeatProduction &production) const {
  const auto &layout = core::node_layout();
  BloodFlowState st;

  // Unconstrained demand
  double demand = 0.0;
  for (size_t i = 0; i < NUM_SEGMENTS; ++i) {
    st.core_lh[i] = tables::BFB_CORE[i] * bloodflow_ratio_;
    st.muscle_lh[i] = tables::BFB_MUSCLE[i] * bloodflow_ratio_;
    st.fat_lh[i] = tables::BFB_FAT[i] * bloodflow_ratio_;
    st.skin_lh[i] = signals.skin_blood_flow[i];

    const double extra = (production.work_w[i] + signals.shivering[i]) /
                         constants::WORK_HEAT_PER_FLOW;
    if (layout.muscle[i] != NO_NODE) {
      st.muscle_lh[i] += extra;
    } else {
      st.core_lh[i] += extra;
    }

    demand += st.core_lh[i] + st.muscle_lh[i] + st.fat_lh[i] + st.skin_lh[i];
  }
  demand += 2.0 * (signals.ava_hand + signals.ava_foot);

  // Proportional renormalisation onto cardiac output
  st.scale = cardiac_output_lh_ / demand;
  st.cardiac_output_lh = cardiac_output_lh_;
  for (size_t i = 0; i < NUM_SEGMENTS; ++i) {
    st.core_lh[i] *= st.scale;
    st.muscle_lh[i] *= st.scale;
    st.fat_lh[i] *= st.scale;
    st.skin_lh[i] *= st.scale;
  }
  st.ava_hand_lh = signals.ava_hand * st.scale;
  st.ava_foot_lh = signals.ava_foot * st.scale;

  for (size_t i = 0; i < NUM_SEGMENTS; ++i) {
    st.segment_lh[i] =
        st.core_lh[i] + st.muscle_lh[i] + st.fat_lh[i] + st.skin_lh[i];
    if (is_hand(i))
      st.segment_lh[i] += st.ava_hand_lh;
    if (is_foot(i))
      st.segment_lh[i] += st.ava_foot_lh;
  }

  build_network(st);
  return st;
}

void BloodFlowDistributor::build_network(BloodFlowState &st) const {
  const auto &layout = core::node_layout();
  const int cb = static_cast<int>(layout.central_blood);

  // Cumulative flows: every segment contributes to itself and its ancestors
  SegmentArray local_deep{};
  for (size_t i = 0; i < NUM_SEGMENTS; ++i) {
    local_deep[i] =
        st.core_lh[i] + st.muscle_lh[i] + st.fat_lh[i] + st.skin_lh[i];
  }

  st.artery_lh.fill(0.0);
  st.vein_lh.fill(0.0);
  st.sfvein_lh.fill(0.0);
  for (size_t i = 0; i < NUM_SEGMENTS; ++i) {
    for (int s = static_cast<int>(i); s != NO_NODE; s = PARENT[s]) {
      st.artery_lh[s] += st.segment_lh[i];
      st.vein_lh[s] += local_deep[i];
    }
  }

  // Superficial veins carry the AVA flow of their limb chain
  for (size_t s : layout.sfvein_segments) {
    st.sfvein_lh[s] = is_arm_chain(s) ? st.ava_hand_lh : st.ava_foot_lh;
  }
  // Thigh superficial veins drain into the pelvis vein
  st.vein_lh[idx(Segment::PELVIS)] += 2.0 * st.ava_foot_lh;

  auto &edges = st.edges;
  edges.clear();
  edges.reserve(6 * NUM_SEGMENTS + layout.sfvein_segments.size());

  for (size_t i = 0; i < NUM_SEGMENTS; ++i) {
    const int parent = PARENT[i];
    const int artery = layout.artery[i];
    const int vein = layout.vein[i];

    // Arterial supply and venous return along the tree
    edges.push_back({parent == NO_NODE ? cb : layout.artery[parent], artery,
                     st.artery_lh[i]});
    edges.push_back({vein, parent == NO_NODE ? cb : layout.vein[parent],
                     st.vein_lh[i]});

    // Capillary beds
    edges.push_back({artery, layout.core[i], st.core_lh[i]});
    edges.push_back({layout.core[i], vein, st.core_lh[i]});
    if (layout.muscle[i] != NO_NODE) {
      edges.push_back({artery, layout.muscle[i], st.muscle_lh[i]});
      edges.push_back({layout.muscle[i], vein, st.muscle_lh[i]});
    }
    if (layout.fat[i] != NO_NODE) {
      edges.push_back({artery, layout.fat[i], st.fat_lh[i]});
      edges.push_back({layout.fat[i], vein, st.fat_lh[i]});
    }
    edges.push_back({artery, layout.skin[i], st.skin_lh[i]});
    edges.push_back({layout.skin[i], vein, st.skin_lh[i]});
  }

  for (size_t s : layout.sfvein_segments) {
    const int sfv = layout.sfvein[s];

    // Anastomoses open into the superficial vein of hands and feet
    if (is_hand(s) || is_foot(s)) {
      edges.push_back({layout.artery[s], sfv, st.sfvein_lh[s]});
    }

    int to = cb;
    const int parent = PARENT[s];
    if (parent != NO_NODE) {
      to = layout.sfvein[parent] != NO_NODE ? layout.sfvein[parent]
                                            : layout.vein[parent];
    }
    edges.push_back({sfv, to, st.sfvein_lh[s]});
  }
}

} // namespace biology
} // namespace bodytherm
