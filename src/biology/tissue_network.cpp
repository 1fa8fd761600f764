/**
 * @file tissue_network.cpp
 * @brief Assembly of the conduction network over the node layout.
 */

#include <bodytherm/biology/tissue_network.hpp>
#include <bodytherm/biology/tissue_tables.hpp>

namespace bodytherm {
namespace biology {

namespace {

constexpr double WH_TO_J = 3600.0;

void connect(Eigen::MatrixXd &g, int a, int b, double w_k) {
  if (a == core::NO_NODE || b == core::NO_NODE || w_k == 0.0)
    return;
  g(a, b) += w_k;
  g(b, a) += w_k;
}

} // namespace

double fat_correction(const Anthropometry &anthro, size_t segment) {
  return 1.0 + tables::FAT_SENSITIVITY[segment] * (2.0 - anthro.fat_class);
}

TissueNetwork build_tissue_network(const Anthropometry &anthro) {
  const auto &layout = core::node_layout();
  TissueNetwork net;
  net.conductance = Eigen::MatrixXd::Zero(core::NUM_NODES, core::NUM_NODES);

  const double wr = anthro.weight_ratio * WH_TO_J;
  auto &cap = net.capacity_j_k;
  cap[layout.central_blood] = tables::CAP_CENTRAL_BLOOD * wr;

  for (size_t i = 0; i < core::NUM_SEGMENTS; ++i) {
    cap[layout.artery[i]] = tables::CAP_ARTERY[i] * wr;
    cap[layout.vein[i]] = tables::CAP_VEIN[i] * wr;
    cap[layout.core[i]] = tables::CAP_CORE[i] * wr;
    cap[layout.skin[i]] = tables::CAP_SKIN[i] * wr;
    if (layout.sfvein[i] != core::NO_NODE)
      cap[layout.sfvein[i]] = tables::CAP_SFVEIN[i] * wr;
    if (layout.muscle[i] != core::NO_NODE)
      cap[layout.muscle[i]] = tables::CAP_MUSCLE[i] * wr;
    if (layout.fat[i] != core::NO_NODE)
      cap[layout.fat[i]] = tables::CAP_FAT[i] * wr;

    const double br = anthro.bsa_ratio;
    const double fat = fat_correction(anthro, i);
    auto &g = net.conductance;

    connect(g, layout.artery[i], layout.core[i],
            tables::CDT_VESSEL_CORE[i] * br);
    connect(g, layout.vein[i], layout.core[i],
            tables::CDT_VESSEL_CORE[i] * br);
    connect(g, layout.artery[i], layout.vein[i],
            tables::CDT_ARTERY_VEIN[i] * br);
    connect(g, layout.sfvein[i], layout.skin[i],
            tables::CDT_SFVEIN_SKIN[i] * br);

    if (layout.muscle[i] != core::NO_NODE) {
      connect(g, layout.core[i], layout.muscle[i],
              tables::CDT_CORE_MUSCLE[i] * br);
      connect(g, layout.muscle[i], layout.fat[i],
              tables::CDT_MUSCLE_FAT[i] * br);
      connect(g, layout.fat[i], layout.skin[i],
              tables::CDT_FAT_SKIN[i] * br * fat);
    } else {
      connect(g, layout.core[i], layout.skin[i],
              tables::CDT_CORE_SKIN[i] * br * fat);
    }
  }

  return net;
}

} // namespace biology
} // namespace bodytherm
