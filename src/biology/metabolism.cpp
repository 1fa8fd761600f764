/**
 * @file metabolism.cpp
 * @brief Distribution of basal, work and thermogenic heat over the layers.
 */

#include <bodytherm/biology/metabolism.hpp>
#include <bodytherm/biology/tissue_tables.hpp>
#include <bodytherm/thermal/psychrometrics.hpp>

namespace bodytherm {
namespace biology {

using core::NUM_SEGMENTS;

MetabolismModel::MetabolismModel(const Anthropometry &anthro)
    : bmr_w_(anthro.bmr_w) {
  const double norm =
      core::sum(tables::MBASE_CORE) + core::sum(tables::MBASE_MUSCLE) +
      core::sum(tables::MBASE_FAT) + core::sum(tables::MBASE_SKIN);

  for (size_t i = 0; i < NUM_SEGMENTS; ++i) {
    basal_.core_w[i] = tables::MBASE_CORE[i] / norm * bmr_w_;
    basal_.muscle_w[i] = tables::MBASE_MUSCLE[i] / norm * bmr_w_;
    basal_.fat_w[i] = tables::MBASE_FAT[i] / norm * bmr_w_;
    basal_.skin_w[i] = tables::MBASE_SKIN[i] / norm * bmr_w_;
  }
}

HeatProduction MetabolismModel::compute(double par,
                                        const ControlSignals &signals) const {
  const auto &layout = core::node_layout();
  HeatProduction q = basal_;

  const double work_total = bmr_w_ * (par - 1.0);
  for (size_t i = 0; i < NUM_SEGMENTS; ++i) {
    q.work_w[i] = work_total * tables::WORK_FRACTION[i];

    // Work and shivering are muscular; segments without a muscle node
    // release them in the core.
    const double muscular = q.work_w[i] + signals.shivering[i];
    if (layout.muscle[i] != core::NO_NODE) {
      q.muscle_w[i] += muscular;
    } else {
      q.core_w[i] += muscular;
    }
    q.core_w[i] += signals.nonshivering[i];
  }
  return q;
}

RespiratoryLoss MetabolismModel::respiration(double ta_head, double rh_head,
                                             double total_production) {
  RespiratoryLoss r;
  const double pa = thermal::vapor_pressure(ta_head, rh_head);
  r.sensible_w = 0.0014 * total_production * (34.0 - ta_head);
  r.latent_w = 0.0173e-3 * total_production * (5870.0 - pa);
  return r;
}

} // namespace biology
} // namespace bodytherm
