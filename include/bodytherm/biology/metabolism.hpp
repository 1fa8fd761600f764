#pragma once

/**
 * @file metabolism.hpp
 * @brief Local heat production and respiratory heat loss.
 */

#include <bodytherm/biology/anthropometry.hpp>
#include <bodytherm/biology/thermoregulation.hpp>
#include <bodytherm/core/segments.hpp>

namespace bodytherm {
namespace biology {

/**
 * @brief Heat production per tissue layer for one step [W].
 *
 * Muscle and fat entries are non-zero only for segments carrying those
 * layers.
 */
struct HeatProduction {
  core::SegmentArray core_w{};
  core::SegmentArray muscle_w{};
  core::SegmentArray fat_w{};
  core::SegmentArray skin_w{};
  core::SegmentArray work_w{}; // external work share, included above

  double total() const {
    return core::sum(core_w) + core::sum(muscle_w) + core::sum(fat_w) +
           core::sum(skin_w);
  }
};

struct RespiratoryLoss {
  double sensible_w = 0.0;
  double latent_w = 0.0;
  double total() const { return sensible_w + latent_w; }
};

class MetabolismModel {
public:
  explicit MetabolismModel(const Anthropometry &anthro);

  /// Basal production, independent of activity and regulation.
  const HeatProduction &basal() const { return basal_; }

  /**
   * @brief Basal + activity + thermogenesis for one step.
   * @param par Physical activity ratio (>= 1)
   * @param signals Controller output supplying shivering and NST
   */
  HeatProduction compute(double par, const ControlSignals &signals) const;

  /**
   * @brief Respiratory heat loss, taken from the chest core.
   * @param ta_head Inhaled air temperature (°C)
   * @param rh_head Inhaled air humidity (%)
   * @param total_production Whole-body heat production (W)
   */
  static RespiratoryLoss respiration(double ta_head, double rh_head,
                                     double total_production);

private:
  double bmr_w_;
  HeatProduction basal_;
};

} // namespace biology
} // namespace bodytherm
