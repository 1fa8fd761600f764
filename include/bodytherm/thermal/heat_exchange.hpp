#pragma once

/**
 * @file heat_exchange.hpp
 * @brief Skin-to-environment heat transfer coefficients and resistances.
 *
 * Features:
 * - Natural convection and radiation tables per posture
 * - Forced convection a·Va^b per segment
 * - Clothing insulation in series with the air layer
 * - Lewis-relation evaporative resistance
 */

#include <bodytherm/core/segments.hpp>
#include <bodytherm/thermal/boundary_conditions.hpp>

namespace bodytherm {
namespace thermal {

/**
 * @brief Per-segment resistances, a pure function of the boundary conditions.
 */
struct DerivedResistances {
  core::SegmentArray hc{};  // convective coefficient [W/(m²·K)]
  core::SegmentArray hr{};  // radiant coefficient [W/(m²·K)]
  core::SegmentArray fcl{}; // clothing area factor [-]
  core::SegmentArray to{};  // operative temperature [°C]
  core::SegmentArray rt{};  // total dry resistance [m²·K/W]
  core::SegmentArray ret{}; // total evaporative resistance [Pa·m²/W]
};

struct HeatExchangeConfig {
  double forced_convection_va_ms = 0.2; // below this, natural convection
  double clo_area_factor = 0.15;        // fcl = 1 + k·Icl
};

class HeatExchangeModel {
public:
  using Config = HeatExchangeConfig;

  explicit HeatExchangeModel(const Config &config = Config{})
      : config_(config) {}

  DerivedResistances compute(const BoundaryConditions &bc) const;

  core::SegmentArray convective_coefficient(Posture posture,
                                            const core::SegmentArray &va) const;

  static const core::SegmentArray &natural_convection(Posture posture);
  static const core::SegmentArray &radiant_coefficient(Posture posture);

  /**
   * @brief Sensible heat loss per segment [W], positive when skin is
   * warmer than the operative temperature.
   */
  static core::SegmentArray dry_heat_loss(const DerivedResistances &r,
                                          const core::SegmentArray &tsk,
                                          const core::SegmentArray &bsa);

  /**
   * @brief Maximum evaporative heat loss per segment [W].
   */
  static core::SegmentArray evaporative_capacity(const DerivedResistances &r,
                                                 const BoundaryConditions &bc,
                                                 const core::SegmentArray &tsk,
                                                 const core::SegmentArray &bsa);

  const Config &config() const { return config_; }

private:
  Config config_;
};

} // namespace thermal
} // namespace bodytherm
