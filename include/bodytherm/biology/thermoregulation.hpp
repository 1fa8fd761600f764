#pragma once

/**
 * @file thermoregulation.hpp
 * @brief Segmented thermoregulatory feedback: vasomotion, AVA opening,
 * shivering, non-shivering thermogenesis and sweating.
 *
 * All laws are thresholded continuous functions of the current core and
 * skin temperature errors. Nothing is carried between steps.
 */

#include <bodytherm/biology/anthropometry.hpp>
#include <bodytherm/core/segments.hpp>
#include <bodytherm/thermal/boundary_conditions.hpp>
#include <bodytherm/thermal/heat_exchange.hpp>

namespace bodytherm {
namespace biology {

/**
 * @brief Optional physiological responses.
 */
struct ThermoregulationOptions {
  bool nonshivering_thermogenesis = true;
  bool cold_acclimated = false;
  bool bat_positive = false;
  bool shivering_threshold = false; // Skin-dependent onset (Asaka 2016)
  bool ava_zero = false;            // Keep arteriovenous anastomoses closed
};

/**
 * @brief Controller outputs for one step.
 */
struct ControlSignals {
  core::SegmentArray err_cr{}; // core - setpoint [K]
  core::SegmentArray err_sk{}; // skin - setpoint [K]
  double wrms = 0.0;           // weighted warm receptor signal
  double clds = 0.0;           // weighted cold receptor signal

  double sig_dilation = 0.0;
  double sig_constriction = 0.0;
  core::SegmentArray skin_blood_flow{}; // L/h

  double ava_hand = 0.0; // L/h per hand
  double ava_foot = 0.0; // L/h per foot

  core::SegmentArray shivering{};    // W
  core::SegmentArray nonshivering{}; // W

  core::SegmentArray e_max{};   // evaporative capacity [W]
  core::SegmentArray e_sweat{}; // sweat-driven evaporation [W]
  core::SegmentArray e_sk{};    // total skin evaporation [W]
  core::SegmentArray wet{};     // wettedness [-], 0.06..1
};

struct ThermoregulationConfig {
  double min_perfusion_ratio = 0.05;    // skin flow floor / basal
  double max_vasodilation_ratio = 20.0; // skin flow ceiling / basal
  double shivering_cold_threshold = 0.0;
  double max_shivering_bmr_ratio = 4.0;
  double diffusion_wettedness = 0.06;   // insensible skin diffusion
  double min_evaporative_capacity = 1e-3; // W
};

class ThermoregulationController {
public:
  using Config = ThermoregulationConfig;

  ThermoregulationController(const BodyProfile &profile,
                             const Anthropometry &anthro,
                             const Config &config = Config{},
                             const ThermoregulationOptions &options =
                                 ThermoregulationOptions{});

  /**
   * @brief Evaluates every feedback law for the current state.
   * @param tcr Core temperatures (°C)
   * @param tsk Skin temperatures (°C)
   * @param set_cr Core setpoints (°C)
   * @param set_sk Skin setpoints (°C)
   * @param resistances Current heat exchange resistances
   * @param bc Current boundary conditions
   * @param passive Zero all error signals (no regulation)
   */
  ControlSignals compute(const core::SegmentArray &tcr,
                         const core::SegmentArray &tsk,
                         const core::SegmentArray &set_cr,
                         const core::SegmentArray &set_sk,
                         const thermal::DerivedResistances &resistances,
                         const thermal::BoundaryConditions &bc,
                         bool passive) const;

  // Individual laws, exposed for testing
  void receptor_signals(ControlSignals &s) const;
  void vasomotion(ControlSignals &s) const;
  void ava_opening(ControlSignals &s) const;
  void shivering(ControlSignals &s, const core::SegmentArray &tcr,
                 const core::SegmentArray &tsk) const;
  void nonshivering(ControlSignals &s) const;
  void sweating(ControlSignals &s, const core::SegmentArray &tsk,
                const thermal::DerivedResistances &resistances,
                const thermal::BoundaryConditions &bc) const;

  /// Brown adipose tissue estimate [SUV].
  double brown_adipose_tissue() const;

  const Config &config() const { return config_; }
  const ThermoregulationOptions &options() const { return options_; }
  void set_options(const ThermoregulationOptions &options) {
    options_ = options;
  }

private:
  BodyProfile profile_;
  Anthropometry anthro_;
  Config config_;
  ThermoregulationOptions options_;
};

} // namespace biology
} // namespace bodytherm
