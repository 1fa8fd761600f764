#pragma once

/**
 * @file body_model.hpp
 * @brief Simulation driver for the 17-segment thermoregulation model.
 *
 * Owns the thermal state, boundary conditions and result log of one body
 * and runs the per-step pipeline:
 * heat exchange -> control -> metabolism -> blood flow -> integration.
 */

#include <cstdint>
#include <vector>

#include <bodytherm/biology/anthropometry.hpp>
#include <bodytherm/biology/circulation.hpp>
#include <bodytherm/biology/metabolism.hpp>
#include <bodytherm/biology/results.hpp>
#include <bodytherm/biology/thermoregulation.hpp>
#include <bodytherm/core/thermal_state.hpp>
#include <bodytherm/thermal/bioheat_integrator.hpp>
#include <bodytherm/thermal/boundary_conditions.hpp>
#include <bodytherm/thermal/heat_exchange.hpp>

namespace bodytherm {
namespace biology {

struct BodyModelConfig {
  BodyProfile profile;
  ThermoregulationOptions options;
  ThermoregulationConfig controller;
  thermal::HeatExchangeConfig heat_exchange;
  thermal::IntegratorConfig integrator;
  thermal::BoundaryDefaults defaults;
  OutputSelector ex_output;

  // Setpoint derivation
  double neutral_par = 1.25;
  int setpoint_passes = 10;
  double setpoint_pass_s = 60000.0;
};

class ThermalBodyModel {
public:
  using Config = BodyModelConfig;

  /**
   * @brief Validates the profile and derives thermoneutral setpoints.
   *
   * Throws core::ConfigurationError for unsupported profiles.
   */
  explicit ThermalBodyModel(const Config &config = Config{});

  /**
   * @brief Runs `times` steps of `dtime` seconds, one log row per step.
   *
   * Throws core::InvalidArgument before any work when times < 1 or
   * dtime <= 0, and core::UnstableStepSizeError when a step cannot be
   * integrated (the state of that step is rolled back). The subclass
   * core::StateOutOfRangeError means the conditions push the body out of
   * the represented band, independent of dtime.
   */
  void simulate(int times, double dtime = 60.0);

  // === Boundary conditions ===
  thermal::BoundaryConditions &conditions() { return conditions_; }
  const thermal::BoundaryConditions &conditions() const { return conditions_; }

  /// Full-state override, 85 values in node order.
  void set_bodytemp(const std::vector<double> &temps);
  void set_bodytemp(double temp);

  /// Re-derives setpoints under the neutral reference environment.
  void reset_setpoints();

  void set_ex_output(const OutputSelector &selector) {
    config_.ex_output = selector;
  }
  const OutputSelector &ex_output() const { return config_.ex_output; }

  // === Anthropometry ===
  const BodyProfile &profile() const { return config_.profile; }
  const Anthropometry &anthropometry() const { return anthro_; }
  const core::SegmentArray &bsa() const { return anthro_.bsa; }
  double bmr() const { return anthro_.bmr_w / anthro_.bsa_total; } // W/m²
  double bmr_power() const { return anthro_.bmr_w; }                // W
  double cardiac_output() const { return anthro_.cardiac_output_lh; }

  // === Derived from the current conditions ===
  core::SegmentArray rt() const;
  core::SegmentArray ret() const;
  core::SegmentArray to() const;
  core::SegmentArray wet() const;
  double wet_mean() const;
  core::SegmentArray segment_blood_flow() const;

  /// Controller output for the current state and conditions.
  ControlSignals current_signals() const;

  // === Temperatures ===
  const core::ThermalState &state() const { return state_; }
  const core::NodeArray &bodytemp() const { return state_.nodes(); }
  double tsk_mean() const;
  core::SegmentArray tsk() const { return state_.skin(); }
  core::SegmentArray tcr() const { return state_.core(); }
  double tcb() const { return state_.central_blood(); }
  core::SegmentArray tar() const { return state_.artery(); }
  core::SegmentArray tve() const { return state_.vein(); }
  std::vector<double> tsve() const { return state_.sfvein(); }
  std::vector<double> tms() const { return state_.muscle(); }
  std::vector<double> tfat() const { return state_.fat(); }

  const core::SegmentArray &setpoint_cr() const { return setpoint_cr_; }
  const core::SegmentArray &setpoint_sk() const { return setpoint_sk_; }

  // === Time and results ===
  double elapsed_time() const { return time_s_; }
  uint64_t cycle() const { return cycle_; }
  const ResultLog &results() const { return log_; }
  ResultTable results_table() const { return log_.table(config_.ex_output); }

private:
  /// One integration interval; fills `row` when given.
  void run_step(double dt, bool passive, ResultRow *row);

  Config config_;
  Anthropometry anthro_;

  thermal::HeatExchangeModel heat_exchange_;
  ThermoregulationController controller_;
  MetabolismModel metabolism_;
  BloodFlowDistributor circulation_;
  thermal::BioheatIntegrator integrator_;

  thermal::BoundaryConditions conditions_;
  core::ThermalState state_;
  core::SegmentArray setpoint_cr_{};
  core::SegmentArray setpoint_sk_{};

  double time_s_ = 0.0;
  uint64_t cycle_ = 0;
  ResultLog log_;
};

} // namespace biology
} // namespace bodytherm
