#pragma once

/**
 * @file bioheat_integrator.hpp
 * @brief Backward-Euler integration of the lumped bioheat network.
 *
 * Features:
 * - Dense implicit solve of the node network (Eigen)
 * - Symmetric tissue conduction plus directed blood advection
 * - Skin boundary conductance against operative temperature
 * - Step-size guard for explicitly lagged control signals
 */

#include <cstddef>

#include <Eigen/Dense>

#include <bodytherm/core/segments.hpp>

namespace bodytherm {
namespace thermal {

/**
 * @brief Per-step loads on the network.
 */
struct StepLoad {
  core::NodeArray heat_w{};          // internal sources [W]
  core::NodeArray boundary_w_k{};    // conductance to surroundings [W/K]
  core::NodeArray boundary_temp_c{}; // surroundings temperature [°C]
  Eigen::MatrixXd advection;         // [to, from] blood heat transport [W/K]

  StepLoad()
      : advection(Eigen::MatrixXd::Zero(core::NUM_NODES, core::NUM_NODES)) {}

  /// Adds a blood flow carrying heat from node `from` into node `to`.
  void add_advection(int from, int to, double w_k) {
    advection(to, from) += w_k;
  }
};

/**
 * @brief Integration settings.
 */
struct IntegratorConfig {
  double max_substep_s = 600.0; // bound for actively regulated steps
  bool auto_subdivide = true;   // split long steps instead of failing
  bool log_warnings = true;
  double min_temp_c = 0.0;
  double max_temp_c = 50.0;
};

class BioheatIntegrator {
public:
  /**
   * @param capacity_j_k Node heat capacities [J/K]
   * @param conductance Symmetric tissue conductances [W/K], zero diagonal
   */
  BioheatIntegrator(const core::NodeArray &capacity_j_k,
                    const Eigen::MatrixXd &conductance,
                    const IntegratorConfig &config = IntegratorConfig{});

  /**
   * @brief Number of equal sub-steps used for an interval.
   *
   * Passive steps are unbounded. Throws core::UnstableStepSizeError when
   * an active interval exceeds the bound and subdivision is disabled.
   */
  size_t substeps(double dtime, bool passive) const;

  /**
   * @brief Advances the state by dt seconds.
   *
   * The state is left untouched on failure. A non-finite solution raises
   * core::UnstableStepSizeError; a finite one outside the band raises
   * core::StateOutOfRangeError.
   */
  void step(core::NodeArray &state, const StepLoad &load, double dt) const;

  const core::NodeArray &capacity() const { return capacity_; }
  const Eigen::MatrixXd &conductance() const { return conductance_; }
  const IntegratorConfig &config() const { return config_; }

private:
  core::NodeArray capacity_;
  Eigen::MatrixXd conductance_;
  Eigen::VectorXd conductance_rowsum_;
  IntegratorConfig config_;
};

} // namespace thermal
} // namespace bodytherm
