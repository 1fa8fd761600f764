/**
 * @file bioheat_integrator.cpp
 * @brief Implicit solve of the bioheat node network.
 */

#include <cmath>
#include <iostream>
#include <sstream>

#include <bodytherm/core/errors.hpp>
#include <bodytherm/thermal/bioheat_integrator.hpp>

namespace bodytherm {
namespace thermal {

using core::NUM_NODES;

BioheatIntegrator::BioheatIntegrator(const core::NodeArray &capacity_j_k,
                                     const Eigen::MatrixXd &conductance,
                                     const IntegratorConfig &config)
    : capacity_(capacity_j_k), conductance_(conductance), config_(config) {
  conductance_rowsum_ = conductance_.rowwise().sum();
}

size_t BioheatIntegrator::substeps(double dtime, bool passive) const {
  if (passive || dtime <= config_.max_substep_s)
    return 1;

  if (!config_.auto_subdivide) {
    std::ostringstream msg;
    msg << "time step " << dtime << " s exceeds the regulated step bound of "
        << config_.max_substep_s << " s";
    throw core::UnstableStepSizeError(msg.str());
  }

  auto n = static_cast<size_t>(std::ceil(dtime / config_.max_substep_s));
  if (config_.log_warnings) {
    std::cerr << "[Integrator] splitting " << dtime << " s step into " << n
              << " sub-steps" << std::endl;
  }
  return n;
}

void BioheatIntegrator::step(core::NodeArray &state, const StepLoad &load,
                             double dt) const {
  // (C/dt + sum(G + B) + h) T' - (G + B) T' = C/dt T + h T_env + Q
  Eigen::MatrixXd system = -(conductance_ + load.advection);
  Eigen::VectorXd advection_rowsum = load.advection.rowwise().sum();
  Eigen::VectorXd rhs(NUM_NODES);

  for (size_t i = 0; i < NUM_NODES; ++i) {
    const auto k = static_cast<Eigen::Index>(i);
    const double c_dt = capacity_[i] / dt;
    system(k, k) += c_dt + conductance_rowsum_(k) + advection_rowsum(k) +
                    load.boundary_w_k[i];
    rhs(k) = c_dt * state[i] + load.boundary_w_k[i] * load.boundary_temp_c[i] +
             load.heat_w[i];
  }

  Eigen::VectorXd next = system.partialPivLu().solve(rhs);

  for (size_t i = 0; i < NUM_NODES; ++i) {
    const double t = next(static_cast<Eigen::Index>(i));
    if (!std::isfinite(t)) {
      std::ostringstream msg;
      msg << "node " << core::node_name(i) << " diverged after a " << dt
          << " s step";
      throw core::UnstableStepSizeError(msg.str());
    }
    if (t < config_.min_temp_c || t > config_.max_temp_c) {
      std::ostringstream msg;
      msg << "node " << core::node_name(i) << " reached " << t
          << " °C, outside the " << config_.min_temp_c << "-"
          << config_.max_temp_c
          << " °C range the model represents under the current conditions";
      throw core::StateOutOfRangeError(msg.str());
    }
  }

  for (size_t i = 0; i < NUM_NODES; ++i) {
    state[i] = next(static_cast<Eigen::Index>(i));
  }
}

} // namespace thermal
} // namespace bodytherm
