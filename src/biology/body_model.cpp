/**
 * @file body_model.cpp
 * @brief Per-step pipeline, setpoint derivation and getters.
 */

#include <cmath>
#include <sstream>

#include <bodytherm/biology/body_model.hpp>
#include <bodytherm/biology/tissue_network.hpp>
#include <bodytherm/core/constants.hpp>
#include <bodytherm/core/errors.hpp>
#include <bodytherm/thermal/comfort.hpp>

namespace bodytherm {
namespace biology {

namespace {

using core::NUM_NODES;
using core::NUM_SEGMENTS;
using core::Segment;
using core::SegmentArray;
using core::idx;

thermal::BioheatIntegrator make_integrator(const Anthropometry &anthro,
                                           const thermal::IntegratorConfig &cfg) {
  TissueNetwork net = build_tissue_network(anthro);
  return thermal::BioheatIntegrator(net.capacity_j_k, net.conductance, cfg);
}

} // namespace

ThermalBodyModel::ThermalBodyModel(const Config &config)
    : config_(config), anthro_(resolve_anthropometry(config.profile)),
      heat_exchange_(config.heat_exchange),
      controller_(config.profile, anthro_, config.controller, config.options),
      metabolism_(anthro_), circulation_(anthro_),
      integrator_(make_integrator(anthro_, config.integrator)) {
  conditions_.reset(config_.defaults);
  setpoint_cr_ = core::filled(37.0);
  setpoint_sk_ = core::filled(34.0);
  reset_setpoints();
}

void ThermalBodyModel::reset_setpoints() {
  const thermal::BoundaryConditions saved = conditions_;
  const ThermoregulationOptions options = controller_.options();

  // Thermoneutral reference: PMV = 0 for the body's own metabolic rate
  const double met = bmr() * config_.neutral_par / constants::MET_TO_WM2;
  thermal::BoundaryConditions neutral;
  neutral.set_to(thermal::preferred_temperature(met));
  neutral.set_rh(50.0);
  neutral.set_va(0.1);
  neutral.set_icl(0.0);
  neutral.set_par(config_.neutral_par);
  neutral.set_posture(saved.posture());
  conditions_ = neutral;

  ThermoregulationOptions passive = options;
  passive.ava_zero = true;
  controller_.set_options(passive);

  try {
    for (int i = 0; i < config_.setpoint_passes; ++i) {
      run_step(config_.setpoint_pass_s, true, nullptr);
    }
  } catch (...) {
    controller_.set_options(options);
    conditions_ = saved;
    throw;
  }

  controller_.set_options(options);
  conditions_ = saved;
  setpoint_cr_ = state_.core();
  setpoint_sk_ = state_.skin();
}

void ThermalBodyModel::simulate(int times, double dtime) {
  if (times < 1) {
    throw core::InvalidArgument("simulate: times must be at least 1, got " +
                                std::to_string(times));
  }
  if (!std::isfinite(dtime) || dtime <= 0.0) {
    std::ostringstream msg;
    msg << "simulate: dtime must be a positive number of seconds, got "
        << dtime;
    throw core::InvalidArgument(msg.str());
  }

  const size_t substeps = integrator_.substeps(dtime, false);
  const double dt = dtime / static_cast<double>(substeps);

  for (int k = 0; k < times; ++k) {
    const core::ThermalState before = state_;
    ResultRow row;
    try {
      for (size_t j = 0; j < substeps; ++j) {
        run_step(dt, false, j + 1 == substeps ? &row : nullptr);
      }
    } catch (const core::UnstableStepSizeError &) {
      state_ = before;
      throw;
    }

    ++cycle_;
    time_s_ += dtime;
    row.cycle = cycle_;
    row.time_s = time_s_;
    row.dt_s = dtime;
    log_.append(std::move(row));
  }
}

void ThermalBodyModel::run_step(double dt, bool passive, ResultRow *row) {
  const auto &layout = core::node_layout();
  const SegmentArray tcr = state_.core();
  const SegmentArray tsk = state_.skin();

  // Heat exchange -> control -> metabolism -> blood flow
  const thermal::DerivedResistances r = heat_exchange_.compute(conditions_);
  const ControlSignals s = controller_.compute(
      tcr, tsk, setpoint_cr_, setpoint_sk_, r, conditions_, passive);
  const HeatProduction q = metabolism_.compute(conditions_.par(), s);

  const size_t head = idx(Segment::HEAD);
  const RespiratoryLoss resp = MetabolismModel::respiration(
      conditions_.ta()[head], conditions_.rh()[head], q.total());

  BloodFlowState flows = circulation_.distribute(s, q);

  thermal::StepLoad load;
  for (size_t i = 0; i < NUM_SEGMENTS; ++i) {
    const auto skin = static_cast<size_t>(layout.skin[i]);
    load.heat_w[static_cast<size_t>(layout.core[i])] += q.core_w[i];
    if (layout.muscle[i] != core::NO_NODE)
      load.heat_w[static_cast<size_t>(layout.muscle[i])] += q.muscle_w[i];
    if (layout.fat[i] != core::NO_NODE)
      load.heat_w[static_cast<size_t>(layout.fat[i])] += q.fat_w[i];
    load.heat_w[skin] += q.skin_w[i] - s.e_sk[i];

    load.boundary_w_k[skin] = anthro_.bsa[i] / r.rt[i];
    load.boundary_temp_c[skin] = r.to[i];
  }
  load.heat_w[static_cast<size_t>(layout.core[idx(Segment::CHEST)])] -=
      resp.total();

  for (const auto &e : flows.edges) {
    load.add_advection(e.from, e.to,
                       constants::BLOOD_HEAT_CAPACITY * e.flow_lh);
  }

  integrator_.step(state_.nodes(), load, dt);

  if (row == nullptr)
    return;

  row->state = state_;
  row->setpoint_cr = setpoint_cr_;
  row->setpoint_sk = setpoint_sk_;
  row->conditions = conditions_;
  row->resistances = r;
  row->signals = s;
  row->production = q;
  row->respiration = resp;
  row->flows = std::move(flows);
  row->bsa = anthro_.bsa;

  row->sensible_loss_w =
      thermal::HeatExchangeModel::dry_heat_loss(r, state_.skin(), anthro_.bsa);
  row->tsk_mean = core::weighted_mean(state_.skin(), anthro_.bsa);
  row->wet_mean = core::weighted_mean(s.wet, anthro_.bsa);
  row->skin_heat_loss_w = core::sum(row->sensible_loss_w) + core::sum(s.e_sk);

  const double w0 = controller_.config().diffusion_wettedness;
  row->weight_loss_g_s =
      (core::sum(s.e_sweat) + w0 * core::sum(s.e_max) + resp.latent_w) /
      constants::LATENT_HEAT_SWEAT;
}

// ============================================================================
// STATE OVERRIDE
// ============================================================================

void ThermalBodyModel::set_bodytemp(const std::vector<double> &temps) {
  if (temps.size() != NUM_NODES) {
    std::ostringstream msg;
    msg << "bodytemp expects " << NUM_NODES << " values, got "
        << temps.size();
    throw core::InvalidArgument(msg.str());
  }

  core::NodeArray next;
  for (size_t i = 0; i < NUM_NODES; ++i) {
    const double t = temps[i];
    if (!std::isfinite(t) || t < constants::BODY_TEMP_MIN_C ||
        t > constants::BODY_TEMP_MAX_C) {
      std::ostringstream msg;
      msg << "bodytemp[" << core::node_name(i) << "] = " << t
          << " outside [" << constants::BODY_TEMP_MIN_C << ", "
          << constants::BODY_TEMP_MAX_C << "]";
      throw core::InvalidArgument(msg.str());
    }
    next[i] = t;
  }
  state_ = core::ThermalState(next);
}

void ThermalBodyModel::set_bodytemp(double temp) {
  set_bodytemp(std::vector<double>(NUM_NODES, temp));
}

// ============================================================================
// GETTERS
// ============================================================================

SegmentArray ThermalBodyModel::rt() const {
  return heat_exchange_.compute(conditions_).rt;
}

SegmentArray ThermalBodyModel::ret() const {
  return heat_exchange_.compute(conditions_).ret;
}

SegmentArray ThermalBodyModel::to() const {
  return heat_exchange_.compute(conditions_).to;
}

ControlSignals ThermalBodyModel::current_signals() const {
  return controller_.compute(state_.core(), state_.skin(), setpoint_cr_,
                             setpoint_sk_, heat_exchange_.compute(conditions_),
                             conditions_, false);
}

SegmentArray ThermalBodyModel::wet() const { return current_signals().wet; }

double ThermalBodyModel::wet_mean() const {
  return core::weighted_mean(wet(), anthro_.bsa);
}

double ThermalBodyModel::tsk_mean() const {
  return core::weighted_mean(state_.skin(), anthro_.bsa);
}

SegmentArray ThermalBodyModel::segment_blood_flow() const {
  const ControlSignals s = current_signals();
  const HeatProduction q = metabolism_.compute(conditions_.par(), s);
  return circulation_.distribute(s, q).segment_lh;
}

} // namespace biology
} // namespace bodytherm
