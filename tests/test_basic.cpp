/**
 * @file test_basic.cpp
 * @brief Unit tests for the model building blocks.
 */

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <set>
#include <vector>

#include <bodytherm/biology/anthropometry.hpp>
#include <bodytherm/biology/circulation.hpp>
#include <bodytherm/biology/metabolism.hpp>
#include <bodytherm/biology/tissue_network.hpp>
#include <bodytherm/biology/tissue_tables.hpp>
#include <bodytherm/biology/thermoregulation.hpp>
#include <bodytherm/core/constants.hpp>
#include <bodytherm/core/errors.hpp>
#include <bodytherm/core/segments.hpp>
#include <bodytherm/thermal/bioheat_integrator.hpp>
#include <bodytherm/thermal/boundary_conditions.hpp>
#include <bodytherm/thermal/comfort.hpp>
#include <bodytherm/thermal/heat_exchange.hpp>
#include <bodytherm/thermal/psychrometrics.hpp>

using namespace bodytherm;
using core::Segment;
using core::idx;

namespace {

template <typename E, typename Fn> bool throws(Fn &&fn) {
  try {
    fn();
  } catch (const E &) {
    return true;
  }
  return false;
}

bool near(double a, double b, double tol) { return std::abs(a - b) <= tol; }

} // namespace

void test_constants() {
  std::cout << "Testing constants..." << std::endl;
  assert(near(core::sum(biology::tables::BSA_STANDARD),
              constants::STANDARD_BSA_M2, 1e-9));
  assert(near(core::sum(biology::tables::WORK_FRACTION), 1.0, 1e-9));
  assert(near(core::sum(biology::tables::SHIVER_FRACTION), 1.0, 1e-4));
  assert(near(core::sum(biology::tables::NST_FRACTION), 1.0, 1e-9));
  std::cout << "  Constants: PASS" << std::endl;
}

void test_node_layout() {
  std::cout << "Testing node layout..." << std::endl;
  const auto &layout = core::node_layout();

  assert(layout.central_blood == 0);
  assert(layout.sfvein_segments.size() == core::NUM_SFVEIN);
  assert(layout.muscle_segments.size() == core::NUM_MUSCLE);
  assert(layout.fat_segments.size() == core::NUM_FAT);

  // Every node index used exactly once, covering 0..84
  std::set<int> seen = {0};
  for (size_t s = 0; s < core::NUM_SEGMENTS; ++s) {
    for (int n : {layout.artery[s], layout.vein[s], layout.sfvein[s],
                  layout.core[s], layout.muscle[s], layout.fat[s],
                  layout.skin[s]}) {
      if (n == core::NO_NODE)
        continue;
      assert(seen.insert(n).second);
    }
  }
  assert(seen.size() == core::NUM_NODES);
  assert(*seen.rbegin() == static_cast<int>(core::NUM_NODES) - 1);

  assert(layout.has(Segment::HEAD, core::Layer::MUSCLE));
  assert(layout.has(Segment::PELVIS, core::Layer::FAT));
  assert(!layout.has(Segment::CHEST, core::Layer::MUSCLE));
  assert(!layout.has(Segment::NECK, core::Layer::SFVEIN));
  assert(layout.has(Segment::L_SHOULDER, core::Layer::SFVEIN));
  assert(layout.has(Segment::R_FOOT, core::Layer::SFVEIN));

  assert(core::node_name(0) == "CB");
  assert(core::node_name(static_cast<size_t>(
             layout.skin[idx(Segment::HEAD)])) == "Head.skin");
  assert(core::node_name(static_cast<size_t>(
             layout.sfvein[idx(Segment::L_HAND)])) == "LHand.sfvein");
  std::cout << "  Node layout: PASS" << std::endl;
}

void test_anthropometry() {
  std::cout << "Testing anthropometry..." << std::endl;

  biology::BodyProfile standard;
  auto a = biology::resolve_anthropometry(standard);
  assert(a.bsa_total > 1.8 && a.bsa_total < 1.95);
  assert(a.bmr_w > 80.0 && a.bmr_w < 95.0);
  assert(near(a.weight_ratio, 1.0, 1e-12));
  assert(near(a.cardiac_output_lh, 2.6432 * 60.0 * a.bsa_total, 1e-9));

  // Local areas always add up to the whole-body value
  const biology::BsaEquation equations[] = {
      biology::BsaEquation::DUBOIS, biology::BsaEquation::TAKAHIRA,
      biology::BsaEquation::FUJIMOTO, biology::BsaEquation::KURAZUMI};
  for (auto eq : equations) {
    for (double h : {1.5, 1.72, 1.95}) {
      for (double w : {45.0, 74.43, 110.0}) {
        biology::BodyProfile p;
        p.height_m = h;
        p.weight_kg = w;
        p.bsa_equation = eq;
        auto r = biology::resolve_anthropometry(p);
        assert(near(core::sum(r.bsa), r.bsa_total, 1e-9));
        assert(near(r.bsa_total, biology::body_surface_area(h, w, eq), 1e-12));
      }
    }
  }

  // Older hearts pump less per square metre
  biology::BodyProfile old = standard;
  old.age_years = 65.0;
  auto ao = biology::resolve_anthropometry(old);
  assert(near(ao.cardiac_output_lh, 0.75 * a.cardiac_output_lh, 1e-9));

  biology::BodyProfile female = standard;
  female.sex = biology::Sex::FEMALE;
  assert(biology::basal_metabolic_rate(female) <
         biology::basal_metabolic_rate(standard));

  std::cout << "  Anthropometry: PASS" << std::endl;
}

void test_configuration_errors() {
  std::cout << "Testing configuration errors..." << std::endl;
  using core::ConfigurationError;

  assert(throws<ConfigurationError>([] { biology::parse_sex("other"); }));
  assert(throws<ConfigurationError>(
      [] { biology::parse_bmr_equation("mifflin"); }));
  assert(throws<ConfigurationError>(
      [] { biology::parse_bsa_equation("mosteller"); }));
  assert(biology::parse_bsa_equation("kurazumi") ==
         biology::BsaEquation::KURAZUMI);
  assert(biology::parse_bmr_equation("japanese") ==
         biology::BmrEquation::JAPANESE);

  auto rejected = [](biology::BodyProfile p) {
    return throws<ConfigurationError>(
        [&] { biology::resolve_anthropometry(p); });
  };

  biology::BodyProfile p;
  p.height_m = -1.0;
  assert(rejected(p));
  p = biology::BodyProfile{};
  p.weight_kg = std::nan("");
  assert(rejected(p));
  p = biology::BodyProfile{};
  p.fat_percent = 100.0;
  assert(rejected(p));
  p = biology::BodyProfile{};
  p.age_years = 12.0;
  assert(rejected(p));
  p = biology::BodyProfile{};
  p.cardiac_index = 0.0;
  assert(rejected(p));

  // Ganpule regression only covers 20-74 years
  p = biology::BodyProfile{};
  p.bmr_equation = biology::BmrEquation::JAPANESE;
  p.age_years = 19.0;
  assert(rejected(p));
  p.age_years = 80.0;
  assert(rejected(p));
  p.age_years = 30.0;
  assert(!rejected(p));

  std::cout << "  Configuration errors: PASS" << std::endl;
}

void test_boundary_conditions() {
  std::cout << "Testing boundary conditions..." << std::endl;
  using core::InvalidBoundaryCondition;

  thermal::BoundaryConditions bc;
  assert(bc.ta()[0] == 28.8 && bc.tr()[16] == 28.8);
  assert(bc.par() == 1.2);
  assert(bc.posture() == thermal::Posture::STANDING);
  assert(!bc.operative_mode());

  // Scalar broadcast equals an explicit sequence
  thermal::BoundaryConditions a;
  thermal::BoundaryConditions b;
  a.set_va(0.35);
  b.set_va(std::vector<double>(core::NUM_SEGMENTS, 0.35));
  assert(a.va() == b.va());
  a.set_icl(0.7);
  b.set_icl(std::vector<double>(core::NUM_SEGMENTS, 0.7));
  assert(a.icl() == b.icl());
  a.set_rh(45.0);
  b.set_rh(std::vector<double>(core::NUM_SEGMENTS, 45.0));
  assert(a.rh() == b.rh());
  a.set_ta(31.0);
  b.set_ta(std::vector<double>(core::NUM_SEGMENTS, 31.0));
  assert(a.ta() == b.ta() && a.tr() == b.tr());
  a.set_tr(26.5);
  b.set_tr(std::vector<double>(core::NUM_SEGMENTS, 26.5));
  assert(a.ta() == b.ta() && a.tr() == b.tr());

  thermal::BoundaryConditions c;
  thermal::BoundaryConditions d;
  c.set_to(22.0);
  d.set_to(std::vector<double>(core::NUM_SEGMENTS, 22.0));
  assert(c.ta() == d.ta() && c.tr() == d.tr());
  assert(c.operative_mode() && d.operative_mode());

  // Sticky fields
  a.set_rh(65.0);
  a.set_par(1.6);
  assert(a.va()[3] == 0.35 && a.icl()[7] == 0.7);

  // Validation, never clamping
  assert(throws<InvalidBoundaryCondition>([&] { a.set_rh(101.0); }));
  assert(throws<InvalidBoundaryCondition>([&] { a.set_va(-0.1); }));
  assert(throws<InvalidBoundaryCondition>([&] { a.set_icl(-1.0); }));
  assert(throws<InvalidBoundaryCondition>([&] { a.set_par(0.5); }));
  assert(throws<InvalidBoundaryCondition>([&] { a.set_ta(std::nan("")); }));
  assert(throws<InvalidBoundaryCondition>([&] { a.set_tr(80.0); }));
  assert(throws<InvalidBoundaryCondition>(
      [&] { a.set_va(std::vector<double>(16, 0.1)); }));
  assert(a.rh()[0] == 65.0 && a.par() == 1.6);

  assert(throws<InvalidBoundaryCondition>([&] { a.set_posture("kneeling"); }));
  a.set_posture("sedentary");
  assert(a.posture() == thermal::Posture::SITTING);
  a.set_posture("supine");
  assert(a.posture() == thermal::Posture::LYING);

  // Reset to a custom baseline, then to the built-in one
  thermal::BoundaryDefaults cool;
  cool.ta_c = 18.0;
  cool.tr_c = 18.0;
  a.reset(cool);
  assert(a.ta()[0] == 18.0 && a.tr()[16] == 18.0);
  assert(a.rh()[0] == 50.0 && a.posture() == thermal::Posture::STANDING);
  a.reset();
  assert(a.ta()[0] == 28.8 && a.par() == 1.2);

  std::cout << "  Boundary conditions: PASS" << std::endl;
}

void test_operative_temperature_rules() {
  std::cout << "Testing operative temperature rules..." << std::endl;
  using core::InvalidBoundaryCondition;

  // To is free while Ta == Tr
  thermal::BoundaryConditions bc;
  bc.set_to(24.0);
  assert(bc.operative_mode());
  assert(bc.ta()[0] == 24.0 && bc.tr()[0] == 24.0);

  // A lone Ta that splits the pair is rejected and changes nothing
  assert(throws<InvalidBoundaryCondition>([&] { bc.set_ta(26.0); }));
  assert(bc.ta()[0] == 24.0 && bc.operative_mode());

  // Reconciling both together is accepted and clears the shortcut
  bc.set_air_radiant(26.0, 27.0);
  assert(!bc.operative_mode());
  assert(bc.ta()[0] == 26.0 && bc.tr()[0] == 27.0);

  // To refused once Ta and Tr differ
  assert(throws<InvalidBoundaryCondition>([&] { bc.set_to(22.0); }));

  // A lone Ta matching Tr is accepted and leaves operative mode
  thermal::BoundaryConditions c;
  c.set_to(25.0);
  c.set_ta(25.0);
  assert(!c.operative_mode());
  c.set_tr(27.0);
  assert(throws<InvalidBoundaryCondition>([&] { c.set_to(22.0); }));
  c.set_ta(27.0);
  c.set_to(22.0);
  assert(c.ta() == c.tr());

  std::cout << "  Operative temperature rules: PASS" << std::endl;
}

void test_psychrometrics() {
  std::cout << "Testing psychrometrics..." << std::endl;
  // ~3.17 kPa at 25 C, ~6.28 kPa at 37 C
  assert(near(thermal::saturation_vapor_pressure(25.0), 3170.0, 40.0));
  assert(near(thermal::saturation_vapor_pressure(37.0), 6280.0, 80.0));
  assert(near(thermal::vapor_pressure(25.0, 50.0),
              0.5 * thermal::saturation_vapor_pressure(25.0), 1e-9));
  // Air wetter than skin: no evaporation
  assert(thermal::evaporative_capacity(30.0, 40.0, 90.0, 20.0, 1.0) == 0.0);
  std::cout << "  Psychrometrics: PASS" << std::endl;
}

void test_heat_exchange() {
  std::cout << "Testing heat exchange..." << std::endl;
  thermal::HeatExchangeModel hx;
  thermal::BoundaryConditions bc;

  // Below 0.2 m/s the natural convection table applies
  auto still = hx.compute(bc);
  const auto &natural =
      thermal::HeatExchangeModel::natural_convection(thermal::Posture::STANDING);
  assert(still.hc == natural);

  // Nude: Ret = 1 / (LR hc fcl), Pa m2/W
  for (size_t i = 0; i < core::NUM_SEGMENTS; ++i) {
    assert(near(still.fcl[i], 1.0, 1e-12));
    assert(near(still.ret[i], 1.0 / (constants::LEWIS_RATIO * still.hc[i]),
                1e-9));
    assert(still.ret[i] > 5.0 && still.ret[i] < 100.0);
    assert(near(still.to[i], 28.8, 1e-9));
  }

  // Forced convection lowers dry resistance, clothing raises it
  bc.set_va(1.0);
  auto windy = hx.compute(bc);
  for (size_t i = 0; i < core::NUM_SEGMENTS; ++i) {
    assert(windy.rt[i] < still.rt[i]);
  }

  // A higher forced-convection onset keeps 1 m/s on the natural table
  thermal::HeatExchangeConfig sheltered;
  sheltered.forced_convection_va_ms = 2.0;
  thermal::HeatExchangeModel calm(sheltered);
  assert(calm.compute(bc).hc == natural);
  bc.set_icl(1.0);
  auto dressed = hx.compute(bc);
  for (size_t i = 0; i < core::NUM_SEGMENTS; ++i) {
    assert(dressed.rt[i] > windy.rt[i] + 0.1);
    assert(dressed.ret[i] > windy.ret[i]);
  }

  // Operative temperature lies between air and radiant temperature
  bc.set_air_radiant(20.0, 30.0);
  auto split = hx.compute(bc);
  for (double to : split.to) {
    assert(to > 20.0 && to < 30.0);
  }

  // Posture selects different tables
  bc.set_posture(thermal::Posture::LYING);
  auto lying = hx.compute(bc);
  assert(lying.hr != split.hr);

  std::cout << "  Heat exchange: PASS" << std::endl;
}

void test_comfort() {
  std::cout << "Testing comfort indices..." << std::endl;
  // ISO 7730 reference case: PMV about -0.75
  double pmv = thermal::predicted_mean_vote(22.0, 22.0, 0.1, 60.0, 1.2, 0.5);
  assert(pmv > -0.95 && pmv < -0.55);

  // Warmer is warmer
  assert(thermal::predicted_mean_vote(27.0, 27.0, 0.1, 50.0, 1.2, 0.5) > pmv);

  double to = thermal::preferred_temperature(1.0);
  assert(to > 26.0 && to < 31.0);
  assert(std::abs(thermal::predicted_mean_vote(to, to, 0.1, 50.0, 1.0, 0.0)) <
         0.01);

  // More activity, cooler preference
  assert(thermal::preferred_temperature(1.6) < to);

  // A search that cannot settle is an error, not a silent last guess
  assert(throws<core::Error>(
      [] { thermal::preferred_temperature(std::nan("")); }));
  std::cout << "  Comfort indices: PASS" << std::endl;
}

void test_controller() {
  std::cout << "Testing thermoregulation controller..." << std::endl;
  biology::BodyProfile profile;
  auto anthro = biology::resolve_anthropometry(profile);
  biology::ThermoregulationController ctrl(profile, anthro);
  thermal::HeatExchangeModel hx;
  thermal::BoundaryConditions bc;
  auto r = hx.compute(bc);

  const auto set_cr = core::filled(37.0);
  const auto set_sk = core::filled(34.0);

  // At setpoint: basal skin flow, insensible wettedness only
  auto neutral = ctrl.compute(set_cr, set_sk, set_cr, set_sk, r, bc, false);
  assert(neutral.wrms == 0.0 && neutral.clds == 0.0);
  for (size_t i = 0; i < core::NUM_SEGMENTS; ++i) {
    assert(near(neutral.skin_blood_flow[i],
                biology::tables::BFB_SKIN[i] * anthro.bloodflow_ratio, 1e-9));
    assert(near(neutral.wet[i], 0.06, 1e-12));
    assert(neutral.shivering[i] == 0.0);
  }

  // Hot: dilation and sweating, wettedness saturates at 1
  auto hot = ctrl.compute(core::filled(39.5), core::filled(37.5), set_cr,
                          set_sk, r, bc, false);
  assert(hot.sig_dilation > 0.0 && hot.sig_constriction == 0.0);
  for (size_t i = 0; i < core::NUM_SEGMENTS; ++i) {
    assert(hot.skin_blood_flow[i] > neutral.skin_blood_flow[i]);
    assert(hot.wet[i] <= 1.0);
    assert(near(hot.e_sk[i], hot.wet[i] * hot.e_max[i], 1e-9));
  }
  assert(*std::max_element(hot.wet.begin(), hot.wet.end()) == 1.0);

  // Any sweat demand stays within the ceiling
  thermal::BoundaryConditions muggy;
  muggy.set_to(40.0);
  muggy.set_rh(95.0);
  auto rm = hx.compute(muggy);
  auto soaked = ctrl.compute(core::filled(41.0), core::filled(39.0), set_cr,
                             set_sk, rm, muggy, false);
  for (double w : soaked.wet) {
    assert(w >= 0.06 && w <= 1.0);
  }

  // Cold: constriction bounded by the perfusion floor, shivering capped
  auto cold = ctrl.compute(core::filled(35.5), core::filled(25.0), set_cr,
                           set_sk, r, bc, false);
  assert(cold.sig_constriction > 0.0 && cold.sig_dilation == 0.0);
  double shiver = 0.0;
  for (size_t i = 0; i < core::NUM_SEGMENTS; ++i) {
    const double basal = biology::tables::BFB_SKIN[i] * anthro.bloodflow_ratio;
    assert(cold.skin_blood_flow[i] >=
           ctrl.config().min_perfusion_ratio * basal - 1e-12);
    shiver += cold.shivering[i];
  }
  assert(shiver > 0.0);
  assert(shiver <= ctrl.config().max_shivering_bmr_ratio * anthro.bmr_w + 1e-9);
  assert(cold.ava_hand == 0.0);

  // Passive evaluation ignores the temperature error
  auto passive = ctrl.compute(core::filled(35.5), core::filled(25.0), set_cr,
                              set_sk, r, bc, true);
  assert(passive.clds == 0.0 && core::sum(passive.shivering) == 0.0);

  // AVA can be forced shut
  biology::ThermoregulationOptions closed;
  closed.ava_zero = true;
  ctrl.set_options(closed);
  auto shut = ctrl.compute(set_cr, set_sk, set_cr, set_sk, r, bc, false);
  assert(shut.ava_hand == 0.0 && shut.ava_foot == 0.0);
  assert(neutral.ava_hand > 0.0);

  std::cout << "  Thermoregulation controller: PASS" << std::endl;
}

void test_blood_flow() {
  std::cout << "Testing blood flow distribution..." << std::endl;
  biology::BodyProfile profile;
  auto anthro = biology::resolve_anthropometry(profile);
  biology::ThermoregulationController ctrl(profile, anthro);
  biology::MetabolismModel metabolism(anthro);
  biology::BloodFlowDistributor circulation(anthro);
  thermal::HeatExchangeModel hx;
  thermal::BoundaryConditions bc;
  auto r = hx.compute(bc);

  const auto set_cr = core::filled(37.0);
  const auto set_sk = core::filled(34.0);
  const double scenarios[][2] = {
      {37.0, 34.0}, {39.0, 37.0}, {35.8, 26.0}, {37.2, 30.0}};

  for (const auto &sc : scenarios) {
    for (double par : {1.0, 1.2, 4.0}) {
      auto s = ctrl.compute(core::filled(sc[0]), core::filled(sc[1]), set_cr,
                            set_sk, r, bc, false);
      auto q = metabolism.compute(par, s);
      auto flows = circulation.distribute(s, q);

      // Segment flows add up to cardiac output
      assert(near(core::sum(flows.segment_lh), anthro.cardiac_output_lh,
                  1e-9 * anthro.cardiac_output_lh));

      // Every node passes on what it receives
      std::vector<double> in(core::NUM_NODES, 0.0);
      std::vector<double> out(core::NUM_NODES, 0.0);
      for (const auto &e : flows.edges) {
        assert(e.flow_lh >= 0.0);
        out[static_cast<size_t>(e.from)] += e.flow_lh;
        in[static_cast<size_t>(e.to)] += e.flow_lh;
      }
      for (size_t n = 0; n < core::NUM_NODES; ++n) {
        assert(near(in[n], out[n], 1e-9 * anthro.cardiac_output_lh));
      }
      assert(near(in[0], anthro.cardiac_output_lh,
                  1e-9 * anthro.cardiac_output_lh));
    }
  }
  std::cout << "  Blood flow distribution: PASS" << std::endl;
}

void test_metabolism() {
  std::cout << "Testing metabolism..." << std::endl;
  biology::BodyProfile profile;
  auto anthro = biology::resolve_anthropometry(profile);
  biology::MetabolismModel metabolism(anthro);
  biology::ControlSignals quiet;

  assert(near(metabolism.basal().total(), anthro.bmr_w, 1e-9));
  auto rest = metabolism.compute(1.0, quiet);
  auto work = metabolism.compute(2.0, quiet);
  assert(near(rest.total(), anthro.bmr_w, 1e-9));
  assert(near(work.total(), 2.0 * anthro.bmr_w, 1e-9));
  // Leg muscles take the largest share of work
  assert(work.work_w[idx(Segment::L_THIGH)] > work.work_w[idx(Segment::CHEST)]);

  auto resp = biology::MetabolismModel::respiration(20.0, 50.0, 100.0);
  assert(resp.sensible_w > 0.0 && resp.latent_w > 0.0);
  auto hot = biology::MetabolismModel::respiration(38.0, 50.0, 100.0);
  assert(hot.sensible_w < 0.0);
  std::cout << "  Metabolism: PASS" << std::endl;
}

void test_integrator() {
  std::cout << "Testing bioheat integrator..." << std::endl;
  biology::BodyProfile profile;
  auto anthro = biology::resolve_anthropometry(profile);
  auto net = biology::build_tissue_network(anthro);

  // Symmetric conductance network with positive capacities
  assert((net.conductance - net.conductance.transpose()).norm() < 1e-12);
  for (double c : net.capacity_j_k)
    assert(c > 0.0);

  thermal::BioheatIntegrator integrator(net.capacity_j_k, net.conductance);
  assert(integrator.substeps(60.0, false) == 1);
  assert(integrator.substeps(1800.0, false) == 3);
  assert(integrator.substeps(60000.0, true) == 1);

  thermal::IntegratorConfig strict;
  strict.auto_subdivide = false;
  strict.log_warnings = false;
  thermal::BioheatIntegrator strict_integrator(net.capacity_j_k,
                                               net.conductance, strict);
  assert(throws<core::UnstableStepSizeError>(
      [&] { strict_integrator.substeps(1800.0, false); }));

  // Isolated uniform body stays put
  core::NodeArray state;
  state.fill(36.0);
  thermal::StepLoad idle;
  integrator.step(state, idle, 600.0);
  for (double t : state)
    assert(near(t, 36.0, 1e-9));

  // Heating raises every node towards the source
  thermal::StepLoad heated;
  heated.heat_w[core::node_layout().central_blood] = 100.0;
  integrator.step(state, heated, 60.0);
  assert(state[0] > 36.0);

  // Leaving the physiological band is refused without touching the state
  const core::NodeArray before = state;
  thermal::StepLoad blast;
  blast.heat_w.fill(1e7);
  assert(throws<core::UnstableStepSizeError>(
      [&] { integrator.step(state, blast, 600.0); }));
  assert(state == before);

  std::cout << "  Bioheat integrator: PASS" << std::endl;
}

int main() {
  std::cout << "=== Running Unit Tests ===" << std::endl;

  test_constants();
  test_node_layout();
  test_anthropometry();
  test_configuration_errors();
  test_boundary_conditions();
  test_operative_temperature_rules();
  test_psychrometrics();
  test_heat_exchange();
  test_comfort();
  test_controller();
  test_blood_flow();
  test_metabolism();
  test_integrator();

  std::cout << std::endl;
  std::cout << "All tests PASSED!" << std::endl;
  return 0;
}
