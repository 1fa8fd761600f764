/**
 * @file thermoregulation.cpp
 * @brief Feedback laws of the segmented thermoregulation model.
 */

#include <algorithm>
#include <cmath>

#include <bodytherm/biology/thermoregulation.hpp>
#include <bodytherm/biology/tissue_tables.hpp>
#include <bodytherm/thermal/psychrometrics.hpp>

namespace bodytherm {
namespace biology {

namespace {

using core::NUM_SEGMENTS;
using core::Segment;
using core::SegmentArray;
using core::idx;

// Skin thermoreceptor distribution
constexpr SegmentArray RECEPTOR_WEIGHT = {
    0.0549, 0.0146, 0.1492, 0.1321, 0.2122, 0.0227, 0.0117, 0.0923, 0.0227,
    0.0117, 0.0923, 0.0501, 0.0251, 0.0167, 0.0501, 0.0251, 0.0167};

constexpr SegmentArray SKIN_DILATION = {
    0.0692, 0.0992, 0.0580, 0.0679, 0.0707, 0.0400, 0.0373, 0.0632, 0.0400,
    0.0373, 0.0632, 0.0736, 0.0411, 0.0623, 0.0736, 0.0411, 0.0623};

constexpr SegmentArray SKIN_CONSTRICTION = {
    0.0213, 0.0213, 0.0638, 0.0638, 0.0638, 0.0213, 0.0213, 0.1489, 0.0213,
    0.0213, 0.1489, 0.0213, 0.0213, 0.1489, 0.0213, 0.0213, 0.1489};

// Vasodilation response of subjects aged 60 and over
constexpr SegmentArray DILATION_AGED = {
    0.91, 0.91, 0.47, 0.47, 0.31, 0.47, 0.47, 0.47, 0.47,
    0.47, 0.47, 0.31, 0.31, 0.31, 0.31, 0.31, 0.31};

constexpr SegmentArray SWEAT_GLAND = {
    0.064, 0.017, 0.146, 0.129, 0.206, 0.051, 0.026, 0.0155, 0.051,
    0.026, 0.0155, 0.073, 0.036, 0.0175, 0.073, 0.036, 0.0175};

constexpr SegmentArray SWEAT_AGED = {
    0.69, 0.69, 0.59, 0.52, 0.40, 0.75, 0.75, 0.75, 0.75,
    0.75, 0.75, 0.40, 0.40, 0.40, 0.40, 0.40, 0.40};

double shivering_age_factor(double age) {
  if (age < 30.0)
    return 1.0;
  if (age < 40.0)
    return 0.97514;
  if (age < 50.0)
    return 0.95028;
  if (age < 60.0)
    return 0.92818;
  if (age < 70.0)
    return 0.90055;
  if (age < 80.0)
    return 0.86188;
  return 0.82597;
}

} // namespace

ThermoregulationController::ThermoregulationController(
    const BodyProfile &profile, const Anthropometry &anthro,
    const Config &config, const ThermoregulationOptions &options)
    : profile_(profile), anthro_(anthro), config_(config), options_(options) {}

ControlSignals ThermoregulationController::compute(
    const SegmentArray &tcr, const SegmentArray &tsk, const SegmentArray &set_cr,
    const SegmentArray &set_sk, const thermal::DerivedResistances &resistances,
    const thermal::BoundaryConditions &bc, bool passive) const {
  ControlSignals s;
  if (!passive) {
    for (size_t i = 0; i < NUM_SEGMENTS; ++i) {
      s.err_cr[i] = tcr[i] - set_cr[i];
      s.err_sk[i] = tsk[i] - set_sk[i];
    }
  }

  receptor_signals(s);
  vasomotion(s);
  ava_opening(s);
  shivering(s, tcr, tsk);
  nonshivering(s);
  sweating(s, tsk, resistances, bc);
  return s;
}

void ThermoregulationController::receptor_signals(ControlSignals &s) const {
  s.wrms = 0.0;
  s.clds = 0.0;
  for (size_t i = 0; i < NUM_SEGMENTS; ++i) {
    s.wrms += std::max(s.err_sk[i], 0.0) * RECEPTOR_WEIGHT[i];
    s.clds += -std::min(s.err_sk[i], 0.0) * RECEPTOR_WEIGHT[i];
  }
}

void ThermoregulationController::vasomotion(ControlSignals &s) const {
  const double err_head = s.err_cr[idx(Segment::HEAD)];
  const double skin = s.wrms - s.clds;

  s.sig_dilation = std::max(100.5 * err_head + 6.4 * skin, 0.0);
  s.sig_constriction = std::max(-10.8 * err_head - 10.8 * skin, 0.0);

  const bool aged = profile_.age_years >= 60.0;
  for (size_t i = 0; i < NUM_SEGMENTS; ++i) {
    const double basal = tables::BFB_SKIN[i] * anthro_.bloodflow_ratio;
    const double sd = aged ? DILATION_AGED[i] : 1.0;

    double flow = (1.0 + SKIN_DILATION[i] * sd * s.sig_dilation) /
                  (1.0 + SKIN_CONSTRICTION[i] * s.sig_constriction) * basal *
                  std::pow(2.0, s.err_sk[i] / 6.0);

    s.skin_blood_flow[i] =
        std::clamp(flow, config_.min_perfusion_ratio * basal,
                   config_.max_vasodilation_ratio * basal);
  }
}

void ThermoregulationController::ava_opening(ControlSignals &s) const {
  if (options_.ava_zero) {
    s.ava_hand = 0.0;
    s.ava_foot = 0.0;
    return;
  }

  // Trunk core error weighted by chest/back/pelvis capacity
  const double w_chest = tables::CAP_CORE[idx(Segment::CHEST)];
  const double w_back = tables::CAP_CORE[idx(Segment::BACK)];
  const double w_pelvis = tables::CAP_CORE[idx(Segment::PELVIS)];
  const double err_bcr = (s.err_cr[idx(Segment::CHEST)] * w_chest +
                          s.err_cr[idx(Segment::BACK)] * w_back +
                          s.err_cr[idx(Segment::PELVIS)] * w_pelvis) /
                         (w_chest + w_back + w_pelvis);
  const double err_msk = core::weighted_mean(s.err_sk, tables::BSA_STANDARD);

  double sig_hand =
      0.265 * (err_msk + 0.43) + 0.953 * (err_bcr + 0.1905) + 0.9126;
  double sig_foot =
      0.265 * (err_msk - 0.997) + 0.953 * (err_bcr + 0.0095) + 0.9126;
  sig_hand = std::clamp(sig_hand, 0.0, 1.0);
  sig_foot = std::clamp(sig_foot, 0.0, 1.0);

  s.ava_hand = tables::BF_AVA_HAND_MAX * anthro_.bloodflow_ratio * sig_hand;
  s.ava_foot = tables::BF_AVA_FOOT_MAX * anthro_.bloodflow_ratio * sig_foot;
}

void ThermoregulationController::shivering(ControlSignals &s,
                                           const SegmentArray &tcr,
                                           const SegmentArray &tsk) const {
  const size_t head = idx(Segment::HEAD);
  double sig = 24.36 * std::max(s.clds - config_.shivering_cold_threshold, 0.0) *
               std::max(-s.err_cr[head], 0.0);

  if (options_.shivering_threshold) {
    const double tskm = core::weighted_mean(tsk, tables::BSA_STANDARD);
    double onset = 36.6;
    if (tskm >= 31.0) {
      onset = profile_.sex == Sex::MALE ? -0.2436 * tskm + 44.10
                                        : -0.2250 * tskm + 43.05;
    }
    if (onset < tcr[head])
      sig = 0.0;
  }

  sig *= shivering_age_factor(profile_.age_years);

  double total = 0.0;
  for (size_t i = 0; i < NUM_SEGMENTS; ++i) {
    s.shivering[i] = tables::SHIVER_FRACTION[i] * sig * anthro_.bsa_ratio;
    total += s.shivering[i];
  }

  const double cap = config_.max_shivering_bmr_ratio * anthro_.bmr_w;
  if (total > cap) {
    const double scale = cap / total;
    for (double &q : s.shivering)
      q *= scale;
  }
}

double ThermoregulationController::brown_adipose_tissue() const {
  const double age = profile_.age_years;
  double bat = std::pow(10.0, -0.10502 * anthro_.bmi + 2.7708);

  if (age < 30.0)
    bat *= 1.61;
  else if (age < 40.0)
    bat *= 1.00;
  else
    bat *= 0.80;

  if (options_.cold_acclimated)
    bat += 3.46;

  // Incidence of detectable BAT by age decade
  if (!options_.bat_positive) {
    if (age < 30.0)
      bat *= 44.0 / 83.0;
    else if (age < 40.0)
      bat *= 15.0 / 38.0;
    else if (age < 50.0)
      bat *= 7.0 / 26.0;
    else if (age < 60.0)
      bat *= 1.0 / 8.0;
    else
      bat = 0.0;
  }
  return bat;
}

void ThermoregulationController::nonshivering(ControlSignals &s) const {
  s.nonshivering.fill(0.0);
  if (!options_.nonshivering_thermogenesis)
    return;

  const double limit = 1.80 * brown_adipose_tissue() + 2.43 + 5.62;
  const double sig = std::min(2.8273 * s.clds, limit);
  for (size_t i = 0; i < NUM_SEGMENTS; ++i) {
    s.nonshivering[i] = tables::NST_FRACTION[i] * sig * anthro_.bsa_ratio;
  }
}

void ThermoregulationController::sweating(
    ControlSignals &s, const SegmentArray &tsk,
    const thermal::DerivedResistances &resistances,
    const thermal::BoundaryConditions &bc) const {
  const double err_head = s.err_cr[idx(Segment::HEAD)];
  double sig = std::max(371.2 * err_head + 33.64 * (s.wrms - s.clds), 0.0);
  sig *= anthro_.bsa_ratio;

  const bool aged = profile_.age_years >= 60.0;
  const double w0 = config_.diffusion_wettedness;

  s.e_max = thermal::HeatExchangeModel::evaporative_capacity(resistances, bc,
                                                             tsk, anthro_.bsa);
  for (size_t i = 0; i < NUM_SEGMENTS; ++i) {
    s.e_max[i] = std::max(s.e_max[i], config_.min_evaporative_capacity);

    const double sd = aged ? SWEAT_AGED[i] : 1.0;
    const double demand =
        SWEAT_GLAND[i] * sig * sd * std::pow(2.0, s.err_sk[i] / 10.0);

    // Fully wet skin cannot evaporate faster than e_max
    s.wet[i] = std::min(w0 + (1.0 - w0) * demand / s.e_max[i], 1.0);
    s.e_sk[i] = s.wet[i] * s.e_max[i];
    s.e_sweat[i] = (s.wet[i] - w0) / (1.0 - w0) * s.e_max[i];
  }
}

} // namespace biology
} // namespace bodytherm
