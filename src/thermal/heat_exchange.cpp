/**
 * @file heat_exchange.cpp
 * @brief Convective/radiant coefficients and clothing resistances.
 */

#include <cmath>

#include <bodytherm/core/constants.hpp>
#include <bodytherm/thermal/heat_exchange.hpp>
#include <bodytherm/thermal/psychrometrics.hpp>

namespace bodytherm {
namespace thermal {

namespace {

using core::NUM_SEGMENTS;
using core::SegmentArray;

// Natural convection [W/(m²·K)]
constexpr SegmentArray HC_NATURAL_STANDING = {
    4.48, 4.48, 2.97, 2.91, 2.85, 3.61, 3.55, 3.67, 3.61,
    3.55, 3.67, 2.80, 2.04, 2.04, 2.80, 2.04, 2.04};
constexpr SegmentArray HC_NATURAL_SITTING = {
    4.75, 4.75, 3.12, 2.48, 1.84, 3.76, 3.62, 2.06, 3.76,
    3.62, 2.06, 2.98, 2.98, 2.62, 2.98, 2.98, 2.62};
constexpr SegmentArray HC_NATURAL_LYING = {
    1.105, 1.105, 1.211, 1.211, 1.211, 0.913, 2.081, 2.178, 0.913,
    2.081, 2.178, 0.945, 0.385, 0.200, 0.945, 0.385, 0.200};

// Forced convection hc = a·Va^b
constexpr SegmentArray HC_FORCED_A = {
    15.0, 15.0, 11.0, 17.0, 13.0, 17.0, 17.0, 20.0, 17.0,
    17.0, 20.0, 14.0, 15.8, 15.1, 14.0, 15.8, 15.1};
constexpr SegmentArray HC_FORCED_B = {
    0.62, 0.62, 0.67, 0.49, 0.60, 0.59, 0.61, 0.60, 0.59,
    0.61, 0.60, 0.61, 0.74, 0.62, 0.61, 0.74, 0.62};

// Linear radiation [W/(m²·K)]
constexpr SegmentArray HR_STANDING = {
    4.89, 4.89, 4.32, 4.09, 4.32, 4.55, 4.43, 4.21, 4.55,
    4.43, 4.21, 4.77, 5.34, 6.14, 4.77, 5.34, 6.14};
constexpr SegmentArray HR_SITTING = {
    4.96, 4.96, 3.99, 4.64, 4.21, 4.96, 4.21, 4.74, 4.96,
    4.21, 4.74, 4.10, 4.74, 6.36, 4.10, 4.74, 6.36};
constexpr SegmentArray HR_LYING = {
    5.475, 5.475, 3.463, 3.463, 3.463, 4.249, 4.835, 4.119, 4.249,
    4.835, 4.119, 4.440, 5.547, 6.085, 4.440, 5.547, 6.085};

} // namespace

const SegmentArray &HeatExchangeModel::natural_convection(Posture posture) {
  switch (posture) {
  case Posture::SITTING:
    return HC_NATURAL_SITTING;
  case Posture::LYING:
    return HC_NATURAL_LYING;
  case Posture::STANDING:
    break;
  }
  return HC_NATURAL_STANDING;
}

const SegmentArray &HeatExchangeModel::radiant_coefficient(Posture posture) {
  switch (posture) {
  case Posture::SITTING:
    return HR_SITTING;
  case Posture::LYING:
    return HR_LYING;
  case Posture::STANDING:
    break;
  }
  return HR_STANDING;
}

SegmentArray
HeatExchangeModel::convective_coefficient(Posture posture,
                                          const SegmentArray &va) const {
  const SegmentArray &natural = natural_convection(posture);
  SegmentArray hc;
  for (size_t i = 0; i < NUM_SEGMENTS; ++i) {
    if (va[i] < config_.forced_convection_va_ms) {
      hc[i] = natural[i];
    } else {
      hc[i] = HC_FORCED_A[i] * std::pow(va[i], HC_FORCED_B[i]);
    }
  }
  return hc;
}

DerivedResistances HeatExchangeModel::compute(const BoundaryConditions &bc) const {
  DerivedResistances r;
  r.hc = convective_coefficient(bc.posture(), bc.va());
  r.hr = radiant_coefficient(bc.posture());

  const double lr = constants::LEWIS_RATIO;
  for (size_t i = 0; i < NUM_SEGMENTS; ++i) {
    const double icl = bc.icl()[i];
    const double r_clo = constants::CLO_TO_M2KW * icl;
    const double hc = r.hc[i];
    const double hr = r.hr[i];

    r.fcl[i] = 1.0 + config_.clo_area_factor * icl;
    r.to[i] = (hc * bc.ta()[i] + hr * bc.tr()[i]) / (hc + hr);

    // Air layer in series with clothing
    r.rt[i] = 1.0 / ((hc + hr) * r.fcl[i]) + r_clo;
    r.ret[i] = 1.0 / (lr * hc * r.fcl[i]) +
               r_clo / (lr * constants::CLOTHING_PERMEABILITY);
  }
  return r;
}

SegmentArray HeatExchangeModel::dry_heat_loss(const DerivedResistances &r,
                                              const SegmentArray &tsk,
                                              const SegmentArray &bsa) {
  SegmentArray q;
  for (size_t i = 0; i < NUM_SEGMENTS; ++i) {
    q[i] = bsa[i] * (tsk[i] - r.to[i]) / r.rt[i];
  }
  return q;
}

SegmentArray HeatExchangeModel::evaporative_capacity(
    const DerivedResistances &r, const BoundaryConditions &bc,
    const SegmentArray &tsk, const SegmentArray &bsa) {
  SegmentArray e;
  for (size_t i = 0; i < NUM_SEGMENTS; ++i) {
    e[i] = thermal::evaporative_capacity(tsk[i], bc.ta()[i], bc.rh()[i],
                                         r.ret[i], bsa[i]);
  }
  return e;
}

} // namespace thermal
} // namespace bodytherm
