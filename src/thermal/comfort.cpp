/**
 * @file comfort.cpp
 * @brief PMV (ISO 7730) and preferred operative temperature.
 */

#include <algorithm>
#include <cmath>

#include <bodytherm/core/constants.hpp>
#include <bodytherm/core/errors.hpp>
#include <bodytherm/thermal/comfort.hpp>

namespace bodytherm {
namespace thermal {

double predicted_mean_vote(double ta, double tr, double va, double rh,
                           double met, double clo, double wmet) {
  const double m = met * constants::MET_TO_WM2;
  const double w = wmet * constants::MET_TO_WM2;
  const double icl = clo * constants::CLO_TO_M2KW;
  const double mw = m - w;

  // Water vapour pressure of air [Pa]
  const double pa = rh * 10.0 * std::exp(16.6536 - 4030.183 / (ta + 235.0));

  const double fcl = icl <= 0.078 ? 1.0 + 1.29 * icl : 1.05 + 0.645 * icl;

  // Clothing surface temperature by fixed-point iteration (Kelvin / 100)
  const double taa = ta + 273.0;
  const double tra = tr + 273.0;
  const double tcla = taa + (35.5 - ta) / (3.5 * icl + 0.1);

  const double p1 = icl * fcl;
  const double p2 = p1 * 3.96;
  const double p3 = p1 * 100.0;
  const double p4 = p1 * taa;
  const double p5 = 308.7 - 0.028 * mw + p2 * std::pow(tra / 100.0, 4);

  double xn = tcla / 100.0;
  double xf = tcla / 50.0;
  double hc = 0.0;
  int iterations = 0;
  while (std::abs(xn - xf) > 0.00015) {
    xf = (xf + xn) / 2.0;
    double hcn = 2.38 * std::pow(std::abs(100.0 * xf - taa), 0.25);
    double hcf = 12.1 * std::sqrt(va);
    hc = std::max(hcf, hcn);
    xn = (p5 + p4 * hc - p2 * std::pow(xf, 4)) / (100.0 + p3 * hc);
    if (++iterations > 150) {
      throw core::Error("PMV clothing temperature iteration did not converge");
    }
  }
  const double tcl = 100.0 * xn - 273.0;

  // Heat loss components [W/m²]
  const double hl1 = 3.05e-3 * (5733.0 - 6.99 * mw - pa); // skin diffusion
  const double hl2 = mw > constants::MET_TO_WM2
                         ? 0.42 * (mw - constants::MET_TO_WM2)
                         : 0.0;                         // sweating
  const double hl3 = 1.7e-5 * m * (5867.0 - pa);        // latent respiration
  const double hl4 = 0.0014 * m * (34.0 - ta);          // dry respiration
  const double hl5 = 3.96 * fcl * (std::pow(xn, 4) - std::pow(tra / 100.0, 4));
  const double hl6 = fcl * hc * (tcl - ta);             // convection

  const double ts = 0.303 * std::exp(-0.036 * m) + 0.028;
  return ts * (mw - hl1 - hl2 - hl3 - hl4 - hl5 - hl6);
}

double preferred_temperature(double met, double va, double rh, double clo) {
  double to = 28.0;
  for (int i = 0; i < 100; ++i) {
    double pmv = predicted_mean_vote(to, to, va, rh, met, clo);
    if (!std::isfinite(pmv))
      break;
    if (std::abs(pmv) < 0.001)
      return to;
    to -= pmv / 3.0;
  }
  throw core::Error("preferred temperature search did not converge");
}

} // namespace thermal
} // namespace bodytherm
