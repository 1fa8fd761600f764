#pragma once

/**
 * @file comfort.hpp
 * @brief ISO 7730 predicted mean vote and the thermoneutral operative
 * temperature derived from it.
 */

namespace bodytherm {
namespace thermal {

/**
 * @brief Fanger's predicted mean vote.
 * @param ta Air temperature (°C)
 * @param tr Mean radiant temperature (°C)
 * @param va Air velocity (m/s)
 * @param rh Relative humidity (0-100)
 * @param met Metabolic rate (met)
 * @param clo Clothing insulation (clo)
 * @param wmet External work (met)
 * @return PMV on the -3..+3 scale (unbounded outside the ISO range)
 *
 * Throws core::Error when the clothing surface temperature iteration fails
 * to converge.
 */
double predicted_mean_vote(double ta, double tr, double va, double rh,
                           double met, double clo, double wmet = 0.0);

/**
 * @brief Operative temperature at which PMV is zero.
 *
 * Ta = Tr = To; Newton-like fixed point started from 28 °C. Throws
 * core::Error when |PMV| < 0.001 is not reached within 100 iterations.
 */
double preferred_temperature(double met, double va = 0.1, double rh = 50.0,
                             double clo = 0.0);

} // namespace thermal
} // namespace bodytherm
