#pragma once

/**
 * @file psychrometrics.hpp
 * @brief Moist-air relations used by skin and respiratory evaporation.
 *
 * Pressures are in Pa, relative humidity in percent (0-100).
 */

#include <algorithm>
#include <cmath>

namespace bodytherm {
namespace thermal {

// ============================================================================
// PSYCHROMETRIC CALCULATIONS
// ============================================================================

/**
 * @brief Saturation vapor pressure (Antoine equation).
 * @param T Temperature in Celsius
 * @return Saturation vapor pressure in Pa
 */
inline double saturation_vapor_pressure(double T) {
  // Antoine form in kPa
  return 1000.0 * std::exp(16.6536 - 4030.183 / (T + 235.0));
}

/**
 * @brief Partial water-vapor pressure of air.
 * @param T Air temperature (°C)
 * @param rh_percent Relative humidity (0-100)
 * @return Vapor pressure (Pa)
 */
inline double vapor_pressure(double T, double rh_percent) {
  return saturation_vapor_pressure(T) * rh_percent / 100.0;
}

/**
 * @brief Maximum evaporative heat loss from fully wet skin.
 * @param T_skin Skin temperature (°C)
 * @param T_air Air temperature (°C)
 * @param rh_percent Relative humidity (0-100)
 * @param ret Total evaporative resistance (Pa·m²/W)
 * @param area Skin area (m²)
 * @return Evaporative capacity (W), zero when air is wetter than skin
 */
inline double evaporative_capacity(double T_skin, double T_air,
                                   double rh_percent, double ret,
                                   double area) {
  double delta_p =
      saturation_vapor_pressure(T_skin) - vapor_pressure(T_air, rh_percent);
  return std::max(0.0, delta_p / ret * area);
}

} // namespace thermal
} // namespace bodytherm
