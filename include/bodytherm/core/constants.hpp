#pragma once

/**
 * @file constants.hpp
 * @brief Model reference values for bodytherm.
 */

namespace bodytherm {
namespace constants {

// === Standard Body (reference for all tabulated coefficients) ===
constexpr double STANDARD_WEIGHT_KG = 74.43;
constexpr double STANDARD_BSA_M2 = 1.868;            // Sum of segment table
constexpr double STANDARD_CARDIAC_OUTPUT_LH = 290.004; // Sum of basal flows

// === Blood ===
constexpr double BLOOD_HEAT_CAPACITY = 1.067;        // Wh/(L·K) -> W/K per L/h
constexpr double WORK_HEAT_PER_FLOW = 1.163;         // W per L/h of muscle flow

// === Heat Exchange ===
constexpr double CLO_TO_M2KW = 0.155;                // m²·K/W per clo
constexpr double LEWIS_RATIO = 0.0165;               // K/Pa
constexpr double CLOTHING_PERMEABILITY = 0.45;       // icl [-]
constexpr double MET_TO_WM2 = 58.15;                 // W/m² per met

// === Metabolism ===
constexpr double KCAL_DAY_TO_W = 0.048;
constexpr double LATENT_HEAT_SWEAT = 2418.0;         // J/g evaporated water

// === Physiological State Band ===
constexpr double BODY_TEMP_MIN_C = 0.0;
constexpr double BODY_TEMP_MAX_C = 50.0;
constexpr double BODY_TEMP_INITIAL_C = 36.0;

}  // namespace constants
}  // namespace bodytherm
