#pragma once

/**
 * @file tissue_tables.hpp
 * @brief Tabulated tissue properties of the standard body.
 *
 * Values refer to the standard body (1.72 m, 74.43 kg, 1.868 m²) and are
 * rescaled per subject by the anthropometry ratios. Segment order is the
 * canonical core::Segment order.
 */

#include <bodytherm/core/segments.hpp>

namespace bodytherm {
namespace biology {
namespace tables {

using core::SegmentArray;

// ============================================================================
// GEOMETRY
// ============================================================================

/// Segment surface areas [m²], sum = constants::STANDARD_BSA_M2
inline constexpr SegmentArray BSA_STANDARD = {
    0.110, 0.029, 0.175, 0.161, 0.221, 0.096, 0.063, 0.050, 0.096,
    0.063, 0.050, 0.209, 0.112, 0.056, 0.209, 0.112, 0.056};

// ============================================================================
// HEAT CAPACITIES [Wh/K]
// ============================================================================

inline constexpr double CAP_CENTRAL_BLOOD = 1.999;

inline constexpr SegmentArray CAP_ARTERY = {
    0.096, 0.025, 0.110, 0.265, 0.189, 0.040, 0.025, 0.008, 0.040,
    0.025, 0.008, 0.090, 0.040, 0.010, 0.090, 0.040, 0.010};

inline constexpr SegmentArray CAP_VEIN = {
    0.288, 0.075, 0.330, 0.795, 0.567, 0.120, 0.075, 0.024, 0.120,
    0.075, 0.024, 0.270, 0.120, 0.030, 0.270, 0.120, 0.030};

inline constexpr SegmentArray CAP_SFVEIN = {
    0.0,   0.0,   0.0,   0.0,   0.0,   0.020, 0.020, 0.015, 0.020,
    0.020, 0.015, 0.050, 0.030, 0.015, 0.050, 0.030, 0.015};

inline constexpr SegmentArray CAP_CORE = {
    3.000, 0.800, 10.2975, 9.3935, 13.834, 1.800, 1.100, 0.350, 1.800,
    1.100, 0.350, 6.000,   2.800,  0.550,  6.000, 2.800, 0.550};

inline constexpr SegmentArray CAP_MUSCLE = {
    0.900, 0.0, 0.0, 0.0, 4.000, 0.0, 0.0, 0.0, 0.0,
    0.0,   0.0, 0.0, 0.0, 0.0,   0.0, 0.0, 0.0};

inline constexpr SegmentArray CAP_FAT = {
    0.500, 0.0, 0.0, 0.0, 2.200, 0.0, 0.0, 0.0, 0.0,
    0.0,   0.0, 0.0, 0.0, 0.0,   0.0, 0.0, 0.0};

inline constexpr SegmentArray CAP_SKIN = {
    0.300, 0.070, 0.450, 0.400, 0.550, 0.200, 0.130, 0.120, 0.200,
    0.130, 0.120, 0.500, 0.270, 0.140, 0.500, 0.270, 0.140};

// ============================================================================
// THERMAL CONDUCTANCES [W/K]
// ============================================================================

/// Core to skin, segments without muscle/fat layers
inline constexpr SegmentArray CDT_CORE_SKIN = {
    0.0,   0.930, 1.879, 1.729, 0.0,   1.557, 1.018, 2.210, 1.557,
    1.018, 2.210, 2.565, 1.378, 3.404, 2.565, 1.378, 3.404};

/// Head and Pelvis only
inline constexpr SegmentArray CDT_CORE_MUSCLE = {
    1.601, 0.0, 0.0, 0.0, 3.0813, 0.0, 0.0, 0.0, 0.0,
    0.0,   0.0, 0.0, 0.0, 0.0,   0.0, 0.0, 0.0};

inline constexpr SegmentArray CDT_MUSCLE_FAT = {
    13.224, 0.0, 0.0, 0.0, 10.3738, 0.0, 0.0, 0.0, 0.0,
    0.0,    0.0, 0.0, 0.0, 0.0,   0.0, 0.0, 0.0};

inline constexpr SegmentArray CDT_FAT_SKIN = {
    16.008, 0.0, 0.0, 0.0, 41.4954, 0.0, 0.0, 0.0, 0.0,
    0.0,    0.0, 0.0, 0.0, 0.0,    0.0, 0.0, 0.0};

/// Artery and vein to the surrounding core
inline constexpr SegmentArray CDT_VESSEL_CORE = {
    1.000, 0.300, 1.000, 1.000, 1.000, 0.500, 0.400, 0.300, 0.500,
    0.400, 0.300, 0.800, 0.400, 0.300, 0.800, 0.400, 0.300};

/// Countercurrent exchange between artery and deep vein (limbs)
inline constexpr SegmentArray CDT_ARTERY_VEIN = {
    0.0,   0.0,   0.0,   0.0,   0.0,   0.537, 0.351, 0.762, 0.537,
    0.351, 0.762, 0.884, 0.475, 1.174, 0.884, 0.475, 1.174};

/// Superficial vein to skin (limbs)
inline constexpr SegmentArray CDT_SFVEIN_SKIN = {
    0.0,    0.0,    0.0,    0.0,     0.0,    57.735, 37.768, 16.634, 57.735,
    37.768, 16.634, 102.012, 55.645, 23.330, 102.012, 55.645, 23.330};

/**
 * @brief Sensitivity of the skin-side conductances to body fat class.
 *
 * multiplier = 1 + FAT_SENSITIVITY * (2 - fat_class), fat_class 0..4 for
 * fat < 12.5, < 17.5, < 22.5, < 27.5 and above.
 */
inline constexpr SegmentArray FAT_SENSITIVITY = {
    0.022, 0.022, 0.050, 0.050, 0.050, 0.036, 0.036, 0.012, 0.036,
    0.036, 0.012, 0.039, 0.039, 0.010, 0.039, 0.039, 0.010};

// ============================================================================
// BASAL BLOOD FLOW [L/h]
// ============================================================================

inline constexpr SegmentArray BFB_CORE = {
    35.251, 15.240, 89.214, 87.663, 18.686, 1.808, 0.940, 0.217, 1.808,
    0.940,  0.217,  1.406,  0.164,  0.080,  1.406, 0.164, 0.080};

inline constexpr SegmentArray BFB_MUSCLE = {
    0.682, 0.0, 0.0, 0.0, 12.614, 0.0, 0.0, 0.0, 0.0,
    0.0,   0.0, 0.0, 0.0, 0.0,    0.0, 0.0, 0.0};

inline constexpr SegmentArray BFB_FAT = {
    0.265, 0.0, 0.0, 0.0, 2.219, 0.0, 0.0, 0.0, 0.0,
    0.0,   0.0, 0.0, 0.0, 0.0,   0.0, 0.0, 0.0};

inline constexpr SegmentArray BFB_SKIN = {
    1.754, 0.325, 1.967, 1.475, 2.272, 0.910, 0.508, 1.114, 0.910,
    0.508, 1.114, 1.456, 0.651, 0.934, 1.456, 0.651, 0.934};

/// Fully open arteriovenous anastomoses, per hand / per foot
inline constexpr double BF_AVA_HAND_MAX = 1.71;
inline constexpr double BF_AVA_FOOT_MAX = 2.16;

// ============================================================================
// METABOLIC DISTRIBUTION (weights, normalised at use)
// ============================================================================

inline constexpr SegmentArray MBASE_CORE = {
    0.19551, 0.00232, 0.28093, 0.23114, 0.01630, 0.00574, 0.00309, 0.00019,
    0.00574, 0.00309, 0.00019, 0.00363, 0.00076, 0.00040, 0.00363, 0.00076,
    0.00040};

inline constexpr SegmentArray MBASE_MUSCLE = {
    0.00252, 0.0, 0.0, 0.0, 0.04978, 0.0, 0.0, 0.0, 0.0,
    0.0,     0.0, 0.0, 0.0, 0.0,     0.0, 0.0, 0.0};

inline constexpr SegmentArray MBASE_FAT = {
    0.00127, 0.0, 0.0, 0.0, 0.00322, 0.0, 0.0, 0.0, 0.0,
    0.0,     0.0, 0.0, 0.0, 0.0,     0.0, 0.0, 0.0};

inline constexpr SegmentArray MBASE_SKIN = {
    0.00152, 0.00057, 0.00933, 0.00667, 0.00522, 0.00099, 0.00073, 0.00050,
    0.00099, 0.00073, 0.00050, 0.00228, 0.00126, 0.00111, 0.00228, 0.00126,
    0.00111};

/// External work above basal (PAR - 1), sum = 1
inline constexpr SegmentArray WORK_FRACTION = {
    0.0,    0.0091, 0.0428, 0.0740, 0.0547, 0.0255, 0.0161, 0.0040, 0.0255,
    0.0161, 0.0040, 0.2227, 0.1344, 0.0070, 0.2227, 0.1344, 0.0070};

/// Shivering thermogenesis, sum = 1
inline constexpr SegmentArray SHIVER_FRACTION = {
    0.0339,  0.0436,  0.27394, 0.24102, 0.38754, 0.00243, 0.00137, 0.0002,
    0.00243, 0.00137, 0.0002,  0.0039,  0.00175, 0.00035, 0.0039,  0.00175,
    0.00035};

/// Brown adipose tissue sites, sum = 1
inline constexpr SegmentArray NST_FRACTION = {
    0.0, 0.20, 0.40, 0.20, 0.0, 0.10, 0.0, 0.0, 0.10,
    0.0, 0.0,  0.0,  0.0,  0.0, 0.0,  0.0, 0.0};

} // namespace tables
} // namespace biology
} // namespace bodytherm
