#pragma once

/**
 * @file anthropometry.hpp
 * @brief Body profile and anthropometric scalars (BSA, BMR, cardiac output).
 */

#include <cstdint>
#include <string>

#include <bodytherm/core/segments.hpp>

namespace bodytherm {
namespace biology {

enum class Sex : uint8_t { MALE, FEMALE };

/**
 * @brief Basal metabolic rate regressions.
 */
enum class BmrEquation : uint8_t {
  HARRIS_BENEDICT,        // Roza & Shizgal revision
  HARRIS_BENEDICT_ORIGIN, // 1919 coefficients
  JAPANESE                // Ganpule et al. 2007
};

/**
 * @brief Body surface area regressions.
 */
enum class BsaEquation : uint8_t { DUBOIS, TAKAHIRA, FUJIMOTO, KURAZUMI };

/**
 * @brief Subject description, fixed for the lifetime of a model.
 */
struct BodyProfile {
  double height_m = 1.72;
  double weight_kg = 74.43;
  double fat_percent = 15.0;
  double age_years = 20.0;
  Sex sex = Sex::MALE;
  double cardiac_index = 2.6432; // L/min/m²
  BmrEquation bmr_equation = BmrEquation::HARRIS_BENEDICT;
  BsaEquation bsa_equation = BsaEquation::DUBOIS;
};

// Name parsing, throws core::ConfigurationError on unknown names
Sex parse_sex(const std::string &name);
BmrEquation parse_bmr_equation(const std::string &name);
BsaEquation parse_bsa_equation(const std::string &name);

const char *to_string(Sex sex);
const char *to_string(BmrEquation eq);
const char *to_string(BsaEquation eq);

/**
 * @brief Scalars resolved once from a BodyProfile.
 */
struct Anthropometry {
  core::SegmentArray bsa{};     // m², sums to bsa_total
  double bsa_total = 0.0;       // m²
  double bsa_ratio = 1.0;       // bsa_total / standard BSA
  double weight_ratio = 1.0;    // weight / standard weight
  double bmi = 0.0;             // kg/m²
  double bmr_w = 0.0;           // whole-body basal metabolic rate
  double cardiac_output_lh = 0.0;
  double bloodflow_ratio = 1.0; // cardiac output / standard cardiac output
  int fat_class = 1;            // 0..4
};

/**
 * @brief Whole-body surface area [m²].
 * @param height_m Height in metres
 * @param weight_kg Weight in kilograms
 * @param eq Regression to use
 */
double body_surface_area(double height_m, double weight_kg, BsaEquation eq);

/**
 * @brief Whole-body basal metabolic rate [W].
 */
double basal_metabolic_rate(const BodyProfile &profile);

/**
 * @brief Cardiac index decrement with age.
 */
double cardiac_index_age_factor(double age_years);

/**
 * @brief Rejects unsupported profiles with core::ConfigurationError.
 */
void validate_profile(const BodyProfile &profile);

/**
 * @brief Validates the profile and resolves all derived scalars.
 */
Anthropometry resolve_anthropometry(const BodyProfile &profile);

} // namespace biology
} // namespace bodytherm
