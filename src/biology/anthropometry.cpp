/**
 * @file anthropometry.cpp
 * @brief BSA, BMR and cardiac output regressions.
 */

#include <cmath>
#include <sstream>

#include <bodytherm/biology/anthropometry.hpp>
#include <bodytherm/biology/tissue_tables.hpp>
#include <bodytherm/core/constants.hpp>
#include <bodytherm/core/errors.hpp>

namespace bodytherm {
namespace biology {

Sex parse_sex(const std::string &name) {
  if (name == "male")
    return Sex::MALE;
  if (name == "female")
    return Sex::FEMALE;
  throw core::ConfigurationError("unsupported sex: '" + name + "'");
}

BmrEquation parse_bmr_equation(const std::string &name) {
  if (name == "harris-benedict")
    return BmrEquation::HARRIS_BENEDICT;
  if (name == "harris-benedict_origin")
    return BmrEquation::HARRIS_BENEDICT_ORIGIN;
  if (name == "japanese" || name == "ganpule")
    return BmrEquation::JAPANESE;
  throw core::ConfigurationError("unsupported BMR equation: '" + name + "'");
}

BsaEquation parse_bsa_equation(const std::string &name) {
  if (name == "dubois")
    return BsaEquation::DUBOIS;
  if (name == "takahira")
    return BsaEquation::TAKAHIRA;
  if (name == "fujimoto")
    return BsaEquation::FUJIMOTO;
  if (name == "kurazumi")
    return BsaEquation::KURAZUMI;
  throw core::ConfigurationError("unsupported BSA equation: '" + name + "'");
}

const char *to_string(Sex sex) {
  return sex == Sex::MALE ? "male" : "female";
}

const char *to_string(BmrEquation eq) {
  switch (eq) {
  case BmrEquation::HARRIS_BENEDICT:
    return "harris-benedict";
  case BmrEquation::HARRIS_BENEDICT_ORIGIN:
    return "harris-benedict_origin";
  case BmrEquation::JAPANESE:
    return "japanese";
  }
  return "unknown";
}

const char *to_string(BsaEquation eq) {
  switch (eq) {
  case BsaEquation::DUBOIS:
    return "dubois";
  case BsaEquation::TAKAHIRA:
    return "takahira";
  case BsaEquation::FUJIMOTO:
    return "fujimoto";
  case BsaEquation::KURAZUMI:
    return "kurazumi";
  }
  return "unknown";
}

double body_surface_area(double height_m, double weight_kg, BsaEquation eq) {
  double h_cm = height_m * 100.0;
  switch (eq) {
  case BsaEquation::DUBOIS:
    return 0.007184 * std::pow(weight_kg, 0.425) * std::pow(h_cm, 0.725);
  case BsaEquation::TAKAHIRA:
    return 0.007241 * std::pow(weight_kg, 0.425) * std::pow(h_cm, 0.725);
  case BsaEquation::FUJIMOTO:
    return 0.008883 * std::pow(weight_kg, 0.444) * std::pow(h_cm, 0.663);
  case BsaEquation::KURAZUMI:
    return 0.0094 * std::pow(weight_kg, 0.441) * std::pow(h_cm, 0.655);
  }
  throw core::ConfigurationError("unsupported BSA equation");
}

double basal_metabolic_rate(const BodyProfile &p) {
  const double w = p.weight_kg;
  const double h = p.height_m * 100.0;
  const double a = p.age_years;
  const bool male = p.sex == Sex::MALE;

  double kcal_day = 0.0;
  switch (p.bmr_equation) {
  case BmrEquation::HARRIS_BENEDICT:
    kcal_day = male ? 88.362 + 13.397 * w + 4.799 * h - 5.677 * a
                    : 447.593 + 9.247 * w + 3.098 * h - 4.330 * a;
    break;
  case BmrEquation::HARRIS_BENEDICT_ORIGIN:
    kcal_day = male ? 66.4730 + 13.7516 * w + 5.0033 * h - 6.7550 * a
                    : 655.0955 + 9.5634 * w + 1.8496 * h - 4.6756 * a;
    break;
  case BmrEquation::JAPANESE: {
    // MJ/day
    double mj = 0.0481 * w + 0.0234 * h - 0.0138 * a;
    mj -= male ? 0.4235 : 0.9708;
    kcal_day = mj * 1000.0 / 4.186;
    break;
  }
  }

  return kcal_day * constants::KCAL_DAY_TO_W;
}

double cardiac_index_age_factor(double age_years) {
  if (age_years < 50.0)
    return 1.0;
  if (age_years < 60.0)
    return 0.85;
  if (age_years < 70.0)
    return 0.75;
  return 0.70;
}

void validate_profile(const BodyProfile &p) {
  auto fail = [](const std::string &msg) {
    throw core::ConfigurationError(msg);
  };

  if (!std::isfinite(p.height_m) || p.height_m <= 0.0)
    fail("height must be a positive number of metres");
  if (!std::isfinite(p.weight_kg) || p.weight_kg <= 0.0)
    fail("weight must be a positive number of kilograms");
  if (!std::isfinite(p.fat_percent) || p.fat_percent < 0.0 ||
      p.fat_percent >= 100.0)
    fail("fat percentage must lie in [0, 100)");
  if (!std::isfinite(p.cardiac_index) || p.cardiac_index <= 0.0)
    fail("cardiac index must be positive");
  if (!std::isfinite(p.age_years) || p.age_years < 18.0 ||
      p.age_years >= 120.0)
    fail("age must lie in [18, 120) years");

  // Ganpule et al. regressed on adults aged 20-74
  if (p.bmr_equation == BmrEquation::JAPANESE &&
      (p.age_years < 20.0 || p.age_years > 74.0)) {
    std::ostringstream msg;
    msg << "BMR equation 'japanese' has no correction for age "
        << p.age_years << " (supported 20-74)";
    fail(msg.str());
  }

  if (basal_metabolic_rate(p) <= 0.0) {
    std::ostringstream msg;
    msg << "BMR equation '" << to_string(p.bmr_equation)
        << "' yields a non-positive rate for this " << to_string(p.sex)
        << " profile";
    fail(msg.str());
  }
}

Anthropometry resolve_anthropometry(const BodyProfile &p) {
  validate_profile(p);

  Anthropometry a;
  a.bsa_total = body_surface_area(p.height_m, p.weight_kg, p.bsa_equation);
  a.bsa_ratio = a.bsa_total / core::sum(tables::BSA_STANDARD);
  for (size_t i = 0; i < core::NUM_SEGMENTS; ++i) {
    a.bsa[i] = tables::BSA_STANDARD[i] * a.bsa_ratio;
  }

  a.weight_ratio = p.weight_kg / constants::STANDARD_WEIGHT_KG;
  a.bmi = p.weight_kg / (p.height_m * p.height_m);
  a.bmr_w = basal_metabolic_rate(p);

  // L/min/m² -> L/h
  a.cardiac_output_lh = p.cardiac_index * 60.0 *
                        cardiac_index_age_factor(p.age_years) * a.bsa_total;
  a.bloodflow_ratio =
      a.cardiac_output_lh / constants::STANDARD_CARDIAC_OUTPUT_LH;

  if (p.fat_percent < 12.5)
    a.fat_class = 0;
  else if (p.fat_percent < 17.5)
    a.fat_class = 1;
  else if (p.fat_percent < 22.5)
    a.fat_class = 2;
  else if (p.fat_percent < 27.5)
    a.fat_class = 3;
  else
    a.fat_class = 4;

  return a;
}

} // namespace biology
} // namespace bodytherm
