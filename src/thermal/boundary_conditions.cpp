/**
 * @file boundary_conditions.cpp
 * @brief Boundary condition validation and broadcast rules.
 */

#include <cmath>
#include <sstream>

#include <bodytherm/core/errors.hpp>
#include <bodytherm/thermal/boundary_conditions.hpp>

namespace bodytherm {
namespace thermal {

namespace {

using core::NUM_SEGMENTS;
using core::SegmentArray;

core::InvalidBoundaryCondition out_of_range(const char *name, size_t segment,
                                            double value, double lo,
                                            double hi) {
  std::ostringstream msg;
  msg << name << "[" << core::SEGMENT_NAMES[segment] << "] = " << value
      << " outside [" << lo << ", " << hi << "]";
  return core::InvalidBoundaryCondition(msg.str());
}

SegmentArray expand(const std::vector<double> &values, const char *name) {
  if (values.size() != NUM_SEGMENTS) {
    std::ostringstream msg;
    msg << name << " expects " << NUM_SEGMENTS << " values, got "
        << values.size();
    throw core::InvalidBoundaryCondition(msg.str());
  }
  SegmentArray a;
  for (size_t i = 0; i < NUM_SEGMENTS; ++i)
    a[i] = values[i];
  return a;
}

void check_range(const SegmentArray &values, double lo, double hi,
                 const char *name) {
  for (size_t i = 0; i < NUM_SEGMENTS; ++i) {
    if (!std::isfinite(values[i]) || values[i] < lo || values[i] > hi)
      throw out_of_range(name, i, values[i], lo, hi);
  }
}

} // namespace

Posture parse_posture(const std::string &name) {
  if (name == "standing")
    return Posture::STANDING;
  if (name == "sitting" || name == "sedentary")
    return Posture::SITTING;
  if (name == "lying" || name == "supine")
    return Posture::LYING;
  throw core::InvalidBoundaryCondition("unknown posture: '" + name + "'");
}

const char *to_string(Posture posture) {
  switch (posture) {
  case Posture::STANDING:
    return "standing";
  case Posture::SITTING:
    return "sitting";
  case Posture::LYING:
    return "lying";
  }
  return "unknown";
}

void BoundaryConditions::reset(const Defaults &d) {
  operative_mode_ = false;
  set_air_radiant(d.ta_c, d.tr_c);
  set_va(d.va_ms);
  set_rh(d.rh_percent);
  set_icl(d.icl_clo);
  set_par(d.par);
  posture_ = d.posture;
}

void BoundaryConditions::assign_temperature(SegmentArray &target,
                                            const SegmentArray &other,
                                            const SegmentArray &values,
                                            const char *name) {
  check_range(values, TEMP_MIN_C, TEMP_MAX_C, name);
  if (operative_mode_ && values != other) {
    throw core::InvalidBoundaryCondition(
        std::string(name) +
        " would split air and radiant temperature while operative "
        "temperature is in use; assign both together");
  }
  target = values;
  operative_mode_ = false;
}

void BoundaryConditions::set_ta(double value) {
  assign_temperature(ta_, tr_, core::filled(value), "Ta");
}

void BoundaryConditions::set_ta(const std::vector<double> &values) {
  assign_temperature(ta_, tr_, expand(values, "Ta"), "Ta");
}

void BoundaryConditions::set_tr(double value) {
  assign_temperature(tr_, ta_, core::filled(value), "Tr");
}

void BoundaryConditions::set_tr(const std::vector<double> &values) {
  assign_temperature(tr_, ta_, expand(values, "Tr"), "Tr");
}

void BoundaryConditions::set_to(double value) {
  set_to(std::vector<double>(NUM_SEGMENTS, value));
}

void BoundaryConditions::set_to(const std::vector<double> &values) {
  SegmentArray to = expand(values, "To");
  check_range(to, TEMP_MIN_C, TEMP_MAX_C, "To");
  if (!operative_mode_ && ta_ != tr_) {
    throw core::InvalidBoundaryCondition(
        "To requires equal air and radiant temperature");
  }
  ta_ = to;
  tr_ = to;
  operative_mode_ = true;
}

void BoundaryConditions::set_air_radiant(double ta, double tr) {
  set_air_radiant(std::vector<double>(NUM_SEGMENTS, ta),
                  std::vector<double>(NUM_SEGMENTS, tr));
}

void BoundaryConditions::set_air_radiant(const std::vector<double> &ta,
                                         const std::vector<double> &tr) {
  SegmentArray a = expand(ta, "Ta");
  SegmentArray r = expand(tr, "Tr");
  check_range(a, TEMP_MIN_C, TEMP_MAX_C, "Ta");
  check_range(r, TEMP_MIN_C, TEMP_MAX_C, "Tr");
  ta_ = a;
  tr_ = r;
  operative_mode_ = false;
}

void BoundaryConditions::set_va(double value) {
  set_va(std::vector<double>(NUM_SEGMENTS, value));
}

void BoundaryConditions::set_va(const std::vector<double> &values) {
  SegmentArray a = expand(values, "Va");
  check_range(a, 0.0, VA_MAX_MS, "Va");
  va_ = a;
}

void BoundaryConditions::set_rh(double value) {
  set_rh(std::vector<double>(NUM_SEGMENTS, value));
}

void BoundaryConditions::set_rh(const std::vector<double> &values) {
  SegmentArray a = expand(values, "RH");
  check_range(a, 0.0, 100.0, "RH");
  rh_ = a;
}

void BoundaryConditions::set_icl(double value) {
  set_icl(std::vector<double>(NUM_SEGMENTS, value));
}

void BoundaryConditions::set_icl(const std::vector<double> &values) {
  SegmentArray a = expand(values, "Icl");
  check_range(a, 0.0, ICL_MAX_CLO, "Icl");
  icl_ = a;
}

void BoundaryConditions::set_par(double value) {
  if (!std::isfinite(value) || value < PAR_MIN || value > PAR_MAX) {
    std::ostringstream msg;
    msg << "PAR = " << value << " outside [" << PAR_MIN << ", " << PAR_MAX
        << "]";
    throw core::InvalidBoundaryCondition(msg.str());
  }
  par_ = value;
}

} // namespace thermal
} // namespace bodytherm
