#pragma once

/**
 * @file boundary_conditions.hpp
 * @brief Environmental and clothing inputs with sticky-field semantics.
 *
 * Every field is defaulted once at construction and keeps its value until
 * explicitly reassigned. Invalid input is rejected with
 * core::InvalidBoundaryCondition, never clamped.
 */

#include <cstdint>
#include <string>
#include <vector>

#include <bodytherm/core/segments.hpp>

namespace bodytherm {
namespace thermal {

enum class Posture : uint8_t { STANDING, SITTING, LYING };

/// Accepts "standing", "sitting"/"sedentary", "lying"/"supine".
Posture parse_posture(const std::string &name);
const char *to_string(Posture posture);

/**
 * @brief Baseline every field takes at construction and on reset.
 */
struct BoundaryDefaults {
  double ta_c = 28.8;
  double tr_c = 28.8;
  double va_ms = 0.1;
  double rh_percent = 50.0;
  double icl_clo = 0.0;
  double par = 1.2;
  Posture posture = Posture::STANDING;
};

/**
 * @brief Current boundary conditions of one body.
 */
class BoundaryConditions {
public:
  using Defaults = BoundaryDefaults;

  // Accepted ranges
  static constexpr double TEMP_MIN_C = -50.0;
  static constexpr double TEMP_MAX_C = 60.0;
  static constexpr double VA_MAX_MS = 50.0;
  static constexpr double ICL_MAX_CLO = 10.0;
  static constexpr double PAR_MIN = 1.0;
  static constexpr double PAR_MAX = 15.0;

  BoundaryConditions() { reset(); }

  /// Restores every field to its baseline and leaves operative mode.
  void reset(const Defaults &defaults = Defaults{});

  // === Temperatures ===
  void set_ta(double value);
  void set_ta(const std::vector<double> &values);
  void set_tr(double value);
  void set_tr(const std::vector<double> &values);

  /**
   * @brief Operative temperature shortcut, sets Ta = Tr = To.
   *
   * Rejected when Ta and Tr currently differ and the shortcut is not
   * already active.
   */
  void set_to(double value);
  void set_to(const std::vector<double> &values);

  /// Assigns air and radiant temperature together, leaving operative mode.
  void set_air_radiant(double ta, double tr);
  void set_air_radiant(const std::vector<double> &ta,
                       const std::vector<double> &tr);

  // === Air, humidity, clothing ===
  void set_va(double value);
  void set_va(const std::vector<double> &values);
  void set_rh(double value);
  void set_rh(const std::vector<double> &values);
  void set_icl(double value);
  void set_icl(const std::vector<double> &values);

  // === Whole-body scalars ===
  void set_par(double value);
  void set_posture(Posture posture) { posture_ = posture; }
  void set_posture(const std::string &name) { posture_ = parse_posture(name); }

  const core::SegmentArray &ta() const { return ta_; }
  const core::SegmentArray &tr() const { return tr_; }
  const core::SegmentArray &va() const { return va_; }
  const core::SegmentArray &rh() const { return rh_; }
  const core::SegmentArray &icl() const { return icl_; }
  double par() const { return par_; }
  Posture posture() const { return posture_; }
  bool operative_mode() const { return operative_mode_; }

private:
  void assign_temperature(core::SegmentArray &target,
                          const core::SegmentArray &other,
                          const core::SegmentArray &values, const char *name);

  core::SegmentArray ta_{};
  core::SegmentArray tr_{};
  core::SegmentArray va_{};
  core::SegmentArray rh_{};
  core::SegmentArray icl_{};
  double par_ = 1.2;
  Posture posture_ = Posture::STANDING;
  bool operative_mode_ = false;
};

} // namespace thermal
} // namespace bodytherm
