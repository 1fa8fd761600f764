#pragma once

/**
 * @file results.hpp
 * @brief Append-only per-step result log and its tabular view.
 *
 * Every row keeps the full step snapshot. Which quantities appear as
 * columns of the table is chosen by an OutputSelector; encoding the table
 * (CSV or otherwise) is left to the caller.
 */

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <bodytherm/biology/circulation.hpp>
#include <bodytherm/biology/metabolism.hpp>
#include <bodytherm/biology/thermoregulation.hpp>
#include <bodytherm/core/thermal_state.hpp>
#include <bodytherm/thermal/boundary_conditions.hpp>
#include <bodytherm/thermal/heat_exchange.hpp>

namespace bodytherm {
namespace biology {

/**
 * @brief Snapshot of one simulation step.
 */
struct ResultRow {
  uint64_t cycle = 0;
  double time_s = 0.0; // elapsed model time at the end of the step
  double dt_s = 0.0;

  core::ThermalState state; // after the step
  core::SegmentArray setpoint_cr{};
  core::SegmentArray setpoint_sk{};

  thermal::BoundaryConditions conditions;
  thermal::DerivedResistances resistances;
  ControlSignals signals;
  HeatProduction production;
  RespiratoryLoss respiration;
  BloodFlowState flows; // network edges are not retained

  core::SegmentArray bsa{};
  core::SegmentArray sensible_loss_w{}; // skin, positive outwards
  double tsk_mean = 0.0;
  double wet_mean = 0.0;
  double skin_heat_loss_w = 0.0;  // sensible + latent
  double weight_loss_g_s = 0.0;   // sweat and respiratory water
};

/**
 * @brief Selects the extra column groups of the tabular view.
 */
class OutputSelector {
public:
  /// Default columns only.
  OutputSelector() = default;

  /// Throws core::ConfigurationError on unknown group names.
  explicit OutputSelector(const std::vector<std::string> &groups);

  static OutputSelector none() { return OutputSelector(); }
  static OutputSelector all();

  bool includes(const std::string &group) const;
  bool is_all() const { return all_; }
  const std::vector<std::string> &groups() const { return groups_; }

  /// Names accepted as extra groups, in table order.
  static const std::vector<std::string> &available();

private:
  bool all_ = false;
  std::vector<std::string> groups_;
};

/// Ordered named columns, one value per logged step.
using ResultTable = std::vector<std::pair<std::string, std::vector<double>>>;

class ResultLog {
public:
  void append(ResultRow row);

  size_t size() const { return rows_.size(); }
  bool empty() const { return rows_.empty(); }
  const ResultRow &back() const { return rows_.back(); }
  const std::vector<ResultRow> &rows() const { return rows_; }

  ResultTable table(const OutputSelector &selector) const;

  /// Column names the table would carry, without building it.
  static std::vector<std::string> column_names(const OutputSelector &selector);

private:
  std::vector<ResultRow> rows_;
};

} // namespace biology
} // namespace bodytherm
