#pragma once

/**
 * @file cohort_manager.hpp
 * @brief Registry of independent body models stepped in parallel.
 */

#include "entt/entt.hpp"
#include <string>
#include <vector>

#include <bodytherm/biology/body_model.hpp>
#include <bodytherm/entities/components.hpp>

namespace bodytherm {
namespace entities {

/**
 * @brief Owns one ThermalBodyModel per occupant entity.
 *
 * Models share no state, so a batch step runs them concurrently.
 */
class CohortManager {
public:
  CohortManager() = default;
  ~CohortManager() = default;

  // Spawning
  entt::entity spawn(const std::string &name,
                     const biology::ThermalBodyModel::Config &config =
                         biology::ThermalBodyModel::Config{});
  void despawn(entt::entity entity);
  void clear() {
    registry_.clear();
    order_.clear();
  }

  /**
   * @brief Steps every occupant `times` x `dtime` seconds.
   *
   * Failures are recorded in each occupant's StepStatus; the first one (in
   * spawn order) is rethrown after all occupants have been processed.
   */
  void simulate_all(int times, double dtime = 60.0);

  /// Applies `fn(ThermalBodyModel&)` to every occupant, in spawn order.
  template <typename Fn> void apply(Fn &&fn) {
    for (auto entity : occupants()) {
      fn(registry_.get<biology::ThermalBodyModel>(entity));
    }
  }

  // Queries
  entt::entity find(const std::string &name) const;
  std::vector<entt::entity> occupants() const;

  biology::ThermalBodyModel &model(entt::entity entity) {
    return registry_.get<biology::ThermalBodyModel>(entity);
  }
  const biology::ThermalBodyModel &model(entt::entity entity) const {
    return registry_.get<biology::ThermalBodyModel>(entity);
  }
  const Occupant &occupant(entt::entity entity) const {
    return registry_.get<Occupant>(entity);
  }
  const StepStatus &status(entt::entity entity) const {
    return registry_.get<StepStatus>(entity);
  }

  /// Worker threads available to simulate_all.
  static int max_threads();

  size_t count() const {
    return registry_.view<const Occupant>().size();
  }

private:
  entt::registry registry_;
  std::vector<entt::entity> order_;
};

} // namespace entities
} // namespace bodytherm
