#include <bodytherm/entities/cohort_manager.hpp>

#include <algorithm>
#include <exception>
#include <omp.h>

namespace bodytherm {
namespace entities {

entt::entity CohortManager::spawn(
    const std::string &name, const biology::ThermalBodyModel::Config &config) {
  // Construct first so a ConfigurationError leaves the registry untouched
  biology::ThermalBodyModel model(config);

  auto entity = registry_.create();
  registry_.emplace<Occupant>(entity, name);
  registry_.emplace<StepStatus>(entity);
  registry_.emplace<biology::ThermalBodyModel>(entity, std::move(model));
  order_.push_back(entity);
  return entity;
}

void CohortManager::despawn(entt::entity entity) {
  order_.erase(std::remove(order_.begin(), order_.end(), entity),
               order_.end());
  if (registry_.valid(entity))
    registry_.destroy(entity);
}

std::vector<entt::entity> CohortManager::occupants() const {
  std::vector<entt::entity> result;
  result.reserve(order_.size());
  for (auto entity : order_) {
    if (registry_.valid(entity) &&
        registry_.all_of<biology::ThermalBodyModel>(entity))
      result.push_back(entity);
  }
  return result;
}

entt::entity CohortManager::find(const std::string &name) const {
  auto view = registry_.view<const Occupant>();
  for (auto entity : occupants()) {
    if (view.get<const Occupant>(entity).name == name)
      return entity;
  }
  return entt::null;
}

int CohortManager::max_threads() { return omp_get_max_threads(); }

void CohortManager::simulate_all(int times, double dtime) {
  const auto entities = occupants();

  // Resolve components up front; the pools are not touched while stepping
  std::vector<biology::ThermalBodyModel *> models;
  std::vector<StepStatus *> statuses;
  models.reserve(entities.size());
  statuses.reserve(entities.size());
  for (auto entity : entities) {
    models.push_back(&registry_.get<biology::ThermalBodyModel>(entity));
    statuses.push_back(&registry_.get<StepStatus>(entity));
  }

  std::vector<std::exception_ptr> errors(entities.size());
  const int n = static_cast<int>(entities.size());

#pragma omp parallel for schedule(dynamic, 1)
  for (int i = 0; i < n; ++i) {
    StepStatus &status = *statuses[i];
    try {
      models[i]->simulate(times, dtime);
      status.ok = true;
      status.error.clear();
    } catch (const std::exception &e) {
      status.ok = false;
      status.error = e.what();
      errors[i] = std::current_exception();
    }
  }

  for (const auto &error : errors) {
    if (error)
      std::rethrow_exception(error);
  }
}

} // namespace entities
} // namespace bodytherm
