/**
 * @file test_cohort.cpp
 * @brief Tests for the parallel occupant cohort.
 */

#include <cassert>
#include <iostream>
#include <string>

#include <bodytherm/core/errors.hpp>
#include <bodytherm/entities/cohort_manager.hpp>

using namespace bodytherm;
using biology::ThermalBodyModel;

void test_spawn_and_find() {
  std::cout << "Testing occupant spawning..." << std::endl;
  entities::CohortManager cohort;
  assert(cohort.count() == 0);

  auto a = cohort.spawn("a");
  ThermalBodyModel::Config older;
  older.profile.age_years = 68.0;
  auto b = cohort.spawn("b", older);
  assert(cohort.count() == 2);
  assert(cohort.find("a") == a);
  assert(cohort.find("b") == b);
  assert(cohort.find("nobody") == entt::null);
  assert(cohort.occupant(b).name == "b");
  assert(cohort.status(a).ok);
  assert(cohort.model(b).profile().age_years == 68.0);

  // Invalid profile leaves the registry untouched
  ThermalBodyModel::Config bad;
  bad.profile.weight_kg = -1.0;
  bool rejected = false;
  try {
    cohort.spawn("bad", bad);
  } catch (const core::ConfigurationError &) {
    rejected = true;
  }
  assert(rejected);
  assert(cohort.count() == 2);
  assert(cohort.find("bad") == entt::null);

  cohort.despawn(a);
  assert(cohort.count() == 1);
  assert(cohort.occupants().size() == 1);
  assert(cohort.occupants()[0] == b);

  cohort.clear();
  assert(cohort.count() == 0);
  assert(cohort.occupants().empty());

  std::cout << "  Occupant spawning: PASS" << std::endl;
}

void test_parallel_matches_serial() {
  std::cout << "Testing parallel stepping..." << std::endl;
  entities::CohortManager cohort;

  ThermalBodyModel::Config small;
  small.profile.sex = biology::Sex::FEMALE;
  small.profile.height_m = 1.58;
  small.profile.weight_kg = 50.0;
  small.profile.fat_percent = 26.0;

  for (int i = 0; i < 4; ++i) {
    cohort.spawn("occupant_" + std::to_string(i),
                 i % 2 == 0 ? ThermalBodyModel::Config{} : small);
  }
  cohort.apply([](ThermalBodyModel &m) {
    m.conditions().set_to(20.0);
    m.conditions().set_posture("sitting");
  });
  cohort.simulate_all(15, 60.0);

  // Same sequence on a standalone model
  ThermalBodyModel reference(small);
  reference.conditions().set_to(20.0);
  reference.conditions().set_posture("sitting");
  reference.simulate(15, 60.0);

  for (auto entity : cohort.occupants()) {
    const auto &m = cohort.model(entity);
    assert(m.results().size() == 15);
    assert(cohort.status(entity).ok);
  }
  const auto &odd = cohort.model(cohort.find("occupant_1"));
  assert(odd.bodytemp() == reference.bodytemp());

  // Occupants stay independent
  const auto &even = cohort.model(cohort.find("occupant_0"));
  assert(even.bodytemp() != odd.bodytemp());
  assert(even.bodytemp() ==
         cohort.model(cohort.find("occupant_2")).bodytemp());

  std::cout << "  Parallel stepping: PASS" << std::endl;
}

void test_error_propagation() {
  std::cout << "Testing cohort error propagation..." << std::endl;
  entities::CohortManager cohort;
  auto fine = cohort.spawn("fine");
  auto doomed = cohort.spawn("doomed");

  // Arguments rejected for everyone
  bool invalid = false;
  try {
    cohort.simulate_all(0, 60.0);
  } catch (const core::InvalidArgument &) {
    invalid = true;
  }
  assert(invalid);
  assert(!cohort.status(fine).ok && !cohort.status(doomed).ok);
  assert(cohort.model(fine).results().empty());

  // One failing occupant does not stop the others
  auto &m = cohort.model(doomed);
  m.set_bodytemp(49.9);
  m.conditions().set_to(60.0);
  m.conditions().set_rh(100.0);
  m.conditions().set_par(15.0);

  bool unstable = false;
  try {
    cohort.simulate_all(1, 600.0);
  } catch (const core::UnstableStepSizeError &) {
    unstable = true;
  }
  assert(unstable);
  assert(cohort.status(fine).ok);
  assert(cohort.status(fine).error.empty());
  assert(!cohort.status(doomed).ok);
  assert(!cohort.status(doomed).error.empty());
  assert(cohort.model(fine).results().size() == 1);
  assert(cohort.model(doomed).results().empty());

  std::cout << "  Cohort error propagation: PASS" << std::endl;
}

int main() {
  std::cout << "=== Running Cohort Tests ===" << std::endl;
  std::cout << "Threads: " << entities::CohortManager::max_threads()
            << std::endl;

  test_spawn_and_find();
  test_parallel_matches_serial();
  test_error_propagation();

  std::cout << std::endl;
  std::cout << "All tests PASSED!" << std::endl;
  return 0;
}
