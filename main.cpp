/**
 * @file main.cpp
 * @brief Entry point: desk-fan exposure scenario and a small occupant cohort.
 */

#include <chrono>
#include <iomanip>
#include <iostream>
#include <vector>

#include <bodytherm/biology/body_model.hpp>
#include <bodytherm/core/errors.hpp>
#include <bodytherm/entities/cohort_manager.hpp>

using namespace bodytherm;

namespace {

const std::vector<double> OFFICE_CLOTHING = {
    0.00, 0.00, 1.14, 0.84, 1.04, 0.84, 0.42, 0.00, 0.84,
    0.42, 0.00, 0.58, 0.62, 0.82, 0.58, 0.62, 0.82};

const std::vector<double> DESK_FAN = {
    0.2, 0.4, 0.4, 0.1, 0.1, 0.4, 0.4, 0.4, 0.4,
    0.4, 0.4, 0.1, 0.1, 0.1, 0.1, 0.1, 0.1};

void print_phase(const char *label, const biology::ThermalBodyModel &model) {
  std::cout << "  " << std::left << std::setw(28) << label << std::right
            << std::fixed << std::setprecision(1) << std::setw(6)
            << model.elapsed_time() / 60.0 << " min  Tsk "
            << std::setprecision(2) << model.tsk_mean() << " C  Tcr(head) "
            << model.tcr()[0] << " C  wet " << std::setprecision(3)
            << model.wet_mean() << std::endl;
}

} // namespace

int main() {
  std::cout << "=== bodytherm: 17-segment thermoregulation ===" << std::endl;
  std::cout << "Initializing model..." << std::endl;

  auto init_start = std::chrono::steady_clock::now();

  biology::ThermalBodyModel::Config config;
  config.profile.height_m = 1.7;
  config.profile.weight_kg = 60.0;
  config.profile.fat_percent = 20.0;
  config.profile.age_years = 30.0;
  config.profile.sex = biology::Sex::MALE;
  config.profile.bmr_equation = biology::BmrEquation::JAPANESE;
  config.profile.bsa_equation = biology::BsaEquation::FUJIMOTO;
  config.ex_output = biology::OutputSelector::all();

  try {
    biology::ThermalBodyModel model(config);
    double init_ms = std::chrono::duration<double, std::milli>(
                         std::chrono::steady_clock::now() - init_start)
                         .count();

    std::cout << "[OK] Body: BSA " << std::setprecision(3) << std::fixed
              << model.anthropometry().bsa_total << " m2, BMR "
              << std::setprecision(1) << model.bmr_power() << " W ("
              << model.bmr() << " W/m2), CO " << model.cardiac_output()
              << " L/h" << std::endl;
    std::cout << "[OK] Setpoints derived in " << init_ms
              << " ms: Tcr(head) " << std::setprecision(2)
              << model.setpoint_cr()[0] << " C, Tsk(chest) "
              << model.setpoint_sk()[2] << " C" << std::endl;

    // Phase 1: neutral office, seated
    auto &bc = model.conditions();
    bc.set_air_radiant(28.0, 28.0);
    bc.set_rh(40.0);
    bc.set_va(0.2);
    bc.set_par(1.2);
    bc.set_posture(thermal::Posture::SITTING);
    bc.set_icl(OFFICE_CLOTHING);
    model.simulate(30, 60.0);
    print_phase("Neutral office", model);

    // Phase 2: cool room with a desk fan
    bc.set_to(20.0);
    bc.set_va(DESK_FAN);
    model.simulate(60, 60.0);
    print_phase("To 20 C + desk fan", model);

    // Phase 3: warm radiant load; Ta and Tr leave operative mode together
    bc.set_air_radiant(30.0, 35.0);
    model.simulate(30, 60.0);
    print_phase("Ta 30 C / Tr 35 C", model);

    auto table = model.results_table();
    std::cout << "[OK] Results: " << model.results().size() << " rows x "
              << table.size() << " columns" << std::endl;
  } catch (const core::Error &e) {
    std::cerr << "[ERROR] " << e.what() << std::endl;
    return 1;
  }

  // Cohort: same room, different occupants
  entities::CohortManager cohort;
  try {
    biology::ThermalBodyModel::Config young;
    biology::ThermalBodyModel::Config older;
    older.profile.age_years = 68.0;
    biology::ThermalBodyModel::Config small;
    small.profile.sex = biology::Sex::FEMALE;
    small.profile.height_m = 1.58;
    small.profile.weight_kg = 50.0;
    small.profile.fat_percent = 26.0;

    cohort.spawn("young", young);
    cohort.spawn("older", older);
    cohort.spawn("small", small);
    std::cout << "[OK] Cohort: " << cohort.count() << " occupants, "
              << entities::CohortManager::max_threads() << " threads"
              << std::endl;

    cohort.apply([](biology::ThermalBodyModel &m) {
      m.conditions().set_to(18.0);
      m.conditions().set_posture("sitting");
      m.conditions().set_icl(0.5);
    });
    cohort.simulate_all(60, 60.0);

    for (auto entity : cohort.occupants()) {
      const auto &m = cohort.model(entity);
      std::cout << "  " << std::left << std::setw(8)
                << cohort.occupant(entity).name << std::right
                << std::setprecision(2) << " Tsk " << m.tsk_mean()
                << " C  Tcr(head) " << m.tcr()[0] << " C" << std::endl;
    }
  } catch (const core::Error &e) {
    std::cerr << "[ERROR] " << e.what() << std::endl;
    return 1;
  }

  std::cout << "Done." << std::endl;
  return 0;
}
