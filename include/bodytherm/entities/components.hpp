#pragma once

#include <string>

namespace bodytherm {
namespace entities {

/**
 * @brief Named occupant of a shared environment.
 */
struct Occupant {
  std::string name;
};

/**
 * @brief Outcome of the last batch step of an occupant.
 */
struct StepStatus {
  bool ok = true;
  std::string error;
};

} // namespace entities
} // namespace bodytherm
