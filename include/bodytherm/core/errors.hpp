#pragma once

/**
 * @file errors.hpp
 * @brief Exception taxonomy raised by the thermoregulation engine.
 *
 * Every error is raised synchronously at the offending call. Physiological
 * saturations (wettedness ceiling, flow renormalisation, vasomotion bounds)
 * are model behaviour and never surface here.
 */

#include <stdexcept>
#include <string>

namespace bodytherm {
namespace core {

/**
 * @brief Base class of all engine errors.
 */
class Error : public std::runtime_error {
public:
  explicit Error(const std::string &what) : std::runtime_error(what) {}
};

/// Unsupported anthropometry or equation combination (construction time).
class ConfigurationError : public Error {
public:
  explicit ConfigurationError(const std::string &what) : Error(what) {}
};

/// Conflicting or out-of-range environmental/clothing input (setter time).
class InvalidBoundaryCondition : public Error {
public:
  explicit InvalidBoundaryCondition(const std::string &what) : Error(what) {}
};

/// Bad simulate() arguments.
class InvalidArgument : public Error {
public:
  explicit InvalidArgument(const std::string &what) : Error(what) {}
};

/// The integration step would leave the scheme's stability region.
class UnstableStepSizeError : public Error {
public:
  explicit UnstableStepSizeError(const std::string &what) : Error(what) {}
};

/**
 * @brief A converged step left the 0-50 °C band the model represents.
 *
 * Raised when the boundary conditions drive a node out of range (for
 * example unprotected skin in freezing wind). A shorter step gives the
 * same result; only different conditions or exposure time avoid it.
 */
class StateOutOfRangeError : public UnstableStepSizeError {
public:
  explicit StateOutOfRangeError(const std::string &what)
      : UnstableStepSizeError(what) {}
};

} // namespace core
} // namespace bodytherm
