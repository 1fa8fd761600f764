#pragma once

/**
 * @file tissue_network.hpp
 * @brief Subject-scaled node capacities and tissue conductances.
 */

#include <Eigen/Dense>

#include <bodytherm/biology/anthropometry.hpp>
#include <bodytherm/core/segments.hpp>

namespace bodytherm {
namespace biology {

struct TissueNetwork {
  core::NodeArray capacity_j_k{}; // heat capacity per node [J/K]
  Eigen::MatrixXd conductance;    // symmetric, zero diagonal [W/K]
};

/**
 * @brief Scales the standard-body tables to a subject.
 *
 * Capacities follow body weight, conductances follow surface area; skin-side
 * conductances are further corrected for body fat.
 */
TissueNetwork build_tissue_network(const Anthropometry &anthro);

/// Multiplier applied to skin-side conductances of one segment.
double fat_correction(const Anthropometry &anthro, size_t segment);

} // namespace biology
} // namespace bodytherm
