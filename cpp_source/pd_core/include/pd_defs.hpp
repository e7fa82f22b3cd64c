#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <string>
#include <vector>

// covariance matrices are sized at runtime from the job input
using Matrix = Eigen::MatrixXd;
using Vector = Eigen::VectorXd;

// hard cap on diagonal loading passes
constexpr int PD_MAX_LOADING_ITERATIONS = 100;

/// @brief How the symmetric polar factor H of B is built.
enum class PolarMethod : uint8_t {
  Svd = 0,   ///< H = V * diag(S) * V^T from B = U S V^T
  Eigen = 1  ///< H = Q * |L| * Q^T from the symmetric eigen-decomposition
};

/// @brief Which branch of the repair produced the returned matrix.
enum class RepairOutcome : uint8_t {
  Unchanged = 0, ///< input was already positive definite
  Projected = 1, ///< polar-factor projection alone was enough
  Loaded = 2     ///< projection plus one or more diagonal loading passes
};

struct RepairOptions {
  int max_iterations{PD_MAX_LOADING_ITERATIONS};
  PolarMethod polar_method{PolarMethod::Svd};
};

/**
 * @brief Diagnostics collected while repairing a single matrix.
 *
 * min_eigenvalues[i] and shifts[i] belong to loading pass k = i + 1.
 */
struct RepairReport {
  RepairOutcome outcome{RepairOutcome::Unchanged};
  int iterations{0};
  double spacing{0.0};
  double frobenius_distance{0.0};
  std::vector<double> min_eigenvalues;
  std::vector<double> shifts;
};

struct RepairResult {
  Matrix matrix;
  RepairReport report;
};

std::string to_string(RepairOutcome outcome);
std::string to_string(PolarMethod method);

// throws std::invalid_argument on an unknown name
PolarMethod polar_method_from_string(const std::string &name);
