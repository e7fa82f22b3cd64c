// nearest_pd.hpp
#pragma once

#include <stdexcept>
#include <string>

#include "pd_defs.hpp"

/**
 * @brief Raised when diagonal loading fails to reach a positive-definite matrix
 * within the configured number of passes.
 *
 * Carries the last candidate and the most recent minimum eigenvalue so the
 * caller can inspect what went wrong with the source data.
 */
class IterationLimitExceeded : public std::runtime_error {
public:
  IterationLimitExceeded(Matrix last_candidate, double min_eigenvalue,
                         int iterations);

  const Matrix &last_candidate() const noexcept { return _last_candidate; }
  double min_eigenvalue() const noexcept { return _min_eigenvalue; }
  int iterations() const noexcept { return _iterations; }

private:
  Matrix _last_candidate;
  double _min_eigenvalue;
  int _iterations;
};

/**
 * @brief Exact positive-definiteness test.
 *
 * True iff M is non-empty, square, finite, exactly symmetric and its LLT
 * factorization succeeds. No tolerance is applied anywhere.
 */
bool is_positive_definite(const Matrix &M);

/**
 * @brief Spacing between |x| and the next representable double.
 *
 * Returns NaN for infinite x, which poisons any loading term built from it.
 */
double float_spacing(double x);

/**
 * @brief Symmetric positive-semidefinite polar factor of a symmetric matrix.
 */
Matrix symmetric_polar_factor(const Matrix &B, PolarMethod method);

/**
 * @brief Return the nearest symmetric positive-definite matrix to A.
 *
 * Applies Higham's projection (A + H) / 2 on the symmetrized input, then, if
 * the projection sits on the PSD boundary, adds (-mineig * k^2 + spacing) * I
 * for k = 1, 2, ... until the exact PD test passes. spacing is the float
 * spacing of ||A||_F and is fixed for the whole call.
 *
 * @param A       Square input matrix, n >= 1, all entries finite.
 * @param options Loading cap and polar factor method.
 * @return        The repaired matrix and a report of the branch taken.
 * @throws std::invalid_argument if A is empty, non-square or non-finite.
 * @throws IterationLimitExceeded if the loading cap is exhausted.
 */
RepairResult nearest_pd(const Matrix &A,
                        const RepairOptions &options = RepairOptions{});

/// @brief Convenience overload returning only the repaired matrix.
Matrix nearest_pd_matrix(const Matrix &A);
