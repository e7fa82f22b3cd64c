#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include "nearest_pd.hpp"
#include "pd_log.hpp"

namespace {

void validate_input(const Matrix &A) {
  if (A.rows() == 0 || A.cols() == 0) {
    throw std::invalid_argument("nearest_pd: input matrix is empty");
  }
  if (A.rows() != A.cols()) {
    throw std::invalid_argument(
        "nearest_pd: input must be square, got " + std::to_string(A.rows()) +
        "x" + std::to_string(A.cols()));
  }
  if (!A.allFinite()) {
    throw std::invalid_argument("nearest_pd: input contains NaN or Inf");
  }
}

// smallest eigenvalue of an exactly symmetric matrix
double min_eigenvalue(const Matrix &M) {
  Eigen::SelfAdjointEigenSolver<Matrix> es(M, Eigen::EigenvaluesOnly);
  if (es.info() == Eigen::Success) {
    return es.eigenvalues().minCoeff();
  }

  // fall back to the general solver and take the real parts
  pd_log() << "[nearest_pd] self-adjoint eigensolver did not converge, "
              "using general solver";
  Eigen::EigenSolver<Matrix> general(M, false);
  if (general.info() != Eigen::Success) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return general.eigenvalues().real().minCoeff();
}

} // namespace

IterationLimitExceeded::IterationLimitExceeded(Matrix last_candidate,
                                               double min_eigenvalue,
                                               int iterations)
    : std::runtime_error("nearest_pd: max iteration reached (" +
                         std::to_string(iterations) +
                         " loading passes, last min eigenvalue " +
                         std::to_string(min_eigenvalue) + ")"),
      _last_candidate(std::move(last_candidate)),
      _min_eigenvalue(min_eigenvalue), _iterations(iterations) {}

bool is_positive_definite(const Matrix &M) {
  if (M.rows() == 0 || M.rows() != M.cols())
    return false;

  // LLT would happily succeed on NaN pivots
  if (!M.allFinite())
    return false;

  // LLT only reads the lower triangle, so symmetry has to be checked here
  if (M != M.transpose())
    return false;

  Eigen::LLT<Matrix> llt(M);
  return llt.info() == Eigen::Success;
}

double float_spacing(double x) {
  x = std::abs(x);
  if (!std::isfinite(x))
    return std::numeric_limits<double>::quiet_NaN();

  const double next = std::nextafter(x, std::numeric_limits<double>::infinity());
  if (std::isinf(next)) {
    // x is the largest finite double
    return x - std::nextafter(x, 0.0);
  }
  return next - x;
}

Matrix symmetric_polar_factor(const Matrix &B, PolarMethod method) {
  switch (method) {
  case PolarMethod::Svd: {
    Eigen::JacobiSVD<Matrix> svd(B, Eigen::ComputeFullU | Eigen::ComputeFullV);
    const Matrix &V = svd.matrixV();
    return V * svd.singularValues().asDiagonal() * V.transpose();
  }
  case PolarMethod::Eigen: {
    Eigen::SelfAdjointEigenSolver<Matrix> es(B);
    if (es.info() != Eigen::Success) {
      throw std::runtime_error(
          "symmetric_polar_factor: eigen-decomposition did not converge");
    }
    const Matrix &Q = es.eigenvectors();
    return Q * es.eigenvalues().cwiseAbs().asDiagonal() * Q.transpose();
  }
  }
  throw std::invalid_argument("symmetric_polar_factor: unknown polar method");
}

RepairResult nearest_pd(const Matrix &A, const RepairOptions &options) {
  validate_input(A);
  if (options.max_iterations < 0) {
    throw std::invalid_argument("nearest_pd: max_iterations must be >= 0");
  }

  RepairResult result;

  // fast path, exact check
  if (is_positive_definite(A)) {
    result.matrix = A;
    result.report.outcome = RepairOutcome::Unchanged;
    return result;
  }

  // halve before adding so entries near the double range do not overflow
  const Matrix B = 0.5 * A + 0.5 * A.transpose();
  const Matrix H = symmetric_polar_factor(B, options.polar_method);

  const Matrix A2 = 0.5 * B + 0.5 * H;
  Matrix A3 = 0.5 * A2 + 0.5 * A2.transpose();

  if (is_positive_definite(A3)) {
    result.report.outcome = RepairOutcome::Projected;
    result.report.frobenius_distance = (A3 - A).stableNorm();
    result.matrix = std::move(A3);
    return result;
  }

  // still on the PSD boundary, nudge it with diagonal loading
  // spacing comes from the untouched input and stays fixed for the loop,
  // stableNorm only overflows when the true norm exceeds the double range
  const double spacing = float_spacing(A.stableNorm());
  result.report.spacing = spacing;

  double mineig = std::numeric_limits<double>::quiet_NaN();
  for (int k = 1; k <= options.max_iterations; ++k) {
    // a non-finite candidate cannot be recovered, skip the eigensolver
    mineig = A3.allFinite() ? min_eigenvalue(A3)
                            : std::numeric_limits<double>::quiet_NaN();

    const double kk = static_cast<double>(k) * static_cast<double>(k);
    const double shift = -mineig * kk + spacing;
    A3.diagonal().array() += shift;

    result.report.min_eigenvalues.push_back(mineig);
    result.report.shifts.push_back(shift);
    result.report.iterations = k;

    pd_log() << "[nearest_pd] pass " << k << ": mineig = " << mineig
             << ", shift = " << shift << ", spacing = " << spacing;

    if (is_positive_definite(A3)) {
      result.report.outcome = RepairOutcome::Loaded;
      result.report.frobenius_distance = (A3 - A).stableNorm();
      result.matrix = std::move(A3);
      return result;
    }
  }

  if (options.max_iterations == 0 && A3.allFinite()) {
    mineig = min_eigenvalue(A3);
  }

  pd_log() << "[nearest_pd] ERROR: no positive-definite matrix after "
           << options.max_iterations << " loading passes";
  throw IterationLimitExceeded(std::move(A3), mineig, options.max_iterations);
}

Matrix nearest_pd_matrix(const Matrix &A) { return nearest_pd(A).matrix; }
