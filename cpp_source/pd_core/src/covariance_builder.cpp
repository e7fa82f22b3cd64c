#include <stdexcept>
#include <string>

#include "covariance_builder.hpp"

SigmaUnits sigma_units_from_string(const std::string &name) {
  if (name == "percent")
    return SigmaUnits::Percent;
  if (name == "fraction")
    return SigmaUnits::Fraction;
  throw std::invalid_argument("Unknown sigma_units '" + name +
                              "', expected \"percent\" or \"fraction\"");
}

Matrix covariance_from_correlation(const Matrix &rho, const Vector &sigma,
                                   SigmaUnits units) {
  if (rho.rows() == 0 || rho.rows() != rho.cols()) {
    throw std::invalid_argument(
        "covariance_from_correlation: correlation must be square and non-empty");
  }
  if (sigma.size() != rho.rows()) {
    throw std::invalid_argument(
        "covariance_from_correlation: sigma size (" +
        std::to_string(sigma.size()) + ") must match correlation size (" +
        std::to_string(rho.rows()) + ")");
  }
  if (!rho.allFinite() || !sigma.allFinite()) {
    throw std::invalid_argument(
        "covariance_from_correlation: inputs contain NaN or Inf");
  }
  if ((sigma.array() < 0.0).any()) {
    throw std::invalid_argument(
        "covariance_from_correlation: standard deviations must be >= 0");
  }

  const Vector s = (units == SigmaUnits::Percent) ? Vector(sigma / 100.0) : sigma;

  // elementwise rho .* (s * s^T)
  return rho.cwiseProduct(s * s.transpose());
}
