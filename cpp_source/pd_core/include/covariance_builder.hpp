#pragma once

#include "pd_defs.hpp"

/// @brief Units of the standard deviations handed to the covariance builder.
enum class SigmaUnits : uint8_t {
  Percent = 0,  ///< e.g. 16.5 means 16.5%, divided by 100 before use
  Fraction = 1  ///< already a fraction of 1
};

// throws std::invalid_argument on an unknown name
SigmaUnits sigma_units_from_string(const std::string &name);

/**
 * @brief Build a covariance matrix from a correlation matrix and volatilities.
 *
 * cov(i, j) = rho(i, j) * sigma(i) * sigma(j), with sigma converted to a
 * fraction first. The result is in (fraction of 1)^2 and is not repaired; float
 * roundoff can leave it slightly non-PD, which is what nearest_pd() is for.
 *
 * @param rho   Square correlation matrix.
 * @param sigma Standard deviation per asset, same length as rho's dimension.
 * @param units Units of sigma.
 * @throws std::invalid_argument on a dimension mismatch, a non-finite entry or a
 * negative standard deviation.
 */
Matrix covariance_from_correlation(const Matrix &rho, const Vector &sigma,
                                   SigmaUnits units = SigmaUnits::Percent);
