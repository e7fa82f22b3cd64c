#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

#include "batch_repair.hpp"
#include "logger.hpp"

/**
 * @note Payloads are down-converted to float32; use the JSON result file when
 * full double precision is needed.
 */

constexpr uint16_t MSG_ID_REPAIR_SUMMARY = 0x01; // [n, outcome, iterations, ||R - A||_F]
constexpr uint16_t MSG_ID_LOADING_STEP = 0x02;   // [k, mineig, shift, spacing]
constexpr uint16_t MSG_ID_REPAIR_FAILURE = 0x03; // [n, iterations, mineig]

constexpr uint8_t NODE_ID_REPAIR_TOOL = 0x01;

template <size_t N>
std::array<float, N> convertForLogging(const std::array<double, N> &values) {
  std::array<float, N> out;
  for (size_t i = 0; i < N; ++i)
    out[i] = static_cast<float>(values[i]);
  return out;
}

/**
 * @brief Write the records describing one repaired matrix.
 *
 * A successful repair produces one summary record followed by one record per
 * loading pass; a failure produces a single failure record.
 */
inline void log_outcome_out(Logger &diag_logger, const BatchOutcome &outcome,
                            size_t dimension) {
  const double n = static_cast<double>(dimension);

  if (!outcome.ok()) {
    if (outcome.iteration_limit) {
      diag_logger.logMessage<3>(
          MSG_ID_REPAIR_FAILURE, NODE_ID_REPAIR_TOOL,
          convertForLogging<3>({n, static_cast<double>(outcome.failed_iterations),
                                outcome.failed_min_eigenvalue}));
    }
    return;
  }

  const RepairReport &report = outcome.result->report;
  diag_logger.logMessage<4>(
      MSG_ID_REPAIR_SUMMARY, NODE_ID_REPAIR_TOOL,
      convertForLogging<4>({n, static_cast<double>(static_cast<int>(report.outcome)),
                            static_cast<double>(report.iterations),
                            report.frobenius_distance}));

  for (size_t i = 0; i < report.min_eigenvalues.size(); ++i) {
    diag_logger.logMessage<4>(
        MSG_ID_LOADING_STEP, NODE_ID_REPAIR_TOOL,
        convertForLogging<4>({static_cast<double>(i + 1),
                              report.min_eigenvalues[i], report.shifts[i],
                              report.spacing}));
  }
}
