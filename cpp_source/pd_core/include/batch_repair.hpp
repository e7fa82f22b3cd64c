#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "nearest_pd.hpp"

struct NamedMatrix {
  std::string name;
  Matrix matrix;
};

/**
 * @brief Result of repairing one matrix of a batch.
 *
 * Exactly one of result / error is meaningful, as told by ok().
 */
struct BatchOutcome {
  std::string name;
  std::optional<RepairResult> result;
  std::string error;

  // filled in when the loading cap was hit
  bool iteration_limit{false};
  int failed_iterations{0};
  double failed_min_eigenvalue{0.0};

  bool ok() const { return result.has_value(); }
};

/**
 * @brief Repairs independent matrices on a small pool of worker threads.
 *
 * Matrices are handed to the workers through a bounded ThreadQueue. Every call
 * to nearest_pd() works on its own copy, so the workers share nothing but the
 * queue and their own result slot. A failing matrix is recorded in its outcome
 * and never stops the rest of the batch.
 */
class BatchRepairer {
public:
  /**
   * @param workers        Number of worker threads, at least 1.
   * @param options        Options applied to every matrix.
   * @param queue_capacity Capacity of the job queue, at least 1.
   * @throws std::invalid_argument if workers or queue_capacity is zero.
   */
  BatchRepairer(size_t workers, RepairOptions options = RepairOptions{},
                size_t queue_capacity = 64);

  // outcomes come back in input order
  std::vector<BatchOutcome> run(const std::vector<NamedMatrix> &inputs) const;

  size_t workers() const { return _workers; }
  const RepairOptions &options() const { return _options; }

private:
  size_t _workers;
  RepairOptions _options;
  size_t _queue_capacity;

  BatchOutcome repair_one(const NamedMatrix &input) const;
};
