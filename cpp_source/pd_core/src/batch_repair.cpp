#include <algorithm>
#include <exception>
#include <stdexcept>
#include <thread>

#include "batch_repair.hpp"
#include "pd_log.hpp"
#include "thread_safe_queue.hpp"

namespace {

struct BatchJob {
  size_t index{0};
  const NamedMatrix *input{nullptr};
};

} // namespace

BatchRepairer::BatchRepairer(size_t workers, RepairOptions options,
                             size_t queue_capacity)
    : _workers(workers), _options(options), _queue_capacity(queue_capacity) {
  if (_workers == 0) {
    throw std::invalid_argument("BatchRepairer: need at least one worker");
  }
  if (_queue_capacity == 0) {
    throw std::invalid_argument("BatchRepairer: queue capacity must be > 0");
  }
}

BatchOutcome BatchRepairer::repair_one(const NamedMatrix &input) const {
  BatchOutcome outcome;
  outcome.name = input.name;

  try {
    outcome.result = nearest_pd(input.matrix, _options);
    pd_log() << "[batch] " << input.name << ": "
             << to_string(outcome.result->report.outcome) << " after "
             << outcome.result->report.iterations << " loading passes";
  } catch (const IterationLimitExceeded &e) {
    outcome.error = e.what();
    outcome.iteration_limit = true;
    outcome.failed_iterations = e.iterations();
    outcome.failed_min_eigenvalue = e.min_eigenvalue();
    pd_log() << "[batch] " << input.name << ": " << e.what();
  } catch (const std::exception &e) {
    outcome.error = e.what();
    pd_log() << "[batch] " << input.name << ": rejected, " << e.what();
  }
  return outcome;
}

std::vector<BatchOutcome>
BatchRepairer::run(const std::vector<NamedMatrix> &inputs) const {
  std::vector<BatchOutcome> outcomes(inputs.size());
  if (inputs.empty())
    return outcomes;

  // the queue only carries pointers into inputs, which outlives the workers
  ThreadQueue<BatchJob> queue(_queue_capacity);

  auto worker_loop = [&]() {
    BatchJob job;
    while (queue.wait_and_pop(job)) {
      // each index is written by exactly one worker
      outcomes[job.index] = repair_one(*job.input);
    }
  };

  const size_t n_threads = std::min(_workers, inputs.size());
  std::vector<std::thread> pool;
  pool.reserve(n_threads);

  auto shutdown = [&]() {
    queue.close();
    for (auto &t : pool) {
      if (t.joinable())
        t.join();
    }
  };

  try {
    for (size_t i = 0; i < n_threads; ++i) {
      pool.emplace_back(worker_loop);
    }
    for (size_t i = 0; i < inputs.size(); ++i) {
      if (!queue.push(BatchJob{i, &inputs[i]})) {
        throw std::runtime_error("BatchRepairer: job queue closed early");
      }
    }
  } catch (...) {
    shutdown();
    throw;
  }

  // close() lets the workers drain what is left and exit
  shutdown();
  return outcomes;
}
