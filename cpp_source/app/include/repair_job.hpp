#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "batch_repair.hpp"

using json = nlohmann::json;

/**
 * @brief Everything a repair run needs, as read from the job file.
 */
struct RepairJobConfig {
  std::string output_path;    // JSON result file
  std::string log_dir{"logs/"}; // binary diagnostics directory
  std::string debug_log_path; // empty leaves the text debug log disabled
  size_t workers{1};
  RepairOptions options;
  std::vector<NamedMatrix> matrices;
};

// array of equal-length numeric rows -> Matrix; throws std::invalid_argument
Matrix matrix_from_json(const json &rows);
json matrix_to_json(const Matrix &M);

// one entry of "matrices": either "matrix" or "correlation" + "sigma"
NamedMatrix named_matrix_from_json(const json &entry);

// checks required keys and applies defaults; throws on bad values
RepairJobConfig parse_job_config(const json &j);

/**
 * @brief A repair run driven by a JSON job file.
 *
 * Repairs every matrix in the job on a BatchRepairer, writes the JSON result
 * file and a binary diagnostics log with one summary record per matrix.
 */
class RepairJob {
public:
  /**
   * @param config_path Path to the job file.
   * @throws std::runtime_error if the file cannot be read or a required key is
   * missing, std::invalid_argument on malformed values.
   */
  explicit RepairJob(const std::string &config_path);
  explicit RepairJob(RepairJobConfig config);

  /**
   * @brief Run the batch and write both outputs.
   *
   * @return 0 if every matrix was repaired, 1 if any failed.
   * @throws std::runtime_error if an output cannot be written.
   */
  int run();

  const RepairJobConfig &config() const { return _config; }
  const std::vector<BatchOutcome> &outcomes() const { return _outcomes; }

  // where the binary log went, empty before run()
  const std::filesystem::path &get_log_path() const { return _log_path; }

private:
  std::string _config_path;
  RepairJobConfig _config;
  std::vector<BatchOutcome> _outcomes;
  std::filesystem::path _log_path;

  void load_configurations();
  void write_results() const;
};
