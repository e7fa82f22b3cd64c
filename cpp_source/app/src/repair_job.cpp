#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "covariance_builder.hpp"
#include "logger.hpp"
#include "logger_conversions.hpp"
#include "pd_log.hpp"
#include "repair_job.hpp"

namespace {

bool check_key(const std::string &key, const json &j) {
  if (j.contains(key)) {
    return true;
  }
  std::cerr << "Key '" << key << "' not found in job file." << std::endl;
  return false;
}

Vector vector_from_json(const json &values) {
  if (!values.is_array() || values.empty()) {
    throw std::invalid_argument("Expected a non-empty array of numbers");
  }
  Vector v(static_cast<Eigen::Index>(values.size()));
  for (size_t i = 0; i < values.size(); ++i) {
    if (!values[i].is_number()) {
      throw std::invalid_argument("Non-numeric entry at index " +
                                  std::to_string(i));
    }
    v(static_cast<Eigen::Index>(i)) = values[i].get<double>();
  }
  return v;
}

} // namespace

Matrix matrix_from_json(const json &rows) {
  if (!rows.is_array() || rows.empty()) {
    throw std::invalid_argument("Matrix must be a non-empty array of rows");
  }
  const size_t n_rows = rows.size();
  if (!rows[0].is_array() || rows[0].empty()) {
    throw std::invalid_argument("Matrix rows must be non-empty arrays");
  }
  const size_t n_cols = rows[0].size();

  Matrix M(static_cast<Eigen::Index>(n_rows), static_cast<Eigen::Index>(n_cols));
  for (size_t r = 0; r < n_rows; ++r) {
    const json &row = rows[r];
    if (!row.is_array() || row.size() != n_cols) {
      throw std::invalid_argument("Matrix row " + std::to_string(r) +
                                  " must have " + std::to_string(n_cols) +
                                  " entries");
    }
    for (size_t c = 0; c < n_cols; ++c) {
      if (!row[c].is_number()) {
        throw std::invalid_argument("Non-numeric matrix entry at (" +
                                    std::to_string(r) + ", " +
                                    std::to_string(c) + ")");
      }
      M(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) =
          row[c].get<double>();
    }
  }
  return M;
}

json matrix_to_json(const Matrix &M) {
  json rows = json::array();
  for (Eigen::Index r = 0; r < M.rows(); ++r) {
    json row = json::array();
    for (Eigen::Index c = 0; c < M.cols(); ++c) {
      row.push_back(M(r, c));
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

NamedMatrix named_matrix_from_json(const json &entry) {
  if (!entry.is_object() || !entry.contains("name") ||
      !entry["name"].is_string()) {
    throw std::invalid_argument("Every matrix entry needs a string 'name'");
  }

  NamedMatrix out;
  out.name = entry["name"].get<std::string>();

  if (entry.contains("matrix")) {
    out.matrix = matrix_from_json(entry["matrix"]);
    return out;
  }

  if (entry.contains("correlation") && entry.contains("sigma")) {
    const SigmaUnits units =
        sigma_units_from_string(entry.value("sigma_units", "percent"));
    out.matrix = covariance_from_correlation(
        matrix_from_json(entry["correlation"]),
        vector_from_json(entry["sigma"]), units);
    return out;
  }

  throw std::invalid_argument("Matrix entry '" + out.name +
                              "' needs either 'matrix' or 'correlation' and "
                              "'sigma'");
}

RepairJobConfig parse_job_config(const json &j) {
  for (const char *key : {"output_path", "matrices"}) {
    if (!check_key(key, j)) {
      throw std::runtime_error(
          std::string("Missing required key in job file: ") + key);
    }
  }

  RepairJobConfig config;
  config.output_path = j["output_path"].get<std::string>();
  config.log_dir = j.value("log_dir", config.log_dir);
  config.debug_log_path = j.value("debug_log_path", std::string{});

  const int workers = j.value("workers", 1);
  if (workers < 1) {
    throw std::invalid_argument("workers must be >= 1");
  }
  config.workers = static_cast<size_t>(workers);

  config.options.max_iterations =
      j.value("max_iterations", PD_MAX_LOADING_ITERATIONS);
  if (config.options.max_iterations < 0) {
    throw std::invalid_argument("max_iterations must be >= 0");
  }
  config.options.polar_method =
      polar_method_from_string(j.value("polar_method", "svd"));

  const json &matrices = j["matrices"];
  if (!matrices.is_array()) {
    throw std::invalid_argument("'matrices' must be an array");
  }
  for (const auto &entry : matrices) {
    config.matrices.push_back(named_matrix_from_json(entry));
  }
  return config;
}

RepairJob::RepairJob(const std::string &config_path)
    : _config_path(config_path) {
  load_configurations();
}

RepairJob::RepairJob(RepairJobConfig config) : _config(std::move(config)) {}

void RepairJob::load_configurations() {
  std::ifstream config_file(_config_path);
  if (!config_file.is_open()) {
    throw std::runtime_error("Failed to open job file: " + _config_path);
  }

  json j;
  try {
    config_file >> j;
  } catch (const json::parse_error &e) {
    throw std::runtime_error("Failed to parse job file " + _config_path +
                             ": " + e.what());
  }

  _config = parse_job_config(j);
  std::cout << "Job loaded: " << _config.matrices.size() << " matrices, "
            << _config.workers << " workers, polar method "
            << to_string(_config.options.polar_method) << "\n";
}

namespace {

// closes the debug sink when run() leaves, including by exception
struct PdLogSession {
  explicit PdLogSession(const std::string &path) : _active(!path.empty()) {
    if (_active)
      set_pd_log_file(path);
  }
  ~PdLogSession() {
    if (_active)
      disable_pd_log();
  }
  PdLogSession(const PdLogSession &) = delete;
  PdLogSession &operator=(const PdLogSession &) = delete;

private:
  bool _active;
};

} // namespace

int RepairJob::run() {
  PdLogSession debug_log(_config.debug_log_path);

  std::string log_dir = _config.log_dir;
  if (!log_dir.empty() && log_dir.back() != '/')
    log_dir += '/';
  const std::string log_path_str = formatLogName(log_dir + "nearpd_repair", ".bin");
  Logger diag_logger(log_path_str);
  _log_path = diag_logger.path();

  BatchRepairer repairer(_config.workers, _config.options);
  _outcomes = repairer.run(_config.matrices);

  int failures = 0;
  for (size_t i = 0; i < _outcomes.size(); ++i) {
    const BatchOutcome &outcome = _outcomes[i];
    log_outcome_out(diag_logger, outcome,
                    static_cast<size_t>(_config.matrices[i].matrix.rows()));
    if (outcome.ok()) {
      std::cout << outcome.name << ": "
                << to_string(outcome.result->report.outcome) << " ("
                << outcome.result->report.iterations
                << " loading passes, ||R - A||_F = "
                << outcome.result->report.frobenius_distance << ")\n";
    } else {
      ++failures;
      std::cerr << outcome.name << ": FAILED: " << outcome.error << "\n";
    }
  }
  diag_logger.flush();

  write_results();
  return failures == 0 ? 0 : 1;
}

void RepairJob::write_results() const {
  json results = json::array();
  for (const BatchOutcome &outcome : _outcomes) {
    json entry;
    entry["name"] = outcome.name;
    if (outcome.ok()) {
      const RepairReport &report = outcome.result->report;
      entry["status"] = "ok";
      entry["outcome"] = to_string(report.outcome);
      entry["iterations"] = report.iterations;
      entry["frobenius_distance"] = report.frobenius_distance;
      entry["matrix"] = matrix_to_json(outcome.result->matrix);
    } else {
      entry["status"] = "error";
      entry["error"] = outcome.error;
    }
    results.push_back(std::move(entry));
  }

  std::filesystem::path out_path(_config.output_path);
  if (out_path.has_parent_path()) {
    std::filesystem::create_directories(out_path.parent_path());
  }
  std::ofstream out(out_path);
  if (!out.is_open()) {
    throw std::runtime_error("Failed to open output file: " +
                             _config.output_path);
  }
  json doc;
  doc["results"] = std::move(results);
  out << std::setw(2) << doc << std::endl;
}
