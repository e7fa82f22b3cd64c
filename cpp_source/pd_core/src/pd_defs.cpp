#include <stdexcept>

#include "pd_defs.hpp"

std::string to_string(RepairOutcome outcome) {
  switch (outcome) {
  case RepairOutcome::Unchanged:
    return "unchanged";
  case RepairOutcome::Projected:
    return "projected";
  case RepairOutcome::Loaded:
    return "loaded";
  }
  return "unknown";
}

std::string to_string(PolarMethod method) {
  switch (method) {
  case PolarMethod::Svd:
    return "svd";
  case PolarMethod::Eigen:
    return "eigen";
  }
  return "unknown";
}

PolarMethod polar_method_from_string(const std::string &name) {
  if (name == "svd")
    return PolarMethod::Svd;
  if (name == "eigen")
    return PolarMethod::Eigen;
  throw std::invalid_argument("Unknown polar_method '" + name +
                              "', expected \"svd\" or \"eigen\"");
}
