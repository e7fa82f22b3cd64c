// main.cpp
#include <exception>
#include <iostream>
#include <string>

#include "repair_job.hpp"

int main(int argc, char **argv) {
  // defaults (CMake copies config/ next to the binary)
  std::string job_path = "config/repair_job.json";

  // ultra-light CLI: nearpd_repair [job_file]
  if (argc > 2) {
    std::cerr << "usage: " << argv[0] << " [job_file]\n";
    return 2;
  }
  if (argc > 1)
    job_path = argv[1];

  try {
    RepairJob job(job_path);
    const int status = job.run();
    std::cout << "Results written to " << job.config().output_path
              << "\nDiagnostics log: " << job.get_log_path().string() << "\n";
    return status;
  } catch (const std::exception &e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 2;
  }
}
