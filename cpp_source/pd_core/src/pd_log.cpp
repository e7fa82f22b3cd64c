#include <fstream>
#include <mutex>
#include <stdexcept>

#include "pd_log.hpp"

namespace {

std::mutex &sink_mutex() {
  static std::mutex mtx;
  return mtx;
}

std::ofstream &sink() {
  static std::ofstream out;
  return out;
}

} // namespace

PdLogLine::~PdLogLine() {
  std::lock_guard<std::mutex> lock(sink_mutex());
  std::ofstream &out = sink();
  if (!out.is_open())
    return;
  out << _buffer.str() << '\n';
  out.flush();
}

void set_pd_log_file(const std::string &path) {
  std::lock_guard<std::mutex> lock(sink_mutex());
  std::ofstream &out = sink();
  if (out.is_open())
    out.close();
  out.clear();
  out.open(path, std::ios::app);
  if (!out.is_open()) {
    throw std::runtime_error("Failed to open debug log file: " + path);
  }
}

void disable_pd_log() {
  std::lock_guard<std::mutex> lock(sink_mutex());
  if (sink().is_open())
    sink().close();
}

bool pd_log_enabled() {
  std::lock_guard<std::mutex> lock(sink_mutex());
  return sink().is_open();
}
