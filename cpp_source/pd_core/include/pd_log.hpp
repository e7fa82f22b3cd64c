#pragma once

#include <sstream>
#include <string>

/**
 * @brief One line of the text debug log.
 *
 * Collects everything streamed into it and hands the finished line to the
 * shared sink on destruction, so lines from concurrent repairs never interleave.
 * When the sink is disabled the text is dropped.
 */
class PdLogLine {
public:
  PdLogLine() = default;
  PdLogLine(const PdLogLine &) = delete;
  PdLogLine &operator=(const PdLogLine &) = delete;
  ~PdLogLine();

  template <typename T> PdLogLine &operator<<(const T &value) {
    _buffer << value;
    return *this;
  }

private:
  std::ostringstream _buffer;
};

// usage: pd_log() << "[nearest_pd] mineig = " << mineig;
inline PdLogLine pd_log() { return {}; }

// opens (appends to) a debug log file; throws std::runtime_error on failure
void set_pd_log_file(const std::string &path);

// closes the sink; later pd_log() lines are dropped
void disable_pd_log();

bool pd_log_enabled();
