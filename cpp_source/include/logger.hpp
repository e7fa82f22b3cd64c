#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Compact binary diagnostics log for repair runs.
 *
 * Every record is a packed 9-byte header, a float32 payload and a CRC-16 over
 * header + payload. The file opens with the "LOGF" magic, a version byte, an
 * endianness byte and a human-readable UTC start time line.
 */

constexpr uint32_t LOG_MAGIC = 0x46474F4C; // ASCII "LOGF" little-endian
constexpr uint8_t LOG_VERSION = 1;

/// @brief Supported payload data types.
enum class DataType : uint8_t {
  Float32 = 0b00,  ///< 4-byte IEEE 754 float
  Int16 = 0b01,    ///< 2-byte signed integer
  Float64 = 0b10,  ///< 8-byte double
  Reserved = 0b11  ///< Reserved for future use
};

// ---- Packed Log Header Definition ----
#pragma pack(push, 1)
/**
 * @brief Packed binary header preceding each log entry.
 */
struct LogHeader {
  uint32_t timestamp; ///< Microseconds since logger start
  uint16_t id;        ///< Message ID, see logger_conversions.hpp
  uint8_t flags;      ///< data type in bits 1-2, others reserved
  uint8_t node_id;    ///< Producer of the record
  uint8_t dlc;        ///< Payload size in bytes
};
#pragma pack(pop)

static_assert(sizeof(LogHeader) == 9, "LogHeader must be 9 bytes packed.");

/**
 * @brief Compute a CRC-16-CCITT checksum over a buffer.
 *
 * @param data Pointer to the byte buffer.
 * @param length Length of the buffer in bytes.
 * @param crc Initial CRC value (default = 0xFFFF).
 * @return uint16_t Final CRC value.
 */
inline uint16_t crc16_ccitt(const uint8_t *data, size_t length,
                            uint16_t crc = 0xFFFF) {
  for (size_t i = 0; i < length; ++i) {
    crc ^= static_cast<uint16_t>(data[i]) << 8;
    for (int j = 0; j < 8; ++j) {
      if (crc & 0x8000)
        crc = static_cast<uint16_t>((crc << 1) ^ 0x1021);
      else
        crc = static_cast<uint16_t>(crc << 1);
    }
  }
  return crc;
}

/**
 * @brief Build "<stem>_YYYYmmdd_HHMMSS_mmm<ext>" from the current UTC time.
 *
 * If that file already exists a "_<n>" counter is appended to the stamp so a
 * second run in the same millisecond does not truncate the first log.
 */
inline std::string formatLogName(const std::string &stem,
                                 const std::string &ext) {
  const auto now = std::chrono::system_clock::now();
  const std::time_t secs = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch())
                      .count() %
                  1000;
  std::tm tm_utc{};
  gmtime_r(&secs, &tm_utc);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "_%Y%m%d_%H%M%S", &tm_utc);
  char millis[8];
  std::snprintf(millis, sizeof(millis), "_%03d", static_cast<int>(ms));

  const std::string base = stem + buffer + millis;
  std::string name = base + ext;
  for (int n = 1; std::filesystem::exists(name); ++n) {
    name = base + "_" + std::to_string(n) + ext;
  }
  return name;
}

/**
 * @brief Logger for writing binary diagnostic records to a file.
 */
class Logger {
public:
  /**
   * @brief Opens the output file (creating parent directories) and writes the
   * file header.
   *
   * @param log_file_name Path to the binary log file.
   * @throws std::runtime_error if the file cannot be opened.
   */
  explicit Logger(const std::string &log_file_name = "diag_log.bin")
      : _path(log_file_name), start_time_(std::chrono::steady_clock::now()),
        wall_time_(std::chrono::system_clock::now()) {
    if (_path.has_parent_path()) {
      std::filesystem::create_directories(_path.parent_path());
    }
    out_.open(_path, std::ios::binary);
    if (!out_.is_open()) {
      throw std::runtime_error("Failed to open log file: " + _path.string());
    }

    const uint8_t endianness = 1; // 1 = little-endian
    out_.write(reinterpret_cast<const char *>(&LOG_MAGIC), sizeof(LOG_MAGIC));
    out_.write(reinterpret_cast<const char *>(&LOG_VERSION),
               sizeof(LOG_VERSION));
    out_.write(reinterpret_cast<const char *>(&endianness), sizeof(endianness));

    // newline keeps the datetime readable with cat
    out_ << "\n";

    std::time_t time = std::chrono::system_clock::to_time_t(wall_time_);
    std::tm tm_utc{};
    gmtime_r(&time, &tm_utc);
    char buffer[128];
    std::strftime(buffer, sizeof(buffer),
                  "# Log Start Time: %Y-%m-%d %H:%M:%S UTC\n", &tm_utc);
    out_ << buffer;
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  ~Logger() { flush(); }

  void flush() {
    std::lock_guard<std::mutex> lock(mtx_);
    out_.flush();
  }

  const std::filesystem::path &path() const { return _path; }

  size_t records_written() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return records_;
  }

  /**
   * @brief Write one record with a float32 payload.
   *
   * @tparam N Number of floats in the payload, at most 63 so dlc fits a byte.
   * @param id Message ID.
   * @param node_id Producer of the record.
   * @param payload Payload values.
   */
  template <size_t N>
  void logMessage(uint16_t id, uint8_t node_id,
                  const std::array<float, N> &payload) {
    static_assert(N * sizeof(float) <= 255, "payload too large for dlc");

    auto now = std::chrono::steady_clock::now();
    auto timestamp_us =
        std::chrono::duration_cast<std::chrono::microseconds>(now - start_time_)
            .count();

    LogHeader header;
    header.timestamp = static_cast<uint32_t>(timestamp_us);
    header.id = id;
    header.flags = static_cast<uint8_t>(DataType::Float32) << 1;
    header.node_id = node_id;
    header.dlc = static_cast<uint8_t>(sizeof(float) * N);

    std::vector<uint8_t> buffer(sizeof(header) + header.dlc);
    std::memcpy(buffer.data(), &header, sizeof(header));
    std::memcpy(buffer.data() + sizeof(header), payload.data(), header.dlc);

    uint16_t crc = crc16_ccitt(buffer.data(), buffer.size());

    std::lock_guard<std::mutex> lock(mtx_);
    out_.write(reinterpret_cast<const char *>(buffer.data()), buffer.size());
    out_.write(reinterpret_cast<const char *>(&crc), sizeof(crc));
    ++records_;
  }

private:
  std::filesystem::path _path;
  std::ofstream out_;
  std::chrono::steady_clock::time_point start_time_;
  std::chrono::system_clock::time_point wall_time_;
  mutable std::mutex mtx_;
  size_t records_{0};
};
