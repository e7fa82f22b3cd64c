// tests/test_logger.cpp
#include <gtest/gtest.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "logger.hpp"
#include "logger_conversions.hpp"

namespace fs = std::filesystem;

static std::vector<uint8_t> read_all(const fs::path &p) {
  std::ifstream in(p, std::ios::binary);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                              std::istreambuf_iterator<char>());
}

// offset of the first record: magic, version, endianness, '\n', time line
static size_t first_record_offset(const std::vector<uint8_t> &bytes) {
  size_t pos = sizeof(uint32_t) + 2 + 1;
  while (pos < bytes.size() && bytes[pos] != '\n')
    ++pos;
  return pos + 1;
}

TEST(Logger, CrcOfKnownVector) {
  const std::string check = "123456789";
  EXPECT_EQ(crc16_ccitt(reinterpret_cast<const uint8_t *>(check.data()),
                        check.size()),
            0x29B1);
}

TEST(Logger, FormatLogNameKeepsStemAndExtension) {
  const fs::path dir = fs::temp_directory_path() / "nearpd_logname_test";
  fs::remove_all(dir);
  const std::string stem = (dir / "nearpd_repair").string();

  const std::string name = formatLogName(stem, ".bin");
  EXPECT_EQ(name.rfind(stem + "_", 0), 0u);
  EXPECT_EQ(name.substr(name.size() - 4), ".bin");
  // stem + "_YYYYmmdd_HHMMSS_mmm" + ext
  EXPECT_EQ(name.size(), stem.size() + 20 + 4);
}

TEST(Logger, BackToBackRunsGetDistinctFiles) {
  const fs::path dir = fs::temp_directory_path() / "nearpd_logname_clash_test";
  fs::remove_all(dir);
  const std::string stem = (dir / "nearpd_repair").string();

  const std::string first = formatLogName(stem, ".bin");
  {
    Logger logger(first);
    logger.logMessage<1>(MSG_ID_REPAIR_SUMMARY, NODE_ID_REPAIR_TOOL, {1.0f});
  }
  const auto first_size = fs::file_size(first);

  const std::string second = formatLogName(stem, ".bin");
  EXPECT_NE(first, second);
  { Logger logger(second); }
  EXPECT_EQ(fs::file_size(first), first_size);

  fs::remove_all(dir);
}

TEST(Logger, WritesHeaderAndCheckedRecords) {
  const fs::path dir = fs::temp_directory_path() / "nearpd_logger_test";
  fs::remove_all(dir);
  const fs::path path = dir / "records.bin";

  RepairResult repaired;
  repaired.matrix = Matrix::Identity(2, 2);
  repaired.report.outcome = RepairOutcome::Loaded;
  repaired.report.iterations = 2;
  repaired.report.spacing = 1e-16;
  repaired.report.min_eigenvalues = {-1e-12, -1e-17};
  repaired.report.shifts = {1e-12, 1e-16};

  BatchOutcome outcome;
  outcome.name = "two_passes";
  outcome.result = repaired;

  {
    Logger logger(path.string());
    log_outcome_out(logger, outcome, 2);
    EXPECT_EQ(logger.records_written(), 3u);
  }

  const std::vector<uint8_t> bytes = read_all(path);
  ASSERT_GT(bytes.size(), 8u);

  uint32_t magic = 0;
  std::memcpy(&magic, bytes.data(), sizeof(magic));
  EXPECT_EQ(magic, LOG_MAGIC);
  EXPECT_EQ(bytes[4], LOG_VERSION);

  size_t pos = first_record_offset(bytes);
  const std::string time_line(bytes.begin() + 7, bytes.begin() + pos);
  EXPECT_EQ(time_line.rfind("# Log Start Time:", 0), 0u);

  const std::vector<uint16_t> expected_ids = {
      MSG_ID_REPAIR_SUMMARY, MSG_ID_LOADING_STEP, MSG_ID_LOADING_STEP};
  for (uint16_t expected_id : expected_ids) {
    ASSERT_LE(pos + sizeof(LogHeader), bytes.size());
    LogHeader header;
    std::memcpy(&header, bytes.data() + pos, sizeof(header));
    // copy out of the packed struct before comparing
    const uint16_t id = header.id;
    const uint8_t node_id = header.node_id;
    const size_t dlc = header.dlc;
    EXPECT_EQ(id, expected_id);
    EXPECT_EQ(node_id, NODE_ID_REPAIR_TOOL);
    ASSERT_EQ(dlc, 4 * sizeof(float));

    const size_t body = sizeof(header) + dlc;
    ASSERT_LE(pos + body + sizeof(uint16_t), bytes.size());
    uint16_t stored_crc = 0;
    std::memcpy(&stored_crc, bytes.data() + pos + body, sizeof(stored_crc));
    EXPECT_EQ(stored_crc, crc16_ccitt(bytes.data() + pos, body));

    if (expected_id == MSG_ID_REPAIR_SUMMARY) {
      float payload[4];
      std::memcpy(payload, bytes.data() + pos + sizeof(header), dlc);
      EXPECT_EQ(payload[0], 2.0f);
      EXPECT_EQ(payload[1], 2.0f);
      EXPECT_EQ(payload[2], 2.0f);
    }
    pos += body + sizeof(uint16_t);
  }
  EXPECT_EQ(pos, bytes.size());

  fs::remove_all(dir);
}

TEST(Logger, FailureRecordOnlyForIterationLimit) {
  const fs::path dir = fs::temp_directory_path() / "nearpd_logger_fail_test";
  fs::remove_all(dir);

  BatchOutcome capped;
  capped.name = "capped";
  capped.error = "max iteration reached";
  capped.iteration_limit = true;
  capped.failed_iterations = 100;
  capped.failed_min_eigenvalue = -3.0;

  BatchOutcome rejected;
  rejected.name = "rejected";
  rejected.error = "not square";

  {
    Logger logger((dir / "fail.bin").string());
    log_outcome_out(logger, capped, 4);
    log_outcome_out(logger, rejected, 4);
    EXPECT_EQ(logger.records_written(), 1u);
  }

  fs::remove_all(dir);
}
