#include "logwire/streaming-log-encoder.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "logwire/compression-ratio.hpp"
#include "logwire/log-decoder.hpp"
#include "logwire/log-encoder.hpp"
#include "logwire/log-entry.hpp"

namespace logwire {

namespace {

LogEntry MakeEntry(int64_t idx) {
  return LogEntry{1000 + (idx * 10), "PLC_" + std::to_string(idx % 2), "Counter", static_cast<int32_t>(idx)};
}

}  // namespace

TEST(StreamingLogEncoderTest, ZeroBatchSizeThrows) { EXPECT_THROW(StreamingLogEncoder(0), std::invalid_argument); }

TEST(StreamingLogEncoderTest, DefaultBatchSize) { EXPECT_EQ(StreamingLogEncoder().batchSize(), 10000U); }

TEST(StreamingLogEncoderTest, EmitsFullBatchesAndFlushesRemainder) {
  StreamingLogEncoder encoder(3);
  std::vector<std::vector<std::byte>> batches;
  std::vector<LogEntry> expected;
  for (int64_t idx = 0; idx < 7; ++idx) {
    expected.push_back(MakeEntry(idx));
    auto batch = encoder.addEntry(MakeEntry(idx));
    if (idx == 2 || idx == 5) {
      ASSERT_TRUE(batch.has_value()) << idx;
      batches.push_back(std::move(*batch));
    } else {
      EXPECT_FALSE(batch.has_value()) << idx;
    }
  }
  EXPECT_EQ(encoder.stats().bufferedEntries, 1U);
  batches.push_back(encoder.flush());
  EXPECT_EQ(encoder.stats().bufferedEntries, 0U);

  std::vector<LogEntry> decoded;
  for (const auto& batch : batches) {
    // Each batch is self-contained.
    auto entries = DecodeLogEntries(batch);
    decoded.insert(decoded.end(), entries.begin(), entries.end());
  }
  EXPECT_EQ(decoded, expected);
  ASSERT_EQ(batches.size(), 3U);
  EXPECT_EQ(DecodeLog(batches[2]).strings, (std::vector<std::string>{"PLC_0", "Counter"}));
}

TEST(StreamingLogEncoderTest, StatsTrackPendingBatch) {
  StreamingLogEncoder encoder(100);
  EXPECT_EQ(encoder.stats().uniqueStrings, 0U);
  (void)encoder.addEntry(LogEntry{0, "D1", "S1", std::string("ON")});
  (void)encoder.addEntry(LogEntry{1, "D1", "S2", std::string("ON")});
  (void)encoder.addEntry(LogEntry{2, "D2", "S1", true});
  const auto stats = encoder.stats();
  EXPECT_EQ(stats.uniqueStrings, 5U);
  EXPECT_EQ(stats.bufferedEntries, 3U);

  EXPECT_FALSE(encoder.flush().empty());
  EXPECT_EQ(encoder.stats().uniqueStrings, 0U);
}

TEST(StreamingLogEncoderTest, BatchMatchesOneShotEncoding) {
  std::vector<LogEntry> entries;
  entries.push_back(LogEntry{0, "D1", "S1", std::string("ON")});
  entries.push_back(LogEntry{5, "D2", "S1", int32_t{-300}});
  entries.push_back(LogEntry{7, "D1", "S2", std::string("D2")});
  entries.push_back(LogEntry{7, "D1", "S1", std::string("OFF")});

  StreamingLogEncoder encoder(100);
  for (const LogEntry& entry : entries) {
    EXPECT_FALSE(encoder.addEntry(entry).has_value());
  }
  EXPECT_EQ(encoder.stats().uniqueStrings, 6U);
  EXPECT_EQ(encoder.flush(), EncodeLogEntries(entries));

  // The table restarts empty for the next batch.
  (void)encoder.addEntry(LogEntry{9, "D3", "S3", true});
  EXPECT_EQ(encoder.stats().uniqueStrings, 2U);
  EXPECT_EQ(encoder.flush(), EncodeLogEntries(std::vector<LogEntry>{LogEntry{9, "D3", "S3", true}}));
}

TEST(StreamingLogEncoderTest, FlushWithoutEntriesGivesEmptyBuffer) {
  StreamingLogEncoder encoder;
  EXPECT_TRUE(encoder.flush().empty());
}

TEST(CompressionRatioTest, Format) {
  EXPECT_EQ(CompressionRatio(8U * 1024U * 1024U, 1024U * 1024U), "87.5% (8.00MB -> 1.00MB)");
  EXPECT_EQ(CompressionRatio(0, 0), "0.0% (0.00MB -> 0.00MB)");
  EXPECT_EQ(CompressionRatio(1024U * 1024U, 2U * 1024U * 1024U), "-100.0% (1.00MB -> 2.00MB)");
}

}  // namespace logwire
