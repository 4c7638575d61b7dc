#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include "FileData.hpp"
#include "Statistics.hpp"

namespace {

TEST(FileReaderTest, ReportsTotalSize) {
    std::istringstream source(std::string(3000, 'x'));
    FileReader reader(source);
    EXPECT_EQ(reader.totalSize(), 3000);
}

TEST(FileReaderTest, ReadsChunkAtOffset) {
    std::istringstream source("0123456789");
    FileReader reader(source);
    char buffer[4];
    ASSERT_EQ(reader.getData(3, 4, buffer), 4);
    EXPECT_EQ(std::string(buffer, 4), "3456");
}

TEST(FileReaderTest, ShortReadAtEndThenRereadEarlierChunk) {
    std::istringstream source("0123456789");
    FileReader reader(source);
    char buffer[8];
    EXPECT_EQ(reader.getData(8, 8, buffer), 2);
    EXPECT_EQ(reader.getData(10, 8, buffer), 0);

    // Retransmissions read backwards after hitting end of file.
    ASSERT_EQ(reader.getData(0, 3, buffer), 3);
    EXPECT_EQ(std::string(buffer, 3), "012");
}

TEST(FileWriterTest, WritesChunksInCallOrder) {
    std::ostringstream sink;
    FileWriter writer(sink);
    EXPECT_EQ(writer.processData(1, 3, "abc"), 3);
    EXPECT_EQ(writer.processData(2, 2, "de"), 2);
    EXPECT_TRUE(writer.flush());
    EXPECT_EQ(sink.str(), "abcde");
}

TEST(TeeProcessorTest, ForwardsToEveryProcessor) {
    std::ostringstream first, second;
    FileWriter a(first), b(second);
    TeeProcessor tee({&a, &b});
    EXPECT_EQ(tee.processData(1, 4, "data"), 4);
    EXPECT_TRUE(tee.flush());
    EXPECT_EQ(first.str(), "data");
    EXPECT_EQ(second.str(), "data");
}

TEST(NullStreamTest, SwallowsOutput) {
    NullStream null;
    null << "ignored " << 42 << std::endl;
    EXPECT_TRUE(static_cast<bool>(null));
}

TEST(StatisticsTest, ThroughputInMegabitsPerSecond) {
    EXPECT_DOUBLE_EQ(throughputMbps(1000000, 1.0), 8.0);
    EXPECT_DOUBLE_EQ(throughputMbps(250000, 0.5), 4.0);
    EXPECT_DOUBLE_EQ(throughputMbps(1000, 0.0), 0.0);
}

TEST(StatisticsTest, CountsAndReports) {
    std::ostringstream out;
    TransferStats stats(false, out);
    stats.record_packet(994);
    stats.record_packet(18);
    stats.record_ack();
    stats.record_out_of_order();
    stats.record_discarded();
    EXPECT_EQ(stats.data_packets, 2u);
    EXPECT_EQ(stats.data_bytes, 1012u);

    stats.report();
    EXPECT_NE(out.str().find("Packets received: 2"), std::string::npos);
    EXPECT_NE(out.str().find("Out-of-order: 1"), std::string::npos);
}

}  // namespace
