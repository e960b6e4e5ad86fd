/**
 * @file chunker_test.cpp
 * @brief Chunk-size bounds and sequential chunked reads
 */

#include "chunker.hpp"
#include "protocol.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

using namespace chunkcast;
using namespace chunkcast::test;

TEST(RandomChunkSizerTest, StaysWithinClosedInterval) {
    RandomChunkSizer sizer(1000, 2000);
    bool saw_low_half = false, saw_high_half = false;
    for (int i = 0; i < 5000; ++i) {
        std::size_t n = sizer.next();
        ASSERT_GE(n, 1000u);
        ASSERT_LE(n, 2000u);
        if (n < 1500)
            saw_low_half = true;
        else
            saw_high_half = true;
    }
    EXPECT_TRUE(saw_low_half);
    EXPECT_TRUE(saw_high_half);
}

TEST(RandomChunkSizerTest, DegenerateIntervalIsConstant) {
    RandomChunkSizer sizer(1400, 1400);
    for (int i = 0; i < 100; ++i)
        EXPECT_EQ(sizer.next(), 1400u);
}

TEST(RandomChunkSizerTest, RejectsInvalidBounds) {
    EXPECT_THROW(RandomChunkSizer(0, 10), std::invalid_argument);
    EXPECT_THROW(RandomChunkSizer(2000, 1000), std::invalid_argument);
    EXPECT_THROW(RandomChunkSizer(1000, kMaxDatagram + 1), std::invalid_argument);
}

TEST(ChunkReaderTest, ConsumesStreamWithShortFinalChunk) {
    auto data = random_bytes(4500, 7);
    std::istringstream in(std::string(data.begin(), data.end()));
    FixedChunkSizer sizer({1000, 2000});
    ChunkReader reader(in, sizer);

    std::vector<std::size_t> sizes;
    std::vector<uint8_t> joined, chunk;
    while (reader.next(chunk)) {
        sizes.push_back(chunk.size());
        joined.insert(joined.end(), chunk.begin(), chunk.end());
    }
    EXPECT_FALSE(reader.failed());
    EXPECT_EQ(sizes, (std::vector<std::size_t>{1000, 2000, 1000, 500}));
    EXPECT_EQ(joined, data);
    EXPECT_EQ(reader.bytes_read(), 4500u);
}

TEST(ChunkReaderTest, ExactMultipleHasNoEmptyTrailingChunk) {
    auto data = random_bytes(3000, 11);
    std::istringstream in(std::string(data.begin(), data.end()));
    FixedChunkSizer sizer({1500});
    ChunkReader reader(in, sizer);

    std::vector<uint8_t> chunk;
    int count = 0;
    while (reader.next(chunk)) {
        EXPECT_EQ(chunk.size(), 1500u);
        count++;
    }
    EXPECT_EQ(count, 2);
    EXPECT_TRUE(chunk.empty());
}

TEST(ChunkReaderTest, EmptyStreamYieldsNothing) {
    std::istringstream in("");
    FixedChunkSizer sizer({1000});
    ChunkReader reader(in, sizer);
    std::vector<uint8_t> chunk;
    EXPECT_FALSE(reader.next(chunk));
    EXPECT_FALSE(reader.failed());
    EXPECT_EQ(reader.bytes_read(), 0u);
}

TEST(ChunkReaderTest, BrokenStreamReportsFailure) {
    std::istringstream in("some bytes");
    in.setstate(std::ios::badbit);
    FixedChunkSizer sizer({4});
    ChunkReader reader(in, sizer);
    std::vector<uint8_t> chunk;
    EXPECT_FALSE(reader.next(chunk));
    EXPECT_TRUE(reader.failed());
    EXPECT_TRUE(chunk.empty());
}
