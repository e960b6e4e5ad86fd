/**
 * @file protocol_test.cpp
 * @brief Sentinel classification, request decoding and output naming
 */

#include "protocol.hpp"
#include <gtest/gtest.h>

#include <string>

using namespace chunkcast;

namespace {
ControlReply classify(const std::string& s) {
    return classify_control(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}
bool terminator(const std::string& s) {
    return is_terminator(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}
} // namespace

TEST(ProtocolTest, OnlyExactOkIsFound) {
    EXPECT_EQ(classify("OK"), ControlReply::Found);
    EXPECT_EQ(classify("ERROR"), ControlReply::NotFound);
    EXPECT_EQ(classify("OK\n"), ControlReply::NotFound);
    EXPECT_EQ(classify("ok"), ControlReply::NotFound);
    EXPECT_EQ(classify("EOF"), ControlReply::NotFound);
    EXPECT_EQ(classify(""), ControlReply::NotFound);
}

TEST(ProtocolTest, TerminatorRequiresExactBytes) {
    EXPECT_TRUE(terminator("EOF"));
    EXPECT_FALSE(terminator("EOF "));
    EXPECT_FALSE(terminator("EO"));
    EXPECT_FALSE(terminator(std::string("EOF\0", 4)));
    EXPECT_FALSE(terminator(""));
}

TEST(ProtocolTest, RequestIsTrimmedUtf8) {
    auto req = encode_request("  clip.mp4 \n");
    EXPECT_EQ(std::string(req.begin(), req.end()), "clip.mp4");

    std::string wire = "\t\xc3\xa9t\xc3\xa9.mp4  ";
    EXPECT_EQ(decode_request(reinterpret_cast<const uint8_t*>(wire.data()), wire.size()),
              "\xc3\xa9t\xc3\xa9.mp4");
}

TEST(ProtocolTest, SentinelBytesMatchWireLiterals) {
    auto ok = sentinel_bytes(kReplyFound);
    auto err = sentinel_bytes(kReplyNotFound);
    auto eof = sentinel_bytes(kTerminator);
    EXPECT_EQ(std::string(ok.begin(), ok.end()), "OK");
    EXPECT_EQ(std::string(err.begin(), err.end()), "ERROR");
    EXPECT_EQ(std::string(eof.begin(), eof.end()), "EOF");
}

TEST(ProtocolTest, OutputNameUsesPrefixAndBaseName) {
    EXPECT_EQ(output_name_for("streaming_", "18.mp4"), "streaming_18.mp4");
    EXPECT_EQ(output_name_for("streaming_", "videos/18.mp4"), "streaming_18.mp4");
    EXPECT_EQ(output_name_for("", "a\\b.bin"), "b.bin");
}
