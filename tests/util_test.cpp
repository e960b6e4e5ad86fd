/**
 * @file util_test.cpp
 * @brief Unit tests for command-line value parsing helpers
 */

#include "logging.hpp"
#include "util.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>

using namespace chunkcast;

TEST(ParseHostPortTest, AcceptsIpv4AndHostnames) {
    std::string host;
    uint16_t port = 0;
    ASSERT_TRUE(parse_host_port("0.0.0.0:9999", host, port));
    EXPECT_EQ(host, "0.0.0.0");
    EXPECT_EQ(port, 9999);

    ASSERT_TRUE(parse_host_port("localhost:1", host, port));
    EXPECT_EQ(host, "localhost");
    EXPECT_EQ(port, 1);
}

TEST(ParseHostPortTest, StripsBracketsFromIpv6) {
    std::string host;
    uint16_t port = 0;
    ASSERT_TRUE(parse_host_port("[::1]:8080", host, port));
    EXPECT_EQ(host, "::1");
    EXPECT_EQ(port, 8080);
}

TEST(ParseHostPortTest, RejectsMalformedInput) {
    std::string host = "unchanged";
    uint16_t port = 7;
    EXPECT_FALSE(parse_host_port("no-port", host, port));
    EXPECT_FALSE(parse_host_port(":9999", host, port));
    EXPECT_FALSE(parse_host_port("host:", host, port));
    EXPECT_FALSE(parse_host_port("host:65536", host, port));
    EXPECT_FALSE(parse_host_port("host:-1", host, port));
    EXPECT_FALSE(parse_host_port("host:12ab", host, port));
    EXPECT_EQ(host, "unchanged");
    EXPECT_EQ(port, 7);
}

TEST(ParseUintTest, WholeStringOnly) {
    uint64_t v = 0;
    EXPECT_TRUE(parse_uint("0", v));
    EXPECT_EQ(v, 0u);
    EXPECT_TRUE(parse_uint("18446744073709551615", v));
    EXPECT_EQ(v, 18446744073709551615ull);
    EXPECT_FALSE(parse_uint("18446744073709551616", v));
    EXPECT_FALSE(parse_uint("", v));
    EXPECT_FALSE(parse_uint("+5", v));
    EXPECT_FALSE(parse_uint("5 ", v));
}

TEST(TrimTest, StripsSurroundingWhitespaceOnly) {
    EXPECT_EQ(trim_copy("  18.mp4\r\n"), "18.mp4");
    EXPECT_EQ(trim_copy("my file.mp4"), "my file.mp4");
    EXPECT_EQ(trim_copy(" \t "), "");
    EXPECT_EQ(trim_copy(""), "");
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    LogLevel lvl = LogLevel::INFO;
    EXPECT_TRUE(parse_log_level("DEBUG", lvl));
    EXPECT_EQ(lvl, LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("warning", lvl));
    EXPECT_EQ(lvl, LogLevel::WARN);
    EXPECT_FALSE(parse_log_level("verbose", lvl));
    EXPECT_EQ(lvl, LogLevel::WARN);
}

TEST(LoggerTest, FiltersBelowLevelAndWritesToRedirectedOutput) {
    FILE* tmp = std::tmpfile();
    ASSERT_NE(tmp, nullptr);
    auto& log = Logger::instance();
    LogLevel saved = log.level();
    log.set_output(tmp);
    log.set_level(LogLevel::WARN);

    log.log(LogLevel::INFO, "hidden %d", 1);
    log.log(LogLevel::ERROR, "shown %s", "bind failed");

    log.set_output(nullptr);
    log.set_level(saved);

    std::rewind(tmp);
    char buf[512] = {};
    size_t n = std::fread(buf, 1, sizeof(buf) - 1, tmp);
    std::fclose(tmp);
    std::string text(buf, n);
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] shown bind failed"), std::string::npos);
}

TEST(LoggerTest, LevelChangesWhileOtherThreadsLog) {
    FILE* tmp = std::tmpfile();
    ASSERT_NE(tmp, nullptr);
    auto& log = Logger::instance();
    LogLevel saved = log.level();
    log.set_output(tmp);

    std::atomic<bool> stop{false};
    std::thread toggler([&]() {
        bool quiet = false;
        while (!stop.load()) {
            log.set_level(quiet ? LogLevel::ERROR : LogLevel::TRACE);
            quiet = !quiet;
        }
    });
    const int kLines = 500;
    for (int i = 0; i < kLines; i++) {
        log.log(LogLevel::ERROR, "always %d", i);
        log.log(LogLevel::DEBUG, "sometimes %d", i);
    }
    stop.store(true);
    toggler.join();

    log.set_level(LogLevel::ERROR);
    log.log(LogLevel::WARN, "after-quiet");
    EXPECT_EQ(log.level(), LogLevel::ERROR);

    log.set_output(nullptr);
    log.set_level(saved);

    std::rewind(tmp);
    std::string text;
    char buf[4096];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), tmp)) > 0)
        text.append(buf, n);
    std::fclose(tmp);

    int always = 0;
    for (size_t pos = 0; (pos = text.find("[ERROR] always ", pos)) != std::string::npos; pos++)
        always++;
    EXPECT_EQ(always, kLines);
    EXPECT_EQ(text.find("after-quiet"), std::string::npos);
}
