#include <gtest/gtest.h>
#include "event_logger.hpp"
#include <iostream>
#include <sstream>

using namespace namesys;

TEST(EventLoggerTest, Sanitization) {
    EXPECT_EQ(EventLogger::sanitize_log_message("plain text"), "plain text");
    EXPECT_EQ(EventLogger::sanitize_log_message("quote\"and\nnewline"), "quote and newline");
    EXPECT_EQ(EventLogger::sanitize_log_message(std::string("bell\x07", 5)), "bell");
}

TEST(EventLoggerTest, LineFormat) {
    EventLogger::set_min_level(EventLogger::Level::INFO);
    std::stringstream captured;
    auto* old = std::cout.rdbuf(captured.rdbuf());
    EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::RECORD_PUBLISHED,
                     "QmPeer", "seq=\"3\"");
    std::cout.rdbuf(old);

    std::string line = captured.str();
    EXPECT_NE(line.find("[INFO] [PUBLISHED] peer=QmPeer msg=\"seq= 3 \""), std::string::npos);
    EXPECT_NE(line.find(" UTC] "), std::string::npos);
}

TEST(EventLoggerTest, MinLevelFilters) {
    EventLogger::set_min_level(EventLogger::Level::ERROR);
    std::stringstream captured;
    auto* old = std::cout.rdbuf(captured.rdbuf());
    EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::RESOLVE_TIMEOUT, "QmPeer");
    std::cout.rdbuf(old);
    EventLogger::set_min_level(EventLogger::Level::INFO);

    EXPECT_TRUE(captured.str().empty());
}

TEST(EventLoggerTest, ErrorsGoToStderr) {
    EventLogger::set_min_level(EventLogger::Level::INFO);
    std::stringstream out, err;
    auto* old_out = std::cout.rdbuf(out.rdbuf());
    auto* old_err = std::cerr.rdbuf(err.rdbuf());
    EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::TRANSPORT_ERROR, "", "down");
    std::cout.rdbuf(old_out);
    std::cerr.rdbuf(old_err);

    EXPECT_TRUE(out.str().empty());
    EXPECT_NE(err.str().find("[ERROR] [TRANSPORT] peer=internal msg=\"down\""), std::string::npos);
}
