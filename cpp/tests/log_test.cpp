#include <gtest/gtest.h>

#include "medley/core/log.hpp"

using namespace medley::core;

TEST(Log, LoggerIsNamedAndShared) {
    auto lg = logger();
    ASSERT_NE(lg, nullptr);
    EXPECT_EQ(lg->name(), kLoggerName);
    EXPECT_EQ(logger().get(), lg.get());
    EXPECT_EQ(spdlog::get(kLoggerName).get(), lg.get());
}

TEST(Log, InitSetsLevel) {
    log_init("debug");
    EXPECT_EQ(logger()->level(), spdlog::level::debug);
    log_init("error");
    EXPECT_EQ(logger()->level(), spdlog::level::err);
    log_init("off");
    EXPECT_EQ(logger()->level(), spdlog::level::off);
    log_init("info");
}

TEST(Log, UnknownLevelFallsBackToInfo) {
    log_init("trace");
    log_init("chatty");
    EXPECT_EQ(logger()->level(), spdlog::level::info);
}
