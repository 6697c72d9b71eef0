#include <gtest/gtest.h>
#include "utils/logging.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

TEST(LogLevel, ToStringCodes) {
  EXPECT_STREQ(to_string(LogLevel::Verbose),  "VRB");
  EXPECT_STREQ(to_string(LogLevel::Debug),    "DBG");
  EXPECT_STREQ(to_string(LogLevel::Info),     "INF");
  EXPECT_STREQ(to_string(LogLevel::Warning),  "WRN");
  EXPECT_STREQ(to_string(LogLevel::Error),    "ERR");
  EXPECT_STREQ(to_string(LogLevel::Critical), "CRT");
  EXPECT_STREQ(to_string(LogLevel::Fatal),    "FTL");
}

TEST(LogLevel, ParseCodesAndNames) {
  EXPECT_EQ(parse_log_level("VRB"), LogLevel::Verbose);
  EXPECT_EQ(parse_log_level("dbg"), LogLevel::Debug);
  EXPECT_EQ(parse_log_level(" INF "), LogLevel::Info);
  EXPECT_EQ(parse_log_level("Warning"), LogLevel::Warning);
  EXPECT_EQ(parse_log_level("ERROR"), LogLevel::Error);
  EXPECT_EQ(parse_log_level("crt"), LogLevel::Critical);
  EXPECT_EQ(parse_log_level("fatal"), LogLevel::Fatal);
}

TEST(LogLevel, ParseRoundTripsEveryCode) {
  for (LogLevel l : {LogLevel::Verbose, LogLevel::Debug, LogLevel::Info, LogLevel::Warning,
                     LogLevel::Error, LogLevel::Critical, LogLevel::Fatal}) {
    EXPECT_EQ(parse_log_level(to_string(l)), l);
  }
}

TEST(LogLevel, ParseRejectsUnknown) {
  EXPECT_THROW(parse_log_level(""), std::invalid_argument);
  EXPECT_THROW(parse_log_level("TRACE"), std::invalid_argument);
  EXPECT_THROW(parse_log_level("IN"), std::invalid_argument);
}

struct LogThresholdFixture : ::testing::Test {
  LogLevel saved = LogLevel::Info;
  std::streambuf* saved_out = nullptr;
  std::streambuf* saved_err = nullptr;
  std::ostringstream out;
  std::ostringstream err;

  void SetUp() override {
    saved = log_level();
    saved_out = std::cout.rdbuf(out.rdbuf());
    saved_err = std::cerr.rdbuf(err.rdbuf());
  }

  void TearDown() override {
    std::cout.rdbuf(saved_out);
    std::cerr.rdbuf(saved_err);
    set_log_level(saved);
  }
};

TEST_F(LogThresholdFixture, GatesBelowThreshold) {
  set_log_level(LogLevel::Warning);
  EXPECT_FALSE(log_enabled(LogLevel::Info));
  EXPECT_TRUE(log_enabled(LogLevel::Warning));
  EXPECT_TRUE(log_enabled(LogLevel::Fatal));

  log_stream(LogLevel::Debug) << "dropped\n";
  log_stream(LogLevel::Info) << "dropped\n";
  log_stream(LogLevel::Error) << "kept\n";
  EXPECT_EQ(out.str(), "");
  EXPECT_EQ(err.str(), "kept\n");
}

TEST_F(LogThresholdFixture, RoutesBySeverity) {
  set_log_level(LogLevel::Verbose);
  log_stream(LogLevel::Verbose) << "a\n";
  log_stream(LogLevel::Info) << "b\n";
  log_stream(LogLevel::Warning) << "c\n";
  EXPECT_EQ(out.str(), "a\nb\n");
  EXPECT_EQ(err.str(), "c\n");
}
