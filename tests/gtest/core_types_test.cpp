/**
 * @file core_types_test.cpp
 * @brief Error taxonomy, Result, address formatting and logging setup
 */

#include <gtest/gtest.h>
#include <memory>
#include "logging.hpp"
#include "udsonip.hpp"

using namespace udsonip;

TEST(CoreTypesTest, FormatAddressIsFourHexDigits) {
  EXPECT_EQ(format_address(0x00E0), "0x00E0");
  EXPECT_EQ(format_address(0x0E00), "0x0E00");
  EXPECT_EQ(format_address(0xFFFF), "0xFFFF");
}

TEST(CoreTypesTest, ConnectionStateNames) {
  EXPECT_STREQ(to_string(ConnectionState::Disconnected), "Disconnected");
  EXPECT_STREQ(to_string(ConnectionState::Idle), "Idle");
  EXPECT_STREQ(to_string(ConnectionState::Busy), "Busy");
  EXPECT_STREQ(to_string(ConnectionState::Error), "Error");
}

TEST(CoreTypesTest, ErrcNames) {
  EXPECT_STREQ(to_string(Errc::ReentrantAcquisition), "ReentrantAcquisition");
  EXPECT_STREQ(to_string(Errc::BusyTimeout), "BusyTimeout");
  EXPECT_STREQ(to_string(Errc::UnknownPeer), "UnknownPeer");
}

TEST(CoreTypesTest, DescribePlainError) {
  Error e = make_error(Errc::Timeout, "no response from 0x00E0");
  EXPECT_EQ(e.describe(), "Timeout: no response from 0x00E0");
  EXPECT_EQ(make_error(Errc::NotConnected).describe(), "NotConnected");
}

TEST(CoreTypesTest, DescribeNegativeResponseIncludesNrc) {
  Error e = make_error(Errc::NegativeResponse);
  e.rejected_sid = 0x22;
  e.nrc = 0x31;
  const std::string text = e.describe();
  EXPECT_NE(text.find("NegativeResponse"), std::string::npos);
  EXPECT_NE(text.find("0x22"), std::string::npos);
  EXPECT_NE(text.find("0x31"), std::string::npos);
  EXPECT_NE(text.find("requestOutOfRange"), std::string::npos);
}

TEST(CoreTypesTest, ResultSuccessAndFailure) {
  auto ok = Result<int>::success(42);
  EXPECT_TRUE(ok.ok);
  EXPECT_TRUE(static_cast<bool>(ok));
  EXPECT_EQ(ok.value, 42);
  EXPECT_EQ(ok.error.code, Errc::None);

  auto bad = Result<int>::failure(Errc::Malformed, "short");
  EXPECT_FALSE(bad.ok);
  EXPECT_EQ(bad.error.code, Errc::Malformed);
  EXPECT_EQ(bad.error.message, "short");

  auto v = Result<void>::success();
  EXPECT_TRUE(v.ok);
  auto vf = Result<void>::failure(Errc::DuplicateName);
  EXPECT_FALSE(vf.ok);
  EXPECT_EQ(vf.error.code, Errc::DuplicateName);
}

TEST(CoreTypesTest, ResultHoldsMoveOnlyValue) {
  auto r = Result<std::unique_ptr<int>>::success(std::make_unique<int>(7));
  ASSERT_TRUE(r.ok);
  ASSERT_NE(r.value, nullptr);
  EXPECT_EQ(*r.value, 7);

  auto moved = std::move(r);
  ASSERT_NE(moved.value, nullptr);
  EXPECT_EQ(*moved.value, 7);
}

// ============================================================================
// Logging
// ============================================================================

TEST(LoggingTest, ComponentLoggersExist) {
  util::LogManager::Initialize("warn");
  for (const char* name : {"default", "bridge", "registry", "discovery", "transport"}) {
    auto logger = util::LogManager::GetLogger(name);
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), name);
  }
}

TEST(LoggingTest, UnknownComponentFallsBackToDefault) {
  auto logger = util::LogManager::GetLogger("no-such-component");
  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(logger->name(), "default");
}

TEST(LoggingTest, ComponentLevelCanBeChanged) {
  util::LogManager::SetComponentLevel("bridge", "debug");
  EXPECT_EQ(util::LogManager::GetLogger("bridge")->level(), spdlog::level::debug);
  util::LogManager::SetLogLevel("warn");
  EXPECT_EQ(util::LogManager::GetLogger("bridge")->level(), spdlog::level::warn);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
