#include "common/logger.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace {
  std::string ReadAll(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }
}

TEST(LoggerTest, EntriesCarryCallerLocationAndLevel) {
  const std::string path = testing::TempDir() + "mw_logger_test.log";
  std::remove(path.c_str());
  Logger::Initialize(path, LogLevel::INFO);
  Logger::Debug("dropped below threshold");
  const int line = __LINE__ + 1;
  Logger::Info("wallet resolved");
  Logger::Critical("key store unavailable");
  Logger::Shutdown();

  std::string contents = ReadAll(path);
  EXPECT_EQ(contents.find("dropped below threshold"), std::string::npos);
  EXPECT_NE(contents.find("[INFO]"), std::string::npos);
  EXPECT_NE(contents.find("logger_test.cpp:" + std::to_string(line) + " - wallet resolved"), std::string::npos);
  EXPECT_NE(contents.find("[CRITICAL]"), std::string::npos);
  EXPECT_EQ(contents.find("logger.hpp"), std::string::npos);
  std::remove(path.c_str());
}

TEST(LoggerTest, CallsBeforeInitializeAreDropped) {
  Logger::Shutdown();
  EXPECT_FALSE(Logger::IsEnabled(LogLevel::CRITICAL));
  Logger::Error("nobody is listening");
}

TEST(LoggerTest, ParseLevel) {
  EXPECT_EQ(Logger::ParseLevel("DEBUG"), LogLevel::DEBUG);
  EXPECT_EQ(Logger::ParseLevel("warn"), LogLevel::WARNING);
  EXPECT_EQ(Logger::ParseLevel("Critical"), LogLevel::CRITICAL);
  EXPECT_EQ(Logger::ParseLevel("verbose", LogLevel::ERROR), LogLevel::ERROR);
}
