#include "logger.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

#include "gtest/gtest.h"

namespace TalonLogger {

class LoggerTest : public ::testing::Test {
 protected:
  void TearDown() override { Logger::Init(); }
};

TEST_F(LoggerTest, ParseLevel) {
  Level level = INFO;
  EXPECT_TRUE(Logger::ParseLevel("debug", level));
  EXPECT_EQ(DEBUG, level);
  EXPECT_TRUE(Logger::ParseLevel("WARNING", level));
  EXPECT_EQ(WARN, level);
  EXPECT_TRUE(Logger::ParseLevel("Warn", level));
  EXPECT_EQ(WARN, level);
  EXPECT_TRUE(Logger::ParseLevel("error", level));
  EXPECT_EQ(ERROR, level);

  EXPECT_FALSE(Logger::ParseLevel("verbose", level));
  EXPECT_FALSE(Logger::ParseLevel("", level));
  EXPECT_EQ(ERROR, level);
}

TEST_F(LoggerTest, FileReceivesLinesAtOrAboveLevel) {
  std::string path = "/tmp/talon_logger_test_" + std::to_string(getpid()) + ".log";
  std::remove(path.c_str());

  Logger::Init(path);
  Logger::SetLevel(WARN);
  EXPECT_EQ(WARN, Logger::GetLevel());

  LOG_INFO("Test", "dropped line");
  LOG_WARN("Test", "kept warning");
  LOG_ERROR("Test", "kept error");

  std::ifstream file(path);
  std::stringstream contents;
  contents << file.rdbuf();
  std::string text = contents.str();

  EXPECT_EQ(std::string::npos, text.find("dropped line"));
  EXPECT_NE(std::string::npos, text.find("[WARN ] [Test] kept warning"));
  EXPECT_NE(std::string::npos, text.find("[ERROR] [Test] kept error"));

  std::remove(path.c_str());
}

TEST_F(LoggerTest, InitResetsFileAndLevel) {
  Logger::SetLevel(ERROR);
  Logger::Init();
  EXPECT_NE(ERROR, Logger::GetLevel());
}

}  // namespace TalonLogger
