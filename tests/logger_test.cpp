#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <boost/log/trivial.hpp>
#include "ethstorage/logger/logger.hpp"

using namespace ethstorage::logger;

class LoggerTest : public ::testing::Test {
protected:
  void TearDown() override {
    init_console_logging(severity_level::error);
  }
};

TEST_F(LoggerTest, ParsesSeverityNames) {
  EXPECT_EQ(parse_severity("trace"), severity_level::trace);
  EXPECT_EQ(parse_severity("DEBUG"), severity_level::debug);
  EXPECT_EQ(parse_severity("warning"), severity_level::warning);
  EXPECT_EQ(parse_severity("fatal"), severity_level::fatal);
}

TEST_F(LoggerTest, RejectsUnknownSeverity) {
  EXPECT_THROW(parse_severity("loud"), std::invalid_argument);
}

TEST_F(LoggerTest, SeverityNamesRoundTrip) {
  for (severity_level level : {severity_level::trace, severity_level::info, severity_level::error}) {
    EXPECT_EQ(parse_severity(ethstorage::logger::to_string(level)), level);
  }
}

TEST_F(LoggerTest, ConsoleLoggingCanBeToggled) {
  init_console_logging(severity_level::warning);
  BOOST_LOG_TRIVIAL(warning) << "LoggerTest: visible";
  disable_logging();
  BOOST_LOG_TRIVIAL(error) << "LoggerTest: suppressed";
  enable_logging();
  SUCCEED();
}

TEST_F(LoggerTest, FileSinkWritesFormattedLines) {
  std::filesystem::path dir = std::filesystem::temp_directory_path() / "ethstorage_logger_test";
  std::filesystem::remove_all(dir);
  std::filesystem::path file = dir / "sdk.log";

  init_logging(file.string(), severity_level::info);
  BOOST_LOG_TRIVIAL(debug) << "LoggerTest: filtered out";
  BOOST_LOG_TRIVIAL(info) << "LoggerTest: written";
  init_console_logging(severity_level::error);

  std::ifstream in(file);
  std::stringstream contents;
  contents << in.rdbuf();
  EXPECT_NE(contents.str().find("[info] LoggerTest: written"), std::string::npos);
  EXPECT_EQ(contents.str().find("filtered out"), std::string::npos);
  std::filesystem::remove_all(dir);
}
