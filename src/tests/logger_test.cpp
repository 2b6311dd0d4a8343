#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include "common/error.hpp"
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace bv::logging;

class LoggerTest : public ::testing::Test {
protected:
  std::unique_ptr<bv::test::TempDir> dir;
  std::string log_file;

  void SetUp() override {
    dir = std::make_unique<bv::test::TempDir>("logger_test");
    log_file = dir->file("logs/blockvault.log");

    LogConfig config;
    config.file = log_file;
    config.level = boost::log::trivial::trace;
    init_logging(config);
  }

  void TearDown() override {
    boost::log::core::get()->flush();
    boost::log::core::get()->remove_all_sinks();
    enable_logging();
    dir.reset();
  }

  bool log_contains(const std::string& text, int max_retries = 3) {
    for (int retry = 0; retry < max_retries; ++retry) {
      boost::log::core::get()->flush();
      std::ifstream file(log_file, std::ios::in | std::ios::binary);
      if (file.is_open()) {
        const std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (content.find(text) != std::string::npos) {
          return true;
        }
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50 * (retry + 1)));
    }
    return false;
  }
};

TEST_F(LoggerTest, BasicLogging) {
  BOOST_LOG_TRIVIAL(info) << "Test info message";
  BOOST_LOG_TRIVIAL(error) << "Test error message";

  EXPECT_TRUE(log_contains("Test info message"));
  EXPECT_TRUE(log_contains("Test error message"));
  EXPECT_TRUE(log_contains("[error]"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
  set_log_level(boost::log::trivial::warning);

  BOOST_LOG_TRIVIAL(debug) << "Filtered debug message";
  BOOST_LOG_TRIVIAL(warning) << "Visible warning message";

  EXPECT_TRUE(log_contains("Visible warning message"));
  EXPECT_FALSE(log_contains("Filtered debug message", 1));
}

TEST_F(LoggerTest, DisableAndEnable) {
  disable_logging();
  BOOST_LOG_TRIVIAL(error) << "Message while disabled";
  enable_logging();
  BOOST_LOG_TRIVIAL(error) << "Message after enable";

  EXPECT_TRUE(log_contains("Message after enable"));
  EXPECT_FALSE(log_contains("Message while disabled", 1));
}

TEST_F(LoggerTest, MultiThreadedLogging) {
  const int num_threads = 4;
  std::vector<std::thread> threads;
  for (int i = 0; i < num_threads; ++i) {
    threads.emplace_back([i] {
      BOOST_LOG_TRIVIAL(info) << "Thread " << i << " message";
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  for (int i = 0; i < num_threads; ++i) {
    EXPECT_TRUE(log_contains("Thread " + std::to_string(i) + " message"));
  }
}

TEST(ParseSeverityTest, KnownAndUnknownNames) {
  EXPECT_EQ(parse_severity("trace"), boost::log::trivial::trace);
  EXPECT_EQ(parse_severity("warning"), boost::log::trivial::warning);
  EXPECT_EQ(parse_severity("fatal"), boost::log::trivial::fatal);
  EXPECT_THROW(parse_severity("loud"), bv::ConfigError);
}
