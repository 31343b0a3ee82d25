#include "../include/logger.hpp"

#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>

#include <memory>
#include <sstream>
#include <string>

#include "../include/history_store.hpp"
#include "../include/windowed_map.hpp"

using namespace revhist;

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    saved_level = Logger::get_instance().get_level();
    saved_logger = spdlog::default_logger();

    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(output, true);
    auto capture = std::make_shared<spdlog::logger>("revhist_capture", sink);
    capture->set_pattern("%v");
    spdlog::set_default_logger(capture);
    Logger::get_instance().set_level(LogLevel::DEBUG);
  }

  void TearDown() override {
    spdlog::set_default_logger(saved_logger);
    Logger::get_instance().set_level(saved_level);
  }

  static std::string located(int line) {
    return "[logger_test.cpp:" + std::to_string(line) + "]";
  }

  std::ostringstream output;
  std::shared_ptr<spdlog::logger> saved_logger;
  LogLevel saved_level = LogLevel::INFO;
};

TEST_F(LoggerTest, FreeFunctionsReportCallerLine) {
  const int line = __LINE__ + 1;
  log_warn("direct call {}", 1);

  EXPECT_NE(output.str().find("direct call 1 " + located(line)),
            std::string::npos)
      << output.str();
}

TEST_F(LoggerTest, ContextLoggerPrefixesAndReportsCallerLine) {
  const ContextLogger ctx("Component");
  const int line = __LINE__ + 1;
  ctx.warn("rejected {} below {}", 3, 5);

  EXPECT_NE(output.str().find("Component: rejected 3 below 5 " + located(line)),
            std::string::npos)
      << output.str();
}

TEST_F(LoggerTest, DisabledLevelsWriteNothing) {
  Logger::get_instance().set_level(LogLevel::WARN);
  const ContextLogger ctx("Component");

  log_debug("hidden {}", 1);
  log_info("hidden too");
  ctx.debug("hidden {}", 2);
  EXPECT_TRUE(output.str().empty()) << output.str();

  Logger::get_instance().set_level(LogLevel::ERROR);
  ctx.warn("hidden {}", 3);
  EXPECT_TRUE(output.str().empty()) << output.str();
}

TEST_F(LoggerTest, ContainersLogFromTheirOwnSource) {
  RevisionWindowedMap<int> map;
  ASSERT_TRUE(map.set(1, 10).ok());
  ASSERT_TRUE(map.truncate_from(1).ok());

  const std::string text = output.str();
  EXPECT_NE(text.find("RevisionWindowedMap: truncated from revision 1"),
            std::string::npos)
      << text;
  EXPECT_NE(text.find("[windowed_map.hpp:"), std::string::npos) << text;
  EXPECT_EQ(text.find("[logger.hpp:"), std::string::npos) << text;
}

TEST_F(LoggerTest, HistoryStoreUsesComponentPrefix) {
  HistoryStore<int> store;
  ASSERT_TRUE(store.set("weight", 1, 70).ok());

  const std::string text = output.str();
  EXPECT_NE(text.find("HistoryStore: created slot 'weight'"), std::string::npos)
      << text;
  EXPECT_NE(text.find("[history_store.hpp:"), std::string::npos) << text;
}
