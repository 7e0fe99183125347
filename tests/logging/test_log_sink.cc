#include <unistd.h>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>

#include <gtest/gtest.h>

#include "chatws/logging/log_formatter.h"
#include "chatws/logging/log_sink.h"

using namespace chatws::logging;

class LogSinkTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_message_.level = LogLevel::Info;
    test_message_.message = "Test message";
    test_message_.logger_name = "chatws.connection";
  }

  void TearDown() override {
    for (const auto& file : test_files_) {
      std::remove(file.c_str());
      for (int i = 1; i <= 5; ++i) {
        std::remove((file + "." + std::to_string(i)).c_str());
      }
    }
  }

  static bool fileExists(const std::string& path) {
    std::ifstream file(path);
    return file.good();
  }

  LogMessage test_message_;
  std::vector<std::string> test_files_;
};

TEST_F(LogSinkTest, NullSink) {
  NullSink sink;
  sink.log(test_message_);
  sink.flush();

  EXPECT_EQ(sink.type(), SinkType::Null);
  EXPECT_FALSE(sink.supportsRotation());
}

TEST_F(LogSinkTest, StdioSinkStderr) {
  std::stringstream buffer;
  std::streambuf* old = std::cerr.rdbuf(buffer.rdbuf());

  {
    StdioSink sink(StdioSink::Stderr);
    sink.log(test_message_);
    sink.flush();
  }

  std::cerr.rdbuf(old);

  std::string output = buffer.str();
  EXPECT_NE(output.find("Test message"), std::string::npos);
  EXPECT_NE(output.find("[INFO]"), std::string::npos);
  EXPECT_NE(output.find("[chatws.connection]"), std::string::npos);
}

TEST_F(LogSinkTest, ExternalSink) {
  std::vector<std::string> captured_messages;
  LogLevel captured_level = LogLevel::Off;
  std::string captured_logger;

  ExternalSink sink([&](LogLevel level, const std::string& logger,
                        const std::string& msg) {
    captured_level = level;
    captured_logger = logger;
    captured_messages.push_back(msg);
  });

  sink.log(test_message_);

  ASSERT_EQ(captured_messages.size(), 1u);
  EXPECT_EQ(captured_level, LogLevel::Info);
  EXPECT_EQ(captured_logger, "chatws.connection");
  EXPECT_NE(captured_messages[0].find("Test message"), std::string::npos);
  EXPECT_EQ(sink.type(), SinkType::External);
}

TEST_F(LogSinkTest, RotatingFileSinkRotation) {
  std::string test_file =
      "/tmp/chatws_rotate_" + std::to_string(getpid()) + ".log";
  test_files_.push_back(test_file);

  RotatingFileSink::Config config;
  config.base_filename = test_file;
  config.max_file_size = 100;  // Very small for testing
  config.max_files = 2;

  {
    RotatingFileSink sink(config);
    EXPECT_TRUE(sink.isOpen());
    EXPECT_TRUE(sink.supportsRotation());
    for (int i = 0; i < 20; ++i) {
      test_message_.message =
          "This is a longer message to trigger rotation " + std::to_string(i);
      sink.log(test_message_);
    }
    sink.flush();
  }

  EXPECT_TRUE(fileExists(test_file));
  EXPECT_TRUE(fileExists(test_file + ".1"));
  EXPECT_TRUE(fileExists(test_file + ".2"));
  EXPECT_FALSE(fileExists(test_file + ".3"));
}

TEST_F(LogSinkTest, JsonFormatterEscapes) {
  test_message_.message = "quote \" backslash \\ newline \n";
  test_message_.file = "chat_connection.cc";
  test_message_.line = 42;
  test_message_.function = "onMessage";

  JsonFormatter formatter;
  std::string line = formatter.format(test_message_);

  EXPECT_EQ('{', line.front());
  EXPECT_EQ('}', line.back());
  EXPECT_NE(line.find("\"level\":\"INFO\""), std::string::npos);
  EXPECT_NE(line.find("\"logger\":\"chatws.connection\""), std::string::npos);
  EXPECT_NE(line.find("\"line\":42"), std::string::npos);
  EXPECT_NE(line.find("quote \\\" backslash \\\\ newline \\n"),
            std::string::npos);
}

TEST_F(LogSinkTest, DefaultFormatterIncludesLocation) {
  test_message_.file = "connection_registry.cc";
  test_message_.line = 7;
  test_message_.function = "close";

  DefaultFormatter formatter;
  std::string line = formatter.format(test_message_);
  EXPECT_NE(line.find("[connection_registry.cc:7 close()]"), std::string::npos);
  EXPECT_EQ(line.size() - std::string("Test message").size(),
            line.rfind("Test message"));
}

TEST_F(LogSinkTest, SinkFactory) {
  EXPECT_EQ(SinkType::Stdio, SinkFactory::createStdioSink()->type());
  EXPECT_EQ(SinkType::Null, SinkFactory::createNullSink()->type());
  EXPECT_EQ(SinkType::External,
            SinkFactory::createExternalSink(
                [](LogLevel, const std::string&, const std::string&) {})
                ->type());
}
