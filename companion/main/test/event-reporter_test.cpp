#include "companion/event-reporter.hpp"

#include <gtest/gtest.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>

#include <chrono>
#include <map>
#include <memory>
#include <sstream>
#include <string>

#include "companion/error.hpp"
#include "companion/log.hpp"

namespace companion {

using namespace std::chrono_literals;

TEST(EventReporterTest, EventNames) {
  EXPECT_EQ(EventNameStr(EventName::Launched), "launched");
  EXPECT_EQ(EventNameStr(EventName::ClientDisconnected), "client_disconnected");
  EXPECT_EQ(EventNameStr(EventName::TargetStateChanged), "target_state_changed");
}

TEST(EventReporterTest, MinimalJson) {
  EventSubject subject{EventName::Started, {}, {}, {}};
  EXPECT_EQ(subject.json_str(), R"({"event":"started"})");
}

TEST(EventReporterTest, MetadataEscapedAndAppendedInKeyOrder) {
  EventSubject subject{EventName::Stopped, {}, {}, {}};
  EXPECT_EQ(subject.json_str({{"udid", "A1"}, {"name", "my \"phone\"\n"}}),
            R"({"event":"stopped","name":"my \"phone\"\n","udid":"A1"})");
}

TEST(EventReporterTest, FullJson) {
  EventSubject subject{EventName::CommandFailed, "pull", std::chrono::milliseconds{1500},
                       Error(ErrorKind::DeviceError, "no \"such\" file", 8)};
  EXPECT_EQ(subject.json_str({{"udid", "A1B2"}}),
            R"({"event":"command_failed","subject":"pull","duration_ms":1500,)"
            R"("error":"DeviceError (8): no \"such\" file","udid":"A1B2"})");
}

TEST(EventReporterTest, LogReporterWritesJsonLinesWithMetadata) {
  std::ostringstream out;
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto logger = std::make_shared<spdlog::logger>("event-reporter-test", sink);
  logger->set_pattern("%l %v");
  logger->set_level(log::level::info);
  auto previous = spdlog::default_logger();
  spdlog::set_default_logger(logger);

  LogEventReporter reporter;
  reporter.addMetadata("udid", "A1B2");
  reporter.report(EventSubject{EventName::ClientConnected, "127.0.0.1", {}, {}});
  reporter.addMetadata("udid", "C3D4");
  reporter.report(EventSubject{EventName::CommandFailed, "remove", 2ms, Error(ErrorKind::InvalidState, "offline")});

  spdlog::set_default_logger(previous);

  const std::string lines = out.str();
  EXPECT_NE(lines.find(R"(info Event {"event":"client_connected","subject":"127.0.0.1","udid":"A1B2"})"),
            std::string::npos);
  EXPECT_NE(lines.find(R"(warning Event {"event":"command_failed","subject":"remove","duration_ms":2,)"),
            std::string::npos);
  EXPECT_NE(lines.find(R"("udid":"C3D4"})"), std::string::npos);
}

}  // namespace companion
