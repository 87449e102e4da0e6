#include "companion/logging-config.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "companion/log.hpp"

namespace companion {

namespace {

constexpr std::array<std::pair<std::string_view, log::level::level_enum>, 7> kLevels{{
    {"trace", log::level::trace},
    {"debug", log::level::debug},
    {"info", log::level::info},
    {"warn", log::level::warn},
    {"error", log::level::err},
    {"critical", log::level::critical},
    {"off", log::level::off},
}};

}  // namespace

LoggingConfig& LoggingConfig::withLevel(std::string_view lvl) {
  this->level = lvl;
  return *this;
}

LoggingConfig& LoggingConfig::withFilePath(std::string_view path) {
  this->filePath = path;
  return *this;
}

void LoggingConfig::validate() const { ParseLogLevel(level); }

log::level::level_enum ParseLogLevel(std::string_view levelName) {
  for (const auto& [name, lvl] : kLevels) {
    if (name == levelName) {
      return lvl;
    }
  }
  throw std::invalid_argument(fmt::format("unknown log level '{}'", levelName));
}

void SetupLogging(const LoggingConfig& config) {
  const auto lvl = ParseLogLevel(config.level);

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!config.filePath.empty()) {
    // Throws spdlog::spdlog_ex if the file cannot be opened.
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.filePath, false));
  }

  auto logger = std::make_shared<spdlog::logger>("companion", sinks.begin(), sinks.end());
  logger->set_pattern("[%Y-%m-%dT%H:%M:%S.%e] [%^%l%$] [%t] %v");
  logger->set_level(lvl);
  logger->flush_on(log::level::warn);
  spdlog::set_default_logger(std::move(logger));
  log::set_level(lvl);
}

}  // namespace companion
