#pragma once

#include <string>
#include <string_view>

#include "companion/log.hpp"

namespace companion {

struct LoggingConfig {
  // One of trace, debug, info, warn, error, critical, off.
  std::string level{"info"};

  // If not empty, logs are also appended to this file.
  std::string filePath;

  LoggingConfig& withLevel(std::string_view lvl);

  LoggingConfig& withFilePath(std::string_view path);

  // Throws std::invalid_argument if the level is unknown.
  void validate() const;
};

// Parse a level name. Throws std::invalid_argument for unknown names.
log::level::level_enum ParseLogLevel(std::string_view levelName);

// Install the process-wide default logger (stderr, plus the optional file sink) at the configured level.
void SetupLogging(const LoggingConfig& config);

}  // namespace companion
