#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "companion/companion-config.hpp"
#include "companion/logging-config.hpp"
#include "companion/target.hpp"
#include "companion/video-source-config.hpp"

namespace companion {

// Command line of the companion executable.
struct CliOptions {
  std::string udid;

  // Target name reported by Describe. Defaults to the udid.
  std::string name;

  // Device relay, from --device-afc HOST:PORT.
  std::string afcHost;
  std::string afcPort;

  std::string simulatorRoot;

  // Set by --video HOST:PORT, refined by --video-width, --video-height and --video-fps.
  std::optional<VideoSourceConfig> video;

  CompanionConfig companion;

  // Parent of the scratch directory of the server. System temporary directory if empty.
  std::string temporaryDirectory;

  LoggingConfig logging;

  bool help{false};

  // Throws std::invalid_argument on unknown options, missing or malformed values and inconsistent combinations.
  // Nothing is validated once --help is seen.
  static CliOptions Parse(int argc, const char* const* argv);

  // Target designated by the options. Throws std::invalid_argument if its configuration is not usable.
  [[nodiscard]] std::shared_ptr<Target> createTarget() const;
};

[[nodiscard]] std::string CliUsage(std::string_view programName);

}  // namespace companion
