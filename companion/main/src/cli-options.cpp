#include "companion/cli-options.hpp"

#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>

#include "companion/device-target.hpp"
#include "companion/ports-config.hpp"
#include "companion/simulator-target.hpp"
#include "companion/target-config.hpp"
#include "companion/video-source-config.hpp"

namespace companion {

namespace {

template <class Int>
Int ParseInteger(std::string_view option, std::string_view value, Int minValue, Int maxValue) {
  int64_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc{} || ptr != value.data() + value.size() || parsed < static_cast<int64_t>(minValue) ||
      parsed > static_cast<int64_t>(maxValue)) {
    throw std::invalid_argument(
        fmt::format("invalid value '{}' for {}, expected an integer in [{}, {}]", value, option, minValue, maxValue));
  }
  return static_cast<Int>(parsed);
}

// Splits 'HOST:PORT' at its last colon.
std::pair<std::string, std::string> ParseEndpoint(std::string_view option, std::string_view value) {
  const auto colonPos = value.rfind(':');
  if (colonPos == std::string_view::npos || colonPos == 0 || colonPos + 1 == value.size()) {
    throw std::invalid_argument(fmt::format("invalid value '{}' for {}, expected HOST:PORT", value, option));
  }
  const std::string_view port = value.substr(colonPos + 1);
  (void)ParseInteger<uint16_t>(option, port, 1, std::numeric_limits<uint16_t>::max());
  return {std::string(value.substr(0, colonPos)), std::string(port)};
}

}  // namespace

CliOptions CliOptions::Parse(int argc, const char* const* argv) {
  CliOptions options;
  std::optional<uint32_t> videoWidth;
  std::optional<uint32_t> videoHeight;
  std::optional<uint32_t> videoFps;

  for (int argPos = 1; argPos < argc; ++argPos) {
    const std::string_view arg(argv[argPos]);
    if (arg == "--help" || arg == "-h") {
      options.help = true;
      return options;
    }
    if (arg == "--terminate-offline") {
      options.companion.withTerminateWhenOffline();
      continue;
    }
    if (argPos + 1 >= argc) {
      throw std::invalid_argument(fmt::format("missing value for option {}", arg));
    }
    const std::string_view value(argv[++argPos]);
    if (arg == "--udid") {
      options.udid = value;
    } else if (arg == "--name") {
      options.name = value;
    } else if (arg == "--device-afc") {
      std::tie(options.afcHost, options.afcPort) = ParseEndpoint(arg, value);
    } else if (arg == "--simulator-root") {
      options.simulatorRoot = value;
    } else if (arg == "--video") {
      auto [host, port] = ParseEndpoint(arg, value);
      options.video.emplace().withHost(std::move(host)).withPort(std::move(port));
    } else if (arg == "--video-width") {
      videoWidth = ParseInteger<uint32_t>(arg, value, 1, 1U << 16);
    } else if (arg == "--video-height") {
      videoHeight = ParseInteger<uint32_t>(arg, value, 1, 1U << 16);
    } else if (arg == "--video-fps") {
      videoFps = ParseInteger<uint32_t>(arg, value, 1, 240);
    } else if (arg == "--port") {
      options.companion.withPort(ParseInteger<uint16_t>(arg, value, 0, std::numeric_limits<uint16_t>::max()));
    } else if (arg == "--temporary-directory") {
      options.temporaryDirectory = value;
    } else if (arg == "--log-file-path") {
      options.logging.withFilePath(value);
    } else if (arg == "--log-level") {
      options.logging.withLevel(value);
    } else {
      throw std::invalid_argument(fmt::format("unknown option {}", arg));
    }
  }

  if (options.udid.empty()) {
    throw std::invalid_argument("--udid is required");
  }
  if (options.afcPort.empty() == options.simulatorRoot.empty()) {
    throw std::invalid_argument("exactly one of --device-afc and --simulator-root is required");
  }
  if ((videoWidth || videoHeight || videoFps) && !options.video) {
    throw std::invalid_argument("--video-width, --video-height and --video-fps require --video");
  }
  if (options.video) {
    if (videoWidth || videoHeight) {
      options.video->withDimensions(videoWidth.value_or(0), videoHeight.value_or(0));
    }
    if (videoFps) {
      options.video->withFramesPerSecond(*videoFps);
    }
  }
  if (options.name.empty()) {
    options.name = options.udid;
  }
  options.logging.validate();
  return options;
}

std::shared_ptr<Target> CliOptions::createTarget() const {
  if (!simulatorRoot.empty()) {
    SimulatorTargetConfig config;
    config.withUdid(udid).withName(name).withRoot(simulatorRoot);
    if (video) {
      config.withVideo(*video);
    }
    return std::make_shared<SimulatorTarget>(std::move(config));
  }
  DeviceTargetConfig config;
  config.withUdid(udid).withName(name).withAfcEndpoint(afcHost, afcPort);
  if (video) {
    config.withVideo(*video);
  }
  return std::make_shared<DeviceTarget>(std::move(config));
}

std::string CliUsage(std::string_view programName) {
  return fmt::format(
      "Usage: {} --udid UDID (--device-afc HOST:PORT | --simulator-root PATH) [options]\n"
      "Options:\n"
      "  --udid UDID                  Identifier of the target\n"
      "  --name NAME                  Name of the target (default: its udid)\n"
      "  --device-afc HOST:PORT       AFC relay of a physical device\n"
      "  --simulator-root PATH        Data container of a simulator\n"
      "  --video HOST:PORT            Video relay of the target screen\n"
      "  --video-width N              Width of the video frames\n"
      "  --video-height N             Height of the video frames\n"
      "  --video-fps N                Frames per second of the video relay (default: 30)\n"
      "  --port N                     Control port (default: {}, 0 for an ephemeral port)\n"
      "  --temporary-directory PATH   Parent of the scratch directory (default: system temporary directory)\n"
      "  --log-file-path PATH         Also append logs to this file\n"
      "  --log-level LEVEL            trace, debug, info, warn, error, critical or off (default: info)\n"
      "  --terminate-offline          Stop once the target goes offline\n"
      "  --help                       Show this help\n",
      programName, kDefaultControlPort);
}

}  // namespace companion
