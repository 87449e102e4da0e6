#include "companion/simulator-target.hpp"

#include <spdlog/fmt/fmt.h>

#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <system_error>
#include <utility>

#include "companion/bitmap-stream.hpp"
#include "companion/delay-scheduler.hpp"
#include "companion/error.hpp"
#include "companion/file-commands.hpp"
#include "companion/host-file-commands.hpp"
#include "companion/log.hpp"
#include "companion/socket-frame-source.hpp"
#include "companion/target-config.hpp"
#include "companion/target.hpp"

namespace companion {

SimulatorTarget::SimulatorTarget(SimulatorTargetConfig config)
    : Target(config.udid, config.name), _config(std::move(config)) {
  _config.validate();
  _fileCommands = std::make_shared<HostFileCommands>(_config.root);
}

TargetState SimulatorTarget::state() const {
  std::scoped_lock lock(_mutex);
  return _state;
}

TargetState SimulatorTarget::refreshState() {
  std::error_code ec;
  const bool present = std::filesystem::is_directory(_fileCommands->root(), ec);
  const TargetState state = present ? TargetState::Booted : TargetState::Offline;
  std::scoped_lock lock(_mutex);
  if (state != _state) {
    log::info("Simulator {} is {}", udid(), TargetStateName(state));
    _state = state;
  }
  return _state;
}

std::expected<std::shared_ptr<FileCommands>, Error> SimulatorTarget::fileCommands() {
  if (refreshState() != TargetState::Booted) {
    return std::unexpected(Error(ErrorKind::InvalidState,
                                 fmt::format("data container {} of simulator {} is missing",
                                             _fileCommands->root().string(), udid())));
  }
  return _fileCommands;
}

std::expected<std::shared_ptr<BitmapStream>, Error> SimulatorTarget::createBitmapStream(DelayScheduler& scheduler) {
  if (!_config.video) {
    return std::unexpected(
        Error(ErrorKind::InvalidState, fmt::format("simulator {} has no video relay configured", udid())));
  }
  return BitmapStream::Create(std::make_unique<SocketFrameSource>(*_config.video), scheduler, _config.stream);
}

}  // namespace companion
