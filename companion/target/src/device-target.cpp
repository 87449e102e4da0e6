#include "companion/device-target.hpp"

#include <spdlog/fmt/fmt.h>

#include <expected>
#include <memory>
#include <mutex>
#include <utility>

#include "companion/afc-client.hpp"
#include "companion/afc-connection.hpp"
#include "companion/afc-file-commands.hpp"
#include "companion/bitmap-stream.hpp"
#include "companion/delay-scheduler.hpp"
#include "companion/error.hpp"
#include "companion/file-commands.hpp"
#include "companion/log.hpp"
#include "companion/socket-frame-source.hpp"
#include "companion/target-config.hpp"
#include "companion/target.hpp"
#include "companion/tcp-connector.hpp"

namespace companion {

DeviceTarget::DeviceTarget(DeviceTargetConfig config)
    : Target(config.udid, config.name), _config(std::move(config)) {
  _config.validate();
}

TargetState DeviceTarget::state() const {
  std::scoped_lock lock(_mutex);
  return _state;
}

TargetState DeviceTarget::refreshState() {
  {
    std::scoped_lock lock(_mutex);
    if (_connection && _connection->isAlive()) {
      _state = TargetState::Booted;
      return _state;
    }
  }
  // Reconnects, updating the state either way.
  (void)fileCommands();
  return state();
}

std::expected<std::shared_ptr<FileCommands>, Error> DeviceTarget::fileCommands() {
  std::scoped_lock lock(_mutex);
  if (_connection && _connection->isAlive()) {
    return _fileCommands;
  }
  if (_connection) {
    log::warn("AFC connection to device {} died, reconnecting", udid());
    _fileCommands.reset();
    _connection.reset();
  }

  ConnectResult result = ConnectTCP(_config.afcHost, _config.afcPort, _config.connectTimeout);
  if (result.failure) {
    if (_state != TargetState::Offline) {
      log::error("Device {} is offline: unable to reach AFC at {}:{}", udid(), _config.afcHost, _config.afcPort);
    }
    _state = TargetState::Offline;
    return std::unexpected(Error(ErrorKind::ConnectionClosed,
                                 fmt::format("unable to connect to AFC of device {} at {}:{}", udid(),
                                             _config.afcHost, _config.afcPort),
                                 result.err));
  }
  _connection = std::make_shared<AfcConnection>(result.cnx.releaseFd(), _config.afc);
  _fileCommands = std::make_shared<AfcFileCommands>(AfcClient(_connection));
  if (_state != TargetState::Booted) {
    log::info("Device {} is online, AFC at {}:{}", udid(), _config.afcHost, _config.afcPort);
  }
  _state = TargetState::Booted;
  return _fileCommands;
}

std::expected<std::shared_ptr<BitmapStream>, Error> DeviceTarget::createBitmapStream(DelayScheduler& scheduler) {
  if (!_config.video) {
    return std::unexpected(
        Error(ErrorKind::InvalidState, fmt::format("device {} has no video relay configured", udid())));
  }
  return BitmapStream::Create(std::make_unique<SocketFrameSource>(*_config.video), scheduler, _config.stream);
}

}  // namespace companion
