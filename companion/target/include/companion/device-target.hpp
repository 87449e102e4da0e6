#pragma once

#include <expected>
#include <memory>
#include <mutex>

#include "companion/afc-connection.hpp"
#include "companion/bitmap-stream.hpp"
#include "companion/delay-scheduler.hpp"
#include "companion/error.hpp"
#include "companion/file-commands.hpp"
#include "companion/target-config.hpp"
#include "companion/target.hpp"

namespace companion {

// Physical device reached through TCP relays.
//
// The target owns at most one AFC connection, shared by every FileCommands it hands out. A connection that died
// (peer close, protocol fault) is replaced by the next call to fileCommands(). A failed connection attempt marks the
// target Offline.
class DeviceTarget : public Target {
 public:
  // Throws std::invalid_argument on invalid config. Does not connect.
  explicit DeviceTarget(DeviceTargetConfig config);

  [[nodiscard]] TargetType type() const noexcept override { return TargetType::Device; }

  [[nodiscard]] TargetState state() const override;

  TargetState refreshState() override;

  std::expected<std::shared_ptr<FileCommands>, Error> fileCommands() override;

  std::expected<std::shared_ptr<BitmapStream>, Error> createBitmapStream(DelayScheduler& scheduler) override;

  [[nodiscard]] const DeviceTargetConfig& config() const noexcept { return _config; }

 private:
  DeviceTargetConfig _config;
  mutable std::mutex _mutex;
  TargetState _state{TargetState::Unknown};
  std::shared_ptr<AfcConnection> _connection;
  std::shared_ptr<FileCommands> _fileCommands;
};

}  // namespace companion
