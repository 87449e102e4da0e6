#pragma once

#include <expected>
#include <memory>
#include <mutex>

#include "companion/bitmap-stream.hpp"
#include "companion/delay-scheduler.hpp"
#include "companion/error.hpp"
#include "companion/file-commands.hpp"
#include "companion/host-file-commands.hpp"
#include "companion/target-config.hpp"
#include "companion/target.hpp"

namespace companion {

// Simulator whose data container is a host directory. Booted while the directory exists, Offline otherwise.
class SimulatorTarget : public Target {
 public:
  // Throws std::invalid_argument on invalid config.
  explicit SimulatorTarget(SimulatorTargetConfig config);

  [[nodiscard]] TargetType type() const noexcept override { return TargetType::Simulator; }

  [[nodiscard]] TargetState state() const override;

  TargetState refreshState() override;

  std::expected<std::shared_ptr<FileCommands>, Error> fileCommands() override;

  std::expected<std::shared_ptr<BitmapStream>, Error> createBitmapStream(DelayScheduler& scheduler) override;

  [[nodiscard]] const SimulatorTargetConfig& config() const noexcept { return _config; }

 private:
  SimulatorTargetConfig _config;
  std::shared_ptr<HostFileCommands> _fileCommands;
  mutable std::mutex _mutex;
  TargetState _state{TargetState::Unknown};
};

}  // namespace companion
