#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "companion/bitmap-stream.hpp"
#include "companion/delay-scheduler.hpp"
#include "companion/error.hpp"
#include "companion/file-commands.hpp"

namespace companion {

enum class TargetType : std::uint8_t { Device, Simulator };

enum class TargetState : std::uint8_t { Unknown, Booted, Offline };

[[nodiscard]] std::string_view TargetTypeName(TargetType type) noexcept;

[[nodiscard]] std::string_view TargetStateName(TargetState state) noexcept;

// The device or simulator a companion serves. Methods may be called from any thread.
class Target {
 public:
  virtual ~Target() = default;

  [[nodiscard]] const std::string& udid() const noexcept { return _udid; }

  [[nodiscard]] const std::string& name() const noexcept { return _name; }

  [[nodiscard]] virtual TargetType type() const noexcept = 0;

  // Last known state.
  [[nodiscard]] virtual TargetState state() const = 0;

  // Queries the target and returns its up to date state.
  virtual TargetState refreshState() = 0;

  // File commands on the target data container.
  virtual std::expected<std::shared_ptr<FileCommands>, Error> fileCommands() = 0;

  // New, idle, stream of the target screen. 'scheduler' must outlive the stream.
  virtual std::expected<std::shared_ptr<BitmapStream>, Error> createBitmapStream(DelayScheduler& scheduler) = 0;

  // JSON object with udid, name, type and state.
  [[nodiscard]] std::string description() const;

 protected:
  Target(std::string udid, std::string name) : _udid(std::move(udid)), _name(std::move(name)) {}

 private:
  std::string _udid;
  std::string _name;
};

}  // namespace companion
