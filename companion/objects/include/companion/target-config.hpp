#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>

#include "companion/afc-connection-config.hpp"
#include "companion/bitmap-stream-config.hpp"
#include "companion/video-source-config.hpp"

namespace companion {

// Physical device reachable through a relay exposing its AFC service (and optionally its screen) over TCP.
struct DeviceTargetConfig {
  std::string udid;

  std::string name{"device"};

  std::string afcHost{"127.0.0.1"};

  std::string afcPort;

  // Bound of the AFC connection establishment. Default: 5 s.
  std::chrono::milliseconds connectTimeout{5000};

  AfcConnectionConfig afc;

  std::optional<VideoSourceConfig> video;

  BitmapStreamConfig stream;

  DeviceTargetConfig& withUdid(std::string udid) {
    this->udid = std::move(udid);
    return *this;
  }

  DeviceTargetConfig& withName(std::string name) {
    this->name = std::move(name);
    return *this;
  }

  DeviceTargetConfig& withAfcEndpoint(std::string host, std::string port) {
    this->afcHost = std::move(host);
    this->afcPort = std::move(port);
    return *this;
  }

  DeviceTargetConfig& withConnectTimeout(std::chrono::milliseconds timeout) {
    this->connectTimeout = timeout;
    return *this;
  }

  DeviceTargetConfig& withAfcConnectionConfig(AfcConnectionConfig afc) {
    this->afc = std::move(afc);
    return *this;
  }

  DeviceTargetConfig& withVideo(VideoSourceConfig video) {
    this->video = std::move(video);
    return *this;
  }

  DeviceTargetConfig& withBitmapStreamConfig(BitmapStreamConfig stream) {
    this->stream = std::move(stream);
    return *this;
  }

  // Throws std::invalid_argument if the configuration is not usable.
  void validate() const;

  bool operator==(const DeviceTargetConfig&) const noexcept = default;
};

// Simulator whose data container is a directory of the host.
struct SimulatorTargetConfig {
  std::string udid;

  std::string name{"simulator"};

  std::string root;

  std::optional<VideoSourceConfig> video;

  BitmapStreamConfig stream;

  SimulatorTargetConfig& withUdid(std::string udid) {
    this->udid = std::move(udid);
    return *this;
  }

  SimulatorTargetConfig& withName(std::string name) {
    this->name = std::move(name);
    return *this;
  }

  SimulatorTargetConfig& withRoot(std::string root) {
    this->root = std::move(root);
    return *this;
  }

  SimulatorTargetConfig& withVideo(VideoSourceConfig video) {
    this->video = std::move(video);
    return *this;
  }

  SimulatorTargetConfig& withBitmapStreamConfig(BitmapStreamConfig stream) {
    this->stream = std::move(stream);
    return *this;
  }

  // Throws std::invalid_argument if the configuration is not usable.
  void validate() const;

  bool operator==(const SimulatorTargetConfig&) const noexcept = default;
};

}  // namespace companion
