#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace companion {

// Endpoint and format of the video relay a target exposes its screen through.
struct VideoSourceConfig {
  std::string host{"127.0.0.1"};

  std::string port;

  uint32_t width{0};

  uint32_t height{0};

  uint32_t framesPerSecond{30};

  std::string pixelFormat{"BGRA"};

  std::string encoding{"h264"};

  // Bound of the connection establishment to the relay. Default: 5 s.
  std::chrono::milliseconds connectTimeout{5000};

  VideoSourceConfig& withHost(std::string host) {
    this->host = std::move(host);
    return *this;
  }

  VideoSourceConfig& withPort(std::string port) {
    this->port = std::move(port);
    return *this;
  }

  VideoSourceConfig& withDimensions(uint32_t width, uint32_t height) {
    this->width = width;
    this->height = height;
    return *this;
  }

  VideoSourceConfig& withFramesPerSecond(uint32_t framesPerSecond) {
    this->framesPerSecond = framesPerSecond;
    return *this;
  }

  VideoSourceConfig& withPixelFormat(std::string pixelFormat) {
    this->pixelFormat = std::move(pixelFormat);
    return *this;
  }

  VideoSourceConfig& withEncoding(std::string encoding) {
    this->encoding = std::move(encoding);
    return *this;
  }

  VideoSourceConfig& withConnectTimeout(std::chrono::milliseconds timeout) {
    this->connectTimeout = timeout;
    return *this;
  }

  // Throws std::invalid_argument if the configuration is not usable.
  void validate() const;

  bool operator==(const VideoSourceConfig&) const noexcept = default;
};

}  // namespace companion
