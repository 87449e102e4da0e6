#include "companion/fake-video-relay.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include "companion/connection.hpp"
#include "companion/socket-ops.hpp"
#include "companion/timedef.hpp"

namespace companion::test {

using namespace std::chrono_literals;

FakeVideoRelay::FakeVideoRelay(std::string frame, std::chrono::milliseconds interval)
    : _frame(std::move(frame)),
      _interval(interval),
      _thread([this](const std::stop_token& stopToken) { run(stopToken); }) {}

FakeVideoRelay::~FakeVideoRelay() { stop(); }

void FakeVideoRelay::closeClients() {
  std::scoped_lock lock(_mutex);
  _clients.clear();
}

void FakeVideoRelay::stop() {
  _thread.request_stop();
  if (_thread.joinable()) {
    _thread.join();
  }
  closeClients();
  _listener.close();
}

std::size_t FakeVideoRelay::activeClients() const {
  std::scoped_lock lock(_mutex);
  return _clients.size();
}

void FakeVideoRelay::run(const std::stop_token& stopToken) {
  auto nextFrame = SteadyClock::now();
  while (!stopToken.stop_requested()) {
    Connection cnx = _listener.accept(1ms);
    if (cnx) {
      ++_connectionsAccepted;
      std::scoped_lock lock(_mutex);
      _clients.push_back(std::move(cnx));
    }
    if (SteadyClock::now() < nextFrame || _paused.load()) {
      continue;
    }
    nextFrame = SteadyClock::now() + _interval;
    std::scoped_lock lock(_mutex);
    std::erase_if(_clients, [this](const Connection& client) {
      if (SendAll(client.fd(), _frame, 200ms) != IoStatus::Ok) {
        return true;
      }
      _bytesSent += _frame.size();
      return false;
    });
  }
}

}  // namespace companion::test
