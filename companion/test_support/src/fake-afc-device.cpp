#include "companion/fake-afc-device.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "companion/afc-protocol.hpp"
#include "companion/connection.hpp"
#include "companion/little-endian.hpp"
#include "companion/log.hpp"
#include "companion/socket-ops.hpp"

namespace companion::test {

namespace {

using namespace std::chrono_literals;

std::string NormalizePath(std::string_view path) {
  std::string ret;
  if (path.empty() || path.front() != '/') {
    ret.push_back('/');
  }
  ret.append(path);
  while (ret.size() > 1 && ret.back() == '/') {
    ret.pop_back();
  }
  return ret;
}

std::string ParentPath(const std::string& path) {
  const auto pos = path.rfind('/');
  if (pos == 0 || pos == std::string::npos) {
    return "/";
  }
  return path.substr(0, pos);
}

AfcPacket StatusPacket(uint64_t requestId, AfcStatus status) {
  AfcPacket packet;
  packet.requestId = requestId;
  packet.operation = AfcOperation::Status;
  AppendAfcU64(packet.params, static_cast<uint64_t>(status));
  return packet;
}

AfcPacket DataPacket(uint64_t requestId, std::string data) {
  AfcPacket packet;
  packet.requestId = requestId;
  packet.operation = AfcOperation::Data;
  packet.data = std::move(data);
  return packet;
}

std::string NulJoin(const std::vector<std::string>& strings) {
  std::string out;
  for (const std::string& str : strings) {
    AppendAfcPath(out, str);
  }
  return out;
}

// Path parameter starting at 'offset', up to its NUL terminator.
std::string PathParam(const std::string& params, std::size_t offset = 0) {
  if (offset >= params.size()) {
    return {};
  }
  const auto end = params.find('\0', offset);
  return NormalizePath(std::string_view(params).substr(offset, end == std::string::npos ? end : end - offset));
}

uint64_t U64Param(const std::string& params, std::size_t offset) {
  if (params.size() < offset + sizeof(uint64_t)) {
    return 0;
  }
  return Read64LE(params.data() + offset);
}

}  // namespace

FakeAfcDevice::FakeAfcDevice()
    : _nodes{{"/", Node{true, {}}}},
      _deviceInfo{{"Model", "iPhone14,2"}, {"FSTotalBytes", "128000000000"}, {"FSFreeBytes", "64000000000"}},
      _acceptor([this](const std::stop_token& stopToken) { acceptLoop(stopToken); }) {}

FakeAfcDevice::~FakeAfcDevice() { stop(); }

void FakeAfcDevice::stop() {
  _acceptor.request_stop();
  if (_acceptor.joinable()) {
    _acceptor.join();
  }
  for (std::jthread& server : _servers) {
    server.request_stop();
  }
  dropConnections();
  for (std::jthread& server : _servers) {
    if (server.joinable()) {
      server.join();
    }
  }
  _servers.clear();
  _listener.close();
}

void FakeAfcDevice::addFile(std::string_view path, std::string content) {
  std::scoped_lock lock(_mutex);
  std::string normalized = NormalizePath(path);
  ensureParents(normalized);
  _nodes.insert_or_assign(std::move(normalized), Node{false, std::move(content)});
}

void FakeAfcDevice::addDirectory(std::string_view path) {
  std::scoped_lock lock(_mutex);
  std::string normalized = NormalizePath(path);
  ensureParents(normalized);
  _nodes.insert_or_assign(std::move(normalized), Node{true, {}});
}

std::optional<std::string> FakeAfcDevice::fileContent(std::string_view path) const {
  std::scoped_lock lock(_mutex);
  auto it = _nodes.find(NormalizePath(path));
  if (it == _nodes.end() || it->second.directory) {
    return std::nullopt;
  }
  return it->second.content;
}

bool FakeAfcDevice::exists(std::string_view path) const {
  std::scoped_lock lock(_mutex);
  return _nodes.contains(NormalizePath(path));
}

bool FakeAfcDevice::isDirectory(std::string_view path) const {
  std::scoped_lock lock(_mutex);
  auto it = _nodes.find(NormalizePath(path));
  return it != _nodes.end() && it->second.directory;
}

void FakeAfcDevice::setDeviceInfo(std::map<std::string, std::string> deviceInfo) {
  std::scoped_lock lock(_mutex);
  _deviceInfo = std::move(deviceInfo);
}

void FakeAfcDevice::setResponseDelay(std::chrono::milliseconds delay) {
  std::scoped_lock lock(_mutex);
  _responseDelay = delay;
}

void FakeAfcDevice::corruptNextResponseId() {
  std::scoped_lock lock(_mutex);
  _corruptNextId = true;
}

void FakeAfcDevice::corruptNextMagic() {
  std::scoped_lock lock(_mutex);
  _corruptNextMagic = true;
}

void FakeAfcDevice::answerNextWith(AfcOperation operation) {
  std::scoped_lock lock(_mutex);
  _nextResponseOperation = operation;
}

void FakeAfcDevice::setSilent(bool silent) {
  std::scoped_lock lock(_mutex);
  _silent = silent;
}

void FakeAfcDevice::dropConnections() {
  std::scoped_lock lock(_mutex);
  for (int fd : _openFds) {
    (void)ShutdownReadWrite(fd);
  }
}

std::vector<AfcOperation> FakeAfcDevice::receivedOperations() const {
  std::scoped_lock lock(_mutex);
  return _receivedOperations;
}

std::vector<uint64_t> FakeAfcDevice::receivedRequestIds() const {
  std::scoped_lock lock(_mutex);
  return _receivedRequestIds;
}

void FakeAfcDevice::acceptLoop(const std::stop_token& stopToken) {
  while (!stopToken.stop_requested()) {
    Connection cnx = _listener.accept(20ms);
    if (!cnx) {
      continue;
    }
    ++_connectionsAccepted;
    {
      std::scoped_lock lock(_mutex);
      _openFds.push_back(cnx.fd());
    }
    _servers.emplace_back(
        [this, cnx = std::move(cnx)](const std::stop_token& serverStop) mutable { serve(serverStop, std::move(cnx)); });
  }
}

void FakeAfcDevice::serve(const std::stop_token& stopToken, Connection cnx) {
  const int fd = cnx.fd();
  while (!stopToken.stop_requested()) {
    const IoStatus ready = WaitReady(fd, false, 20ms);
    if (ready == IoStatus::Timeout) {
      continue;
    }
    if (ready != IoStatus::Ok) {
      break;
    }
    std::array<char, kAfcHeaderSize> headerBuf;
    if (RecvExact(fd, headerBuf.data(), headerBuf.size(), 2s) != IoStatus::Ok) {
      break;
    }
    auto header = DecodeAfcHeader(std::string_view(headerBuf.data(), headerBuf.size()), std::size_t{1} << 30);
    if (!header) {
      log::warn("FakeAfcDevice: {}", header.error().describe());
      break;
    }
    AfcPacket request;
    request.requestId = header->requestId;
    request.operation = static_cast<AfcOperation>(header->operation);
    request.params.resize(header->paramsLength());
    request.data.resize(header->dataLength());
    if (!request.params.empty() && RecvExact(fd, request.params.data(), request.params.size(), 2s) != IoStatus::Ok) {
      break;
    }
    if (!request.data.empty() && RecvExact(fd, request.data.data(), request.data.size(), 2s) != IoStatus::Ok) {
      break;
    }
    ++_requestsReceived;

    std::chrono::milliseconds delay;
    bool silent;
    {
      std::scoped_lock lock(_mutex);
      _receivedOperations.push_back(request.operation);
      _receivedRequestIds.push_back(request.requestId);
      delay = _responseDelay;
      silent = _silent;
    }
    if (silent) {
      continue;
    }
    const auto deadline = SteadyClock::now() + delay;
    while (SteadyClock::now() < deadline && !stopToken.stop_requested()) {
      std::this_thread::sleep_for(std::min<SteadyClock::duration>(deadline - SteadyClock::now(), 5ms));
    }

    std::string encoded;
    {
      std::scoped_lock lock(_mutex);
      AfcPacket response;
      if (_nextResponseOperation) {
        const AfcOperation operation = *_nextResponseOperation;
        response = operation == AfcOperation::Status ? StatusPacket(request.requestId, AfcStatus::Success)
                                                     : AfcPacket{request.requestId, operation};
        _nextResponseOperation.reset();
      } else {
        response = handle(request);
      }
      if (_corruptNextId) {
        _corruptNextId = false;
        response.requestId += 1000;
      }
      encoded = EncodeAfcPacket(response);
      if (_corruptNextMagic) {
        _corruptNextMagic = false;
        encoded[0] = 'X';
      }
    }
    if (SendAll(fd, encoded, 2s) != IoStatus::Ok) {
      break;
    }
  }
  std::scoped_lock lock(_mutex);
  std::erase(_openFds, fd);
}

void FakeAfcDevice::ensureParents(const std::string& path) {
  for (std::string parent = ParentPath(path); parent != "/"; parent = ParentPath(parent)) {
    _nodes.insert_or_assign(parent, Node{true, {}});
  }
}

std::vector<std::string> FakeAfcDevice::children(const std::string& path) const {
  const std::string prefix = path == "/" ? path : path + "/";
  std::vector<std::string> ret;
  for (auto it = _nodes.lower_bound(prefix); it != _nodes.end() && it->first.starts_with(prefix); ++it) {
    std::string_view rest = std::string_view(it->first).substr(prefix.size());
    if (!rest.empty() && rest.find('/') == std::string_view::npos) {
      ret.emplace_back(rest);
    }
  }
  return ret;
}

AfcPacket FakeAfcDevice::handle(const AfcPacket& request) {
  const uint64_t id = request.requestId;
  switch (request.operation) {
    case AfcOperation::ReadDirectory: {
      const std::string path = PathParam(request.params);
      auto it = _nodes.find(path);
      if (it == _nodes.end()) {
        return StatusPacket(id, AfcStatus::ObjectNotFound);
      }
      if (!it->second.directory) {
        return StatusPacket(id, AfcStatus::InvalidArg);
      }
      std::vector<std::string> entries{".", ".."};
      for (std::string& child : children(path)) {
        entries.push_back(std::move(child));
      }
      return DataPacket(id, NulJoin(entries));
    }
    case AfcOperation::MakeDirectory: {
      const std::string path = PathParam(request.params);
      auto it = _nodes.find(path);
      if (it != _nodes.end()) {
        return StatusPacket(id, it->second.directory ? AfcStatus::Success : AfcStatus::ObjectExists);
      }
      ensureParents(path);
      _nodes.emplace(path, Node{true, {}});
      return StatusPacket(id, AfcStatus::Success);
    }
    case AfcOperation::RemovePath: {
      const std::string path = PathParam(request.params);
      auto it = _nodes.find(path);
      if (it == _nodes.end() || path == "/") {
        return StatusPacket(id, AfcStatus::ObjectNotFound);
      }
      if (it->second.directory && !children(path).empty()) {
        return StatusPacket(id, AfcStatus::DirNotEmpty);
      }
      _nodes.erase(it);
      return StatusPacket(id, AfcStatus::Success);
    }
    case AfcOperation::RemovePathAndContents: {
      const std::string path = PathParam(request.params);
      if (!_nodes.contains(path) || path == "/") {
        return StatusPacket(id, AfcStatus::ObjectNotFound);
      }
      const std::string prefix = path + "/";
      std::erase_if(_nodes, [&](const auto& entry) { return entry.first == path || entry.first.starts_with(prefix); });
      return StatusPacket(id, AfcStatus::Success);
    }
    case AfcOperation::RenamePath: {
      const std::string from = PathParam(request.params);
      const std::string to = PathParam(request.params, request.params.find('\0') + 1);
      if (!_nodes.contains(from) || from == "/") {
        return StatusPacket(id, AfcStatus::ObjectNotFound);
      }
      auto parent = _nodes.find(ParentPath(to));
      if (parent == _nodes.end() || !parent->second.directory) {
        return StatusPacket(id, AfcStatus::ObjectNotFound);
      }
      const std::string prefix = from + "/";
      std::map<std::string, Node> moved;
      for (auto it = _nodes.begin(); it != _nodes.end();) {
        if (it->first == from) {
          moved.emplace(to, std::move(it->second));
          it = _nodes.erase(it);
        } else if (it->first.starts_with(prefix)) {
          moved.emplace(to + it->first.substr(from.size()), std::move(it->second));
          it = _nodes.erase(it);
        } else {
          ++it;
        }
      }
      for (auto& [path, node] : moved) {
        _nodes.insert_or_assign(path, std::move(node));
      }
      return StatusPacket(id, AfcStatus::Success);
    }
    case AfcOperation::GetFileInfo: {
      const std::string path = PathParam(request.params);
      auto it = _nodes.find(path);
      if (it == _nodes.end()) {
        return StatusPacket(id, AfcStatus::ObjectNotFound);
      }
      const Node& node = it->second;
      return DataPacket(id, NulJoin({"st_size", std::to_string(node.content.size()), "st_ifmt",
                                     node.directory ? "S_IFDIR" : "S_IFREG", "st_nlink",
                                     node.directory ? std::to_string(2 + children(path).size()) : "1"}));
    }
    case AfcOperation::GetDeviceInfo: {
      std::vector<std::string> strings;
      for (const auto& [key, value] : _deviceInfo) {
        strings.push_back(key);
        strings.push_back(value);
      }
      return DataPacket(id, NulJoin(strings));
    }
    case AfcOperation::FileOpen: {
      const auto mode = static_cast<AfcFileMode>(U64Param(request.params, 0));
      const std::string path = PathParam(request.params, sizeof(uint64_t));
      auto it = _nodes.find(path);
      if (it != _nodes.end() && it->second.directory) {
        return StatusPacket(id, AfcStatus::ObjectIsDir);
      }
      if (mode == AfcFileMode::ReadOnly || mode == AfcFileMode::ReadWrite) {
        if (it == _nodes.end()) {
          return StatusPacket(id, AfcStatus::ObjectNotFound);
        }
      } else {
        auto parent = _nodes.find(ParentPath(path));
        if (parent == _nodes.end() || !parent->second.directory) {
          return StatusPacket(id, AfcStatus::ObjectNotFound);
        }
        Node& node = _nodes[path];
        if (mode == AfcFileMode::WriteTruncate || mode == AfcFileMode::ReadWriteTrunc) {
          node.content.clear();
        }
      }
      const uint64_t handle = _nextHandle++;
      const std::size_t offset =
          (mode == AfcFileMode::Append || mode == AfcFileMode::ReadAppend) ? _nodes[path].content.size() : 0;
      _openFiles.emplace(handle, OpenFile{path, offset});
      AfcPacket packet;
      packet.requestId = id;
      packet.operation = AfcOperation::FileOpenResult;
      AppendAfcU64(packet.params, handle);
      return packet;
    }
    case AfcOperation::FileRead: {
      auto it = _openFiles.find(U64Param(request.params, 0));
      if (it == _openFiles.end()) {
        return StatusPacket(id, AfcStatus::InvalidArg);
      }
      const std::string& content = _nodes[it->second.path].content;
      const std::size_t length = U64Param(request.params, sizeof(uint64_t));
      const std::size_t offset = std::min(it->second.offset, content.size());
      std::string chunk = content.substr(offset, length);
      it->second.offset = offset + chunk.size();
      return DataPacket(id, std::move(chunk));
    }
    case AfcOperation::FileWrite: {
      auto it = _openFiles.find(U64Param(request.params, 0));
      if (it == _openFiles.end()) {
        return StatusPacket(id, AfcStatus::InvalidArg);
      }
      std::string& content = _nodes[it->second.path].content;
      if (content.size() < it->second.offset + request.data.size()) {
        content.resize(it->second.offset + request.data.size());
      }
      content.replace(it->second.offset, request.data.size(), request.data);
      it->second.offset += request.data.size();
      return StatusPacket(id, AfcStatus::Success);
    }
    case AfcOperation::FileClose: {
      if (_openFiles.erase(U64Param(request.params, 0)) == 0) {
        return StatusPacket(id, AfcStatus::InvalidArg);
      }
      return StatusPacket(id, AfcStatus::Success);
    }
    default:
      return StatusPacket(id, AfcStatus::UnknownPacketType);
  }
}

}  // namespace companion::test
