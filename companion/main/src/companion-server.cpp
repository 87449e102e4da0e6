#include "companion/companion-server.hpp"

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "companion/bitmap-stream.hpp"
#include "companion/command-executor.hpp"
#include "companion/companion-config.hpp"
#include "companion/connection.hpp"
#include "companion/continuation.hpp"
#include "companion/data-consumer.hpp"
#include "companion/delay-scheduler.hpp"
#include "companion/error.hpp"
#include "companion/event-loop.hpp"
#include "companion/event-reporter.hpp"
#include "companion/event.hpp"
#include "companion/future-combinators.hpp"
#include "companion/future.hpp"
#include "companion/internal/client-session.hpp"
#include "companion/internal/reactor-mailbox.hpp"
#include "companion/log.hpp"
#include "companion/rpc-protocol.hpp"
#include "companion/socket-ops.hpp"
#include "companion/socket.hpp"
#include "companion/target-state-watch.hpp"
#include "companion/target.hpp"
#include "companion/temporary-directory.hpp"
#include "companion/timedef.hpp"

namespace companion {

namespace {

constexpr EventBmp kClientEvents = EventIn | EventRdHup;

using Fields = std::vector<std::string>;

// Forwards the bytes of a video stream to the reactor, as frames answering the StartVideo request.
class ClientStreamConsumer : public DataConsumer {
 public:
  // Runs on the reactor thread.
  using Deliver = std::function<void(const RpcFrame&, bool)>;

  ClientStreamConsumer(std::shared_ptr<internal::ReactorMailbox> mailbox, uint64_t requestId, Deliver deliver)
      : _mailbox(std::move(mailbox)), _deliver(std::move(deliver)), _requestId(requestId) {}

  void consumeData(std::string_view bytes) override {
    post(MakeRpcResponse(_requestId, RpcStatus::StreamChunk, {std::string(bytes)}), true);
  }

  void consumeEndOfFile() override { post(MakeRpcResponse(_requestId, RpcStatus::StreamEnd), false); }

 private:
  void post(RpcFrame frame, bool streamChunk) {
    // A closed mailbox means that the server is gone, and so is the client.
    (void)_mailbox->post([deliver = _deliver, frame = std::move(frame), streamChunk] { deliver(frame, streamChunk); });
  }

  std::shared_ptr<internal::ReactorMailbox> _mailbox;
  Deliver _deliver;
  uint64_t _requestId;
};

}  // namespace

std::string_view ServerStateName(ServerState state) noexcept {
  switch (state) {
    case ServerState::Constructed:
      return "Constructed";
    case ServerState::Starting:
      return "Starting";
    case ServerState::Serving:
      return "Serving";
    case ServerState::Completed:
      return "Completed";
    default:
      return "Unknown";
  }
}

std::expected<std::unique_ptr<CompanionServer>, Error> CompanionServer::Create(
    std::shared_ptr<Target> target, std::shared_ptr<TemporaryDirectory> temporaryDirectory, DelayScheduler& scheduler,
    CompanionConfig config, std::shared_ptr<EventReporter> reporter) {
  const auto initFailure = [](std::string message) {
    log::error("Companion server initialization failed: {}", message);
    return std::unexpected(Error(ErrorKind::InitializationFailure, std::move(message)));
  };
  if (!target) {
    return initFailure("a target is required");
  }
  if (!reporter) {
    return initFailure("an event reporter is required");
  }
  if (!temporaryDirectory) {
    return initFailure("a temporary directory is required");
  }
  std::error_code ec;
  if (temporaryDirectory->removed() || !std::filesystem::is_directory(temporaryDirectory->path(), ec)) {
    return initFailure(fmt::format("temporary directory {} is not usable", temporaryDirectory->path().string()));
  }
  try {
    config.validate();
  } catch (const std::invalid_argument& ex) {
    return initFailure(fmt::format("invalid configuration: {}", ex.what()));
  }
  try {
    return std::make_unique<CompanionServer>(PrivateTag{}, std::move(target), std::move(temporaryDirectory), scheduler,
                                             std::move(config), std::move(reporter));
  } catch (const std::exception& ex) {
    return initFailure(ex.what());
  }
}

CompanionServer::CompanionServer(PrivateTag, std::shared_ptr<Target> target,
                                 std::shared_ptr<TemporaryDirectory> temporaryDirectory, DelayScheduler& scheduler,
                                 CompanionConfig config, std::shared_ptr<EventReporter> reporter)
    : _config(std::move(config)),
      _target(std::move(target)),
      _temporaryDirectory(std::move(temporaryDirectory)),
      _reporter(std::move(reporter)),
      _scheduler(scheduler),
      _executor(_target, _temporaryDirectory, scheduler, _config.maxDecompressedBytes),
      _mailbox(std::make_shared<internal::ReactorMailbox>()),
      _eventLoop(_config.pollInterval) {
  _eventLoop.addOrThrow(EventLoop::EventFd{EventIn, _mailbox->wakeupFd().fd()});
  _maintenanceTimer.start(_config.pollInterval);
  _eventLoop.addOrThrow(EventLoop::EventFd{EventIn, _maintenanceTimer.fd()});

  // May be called after the destruction of the server, for continuations that outlived it.
  _registry.setRemovalCallback([reporter = _reporter](uint64_t id, const Continuation& continuation) {
    reporter->report(EventSubject{EventName::ContinuationRemoved,
                                  fmt::format("{} #{}", ContinuationTypeName(continuation.type()), id),
                                  {},
                                  {}});
  });
}

CompanionServer::~CompanionServer() {
  (void)shutdown();
  if (_reactor.joinable()) {
    _reactor.join();
  }
  _targetWatch.reset();
}

Future<uint16_t> CompanionServer::start() {
  std::unique_lock lock(_lifecycleMutex);
  if (_state.load() != ServerState::Constructed || _shutdownRequested) {
    return Future<uint16_t>::Failed(Error(
        ErrorKind::InvalidState, fmt::format("cannot start a companion server in state {}",
                                             _shutdownRequested ? "ShuttingDown" : ServerStateName(_state.load()))));
  }
  _state = ServerState::Starting;

  uint16_t port = _config.ports.port;
  try {
    _listenSocket = Socket(Socket::Type::StreamNonBlock);
    _listenSocket.bindAndListen(_config.ports.reusePort, _config.ports.tcpNoDelay, port);
    _eventLoop.addOrThrow(EventLoop::EventFd{EventIn, _listenSocket.fd()});
  } catch (const std::system_error& ex) {
    Error error(ErrorKind::BindFailure, fmt::format("unable to listen on port {}: {}", _config.ports.port, ex.what()),
                ex.code().value());
    log::error("Companion server {}", error.describe());
    _shutdownRequested = true;
    lock.unlock();
    completeWithoutReactor();
    return Future<uint16_t>::Failed(std::move(error));
  }
  _port = port;

  if (_config.terminateWhenOffline) {
    _targetWatch = std::make_unique<TargetStateWatch>(_target, _config.targetCheckInterval, _reporter);
    const Continuation watch = _targetWatch->continuation();
    (void)addContinuation(watch);
    watch.completion().onComplete([this](const Future<Void>& done) {
      if (done.state() == FutureState::Succeeded) {
        log::warn("Target {} is offline, terminating", _target->udid());
        (void)shutdown();
      }
    });
  }

  _running = true;
  _state = ServerState::Serving;
  _reactor = std::jthread([this] { run(); });
  lock.unlock();

  log::info("Companion server for {} target {} listening on port :{}", TargetTypeName(_target->type()),
            _target->udid(), port);
  report(EventName::Started, std::to_string(port));
  return Future<uint16_t>::Resolved(port);
}

Future<Void> CompanionServer::shutdown() {
  std::unique_lock lock(_lifecycleMutex);
  if (_shutdownRequested) {
    return _completed.future();
  }
  _shutdownRequested = true;
  if (_state.load() != ServerState::Serving) {
    lock.unlock();
    completeWithoutReactor();
    return _completed.future();
  }
  lock.unlock();
  log::debug("Companion server shutdown requested");
  if (!_mailbox->post([this] { beginShutdown(); })) {
    // The mailbox is only closed by the reactor once shutdown has completed.
    log::error("Companion server reactor is gone");
  }
  return _completed.future();
}

std::expected<uint64_t, Error> CompanionServer::addContinuation(Continuation continuation) {
  const ContinuationType type = continuation.type();
  auto id = _registry.add(std::move(continuation));
  if (id) {
    report(EventName::ContinuationAdded, fmt::format("{} #{}", ContinuationTypeName(type), *id));
  }
  return id;
}

void CompanionServer::run() {
  log::debug("Companion server reactor running");
  while (_running) {
    runPostedTasks();
    if (!_running) {
      break;
    }
    const auto events = _eventLoop.poll();
    if (events.data() == nullptr) [[unlikely]] {
      log::error("Companion server event loop failure, shutting down");
      (void)shutdown();
      continue;
    }
    for (const auto event : events) {
      const int fd = event.fd;
      if (fd == _listenSocket.fd()) {
        if ((event.eventBmp & (EventErr | EventHup)) != 0) {
          log::error("Control listener on fd # {} failed, shutting down", fd);
          (void)shutdown();
        } else {
          acceptClients();
        }
      } else if (fd == _mailbox->wakeupFd().fd()) {
        (void)_mailbox->wakeupFd().drain();
      } else if (fd == _maintenanceTimer.fd()) {
        if (_maintenanceTimer.drain() > 1) {
          log::debug("Maintenance tick missed");
        }
        maintenance();
      } else {
        const auto bmp = event.eventBmp;
        if ((bmp & EventOut) != 0) {
          handleWritable(fd);
        }
        // Errors and hang ups are observed through the read.
        if ((bmp & (EventIn | EventErr | EventHup | EventRdHup)) != 0) {
          handleReadable(fd);
        }
      }
    }
  }
  _mailbox->close();
  log::debug("Companion server reactor stopped");
}

void CompanionServer::runPostedTasks() {
  for (auto& task : _mailbox->drain()) {
    task();
  }
}

void CompanionServer::maintenance() {
  for (auto& [fd, session] : _clients) {
    // Release the streams that ended on their own.
    if (session->stream && session->stream->state() == StreamState::Stopped &&
        session->stream->continuation().isTerminal()) {
      log::debug("Client #{} video stream ended after {} bytes", session->id, session->stream->bytesForwarded());
      session->stream.reset();
    }
    if (session->droppedChunks != 0) {
      log::warn("Client #{} is too slow, {} video chunks dropped", session->id, session->droppedChunks);
      session->droppedChunks = 0;
    }
  }
}

void CompanionServer::acceptClients() {
  while (true) {
    Connection cnx(_listenSocket);
    if (!cnx) {
      // no more waiting connections
      break;
    }
    const int fd = cnx.fd();
    if (_config.ports.tcpNoDelay && !SetTcpNoDelay(fd)) {
      log::warn("Unable to set TCP_NODELAY on fd # {}", fd);
    }
    if (!_eventLoop.add(EventLoop::EventFd{kClientEvents, fd})) {
      continue;
    }
    const uint64_t id = _nextClientId++;
    const std::string peer = cnx.peer();
    _clients.emplace(fd, std::make_unique<internal::ClientSession>(std::move(cnx), id, _config.maxFrameBytes));
    ++_nbClients;
    log::debug("Client #{} {} connected on fd # {}", id, peer, fd);
    report(EventName::ClientConnected, fmt::format("#{} {}", id, peer));
  }
}

void CompanionServer::handleReadable(int fd) {
  auto it = _clients.find(fd);
  if (it == _clients.end()) {
    return;
  }
  internal::ClientSession& session = *it->second;
  while (true) {
    std::size_t nbRead = 0;
    const IoStatus status = RecvSome(fd, _readBuffer.data(), _readBuffer.size(), SysDuration::zero(), nbRead);
    if (status == IoStatus::Timeout) {
      break;
    }
    if (status != IoStatus::Ok) {
      closeClient(it, status == IoStatus::PeerClosed ? "peer closed" : "read error");
      return;
    }
    session.decoder.feed(std::string_view(_readBuffer.data(), nbRead));
    if (nbRead < _readBuffer.size()) {
      break;
    }
  }

  while (!session.broken) {
    std::optional<RpcFrame> frame = session.decoder.next();
    if (!frame) {
      break;
    }
    handleRequest(session, std::move(*frame));
  }
  if (session.decoder.failed() && !session.closeWhenFlushed && !session.broken) {
    log::warn("Client #{} sent a malformed control frame: {}", session.id, session.decoder.error()->message());
    session.closeWhenFlushed = true;
    queueFrame(session, MakeRpcFailure(0, *session.decoder.error()));
  }
  if (session.broken) {
    closeClient(it, session.closeWhenFlushed ? "protocol violation" : "write error");
  }
}

void CompanionServer::handleWritable(int fd) {
  auto it = _clients.find(fd);
  if (it == _clients.end()) {
    return;
  }
  if (!flush(*it->second)) {
    closeClient(it, it->second->closeWhenFlushed ? "protocol violation" : "write error");
  }
}

void CompanionServer::handleRequest(internal::ClientSession& session, RpcFrame request) {
  log::debug("Client #{} request {} {}", session.id, request.requestId, RpcCommandName(request.code));
  switch (static_cast<RpcCommand>(request.code)) {
    case RpcCommand::StartVideo:
      startVideo(session, request.requestId);
      break;
    case RpcCommand::StopVideo:
      stopVideo(session, request.requestId);
      break;
    default:
      replyWhenDone(session, request, _executor.execute(request));
      break;
  }
}

void CompanionServer::startVideo(internal::ClientSession& session, uint64_t requestId) {
  const RpcFrame request{requestId, static_cast<uint64_t>(RpcCommand::StartVideo), {}};
  if (session.stream && session.stream->state() == StreamState::Streaming) {
    replyWhenDone(session, request,
                  Future<Fields>::Failed(Error(ErrorKind::AlreadyStarted, "video stream already running")));
    return;
  }
  auto stream = _executor.createVideoStream();
  if (!stream) {
    replyWhenDone(session, request, Future<Fields>::Failed(stream.error()));
    return;
  }
  // Registered before any reply can be sent.
  auto continuationId = addContinuation((*stream)->continuation());
  if (!continuationId) {
    replyWhenDone(session, request, Future<Fields>::Failed(continuationId.error()));
    return;
  }
  session.stream = std::move(*stream);
  session.streamRequestId = requestId;

  auto deliver = [this, fd = session.cnx.fd(), clientId = session.id](const RpcFrame& frame, bool streamChunk) {
    sendFrame(fd, clientId, frame, streamChunk);
  };
  auto consumer = std::make_unique<ClientStreamConsumer>(_mailbox, requestId, std::move(deliver));
  replyWhenDone(session, request,
                session.stream->startStreaming(std::move(consumer)).map([id = *continuationId](const Void&) {
                  return Fields{std::to_string(id)};
                }));
}

void CompanionServer::stopVideo(internal::ClientSession& session, uint64_t requestId) {
  const RpcFrame request{requestId, static_cast<uint64_t>(RpcCommand::StopVideo), {}};
  if (!session.stream) {
    replyWhenDone(session, request, Future<Fields>::Resolved());
    return;
  }
  std::shared_ptr<BitmapStream> stream = std::move(session.stream);
  // However the stream ended, it is stopped once its completion is terminal.
  replyWhenDone(session, request,
                stream->stopStreaming().chain([](const Future<Void>&) { return Future<Fields>::Resolved(); }));
}

void CompanionServer::replyWhenDone(const internal::ClientSession& session, const RpcFrame& request,
                                    const Future<Fields>& result) {
  const auto startTime = SteadyClock::now();
  // The callback may run after the destruction of the server: only the posted task touches it.
  result.onComplete([this, mailbox = _mailbox, reporter = _reporter, fd = session.cnx.fd(), clientId = session.id,
                     requestId = request.requestId, command = std::string(RpcCommandName(request.code)),
                     startTime](const Future<Fields>& done) {
    const SysDuration duration = SteadyClock::now() - startTime;
    RpcFrame response;
    if (done.state() == FutureState::Succeeded) {
      response = MakeRpcResponse(requestId, RpcStatus::Ok, done.value());
      reporter->report(EventSubject{EventName::CommandSucceeded, command, duration, {}});
    } else {
      const Error error = done.error();
      log::debug("Client #{} request {} {} failed: {}", clientId, requestId, command, error.describe());
      response = MakeRpcFailure(requestId, error);
      reporter->report(EventSubject{EventName::CommandFailed, command, duration, error});
    }
    (void)mailbox->post([this, fd, clientId, response = std::move(response)] { sendFrame(fd, clientId, response); });
  });
}

void CompanionServer::sendFrame(int fd, uint64_t clientId, const RpcFrame& frame, bool streamChunk) {
  auto it = _clients.find(fd);
  if (it == _clients.end() || it->second->id != clientId) {
    log::trace("Client #{} is gone, {} for request {} dropped", clientId, RpcStatusName(frame.code), frame.requestId);
    return;
  }
  queueFrame(*it->second, frame, streamChunk);
  if (it->second->broken) {
    closeClient(it, it->second->closeWhenFlushed ? "protocol violation" : "write error");
  }
}

void CompanionServer::queueFrame(internal::ClientSession& session, const RpcFrame& frame, bool streamChunk) {
  if (session.broken) {
    return;
  }
  if (streamChunk && session.pendingBytes() >= _config.maxOutboundBufferBytes) {
    ++session.droppedChunks;
    return;
  }
  AppendRpcFrame(session.outBuffer, frame);
  if (!session.waitingWritable && !flush(session)) {
    session.broken = true;
  }
}

bool CompanionServer::flush(internal::ClientSession& session) {
  const int fd = session.cnx.fd();
  while (session.pendingBytes() != 0) {
    const int64_t sent = SafeSend(fd, session.outBuffer.data() + session.outPos, session.pendingBytes());
    if (sent < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        break;
      }
      log::debug("Client #{} write error on fd # {}: {}", session.id, fd, std::strerror(errno));
      return false;
    }
    session.outPos += static_cast<std::size_t>(sent);
  }

  if (session.pendingBytes() == 0) {
    session.outBuffer.clear();
    session.outPos = 0;
    if (session.waitingWritable) {
      if (!_eventLoop.mod(EventLoop::EventFd{kClientEvents, fd})) {
        return false;
      }
      session.waitingWritable = false;
    }
    return !session.closeWhenFlushed;
  }

  if (session.outPos > session.outBuffer.size() / 2) {
    session.outBuffer.erase(0, session.outPos);
    session.outPos = 0;
  }
  if (!session.waitingWritable) {
    if (!_eventLoop.mod(EventLoop::EventFd{kClientEvents | EventOut, fd})) {
      return false;
    }
    session.waitingWritable = true;
  }
  return true;
}

CompanionServer::ClientMap::iterator CompanionServer::closeClient(ClientMap::iterator it, std::string_view reason) {
  internal::ClientSession& session = *it->second;
  if (session.stream) {
    log::debug("Client #{} leaves, stopping its video stream", session.id);
    (void)session.stream->stopStreaming();
    session.stream.reset();
  }
  _eventLoop.del(it->first);
  log::debug("Client #{} on fd # {} closed: {}", session.id, it->first, reason);
  report(EventName::ClientDisconnected, fmt::format("#{}", session.id), {},
         reason == "peer closed" || reason == "server shutdown"
             ? std::nullopt
             : std::optional<Error>(Error(ErrorKind::ConnectionClosed, std::string(reason))));
  --_nbClients;
  return _clients.erase(it);
}

void CompanionServer::closeListener() noexcept {
  if (_listenSocket) {
    if (_state.load() == ServerState::Serving) {
      _eventLoop.del(_listenSocket.fd());
    }
    _listenSocket.close();
  }
}

void CompanionServer::beginShutdown() {
  log::info("Companion server on port :{} shutting down", port());
  closeListener();

  const std::vector<Continuation> live = _registry.close();
  std::vector<Future<Void>> settling;
  settling.reserve(live.size() * 2);
  for (const Continuation& continuation : live) {
    settling.push_back(continuation.cancel());
    settling.push_back(continuation.completion());
  }
  if (!live.empty()) {
    log::info("Waiting for {} continuation(s) to settle", live.size());
  }

  const auto gracePeriod = _config.shutdownGracePeriod;
  WithTimeout(AwaitAllSettled(settling), gracePeriod, _scheduler)
      .onComplete([this, mailbox = _mailbox, gracePeriod](const Future<Void>& settled) {
        if (settled.state() != FutureState::Succeeded) {
          log::warn("Continuations still running after the shutdown grace period of {} ms, abandoned",
                    gracePeriod.count());
        }
        (void)mailbox->post([this] { finishShutdown(); });
      });
}

void CompanionServer::finishShutdown() {
  for (auto it = _clients.begin(); it != _clients.end();) {
    // Last chance for the responses already queued.
    (void)flush(*it->second);
    it = closeClient(it, "server shutdown");
  }
  _temporaryDirectory->remove();
  _running = false;
  _state = ServerState::Completed;
  log::info("Companion server on port :{} completed", port());
  report(EventName::Stopped, std::to_string(port()));
  _completed.resolve();
}

void CompanionServer::completeWithoutReactor() {
  closeListener();
  for (const Continuation& continuation : _registry.close()) {
    (void)continuation.cancel();
  }
  _temporaryDirectory->remove();
  _state = ServerState::Completed;
  report(EventName::Stopped, std::to_string(port()));
  _completed.resolve();
}

void CompanionServer::report(EventName name, std::string subject, std::optional<SysDuration> duration,
                             std::optional<Error> error) {
  _reporter->report(EventSubject{name, std::move(subject), duration, std::move(error)});
}

}  // namespace companion
