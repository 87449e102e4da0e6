#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include "companion/command-executor.hpp"
#include "companion/companion-config.hpp"
#include "companion/continuation-registry.hpp"
#include "companion/continuation.hpp"
#include "companion/delay-scheduler.hpp"
#include "companion/error.hpp"
#include "companion/event-loop.hpp"
#include "companion/event-reporter.hpp"
#include "companion/future.hpp"
#include "companion/internal/client-session.hpp"
#include "companion/internal/reactor-mailbox.hpp"
#include "companion/rpc-protocol.hpp"
#include "companion/socket.hpp"
#include "companion/target-state-watch.hpp"
#include "companion/target.hpp"
#include "companion/temporary-directory.hpp"
#include "companion/timedef.hpp"
#include "companion/timer-fd.hpp"

namespace companion {

enum class ServerState : std::uint8_t { Constructed, Starting, Serving, Completed };

[[nodiscard]] std::string_view ServerStateName(ServerState state) noexcept;

// Serves one target to control clients.
//
// A single reactor thread accepts clients, decodes their control frames and writes responses and stream chunks.
// Commands complete on other threads (AFC worker, stream worker) and hand their results back through a mailbox
// that wakes the reactor up. Video streams started by clients are tracked as continuations: completed() resolves
// only once the server has been shut down and every continuation has settled, or the shutdown grace period
// expired.
class CompanionServer {
  struct PrivateTag {};

 public:
  // InitializationFailure for a null target or reporter, an invalid configuration or an unusable temporary
  // directory. 'scheduler' must outlive the server and the streams it creates.
  static std::expected<std::unique_ptr<CompanionServer>, Error> Create(
      std::shared_ptr<Target> target, std::shared_ptr<TemporaryDirectory> temporaryDirectory, DelayScheduler& scheduler,
      CompanionConfig config, std::shared_ptr<EventReporter> reporter);

  CompanionServer(PrivateTag, std::shared_ptr<Target> target, std::shared_ptr<TemporaryDirectory> temporaryDirectory,
                  DelayScheduler& scheduler, CompanionConfig config, std::shared_ptr<EventReporter> reporter);

  CompanionServer(const CompanionServer&) = delete;
  CompanionServer(CompanionServer&&) = delete;
  CompanionServer& operator=(const CompanionServer&) = delete;
  CompanionServer& operator=(CompanionServer&&) = delete;

  // Shuts down and joins the reactor.
  ~CompanionServer();

  // Binds the control listener and starts serving. Resolves with the bound port.
  // InvalidState if not called first, BindFailure if the port cannot be acquired (the server then completes).
  Future<uint16_t> start();

  // Stops accepting, cancels every continuation and closes the clients once they settled. Idempotent, callable
  // from any thread. Returns completed().
  Future<Void> shutdown();

  [[nodiscard]] Future<Void> completed() const { return _completed.future(); }

  [[nodiscard]] ServerState state() const noexcept { return _state.load(); }

  // Bound port, 0 before start.
  [[nodiscard]] uint16_t port() const noexcept { return _port.load(); }

  // Live continuations.
  [[nodiscard]] std::vector<Continuation> continuations() const { return _registry.continuations(); }

  // Tracks 'continuation' until its completion is terminal. It is cancelled, and InvalidState returned, once the
  // server is shutting down.
  std::expected<uint64_t, Error> addContinuation(Continuation continuation);

  [[nodiscard]] std::size_t nbClients() const noexcept { return _nbClients.load(); }

 private:
  using ClientMap = std::unordered_map<int, std::unique_ptr<internal::ClientSession>>;

  void run();

  // Periodic housekeeping of the client sessions.
  void maintenance();

  void runPostedTasks();

  void acceptClients();

  void handleReadable(int fd);

  void handleWritable(int fd);

  void handleRequest(internal::ClientSession& session, RpcFrame request);

  void startVideo(internal::ClientSession& session, uint64_t requestId);

  void stopVideo(internal::ClientSession& session, uint64_t requestId);

  // Completes the request with the fields of 'result' (Ok) or its error (Failed), from the reactor thread.
  void replyWhenDone(const internal::ClientSession& session, const RpcFrame& request,
                     const Future<std::vector<std::string>>& result);

  // Queues 'frame' for the client if it is still connected. Stream chunks are dropped when the outbound buffer is
  // full.
  void sendFrame(int fd, uint64_t clientId, const RpcFrame& frame, bool streamChunk = false);

  void queueFrame(internal::ClientSession& session, const RpcFrame& frame, bool streamChunk = false);

  // Writes what the socket accepts. Returns false if the client has to be closed.
  bool flush(internal::ClientSession& session);

  ClientMap::iterator closeClient(ClientMap::iterator it, std::string_view reason);

  void closeListener() noexcept;

  // Shutdown steps, on the reactor thread.
  void beginShutdown();
  void finishShutdown();

  // Shutdown of a server whose reactor never ran.
  void completeWithoutReactor();

  void report(EventName name, std::string subject, std::optional<SysDuration> duration = {},
              std::optional<Error> error = {});

  CompanionConfig _config;
  std::shared_ptr<Target> _target;
  std::shared_ptr<TemporaryDirectory> _temporaryDirectory;
  std::shared_ptr<EventReporter> _reporter;
  DelayScheduler& _scheduler;
  CommandExecutor _executor;
  ContinuationRegistry _registry;
  std::shared_ptr<internal::ReactorMailbox> _mailbox;
  Promise<Void> _completed{"companion-server"};
  std::mutex _lifecycleMutex;
  std::atomic<ServerState> _state{ServerState::Constructed};
  std::atomic<uint16_t> _port{0};
  std::atomic<std::size_t> _nbClients{0};
  bool _shutdownRequested{false};
  bool _running{false};
  Socket _listenSocket;
  EventLoop _eventLoop;
  TimerFd _maintenanceTimer;
  ClientMap _clients;
  uint64_t _nextClientId{1};
  std::array<char, std::size_t{1} << 16> _readBuffer{};
  std::unique_ptr<TargetStateWatch> _targetWatch;
  std::jthread _reactor;
};

}  // namespace companion
