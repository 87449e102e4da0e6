#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "companion/cli-options.hpp"
#include "companion/companion-server.hpp"
#include "companion/delay-scheduler.hpp"
#include "companion/event-reporter.hpp"
#include "companion/future.hpp"
#include "companion/json-serializer.hpp"
#include "companion/log.hpp"
#include "companion/logging-config.hpp"
#include "companion/signal-handler.hpp"
#include "companion/target.hpp"
#include "companion/temporary-directory.hpp"

namespace {

// First line of the standard output, read by the launcher of the companion.
struct PortAnnouncement {
  uint16_t port;
};

}  // namespace

template <>
struct glz::meta<PortAnnouncement> {
  using T = PortAnnouncement;
  static constexpr auto value = glz::object("port", &T::port);
};

namespace {

constexpr std::chrono::milliseconds kSignalCheckInterval{100};

int Run(const companion::CliOptions& options) {
  using namespace companion;

  auto target = options.createTarget();
  DelayScheduler scheduler;
  auto temporaryDirectory = std::make_shared<TemporaryDirectory>(options.temporaryDirectory);
  auto reporter = std::make_shared<LogEventReporter>();
  reporter->addMetadata("udid", target->udid());
  reporter->addMetadata("target_type", std::string(TargetTypeName(target->type())));
  reporter->report(EventSubject{EventName::Launched, target->name(), {}, {}});

  auto server = CompanionServer::Create(target, temporaryDirectory, scheduler, options.companion, reporter);
  if (!server) {
    log::critical("Unable to create the companion server: {}", server.error().describe());
    return EXIT_FAILURE;
  }
  auto port = (*server)->start();
  if (port.state() != FutureState::Succeeded) {
    log::critical("Unable to start the companion server: {}", port.error().describe());
    return EXIT_FAILURE;
  }
  std::cout << SerializeToJson(PortAnnouncement{port.value()}) << std::endl;

  const Future<Void> completed = (*server)->completed();
  while (!completed.waitFor(kSignalCheckInterval)) {
    if (SignalHandler::IsStopRequested()) {
      log::warn("Received signal {}, shutting down the companion (a second signal terminates it)",
                SignalHandler::ReceivedSignal());
      (void)(*server)->shutdown();
      completed.wait();
      break;
    }
  }
  return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
  companion::CliOptions options;
  try {
    options = companion::CliOptions::Parse(argc, argv);
  } catch (const std::invalid_argument& ex) {
    std::cerr << "Error: " << ex.what() << "\n\n" << companion::CliUsage(argv[0]);
    return EXIT_FAILURE;
  }
  if (options.help) {
    std::cout << companion::CliUsage(argv[0]);
    return EXIT_SUCCESS;
  }

  companion::SetupLogging(options.logging);
  companion::SignalHandler::Enable();

  try {
    return Run(options);
  } catch (const std::exception& ex) {
    companion::log::critical("Companion failed: {}", ex.what());
    return EXIT_FAILURE;
  }
}
