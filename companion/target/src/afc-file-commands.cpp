#include "companion/afc-file-commands.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "companion/error.hpp"
#include "companion/future-combinators.hpp"
#include "companion/future.hpp"
#include "companion/host-file-paths.hpp"
#include "companion/log.hpp"

namespace companion {

namespace {

Future<Void> AllDone(std::vector<Future<Void>> operations) { return AwaitAll(std::move(operations)).discardValue(); }

}  // namespace

Future<std::vector<std::string>> AfcFileCommands::listPath(std::string path) { return _client.readDirectory(path); }

Future<std::filesystem::path> AfcFileCommands::pull(std::string path, std::filesystem::path hostDestination) {
  log::debug("Pulling {} to {}", path, hostDestination.string());
  return _client.readFile(path).map([hostDestination = std::move(hostDestination)](const std::string& content) {
    WriteHostFile(hostDestination, content);
    return hostDestination;
  });
}

Future<Void> AfcFileCommands::push(std::filesystem::path hostSource, std::string destinationDirectory) {
  std::string content;
  try {
    content = ReadHostFile(hostSource);
  } catch (const FutureError& ex) {
    return Future<Void>::Failed(ex.error());
  }
  std::string destination = JoinTargetPath(destinationDirectory, hostSource.filename().string());
  log::debug("Pushing {} ({} bytes) to {}", hostSource.string(), content.size(), destination);
  return _client.writeFile(destination, std::move(content));
}

Future<Void> AfcFileCommands::remove(std::vector<std::string> paths) {
  std::vector<Future<Void>> removals;
  removals.reserve(paths.size());
  for (const std::string& path : paths) {
    removals.push_back(_client.removePathAndContents(path));
  }
  return AllDone(std::move(removals));
}

Future<Void> AfcFileCommands::move(std::vector<std::string> sources, std::string destinationDirectory) {
  std::vector<Future<Void>> renames;
  renames.reserve(sources.size());
  for (const std::string& source : sources) {
    renames.push_back(_client.renamePath(source, JoinTargetPath(destinationDirectory, TargetBaseName(source))));
  }
  return AllDone(std::move(renames));
}

Future<Void> AfcFileCommands::makeDirectory(std::string path) { return _client.makeDirectory(path); }

}  // namespace companion
