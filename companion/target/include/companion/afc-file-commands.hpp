#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "companion/afc-client.hpp"
#include "companion/file-commands.hpp"
#include "companion/future.hpp"

namespace companion {

// FileCommands of a device, each command translated to AFC operations.
class AfcFileCommands : public FileCommands {
 public:
  explicit AfcFileCommands(AfcClient client) : _client(std::move(client)) {}

  Future<std::vector<std::string>> listPath(std::string path) override;

  Future<std::filesystem::path> pull(std::string path, std::filesystem::path hostDestination) override;

  Future<Void> push(std::filesystem::path hostSource, std::string destinationDirectory) override;

  Future<Void> remove(std::vector<std::string> paths) override;

  Future<Void> move(std::vector<std::string> sources, std::string destinationDirectory) override;

  Future<Void> makeDirectory(std::string path) override;

  [[nodiscard]] const AfcClient& client() const noexcept { return _client; }

 private:
  AfcClient _client;
};

}  // namespace companion
