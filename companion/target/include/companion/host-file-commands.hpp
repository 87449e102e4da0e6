#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "companion/error.hpp"
#include "companion/file-commands.hpp"
#include "companion/future.hpp"

namespace companion {

// FileCommands of a simulator, on the host directory backing its data container.
// Target paths never escape the root. File system failures are reported as DeviceError with the errno code.
// Operations complete synchronously.
class HostFileCommands : public FileCommands {
 public:
  explicit HostFileCommands(std::filesystem::path root);

  Future<std::vector<std::string>> listPath(std::string path) override;

  Future<std::filesystem::path> pull(std::string path, std::filesystem::path hostDestination) override;

  Future<Void> push(std::filesystem::path hostSource, std::string destinationDirectory) override;

  Future<Void> remove(std::vector<std::string> paths) override;

  Future<Void> move(std::vector<std::string> sources, std::string destinationDirectory) override;

  Future<Void> makeDirectory(std::string path) override;

  // Host path of a target path. InvalidArgument if it would escape the root.
  [[nodiscard]] std::expected<std::filesystem::path, Error> resolve(std::string_view path) const;

  [[nodiscard]] const std::filesystem::path& root() const noexcept { return _root; }

 private:
  std::filesystem::path _root;
};

}  // namespace companion
