#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "companion/future.hpp"

namespace companion {

// File operations on the data container of a target. Target paths are relative to the container root, a leading
// '/' being optional.
class FileCommands {
 public:
  virtual ~FileCommands() = default;

  // Entry names of a directory.
  virtual Future<std::vector<std::string>> listPath(std::string path) = 0;

  // Copies the target file 'path' to 'hostDestination', replacing it. Resolves with 'hostDestination'.
  virtual Future<std::filesystem::path> pull(std::string path, std::filesystem::path hostDestination) = 0;

  // Copies the host file 'hostSource' into the target directory 'destinationDirectory', keeping its file name.
  virtual Future<Void> push(std::filesystem::path hostSource, std::string destinationDirectory) = 0;

  // Removes files and directories, recursively.
  virtual Future<Void> remove(std::vector<std::string> paths) = 0;

  // Moves each of 'sources' into the target directory 'destinationDirectory'.
  virtual Future<Void> move(std::vector<std::string> sources, std::string destinationDirectory) = 0;

  // Creates a directory and its missing parents.
  virtual Future<Void> makeDirectory(std::string path) = 0;
};

}  // namespace companion
