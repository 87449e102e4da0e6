#include "companion/host-file-commands.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "companion/error.hpp"
#include "companion/future.hpp"
#include "companion/host-file-paths.hpp"
#include "companion/log.hpp"

namespace companion {

namespace fs = std::filesystem;

namespace {

Error FileSystemError(const std::error_code& ec, std::string_view operation, const fs::path& path) {
  return {ErrorKind::DeviceError, fmt::format("unable to {} {}: {}", operation, path.string(), ec.message()),
          ec.value()};
}

Error MissingPathError(std::string_view operation, const fs::path& path) {
  return FileSystemError(std::make_error_code(std::errc::no_such_file_or_directory), operation, path);
}

}  // namespace

HostFileCommands::HostFileCommands(fs::path root) : _root(fs::absolute(root).lexically_normal()) {
  if (!_root.has_filename() && _root.has_parent_path() && _root != _root.root_path()) {
    _root = _root.parent_path();
  }
}

std::expected<fs::path, Error> HostFileCommands::resolve(std::string_view path) const {
  while (!path.empty() && path.front() == '/') {
    path.remove_prefix(1);
  }
  fs::path candidate = (_root / path).lexically_normal();
  const fs::path relative = candidate.lexically_relative(_root);
  if (relative.empty() || *relative.begin() == "..") {
    return std::unexpected(Error(ErrorKind::InvalidArgument, fmt::format("path {} escapes the container", path)));
  }
  if (!candidate.has_filename() && candidate != _root) {
    candidate = candidate.parent_path();
  }
  return candidate;
}

Future<std::vector<std::string>> HostFileCommands::listPath(std::string path) {
  auto directory = resolve(path);
  if (!directory) {
    return Future<std::vector<std::string>>::Failed(directory.error());
  }
  std::error_code ec;
  fs::directory_iterator it(*directory, ec);
  if (ec) {
    return Future<std::vector<std::string>>::Failed(FileSystemError(ec, "list", *directory));
  }
  std::vector<std::string> entries;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    entries.push_back(it->path().filename().string());
  }
  if (ec) {
    return Future<std::vector<std::string>>::Failed(FileSystemError(ec, "list", *directory));
  }
  std::ranges::sort(entries);
  return Future<std::vector<std::string>>::Resolved(std::move(entries));
}

Future<fs::path> HostFileCommands::pull(std::string path, fs::path hostDestination) {
  auto source = resolve(path);
  if (!source) {
    return Future<fs::path>::Failed(source.error());
  }
  std::error_code ec;
  if (fs::is_directory(*source, ec)) {
    return Future<fs::path>::Failed(
        FileSystemError(std::make_error_code(std::errc::is_a_directory), "pull", *source));
  }
  fs::copy_file(*source, hostDestination, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    return Future<fs::path>::Failed(FileSystemError(ec, "pull", *source));
  }
  log::debug("Pulled {} to {}", source->string(), hostDestination.string());
  return Future<fs::path>::Resolved(std::move(hostDestination));
}

Future<Void> HostFileCommands::push(fs::path hostSource, std::string destinationDirectory) {
  auto directory = resolve(destinationDirectory);
  if (!directory) {
    return Future<Void>::Failed(directory.error());
  }
  std::error_code ec;
  if (!fs::is_directory(*directory, ec)) {
    return Future<Void>::Failed(MissingPathError("push to", *directory));
  }
  const fs::path destination = *directory / hostSource.filename();
  fs::copy_file(hostSource, destination, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    return Future<Void>::Failed(FileSystemError(ec, "push", hostSource));
  }
  log::debug("Pushed {} to {}", hostSource.string(), destination.string());
  return Future<Void>::Resolved();
}

Future<Void> HostFileCommands::remove(std::vector<std::string> paths) {
  for (const std::string& path : paths) {
    auto target = resolve(path);
    if (!target) {
      return Future<Void>::Failed(target.error());
    }
    if (*target == _root) {
      return Future<Void>::Failed(Error(ErrorKind::InvalidArgument, "the container root cannot be removed"));
    }
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(*target, ec))) {
      return Future<Void>::Failed(MissingPathError("remove", *target));
    }
    fs::remove_all(*target, ec);
    if (ec) {
      return Future<Void>::Failed(FileSystemError(ec, "remove", *target));
    }
  }
  return Future<Void>::Resolved();
}

Future<Void> HostFileCommands::move(std::vector<std::string> sources, std::string destinationDirectory) {
  auto directory = resolve(destinationDirectory);
  if (!directory) {
    return Future<Void>::Failed(directory.error());
  }
  for (const std::string& sourcePath : sources) {
    auto source = resolve(sourcePath);
    if (!source) {
      return Future<Void>::Failed(source.error());
    }
    std::error_code ec;
    fs::rename(*source, *directory / std::string(TargetBaseName(sourcePath)), ec);
    if (ec) {
      return Future<Void>::Failed(FileSystemError(ec, "move", *source));
    }
  }
  return Future<Void>::Resolved();
}

Future<Void> HostFileCommands::makeDirectory(std::string path) {
  auto directory = resolve(path);
  if (!directory) {
    return Future<Void>::Failed(directory.error());
  }
  std::error_code ec;
  fs::create_directories(*directory, ec);
  if (ec) {
    return Future<Void>::Failed(FileSystemError(ec, "create directory", *directory));
  }
  return Future<Void>::Resolved();
}

}  // namespace companion
