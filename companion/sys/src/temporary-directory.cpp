#include "companion/temporary-directory.hpp"

#include <spdlog/fmt/fmt.h>
#include <stdlib.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "companion/errno-throw.hpp"
#include "companion/log.hpp"

namespace companion {

TemporaryDirectory::TemporaryDirectory(const std::filesystem::path& parent, std::string_view prefix) {
  std::filesystem::path base = parent;
  if (base.empty()) {
    base = std::filesystem::temp_directory_path();
  }
  std::string pattern = (base / fmt::format("{}.XXXXXX", prefix)).string();
  if (::mkdtemp(pattern.data()) == nullptr) {
    throw_errno("Unable to create a temporary directory from pattern {}", pattern);
  }
  _path = std::move(pattern);
  log::debug("Temporary directory {} created", _path.string());
}

std::filesystem::path TemporaryDirectory::newPath(std::string_view name) {
  return _path / fmt::format("{}-{}", _nextId++, name);
}

void TemporaryDirectory::remove() noexcept {
  if (_removed.exchange(true)) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(_path, ec);
  if (ec) {
    log::error("Unable to remove temporary directory {}: {}", _path.string(), ec.message());
  } else {
    log::debug("Temporary directory {} removed", _path.string());
  }
}

}  // namespace companion
