#include "companion/host-file-paths.hpp"

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

#include "companion/error.hpp"

namespace companion {

std::string ReadHostFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw FutureError(
        Error(ErrorKind::DeviceError, fmt::format("unable to open {} for reading", path.string()), errno));
  }
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw FutureError(Error(ErrorKind::DeviceError, fmt::format("error while reading {}", path.string()), errno));
  }
  return content;
}

void WriteHostFile(const std::filesystem::path& path, std::string_view content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw FutureError(
        Error(ErrorKind::DeviceError, fmt::format("unable to open {} for writing", path.string()), errno));
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.flush();
  if (!out) {
    throw FutureError(Error(ErrorKind::DeviceError, fmt::format("error while writing {}", path.string()), errno));
  }
}

std::string_view TargetBaseName(std::string_view path) {
  while (path.size() > 1 && path.back() == '/') {
    path.remove_suffix(1);
  }
  const auto pos = path.rfind('/');
  return pos == std::string_view::npos ? path : path.substr(pos + 1);
}

std::string JoinTargetPath(std::string_view directory, std::string_view name) {
  std::string ret(directory);
  if (ret.empty() || ret.back() != '/') {
    ret.push_back('/');
  }
  while (!name.empty() && name.front() == '/') {
    name.remove_prefix(1);
  }
  ret.append(name);
  return ret;
}

}  // namespace companion
