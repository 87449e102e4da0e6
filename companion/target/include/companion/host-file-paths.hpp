#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "companion/error.hpp"

namespace companion {

// Whole content of a host file. Throws FutureError (DeviceError with the errno code) on failure.
std::string ReadHostFile(const std::filesystem::path& path);

// Creates or replaces a host file. Throws FutureError (DeviceError with the errno code) on failure.
void WriteHostFile(const std::filesystem::path& path, std::string_view content);

// Last component of a target path, ignoring trailing '/'.
std::string_view TargetBaseName(std::string_view path);

// 'directory' + '/' + 'name', without doubling the separator.
std::string JoinTargetPath(std::string_view directory, std::string_view name);

}  // namespace companion
