#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string_view>

namespace companion {

// RAII unique scratch directory, removed with its content on destruction.
class TemporaryDirectory {
 public:
  // Creates '<parent>/<prefix>.XXXXXX'. The system temporary directory is used when 'parent' is empty.
  // Throws std::system_error on failure.
  explicit TemporaryDirectory(const std::filesystem::path& parent = {}, std::string_view prefix = "companion");

  TemporaryDirectory(const TemporaryDirectory&) = delete;
  TemporaryDirectory(TemporaryDirectory&&) = delete;
  TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
  TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

  ~TemporaryDirectory() { remove(); }

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return _path; }

  // Fresh path inside the directory, ending with 'name'. Nothing is created. Thread safe.
  [[nodiscard]] std::filesystem::path newPath(std::string_view name);

  // Removes the directory and its content. Idempotent.
  void remove() noexcept;

  [[nodiscard]] bool removed() const noexcept { return _removed.load(); }

 private:
  std::filesystem::path _path;
  std::atomic<uint64_t> _nextId{0};
  std::atomic<bool> _removed{false};
};

}  // namespace companion
