#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace companion {

using StreamAttributeValue = std::variant<std::string, int64_t, double>;

// Snapshot of the attributes of a stream, keys in lexicographic order.
class StreamAttributes {
 public:
  StreamAttributes& set(std::string key, StreamAttributeValue value);

  // nullptr if 'key' is not present.
  [[nodiscard]] const StreamAttributeValue* find(std::string_view key) const;

  [[nodiscard]] const std::map<std::string, StreamAttributeValue, std::less<>>& entries() const noexcept {
    return _entries;
  }

  [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

  [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }

  // JSON object of the attributes. Non finite floating point values are rendered as null.
  [[nodiscard]] std::string json_str() const;

  bool operator==(const StreamAttributes&) const = default;

 private:
  std::map<std::string, StreamAttributeValue, std::less<>> _entries;
};

}  // namespace companion
