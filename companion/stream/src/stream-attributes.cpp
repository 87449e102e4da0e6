#include "companion/stream-attributes.hpp"

#include <cmath>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "companion/json-serializer.hpp"

namespace companion {

StreamAttributes& StreamAttributes::set(std::string key, StreamAttributeValue value) {
  _entries.insert_or_assign(std::move(key), std::move(value));
  return *this;
}

const StreamAttributeValue* StreamAttributes::find(std::string_view key) const {
  auto it = _entries.find(key);
  return it == _entries.end() ? nullptr : &it->second;
}

std::string StreamAttributes::json_str() const {
  std::map<std::string_view, glz::raw_json> values;
  for (const auto& [key, value] : _entries) {
    std::string json = std::visit(
        [](const auto& val) -> std::string {
          if constexpr (std::is_same_v<std::decay_t<decltype(val)>, double>) {
            if (!std::isfinite(val)) {
              return "null";
            }
          }
          return SerializeToJson(val);
        },
        value);
    values.emplace(key, glz::raw_json{std::move(json)});
  }
  return SerializeToJson(values);
}

}  // namespace companion
