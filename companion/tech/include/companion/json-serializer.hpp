#pragma once

#include <glaze/glaze.hpp>  // IWYU pragma: export
#include <string>

namespace companion {

// JSON of 'obj', which glaze must know how to write (glz::meta specialization or reflectable aggregate).
// Empty string if serialization fails.
template <typename T>
[[nodiscard]] inline std::string SerializeToJson(const T& obj) {
  return glz::write_json(obj).value_or(std::string{});
}

}  // namespace companion
