#include "companion/target.hpp"

#include <string>
#include <string_view>

#include "companion/json-serializer.hpp"

namespace {

struct TargetDescription {
  std::string_view udid;
  std::string_view name;
  std::string_view type;
  std::string_view state;
};

}  // namespace

template <>
struct glz::meta<TargetDescription> {
  using T = TargetDescription;
  static constexpr auto value = glz::object("udid", &T::udid, "name", &T::name, "type", &T::type, "state", &T::state);
};

namespace companion {

std::string_view TargetTypeName(TargetType type) noexcept {
  switch (type) {
    case TargetType::Device:
      return "Device";
    case TargetType::Simulator:
      return "Simulator";
    default:
      return "Unknown";
  }
}

std::string_view TargetStateName(TargetState state) noexcept {
  switch (state) {
    case TargetState::Booted:
      return "Booted";
    case TargetState::Offline:
      return "Offline";
    default:
      return "Unknown";
  }
}

std::string Target::description() const {
  return SerializeToJson(TargetDescription{_udid, _name, TargetTypeName(type()), TargetStateName(state())});
}

}  // namespace companion
