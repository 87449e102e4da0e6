#include "companion/future.hpp"

#include <string_view>

namespace companion {

std::string_view FutureStateName(FutureState state) noexcept {
  switch (state) {
    case FutureState::Pending:
      return "Pending";
    case FutureState::Succeeded:
      return "Succeeded";
    case FutureState::Failed:
      return "Failed";
    case FutureState::Cancelled:
      return "Cancelled";
    default:
      return "Unknown";
  }
}

}  // namespace companion
