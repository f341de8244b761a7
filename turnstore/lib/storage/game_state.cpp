#include "game_state.hpp"

#include <limits>
#include <stdexcept>

namespace turnstore {
std::int64_t stateIdOf(const GameState &state) {
  auto it = state.find(kStateIdField);
  if (it == state.end()) {
    return 0;
  }
  const json::value &value = it->value();
  if (const auto *signedId = value.if_int64()) {
    return *signedId;
  }
  if (const auto *unsignedId = value.if_uint64()) {
    if (*unsignedId >
        static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      throw std::invalid_argument("_stateID is out of range");
    }
    return static_cast<std::int64_t>(*unsignedId);
  }
  throw std::invalid_argument("_stateID must be an integer, got: " +
                              json::serialize(value));
}

void stripIdentity(GameState &state) { state.erase(kIdentityField); }
} // namespace turnstore
