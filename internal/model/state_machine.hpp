#pragma once

#include <cstdint>
#include <string_view>

namespace scout::model {

enum class RunState : std::uint8_t {
  kIdle      = 0,
  kSeeding   = 1,
  kProbing   = 2,
  kMerging   = 3,
  kScoring   = 4,
  kFiltering = 5,
  kDone      = 6,
};

constexpr bool IsTerminal(RunState state) {
  return state == RunState::kDone;
}

// Strictly sequential: every stage is entered, none is skipped.
constexpr bool CanTransition(RunState from, RunState to) {
  if (IsTerminal(from)) {
    return false;
  }
  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

constexpr std::string_view Name(RunState state) {
  switch (state) {
    case RunState::kIdle:
      return "idle";
    case RunState::kSeeding:
      return "seeding";
    case RunState::kProbing:
      return "probing";
    case RunState::kMerging:
      return "merging";
    case RunState::kScoring:
      return "scoring";
    case RunState::kFiltering:
      return "filtering";
    case RunState::kDone:
      return "done";
  }
  return "unknown";
}

} // namespace scout::model
