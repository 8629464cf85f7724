#include "internal/model/state_machine.hpp"

#include <cassert>
#include <iostream>

namespace {

using scout::model::CanTransition;
using scout::model::IsTerminal;
using scout::model::RunState;

constexpr RunState kOrder[] = {RunState::kIdle,    RunState::kSeeding,   RunState::kProbing, RunState::kMerging,
                               RunState::kScoring, RunState::kFiltering, RunState::kDone};

void TestOnlyNextStageIsAllowed() {
  for (auto from : kOrder) {
    for (auto to : kOrder) {
      const bool expected = static_cast<int>(to) == static_cast<int>(from) + 1;
      assert(CanTransition(from, to) == expected);
    }
  }
}

void TestDoneIsTerminal() {
  assert(IsTerminal(RunState::kDone));
  assert(!IsTerminal(RunState::kFiltering));
  for (auto to : kOrder) {
    assert(!CanTransition(RunState::kDone, to));
  }
}

void TestNoSkipping() {
  static_assert(!CanTransition(RunState::kSeeding, RunState::kMerging));
  static_assert(!CanTransition(RunState::kIdle, RunState::kDone));
  static_assert(CanTransition(RunState::kFiltering, RunState::kDone));
}

} // namespace

int main() {
  TestOnlyNextStageIsAllowed();
  TestDoneIsTerminal();
  TestNoSkipping();

  std::cout << "device_scout_unit_state_machine: pass\n";
  return 0;
}
