#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "internal/classify/iot_classifier.hpp"
#include "internal/merge/device_table.hpp"
#include "internal/model/device_record.hpp"
#include "internal/model/probe_kind.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/probe/probe.hpp"
#include "internal/scoring/confidence_scorer.hpp"
#include "internal/util/time.hpp"

namespace scout::core {

enum class ProbeStatus {
  kCompleted,
  kTimedOut,
  kUnavailable,
  kDisabled,
  kFailed,
};

std::string_view Name(ProbeStatus status);

struct ProbeSummary {
  std::string               name;
  model::ProbeKind          kind{model::ProbeKind::kActiveScan};
  ProbeStatus               status{ProbeStatus::kDisabled};
  std::size_t               results = 0;
  std::chrono::milliseconds elapsed{0};
  std::string               detail;
};

/*
  How the overall timeout is split between stages.

    seeding      [0, seed_share)
    probing      [seed end, 1 - fingerprint_share)
    fingerprint  [probing end, 1)

  A probe still running overrun_grace after its stage deadline is
  abandoned: the run stops waiting for it and anything it emits later
  is dropped. Its thread is joined by a later run once it has finished,
  or by the orchestrator's destructor.
*/
struct BudgetPolicy {
  double                    seed_share        = 0.34;
  double                    fingerprint_share = 0.33;
  std::chrono::milliseconds overrun_grace{500};
};

struct DiscoveryRequest {
  std::string               network_range;
  std::chrono::milliseconds timeout{30000};
  std::set<model::ProbeKind> disabled;

  // Drop evidence about addresses outside network_range.
  bool restrict_to_range = false;
};

struct DiscoveryOutcome {
  std::string scan_range;

  // Classified records only, sealed and scored.
  std::map<std::string, model::DeviceRecord> devices;
  std::size_t                                total_records = 0;

  std::vector<ProbeSummary> probes;
  model::RunState           final_state{model::RunState::kIdle};

  util::TimePoint           started_at;
  util::TimePoint           finished_at;
  std::chrono::milliseconds elapsed{0};

  std::size_t HighConfidenceCount(double threshold = 0.7) const;
};

/*
  Runs one discovery pass end to end.

    Idle -> Seeding -> Probing -> Merging -> Scoring -> Filtering -> Done

  Every stage is entered on every run, even when there is nothing to do.
  Probe capabilities are checked once, here in the constructor, and the
  answers are reused by every run. Nothing inside a run throws: probe
  failures and budget exhaustion end up in the probe summaries.
*/
class DiscoveryOrchestrator {
 public:
  DiscoveryOrchestrator(std::vector<std::shared_ptr<probe::Probe>> probes, scoring::ConfidenceScorer scorer, classify::IotClassifier classifier,
                        BudgetPolicy policy = {});

  // Waits for abandoned probe threads.
  ~DiscoveryOrchestrator();

  DiscoveryOrchestrator(const DiscoveryOrchestrator&)            = delete;
  DiscoveryOrchestrator& operator=(const DiscoveryOrchestrator&) = delete;

  // Throws util::InvalidArgument when the range does not parse.
  DiscoveryOutcome Run(const DiscoveryRequest& request);

  model::RunState State() const {
    return state_.load();
  }

  // Resolved at construction. Unknown kinds report unavailable.
  probe::Capability CapabilityOf(model::ProbeKind kind) const;

 private:
  struct Slot {
    std::shared_ptr<probe::Probe>     probe;
    probe::Capability                 capability;
    std::shared_ptr<std::atomic<bool>> busy;
  };

  struct StageContext {
    std::shared_ptr<merge::DeviceTable>   table;
    std::optional<net::NetworkRange>      restrict_to;
    std::map<model::ProbeKind, ProbeSummary>* summaries = nullptr;
  };

  // A probe thread the run stopped waiting for.
  struct Abandoned;

  void Transition(model::RunState next);

  // Joins abandoned threads that have finished since.
  void ReapAbandoned();

  // Runs the slots concurrently, each on its own thread, and waits up to deadline + grace.
  void RunStage(std::string_view stage, const std::vector<Slot*>& slots, const probe::ProbeTarget& target, const util::Deadline& deadline,
                StageContext& context);

  std::vector<Slot>         slots_;
  scoring::ConfidenceScorer scorer_;
  classify::IotClassifier   classifier_;
  BudgetPolicy              policy_;

  std::vector<Abandoned> abandoned_;

  std::mutex                   run_mutex_;
  std::atomic<model::RunState> state_{model::RunState::kIdle};
};

} // namespace scout::core
