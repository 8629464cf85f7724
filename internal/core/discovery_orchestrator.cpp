#include "discovery_orchestrator.hpp"

#include <algorithm>
#include <condition_variable>
#include <thread>

#include "internal/merge/evidence_merger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace scout::core {

using model::ProbeKind;
using model::RunState;
using observability::IntField;
using observability::StringField;

namespace {

/*
  Feeds one probe's results into the run's device table.

  Close() waits for an in-flight Emit and turns every later one into a
  no-op, so nothing reaches the table once scoring has started.
*/
class MergingSink : public probe::ResultSink {
 public:
  MergingSink(std::shared_ptr<merge::DeviceTable> table, std::optional<net::NetworkRange> restrict_to)
      : table_(std::move(table)), restrict_to_(std::move(restrict_to)) {
  }

  void Emit(model::ProbeResult result) override {
    std::lock_guard lock(mutex_);
    if (closed_) {
      ++dropped_;
      return;
    }
    if (result.address.empty()) {
      SCOUT_LOG_DEBUG("dropping result without address", {StringField("probe", model::Name(result.kind))});
      return;
    }
    if (restrict_to_ && !restrict_to_->Contains(result.address)) {
      return;
    }
    table_->Apply(std::make_shared<const model::ProbeResult>(std::move(result)));
    ++accepted_;
  }

  void Close() {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }

  std::size_t Accepted() const {
    std::lock_guard lock(mutex_);
    return accepted_;
  }

 private:
  mutable std::mutex                  mutex_;
  std::shared_ptr<merge::DeviceTable> table_;
  std::optional<net::NetworkRange>    restrict_to_;
  bool                                closed_   = false;
  std::size_t                         accepted_ = 0;
  std::size_t                         dropped_  = 0;
};

// Shared between the orchestrator and a probe thread that may outlive the wait.
struct ProbeRun {
  std::mutex              mutex;
  std::condition_variable cv;
  bool                    finished = false;
  ProbeStatus             status   = ProbeStatus::kCompleted;
  std::string             detail;
  util::SteadyTimePoint   started;
  util::SteadyTimePoint   ended;
};

std::chrono::milliseconds Share(std::chrono::milliseconds total, double share) {
  return std::chrono::milliseconds(static_cast<std::int64_t>(static_cast<double>(total.count()) * share));
}

} // namespace

struct DiscoveryOrchestrator::Abandoned {
  std::string               probe;
  std::shared_ptr<ProbeRun> run;
  std::thread               thread;
};

std::string_view Name(ProbeStatus status) {
  switch (status) {
    case ProbeStatus::kCompleted:
      return "completed";
    case ProbeStatus::kTimedOut:
      return "timed_out";
    case ProbeStatus::kUnavailable:
      return "unavailable";
    case ProbeStatus::kDisabled:
      return "disabled";
    case ProbeStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

std::size_t DiscoveryOutcome::HighConfidenceCount(double threshold) const {
  return static_cast<std::size_t>(
      std::count_if(devices.begin(), devices.end(), [&](const auto& entry) { return entry.second.confidence_score > threshold; }));
}

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------

DiscoveryOrchestrator::DiscoveryOrchestrator(std::vector<std::shared_ptr<probe::Probe>> probes, scoring::ConfidenceScorer scorer,
                                             classify::IotClassifier classifier, BudgetPolicy policy)
    : scorer_(std::move(scorer)), classifier_(std::move(classifier)), policy_(policy) {
  if (policy_.seed_share < 0 || policy_.fingerprint_share < 0 || policy_.seed_share + policy_.fingerprint_share >= 1.0) {
    throw util::InvalidArgument("budget shares must be non-negative and sum below 1");
  }

  std::set<ProbeKind> seen;
  for (auto& probe : probes) {
    if (!probe) {
      throw util::InvalidArgument("null probe");
    }
    if (!seen.insert(probe->Kind()).second) {
      throw util::InvalidArgument("probe registered twice: " + std::string(probe->Name()));
    }

    Slot slot;
    slot.probe      = std::move(probe);
    slot.capability = slot.probe->CheckCapability();
    slot.busy       = std::make_shared<std::atomic<bool>>(false);
    if (!slot.capability.available) {
      SCOUT_LOG_WARN("probe unavailable", {StringField("probe", slot.probe->Name()), StringField("reason", slot.capability.reason)});
    }
    slots_.push_back(std::move(slot));
  }
  std::sort(slots_.begin(), slots_.end(), [](const Slot& a, const Slot& b) { return a.probe->Kind() < b.probe->Kind(); });
}

DiscoveryOrchestrator::~DiscoveryOrchestrator() {
  std::lock_guard run_lock(run_mutex_);
  ReapAbandoned();
  for (auto& entry : abandoned_) {
    SCOUT_LOG_INFO("waiting for abandoned probe", {StringField("probe", entry.probe)});
    entry.thread.join();
  }
}

void DiscoveryOrchestrator::ReapAbandoned() {
  auto finished = [](Abandoned& entry) {
    std::lock_guard lock(entry.run->mutex);
    return entry.run->finished;
  };
  for (auto it = abandoned_.begin(); it != abandoned_.end();) {
    if (finished(*it)) {
      it->thread.join();
      it = abandoned_.erase(it);
    } else {
      ++it;
    }
  }
}

probe::Capability DiscoveryOrchestrator::CapabilityOf(ProbeKind kind) const {
  for (const auto& slot : slots_) {
    if (slot.probe->Kind() == kind) {
      return slot.capability;
    }
  }
  return probe::Capability::Unavailable("not registered");
}

void DiscoveryOrchestrator::Transition(RunState next) {
  const auto current = state_.load();
  if (!model::CanTransition(current, next)) {
    throw util::InvalidState("illegal run state transition " + std::string(model::Name(current)) + " -> " + std::string(model::Name(next)));
  }
  state_ = next;
  SCOUT_LOG_DEBUG("discovery stage", {StringField("state", model::Name(next))});
}

// ------------------------------------------------------------
// Run
// ------------------------------------------------------------

DiscoveryOutcome DiscoveryOrchestrator::Run(const DiscoveryRequest& request) {
  std::lock_guard run_lock(run_mutex_);
  ReapAbandoned();

  auto range = net::NetworkRange::Parse(request.network_range);

  observability::SpanScope span("discovery.run");
  span.SetAttribute("scan.range", range.Expression());

  DiscoveryOutcome outcome;
  outcome.scan_range = range.Expression();
  outcome.started_at = util::Now();

  state_         = RunState::kIdle;
  const auto t0  = util::SteadyNow();
  const auto all = util::Deadline::After(request.timeout);

  std::map<ProbeKind, ProbeSummary> summaries;
  std::vector<Slot*>                seeders, concurrent, fingerprinters;
  for (auto& slot : slots_) {
    auto& summary = summaries[slot.probe->Kind()];
    summary.name  = std::string(slot.probe->Name());
    summary.kind  = slot.probe->Kind();

    if (request.disabled.count(slot.probe->Kind()) > 0) {
      summary.status = ProbeStatus::kDisabled;
      continue;
    }
    if (!slot.capability.available) {
      summary.status = ProbeStatus::kUnavailable;
      summary.detail = slot.capability.reason;
      continue;
    }
    if (slot.probe->SeedsHostSet()) {
      seeders.push_back(&slot);
    } else if (slot.probe->RequiresKnownHosts()) {
      fingerprinters.push_back(&slot);
    } else {
      concurrent.push_back(&slot);
    }
  }

  StageContext context;
  context.table     = std::make_shared<merge::DeviceTable>();
  context.summaries = &summaries;
  if (request.restrict_to_range) {
    context.restrict_to = range;
  }

  probe::ProbeTarget target;
  target.range = range;

  // Seeding: an empty host set is fine, passive probes can still find devices.
  Transition(RunState::kSeeding);
  {
    const auto deadline = all.Min(util::Deadline::At(t0 + Share(request.timeout, policy_.seed_share)));
    RunStage("seeding", seeders, target, deadline, context);
  }

  Transition(RunState::kProbing);
  {
    target.known_addresses = context.table->Addresses();
    const auto deadline    = all.Min(util::Deadline::At(t0 + Share(request.timeout, 1.0 - policy_.fingerprint_share)));
    RunStage("probing", concurrent, target, deadline, context);

    target.known_addresses = context.table->Addresses();
    RunStage("fingerprint", fingerprinters, target, all, context);
  }

  // Results are merged as they stream in; this stage only stops the stream.
  Transition(RunState::kMerging);
  outcome.total_records = context.table->Size();

  Transition(RunState::kScoring);
  context.table->ForEach([&](model::DeviceRecord& record) {
    record.confidence_score  = scorer_.Score(record);
    record.discovery_elapsed = util::ToMillis(util::SteadyNow() - t0);
    record.sealed            = true;
  });

  Transition(RunState::kFiltering);
  for (auto& [address, record] : context.table->Snapshot()) {
    if (classifier_.IsRelevant(record)) {
      outcome.devices.emplace(address, std::move(record));
    }
  }

  Transition(RunState::kDone);
  outcome.final_state = state_.load();
  outcome.finished_at = util::Now();
  outcome.elapsed     = util::ToMillis(util::SteadyNow() - t0);
  for (auto& [kind, summary] : summaries) {
    outcome.probes.push_back(std::move(summary));
  }

  observability::Metrics::Instance().ObserveRunDurationMs(static_cast<double>(outcome.elapsed.count()));
  observability::Metrics::Instance().SetDevicesFound(outcome.devices.size(), outcome.total_records);
  span.SetAttribute("devices.total", static_cast<std::int64_t>(outcome.total_records));
  span.SetAttribute("devices.relevant", static_cast<std::int64_t>(outcome.devices.size()));

  SCOUT_LOG_INFO("discovery finished", {StringField("range", outcome.scan_range), IntField("records", static_cast<std::int64_t>(outcome.total_records)),
                                        IntField("relevant", static_cast<std::int64_t>(outcome.devices.size())),
                                        IntField("elapsed_ms", outcome.elapsed.count())});
  return outcome;
}

// ------------------------------------------------------------
// Stages
// ------------------------------------------------------------

void DiscoveryOrchestrator::RunStage(std::string_view stage, const std::vector<Slot*>& slots, const probe::ProbeTarget& target,
                                     const util::Deadline& deadline, StageContext& context) {
  if (slots.empty()) {
    return;
  }
  observability::SpanScope span("discovery." + std::string(stage));

  struct Launched {
    Slot*                        slot;
    std::shared_ptr<MergingSink> sink;
    std::shared_ptr<ProbeRun>    run;
    std::thread                  thread;
  };
  std::vector<Launched> launched;

  for (auto* slot : slots) {
    auto& summary = (*context.summaries)[slot->probe->Kind()];
    if (slot->busy->exchange(true)) {
      summary.status = ProbeStatus::kFailed;
      summary.detail = "still running from an earlier run";
      continue;
    }

    auto sink = std::make_shared<MergingSink>(context.table, context.restrict_to);
    auto run  = std::make_shared<ProbeRun>();
    run->started = util::SteadyNow();

    std::thread thread([probe = slot->probe, busy = slot->busy, sink, run, target, deadline] {
      ProbeStatus status = ProbeStatus::kCompleted;
      std::string detail;
      {
        observability::SpanScope probe_span("probe." + std::string(probe->Name()));
        try {
          probe->Run(target, deadline, *sink);
          if (deadline.Expired()) {
            status = ProbeStatus::kTimedOut;
            detail = "stage budget exhausted";
          }
        } catch (const util::CapabilityUnavailable& e) {
          status = ProbeStatus::kUnavailable;
          detail = e.what();
        } catch (const util::ProbeTimeout& e) {
          status = ProbeStatus::kTimedOut;
          detail = e.what();
        } catch (const std::exception& e) {
          status = ProbeStatus::kFailed;
          detail = e.what();
          probe_span.RecordException(detail);
        }
      }
      busy->store(false);
      {
        std::lock_guard lock(run->mutex);
        run->finished = true;
        run->status   = status;
        run->detail   = std::move(detail);
        run->ended    = util::SteadyNow();
      }
      run->cv.notify_all();
    });
    launched.push_back({slot, std::move(sink), std::move(run), std::move(thread)});
  }

  const auto give_up = deadline.IsNever() ? util::Deadline::Never() : util::Deadline::At(deadline.When() + policy_.overrun_grace);

  for (auto& entry : launched) {
    auto& summary = (*context.summaries)[entry.slot->probe->Kind()];

    bool finished = false;
    {
      std::unique_lock lock(entry.run->mutex);
      if (give_up.IsNever()) {
        entry.run->cv.wait(lock, [&] { return entry.run->finished; });
        finished = true;
      } else {
        finished = entry.run->cv.wait_until(lock, give_up.When(), [&] { return entry.run->finished; });
      }
      if (finished) {
        summary.status  = entry.run->status;
        summary.detail  = entry.run->detail;
        summary.elapsed = util::ToMillis(entry.run->ended - entry.run->started);
      }
    }

    if (finished) {
      entry.thread.join();
    } else {
      entry.sink->Close();
      abandoned_.push_back({summary.name, entry.run, std::move(entry.thread)});
      summary.status  = ProbeStatus::kTimedOut;
      summary.detail  = "abandoned after stage deadline";
      summary.elapsed = util::ToMillis(util::SteadyNow() - entry.run->started);
      SCOUT_LOG_WARN("probe overran its budget", {StringField("probe", summary.name), StringField("stage", stage)});
    }
    entry.sink->Close();
    summary.results = entry.sink->Accepted();

    auto& metrics = observability::Metrics::Instance();
    metrics.RecordProbeRun(summary.name, Name(summary.status));
    metrics.ObserveProbeDurationMs(summary.name, static_cast<double>(summary.elapsed.count()));
    metrics.AddProbeResults(summary.name, summary.results);

    SCOUT_LOG_INFO("probe finished", {StringField("probe", summary.name), StringField("status", Name(summary.status)),
                                      IntField("results", static_cast<std::int64_t>(summary.results)), IntField("elapsed_ms", summary.elapsed.count())});
  }
}

} // namespace scout::core
