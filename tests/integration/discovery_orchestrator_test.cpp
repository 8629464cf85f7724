#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/discovery_orchestrator.hpp"
#include "internal/util/errors.hpp"

namespace {

using scout::core::BudgetPolicy;
using scout::core::DiscoveryOrchestrator;
using scout::core::DiscoveryOutcome;
using scout::core::DiscoveryRequest;
using scout::core::ProbeStatus;
using scout::model::MakeProbeResult;
using scout::model::ProbeKind;
using scout::model::ProbeResult;
using scout::model::RunState;
using scout::probe::Capability;
using scout::probe::ProbeTarget;
using scout::probe::ResultSink;
using scout::util::Deadline;

using RunFn = std::function<void(const ProbeTarget&, const Deadline&, ResultSink&)>;

/*
  Scripted probe. Behaviour comes from a callback so each test can decide
  what is emitted and how long the run takes.
*/
class FakeProbe : public scout::probe::Probe {
 public:
  FakeProbe(ProbeKind kind, RunFn run, Capability capability = Capability::Available())
      : kind_(kind), run_(std::move(run)), capability_(std::move(capability)) {
  }

  ProbeKind Kind() const override {
    return kind_;
  }

  Capability CheckCapability() override {
    ++capability_checks;
    return capability_;
  }

  void Run(const ProbeTarget& target, const Deadline& deadline, ResultSink& sink) override {
    ++runs;
    run_(target, deadline, sink);
  }

  bool SeedsHostSet() const override {
    return kind_ == ProbeKind::kActiveScan;
  }

  bool RequiresKnownHosts() const override {
    return kind_ == ProbeKind::kProtocolFingerprint;
  }

  std::atomic<int> capability_checks{0};
  std::atomic<int> runs{0};

 private:
  ProbeKind  kind_;
  RunFn      run_;
  Capability capability_;
};

RunFn Silent() {
  return [](const ProbeTarget&, const Deadline&, ResultSink&) {};
}

std::string Host(int i) {
  return "10.0.0." + std::to_string(i);
}

void WaitUntilExpired(const Deadline& deadline) {
  while (!deadline.Expired()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
}

std::vector<std::shared_ptr<scout::probe::Probe>> AllSilentExcept(ProbeKind kind, RunFn run) {
  std::vector<std::shared_ptr<scout::probe::Probe>> probes;
  for (auto k : scout::model::kAllProbeKinds) {
    probes.push_back(std::make_shared<FakeProbe>(k, k == kind ? std::move(run) : Silent()));
  }
  return probes;
}

const scout::core::ProbeSummary& SummaryOf(const DiscoveryOutcome& outcome, ProbeKind kind) {
  for (const auto& summary : outcome.probes) {
    if (summary.kind == kind) {
      return summary;
    }
  }
  throw std::logic_error("no summary");
}

// ------------------------------------------------------------
// Tests
// ------------------------------------------------------------

void TestSingleProbeStillProducesResults() {
  auto probes = AllSilentExcept(ProbeKind::kServiceAnnouncement, [](const ProbeTarget&, const Deadline&, ResultSink& sink) {
    auto result         = MakeProbeResult(ProbeKind::kServiceAnnouncement, "192.168.1.20");
    result.manufacturer = "Philips";
    result.device_type  = "Hue Bridge";
    result.services     = {"hue"};
    sink.Emit(result);
  });

  DiscoveryOrchestrator orchestrator(probes, {}, {});
  assert(orchestrator.State() == RunState::kIdle);

  DiscoveryRequest request;
  request.network_range = "192.168.1.0/24";
  request.timeout       = std::chrono::milliseconds(600);
  request.disabled      = {ProbeKind::kActiveScan, ProbeKind::kDeviceDescription, ProbeKind::kVendorPassive, ProbeKind::kProtocolFingerprint};

  auto outcome = orchestrator.Run(request);
  assert(outcome.final_state == RunState::kDone);
  assert(orchestrator.State() == RunState::kDone);
  assert(outcome.devices.size() == 1);
  const auto& record = outcome.devices.at("192.168.1.20");
  assert(record.sealed);
  assert(record.confidence_score > 0.49 && record.confidence_score < 0.51);
  assert(record.derived.manufacturer.value == "Philips");

  assert(outcome.probes.size() == 5);
  assert(SummaryOf(outcome, ProbeKind::kServiceAnnouncement).status == ProbeStatus::kCompleted);
  assert(SummaryOf(outcome, ProbeKind::kServiceAnnouncement).results == 1);
  assert(SummaryOf(outcome, ProbeKind::kActiveScan).status == ProbeStatus::kDisabled);
  for (const auto& probe : probes) {
    auto* fake = static_cast<FakeProbe*>(probe.get());
    assert(fake->capability_checks.load() == 1);
    assert(fake->runs.load() == (fake->Kind() == ProbeKind::kServiceAnnouncement ? 1 : 0));
  }
}

void TestUnavailableAndFailingProbesDoNotStopTheRun() {
  std::vector<std::shared_ptr<scout::probe::Probe>> probes;
  probes.push_back(std::make_shared<FakeProbe>(ProbeKind::kActiveScan, Silent(), Capability::Unavailable("no raw sockets")));
  probes.push_back(std::make_shared<FakeProbe>(ProbeKind::kVendorPassive, [](const ProbeTarget&, const Deadline&, ResultSink& sink) {
    auto result         = MakeProbeResult(ProbeKind::kVendorPassive, "192.168.1.30");
    result.manufacturer = "Sonos";
    sink.Emit(result);
    throw std::runtime_error("socket exploded");
  }));
  probes.push_back(std::make_shared<FakeProbe>(ProbeKind::kDeviceDescription, [](const ProbeTarget&, const Deadline&, ResultSink&) {
    throw scout::util::CapabilityUnavailable("multicast route missing");
  }));

  DiscoveryOrchestrator orchestrator(probes, {}, {});
  assert(!orchestrator.CapabilityOf(ProbeKind::kActiveScan).available);
  assert(orchestrator.CapabilityOf(ProbeKind::kActiveScan).reason == "no raw sockets");
  assert(!orchestrator.CapabilityOf(ProbeKind::kProtocolFingerprint).available);

  DiscoveryRequest request;
  request.network_range = "192.168.1.0/24";
  request.timeout       = std::chrono::milliseconds(500);

  auto outcome = orchestrator.Run(request);
  assert(outcome.final_state == RunState::kDone);
  assert(SummaryOf(outcome, ProbeKind::kActiveScan).status == ProbeStatus::kUnavailable);
  assert(SummaryOf(outcome, ProbeKind::kVendorPassive).status == ProbeStatus::kFailed);
  assert(SummaryOf(outcome, ProbeKind::kVendorPassive).detail == "socket exploded");
  assert(SummaryOf(outcome, ProbeKind::kDeviceDescription).status == ProbeStatus::kUnavailable);
  // Streamed before the failure, so kept.
  assert(outcome.devices.count("192.168.1.30") == 1);
}

void TestBudgetExpiresMidFingerprint() {
  std::vector<std::shared_ptr<scout::probe::Probe>> probes;
  probes.push_back(std::make_shared<FakeProbe>(ProbeKind::kActiveScan, [](const ProbeTarget&, const Deadline&, ResultSink& sink) {
    for (int i = 1; i <= 10; ++i) {
      auto result       = MakeProbeResult(ProbeKind::kActiveScan, Host(i));
      result.open_ports = {80};
      sink.Emit(result);
    }
  }));
  probes.push_back(std::make_shared<FakeProbe>(ProbeKind::kVendorPassive, [](const ProbeTarget&, const Deadline&, ResultSink& sink) {
    for (int i = 1; i <= 10; ++i) {
      auto result         = MakeProbeResult(ProbeKind::kVendorPassive, Host(i));
      result.manufacturer = "Samsung SmartThings";
      sink.Emit(result);
    }
  }));

  std::vector<std::string> seen_by_fingerprint;
  probes.push_back(std::make_shared<FakeProbe>(ProbeKind::kProtocolFingerprint,
                                               [&seen_by_fingerprint](const ProbeTarget& target, const Deadline& deadline, ResultSink& sink) {
                                                 seen_by_fingerprint = target.known_addresses;
                                                 for (std::size_t i = 0; i < target.known_addresses.size() && i < 7; ++i) {
                                                   auto result              = MakeProbeResult(ProbeKind::kProtocolFingerprint, target.known_addresses[i]);
                                                   result.signature_matched = true;
                                                   result.manufacturer      = "Samsung SmartThings";
                                                   result.device_type       = "washing_machine";
                                                   sink.Emit(result);
                                                 }
                                                 // The remaining three never answer before the budget runs out.
                                                 WaitUntilExpired(deadline);
                                               }));

  DiscoveryOrchestrator orchestrator(probes, {}, {});

  DiscoveryRequest request;
  request.network_range = "10.0.0.0/24";
  request.timeout       = std::chrono::milliseconds(900);

  const auto started = std::chrono::steady_clock::now();
  auto       outcome = orchestrator.Run(request);
  const auto took    = std::chrono::steady_clock::now() - started;

  assert(took < std::chrono::milliseconds(900) + BudgetPolicy{}.overrun_grace + std::chrono::milliseconds(500));
  assert(outcome.final_state == RunState::kDone);
  assert(seen_by_fingerprint.size() == 10);
  assert(outcome.total_records == 10);
  assert(outcome.devices.size() == 10);

  std::size_t fingerprinted = 0;
  for (const auto& [address, record] : outcome.devices) {
    if (record.HasEvidence(ProbeKind::kProtocolFingerprint)) {
      ++fingerprinted;
      assert(record.derived.device_type.value == "washing_machine");
      assert(record.confidence_score == 1.0);
    } else {
      assert(record.derived.device_type.value.empty());
    }
  }
  assert(fingerprinted == 7);
  assert(SummaryOf(outcome, ProbeKind::kProtocolFingerprint).status == ProbeStatus::kTimedOut);
  assert(SummaryOf(outcome, ProbeKind::kProtocolFingerprint).results == 7);
}

void TestRepeatedRunsConverge() {
  // Three probes report overlapping evidence in a different order and from
  // several threads on every run.
  std::atomic<unsigned> seed{1};
  auto                  emitter = [&seed](ProbeKind kind) {
    return RunFn([&seed, kind](const ProbeTarget&, const Deadline&, ResultSink& sink) {
      std::vector<ProbeResult> results;
      for (int i = 1; i <= 20; ++i) {
        auto result = MakeProbeResult(kind, Host(i));
        if (kind != ProbeKind::kActiveScan) {
          result.manufacturer = (i % 2 == 0 ? "Philips" : "Sonos") + std::string(kind == ProbeKind::kDeviceDescription ? " Inc" : "");
          result.device_type  = i % 3 == 0 ? "smart_speaker" : "bridge";
        }
        result.open_ports = {static_cast<std::uint16_t>(1000 + i)};
        results.push_back(result);
      }
      std::mt19937 rng(seed.fetch_add(1));
      std::shuffle(results.begin(), results.end(), rng);

      std::vector<std::thread> threads;
      for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&results, &sink, t] {
          for (std::size_t i = static_cast<std::size_t>(t); i < results.size(); i += 4) {
            sink.Emit(results[i]);
          }
        });
      }
      for (auto& thread : threads) thread.join();
    });
  };

  std::vector<std::shared_ptr<scout::probe::Probe>> probes;
  probes.push_back(std::make_shared<FakeProbe>(ProbeKind::kActiveScan, emitter(ProbeKind::kActiveScan)));
  probes.push_back(std::make_shared<FakeProbe>(ProbeKind::kDeviceDescription, emitter(ProbeKind::kDeviceDescription)));
  probes.push_back(std::make_shared<FakeProbe>(ProbeKind::kVendorPassive, emitter(ProbeKind::kVendorPassive)));
  DiscoveryOrchestrator orchestrator(probes, {}, {});

  DiscoveryRequest request;
  request.network_range = "10.0.0.0/24";
  request.timeout       = std::chrono::milliseconds(600);

  auto first = orchestrator.Run(request);
  for (int run = 0; run < 3; ++run) {
    auto again = orchestrator.Run(request);
    assert(again.devices.size() == first.devices.size());
    for (const auto& [address, record] : first.devices) {
      const auto& other = again.devices.at(address);
      assert(other.derived.manufacturer.value == record.derived.manufacturer.value);
      assert(other.derived.device_type.value == record.derived.device_type.value);
      assert(other.derived.open_ports == record.derived.open_ports);
      assert(other.confidence_score == record.confidence_score);
    }
  }
  // Description outranks vendor hints.
  assert(first.devices.at(Host(2)).derived.manufacturer.value == "Philips Inc");
}

void TestOverrunningProbeIsAbandoned() {
  std::atomic<bool> finished{false};
  {
    auto probes = AllSilentExcept(ProbeKind::kVendorPassive, [&finished](const ProbeTarget&, const Deadline&, ResultSink& sink) {
      // Ignores its deadline entirely.
      std::this_thread::sleep_for(std::chrono::milliseconds(1500));
      sink.Emit(MakeProbeResult(ProbeKind::kVendorPassive, "192.168.1.99"));
      finished = true;
    });

    BudgetPolicy policy;
    policy.overrun_grace = std::chrono::milliseconds(100);
    DiscoveryOrchestrator orchestrator(probes, {}, {}, policy);

    DiscoveryRequest request;
    request.network_range = "192.168.1.0/24";
    request.timeout       = std::chrono::milliseconds(300);

    const auto started = std::chrono::steady_clock::now();
    auto       outcome = orchestrator.Run(request);
    assert(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(1200));
    assert(outcome.final_state == RunState::kDone);
    assert(SummaryOf(outcome, ProbeKind::kVendorPassive).status == ProbeStatus::kTimedOut);
    assert(outcome.devices.empty());

    // Still running from the first pass: the second pass must not start it again.
    auto second = orchestrator.Run(request);
    assert(SummaryOf(second, ProbeKind::kVendorPassive).status == ProbeStatus::kFailed);
    assert(second.devices.empty());
    assert(!finished.load());
  }
  // Destroying the orchestrator waited for the abandoned thread.
  assert(finished.load());
}

void TestAbandonedRunIsReapedBeforeNextRun() {
  std::atomic<int> calls{0};
  auto             probes = AllSilentExcept(ProbeKind::kVendorPassive, [&calls](const ProbeTarget&, const Deadline&, ResultSink& sink) {
    if (++calls == 1) {
      std::this_thread::sleep_for(std::chrono::milliseconds(500));
      return;
    }
    sink.Emit(MakeProbeResult(ProbeKind::kVendorPassive, "192.168.1.98"));
  });

  BudgetPolicy policy;
  policy.overrun_grace = std::chrono::milliseconds(50);
  DiscoveryOrchestrator orchestrator(probes, {}, {}, policy);

  DiscoveryRequest request;
  request.network_range = "192.168.1.0/24";
  request.timeout       = std::chrono::milliseconds(200);

  auto first = orchestrator.Run(request);
  assert(SummaryOf(first, ProbeKind::kVendorPassive).status == ProbeStatus::kTimedOut);

  std::this_thread::sleep_for(std::chrono::milliseconds(600));
  auto second = orchestrator.Run(request);
  assert(SummaryOf(second, ProbeKind::kVendorPassive).status == ProbeStatus::kCompleted);
  assert(second.devices.count("192.168.1.98") == 1);
}

void TestRestrictToRangeDropsForeignAddresses() {
  auto probes = AllSilentExcept(ProbeKind::kServiceAnnouncement, [](const ProbeTarget&, const Deadline&, ResultSink& sink) {
    sink.Emit(MakeProbeResult(ProbeKind::kServiceAnnouncement, "192.168.1.5"));
    sink.Emit(MakeProbeResult(ProbeKind::kServiceAnnouncement, "172.16.0.5"));
    sink.Emit(MakeProbeResult(ProbeKind::kServiceAnnouncement, ""));
  });
  DiscoveryOrchestrator orchestrator(probes, {}, {});

  DiscoveryRequest request;
  request.network_range     = "192.168.1.0/24";
  request.timeout           = std::chrono::milliseconds(300);
  request.restrict_to_range = true;
  auto restricted           = orchestrator.Run(request);
  assert(restricted.devices.size() == 1);
  assert(restricted.devices.count("192.168.1.5") == 1);

  request.restrict_to_range = false;
  auto open                 = orchestrator.Run(request);
  assert(open.devices.size() == 2);
}

void TestInvalidInputsThrow() {
  DiscoveryOrchestrator orchestrator(AllSilentExcept(ProbeKind::kActiveScan, Silent()), {}, {});
  DiscoveryRequest      request;
  request.network_range = "not-a-range";
  bool threw            = false;
  try {
    orchestrator.Run(request);
  } catch (const scout::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    std::vector<std::shared_ptr<scout::probe::Probe>> duplicate = {std::make_shared<FakeProbe>(ProbeKind::kActiveScan, Silent()),
                                                                   std::make_shared<FakeProbe>(ProbeKind::kActiveScan, Silent())};
    DiscoveryOrchestrator bad(duplicate, {}, {});
  } catch (const scout::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSingleProbeStillProducesResults();
  TestUnavailableAndFailingProbesDoNotStopTheRun();
  TestBudgetExpiresMidFingerprint();
  TestRepeatedRunsConverge();
  TestOverrunningProbeIsAbandoned();
  TestAbandonedRunIsReapedBeforeNextRun();
  TestRestrictToRangeDropsForeignAddresses();
  TestInvalidInputsThrow();

  std::cout << "device_scout_integration_discovery_orchestrator: pass\n";
  return 0;
}
