#pragma once

#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/probe_kind.hpp"
#include "internal/model/probe_result.hpp"
#include "internal/net/network_range.hpp"
#include "internal/util/time.hpp"

namespace scout::probe {

struct Capability {
  bool        available = false;
  std::string reason;

  static Capability Available() {
    return {true, {}};
  }
  static Capability Unavailable(std::string why) {
    return {false, std::move(why)};
  }
};

// What a probe is asked to look at: the scan range and every address known so far.
struct ProbeTarget {
  net::NetworkRange        range;
  std::vector<std::string> known_addresses;
};

/*
  Receives results as soon as a probe produces them.

  Implementations must be thread-safe: probes emit from worker threads.
*/
class ResultSink {
 public:
  virtual ~ResultSink() = default;

  virtual void Emit(model::ProbeResult result) = 0;
};

// Keeps everything it is given. Used where results are inspected after the fact.
class CollectingSink : public ResultSink {
 public:
  void Emit(model::ProbeResult result) override {
    std::lock_guard lock(mutex_);
    results_.push_back(std::move(result));
  }

  std::vector<model::ProbeResult> Results() const {
    std::lock_guard lock(mutex_);
    return results_;
  }

 private:
  mutable std::mutex              mutex_;
  std::vector<model::ProbeResult> results_;
};

/*
  One independent discovery method.

  CheckCapability() is called once at startup; Run() is only called on
  probes that reported themselves available. Run() streams results to
  the sink and returns when its work is done or the deadline expires,
  whichever comes first. It does not throw for network failures; those
  just mean less evidence.
*/
class Probe {
 public:
  virtual ~Probe() = default;

  virtual model::ProbeKind Kind() const = 0;

  std::string_view Name() const {
    return model::Name(Kind());
  }

  virtual Capability CheckCapability() = 0;

  virtual void Run(const ProbeTarget& target, const util::Deadline& deadline, ResultSink& sink) = 0;

  // Runs alone, first, and establishes the initial host set.
  virtual bool SeedsHostSet() const {
    return false;
  }

  // Runs last, against the addresses every earlier stage found.
  virtual bool RequiresKnownHosts() const {
    return false;
  }
};

} // namespace scout::probe
