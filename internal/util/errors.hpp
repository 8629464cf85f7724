#pragma once

#include <stdexcept>
#include <string>

namespace scout::util {

/*
  Central error types.

  Probe-level errors never cross the orchestrator boundary; they are
  turned into probe summaries there. Configuration errors reach main().
*/

// A probing mechanism is not present or not permitted on this host.
class CapabilityUnavailable : public std::runtime_error {
 public:
  explicit CapabilityUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A network operation or a probe stage exceeded its budget.
class ProbeTimeout : public std::runtime_error {
 public:
  explicit ProbeTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A response could not be parsed into the expected fields.
class MalformedEvidence : public std::runtime_error {
 public:
  explicit MalformedEvidence(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace scout::util
