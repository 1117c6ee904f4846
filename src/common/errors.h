#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tandem {

// --- Exception taxonomy ---
// Conflicts and expect mismatches are diagnostics, not exceptions. The types
// below cover the failures that end a thread or the whole run.

class TesterError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A stale peek was requested; reading a pre-poke value is not supported.
class StaleReadError : public TesterError {
 public:
  using TesterError::TesterError;
};

// No thread can make progress while the main thread is unfinished.
class DeadlockError : public TesterError {
 public:
  DeadlockError(const std::string& what, uint64_t timestep)
      : TesterError(what), timestep_(timestep) {}

  uint64_t timestep() const { return timestep_; }

 private:
  uint64_t timestep_ = 0;
};

// Scheduler invariant violated. Not recoverable.
class SchedulerError : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

// Several threads failed; each thrown exception is kept.
class ThreadFailures : public TesterError {
 public:
  ThreadFailures(const std::string& what,
                 std::vector<std::exception_ptr> failures)
      : TesterError(what), failures_(std::move(failures)) {}

  const std::vector<std::exception_ptr>& failures() const {
    return failures_;
  }

 private:
  std::vector<std::exception_ptr> failures_;
};

// Thrown out of a suspension point when the run tears a thread down.
// Not a std::exception so that catch (const std::exception&) in test code
// does not intercept it.
struct ThreadCancelled {};

}  // namespace tandem
