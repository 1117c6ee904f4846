#pragma once

#include <coroutine>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common/types.h"
#include "tester/thread.h"

namespace tandem {

// =============================================================================
// ThreadRegistry: owns every TestThread and the blocked set
// =============================================================================
//
// The blocked set maps a clock to the threads waiting for its next rising
// edge, in the order they blocked. That order is the resume order. A thread
// sits under at most one clock.

class ThreadRegistry {
 public:
  TestThread* Create(std::string name, std::function<ThreadCoroutine()> factory,
                     TestThread* parent);
  TestThread* Create(std::string name, ThreadCoroutine body,
                     TestThread* parent);

  void Block(TestThread* thread, Signal clock,
             std::coroutine_handle<> resume_point);
  // Removes and returns the bucket for a clock.
  std::vector<TestThread*> TakeBlocked(Signal clock);
  void ClearBlocked() { blocked_.clear(); }

  bool HasBlocked(Signal clock) const { return blocked_.count(clock) != 0; }
  std::vector<Signal> BlockedClocks() const;
  const std::vector<TestThread*>* BlockedOn(Signal clock) const;
  uint32_t BlockedCount() const;

  TestThread* Find(ThreadId id) const;
  uint32_t Size() const { return static_cast<uint32_t>(threads_.size()); }
  uint32_t LiveCount() const;
  // Creation order. Index-based iteration stays valid across Create.
  TestThread* At(uint32_t index) const { return threads_[index].get(); }

 private:
  TestThread* Add(std::string name, TestThread* parent);

  std::vector<std::unique_ptr<TestThread>> threads_;
  std::map<Signal, std::vector<TestThread*>> blocked_;
};

}  // namespace tandem
