#include "tester/thread_registry.h"

#include <string>
#include <utility>

#include "common/errors.h"

namespace tandem {

TestThread* ThreadRegistry::Add(std::string name, TestThread* parent) {
  auto thread = std::make_unique<TestThread>();
  thread->id = static_cast<ThreadId>(threads_.size());
  thread->name = name.empty() ? "thread" + std::to_string(thread->id)
                              : std::move(name);
  thread->parent = parent;
  threads_.push_back(std::move(thread));
  return threads_.back().get();
}

TestThread* ThreadRegistry::Create(std::string name,
                                   std::function<ThreadCoroutine()> factory,
                                   TestThread* parent) {
  auto* thread = Add(std::move(name), parent);
  thread->factory = std::move(factory);
  try {
    thread->body = thread->factory();
  } catch (...) {
    thread->state = ThreadState::kDone;
    throw;
  }
  thread->resume_point = thread->body.handle();
  return thread;
}

TestThread* ThreadRegistry::Create(std::string name, ThreadCoroutine body,
                                   TestThread* parent) {
  auto* thread = Add(std::move(name), parent);
  thread->body = std::move(body);
  thread->resume_point = thread->body.handle();
  return thread;
}

void ThreadRegistry::Block(TestThread* thread, Signal clock,
                           std::coroutine_handle<> resume_point) {
  if (thread->state == ThreadState::kBlocked) {
    throw SchedulerError("thread '" + thread->name + "' is already blocked");
  }
  thread->state = ThreadState::kBlocked;
  thread->blocked_on = clock;
  thread->resume_point = resume_point;
  blocked_[clock].push_back(thread);
}

std::vector<TestThread*> ThreadRegistry::TakeBlocked(Signal clock) {
  auto it = blocked_.find(clock);
  if (it == blocked_.end()) return {};
  auto threads = std::move(it->second);
  blocked_.erase(it);
  for (auto* t : threads) {
    t->state = ThreadState::kReady;
    t->blocked_on = Signal{};
  }
  return threads;
}

std::vector<Signal> ThreadRegistry::BlockedClocks() const {
  std::vector<Signal> clocks;
  clocks.reserve(blocked_.size());
  for (const auto& [clock, threads] : blocked_) {
    clocks.push_back(clock);
  }
  return clocks;
}

const std::vector<TestThread*>* ThreadRegistry::BlockedOn(Signal clock) const {
  auto it = blocked_.find(clock);
  return it == blocked_.end() ? nullptr : &it->second;
}

uint32_t ThreadRegistry::BlockedCount() const {
  uint32_t n = 0;
  for (const auto& [clock, threads] : blocked_) {
    n += static_cast<uint32_t>(threads.size());
  }
  return n;
}

TestThread* ThreadRegistry::Find(ThreadId id) const {
  if (id >= threads_.size()) return nullptr;
  return threads_[id].get();
}

uint32_t ThreadRegistry::LiveCount() const {
  uint32_t n = 0;
  for (const auto& t : threads_) {
    if (!t->Done()) ++n;
  }
  return n;
}

}  // namespace tandem
