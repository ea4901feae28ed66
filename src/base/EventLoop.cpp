#include "EventLoop.hpp"

namespace pmx {
EventLoop::EventLoop(shared_ptr<Clock> _clock)
    : clock(_clock), nextSequence(0), stopped(false) {}

void EventLoop::post(Task task) { postDelayed(0, std::move(task)); }

void EventLoop::postDelayed(int64_t delayMs, Task task) {
  if (delayMs < 0) {
    delayMs = 0;
  }
  int64_t deadline = clock->nowMs() + delayMs;
  tasks.insert(make_pair(make_pair(deadline, nextSequence++), std::move(task)));
}

int EventLoop::runReady() {
  int ran = 0;
  while (!tasks.empty() && !stopped) {
    auto it = tasks.begin();
    if (it->first.first > clock->nowMs()) {
      break;
    }
    // Take ownership before running: the task may post more work.
    Task task = std::move(it->second);
    tasks.erase(it);
    task();
    ran++;
  }
  if (ran) {
    VLOG(4) << "Ran " << ran << " tasks, " << tasks.size() << " pending";
  }
  return ran;
}

int64_t EventLoop::millisUntilNextTask() {
  if (tasks.empty()) {
    return -1;
  }
  int64_t delta = tasks.begin()->first.first - clock->nowMs();
  return delta > 0 ? delta : 0;
}
}  // namespace pmx
