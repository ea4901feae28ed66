#ifndef __PMX_EVENT_LOOP__
#define __PMX_EVENT_LOOP__

#include "Clock.hpp"
#include "Headers.hpp"

namespace pmx {
/**
 * @brief Single-threaded task queue that serializes every state transition.
 *
 * Asynchronous work (backend acquisition, cwd queries, idle polling) is
 * expressed as tasks posted here; their results are applied when the task
 * runs, so two mutations never interleave.  Tasks with the same deadline run
 * in the order they were posted.
 *
 * Not thread safe: post from the loop thread only.
 */
class EventLoop {
 public:
  typedef std::function<void()> Task;

  explicit EventLoop(shared_ptr<Clock> _clock);

  /** @brief Queues a task to run on the next `runReady()`. */
  void post(Task task);
  /** @brief Queues a task to run once `delayMs` have elapsed. */
  void postDelayed(int64_t delayMs, Task task);

  /**
   * @brief Runs every task whose deadline has passed, including tasks posted
   * by those tasks when they are already due.
   * @return The number of tasks that ran.
   */
  int runReady();

  inline bool hasPending() const { return !tasks.empty(); }
  inline size_t numPending() const { return tasks.size(); }

  /**
   * @brief Milliseconds until the earliest queued task is due, 0 if one is
   * due now, -1 when nothing is queued.
   */
  int64_t millisUntilNextTask();

  inline void stop() { stopped = true; }
  inline bool isStopped() const { return stopped; }

  inline shared_ptr<Clock> getClock() { return clock; }

 protected:
  shared_ptr<Clock> clock;
  /** @brief Keyed by (deadline, sequence) to keep FIFO order per deadline. */
  map<pair<int64_t, uint64_t>, Task> tasks;
  uint64_t nextSequence;
  bool stopped;
};
}  // namespace pmx

#endif  // __PMX_EVENT_LOOP__
