#ifndef __PMX_STEP_DISPATCHER__
#define __PMX_STEP_DISPATCHER__

#include "ActivityTracker.hpp"
#include "EventLoop.hpp"
#include "Headers.hpp"
#include "SessionRegistry.hpp"
#include "WorkspaceConfig.hpp"

namespace pmx {
enum class StepOutcome { IDLE, TIMED_OUT };

enum class DispatchStatus {
  COMPLETED,
  CANCELLED,
  BACKEND_UNAVAILABLE,
  PANE_CLOSED
};

string dispatchStatusToString(DispatchStatus status);

struct DispatchResult {
  DispatchStatus status;
  /** @brief One entry per step that was sent and waited on. */
  vector<StepOutcome> steps;

  DispatchResult() : status(DispatchStatus::COMPLETED) {}
};

/**
 * @brief Types a sequence of commands into a pane, one at a time, waiting
 * for the pane to go quiet between them.
 *
 * After each step the pane is polled every `idlePollIntervalMs`.  A step that
 * keeps producing output past `idleWaitCeilingMs` is marked timed out and
 * the sequence moves on, so a stuck pane cannot hold it forever.  The cancel
 * flag is checked on every tick and may be set from any thread.
 */
class StepDispatcher {
 public:
  typedef std::function<void(const DispatchResult&)> Callback;
  typedef shared_ptr<std::atomic<bool>> CancelFlag;

  StepDispatcher(shared_ptr<EventLoop> _loop,
                 shared_ptr<SessionRegistry> _registry,
                 const WorkspaceConfig& config);
  ~StepDispatcher();

  static CancelFlag makeCancelFlag() {
    return CancelFlag(new std::atomic<bool>(false));
  }

  /**
   * @brief Starts a sequence.  The pane's backend handle is awaited first
   * (up to `handleWaitCeilingMs`).  `callback` runs once, on the loop,
   * when the sequence ends.  Sequences still running when the dispatcher is
   * destroyed are dropped without a callback.
   */
  void dispatch(PaneId paneId, const vector<string>& steps,
                CancelFlag cancelFlag, Callback callback);

  inline int numRunning() const { return running; }

 protected:
  struct Job {
    PaneId paneId;
    vector<string> steps;
    size_t nextStep;
    int64_t waitStartedMs;
    CancelFlag cancelFlag;
    Callback callback;
    DispatchResult result;
  };

  void waitForHandle(const shared_ptr<Job>& job);
  void sendNextStep(const shared_ptr<Job>& job);
  void pollIdle(const shared_ptr<Job>& job);
  /**
   * @brief Ends the job unless its session is live: PANE_CLOSED once the
   * pane was released, BACKEND_UNAVAILABLE if the shell exited.
   */
  bool checkSession(const shared_ptr<Job>& job);
  void finish(const shared_ptr<Job>& job, DispatchStatus status);
  void schedule(const shared_ptr<Job>& job, void (StepDispatcher::*fn)(
                                                const shared_ptr<Job>&));

  shared_ptr<EventLoop> loop;
  shared_ptr<SessionRegistry> registry;
  shared_ptr<ActivityTracker> activityTracker;
  int64_t idlePollIntervalMs;
  int64_t idleWaitCeilingMs;
  int64_t handleWaitCeilingMs;
  int running;
  shared_ptr<bool> lifetimeToken;
};
}  // namespace pmx

#endif  // __PMX_STEP_DISPATCHER__
