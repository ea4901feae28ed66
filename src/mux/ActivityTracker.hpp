#ifndef __PMX_ACTIVITY_TRACKER__
#define __PMX_ACTIVITY_TRACKER__

#include "Clock.hpp"
#include "Headers.hpp"
#include "PaneTypes.hpp"

namespace pmx {
/**
 * @brief Remembers when each pane last produced output.
 *
 * A pane is active while its last output is younger than the idle
 * threshold.  Close confirmation and the step dispatcher both read it.
 */
class ActivityTracker {
 public:
  static constexpr int64_t DEFAULT_IDLE_THRESHOLD_MS = 3000;

  ActivityTracker(shared_ptr<Clock> _clock,
                  int64_t _idleThresholdMs = DEFAULT_IDLE_THRESHOLD_MS);

  /** @brief Called for every output chunk a pane's backend produces. */
  void recordActivity(PaneId paneId);
  /** @brief True iff output arrived less than the threshold ago. */
  bool isActive(PaneId paneId);
  optional<int64_t> lastActivity(PaneId paneId) const;
  /** @brief Drops the record of a released pane. */
  void forget(PaneId paneId);

  inline int64_t getIdleThresholdMs() const { return idleThresholdMs; }
  inline size_t numTracked() const { return lastOutput.size(); }

 protected:
  shared_ptr<Clock> clock;
  int64_t idleThresholdMs;
  unordered_map<PaneId, int64_t> lastOutput;
};
}  // namespace pmx

#endif  // __PMX_ACTIVITY_TRACKER__
