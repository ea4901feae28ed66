#include "ActivityTracker.hpp"

namespace pmx {
ActivityTracker::ActivityTracker(shared_ptr<Clock> _clock,
                                 int64_t _idleThresholdMs)
    : clock(_clock), idleThresholdMs(_idleThresholdMs) {
  if (idleThresholdMs <= 0) {
    STFATAL << "Idle threshold must be positive: " << idleThresholdMs;
  }
}

void ActivityTracker::recordActivity(PaneId paneId) {
  lastOutput[paneId] = clock->nowMs();
}

bool ActivityTracker::isActive(PaneId paneId) {
  auto it = lastOutput.find(paneId);
  if (it == lastOutput.end()) {
    return false;
  }
  return clock->nowMs() - it->second < idleThresholdMs;
}

optional<int64_t> ActivityTracker::lastActivity(PaneId paneId) const {
  auto it = lastOutput.find(paneId);
  if (it == lastOutput.end()) {
    return nullopt;
  }
  return it->second;
}

void ActivityTracker::forget(PaneId paneId) { lastOutput.erase(paneId); }
}  // namespace pmx
