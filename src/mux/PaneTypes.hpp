#ifndef __PMX_PANE_TYPES__
#define __PMX_PANE_TYPES__

#include "Headers.hpp"

namespace pmx {
/**
 * @brief Identity of a pane.  Issued from a process-wide counter and never
 * reused within one run.
 */
typedef int64_t PaneId;

/** @brief Opaque handle returned by a `SessionBackend`. */
typedef int64_t BackendHandle;

/** @brief Tabs are keyed by a random uuid string. */
typedef string TabId;

enum class SplitDirection { HORIZONTAL, VERTICAL };

inline string directionToString(SplitDirection direction) {
  return direction == SplitDirection::HORIZONTAL ? "horizontal" : "vertical";
}

inline string paneIdToString(PaneId id) {
  return string("pane-") + to_string(id);
}

/**
 * @brief Hands out pane ids.  The counter is shared by every workspace in the
 * process so that ids stay unique even across independent layout trees.
 */
class PaneIdGenerator {
 public:
  static PaneId next() { return ++counter; }
  /** @brief The most recently issued id (0 if none yet). */
  static PaneId last() { return counter.load(); }

 private:
  static std::atomic<PaneId> counter;
};
}  // namespace pmx

#endif  // __PMX_PANE_TYPES__
