#ifndef __PMX_DISPLAY_SURFACE__
#define __PMX_DISPLAY_SURFACE__

#include "Headers.hpp"

namespace pmx {
/**
 * @brief Where a session's output goes while a container shows it.
 *
 * Surfaces are owned by whoever mounted them.  The registry keeps only a
 * weak reference and swaps it when the pane is remounted elsewhere.
 */
class DisplaySurface {
 public:
  virtual ~DisplaySurface() {}
  /** @brief Raw output bytes, escape sequences untouched. */
  virtual void write(const string& data) = 0;
  /** @brief The session moved to another surface or was released. */
  virtual void onDetached() {}
};
}  // namespace pmx

#endif  // __PMX_DISPLAY_SURFACE__
