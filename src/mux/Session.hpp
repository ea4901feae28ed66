#ifndef __PMX_SESSION__
#define __PMX_SESSION__

#include "DisplaySurface.hpp"
#include "Headers.hpp"
#include "PaneTypes.hpp"
#include "ScrollbackBuffer.hpp"

namespace pmx {
/**
 * @brief The live state behind one pane: backend handle, current display
 * binding and recent output.
 *
 * Only the `SessionRegistry` writes to a session.  Everyone else gets a
 * read-only view through the accessors.
 */
class Session {
 public:
  Session(PaneId _paneId, size_t scrollbackBytes, int _rows, int _cols)
      : paneId(_paneId),
        scrollback(scrollbackBytes),
        rows(_rows),
        cols(_cols),
        exited(false) {}

  inline PaneId getPaneId() const { return paneId; }
  inline optional<BackendHandle> getBackendHandle() const {
    return backendHandle;
  }
  /** @brief The currently bound surface, if it is still alive. */
  inline shared_ptr<DisplaySurface> getDisplaySurface() const {
    return displaySurface.lock();
  }
  inline optional<string> getStartupDirectory() const {
    return startupDirectory;
  }
  inline optional<string> getLastKnownWorkingDirectory() const {
    return lastKnownWorkingDirectory;
  }
  /** @brief Why the backend could not start this session, if it failed. */
  inline optional<string> getFailure() const { return failure; }
  inline bool hasFailed() const { return failure.has_value(); }
  inline bool hasExited() const { return exited; }
  /** @brief Handle attached and the process still running. */
  inline bool isLive() const { return backendHandle.has_value() && !exited; }
  inline const ScrollbackBuffer& getScrollback() const { return scrollback; }
  inline int getRows() const { return rows; }
  inline int getCols() const { return cols; }

 protected:
  friend class SessionRegistry;

  PaneId paneId;
  optional<BackendHandle> backendHandle;
  weak_ptr<DisplaySurface> displaySurface;
  optional<string> startupDirectory;
  optional<string> lastKnownWorkingDirectory;
  optional<string> failure;
  ScrollbackBuffer scrollback;
  int rows;
  int cols;
  bool exited;
};
}  // namespace pmx

#endif  // __PMX_SESSION__
