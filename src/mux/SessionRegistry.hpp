#ifndef __PMX_SESSION_REGISTRY__
#define __PMX_SESSION_REGISTRY__

#include "ActivityTracker.hpp"
#include "DisplaySurface.hpp"
#include "EventLoop.hpp"
#include "Headers.hpp"
#include "PaneTypes.hpp"
#include "Session.hpp"
#include "SessionBackend.hpp"

namespace pmx {
/**
 * @brief Owns the mapping from pane id to live session.
 *
 * Sessions are created lazily the first time a pane is shown and destroyed
 * only when the pane is explicitly closed.  Containers that show a pane
 * come and go through `attachDisplay`/`detachDisplay` without touching the
 * session behind it.
 *
 * All methods run on the event loop thread.
 */
class SessionRegistry : public SessionEventSink {
 public:
  typedef std::function<void(PaneId paneId, BackendHandle handle)>
      BackendAttachedCallback;

  SessionRegistry(shared_ptr<EventLoop> _loop,
                  shared_ptr<SessionBackend> _backend,
                  shared_ptr<ActivityTracker> _activityTracker,
                  int _defaultRows = 24, int _defaultCols = 80,
                  size_t _scrollbackBytes = ScrollbackBuffer::DEFAULT_MAX_BYTES);
  virtual ~SessionRegistry();

  /**
   * @brief Returns the pane's session, creating it (and asking the backend
   * for a process) if there is none yet.
   *
   * Backend failure never reaches the caller: the session stays without a
   * handle and the error is written to its display.
   */
  shared_ptr<Session> acquire(PaneId paneId,
                              const optional<string>& startupDirectory = nullopt);

  /**
   * @brief Makes `surface` the output sink of the pane's session and replays
   * buffered output into it.  The previous surface is told it was detached.
   */
  void attachDisplay(PaneId paneId, shared_ptr<DisplaySurface> surface);

  /**
   * @brief A container went away.  Clears the binding only if `surface` is
   * still the current one.
   */
  void detachDisplay(PaneId paneId, const shared_ptr<DisplaySurface>& surface);

  /** @brief Kills the backend process and forgets the session. */
  void release(PaneId paneId);

  /**
   * @brief Asks the backend for the session's current directory.  The
   * callback always runs later on the loop, with nullopt when the answer is
   * unknown.
   */
  void getWorkingDirectory(PaneId paneId, SessionBackend::CwdCallback callback);

  void writeInput(PaneId paneId, const string& data);
  void resize(PaneId paneId, int rows, int cols);

  shared_ptr<Session> get(PaneId paneId) const;
  inline bool has(PaneId paneId) const {
    return sessions.find(paneId) != sessions.end();
  }
  inline size_t numSessions() const { return sessions.size(); }
  vector<PaneId> getPaneIds() const;

  inline void setBackendAttachedCallback(BackendAttachedCallback callback) {
    backendAttachedCallback = callback;
  }

  inline shared_ptr<ActivityTracker> getActivityTracker() {
    return activityTracker;
  }

  virtual void onOutput(BackendHandle handle, const string& data);
  virtual void onExit(BackendHandle handle);
  virtual void onError(BackendHandle handle, const string& message);

 protected:
  void handleCreated(const shared_ptr<Session>& session,
                     optional<BackendHandle> handle, const string& error);
  /** @brief Records output in scrollback and forwards it to the surface. */
  void emit(const shared_ptr<Session>& session, const string& data);
  shared_ptr<Session> sessionForHandle(BackendHandle handle) const;

  shared_ptr<EventLoop> loop;
  shared_ptr<SessionBackend> backend;
  shared_ptr<ActivityTracker> activityTracker;
  int defaultRows;
  int defaultCols;
  size_t scrollbackBytes;
  map<PaneId, shared_ptr<Session>> sessions;
  unordered_map<BackendHandle, PaneId> handleToPane;
  BackendAttachedCallback backendAttachedCallback;
  /** @brief Expires with the registry; async callbacks check it first. */
  shared_ptr<bool> lifetimeToken;
};
}  // namespace pmx

#endif  // __PMX_SESSION_REGISTRY__
