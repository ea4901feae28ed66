#ifndef __PMX_SESSION_BACKEND__
#define __PMX_SESSION_BACKEND__

#include "Headers.hpp"
#include "PaneTypes.hpp"

namespace pmx {
/**
 * @brief Receives the per-handle event stream of a backend.
 */
class SessionEventSink {
 public:
  virtual ~SessionEventSink() {}
  virtual void onOutput(BackendHandle handle, const string& data) = 0;
  virtual void onExit(BackendHandle handle) = 0;
  virtual void onError(BackendHandle handle, const string& message) = 0;
};

/**
 * @brief Runs the processes behind panes.
 *
 * `createSession` and `queryCwd` are asynchronous: they return immediately
 * and answer through the callback later, on the event loop.  Exactly one of
 * the handle and the error is set in a create callback.
 */
class SessionBackend {
 public:
  typedef std::function<void(optional<BackendHandle> handle,
                             const string& error)>
      CreateCallback;
  typedef std::function<void(optional<string> cwd)> CwdCallback;

  SessionBackend() : sink(NULL) {}
  virtual ~SessionBackend() {}

  virtual void createSession(int rows, int cols, const optional<string>& cwd,
                             CreateCallback callback) = 0;
  virtual void writeInput(BackendHandle handle, const string& data) = 0;
  virtual void resize(BackendHandle handle, int rows, int cols) = 0;
  /** @brief Ends the process.  No events follow for a killed handle. */
  virtual void killSession(BackendHandle handle) = 0;
  virtual void queryCwd(BackendHandle handle, CwdCallback callback) = 0;

  inline void setEventSink(SessionEventSink* _sink) { sink = _sink; }

 protected:
  SessionEventSink* sink;
};
}  // namespace pmx

#endif  // __PMX_SESSION_BACKEND__
