#ifndef __PMX_PTY_SESSION_BACKEND__
#define __PMX_PTY_SESSION_BACKEND__

#include "EventLoop.hpp"
#include "Headers.hpp"
#include "SessionBackend.hpp"

namespace pmx {
/**
 * @brief Runs each session as a login shell on its own pseudo-terminal.
 *
 * Creation and cwd queries are posted to the event loop, so callers always
 * get their answer asynchronously.  Output is only read when the owner calls
 * `poll()`, which keeps every event on the loop thread.
 */
class PtySessionBackend : public SessionBackend {
 public:
  PtySessionBackend(shared_ptr<EventLoop> _loop, const string& _shell);
  virtual ~PtySessionBackend();

  virtual void createSession(int rows, int cols, const optional<string>& cwd,
                             CreateCallback callback);
  virtual void writeInput(BackendHandle handle, const string& data);
  virtual void resize(BackendHandle handle, int rows, int cols);
  virtual void killSession(BackendHandle handle);
  virtual void queryCwd(BackendHandle handle, CwdCallback callback);

  /**
   * @brief Waits up to `timeoutMs` for output on any pty and dispatches the
   * resulting events to the sink.
   * @return The number of ptys that were read.
   */
  int poll(int64_t timeoutMs);

  inline int numSessions() const { return int(children.size()); }
  optional<pid_t> getChildPid(BackendHandle handle) const;

 protected:
  struct Child {
    int masterFd;
    pid_t pid;
  };

  /** @brief forkpty + exec.  Throws std::runtime_error if the fork fails. */
  BackendHandle spawn(int rows, int cols, const optional<string>& cwd);
  void runShell(const optional<string>& cwd);
  /** @brief Reaps and forgets the child, then emits error (if any) and exit. */
  void finishChild(BackendHandle handle, const string& error);
  static void reap(pid_t pid);

  shared_ptr<EventLoop> loop;
  string shell;
  map<BackendHandle, Child> children;
  BackendHandle nextHandle;
  shared_ptr<bool> lifetimeToken;
};
}  // namespace pmx

#endif  // __PMX_PTY_SESSION_BACKEND__
