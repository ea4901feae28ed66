#ifndef __PMX_WORKSPACE_CONSOLE__
#define __PMX_WORKSPACE_CONSOLE__

#include "DisplaySurface.hpp"
#include "Headers.hpp"
#include "StepDispatcher.hpp"
#include "Workspace.hpp"

namespace pmx {
/**
 * @brief Line-mode front end for the workspace.
 *
 * Lines starting with `:` are commands (`:split h`, `:tab new`, `:run`, ...);
 * anything else is typed into the active pane.  Only the active pane is
 * mounted on the surface; focus changes unmount the old pane and mount the
 * new one, which replays its scrollback.
 */
class WorkspaceConsole {
 public:
  WorkspaceConsole(shared_ptr<Workspace> _workspace,
                   shared_ptr<StepDispatcher> _dispatcher,
                   shared_ptr<DisplaySurface> _surface);

  /** @brief Mounts the active pane.  Call once before feeding input. */
  void start();

  /** @brief Splits raw input into lines and handles each complete one. */
  void handleInput(const string& data);

  /** @return false once `:quit` was entered. */
  bool handleLine(const string& line);

  /** @brief Makes sure the surface shows the active pane. */
  void remount();

  inline bool isDone() const { return done; }
  inline optional<PaneId> getMountedPane() const { return mountedPane; }
  inline const string& getLastMessage() const { return lastMessage; }
  inline bool isRunningSteps() const { return bool(cancelFlag); }

 protected:
  bool handleCommand(const vector<string>& tokens, const string& rest);
  bool handleTabCommand(const vector<string>& tokens, const string& rest);
  void closeActivePane(bool force);
  void runSteps(const string& rest);
  void say(const string& message);

  shared_ptr<Workspace> workspace;
  shared_ptr<StepDispatcher> dispatcher;
  shared_ptr<DisplaySurface> surface;
  optional<PaneId> mountedPane;
  StepDispatcher::CancelFlag cancelFlag;
  string pendingInput;
  string lastMessage;
  bool done;
  shared_ptr<bool> lifetimeToken;
};
}  // namespace pmx

#endif  // __PMX_WORKSPACE_CONSOLE__
