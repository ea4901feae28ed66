#include "WorkspaceConsole.hpp"

namespace pmx {
namespace {
const string STEP_SEPARATOR = ";;";

vector<string> tokenize(const string& s) {
  vector<string> tokens;
  for (const string& token : split(s, ' ')) {
    if (!token.empty()) {
      tokens.push_back(token);
    }
  }
  return tokens;
}

string restAfter(const string& s, const string& word) {
  size_t pos = s.find(word);
  if (pos == string::npos) {
    return string();
  }
  return trim(s.substr(pos + word.length()));
}
}  // namespace

WorkspaceConsole::WorkspaceConsole(shared_ptr<Workspace> _workspace,
                                   shared_ptr<StepDispatcher> _dispatcher,
                                   shared_ptr<DisplaySurface> _surface)
    : workspace(_workspace),
      dispatcher(_dispatcher),
      surface(_surface),
      done(false),
      lifetimeToken(new bool(true)) {}

void WorkspaceConsole::start() { remount(); }

void WorkspaceConsole::handleInput(const string& data) {
  pendingInput.append(data);
  while (!done) {
    size_t newline = pendingInput.find('\n');
    if (newline == string::npos) {
      break;
    }
    string line = pendingInput.substr(0, newline);
    pendingInput.erase(0, newline + 1);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (!handleLine(line)) {
      done = true;
    }
  }
}

bool WorkspaceConsole::handleLine(const string& line) {
  if (line.empty() || line[0] != ':') {
    PaneId active = workspace->getActiveTab().activePaneId;
    workspace->getRegistry()->writeInput(active, line + "\n");
    return true;
  }
  string body = trim(line.substr(1));
  vector<string> tokens = tokenize(body);
  if (tokens.empty()) {
    say("Empty command");
    return true;
  }
  return handleCommand(tokens, restAfter(body, tokens[0]));
}

bool WorkspaceConsole::handleCommand(const vector<string>& tokens,
                                     const string& rest) {
  const string& command = tokens[0];
  VLOG(1) << "Console command: " << command;
  if (command == "quit") {
    say("Bye");
    return false;
  }
  if (command == "split") {
    if (tokens.size() != 2 || (tokens[1] != "h" && tokens[1] != "v")) {
      say("Usage: :split h|v");
      return true;
    }
    SplitDirection direction = tokens[1] == "h" ? SplitDirection::HORIZONTAL
                                                : SplitDirection::VERTICAL;
    const Tab& tab = workspace->getActiveTab();
    weak_ptr<bool> alive(lifetimeToken);
    workspace->splitPaneInheritingCwd(
        tab.id, tab.activePaneId, direction,
        [this, alive, direction](optional<PaneId> newPane) {
          if (alive.expired()) {
            return;
          }
          if (!newPane) {
            say("Cannot split " + directionToString(direction) +
                " any further here");
            return;
          }
          remount();
        });
    return true;
  }
  if (command == "close" || command == "close!") {
    closeActivePane(command == "close!");
    return true;
  }
  if (command == "next" || command == "prev") {
    const TabId& tabId = workspace->getActiveTabId();
    if (command == "next") {
      workspace->focusNextPane(tabId);
    } else {
      workspace->focusPrevPane(tabId);
    }
    remount();
    return true;
  }
  if (command == "tab") {
    return handleTabCommand(tokens, rest);
  }
  if (command == "run") {
    runSteps(rest);
    return true;
  }
  if (command == "cancel") {
    if (!cancelFlag) {
      say("No step sequence is running");
      return true;
    }
    cancelFlag->store(true);
    say("Cancelling step sequence");
    return true;
  }
  if (command == "state") {
    say(workspace->toJsonString());
    return true;
  }
  say("Unknown command: " + command);
  return true;
}

bool WorkspaceConsole::handleTabCommand(const vector<string>& tokens,
                                        const string& rest) {
  if (tokens.size() < 2) {
    say("Usage: :tab new|close|next|prev|rename");
    return true;
  }
  const string& sub = tokens[1];
  if (sub == "new") {
    workspace->addTab(restAfter(rest, sub));
  } else if (sub == "close" || sub == "close!") {
    const TabId tabId = workspace->getActiveTabId();
    if (sub == "close" && workspace->tabNeedsCloseConfirmation(tabId)) {
      say("A pane in this tab is still busy, use :tab close! to close it "
          "anyway");
      return true;
    }
    if (!workspace->closeTab(tabId)) {
      say("Cannot close the last tab");
      return true;
    }
  } else if (sub == "next") {
    workspace->focusNextTab();
  } else if (sub == "prev") {
    workspace->focusPrevTab();
  } else if (sub == "rename") {
    if (!workspace->renameTab(workspace->getActiveTabId(),
                              restAfter(rest, sub))) {
      say("Usage: :tab rename <name>");
    }
    return true;
  } else {
    say("Unknown tab command: " + sub);
    return true;
  }
  remount();
  return true;
}

void WorkspaceConsole::closeActivePane(bool force) {
  const Tab& tab = workspace->getActiveTab();
  PaneId paneId = tab.activePaneId;
  if (!force && workspace->paneNeedsCloseConfirmation(paneId)) {
    say(paneIdToString(paneId) +
        " is still busy, use :close! to close it anyway");
    return;
  }
  if (!workspace->closePane(tab.id, paneId)) {
    say("Cannot close the last pane of a tab");
    return;
  }
  remount();
}

void WorkspaceConsole::runSteps(const string& rest) {
  if (cancelFlag) {
    say("A step sequence is already running, :cancel it first");
    return;
  }
  vector<string> steps;
  size_t start = 0;
  while (true) {
    size_t pos = rest.find(STEP_SEPARATOR, start);
    string step = trim(rest.substr(
        start, pos == string::npos ? string::npos : pos - start));
    if (!step.empty()) {
      steps.push_back(step);
    }
    if (pos == string::npos) {
      break;
    }
    start = pos + STEP_SEPARATOR.length();
  }
  if (steps.empty()) {
    say("Usage: :run <step> ;; <step> ...");
    return;
  }

  PaneId paneId = workspace->getActiveTab().activePaneId;
  cancelFlag = StepDispatcher::makeCancelFlag();
  weak_ptr<bool> alive(lifetimeToken);
  dispatcher->dispatch(
      paneId, steps, cancelFlag,
      [this, alive, paneId](const DispatchResult& result) {
        if (alive.expired()) {
          return;
        }
        cancelFlag.reset();
        int timedOut = 0;
        for (StepOutcome outcome : result.steps) {
          if (outcome == StepOutcome::TIMED_OUT) {
            timedOut++;
          }
        }
        std::ostringstream ss;
        ss << "Steps on " << paneIdToString(paneId) << " "
           << dispatchStatusToString(result.status) << " ("
           << result.steps.size() << " run, " << timedOut << " timed out)";
        say(ss.str());
      });
}

void WorkspaceConsole::remount() {
  const Tab& tab = workspace->getActiveTab();
  PaneId active = tab.activePaneId;
  if (mountedPane && *mountedPane == active) {
    return;
  }
  if (mountedPane) {
    workspace->unmountPane(*mountedPane, surface);
  }
  surface->write("\r\n\x1b[7m " + tab.name + " | " + paneIdToString(active) +
                 " \x1b[0m\r\n");
  workspace->mountPane(active, surface);
  mountedPane = active;
}

void WorkspaceConsole::say(const string& message) {
  lastMessage = message;
  CLOG(INFO, "stdout") << message << endl;
}
}  // namespace pmx
