#include "JsonLib.hpp"
#include "MuxTestFixture.hpp"
#include "TestHeaders.hpp"
#include "WorkspaceConsole.hpp"

using namespace pmx;

namespace {
struct ConsoleFixture : public MuxTestFixture {
  ConsoleFixture()
      : workspace(new Workspace(registry, WorkspaceConfig())),
        dispatcher(new StepDispatcher(loop, registry, WorkspaceConfig())),
        surface(new FakeDisplaySurface()),
        console(workspace, dispatcher, surface) {
    console.start();
    loop->runReady();
  }

  BackendHandle handleOf(PaneId paneId) {
    return *registry->get(paneId)->getBackendHandle();
  }

  shared_ptr<Workspace> workspace;
  shared_ptr<StepDispatcher> dispatcher;
  shared_ptr<FakeDisplaySurface> surface;
  WorkspaceConsole console;
};
}  // namespace

TEST_CASE("Start mounts the active pane", "[WorkspaceConsole]") {
  ConsoleFixture f;
  PaneId active = f.workspace->getActiveTab().activePaneId;
  REQUIRE(f.console.getMountedPane() == optional<PaneId>(active));
  REQUIRE(f.surface->contains("Terminal | " + paneIdToString(active)));
  REQUIRE(f.registry->get(active)->getDisplaySurface() == f.surface);
}

TEST_CASE("Plain lines are typed into the active pane",
          "[WorkspaceConsole]") {
  ConsoleFixture f;
  PaneId active = f.workspace->getActiveTab().activePaneId;
  f.console.handleInput("echo hi\r\nls");
  REQUIRE(f.backend->writes[f.handleOf(active)] == "echo hi\n");
  f.console.handleInput(" -la\n");
  REQUIRE(f.backend->writes[f.handleOf(active)] == "echo hi\nls -la\n");
}

TEST_CASE("Splitting remounts the new pane", "[WorkspaceConsole]") {
  ConsoleFixture f;
  PaneId first = f.workspace->getActiveTab().activePaneId;
  f.backend->cwds[f.handleOf(first)] = "/work";

  REQUIRE(f.console.handleLine(":split v"));
  // The cwd lookup is asynchronous
  REQUIRE(f.console.getMountedPane() == optional<PaneId>(first));
  f.loop->runReady();

  PaneId second = f.workspace->getActiveTab().activePaneId;
  REQUIRE(second != first);
  REQUIRE(f.console.getMountedPane() == optional<PaneId>(second));
  REQUIRE(f.backend->requests.back().cwd == optional<string>("/work"));
  REQUIRE(!f.registry->get(first)->getDisplaySurface());

  f.console.handleLine(":split x");
  REQUIRE(f.console.getLastMessage() == "Usage: :split h|v");
}

TEST_CASE("Focus changes replay the pane's output", "[WorkspaceConsole]") {
  ConsoleFixture f;
  PaneId first = f.workspace->getActiveTab().activePaneId;
  f.backend->emitOutput(f.handleOf(first), "first-output");
  f.console.handleLine(":split h");
  f.loop->runReady();

  f.surface->clear();
  f.console.handleLine(":next");
  REQUIRE(f.console.getMountedPane() == optional<PaneId>(first));
  REQUIRE(f.surface->contains("first-output"));
}

TEST_CASE("Busy panes ask before closing", "[WorkspaceConsole]") {
  ConsoleFixture f;
  PaneId first = f.workspace->getActiveTab().activePaneId;
  f.console.handleLine(":split h");
  f.loop->runReady();
  PaneId second = f.workspace->getActiveTab().activePaneId;
  f.backend->emitOutput(f.handleOf(second), "still running");

  f.console.handleLine(":close");
  REQUIRE(f.registry->has(second));
  REQUIRE(f.console.getLastMessage().find("still busy") != string::npos);

  f.console.handleLine(":close!");
  REQUIRE(!f.registry->has(second));
  REQUIRE(f.console.getMountedPane() == optional<PaneId>(first));

  f.console.handleLine(":close");
  REQUIRE(f.registry->has(first));
  REQUIRE(f.console.getLastMessage() == "Cannot close the last pane of a tab");
}

TEST_CASE("Tab commands", "[WorkspaceConsole]") {
  ConsoleFixture f;
  TabId firstTab = f.workspace->getActiveTabId();

  f.console.handleLine(":tab new logs");
  f.loop->runReady();
  REQUIRE(f.workspace->getTabs().size() == 2);
  REQUIRE(f.workspace->getActiveTab().name == "logs");
  REQUIRE(f.console.getMountedPane() ==
          optional<PaneId>(f.workspace->getActiveTab().activePaneId));

  f.console.handleLine(":tab rename build output");
  REQUIRE(f.workspace->getActiveTab().name == "build output");

  f.console.handleLine(":tab prev");
  REQUIRE(f.workspace->getActiveTabId() == firstTab);
  f.console.handleLine(":tab next");
  REQUIRE(f.workspace->getActiveTab().name == "build output");

  f.console.handleLine(":tab close");
  REQUIRE(f.workspace->getTabs().size() == 1);
  REQUIRE(f.workspace->getActiveTabId() == firstTab);

  f.console.handleLine(":tab close");
  REQUIRE(f.console.getLastMessage() == "Cannot close the last tab");
}

TEST_CASE("Run and cancel step sequences", "[WorkspaceConsole]") {
  ConsoleFixture f;
  PaneId active = f.workspace->getActiveTab().activePaneId;
  BackendHandle handle = f.handleOf(active);

  f.console.handleLine(":run cd /tmp ;; ls ;;");
  REQUIRE(f.console.isRunningSteps());
  f.loop->runReady();
  REQUIRE(f.backend->writes[handle] == "cd /tmp\r");

  f.console.handleLine(":run pwd");
  REQUIRE(f.console.getLastMessage().find("already running") != string::npos);

  f.console.handleLine(":cancel");
  f.advance(1000);
  REQUIRE(!f.console.isRunningSteps());
  REQUIRE(f.console.getLastMessage().find("cancelled") != string::npos);

  f.console.handleLine(":cancel");
  REQUIRE(f.console.getLastMessage() == "No step sequence is running");

  f.console.handleLine(":run   ;;  ");
  REQUIRE(!f.console.isRunningSteps());
}

TEST_CASE("State, unknown commands and quit", "[WorkspaceConsole]") {
  ConsoleFixture f;

  f.console.handleLine(":state");
  json state = json::parse(f.console.getLastMessage());
  REQUIRE(state["tabs"].size() == 1);

  f.console.handleLine(":frobnicate");
  REQUIRE(f.console.getLastMessage() == "Unknown command: frobnicate");

  f.console.handleInput(":quit\nls\n");
  REQUIRE(f.console.isDone());
  // Lines after :quit are not typed anywhere
  PaneId active = f.workspace->getActiveTab().activePaneId;
  REQUIRE(f.backend->writes[f.handleOf(active)].empty());
}
