#include "MuxTestFixture.hpp"
#include "TestHeaders.hpp"

using namespace pmx;

TEST_CASE("Sessions are created lazily and reused", "[SessionRegistry]") {
  MuxTestFixture f;
  REQUIRE(f.registry->numSessions() == 0);

  shared_ptr<Session> session = f.registry->acquire(1, string("/tmp"));
  REQUIRE(session);
  REQUIRE(f.registry->has(1));
  // The handle arrives asynchronously
  REQUIRE(!session->getBackendHandle());
  REQUIRE(f.backend->requests.size() == 1);
  REQUIRE(f.backend->requests[0].rows == 24);
  REQUIRE(f.backend->requests[0].cols == 80);
  REQUIRE(f.backend->requests[0].cwd == optional<string>("/tmp"));

  f.loop->runReady();
  REQUIRE(session->getBackendHandle());
  REQUIRE(session->isLive());

  shared_ptr<Session> again = f.registry->acquire(1);
  REQUIRE(again == session);
  REQUIRE(f.backend->requests.size() == 1);
}

TEST_CASE("Only the latest surface receives output", "[SessionRegistry]") {
  MuxTestFixture f;
  shared_ptr<FakeDisplaySurface> s1(new FakeDisplaySurface());
  shared_ptr<FakeDisplaySurface> s2(new FakeDisplaySurface());

  shared_ptr<Session> session = f.registry->acquire(1);
  f.loop->runReady();
  BackendHandle handle = *session->getBackendHandle();

  f.registry->attachDisplay(1, s1);
  f.registry->attachDisplay(1, s2);
  REQUIRE(s1->detachCount == 1);
  REQUIRE(session->getDisplaySurface() == s2);

  shared_ptr<Session> again = f.registry->acquire(1);
  REQUIRE(again == session);
  REQUIRE(*again->getBackendHandle() == handle);

  f.backend->emitOutput(handle, "hello");
  REQUIRE(s2->output == "hello");
  REQUIRE(s1->output.empty());

  // Attaching the current surface again changes nothing
  f.registry->attachDisplay(1, s2);
  REQUIRE(s2->detachCount == 0);
  REQUIRE(s2->output == "hello");
}

TEST_CASE("Scrollback is replayed into a remounted surface",
          "[SessionRegistry]") {
  MuxTestFixture f;
  shared_ptr<FakeDisplaySurface> first(new FakeDisplaySurface());
  shared_ptr<Session> session = f.registry->acquire(1);
  f.loop->runReady();
  BackendHandle handle = *session->getBackendHandle();

  f.registry->attachDisplay(1, first);
  f.backend->emitOutput(handle, "$ ls\r\n");
  f.registry->detachDisplay(1, first);
  REQUIRE(!session->getDisplaySurface());

  // Output while nothing is mounted is kept too
  f.backend->emitOutput(handle, "README.md\r\n");
  REQUIRE(first->output == "$ ls\r\n");

  shared_ptr<FakeDisplaySurface> second(new FakeDisplaySurface());
  f.registry->attachDisplay(1, second);
  REQUIRE(second->output == "$ ls\r\nREADME.md\r\n");
  REQUIRE(session->isLive());
}

TEST_CASE("Detaching a stale surface keeps the current binding",
          "[SessionRegistry]") {
  MuxTestFixture f;
  shared_ptr<FakeDisplaySurface> oldSurface(new FakeDisplaySurface());
  shared_ptr<FakeDisplaySurface> newSurface(new FakeDisplaySurface());
  shared_ptr<Session> session = f.registry->acquire(1);
  f.registry->attachDisplay(1, oldSurface);
  f.registry->attachDisplay(1, newSurface);

  f.registry->detachDisplay(1, oldSurface);
  REQUIRE(session->getDisplaySurface() == newSurface);
}

TEST_CASE("The registry does not keep surfaces alive", "[SessionRegistry]") {
  MuxTestFixture f;
  shared_ptr<Session> session = f.registry->acquire(1);
  f.loop->runReady();
  {
    shared_ptr<FakeDisplaySurface> surface(new FakeDisplaySurface());
    f.registry->attachDisplay(1, surface);
  }
  REQUIRE(!session->getDisplaySurface());
  // Output with a dead surface only goes to scrollback
  f.backend->emitOutput(*session->getBackendHandle(), "x");
  REQUIRE(session->getScrollback().contents() == "x");
}

TEST_CASE("Backend failure is shown inline and not retried",
          "[SessionRegistry]") {
  MuxTestFixture f(false);
  shared_ptr<FakeDisplaySurface> surface(new FakeDisplaySurface());
  shared_ptr<Session> session = f.registry->acquire(1);
  f.registry->attachDisplay(1, surface);

  f.backend->failCreate("out of ptys");
  REQUIRE(session->hasFailed());
  REQUIRE(*session->getFailure() == "out of ptys");
  REQUIRE(!session->getBackendHandle());
  REQUIRE(surface->contains("Failed to start shell: out of ptys"));

  // Still the same failed session, no second request
  REQUIRE(f.registry->acquire(1) == session);
  REQUIRE(f.backend->requests.size() == 1);

  // Input has nowhere to go
  f.registry->writeInput(1, "ls\n");
  REQUIRE(f.backend->writes.empty());

  // A fresh surface still sees the failure
  shared_ptr<FakeDisplaySurface> later(new FakeDisplaySurface());
  f.registry->attachDisplay(1, later);
  REQUIRE(later->contains("Failed to start shell"));
}

TEST_CASE("Orphan handles are killed", "[SessionRegistry]") {
  MuxTestFixture f(false);

  SECTION("Pane released before the backend answered") {
    f.registry->acquire(1);
    f.registry->release(1);
    REQUIRE(!f.registry->has(1));

    BackendHandle handle = f.backend->completeCreate();
    REQUIRE(f.backend->wasKilled(handle));
    REQUIRE(!f.registry->has(1));
  }

  SECTION("Pane re-acquired before the first answer") {
    f.registry->acquire(1);
    f.registry->release(1);
    shared_ptr<Session> newer = f.registry->acquire(1);
    REQUIRE(f.backend->requests.size() == 2);

    BackendHandle stale = f.backend->completeCreate();
    REQUIRE(f.backend->wasKilled(stale));
    REQUIRE(!newer->getBackendHandle());

    BackendHandle fresh = f.backend->completeCreate();
    REQUIRE(!f.backend->wasKilled(fresh));
    REQUIRE(newer->getBackendHandle() == optional<BackendHandle>(fresh));
  }

  SECTION("Registry destroyed before the backend answered") {
    f.registry->acquire(1);
    f.registry.reset();
    BackendHandle handle = f.backend->completeCreate();
    REQUIRE(f.backend->wasKilled(handle));
  }
}

TEST_CASE("Release kills the process and forgets the pane",
          "[SessionRegistry]") {
  MuxTestFixture f;
  shared_ptr<FakeDisplaySurface> surface(new FakeDisplaySurface());
  shared_ptr<Session> session = f.registry->acquire(1);
  f.registry->attachDisplay(1, surface);
  f.loop->runReady();
  BackendHandle handle = *session->getBackendHandle();
  f.backend->emitOutput(handle, "busy");
  REQUIRE(f.activity->isActive(1));

  f.registry->release(1);
  REQUIRE(f.backend->wasKilled(handle));
  REQUIRE(!f.registry->has(1));
  REQUIRE(surface->detachCount == 1);
  REQUIRE(!f.activity->lastActivity(1));

  // Late events for the killed handle are ignored
  surface->clear();
  f.backend->emitOutput(handle, "late");
  REQUIRE(surface->output.empty());

  // Releasing twice is harmless
  f.registry->release(1);
  REQUIRE(f.backend->killed.size() == 1);
}

TEST_CASE("Exit and error events are written inline", "[SessionRegistry]") {
  MuxTestFixture f;
  shared_ptr<FakeDisplaySurface> surface(new FakeDisplaySurface());
  shared_ptr<Session> session = f.registry->acquire(1);
  f.registry->attachDisplay(1, surface);
  f.loop->runReady();
  BackendHandle handle = *session->getBackendHandle();

  f.backend->emitError(handle, "read failed");
  REQUIRE(surface->contains("[Error: read failed]"));

  f.backend->emitExit(handle);
  REQUIRE(surface->contains("[Process exited]"));
  REQUIRE(session->hasExited());
  REQUIRE(!session->isLive());

  // An exited session is not killed again on release
  f.registry->release(1);
  REQUIRE(f.backend->killed.empty());
}

TEST_CASE("Output marks the pane active", "[SessionRegistry]") {
  MuxTestFixture f;
  shared_ptr<Session> session = f.registry->acquire(1);
  f.loop->runReady();
  REQUIRE(!f.activity->isActive(1));
  f.backend->emitOutput(*session->getBackendHandle(), "tick");
  REQUIRE(f.activity->isActive(1));
  f.clock->advance(3000);
  REQUIRE(!f.activity->isActive(1));
}

TEST_CASE("Working directory queries", "[SessionRegistry]") {
  MuxTestFixture f;
  shared_ptr<Session> session = f.registry->acquire(1);
  f.loop->runReady();
  BackendHandle handle = *session->getBackendHandle();

  SECTION("A live session answers and remembers the directory") {
    f.backend->cwds[handle] = "/home/dev/project";
    optional<string> answer;
    bool called = false;
    f.registry->getWorkingDirectory(1, [&](optional<string> cwd) {
      called = true;
      answer = cwd;
    });
    REQUIRE(!called);
    f.loop->runReady();
    REQUIRE(called);
    REQUIRE(answer == optional<string>("/home/dev/project"));
    REQUIRE(session->getLastKnownWorkingDirectory() == answer);
  }

  SECTION("An empty answer is unknown") {
    f.backend->cwds[handle] = "";
    optional<string> answer = string("unset");
    f.registry->getWorkingDirectory(1,
                                    [&](optional<string> cwd) { answer = cwd; });
    f.loop->runReady();
    REQUIRE(!answer);
    REQUIRE(!session->getLastKnownWorkingDirectory());
  }

  SECTION("Unknown panes answer later with nothing") {
    bool called = false;
    optional<string> answer = string("unset");
    f.registry->getWorkingDirectory(99, [&](optional<string> cwd) {
      called = true;
      answer = cwd;
    });
    REQUIRE(!called);
    f.loop->runReady();
    REQUIRE(called);
    REQUIRE(!answer);
    REQUIRE(f.backend->cwdQueries == 0);
  }
}

TEST_CASE("Input and resize reach the backend", "[SessionRegistry]") {
  MuxTestFixture f(false);
  shared_ptr<Session> session = f.registry->acquire(1);

  // Before the handle arrives
  f.registry->writeInput(1, "dropped");
  f.registry->resize(1, 40, 120);
  REQUIRE(f.backend->resizes.empty());

  BackendHandle handle = f.backend->completeCreate();
  REQUIRE(f.backend->writes.empty());
  // The early resize is applied once the handle exists
  REQUIRE(f.backend->resizes.size() == 1);
  REQUIRE(f.backend->resizes[0].handle == handle);
  REQUIRE(f.backend->resizes[0].rows == 40);
  REQUIRE(f.backend->resizes[0].cols == 120);

  f.registry->writeInput(1, "ls\r");
  REQUIRE(f.backend->writes[handle] == "ls\r");

  f.registry->resize(1, 40, 120);
  REQUIRE(f.backend->resizes.size() == 1);
  f.registry->resize(1, 30, 100);
  REQUIRE(f.backend->resizes.size() == 2);
  REQUIRE(session->getRows() == 30);
  REQUIRE(session->getCols() == 100);
}

TEST_CASE("Attached handles are reported to observers", "[SessionRegistry]") {
  MuxTestFixture f;
  vector<pair<PaneId, BackendHandle>> seen;
  f.registry->setBackendAttachedCallback(
      [&seen](PaneId paneId, BackendHandle handle) {
        seen.push_back(make_pair(paneId, handle));
      });
  shared_ptr<Session> session = f.registry->acquire(5);
  f.loop->runReady();
  REQUIRE(seen.size() == 1);
  REQUIRE(seen[0].first == 5);
  REQUIRE(seen[0].second == *session->getBackendHandle());
}
