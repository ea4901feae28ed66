#include "Clock.hpp"
#include "EventLoop.hpp"
#include "PtySessionBackend.hpp"
#include "TestHeaders.hpp"

using namespace pmx;

namespace {
class RecordingSink : public SessionEventSink {
 public:
  virtual void onOutput(BackendHandle handle, const string& data) {
    output[handle].append(data);
  }
  virtual void onExit(BackendHandle handle) { exits.push_back(handle); }
  virtual void onError(BackendHandle handle, const string& message) {
    errors[handle] = message;
  }

  bool exited(BackendHandle handle) const {
    return std::find(exits.begin(), exits.end(), handle) != exits.end();
  }

  map<BackendHandle, string> output;
  vector<BackendHandle> exits;
  map<BackendHandle, string> errors;
};

struct PtyFixture {
  explicit PtyFixture(const string& shell = "/bin/sh")
      : loop(new EventLoop(shared_ptr<Clock>(new SteadyClock()))),
        backend(new PtySessionBackend(loop, shell)) {
    backend->setEventSink(&sink);
  }

  /** @brief Pumps the backend and the loop until `done` or ten seconds. */
  bool pumpUntil(std::function<bool()> done) {
    auto deadline =
        std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (std::chrono::steady_clock::now() < deadline) {
      if (done()) {
        return true;
      }
      backend->poll(50);
      loop->runReady();
    }
    return done();
  }

  BackendHandle create(const optional<string>& cwd = nullopt) {
    optional<BackendHandle> handle;
    string error;
    bool answered = false;
    backend->createSession(24, 80, cwd,
                           [&](optional<BackendHandle> h, const string& e) {
                             answered = true;
                             handle = h;
                             error = e;
                           });
    REQUIRE(!answered);
    REQUIRE(pumpUntil([&answered]() { return answered; }));
    INFO(error);
    REQUIRE(handle);
    return *handle;
  }

  /**
   * @brief Runs `command` and waits for its output.  The marker is built
   * by the shell so the echoed command line never matches it.
   */
  void runAndWait(BackendHandle handle, const string& command) {
    backend->writeInput(handle, command + "; echo pmx-$((40+2))\r");
    REQUIRE(pumpUntil([this, handle]() {
      return sink.output[handle].find("pmx-42") != string::npos;
    }));
  }

  RecordingSink sink;
  shared_ptr<EventLoop> loop;
  shared_ptr<PtySessionBackend> backend;
};
}  // namespace

TEST_CASE("A shell starts and echoes input", "[Pty]") {
  PtyFixture f;
  BackendHandle handle = f.create();
  REQUIRE(f.backend->numSessions() == 1);
  REQUIRE(f.backend->getChildPid(handle));

  f.runAndWait(handle, "echo $TERM");
  REQUIRE(f.sink.output[handle].find("xterm-256color") != string::npos);
  REQUIRE(f.sink.errors.empty());
}

TEST_CASE("The working directory follows the shell", "[Pty]") {
  PtyFixture f;
  string tmp = fs::canonical(fs::temp_directory_path()).string();
  BackendHandle handle = f.create(tmp);
  f.runAndWait(handle, "true");

  optional<string> cwd;
  bool answered = false;
  f.backend->queryCwd(handle, [&](optional<string> c) {
    answered = true;
    cwd = c;
  });
  REQUIRE(f.pumpUntil([&answered]() { return answered; }));
  REQUIRE(cwd == optional<string>(tmp));

  f.runAndWait(handle, "cd /");
  answered = false;
  f.backend->queryCwd(handle, [&](optional<string> c) {
    answered = true;
    cwd = c;
  });
  REQUIRE(f.pumpUntil([&answered]() { return answered; }));
  REQUIRE(cwd == optional<string>("/"));
}

TEST_CASE("Exiting the shell reports an exit", "[Pty]") {
  PtyFixture f;
  BackendHandle handle = f.create();
  f.runAndWait(handle, "true");

  f.backend->writeInput(handle, "exit\r");
  REQUIRE(f.pumpUntil([&f, handle]() { return f.sink.exited(handle); }));
  REQUIRE(f.backend->numSessions() == 0);
  REQUIRE(f.sink.errors.empty());

  // The handle is gone for good
  bool answered = false;
  optional<string> cwd = string("unset");
  f.backend->queryCwd(handle, [&](optional<string> c) {
    answered = true;
    cwd = c;
  });
  REQUIRE(f.pumpUntil([&answered]() { return answered; }));
  REQUIRE(!cwd);
}

TEST_CASE("Killed sessions emit nothing", "[Pty]") {
  PtyFixture f;
  BackendHandle handle = f.create();
  f.runAndWait(handle, "true");
  pid_t pid = *f.backend->getChildPid(handle);

  f.backend->killSession(handle);
  REQUIRE(f.backend->numSessions() == 0);
  REQUIRE(!f.backend->getChildPid(handle));
  // Already reaped
  REQUIRE(::kill(pid, 0) == -1);

  f.backend->writeInput(handle, "echo late\r");
  f.backend->poll(100);
  f.loop->runReady();
  REQUIRE(f.sink.exits.empty());
  REQUIRE(f.sink.errors.empty());
}

TEST_CASE("A missing shell exits right away", "[Pty]") {
  PtyFixture f("/nonexistent/panemux-shell");
  BackendHandle handle = f.create();
  REQUIRE(f.pumpUntil([&f, handle]() { return f.sink.exited(handle); }));
  REQUIRE(f.backend->numSessions() == 0);
}
