#ifndef __PMX_FAKE_SESSION_BACKEND__
#define __PMX_FAKE_SESSION_BACKEND__

#include "EventLoop.hpp"
#include "SessionBackend.hpp"

namespace pmx {
/**
 * @brief In-memory backend.  Create requests either complete on the next
 * loop turn (`autoCreate`) or wait until the test resolves them, which lets
 * tests interleave creation with pane removal.
 */
class FakeSessionBackend : public SessionBackend {
 public:
  struct CreateRequest {
    int rows;
    int cols;
    optional<string> cwd;
    CreateCallback callback;
  };

  struct ResizeRecord {
    BackendHandle handle;
    int rows;
    int cols;
  };

  explicit FakeSessionBackend(shared_ptr<EventLoop> _loop,
                              bool _autoCreate = true)
      : loop(_loop), autoCreate(_autoCreate), nextHandle(100) {}

  virtual void createSession(int rows, int cols, const optional<string>& cwd,
                             CreateCallback callback) {
    CreateRequest request;
    request.rows = rows;
    request.cols = cols;
    request.cwd = cwd;
    request.callback = callback;
    requests.push_back(request);
    pending.push_back(request);
    if (autoCreate) {
      loop->post([this]() { completeCreate(); });
    }
  }

  virtual void writeInput(BackendHandle handle, const string& data) {
    writes[handle].append(data);
  }

  virtual void resize(BackendHandle handle, int rows, int cols) {
    ResizeRecord record;
    record.handle = handle;
    record.rows = rows;
    record.cols = cols;
    resizes.push_back(record);
  }

  virtual void killSession(BackendHandle handle) {
    killed.push_back(handle);
    live.erase(handle);
  }

  virtual void queryCwd(BackendHandle handle, CwdCallback callback) {
    cwdQueries++;
    optional<string> answer;
    auto it = cwds.find(handle);
    if (it != cwds.end()) {
      answer = it->second;
    }
    loop->post([callback, answer]() { callback(answer); });
  }

  /** @brief Completes the oldest pending create with a fresh handle. */
  BackendHandle completeCreate() {
    if (pending.empty()) {
      STFATAL << "No pending create request";
    }
    CreateRequest request = pending.front();
    pending.pop_front();
    BackendHandle handle = nextHandle++;
    live.insert(handle);
    request.callback(handle, string());
    return handle;
  }

  /** @brief Fails the oldest pending create. */
  void failCreate(const string& error) {
    if (pending.empty()) {
      STFATAL << "No pending create request";
    }
    CreateRequest request = pending.front();
    pending.pop_front();
    request.callback(nullopt, error);
  }

  void emitOutput(BackendHandle handle, const string& data) {
    if (sink) {
      sink->onOutput(handle, data);
    }
  }
  void emitExit(BackendHandle handle) {
    live.erase(handle);
    if (sink) {
      sink->onExit(handle);
    }
  }
  void emitError(BackendHandle handle, const string& message) {
    if (sink) {
      sink->onError(handle, message);
    }
  }

  inline bool isLive(BackendHandle handle) const {
    return live.find(handle) != live.end();
  }
  inline bool wasKilled(BackendHandle handle) const {
    return std::find(killed.begin(), killed.end(), handle) != killed.end();
  }
  inline SessionEventSink* getSink() const { return sink; }

  shared_ptr<EventLoop> loop;
  bool autoCreate;
  BackendHandle nextHandle;
  vector<CreateRequest> requests;
  deque<CreateRequest> pending;
  set<BackendHandle> live;
  map<BackendHandle, string> writes;
  vector<ResizeRecord> resizes;
  vector<BackendHandle> killed;
  map<BackendHandle, string> cwds;
  int cwdQueries = 0;
};
}  // namespace pmx

#endif  // __PMX_FAKE_SESSION_BACKEND__
