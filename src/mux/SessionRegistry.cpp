#include "SessionRegistry.hpp"

namespace pmx {
namespace {
const string FAILED_TO_START_PREFIX = "\x1b[31mFailed to start shell: ";
const string PROCESS_EXITED_MESSAGE =
    "\r\n\x1b[38;5;241m[Process exited]\x1b[0m\r\n";
const string COLOR_RESET_NEWLINE = "\x1b[0m\r\n";
}  // namespace

SessionRegistry::SessionRegistry(shared_ptr<EventLoop> _loop,
                                 shared_ptr<SessionBackend> _backend,
                                 shared_ptr<ActivityTracker> _activityTracker,
                                 int _defaultRows, int _defaultCols,
                                 size_t _scrollbackBytes)
    : loop(_loop),
      backend(_backend),
      activityTracker(_activityTracker),
      defaultRows(_defaultRows),
      defaultCols(_defaultCols),
      scrollbackBytes(_scrollbackBytes),
      lifetimeToken(new bool(true)) {
  backend->setEventSink(this);
}

SessionRegistry::~SessionRegistry() {
  backend->setEventSink(NULL);
  for (auto& it : sessions) {
    if (it.second->isLive()) {
      backend->killSession(*(it.second->backendHandle));
    }
  }
}

shared_ptr<Session> SessionRegistry::acquire(
    PaneId paneId, const optional<string>& startupDirectory) {
  auto it = sessions.find(paneId);
  if (it != sessions.end()) {
    return it->second;
  }

  shared_ptr<Session> session(
      new Session(paneId, scrollbackBytes, defaultRows, defaultCols));
  session->startupDirectory = startupDirectory;
  sessions.insert(make_pair(paneId, session));
  LOG(INFO) << "Requesting backend for " << paneIdToString(paneId)
            << (startupDirectory ? " in " + *startupDirectory : string());

  weak_ptr<bool> alive(lifetimeToken);
  weak_ptr<Session> weakSession(session);
  shared_ptr<SessionBackend> backendRef(backend);
  backend->createSession(
      session->rows, session->cols, startupDirectory,
      [this, alive, weakSession, backendRef, paneId](
          optional<BackendHandle> handle, const string& error) {
        shared_ptr<Session> s = weakSession.lock();
        if (alive.expired() || !s) {
          // Registry or session went away while the backend was starting
          if (handle) {
            LOG(INFO) << "Releasing orphan handle " << *handle << " for "
                      << paneIdToString(paneId);
            backendRef->killSession(*handle);
          }
          return;
        }
        handleCreated(s, handle, error);
      });
  return session;
}

void SessionRegistry::handleCreated(const shared_ptr<Session>& session,
                                    optional<BackendHandle> handle,
                                    const string& error) {
  PaneId paneId = session->paneId;
  auto it = sessions.find(paneId);
  if (it == sessions.end() || it->second != session) {
    // The pane was closed while we waited; never attach to it.
    if (handle) {
      LOG(INFO) << "Releasing orphan handle " << *handle << " for "
                << paneIdToString(paneId);
      backend->killSession(*handle);
    }
    return;
  }

  if (!handle) {
    LOG(ERROR) << "Backend failed for " << paneIdToString(paneId) << ": "
               << error;
    session->failure = error.empty() ? string("unknown error") : error;
    emit(session, FAILED_TO_START_PREFIX + *session->failure +
                      COLOR_RESET_NEWLINE);
    return;
  }

  if (session->backendHandle) {
    STFATAL << "Tried to attach a second handle to " << paneIdToString(paneId);
  }
  session->backendHandle = *handle;
  handleToPane[*handle] = paneId;
  LOG(INFO) << "Attached handle " << *handle << " to "
            << paneIdToString(paneId);
  if (session->rows != defaultRows || session->cols != defaultCols) {
    // A resize arrived before the handle did
    backend->resize(*handle, session->rows, session->cols);
  }
  if (backendAttachedCallback) {
    backendAttachedCallback(paneId, *handle);
  }
}

void SessionRegistry::attachDisplay(PaneId paneId,
                                    shared_ptr<DisplaySurface> surface) {
  auto it = sessions.find(paneId);
  if (it == sessions.end()) {
    VLOG(1) << "Tried to attach a display to unknown "
            << paneIdToString(paneId);
    return;
  }
  shared_ptr<Session> session = it->second;
  shared_ptr<DisplaySurface> previous = session->displaySurface.lock();
  if (previous == surface) {
    return;
  }
  session->displaySurface = surface;
  if (previous) {
    previous->onDetached();
  }
  VLOG(1) << "Attached display to " << paneIdToString(paneId);
  if (surface && !session->scrollback.empty()) {
    surface->write(session->scrollback.contents());
  }
}

void SessionRegistry::detachDisplay(PaneId paneId,
                                    const shared_ptr<DisplaySurface>& surface) {
  auto it = sessions.find(paneId);
  if (it == sessions.end()) {
    return;
  }
  shared_ptr<Session> session = it->second;
  if (session->displaySurface.lock() == surface) {
    session->displaySurface.reset();
    VLOG(1) << "Detached display from " << paneIdToString(paneId);
  }
}

void SessionRegistry::release(PaneId paneId) {
  auto it = sessions.find(paneId);
  if (it == sessions.end()) {
    VLOG(1) << "Tried to release unknown " << paneIdToString(paneId);
    return;
  }
  shared_ptr<Session> session = it->second;
  sessions.erase(it);
  if (session->backendHandle) {
    handleToPane.erase(*session->backendHandle);
    if (!session->exited) {
      LOG(INFO) << "Killing handle " << *session->backendHandle << " for "
                << paneIdToString(paneId);
      backend->killSession(*session->backendHandle);
    }
  }
  shared_ptr<DisplaySurface> surface = session->displaySurface.lock();
  session->displaySurface.reset();
  if (surface) {
    surface->onDetached();
  }
  activityTracker->forget(paneId);
}

void SessionRegistry::getWorkingDirectory(PaneId paneId,
                                          SessionBackend::CwdCallback callback) {
  shared_ptr<Session> session = get(paneId);
  if (!session || !session->isLive()) {
    loop->post([callback]() { callback(nullopt); });
    return;
  }
  weak_ptr<bool> alive(lifetimeToken);
  weak_ptr<Session> weakSession(session);
  backend->queryCwd(*session->backendHandle,
                    [alive, weakSession, callback](optional<string> cwd) {
                      if (cwd && cwd->empty()) {
                        cwd.reset();
                      }
                      shared_ptr<Session> s = weakSession.lock();
                      if (!alive.expired() && s && cwd) {
                        s->lastKnownWorkingDirectory = cwd;
                      }
                      callback(cwd);
                    });
}

void SessionRegistry::writeInput(PaneId paneId, const string& data) {
  shared_ptr<Session> session = get(paneId);
  if (!session || !session->isLive()) {
    VLOG(1) << "Dropping input for " << paneIdToString(paneId)
            << ": no live session";
    return;
  }
  backend->writeInput(*session->backendHandle, data);
}

void SessionRegistry::resize(PaneId paneId, int rows, int cols) {
  shared_ptr<Session> session = get(paneId);
  if (!session || rows <= 0 || cols <= 0) {
    return;
  }
  if (session->rows == rows && session->cols == cols) {
    return;
  }
  session->rows = rows;
  session->cols = cols;
  if (session->isLive()) {
    backend->resize(*session->backendHandle, rows, cols);
  }
}

shared_ptr<Session> SessionRegistry::get(PaneId paneId) const {
  auto it = sessions.find(paneId);
  if (it == sessions.end()) {
    return shared_ptr<Session>();
  }
  return it->second;
}

vector<PaneId> SessionRegistry::getPaneIds() const {
  vector<PaneId> ids;
  for (const auto& it : sessions) {
    ids.push_back(it.first);
  }
  return ids;
}

shared_ptr<Session> SessionRegistry::sessionForHandle(
    BackendHandle handle) const {
  auto it = handleToPane.find(handle);
  if (it == handleToPane.end()) {
    return shared_ptr<Session>();
  }
  return get(it->second);
}

void SessionRegistry::onOutput(BackendHandle handle, const string& data) {
  shared_ptr<Session> session = sessionForHandle(handle);
  if (!session) {
    VLOG(2) << "Output for unknown handle " << handle;
    return;
  }
  activityTracker->recordActivity(session->paneId);
  emit(session, data);
}

void SessionRegistry::onExit(BackendHandle handle) {
  shared_ptr<Session> session = sessionForHandle(handle);
  if (!session) {
    return;
  }
  LOG(INFO) << "Session for " << paneIdToString(session->paneId)
            << " exited";
  session->exited = true;
  handleToPane.erase(handle);
  emit(session, PROCESS_EXITED_MESSAGE);
}

void SessionRegistry::onError(BackendHandle handle, const string& message) {
  shared_ptr<Session> session = sessionForHandle(handle);
  if (!session) {
    return;
  }
  LOG(ERROR) << "Backend error on " << paneIdToString(session->paneId) << ": "
             << message;
  emit(session, "\r\n\x1b[31m[Error: " + message + "]" + COLOR_RESET_NEWLINE);
}

void SessionRegistry::emit(const shared_ptr<Session>& session,
                           const string& data) {
  session->scrollback.append(data);
  shared_ptr<DisplaySurface> surface = session->displaySurface.lock();
  if (surface) {
    surface->write(data);
  }
}
}  // namespace pmx
