#include "PtySessionBackend.hpp"

#include "RawSocketUtils.hpp"

namespace pmx {
#define BUF_SIZE (16 * 1024)

PtySessionBackend::PtySessionBackend(shared_ptr<EventLoop> _loop,
                                     const string& _shell)
    : loop(_loop), shell(_shell), nextHandle(1), lifetimeToken(new bool(true)) {}

PtySessionBackend::~PtySessionBackend() {
  vector<BackendHandle> handles;
  for (auto& it : children) {
    handles.push_back(it.first);
  }
  for (BackendHandle handle : handles) {
    killSession(handle);
  }
}

void PtySessionBackend::createSession(int rows, int cols,
                                      const optional<string>& cwd,
                                      CreateCallback callback) {
  weak_ptr<bool> alive(lifetimeToken);
  loop->post([this, alive, rows, cols, cwd, callback]() {
    if (alive.expired()) {
      return;
    }
    BackendHandle handle;
    try {
      handle = spawn(rows, cols, cwd);
    } catch (const std::runtime_error& re) {
      LOG(ERROR) << "Could not start " << shell << ": " << re.what();
      callback(nullopt, re.what());
      return;
    }
    callback(handle, string());
  });
}

BackendHandle PtySessionBackend::spawn(int rows, int cols,
                                       const optional<string>& cwd) {
  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_row = rows;
  win.ws_col = cols;

  int masterFd;
  pid_t pid = forkpty(&masterFd, NULL, NULL, &win);
  switch (pid) {
    case -1:
      throw std::runtime_error(string("forkpty failed: ") +
                               strerror(GetErrno()));
    case 0: {
      runShell(cwd);
      // Only reached when exec failed
      _exit(127);
    }
    default:
      break;
  }

  RawSocketUtils::setNonBlocking(masterFd);
  BackendHandle handle = nextHandle++;
  Child child;
  child.masterFd = masterFd;
  child.pid = pid;
  children[handle] = child;
  VLOG(1) << "pty opened " << masterFd << " for handle " << handle
          << " (pid " << pid << ")";
  return handle;
}

void PtySessionBackend::runShell(const optional<string>& cwd) {
  if (!cwd || ::chdir(cwd->c_str()) != 0) {
    passwd* pwd = getpwuid(getuid());
    if (pwd == NULL || ::chdir(pwd->pw_dir) != 0) {
      // Keep the directory inherited from the multiplexer
    }
  }
  setenv("TERM", "xterm-256color", 1);
  setenv("PANEMUX_VERSION", PANEMUX_VERSION, 1);
  // The shell remembers the inherited SIGCHLD disposition, so hand it the
  // default one.
  signal(SIGCHLD, SIG_DFL);
  execl(shell.c_str(), shell.c_str(), "-l", NULL);
  string message = string("exec ") + shell + ": " + strerror(GetErrno()) + "\r\n";
  if (::write(STDOUT_FILENO, message.c_str(), message.length()) < 0) {
    _exit(126);
  }
}

void PtySessionBackend::writeInput(BackendHandle handle, const string& data) {
  auto it = children.find(handle);
  if (it == children.end()) {
    VLOG(1) << "Dropping input for unknown handle " << handle;
    return;
  }
  try {
    RawSocketUtils::writeAll(it->second.masterFd, &data[0], data.length());
  } catch (const std::runtime_error& re) {
    finishChild(handle, re.what());
  }
}

void PtySessionBackend::resize(BackendHandle handle, int rows, int cols) {
  auto it = children.find(handle);
  if (it == children.end()) {
    return;
  }
  winsize tmpwin;
  tmpwin.ws_row = rows;
  tmpwin.ws_col = cols;
  tmpwin.ws_xpixel = 0;
  tmpwin.ws_ypixel = 0;
  if (ioctl(it->second.masterFd, TIOCSWINSZ, &tmpwin) < 0) {
    LOG(WARNING) << "Could not resize handle " << handle << ": "
                 << strerror(GetErrno());
  }
}

void PtySessionBackend::killSession(BackendHandle handle) {
  auto it = children.find(handle);
  if (it == children.end()) {
    return;
  }
  Child child = it->second;
  children.erase(it);
  LOG(INFO) << "Killing handle " << handle << " (pid " << child.pid << ")";
  ::kill(child.pid, SIGKILL);
  reap(child.pid);
  ::close(child.masterFd);
}

void PtySessionBackend::queryCwd(BackendHandle handle, CwdCallback callback) {
  weak_ptr<bool> alive(lifetimeToken);
  loop->post([this, alive, handle, callback]() {
    if (alive.expired()) {
      return;
    }
    auto it = children.find(handle);
    if (it == children.end()) {
      callback(nullopt);
      return;
    }
    // Prefer the foreground job, so a split made while `cd`-ing inside a
    // subshell follows it.
    vector<pid_t> candidates;
    pid_t foreground = tcgetpgrp(it->second.masterFd);
    if (foreground > 0) {
      candidates.push_back(foreground);
    }
    candidates.push_back(it->second.pid);
    for (pid_t pid : candidates) {
      std::error_code ec;
      fs::path cwd =
          fs::read_symlink("/proc/" + to_string(pid) + "/cwd", ec);
      if (!ec && !cwd.empty()) {
        callback(cwd.string());
        return;
      }
    }
    VLOG(1) << "Could not resolve cwd for handle " << handle;
    callback(nullopt);
  });
}

int PtySessionBackend::poll(int64_t timeoutMs) {
  fd_set rfd;
  timeval tv;
  FD_ZERO(&rfd);
  int maxFd = -1;
  for (auto& it : children) {
    FD_SET(it.second.masterFd, &rfd);
    maxFd = max(maxFd, it.second.masterFd);
  }
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  int rc = select(maxFd + 1, &rfd, NULL, NULL, &tv);
  if (rc < 0) {
    if (GetErrno() == EINTR) {
      return 0;
    }
    FATAL_FAIL(rc);
  }
  if (rc == 0) {
    return 0;
  }

  // Sink callbacks may kill other handles, so look each one up again
  vector<BackendHandle> ready;
  for (auto& it : children) {
    if (FD_ISSET(it.second.masterFd, &rfd)) {
      ready.push_back(it.first);
    }
  }

  int numRead = 0;
  char b[BUF_SIZE];
  for (BackendHandle handle : ready) {
    auto it = children.find(handle);
    if (it == children.end()) {
      continue;
    }
    ssize_t bytes = ::read(it->second.masterFd, b, BUF_SIZE);
    numRead++;
    if (bytes > 0) {
      if (sink) {
        sink->onOutput(handle, string(b, bytes));
      }
    } else if (bytes == 0) {
      LOG(INFO) << "Terminal session ended for handle " << handle;
      finishChild(handle, string());
    } else {
      int localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        continue;
      }
      if (localErrno == EIO) {
        // Linux reports a hung-up slave as EIO instead of EOF
        LOG(INFO) << "Terminal session ended for handle " << handle;
        finishChild(handle, string());
      } else {
        finishChild(handle, strerror(localErrno));
      }
    }
  }
  return numRead;
}

optional<pid_t> PtySessionBackend::getChildPid(BackendHandle handle) const {
  auto it = children.find(handle);
  if (it == children.end()) {
    return nullopt;
  }
  return it->second.pid;
}

void PtySessionBackend::finishChild(BackendHandle handle,
                                    const string& error) {
  auto it = children.find(handle);
  if (it == children.end()) {
    return;
  }
  Child child = it->second;
  children.erase(it);
  if (!error.empty()) {
    LOG(ERROR) << "Terminal failure on handle " << handle << ": " << error;
    // The shell may still be running behind a broken descriptor
    ::kill(child.pid, SIGKILL);
  }
  reap(child.pid);
  ::close(child.masterFd);
  if (sink) {
    if (!error.empty()) {
      sink->onError(handle, error);
    }
    sink->onExit(handle);
  }
}

void PtySessionBackend::reap(pid_t pid) {
  siginfo_t childInfo;
  while (true) {
    int rc = waitid(P_PID, pid, &childInfo, WEXITED);
    if (rc == 0) {
      return;
    }
    if (GetErrno() == EINTR) {
      continue;
    }
    if (GetErrno() != ECHILD) {
      LOG(WARNING) << "waitid failed for pid " << pid << ": "
                   << strerror(GetErrno());
    }
    return;
  }
}
}  // namespace pmx
