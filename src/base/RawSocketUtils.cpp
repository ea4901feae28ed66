#include "RawSocketUtils.hpp"

namespace pmx {
void RawSocketUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    int rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // The shell is not draining its input yet, back off briefly
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      LOG(ERROR) << "Cannot write to pty: " << strerror(localErrno);
      throw std::runtime_error("Cannot write to pty");
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to pty: descriptor closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

void RawSocketUtils::setNonBlocking(int fd) {
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL(opts);
  opts |= O_NONBLOCK;
  FATAL_FAIL(fcntl(fd, F_SETFL, opts));
}
}  // namespace pmx
