#ifndef __PMX_RAW_SOCKET_UTILS__
#define __PMX_RAW_SOCKET_UTILS__

#include "Headers.hpp"

namespace pmx {
/**
 * @brief Blocking write loop for pty master descriptors.
 */
class RawSocketUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on
   * EAGAIN/EINTR.  Throws `std::runtime_error` when the descriptor is dead.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /** @brief Puts the descriptor in non-blocking mode. */
  static void setNonBlocking(int fd);
};
}  // namespace pmx
#endif  // __PMX_RAW_SOCKET_UTILS__
