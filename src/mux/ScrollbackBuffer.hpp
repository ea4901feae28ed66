#ifndef __PMX_SCROLLBACK_BUFFER__
#define __PMX_SCROLLBACK_BUFFER__

#include "Headers.hpp"

namespace pmx {
/**
 * @brief Bounded record of recent session output, replayed into a surface
 * when a pane is remounted.
 *
 * Chunks are kept as they arrived.  Once the byte limit is exceeded the
 * oldest chunks are dropped; a single oversized chunk keeps only its tail.
 */
class ScrollbackBuffer {
 public:
  static constexpr size_t DEFAULT_MAX_BYTES = 128 * 1024;

  explicit ScrollbackBuffer(size_t _maxBytes = DEFAULT_MAX_BYTES);

  void append(const string& data);
  string contents() const;
  void clear();

  inline size_t size() const { return totalBytes; }
  inline bool empty() const { return totalBytes == 0; }
  inline size_t getMaxBytes() const { return maxBytes; }

 protected:
  size_t maxBytes;
  size_t totalBytes;
  deque<string> chunks;
};
}  // namespace pmx

#endif  // __PMX_SCROLLBACK_BUFFER__
