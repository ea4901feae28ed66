#ifndef __PMX_CLOCK__
#define __PMX_CLOCK__

#include "Headers.hpp"

namespace pmx {
/**
 * @brief Millisecond time source.  Everything that compares timestamps reads
 * time through this so tests can drive it by hand.
 */
class Clock {
 public:
  virtual ~Clock() {}
  virtual int64_t nowMs() = 0;
};

class SteadyClock : public Clock {
 public:
  virtual int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
  }
};
}  // namespace pmx

#endif  // __PMX_CLOCK__
