#ifndef __PMX_TERMINAL_SURFACE__
#define __PMX_TERMINAL_SURFACE__

#include "DisplaySurface.hpp"
#include "Headers.hpp"

namespace pmx {
/**
 * @brief Display surface that copies pane output straight to a descriptor
 * (stdout by default).
 */
class TerminalSurface : public DisplaySurface {
 public:
  explicit TerminalSurface(int _fd = STDOUT_FILENO);
  virtual ~TerminalSurface() {}

  virtual void write(const string& data);
  virtual void onDetached();

 protected:
  int fd;
};
}  // namespace pmx

#endif  // __PMX_TERMINAL_SURFACE__
