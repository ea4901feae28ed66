#include "TerminalSurface.hpp"

#include "RawSocketUtils.hpp"

namespace pmx {
TerminalSurface::TerminalSurface(int _fd) : fd(_fd) {}

void TerminalSurface::write(const string& data) {
  try {
    RawSocketUtils::writeAll(fd, data.c_str(), data.length());
  } catch (const std::runtime_error& re) {
    STERROR << "Lost the terminal: " << re.what();
  }
}

void TerminalSurface::onDetached() {
  VLOG(1) << "Surface on fd " << fd << " detached";
}
}  // namespace pmx
