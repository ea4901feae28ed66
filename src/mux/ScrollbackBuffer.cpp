#include "ScrollbackBuffer.hpp"

namespace pmx {
ScrollbackBuffer::ScrollbackBuffer(size_t _maxBytes)
    : maxBytes(_maxBytes), totalBytes(0) {}

void ScrollbackBuffer::append(const string& data) {
  if (data.empty() || maxBytes == 0) {
    return;
  }
  if (data.length() >= maxBytes) {
    chunks.clear();
    chunks.push_back(data.substr(data.length() - maxBytes));
    totalBytes = maxBytes;
    return;
  }
  chunks.push_back(data);
  totalBytes += data.length();
  while (totalBytes > maxBytes) {
    totalBytes -= chunks.front().length();
    chunks.pop_front();
  }
}

string ScrollbackBuffer::contents() const {
  string retval;
  retval.reserve(totalBytes);
  for (const string& it : chunks) {
    retval.append(it);
  }
  return retval;
}

void ScrollbackBuffer::clear() {
  chunks.clear();
  totalBytes = 0;
}
}  // namespace pmx
