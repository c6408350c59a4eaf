// src/launch/LineSource.cpp
#include "gstmulti/launch/LineSource.h"

#include <poll.h>
#include <unistd.h>

#include <cerrno>

namespace gstmulti {

bool StreamLineSource::read_line(std::string& line) {
  if (cancelled_.load()) return false;
  return static_cast<bool>(std::getline(in_, line));
}

bool FdLineSource::read_line(std::string& line) {
  while (true) {
    const size_t nl = buf_.find('\n');
    if (nl != std::string::npos) {
      line = buf_.substr(0, nl);
      buf_.erase(0, nl + 1);
      return true;
    }
    if (eof_) {
      // Last line without a trailing newline.
      if (buf_.empty()) return false;
      line.swap(buf_);
      buf_.clear();
      return true;
    }
    if (cancelled_.load()) return false;

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    const int rc = ::poll(&pfd, 1, poll_ms_);
    if (rc < 0) {
      if (errno == EINTR) continue;
      eof_ = true;
      continue;
    }
    if (rc == 0) continue;

    char chunk[512];
    const ssize_t n = ::read(fd_, chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      eof_ = true;
    } else if (n == 0) {
      eof_ = true;
    } else {
      buf_.append(chunk, static_cast<size_t>(n));
    }
  }
}

} // namespace gstmulti
