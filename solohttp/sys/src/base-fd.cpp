#include "solohttp/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "solohttp/log.hpp"
#include "solohttp/platform.hpp"

namespace solohttp {

namespace {

// Returns 0 on success, the errno of the failed close otherwise.
int CloseRetryingOnEintr(NativeHandle fd) noexcept {
  int ret;
  do {
    ret = ::close(fd);
  } while (ret == -1 && errno == EINTR);
  return ret == 0 ? 0 : errno;
}

}  // namespace

void BaseFd::reset(NativeHandle newFd) noexcept {
  if (_fd != kClosedFd && _fd != newFd) {
    const int err = CloseRetryingOnEintr(_fd);
    if (err == 0) {
      log::debug("fd # {} closed", _fd);
    } else {
      // the descriptor is released by the kernel even when close reports an error
      log::error("Error while closing fd # {}: {}", _fd, std::strerror(err));
    }
  }
  _fd = newFd;
}

}  // namespace solohttp
