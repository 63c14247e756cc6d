#pragma once

#include <utility>

#include "solohttp/platform.hpp"

namespace solohttp {

// Unique owner of a file descriptor, closed on destruction.
class BaseFd {
 public:
  static constexpr NativeHandle kClosedFd = kInvalidHandle;

  BaseFd() noexcept = default;

  // Adopt fd (kClosedFd is accepted and yields an empty owner).
  explicit BaseFd(NativeHandle fd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd&) = delete;
  BaseFd& operator=(const BaseFd&) = delete;

  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}

  BaseFd& operator=(BaseFd&& other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }

  ~BaseFd() { reset(); }

  [[nodiscard]] NativeHandle fd() const noexcept { return _fd; }

  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Give up ownership: the caller becomes responsible for closing the returned fd.
  [[nodiscard]] NativeHandle release() noexcept { return std::exchange(_fd, kClosedFd); }

  // Close the owned fd now, if any. Close errors are logged, the object is empty afterwards in all cases.
  void close() noexcept { reset(); }

  // Close the owned fd, if any, and adopt newFd.
  void reset(NativeHandle newFd = kClosedFd) noexcept;

 private:
  NativeHandle _fd{kClosedFd};
};

}  // namespace solohttp
