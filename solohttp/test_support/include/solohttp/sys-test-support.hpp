#pragma once

#include <dlfcn.h>

#include <cerrno>
#include <cstdlib>
#include <deque>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace solohttp::test {

// Syscall failure injection for tests.
//
// A test translation unit overrides a libc function with an extern "C" definition of the same signature. The override
// asks a SyscallScript for a scripted result for the fd it is called with; when there is none, it forwards to the real
// implementation obtained with RealFunction().
//
//   test::SyscallScript gRecvScript;
//   extern "C" ssize_t recv(int fd, void* buf, size_t len, int flags) {
//     static auto realRecv = test::RealFunction<ssize_t (*)(int, void*, size_t, int)>("recv");
//     if (auto action = gRecvScript.next(fd)) {
//       return action->apply();
//     }
//     return realRecv(fd, buf, len, flags);
//   }

// Scripted outcome of a single call: the return value, and the errno to set when it is an error.
struct SyscallAction {
  int ret{-1};
  int err{0};

  int apply() const noexcept {
    if (ret == -1) {
      errno = err;
    }
    return ret;
  }
};

[[nodiscard]] constexpr SyscallAction Fail(int err) noexcept { return SyscallAction{-1, err}; }

// Next symbol named name after the current object in the lookup order. Aborts if it cannot be found.
template <typename Fn>
Fn RealFunction(const char* name) {
  void* sym = ::dlsym(RTLD_NEXT, name);
  if (sym == nullptr) {
    std::abort();
  }
  return reinterpret_cast<Fn>(sym);
}

// Thread safe FIFO of scripted actions per fd. Actions registered for kAnyFd apply to calls on any fd, after the
// fd specific ones.
class SyscallScript {
 public:
  static constexpr int kAnyFd = -1;

  SyscallScript() = default;
  SyscallScript(const SyscallScript&) = delete;
  SyscallScript& operator=(const SyscallScript&) = delete;

  void add(int fd, std::initializer_list<SyscallAction> actions) {
    std::scoped_lock<std::mutex> lock(_mutex);
    auto& queue = _queues[fd];
    queue.insert(queue.end(), actions.begin(), actions.end());
  }

  void add(std::initializer_list<SyscallAction> actions) { add(kAnyFd, actions); }

  [[nodiscard]] std::optional<SyscallAction> next(int fd) {
    std::scoped_lock<std::mutex> lock(_mutex);
    if (auto action = popLocked(fd)) {
      return action;
    }
    return popLocked(kAnyFd);
  }

  void clear() {
    std::scoped_lock<std::mutex> lock(_mutex);
    _queues.clear();
  }

 private:
  std::optional<SyscallAction> popLocked(int fd) {
    const auto it = _queues.find(fd);
    if (it == _queues.end() || it->second.empty()) {
      return std::nullopt;
    }
    const SyscallAction action = it->second.front();
    it->second.pop_front();
    return action;
  }

  std::mutex _mutex;
  std::unordered_map<int, std::deque<SyscallAction>> _queues;
};

// Clears a script when leaving the scope, so that leftover actions never leak into the next test.
class [[nodiscard]] ScriptGuard {
 public:
  explicit ScriptGuard(SyscallScript& script) noexcept : _script(script) {}
  ScriptGuard(const ScriptGuard&) = delete;
  ScriptGuard& operator=(const ScriptGuard&) = delete;
  ~ScriptGuard() { _script.clear(); }

 private:
  SyscallScript& _script;
};

}  // namespace solohttp::test
