#pragma once

#include <dlfcn.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <functional>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "dgramipc/poll-events.hpp"

namespace dgramipc::test {

// Portable resolver for RTLD_NEXT symbols. This is inline to allow inclusion
// in test translation units. It aborts if symbol resolution fails.
template <typename Fn>
Fn ResolveNext(const char* name) {
  void* sym = dlsym(RTLD_NEXT, name);
  if (sym == nullptr) {
    std::abort();
  }
  return reinterpret_cast<Fn>(sym);
}

#ifdef SYS_memfd_create
inline int CreateMemfd(std::string_view name) {
  const std::string nameStr(name);
  int retfd = static_cast<int>(::syscall(SYS_memfd_create, nameStr.c_str(), 1U /* MFD_CLOEXEC */));
  if (retfd < 0) {
    throw std::runtime_error("memfd_create failed: " + std::string(std::strerror(errno)));
  }
  return retfd;
}
#endif

template <typename Action>
class ActionQueue {
 public:
  ActionQueue() = default;
  ActionQueue(const ActionQueue&) = delete;
  ActionQueue& operator=(const ActionQueue&) = delete;

  void reset() {
    std::scoped_lock<std::mutex> lock(_mutex);
    _actions.clear();
  }

  void setActions(std::initializer_list<Action> actions) {
    std::scoped_lock<std::mutex> lock(_mutex);
    _actions.assign(actions.begin(), actions.end());
  }

  void push(Action action) {
    std::scoped_lock<std::mutex> lock(_mutex);
    _actions.emplace_back(std::move(action));
  }

  [[nodiscard]] std::optional<Action> pop() {
    std::scoped_lock<std::mutex> lock(_mutex);
    if (_actions.empty()) {
      return std::nullopt;
    }
    Action front = std::move(_actions.front());
    _actions.pop_front();
    return front;
  }

 private:
  std::mutex _mutex;
  std::deque<Action> _actions;
};

template <typename Key, typename Action, typename Hash = std::hash<Key>, typename Eq = std::equal_to<Key>>
class KeyedActionQueue {
 public:
  KeyedActionQueue() = default;
  KeyedActionQueue(const KeyedActionQueue&) = delete;
  KeyedActionQueue& operator=(const KeyedActionQueue&) = delete;

  void reset() {
    std::scoped_lock<std::mutex> lock(_mutex);
    _queues.clear();
  }

  void setActions(const Key& key, std::initializer_list<Action> actions) {
    std::scoped_lock<std::mutex> lock(_mutex);
    _queues[key] = std::deque<Action>(actions.begin(), actions.end());
  }

  void push(const Key& key, Action action) {
    std::scoped_lock<std::mutex> lock(_mutex);
    _queues[key].emplace_back(std::move(action));
  }

  [[nodiscard]] std::optional<Action> pop(const Key& key) {
    std::scoped_lock<std::mutex> lock(_mutex);
    auto it = _queues.find(key);
    if (it == _queues.end() || it->second.empty()) {
      return std::nullopt;
    }
    Action front = std::move(it->second.front());
    it->second.pop_front();
    if (it->second.empty()) {
      _queues.erase(it);
    }
    return front;
  }

 private:
  std::mutex _mutex;
  std::unordered_map<Key, std::deque<Action>, Hash, Eq> _queues;
};

template <typename Queue>
class QueueResetGuard {
 public:
  explicit QueueResetGuard(Queue& queue) noexcept : _queue(queue) {}
  QueueResetGuard(const QueueResetGuard&) = delete;
  QueueResetGuard& operator=(const QueueResetGuard&) = delete;
  ~QueueResetGuard() { _queue.reset(); }

 private:
  Queue& _queue;
};

}  // namespace dgramipc::test

// Socket syscall action queues: allow tests to simulate syscall errors.
// Action type for socket syscalls: return value (-1 for error) and errno.
using SyscallAction = std::pair<int, int>;  // (return value, errno)

// Action type for data syscalls: bytes (or -1) and errno.
using IoAction = std::pair<ssize_t, int>;

// Action type for poll: a non-negative return value comes with the revents to report.
struct PollAction {
  int ret;
  int err;
  dgramipc::PollEventBmp revents;
};

namespace dgramipc::test {
inline ActionQueue<SyscallAction> g_socket_actions;
inline ActionQueue<SyscallAction> g_bind_actions;
inline ActionQueue<IoAction> g_sendto_actions;
inline ActionQueue<IoAction> g_recvmsg_actions;
inline ActionQueue<PollAction> g_poll_actions;
// Keyed by path
inline KeyedActionQueue<std::string, SyscallAction> g_unlink_actions;
// Keyed by descriptor
inline KeyedActionQueue<int, SyscallAction> g_close_actions;

inline void ResetSocketActions() {
  g_socket_actions.reset();
  g_bind_actions.reset();
  g_sendto_actions.reset();
  g_recvmsg_actions.reset();
  g_poll_actions.reset();
  g_unlink_actions.reset();
  g_close_actions.reset();
}

inline void PushSocketAction(SyscallAction action) { g_socket_actions.push(action); }
inline void PushBindAction(SyscallAction action) { g_bind_actions.push(action); }
inline void PushSendtoAction(IoAction action) { g_sendto_actions.push(action); }
inline void PushRecvmsgAction(IoAction action) { g_recvmsg_actions.push(action); }
inline void PushPollAction(PollAction action) { g_poll_actions.push(action); }
inline void PushUnlinkAction(std::string_view path, SyscallAction action) {
  g_unlink_actions.push(std::string(path), action);
}
// An injected failure leaves the descriptor open: the test closes it for real afterwards.
inline void PushCloseAction(int fd, SyscallAction action) { g_close_actions.push(fd, action); }

// Resets every socket action queue when going out of scope, so that a failing test
// does not leak injected failures into the next one.
class SocketActionsGuard {
 public:
  SocketActionsGuard() = default;
  SocketActionsGuard(const SocketActionsGuard&) = delete;
  SocketActionsGuard& operator=(const SocketActionsGuard&) = delete;
  ~SocketActionsGuard() { ResetSocketActions(); }
};

using SocketFn = int (*)(int, int, int);
using BindFn = int (*)(int, const struct sockaddr*, socklen_t);
using SendtoFn = ssize_t (*)(int, const void*, size_t, int, const struct sockaddr*, socklen_t);
using RecvmsgFn = ssize_t (*)(int, struct msghdr*, int);
using PollFn = int (*)(struct pollfd*, nfds_t, int);
using UnlinkFn = int (*)(const char*);
using CloseFn = int (*)(int);

inline SocketFn ResolveRealSocket() {
  static SocketFn fn = ResolveNext<SocketFn>("socket");
  return fn;
}

inline BindFn ResolveRealBind() {
  static BindFn fn = ResolveNext<BindFn>("bind");
  return fn;
}

inline SendtoFn ResolveRealSendto() {
  static SendtoFn fn = ResolveNext<SendtoFn>("sendto");
  return fn;
}

inline RecvmsgFn ResolveRealRecvmsg() {
  static RecvmsgFn fn = ResolveNext<RecvmsgFn>("recvmsg");
  return fn;
}

inline PollFn ResolveRealPoll() {
  static PollFn fn = ResolveNext<PollFn>("poll");
  return fn;
}

inline UnlinkFn ResolveRealUnlink() {
  static UnlinkFn fn = ResolveNext<UnlinkFn>("unlink");
  return fn;
}

inline CloseFn ResolveRealClose() {
  static CloseFn fn = ResolveNext<CloseFn>("close");
  return fn;
}

}  // namespace dgramipc::test

#ifdef DGRAMIPC_WANT_SOCKET_OVERRIDES

// NOLINTNEXTLINE
extern "C" __attribute__((no_sanitize("address"))) int socket(int domain, int type, int protocol) noexcept {
  auto act = dgramipc::test::g_socket_actions.pop();
  if (act) {
    auto [ret, err] = *act;
    if (ret >= 0) {
      return ret;
    }
    errno = err;
    return -1;
  }
  auto real = dgramipc::test::ResolveRealSocket();
  return real(domain, type, protocol);
}

// NOLINTNEXTLINE
extern "C" __attribute__((no_sanitize("address"))) int bind(int sockfd, const struct sockaddr* addr,
                                                            socklen_t addrlen) noexcept {
  auto act = dgramipc::test::g_bind_actions.pop();
  if (act) {
    auto [ret, err] = *act;
    if (ret >= 0) {
      return ret;
    }
    errno = err;
    return -1;
  }
  auto real = dgramipc::test::ResolveRealBind();
  return real(sockfd, addr, addrlen);
}

// NOLINTNEXTLINE
extern "C" __attribute__((no_sanitize("address"))) ssize_t sendto(int sockfd, const void* buf, size_t len, int flags,
                                                                  const struct sockaddr* destAddr, socklen_t addrlen) {
  auto act = dgramipc::test::g_sendto_actions.pop();
  if (act) {
    auto [ret, err] = *act;
    if (ret >= 0) {
      // pretend we sent ret bytes
      return ret;
    }
    errno = err;
    return -1;
  }
  auto real = dgramipc::test::ResolveRealSendto();
  return real(sockfd, buf, len, flags, destAddr, addrlen);
}

// NOLINTNEXTLINE
extern "C" __attribute__((no_sanitize("address"))) ssize_t recvmsg(int sockfd, struct msghdr* msg, int flags) {
  auto act = dgramipc::test::g_recvmsg_actions.pop();
  if (act) {
    auto [ret, err] = *act;
    if (ret >= 0) {
      msg->msg_flags = 0;
      return ret;
    }
    errno = err;
    return -1;
  }
  auto real = dgramipc::test::ResolveRealRecvmsg();
  return real(sockfd, msg, flags);
}

// NOLINTNEXTLINE
extern "C" __attribute__((no_sanitize("address"))) int poll(struct pollfd* fds, nfds_t nfds, int timeout) {
  auto act = dgramipc::test::g_poll_actions.pop();
  if (act) {
    if (act->ret >= 0) {
      for (nfds_t idx = 0; idx < nfds; ++idx) {
        fds[idx].revents = static_cast<short>(act->revents);
      }
      return act->ret;
    }
    errno = act->err;
    return -1;
  }
  auto real = dgramipc::test::ResolveRealPoll();
  return real(fds, nfds, timeout);
}

// With _FORTIFY_SOURCE, glibc routes poll calls with a known array size to __poll_chk.
// NOLINTNEXTLINE
extern "C" __attribute__((no_sanitize("address"))) int __poll_chk(struct pollfd* fds, nfds_t nfds, int timeout,
                                                                  size_t /*fdslen*/) {
  return poll(fds, nfds, timeout);
}

// NOLINTNEXTLINE
extern "C" __attribute__((no_sanitize("address"))) int unlink(const char* path) noexcept {
  auto act = dgramipc::test::g_unlink_actions.pop(path);
  if (act) {
    auto [ret, err] = *act;
    if (ret >= 0) {
      return ret;
    }
    errno = err;
    return -1;
  }
  auto real = dgramipc::test::ResolveRealUnlink();
  return real(path);
}

// NOLINTNEXTLINE
extern "C" __attribute__((no_sanitize("address"))) int close(int fd) {
  auto act = dgramipc::test::g_close_actions.pop(fd);
  if (act) {
    auto [ret, err] = *act;
    if (ret >= 0) {
      return ret;
    }
    errno = err;
    return -1;
  }
  auto real = dgramipc::test::ResolveRealClose();
  return real(fd);
}

#endif
