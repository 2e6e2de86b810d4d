#include "FdUtils.hpp"

namespace tb {
namespace {
bool waitOnFd(int fd, int timeoutMs, bool forWrite) {
  if (fd < 0) {
    return false;
  }
  pollfd pfd;
  pfd.fd = fd;
  pfd.events = forWrite ? POLLOUT : POLLIN;
  pfd.revents = 0;
  int rc = ::poll(&pfd, 1, timeoutMs);
  if (rc < 0) {
    if (GetErrno() != EINTR) {
      VLOG(1) << "poll on fd " << fd << " failed: " << strerror(GetErrno());
    }
    return false;
  }
  // Hangups and errors count as ready so the caller's read or write sees them
  return rc > 0 && pfd.revents != 0;
}
}  // namespace

void FdUtils::setNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  FATAL_FAIL(flags);
  FATAL_FAIL(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

bool FdUtils::waitForRead(int fd, int timeoutMs) {
  return waitOnFd(fd, timeoutMs, false);
}

bool FdUtils::waitForWrite(int fd, int timeoutMs) {
  return waitOnFd(fd, timeoutMs, true);
}

bool FdUtils::waitForAnyRead(const vector<int> &fds, int timeoutMs) {
  vector<pollfd> pfds;
  for (int fd : fds) {
    if (fd < 0) {
      continue;
    }
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    pfds.push_back(pfd);
  }
  if (pfds.empty()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(timeoutMs));
    return false;
  }
  int rc = ::poll(&pfds[0], pfds.size(), timeoutMs);
  if (rc < 0) {
    if (GetErrno() != EINTR) {
      STERROR << "poll() failed: " << strerror(GetErrno());
    }
    return false;
  }
  return rc > 0;
}

void FdUtils::setCloseOnExec(int fd) {
  int flags = fcntl(fd, F_GETFD, 0);
  FATAL_FAIL(flags);
  FATAL_FAIL(fcntl(fd, F_SETFD, flags | FD_CLOEXEC));
}

bool FdUtils::writeAllWithin(int fd, const char *buf, size_t count,
                             int timeoutMs) {
  if (fd < 0) {
    return false;
  }
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc > 0) {
      bytesWritten += rc;
      continue;
    }
    if (rc < 0 && GetErrno() == EINTR) {
      continue;
    }
    if (rc < 0 && (GetErrno() == EAGAIN || GetErrno() == EWOULDBLOCK)) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                           deadline - std::chrono::steady_clock::now())
                           .count();
      if (remaining <= 0) {
        VLOG(1) << "Gave up writing to fd " << fd << " after " << timeoutMs
                << "ms";
        return false;
      }
      waitForWrite(fd, int(remaining));
      continue;
    }
    VLOG(1) << "Write to fd " << fd << " failed: "
            << (rc < 0 ? strerror(GetErrno()) : "closed");
    return false;
  }
  return true;
}
}  // namespace tb
