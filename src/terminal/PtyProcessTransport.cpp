#include "PtyProcessTransport.hpp"

#include "FdUtils.hpp"

namespace tb {
namespace {
const int REAP_POLL_MS = 10;
// After SIGKILL the child can only linger in uninterruptible sleep
const int KILL_WAIT_MS = 1000;
}  // namespace

PtyProcessTransport::PtyProcessTransport(const PtyOptions &_options)
    : options(_options), masterFd(-1), childPid(-1), groupReleased(false) {}

PtyProcessTransport::~PtyProcessTransport() { terminate(); }

void PtyProcessTransport::spawn(const string &command,
                                const vector<string> &args) {
  if (masterFd >= 0 || childPid > 0) {
    throw SpawnError("A process is already running on this terminal");
  }
  if (command.empty()) {
    throw SpawnError("No command to run");
  }

  // Build everything the child needs before forking
  vector<string> argvStrings;
  argvStrings.push_back(command);
  argvStrings.insert(argvStrings.end(), args.begin(), args.end());
  vector<char *> argv;
  for (auto &it : argvStrings) {
    argv.push_back(&it[0]);
  }
  argv.push_back(NULL);

  // The child reports a failed exec through this pipe; a successful exec
  // closes it.
  int errorPipe[2];
#if __APPLE__
  if (::pipe(errorPipe) == -1) {
    throw SpawnError(string("Cannot create pipe: ") + strerror(GetErrno()));
  }
  FATAL_FAIL(fcntl(errorPipe[0], F_SETFD, FD_CLOEXEC));
  FATAL_FAIL(fcntl(errorPipe[1], F_SETFD, FD_CLOEXEC));
#else
  // Other sessions fork concurrently and must not inherit the write end
  if (::pipe2(errorPipe, O_CLOEXEC) == -1) {
    throw SpawnError(string("Cannot create pipe: ") + strerror(GetErrno()));
  }
#endif

  winsize initialSize;
  memset(&initialSize, 0, sizeof(winsize));
  initialSize.ws_row = options.initialRows;
  initialSize.ws_col = options.initialCols;

  int fd = -1;
  pid_t pid = forkpty(&fd, NULL, NULL, &initialSize);
  switch (pid) {
    case -1: {
      int forkErrno = GetErrno();
      ::close(errorPipe[0]);
      ::close(errorPipe[1]);
      throw SpawnError(string("Cannot allocate a pseudo-terminal: ") +
                       strerror(forkErrno));
    }
    case 0: {
      // child
      ::close(errorPipe[0]);
      // Dispositions the server ignores must not leak into the shell
      signal(SIGCHLD, SIG_DFL);
      signal(SIGHUP, SIG_DFL);
      signal(SIGINT, SIG_DFL);
      signal(SIGPIPE, SIG_DFL);
      signal(SIGTERM, SIG_DFL);
      setenv("TERM", options.termType.c_str(), 1);
      setenv("TB_VERSION", TB_VERSION, 1);
      execvp(argv[0], &argv[0]);
      int execErrno = GetErrno();
      if (::write(errorPipe[1], &execErrno, sizeof(execErrno)) < 0) {
        _exit(126);
      }
      _exit(127);
    }
    default:
      break;
  }

  // parent
  ::close(errorPipe[1]);
  int childErrno = 0;
  ssize_t rc;
  do {
    rc = ::read(errorPipe[0], &childErrno, sizeof(childErrno));
  } while (rc == -1 && GetErrno() == EINTR);
  ::close(errorPipe[0]);

  if (rc > 0) {
    int status;
    while (waitpid(pid, &status, 0) == -1 && GetErrno() == EINTR) {
    }
    ::close(fd);
    throw SpawnError("Cannot execute '" + command + "': " +
                     strerror(childErrno));
  }

  masterFd = fd;
  childPid = pid;
  FATAL_FAIL(fcntl(masterFd, F_SETFD, FD_CLOEXEC));
  FdUtils::setNonBlocking(masterFd);
  VLOG(1) << "pty opened " << masterFd << " for pid " << childPid << " ("
          << command << ")";
}

string PtyProcessTransport::read() {
  if (masterFd < 0) {
    return string();
  }
  char b[TRANSPORT_READ_CHUNK];
  ssize_t rc = ::read(masterFd, b, sizeof(b));
  if (rc > 0) {
    return string(b, rc);
  }
  if (rc < 0 && GetErrno() != EAGAIN && GetErrno() != EWOULDBLOCK &&
      GetErrno() != EINTR) {
    // Linux reports EIO once every slave descriptor is closed
    VLOG(2) << "pty read on " << masterFd << ": " << strerror(GetErrno());
  }
  return string();
}

void PtyProcessTransport::write(const string &data) {
  if (masterFd < 0 || data.empty()) {
    return;
  }
  if (!FdUtils::writeAllWithin(masterFd, data.c_str(), data.length(),
                               options.writeTimeoutMs)) {
    VLOG(1) << "Dropped input for pid " << childPid;
  }
}

void PtyProcessTransport::resize(int rows, int cols) {
  if (masterFd < 0) {
    return;
  }
  winsize tmpwin;
  memset(&tmpwin, 0, sizeof(winsize));
  tmpwin.ws_row = rows;
  tmpwin.ws_col = cols;
  if (ioctl(masterFd, TIOCSWINSZ, &tmpwin) == -1) {
    VLOG(1) << "TIOCSWINSZ failed: " << strerror(GetErrno());
  }
}

void PtyProcessTransport::terminate() {
  // forkpty() makes the child a session leader, so its pid names the process
  // group that background jobs started from the shell share
  if (childPid > 0 && !groupReleased && signalGroup(0)) {
    // Interactive shells ignore SIGTERM but exit on hangup
    signalGroup(SIGHUP);
    signalGroup(SIGTERM);
    if (!waitForGroupExit(options.terminateTimeoutMs)) {
      LOG(WARNING) << "Process group " << childPid << " ignored SIGTERM for "
                   << options.terminateTimeoutMs << "ms, sending SIGKILL";
      signalGroup(SIGKILL);
      if (!waitForGroupExit(KILL_WAIT_MS)) {
        LOG(ERROR) << "Process group " << childPid
                   << " survived SIGKILL, giving up";
      }
    }
  }
  tryReap();
  groupReleased = true;
  if (masterFd >= 0) {
    ::close(masterFd);
    masterFd = -1;
  }
}

bool PtyProcessTransport::isAlive() {
  if (masterFd < 0) {
    return false;
  }
  return !tryReap();
}

bool PtyProcessTransport::tryReap() {
  if (exitStatus) {
    return true;
  }
  if (childPid <= 0) {
    return true;
  }
  int status = 0;
  pid_t rc = waitpid(childPid, &status, WNOHANG);
  if (rc == childPid) {
    exitStatus = status;
    VLOG(1) << "pid " << childPid << " exited with status " << status;
    return true;
  }
  if (rc == -1 && GetErrno() == ECHILD) {
    // Reaped elsewhere; nothing left to wait for
    exitStatus = -1;
    return true;
  }
  return false;
}

bool PtyProcessTransport::signalGroup(int signum) {
  return kill(-childPid, signum) == 0;
}

bool PtyProcessTransport::waitForGroupExit(int timeoutMs) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  while (true) {
    // The leader stays a zombie, and keeps the group alive, until reaped
    tryReap();
    if (exitStatus && !signalGroup(0)) {
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(REAP_POLL_MS));
  }
}
}  // namespace tb
