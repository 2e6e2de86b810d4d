#include "DaemonCreator.hpp"

namespace tb {
namespace {
void writePidFile(const string &childPidFile) {
  int pidFilehandle =
      ::open(childPidFile.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0600);
  if (pidFilehandle == -1) {
    STFATAL << "Error opening pidfile for writing: " << childPidFile;
  }
  string pidString = to_string(getpid()) + "\n";
  ssize_t rc = ::write(pidFilehandle, pidString.c_str(), pidString.length());
  if (rc != (ssize_t)pidString.length()) {
    STFATAL << "Error writing pidfile " << childPidFile << ": "
            << strerror(GetErrno());
  }
  ::close(pidFilehandle);
}

void redirectStdio() {
  int out = ::open("/dev/null", O_WRONLY);
  int in = ::open("/dev/null", O_RDONLY);
  FATAL_FAIL(out);
  FATAL_FAIL(in);
  FATAL_FAIL(dup2(out, STDOUT_FILENO));
  FATAL_FAIL(dup2(out, STDERR_FILENO));
  FATAL_FAIL(dup2(in, STDIN_FILENO));
  ::close(out);
  ::close(in);
}
}  // namespace

int DaemonCreator::create(const string &childPidFile) {
  pid_t pid = fork();
  if (pid < 0) {
    return -1;
  }
  if (pid > 0) {
    exit(EXIT_SUCCESS);
  }

  // The first child becomes session leader so it loses the terminal
  if (setsid() < 0) {
    return -1;
  }
  signal(SIGHUP, SIG_IGN);

  pid = fork();
  if (pid < 0) {
    return -1;
  }
  if (pid > 0) {
    exit(EXIT_SUCCESS);
  }

  if (!childPidFile.empty()) {
    writePidFile(childPidFile);
  }

  FATAL_FAIL(chdir("/"));
  redirectStdio();
  return CHILD;
}
}  // namespace tb
