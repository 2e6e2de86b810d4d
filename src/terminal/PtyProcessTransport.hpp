#ifndef __TB_PTY_PROCESS_TRANSPORT__
#define __TB_PTY_PROCESS_TRANSPORT__

#include "BridgeErrors.hpp"
#include "Headers.hpp"
#include "TransportHandle.hpp"

namespace tb {
struct PtyOptions {
  int initialRows = DEFAULT_TERMINAL_ROWS;
  int initialCols = DEFAULT_TERMINAL_COLS;
  string termType = "xterm-256color";
  /**
   * @brief How long terminate() waits for the process group before
   * escalating to SIGKILL.
   */
  int terminateTimeoutMs = 2000;
  /** @brief Upper bound for a single write() when the pty is full. */
  int writeTimeoutMs = 1000;
};

/**
 * @brief Runs a command on a fresh pseudo-terminal and exposes the master
 * side.
 */
class PtyProcessTransport : public TransportHandle {
 public:
  explicit PtyProcessTransport(const PtyOptions &_options);
  virtual ~PtyProcessTransport();

  /**
   * @brief Forks `command` (looked up in PATH) with `args` on the slave side
   * of a new pty.
   * @throws SpawnError if no pty is available or the command cannot be
   * executed.
   */
  void spawn(const string &command, const vector<string> &args);

  virtual string read();
  virtual void write(const string &data);
  virtual void resize(int rows, int cols);
  virtual void terminate();
  virtual bool isAlive();
  virtual int getFd() { return masterFd; }

  pid_t getPid() { return childPid; }

  /** @brief Raw waitpid() status once the child has been reaped. */
  optional<int> getExitStatus() { return exitStatus; }

 protected:
  PtyOptions options;
  int masterFd;
  pid_t childPid;
  optional<int> exitStatus;
  /** @brief Set once terminate() is done; the group id may be reused. */
  bool groupReleased;

  /** @brief Non-blocking reap. Returns true once the child is gone. */
  bool tryReap();
  /** @brief Sends `signum` to the child's process group. */
  bool signalGroup(int signum);
  /**
   * @brief Waits at most `timeoutMs` for the child to be reaped and the rest
   * of its process group to be gone.
   */
  bool waitForGroupExit(int timeoutMs);
};
}  // namespace tb

#endif  // __TB_PTY_PROCESS_TRANSPORT__
