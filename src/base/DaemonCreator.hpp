#ifndef __TB_DAEMON_CREATOR_H__
#define __TB_DAEMON_CREATOR_H__

#include "Headers.hpp"

namespace tb {
/**
 * @brief Detaches `tbserver` from its controlling terminal.
 */
class DaemonCreator {
 public:
  /**
   * @brief Double-forks into a new session and points stdio at /dev/null.
   * @param childPidFile Pid file written by the daemon, skipped when empty.
   * @return CHILD inside the daemon, -1 if a fork or setsid failed. The
   * original process exits on success.
   */
  static int create(const string &childPidFile);

  static const int CHILD = 2;
};
}  // namespace tb

#endif  // __TB_DAEMON_CREATOR_H__
