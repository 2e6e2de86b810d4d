#ifndef __TB_FD_UTILS__
#define __TB_FD_UTILS__

#include "Headers.hpp"

namespace tb {
/**
 * @brief Helpers for non-blocking file descriptors shared by the transports.
 */
class FdUtils {
 public:
  /** @brief Adds O_NONBLOCK to the descriptor's status flags. */
  static void setNonBlocking(int fd);

  /**
   * @brief Waits up to `timeoutMs` for the descriptor to become readable.
   * Returns false on timeout, on error, or for a negative descriptor.
   */
  static bool waitForRead(int fd, int timeoutMs);

  /** @brief Same as waitForRead, for writability. */
  static bool waitForWrite(int fd, int timeoutMs);

  /**
   * @brief Waits up to `timeoutMs` until any of `fds` is readable. Negative
   * entries are skipped; with none left this just sleeps.
   * @return true if a descriptor is readable.
   */
  static bool waitForAnyRead(const vector<int> &fds, int timeoutMs);

  /** @brief Marks the descriptor close-on-exec so shells never inherit it. */
  static void setCloseOnExec(int fd);

  /**
   * @brief Writes the whole buffer to a non-blocking descriptor, waiting for
   * writability on EAGAIN for at most `timeoutMs` overall.
   * @return false if anything could not be written.
   */
  static bool writeAllWithin(int fd, const char *buf, size_t count,
                             int timeoutMs);
};
}  // namespace tb
#endif  // __TB_FD_UTILS__
