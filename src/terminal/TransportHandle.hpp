#ifndef __TB_TRANSPORT_HANDLE__
#define __TB_TRANSPORT_HANDLE__

#include "Headers.hpp"

namespace tb {
/**
 * @brief One live shell endpoint: a local process on a pty, or a remote shell
 * channel.
 *
 * None of the operations throw once the handle is live. I/O failures degrade
 * to "no data" / "dropped" and a dead handle reports !isAlive().
 */
class TransportHandle {
 public:
  virtual ~TransportHandle() {}

  /**
   * @brief Non-blocking read of at most TRANSPORT_READ_CHUNK bytes.
   * @return Empty when nothing is ready or the handle is closed.
   */
  virtual string read() = 0;

  /** @brief Best-effort write of keystrokes; silently dropped on error. */
  virtual void write(const string &data) = 0;

  /** @brief Applies a new window size; a no-op once closed. */
  virtual void resize(int rows, int cols) = 0;

  /**
   * @brief Closes the handle and reaps the shell. Bounded in time and
   * idempotent.
   */
  virtual void terminate() = 0;

  virtual bool isAlive() = 0;

  /** @brief Descriptor that becomes readable with new output, or -1. */
  virtual int getFd() = 0;
};
}  // namespace tb

#endif  // __TB_TRANSPORT_HANDLE__
