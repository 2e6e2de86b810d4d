#ifndef __TB_MESSAGE_CHANNEL__
#define __TB_MESSAGE_CHANNEL__

#include "BridgeErrors.hpp"
#include "Headers.hpp"

namespace tb {
/**
 * @brief Message-oriented, bidirectional link to one browser client.
 *
 * Implementations are driven from a single session thread and must never
 * block that thread indefinitely outside of accept().
 */
class MessageChannel {
 public:
  virtual ~MessageChannel() {}

  /** @brief Completes the opening handshake. Throws ChannelClosedError. */
  virtual void accept() = 0;

  /** @brief True if receive() would return a message right now. */
  virtual bool hasData() = 0;

  /**
   * @brief Pops the next inbound message without blocking.
   * @return false when nothing is ready.
   * @throws ChannelClosedError once the peer is gone and no message is left.
   */
  virtual bool receive(string *message) = 0;

  /**
   * @brief Queues one outbound message, as a binary or a text frame.
   * @throws ChannelClosedError when the peer is gone.
   */
  virtual void send(const string &message, bool binary) = 0;

  /** @brief Closes the channel. Safe to call when already closed. */
  virtual void close() = 0;

  virtual bool isOpen() = 0;

  /**
   * @brief Descriptor that becomes readable when inbound data arrives, or -1.
   * Only used as a wakeup hint; callers still poll hasData().
   */
  virtual int getFd() = 0;
};
}  // namespace tb

#endif  // __TB_MESSAGE_CHANNEL__
