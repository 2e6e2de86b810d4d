#ifndef __TB_SESSION_BRIDGE__
#define __TB_SESSION_BRIDGE__

#include "BridgeProtocol.hpp"
#include "Headers.hpp"
#include "MessageChannel.hpp"
#include "SessionRegistry.hpp"
#include "TransportFactory.hpp"
#include "TransportHandle.hpp"

namespace tb {
/**
 * @brief Relays one browser client to one shell.
 *
 * The bridge owns the shell's TransportHandle and shares the client's
 * MessageChannel. All I/O happens on the thread that calls run(): each tick
 * waits for readiness, relays shell output to the client, then applies the
 * client's pending messages. Only requestStop() and getState() may be called
 * from other threads.
 *
 * The transport is terminated exactly once, whatever ends the session.
 */
class SessionBridge : public std::enable_shared_from_this<SessionBridge> {
 public:
  enum State {
    /** @brief Waiting for a `connect` message. */
    IDLE,
    /** @brief Opening the shell. */
    CONNECTING,
    /** @brief Relaying. */
    ACTIVE,
    CLOSED,
  };

  SessionBridge(const string &_id, shared_ptr<MessageChannel> _channel,
                shared_ptr<SessionRegistry> _registry,
                shared_ptr<TransportFactory> _factory,
                int _pollIntervalMs = 10);
  virtual ~SessionBridge();

  /**
   * @brief Registers the session and, unless the factory waits for a
   * `connect` message, opens the shell. Failures are reported to the client
   * and close the session.
   */
  void start();

  /** @brief Applies one raw client message. Bad messages are ignored. */
  void handleInboundMessage(const string &message);

  /**
   * @brief Forwards whatever the shell has produced. Once the shell is dead
   * its remaining output is drained and the session stops.
   * @return true if anything was forwarded.
   */
  bool relayOnce();

  /** @brief Applies the client messages that are ready. */
  void dispatchPending();

  /** @brief start(), then ticks until the session is closed. */
  void run();

  /** @brief Tears the session down. Idempotent. */
  void stop();

  /** @brief Thread-safe; the session stops at its next tick. */
  void requestStop();

  State getState();

  const string &getId() const { return id; }

  static const char *stateName(State state);

 protected:
  string id;
  shared_ptr<MessageChannel> channel;
  shared_ptr<SessionRegistry> registry;
  shared_ptr<TransportFactory> factory;
  int pollIntervalMs;
  OutputFraming framing;
  shared_ptr<TransportHandle> transport;

  std::mutex stateMutex;
  State state;
  bool stopped;
  bool registered;
  std::atomic<bool> stopRequested;

  void setState(State newState);
  void openTransport(const ConnectRequest &request);
  /** @brief Reports a fatal error to the client, then stops. */
  void failSession(const string &message);
  /** @brief Sends one chunk of output. Returns false if the client is gone. */
  bool forwardOutput(const string &chunk);
  /** @brief Reads what a dead shell left behind, then stops. */
  void drainAndStop();
  /** @brief Blocks until the shell or the client is readable, or one tick. */
  void waitForActivity();
};
}  // namespace tb

#endif  // __TB_SESSION_BRIDGE__
