#ifndef __TB_BRIDGE_SERVER__
#define __TB_BRIDGE_SERVER__

#include "BridgeConfig.hpp"
#include "Headers.hpp"
#include "SessionBridge.hpp"
#include "SessionRegistry.hpp"
#include "TransportFactory.hpp"
#include "WebSocketChannel.hpp"

namespace tb {
/**
 * @brief Accepts browser connections and runs one SessionBridge per
 * connection on its own thread.
 */
class BridgeServer {
 public:
  /**
   * @brief Binds and listens right away, so a port of 0 is resolved by the
   * time the constructor returns.
   * @throws boost::system::system_error if the address cannot be bound.
   */
  BridgeServer(const BridgeConfig &_config,
               shared_ptr<SessionRegistry> _registry);
  virtual ~BridgeServer();

  /** @brief Serves until shutdown(), then stops and joins every session. */
  void run();

  /** @brief Thread-safe; run() returns soon after. */
  void shutdown() { halt = true; }

  int getPort();

  shared_ptr<SessionRegistry> getRegistry() { return registry; }

  /**
   * @brief The factory for a new session, given the query parameters of its
   * upgrade request (`host`, `user` and `port`).
   * @throws std::invalid_argument for unusable parameters.
   */
  shared_ptr<TransportFactory> createFactory(
      const map<string, string> &query);

 protected:
  struct SessionThread {
    shared_ptr<thread> sessionThread;
    shared_ptr<atomic<bool>> done;
  };

  BridgeConfig config;
  shared_ptr<SessionRegistry> registry;
  asio::io_context ioc;
  tcp::acceptor acceptor;
  std::mutex sessionThreadMutex;
  vector<SessionThread> sessionThreads;
  atomic<bool> halt;

  void acceptNewConnection();
  void handleClient(shared_ptr<WebSocketChannel> channel);
  /** @brief Joins the threads whose session is over. */
  void reapSessionThreads();
  /** @brief Stops every session and waits for all threads. */
  void joinSessionThreads();
};
}  // namespace tb

#endif  // __TB_BRIDGE_SERVER__
