#ifndef __TB_TRANSPORT_FACTORY__
#define __TB_TRANSPORT_FACTORY__

#include "BridgeProtocol.hpp"
#include "Headers.hpp"
#include "PtyProcessTransport.hpp"
#include "SshChannelTransport.hpp"
#include "TransportHandle.hpp"

namespace tb {
/**
 * @brief How shell output is framed on the way to the browser.
 */
enum class OutputFraming {
  /** @brief Each chunk is sent as-is in a binary frame. */
  RAW_BINARY,
  /** @brief Each chunk is wrapped in a `{"type":"output"}` text frame. */
  JSON_OUTPUT,
};

/**
 * @brief Creates the live shell for one session.
 */
class TransportFactory {
 public:
  virtual ~TransportFactory() {}

  /**
   * @brief True if the client has to send a `connect` message before the
   * shell can be opened.
   */
  virtual bool requiresConnectMessage() = 0;

  /**
   * @brief Opens a live shell. `request` is ignored by factories that do not
   * need a connect message.
   * @throws SpawnError or ConnectError.
   */
  virtual shared_ptr<TransportHandle> open(const ConnectRequest &request) = 0;

  virtual OutputFraming outputFraming() = 0;
};

/**
 * @brief Runs a fixed command line on a local pty.
 */
class PtyTransportFactory : public TransportFactory {
 public:
  PtyTransportFactory(const PtyOptions &_options, const string &_command,
                      const vector<string> &_args)
      : options(_options), command(_command), args(_args) {}

  virtual bool requiresConnectMessage() { return false; }
  virtual shared_ptr<TransportHandle> open(const ConnectRequest &request);
  virtual OutputFraming outputFraming() { return OutputFraming::RAW_BINARY; }

  const string &getCommand() const { return command; }
  const vector<string> &getArgs() const { return args; }

  /**
   * @brief Command line that logs into `user@host` with the system ssh
   * client, accepting unknown host keys.
   */
  static vector<string> sshCommandLine(const string &host, int port,
                                       const string &user);

 protected:
  PtyOptions options;
  string command;
  vector<string> args;
};

/**
 * @brief Opens a remote shell over SSH with the client's credentials.
 */
class SshTransportFactory : public TransportFactory {
 public:
  /**
   * @param _defaults Fills in whatever the client's connect message leaves
   * out.
   */
  SshTransportFactory(const SshOptions &_options,
                      const ConnectRequest &_defaults)
      : options(_options), defaults(_defaults) {}

  virtual bool requiresConnectMessage() { return true; }
  virtual shared_ptr<TransportHandle> open(const ConnectRequest &request);
  virtual OutputFraming outputFraming() { return OutputFraming::JSON_OUTPUT; }

  /** @brief `request` with the missing fields taken from the defaults. */
  ConnectRequest resolve(const ConnectRequest &request) const;

 protected:
  SshOptions options;
  ConnectRequest defaults;
};
}  // namespace tb

#endif  // __TB_TRANSPORT_FACTORY__
