#ifndef __TB_SSH_CHANNEL_TRANSPORT__
#define __TB_SSH_CHANNEL_TRANSPORT__

#include <libssh2.h>

#include "BridgeErrors.hpp"
#include "Headers.hpp"
#include "TransportHandle.hpp"

namespace tb {
/**
 * @brief What to do with the key a remote host presents.
 */
enum class HostKeyPolicy {
  /** @brief Accept unknown keys and record them (StrictHostKeyChecking=no) */
  ACCEPT_NEW,
  /** @brief Accept every key without recording anything */
  ACCEPT_ANY,
  /** @brief Only accept keys already present in the known hosts file */
  STRICT,
};

struct SshOptions {
  int initialRows = DEFAULT_TERMINAL_ROWS;
  int initialCols = DEFAULT_TERMINAL_COLS;
  string termType = "xterm-256color";
  /** @brief Bound for TCP connect, handshake and authentication each. */
  int connectTimeoutMs = 10000;
  /** @brief Bound for the close handshake in terminate(). */
  int terminateTimeoutMs = 2000;
  int writeTimeoutMs = 1000;
  HostKeyPolicy hostKeyPolicy = HostKeyPolicy::ACCEPT_NEW;
  /** @brief OpenSSH-format file for remembered keys; empty keeps none. */
  string knownHostsFile;
};

/**
 * @brief Interactive shell on a remote host over an SSH session channel.
 */
class SshChannelTransport : public TransportHandle {
 public:
  explicit SshChannelTransport(const SshOptions &_options);
  virtual ~SshChannelTransport();

  /**
   * @brief Connects, verifies the host key, authenticates with a password
   * and starts a shell on a pty.
   * @throws ConnectError describing why the shell is not available.
   */
  void connect(const string &host, int port, const string &username,
               const string &credential);

  virtual string read();
  virtual void write(const string &data);
  virtual void resize(int rows, int cols);
  virtual void terminate();
  virtual bool isAlive();
  virtual int getFd() { return sockFd; }

  /** @brief Initializes libssh2 once per process. Throws ConnectError. */
  static void initializeLibrary();

  /**
   * @brief Checks a host key against the known hosts file under the policy
   * in `options`, recording it when the policy allows. `session` only has to
   * exist, not be connected.
   * @throws ConnectError of kind HOST_KEY_REJECTED.
   */
  static void checkHostKey(LIBSSH2_SESSION *session, const SshOptions &options,
                           const string &host, int port, const string &key,
                           int keyType);

  /** @brief Host name as written to known_hosts: `host` or `[host]:port`. */
  static string knownHostsEntry(const string &host, int port);

  /**
   * @brief The password-based methods to try, in order, given the server's
   * comma-separated method list.
   */
  static vector<string> passwordMethods(const string &available);

  /** @brief Answer for keyboard-interactive prompts during connect(). */
  const string &getPendingCredential() const { return pendingCredential; }

 protected:
  SshOptions options;
  int sockFd;
  LIBSSH2_SESSION *session;
  LIBSSH2_CHANNEL *channel;
  bool alive;
  string pendingCredential;

  void openSocket(const string &host, int port);
  void verifyHostKey(const string &host, int port);
  void authenticate(const string &username, const string &credential);
  void openShell();
  /** @brief True if output is buffered in libssh2 or waiting on the socket. */
  bool dataReady();
  /** @brief Waits for the socket in the direction libssh2 is blocked on. */
  bool waitForSession(int timeoutMs);
  /** @brief Builds a ConnectError from the session's last libssh2 error. */
  ConnectError sessionError(const string &context, int rc);
  void releaseResources();
};
}  // namespace tb

#endif  // __TB_SSH_CHANNEL_TRANSPORT__
