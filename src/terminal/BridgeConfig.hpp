#ifndef __TB_BRIDGE_CONFIG__
#define __TB_BRIDGE_CONFIG__

#include "BridgeProtocol.hpp"
#include "Headers.hpp"
#include "PtyProcessTransport.hpp"
#include "SshChannelTransport.hpp"

namespace tb {
/**
 * @brief Which kind of shell every session gets.
 */
enum class BridgeMode {
  /** @brief A local command on a pty. */
  PTY,
  /** @brief A remote shell over SSH, opened by the client's connect message. */
  SSH,
};

/**
 * @brief Runtime settings of `tbserver`, from the config file and the
 * command line.
 */
struct BridgeConfig {
  // [Networking]
  int port = 8765;
  string bindIp = "0.0.0.0";
  string wsPath = "/ws/terminal";

  // [Session]
  BridgeMode mode = BridgeMode::PTY;
  /** @brief Space separated command line; empty runs the login shell. */
  string command;
  int pollIntervalMs = 10;
  int terminateTimeoutMs = 2000;
  int initialRows = DEFAULT_TERMINAL_ROWS;
  int initialCols = DEFAULT_TERMINAL_COLS;
  string termType = "xterm-256color";

  // [Ssh]
  string defaultHost = "localhost";
  int defaultPort = 22;
  /** @brief Empty means the user running the server. */
  string defaultUser;
  int connectTimeoutMs = 10000;
  HostKeyPolicy hostKeyPolicy = HostKeyPolicy::ACCEPT_NEW;
  /** @brief Empty means ~/.termbridge/known_hosts. */
  string knownHostsFile;

  // [Debug]
  int verbose = 0;
  bool silent = false;
  string maxLogSize = "20971520";

  PtyOptions ptyOptions() const;
  SshOptions sshOptions() const;
  ConnectRequest connectDefaults() const;

  /** @brief `command` split into words, or the user's shell with `-l`. */
  vector<string> commandLine() const;

  /**
   * @brief Overrides `config` with the values present in an INI file.
   * @throws std::runtime_error if the file cannot be read, and
   * std::invalid_argument for a value that makes no sense.
   */
  static void loadFile(const string &path, BridgeConfig *config);

  /** @brief `pty` or `ssh`. @throws std::invalid_argument */
  static BridgeMode parseMode(const string &s);

  /**
   * @brief `accept-new`, `accept-any` or `strict`.
   * @throws std::invalid_argument
   */
  static HostKeyPolicy parseHostKeyPolicy(const string &s);
};
}  // namespace tb

#endif  // __TB_BRIDGE_CONFIG__
