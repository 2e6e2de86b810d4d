#ifndef __TB_BRIDGE_PROTOCOL__
#define __TB_BRIDGE_PROTOCOL__

#include "Headers.hpp"

namespace tb {
/**
 * @brief Where and as whom to open a remote shell. Empty strings and a zero
 * port mean "not given".
 */
struct ConnectRequest {
  string host;
  int port = 0;
  string username;
  string credential;
};

/**
 * @brief One decoded client message.
 */
struct InboundMessage {
  enum Kind {
    INPUT,
    RESIZE,
    CONNECT,
    /** @brief Well formed, but with a type the bridge does not know. */
    UNKNOWN,
    MALFORMED,
  };

  Kind kind = MALFORMED;
  /** @brief The raw `type` field, kept for logging. */
  string type;
  /** @brief INPUT payload. */
  string data;
  /** @brief RESIZE geometry, already clamped. */
  int rows = DEFAULT_TERMINAL_ROWS;
  int cols = DEFAULT_TERMINAL_COLS;
  ConnectRequest connect;
  /** @brief Why a MALFORMED message was rejected. */
  string error;
};

/**
 * @brief JSON encoding of the browser protocol.
 *
 * Client to server: `input{data}`, `resize{rows,cols}` and
 * `connect{host,port,username,credential}`. Server to client: `connected`,
 * `error{message}` and `output{data}`; a local shell's output goes out as
 * raw binary frames instead.
 */
class BridgeProtocol {
 public:
  static InboundMessage parseInboundMessage(const string &raw);

  /**
   * @brief Turns a client supplied dimension into [1, MAX_TERMINAL_DIMENSION].
   * Missing or unusable values become `fallback`; integral strings and
   * fractional numbers are accepted and truncated.
   */
  static int clampTerminalSize(const json &value, int fallback);

  static string makeConnectedMessage();
  static string makeErrorMessage(const string &message);
  static string makeOutputMessage(const string &data);

  static const int MAX_TERMINAL_DIMENSION = 65535;
};
}  // namespace tb

#endif  // __TB_BRIDGE_PROTOCOL__
