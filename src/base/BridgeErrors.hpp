#ifndef __TB_BRIDGE_ERRORS__
#define __TB_BRIDGE_ERRORS__

#include "Headers.hpp"

namespace tb {
/**
 * @brief A local shell could not be started (no pty, or the executable could
 * not be run). Fatal for the session; the message is shown to the client.
 */
class SpawnError : public std::runtime_error {
 public:
  explicit SpawnError(const string &message) : std::runtime_error(message) {}
};

/**
 * @brief A remote shell could not be established. Fatal for the session; the
 * message is shown to the client.
 */
class ConnectError : public std::runtime_error {
 public:
  enum Kind {
    AUTH_FAILED,
    PROTOCOL_ERROR,
    TIMEOUT,
    HOST_KEY_REJECTED,
    OTHER,
  };

  ConnectError(Kind _kind, const string &message)
      : std::runtime_error(message), kind(_kind) {}

  Kind getKind() const { return kind; }

  static const char *kindName(Kind kind) {
    switch (kind) {
      case AUTH_FAILED:
        return "auth-failed";
      case PROTOCOL_ERROR:
        return "protocol-error";
      case TIMEOUT:
        return "timeout";
      case HOST_KEY_REJECTED:
        return "host-key-rejected";
      case OTHER:
        break;
    }
    return "other";
  }

 protected:
  Kind kind;
};

/**
 * @brief The browser side of a session is gone. Ends the session silently.
 */
class ChannelClosedError : public std::runtime_error {
 public:
  explicit ChannelClosedError(const string &message)
      : std::runtime_error(message) {}
};
}  // namespace tb

#endif  // __TB_BRIDGE_ERRORS__
