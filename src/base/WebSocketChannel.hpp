#ifndef __TB_WEB_SOCKET_CHANNEL__
#define __TB_WEB_SOCKET_CHANNEL__

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "Headers.hpp"
#include "MessageChannel.hpp"

namespace tb {
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

/**
 * @brief Server side of one browser WebSocket connection.
 *
 * The channel owns a private io_context that is only ever run from the
 * thread calling into the channel, so reads, writes and the close handshake
 * never race each other and no lock is needed.
 */
class WebSocketChannel : public MessageChannel {
 public:
  /**
   * @param _path Request path the upgrade must target, e.g. `/ws/terminal`.
   * Anything else is answered with 404.
   */
  WebSocketChannel(const string &_path, int _handshakeTimeoutMs = 10000);
  virtual ~WebSocketChannel();

  /** @brief Unconnected socket that the server accepts the client into. */
  tcp::socket &getSocket() { return ws.next_layer(); }

  virtual void accept();
  virtual bool hasData();
  virtual bool receive(string *message);
  virtual void send(const string &message, bool binary);
  virtual void close();
  virtual bool isOpen();
  virtual int getFd();

  /** @brief Decoded query parameters of the upgrade request. */
  const map<string, string> &getQueryParameters() const {
    return queryParameters;
  }

  /**
   * @brief Splits a request target into its path and decoded query string.
   */
  static void parseTarget(const string &target, string *path,
                          map<string, string> *query);

  /** @brief Decodes %XX escapes and '+' as used in query strings. */
  static string urlDecode(const string &s);

 protected:
  asio::io_context ioc;
  websocket::stream<tcp::socket> ws;
  beast::flat_buffer readBuffer;
  deque<string> inbound;
  /** @brief Pending frames and whether each one is binary. */
  deque<pair<string, bool>> outbound;
  size_t outboundBytes;
  bool writing;
  bool open;
  bool closing;
  string path;
  int handshakeTimeoutMs;
  map<string, string> queryParameters;

  /** @brief Runs the handlers that are ready without blocking. */
  void pump();
  /** @brief Runs handlers until `done` is set or the timeout expires. */
  void runUntil(const bool &done, int timeoutMs);
  /** @brief Closes the socket and waits for the aborted handlers to run. */
  void abortUntil(const bool &done);
  void rejectRequest(const http::request<http::string_body> &request);
  void startRead();
  void onRead(beast::error_code ec);
  void startWrite();
  void onWrite(beast::error_code ec);
};
}  // namespace tb

#endif  // __TB_WEB_SOCKET_CHANNEL__
