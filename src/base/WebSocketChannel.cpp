#include "WebSocketChannel.hpp"

namespace tb {
namespace {
// A client that stops reading is treated as gone once this much output is
// waiting for it and nothing drains for SEND_STALL_TIMEOUT_MS.
const size_t MAX_PENDING_OUTBOUND_BYTES = 1024 * 1024;
const int SEND_STALL_TIMEOUT_MS = 10 * 1000;
const int CLOSE_TIMEOUT_MS = 1000;

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}
}  // namespace

WebSocketChannel::WebSocketChannel(const string &_path,
                                   int _handshakeTimeoutMs)
    : ioc(1),
      ws(ioc),
      outboundBytes(0),
      writing(false),
      open(false),
      closing(false),
      path(_path),
      handshakeTimeoutMs(_handshakeTimeoutMs) {}

WebSocketChannel::~WebSocketChannel() { close(); }

void WebSocketChannel::accept() {
  beast::flat_buffer buffer;
  http::request<http::string_body> request;
  bool done = false;
  beast::error_code result;
  http::async_read(ws.next_layer(), buffer, request,
                   [&done, &result](beast::error_code ec, size_t) {
                     result = ec;
                     done = true;
                   });
  runUntil(done, handshakeTimeoutMs);
  if (!done) {
    abortUntil(done);
    throw ChannelClosedError("Timed out waiting for the upgrade request");
  }
  if (result) {
    throw ChannelClosedError("Cannot read upgrade request: " +
                             result.message());
  }

  string target(request.target().data(), request.target().size());
  string requestPath;
  parseTarget(target, &requestPath, &queryParameters);
  if (!websocket::is_upgrade(request) || requestPath != path) {
    rejectRequest(request);
    throw ChannelClosedError("Rejected request for " + target);
  }

  ws.set_option(websocket::stream_base::decorator(
      [](websocket::response_type &response) {
        response.set(http::field::server, string("tbserver/") + TB_VERSION);
      }));
  done = false;
  ws.async_accept(request, [&done, &result](beast::error_code ec) {
    result = ec;
    done = true;
  });
  runUntil(done, handshakeTimeoutMs);
  if (!done) {
    abortUntil(done);
    throw ChannelClosedError("Timed out completing the websocket handshake");
  }
  if (result) {
    throw ChannelClosedError("Websocket handshake failed: " + result.message());
  }

  VLOG(1) << "Websocket accepted for " << target;
  open = true;
  startRead();
}

bool WebSocketChannel::hasData() {
  pump();
  return !inbound.empty();
}

bool WebSocketChannel::receive(string *message) {
  pump();
  if (!inbound.empty()) {
    *message = std::move(inbound.front());
    inbound.pop_front();
    return true;
  }
  if (!open || closing) {
    throw ChannelClosedError("Client disconnected");
  }
  return false;
}

void WebSocketChannel::send(const string &message, bool binary) {
  pump();
  if (!open || closing) {
    throw ChannelClosedError("Cannot send, websocket is closed");
  }
  outbound.emplace_back(message, binary);
  outboundBytes += message.length();
  if (!writing) {
    startWrite();
  }
  pump();

  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(SEND_STALL_TIMEOUT_MS);
  while (open && outboundBytes > MAX_PENDING_OUTBOUND_BYTES) {
    if (std::chrono::steady_clock::now() > deadline) {
      LOG(WARNING) << "Client is not reading, dropping the connection";
      beast::error_code ec;
      ws.next_layer().close(ec);
      open = false;
      break;
    }
    if (ioc.stopped()) {
      ioc.restart();
    }
    ioc.run_one_for(std::chrono::milliseconds(100));
  }
  if (!open) {
    throw ChannelClosedError("Websocket closed while sending");
  }
}

void WebSocketChannel::close() {
  if (closing) {
    return;
  }
  closing = true;
  if (open) {
    // Give queued output a chance to reach the client before the close frame
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(CLOSE_TIMEOUT_MS);
    while (open && writing && std::chrono::steady_clock::now() < deadline) {
      if (ioc.stopped()) {
        ioc.restart();
      }
      ioc.run_one_until(deadline);
    }
  }
  if (open && writing) {
    // The close frame may not overlap a write that is still in flight
    LOG(WARNING) << "Client stopped reading, dropping the connection";
    beast::error_code ec;
    ws.next_layer().close(ec);
    open = false;
    while (writing) {
      if (ioc.stopped()) {
        ioc.restart();
      }
      if (ioc.run_one_for(std::chrono::milliseconds(100)) == 0) {
        break;
      }
    }
  }
  if (open) {
    bool done = false;
    ws.async_close(websocket::close_code::normal,
                   [&done](beast::error_code ec) {
                     if (ec) {
                       VLOG(1) << "Websocket close handshake: " << ec.message();
                     }
                     done = true;
                   });
    runUntil(done, CLOSE_TIMEOUT_MS);
    if (!done) {
      abortUntil(done);
    }
  }
  open = false;
  if (ws.next_layer().is_open()) {
    beast::error_code ec;
    ws.next_layer().close(ec);
    if (ec) {
      VLOG(1) << "Error closing client socket: " << ec.message();
    }
  }
  // Let the aborted read complete so no handler outlives this object
  pump();
}

bool WebSocketChannel::isOpen() {
  pump();
  return open && !closing;
}

int WebSocketChannel::getFd() {
  if (!open || !ws.next_layer().is_open()) {
    return -1;
  }
  return ws.next_layer().native_handle();
}

void WebSocketChannel::parseTarget(const string &target, string *path,
                                   map<string, string> *query) {
  auto questionMark = target.find('?');
  *path = target.substr(0, questionMark);
  query->clear();
  if (questionMark == string::npos) {
    return;
  }
  for (const string &pair : split(target.substr(questionMark + 1), '&')) {
    if (pair.empty()) {
      continue;
    }
    auto equals = pair.find('=');
    string key = urlDecode(pair.substr(0, equals));
    string value =
        equals == string::npos ? string() : urlDecode(pair.substr(equals + 1));
    (*query)[key] = value;
  }
}

string WebSocketChannel::urlDecode(const string &s) {
  string decoded;
  decoded.reserve(s.length());
  for (size_t a = 0; a < s.length(); a++) {
    if (s[a] == '+') {
      decoded.push_back(' ');
    } else if (s[a] == '%' && a + 2 < s.length() && hexValue(s[a + 1]) >= 0 &&
               hexValue(s[a + 2]) >= 0) {
      decoded.push_back(char(hexValue(s[a + 1]) * 16 + hexValue(s[a + 2])));
      a += 2;
    } else {
      decoded.push_back(s[a]);
    }
  }
  return decoded;
}

void WebSocketChannel::pump() {
  if (ioc.stopped()) {
    ioc.restart();
  }
  ioc.poll();
}

void WebSocketChannel::runUntil(const bool &done, int timeoutMs) {
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(timeoutMs);
  while (!done) {
    if (ioc.stopped()) {
      ioc.restart();
    }
    if (ioc.run_one_until(deadline) == 0 &&
        std::chrono::steady_clock::now() >= deadline) {
      break;
    }
  }
}

void WebSocketChannel::abortUntil(const bool &done) {
  beast::error_code ec;
  ws.next_layer().close(ec);
  open = false;
  while (!done) {
    if (ioc.stopped()) {
      ioc.restart();
    }
    if (ioc.run_one_for(std::chrono::milliseconds(100)) == 0) {
      break;
    }
  }
}

void WebSocketChannel::rejectRequest(
    const http::request<http::string_body> &request) {
  http::response<http::string_body> response{http::status::not_found,
                                             request.version()};
  response.set(http::field::server, string("tbserver/") + TB_VERSION);
  response.set(http::field::content_type, "text/plain");
  response.keep_alive(false);
  response.body() = "Not found\n";
  response.prepare_payload();
  beast::error_code ec;
  http::write(ws.next_layer(), response, ec);
  if (ec) {
    VLOG(1) << "Cannot send rejection: " << ec.message();
  }
  ws.next_layer().close(ec);
}

void WebSocketChannel::startRead() {
  ws.async_read(readBuffer, [this](beast::error_code ec, size_t) {
    onRead(ec);
  });
}

void WebSocketChannel::onRead(beast::error_code ec) {
  if (ec) {
    if (ec != websocket::error::closed && ec != asio::error::operation_aborted) {
      VLOG(1) << "Websocket read ended: " << ec.message();
    }
    open = false;
    return;
  }
  inbound.push_back(beast::buffers_to_string(readBuffer.data()));
  readBuffer.consume(readBuffer.size());
  startRead();
}

void WebSocketChannel::startWrite() {
  writing = true;
  const pair<string, bool> &frame = outbound.front();
  ws.binary(frame.second);
  ws.async_write(asio::buffer(frame.first),
                 [this](beast::error_code ec, size_t) { onWrite(ec); });
}

void WebSocketChannel::onWrite(beast::error_code ec) {
  writing = false;
  if (ec) {
    VLOG(1) << "Websocket write failed: " << ec.message();
    open = false;
    outbound.clear();
    outboundBytes = 0;
    return;
  }
  outboundBytes -= outbound.front().first.length();
  outbound.pop_front();
  if (open && !outbound.empty()) {
    startWrite();
  }
}
}  // namespace tb
