#include "BridgeProtocol.hpp"

namespace tb {
namespace {
int clampDimension(long long value) {
  if (value < 1) {
    return 1;
  }
  if (value > BridgeProtocol::MAX_TERMINAL_DIMENSION) {
    return BridgeProtocol::MAX_TERMINAL_DIMENSION;
  }
  return int(value);
}

// Returns false if the field is present but not a string
bool readString(const json &object, const char *key, string *out) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return true;
  }
  if (!it->is_string()) {
    return false;
  }
  *out = it->get<string>();
  return true;
}

// 0 for anything that is not an integer in [1, 65535]
int parsePort(const json &value) {
  long long port = 0;
  if (value.is_number_integer()) {
    port = value.get<long long>();
  } else if (value.is_string()) {
    const string &s = value.get_ref<const string &>();
    if (s.empty() || s.length() > 5 ||
        s.find_first_not_of("0123456789") != string::npos) {
      return 0;
    }
    port = stoll(s);
  }
  return (port >= 1 && port <= 65535) ? int(port) : 0;
}
}  // namespace

InboundMessage BridgeProtocol::parseInboundMessage(const string &raw) {
  InboundMessage message;
  json j = json::parse(raw, nullptr, false);
  if (j.is_discarded()) {
    message.error = "not valid JSON";
    return message;
  }
  if (!j.is_object()) {
    message.error = "not a JSON object";
    return message;
  }
  auto typeIt = j.find("type");
  if (typeIt == j.end() || !typeIt->is_string()) {
    message.error = "missing message type";
    return message;
  }
  message.type = typeIt->get<string>();

  if (message.type == "input") {
    if (!readString(j, "data", &message.data)) {
      message.error = "input data is not a string";
      return message;
    }
    message.kind = InboundMessage::INPUT;
  } else if (message.type == "resize") {
    message.rows =
        clampTerminalSize(j.value("rows", json()), DEFAULT_TERMINAL_ROWS);
    message.cols =
        clampTerminalSize(j.value("cols", json()), DEFAULT_TERMINAL_COLS);
    message.kind = InboundMessage::RESIZE;
  } else if (message.type == "connect") {
    ConnectRequest &request = message.connect;
    if (!readString(j, "host", &request.host) ||
        !readString(j, "username", &request.username) ||
        !readString(j, "credential", &request.credential)) {
      message.error = "connect fields must be strings";
      return message;
    }
    auto portIt = j.find("port");
    if (portIt != j.end() && !portIt->is_null()) {
      int port = parsePort(*portIt);
      if (port == 0) {
        message.error = "invalid port";
        return message;
      }
      request.port = port;
    }
    message.kind = InboundMessage::CONNECT;
  } else {
    message.kind = InboundMessage::UNKNOWN;
  }
  return message;
}

int BridgeProtocol::clampTerminalSize(const json &value, int fallback) {
  switch (value.type()) {
    case json::value_t::number_integer:
      return clampDimension(value.get<long long>());
    case json::value_t::number_unsigned: {
      unsigned long long u = value.get<unsigned long long>();
      return u > (unsigned long long)MAX_TERMINAL_DIMENSION
                 ? MAX_TERMINAL_DIMENSION
                 : clampDimension((long long)u);
    }
    case json::value_t::number_float: {
      double d = value.get<double>();
      if (std::isnan(d)) {
        return fallback;
      }
      if (d >= double(MAX_TERMINAL_DIMENSION)) {
        return MAX_TERMINAL_DIMENSION;
      }
      return clampDimension((long long)std::max(d, -1.0));
    }
    case json::value_t::string: {
      const string &s = value.get_ref<const string &>();
      try {
        size_t used = 0;
        long long parsed = stoll(s, &used);
        if (used != s.length()) {
          return fallback;
        }
        return clampDimension(parsed);
      } catch (const std::invalid_argument &) {
        return fallback;
      } catch (const std::out_of_range &) {
        return s.find('-') == string::npos ? MAX_TERMINAL_DIMENSION : 1;
      }
    }
    default:
      break;
  }
  return fallback;
}

string BridgeProtocol::makeConnectedMessage() {
  return dumpJson(json{{"type", "connected"}});
}

string BridgeProtocol::makeErrorMessage(const string &message) {
  return dumpJson(json{{"type", "error"}, {"message", message}});
}

string BridgeProtocol::makeOutputMessage(const string &data) {
  return dumpJson(json{{"type", "output"}, {"data", data}});
}
}  // namespace tb
