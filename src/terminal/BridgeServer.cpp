#include "BridgeServer.hpp"

#include "FdUtils.hpp"

namespace tb {
namespace {
int parseQueryPort(const string &s) {
  if (s.empty() || s.length() > 5 ||
      s.find_first_not_of("0123456789") != string::npos) {
    throw std::invalid_argument("Invalid port '" + s + "'");
  }
  int port = stoi(s);
  if (port < 1 || port > 65535) {
    throw std::invalid_argument("Invalid port '" + s + "'");
  }
  return port;
}

// Values end up on an ssh command line and must not read as options
string checkedQueryValue(const map<string, string> &query, const string &key,
                         const string &fallback) {
  auto it = query.find(key);
  if (it == query.end() || it->second.empty()) {
    return fallback;
  }
  if (it->second[0] == '-' ||
      it->second.find_first_of(" \t\r\n") != string::npos) {
    throw std::invalid_argument("Invalid " + key + " '" + it->second + "'");
  }
  return it->second;
}
}  // namespace

BridgeServer::BridgeServer(const BridgeConfig &_config,
                           shared_ptr<SessionRegistry> _registry)
    : config(_config), registry(_registry), ioc(1), acceptor(ioc), halt(false) {
  tcp::endpoint endpoint(asio::ip::make_address(config.bindIp),
                         (unsigned short)config.port);
  acceptor.open(endpoint.protocol());
  FdUtils::setCloseOnExec(acceptor.native_handle());
  acceptor.set_option(asio::socket_base::reuse_address(true));
  acceptor.bind(endpoint);
  acceptor.listen();
  acceptor.non_blocking(true);
}

BridgeServer::~BridgeServer() {
  halt = true;
  joinSessionThreads();
}

void BridgeServer::run() {
  LOG(INFO) << "Listening on " << config.bindIp << ":" << getPort()
            << config.wsPath;
  int listenFd = acceptor.native_handle();
  while (!halt) {
    bool pending = FdUtils::waitForRead(listenFd, 10);
    reapSessionThreads();
    if (pending) {
      acceptNewConnection();
    }
  }
  LOG(INFO) << "Shutting down";
  joinSessionThreads();
}

int BridgeServer::getPort() { return acceptor.local_endpoint().port(); }

shared_ptr<TransportFactory> BridgeServer::createFactory(
    const map<string, string> &query) {
  auto portIt = query.find("port");
  bool hasPort = portIt != query.end() && !portIt->second.empty();

  if (config.mode == BridgeMode::SSH) {
    ConnectRequest defaults = config.connectDefaults();
    defaults.host = checkedQueryValue(query, "host", defaults.host);
    defaults.username = checkedQueryValue(query, "user", defaults.username);
    if (hasPort) {
      defaults.port = parseQueryPort(portIt->second);
    }
    return shared_ptr<TransportFactory>(
        new SshTransportFactory(config.sshOptions(), defaults));
  }

  vector<string> commandLine = config.commandLine();
  if (commandLine.size() == 1 && commandLine[0] == "ssh") {
    ConnectRequest defaults = config.connectDefaults();
    string host = checkedQueryValue(query, "host", defaults.host);
    string user = checkedQueryValue(query, "user", defaults.username);
    int port = hasPort ? parseQueryPort(portIt->second) : defaults.port;
    commandLine = PtyTransportFactory::sshCommandLine(host, port, user);
  }
  vector<string> args(commandLine.begin() + 1, commandLine.end());
  return shared_ptr<TransportFactory>(
      new PtyTransportFactory(config.ptyOptions(), commandLine[0], args));
}

void BridgeServer::acceptNewConnection() {
  // Accepted sockets must be close-on-exec before any session forks a shell
#if __APPLE__
  int fd = ::accept(acceptor.native_handle(), NULL, NULL);
#else
  int fd = ::accept4(acceptor.native_handle(), NULL, NULL, SOCK_CLOEXEC);
#endif
  if (fd == -1) {
    if (GetErrno() != EAGAIN && GetErrno() != EWOULDBLOCK &&
        GetErrno() != EINTR) {
      LOG(WARNING) << "Error accepting connection: " << strerror(GetErrno());
    }
    return;
  }
#if __APPLE__
  FdUtils::setCloseOnExec(fd);
#endif

  shared_ptr<WebSocketChannel> channel(new WebSocketChannel(config.wsPath));
  beast::error_code ec;
  channel->getSocket().assign(acceptor.local_endpoint().protocol(), fd, ec);
  if (ec) {
    LOG(WARNING) << "Cannot adopt accepted socket: " << ec.message();
    ::close(fd);
    return;
  }
  tcp::endpoint remote = channel->getSocket().remote_endpoint(ec);
  if (!ec) {
    LOG(INFO) << "Connection from " << remote.address().to_string() << ":"
              << remote.port();
  }

  shared_ptr<atomic<bool>> done(new atomic<bool>(false));
  shared_ptr<thread> sessionThread(new thread([this, channel, done]() {
    handleClient(channel);
    *done = true;
  }));
  lock_guard<std::mutex> guard(sessionThreadMutex);
  sessionThreads.push_back({sessionThread, done});
}

void BridgeServer::handleClient(shared_ptr<WebSocketChannel> channel) {
  string id = sole::uuid4().str();
  // set thread name
  el::Helpers::setThreadName(id);
  try {
    channel->accept();
  } catch (const ChannelClosedError &cce) {
    LOG(INFO) << "Dropping connection: " << cce.what();
    return;
  }

  shared_ptr<TransportFactory> factory;
  try {
    factory = createFactory(channel->getQueryParameters());
  } catch (const std::invalid_argument &ia) {
    LOG(WARNING) << "Rejecting session: " << ia.what();
    try {
      channel->send(BridgeProtocol::makeErrorMessage(ia.what()), false);
    } catch (const ChannelClosedError &cce) {
      VLOG(1) << "Cannot report error to the client: " << cce.what();
    }
    channel->close();
    return;
  }

  shared_ptr<SessionBridge> bridge(new SessionBridge(
      id, channel, registry, factory, config.pollIntervalMs));
  bridge->run();
}

void BridgeServer::reapSessionThreads() {
  lock_guard<std::mutex> guard(sessionThreadMutex);
  for (auto it = sessionThreads.begin(); it != sessionThreads.end();) {
    if (*(it->done)) {
      it->sessionThread->join();
      it = sessionThreads.erase(it);
    } else {
      ++it;
    }
  }
}

void BridgeServer::joinSessionThreads() {
  while (true) {
    // Sessions still finishing their handshake register late, so keep asking
    registry->stopAll();
    reapSessionThreads();
    {
      lock_guard<std::mutex> guard(sessionThreadMutex);
      if (sessionThreads.empty()) {
        break;
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}
}  // namespace tb
