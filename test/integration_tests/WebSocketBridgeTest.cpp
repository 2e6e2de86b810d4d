#include "BridgeServer.hpp"
#include "FdUtils.hpp"
#include "TestHeaders.hpp"

using namespace tb;

namespace {
struct ServerFixture {
  shared_ptr<SessionRegistry> registry;
  shared_ptr<BridgeServer> server;
  thread serverThread;

  explicit ServerFixture(BridgeConfig config) {
    config.bindIp = "127.0.0.1";
    config.port = 0;
    registry.reset(new SessionRegistry());
    server.reset(new BridgeServer(config, registry));
    serverThread = thread([this]() { server->run(); });
  }

  ~ServerFixture() {
    server->shutdown();
    serverThread.join();
  }

  int getPort() { return server->getPort(); }
};

/**
 * @brief Browser stand-in speaking the bridge protocol over a real socket.
 */
class TestClient {
 public:
  TestClient() : ws(ioc), closed(false) {}

  void connect(int port, const string &target) {
    ws.next_layer().connect(
        tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    // Shells spawned by the server must only ever see the server's sockets
    FdUtils::setCloseOnExec(ws.next_layer().native_handle());
    ws.handshake("127.0.0.1:" + to_string(port), target);
  }

  void sendJson(const json &message) {
    ws.text(true);
    ws.write(asio::buffer(message.dump()));
  }

  /**
   * @brief Reads frames until the shell output contains `needle` or the
   * server closes the connection. Returns false on timeout.
   */
  bool readUntil(const string &needle, int timeoutMs = 5000) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timeoutMs);
    while (!closed && (needle.empty() || output.find(needle) == string::npos)) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0 || !readFrame(remaining)) {
        return false;
      }
    }
    return true;
  }

  /** @brief Waits for the server to close the connection. */
  bool waitForClose(int timeoutMs = 5000) {
    readUntil("", timeoutMs);
    return closed;
  }

  void close() {
    ws.close(websocket::close_code::normal);
  }

  string output;
  vector<json> textMessages;
  int binaryFrames = 0;
  bool closed;

 protected:
  asio::io_context ioc;
  websocket::stream<tcp::socket> ws;

  bool readFrame(std::chrono::milliseconds timeout) {
    beast::flat_buffer buffer;
    bool done = false;
    beast::error_code result;
    ws.async_read(buffer, [&done, &result](beast::error_code ec, size_t) {
      result = ec;
      done = true;
    });
    ioc.restart();
    ioc.run_for(timeout);
    if (!done) {
      beast::error_code ignored;
      ws.next_layer().cancel(ignored);
      ioc.restart();
      ioc.run();
      return false;
    }
    if (result) {
      closed = true;
      return true;
    }
    string payload = beast::buffers_to_string(buffer.data());
    if (ws.got_binary()) {
      binaryFrames++;
      output += payload;
    } else {
      json message = json::parse(payload);
      if (message["type"] == "output") {
        output += message["data"].get<string>();
      }
      textMessages.push_back(message);
    }
    return true;
  }
};

int refusedPort() {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  FATAL_FAIL(::bind(fd, (sockaddr *)&addr, sizeof(addr)));
  socklen_t length = sizeof(addr);
  FATAL_FAIL(getsockname(fd, (sockaddr *)&addr, &length));
  FATAL_FAIL(::close(fd));
  return ntohs(addr.sin_port);
}
}  // namespace

TEST_CASE("A local command's output reaches the browser",
          "[WebSocketBridge]") {
  BridgeConfig config;
  config.command = "echo hi";
  ServerFixture fixture(config);

  TestClient client;
  client.connect(fixture.getPort(), "/ws/terminal");
  REQUIRE(client.readUntil("hi"));
  REQUIRE(client.output.find("hi") != string::npos);
  REQUIRE(client.binaryFrames > 0);
  // The session ends with the command
  REQUIRE(client.waitForClose());
  REQUIRE(waitFor([&fixture]() { return fixture.registry->size() == 0; }));
}

TEST_CASE("Keystrokes and resizes reach a local shell", "[WebSocketBridge]") {
  BridgeConfig config;
  config.command = "sh";
  ServerFixture fixture(config);

  TestClient client;
  client.connect(fixture.getPort(), "/ws/terminal");
  REQUIRE(waitFor([&fixture]() { return fixture.registry->size() == 1; }));

  client.sendJson(json{{"type", "resize"}, {"rows", 40}, {"cols", 120}});
  client.sendJson(json{{"type", "input"}, {"data", "stty size\n"}});
  REQUIRE(client.readUntil("40 120"));

  client.sendJson(json{{"type", "input"}, {"data", "echo tb-$((6*7))\n"}});
  REQUIRE(client.readUntil("tb-42"));

  // An abrupt disconnect ends the session on the server
  client.close();
  REQUIRE(waitFor([&fixture]() { return fixture.registry->size() == 0; }));
}

TEST_CASE("Shells inherit no sockets", "[WebSocketBridge]") {
  if (!fs::exists("/proc/self/fd")) {
    WARN("No /proc/self/fd to inspect");
    return;
  }
  string scriptPath = GetTempDirectory() + "tb_fd_scan_" +
                      to_string(getpid()) + ".sh";
  {
    ofstream script(scriptPath);
    script << "for f in /proc/$$/fd/*; do\n"
           << "  n=${f##*/}\n"
           << "  if [ \"$n\" -gt 2 ]; then readlink \"$f\"; fi\n"
           << "done\n"
           << "echo fd-scan-done\n"
           << "exec cat\n";
  }
  BridgeConfig config;
  config.command = "sh " + scriptPath;
  ServerFixture fixture(config);

  // A second client connects while the first one's session is live
  TestClient first;
  first.connect(fixture.getPort(), "/ws/terminal");
  REQUIRE(first.readUntil("fd-scan-done"));
  TestClient second;
  second.connect(fixture.getPort(), "/ws/terminal");
  REQUIRE(second.readUntil("fd-scan-done"));
  REQUIRE(fixture.registry->size() == 2);

  REQUIRE(first.output.find("socket:") == string::npos);
  REQUIRE(second.output.find("socket:") == string::npos);
  fs::remove(scriptPath);
}

TEST_CASE("Other paths are refused", "[WebSocketBridge]") {
  BridgeConfig config;
  config.command = "cat";
  ServerFixture fixture(config);

  TestClient client;
  REQUIRE_THROWS(client.connect(fixture.getPort(), "/not/terminal"));
  REQUIRE(fixture.registry->size() == 0);
}

TEST_CASE("A failed remote connect is reported to the browser",
          "[WebSocketBridge]") {
  BridgeConfig config;
  config.mode = BridgeMode::SSH;
  config.defaultHost = "127.0.0.1";
  config.defaultPort = refusedPort();
  config.connectTimeoutMs = 1000;
  ServerFixture fixture(config);

  TestClient client;
  client.connect(fixture.getPort(), "/ws/terminal");
  client.sendJson(json{{"type", "connect"},
                       {"username", "nobody"},
                       {"credential", "secret"}});
  REQUIRE(client.waitForClose());

  REQUIRE(client.textMessages.size() == 1);
  REQUIRE(client.textMessages[0]["type"] == "error");
  REQUIRE_FALSE(client.textMessages[0]["message"].get<string>().empty());
  REQUIRE(client.binaryFrames == 0);
  REQUIRE(waitFor([&fixture]() { return fixture.registry->size() == 0; }));
}

TEST_CASE("Shutting down the server closes live sessions",
          "[WebSocketBridge]") {
  BridgeConfig config;
  config.command = "cat";
  shared_ptr<ServerFixture> fixture(new ServerFixture(config));

  TestClient client;
  client.connect(fixture->getPort(), "/ws/terminal");
  REQUIRE(waitFor([&fixture]() { return fixture->registry->size() == 1; }));

  fixture.reset();
  REQUIRE(client.waitForClose());
}

TEST_CASE("Query parameters pick the ssh target", "[WebSocketBridge]") {
  BridgeConfig config;
  config.command = "ssh";
  ServerFixture fixture(config);

  auto factory = fixture.server->createFactory(
      {{"host", "pi.local"}, {"user", "pi"}, {"port", "2200"}});
  auto ptyFactory = dynamic_pointer_cast<PtyTransportFactory>(factory);
  REQUIRE(ptyFactory != nullptr);
  REQUIRE_FALSE(ptyFactory->requiresConnectMessage());
  REQUIRE(ptyFactory->getCommand() == "ssh");
  REQUIRE(ptyFactory->getArgs() ==
          vector<string>({"-o", "StrictHostKeyChecking=no", "-p", "2200",
                          "pi@pi.local"}));

  // Without parameters the configured defaults are used
  ptyFactory = dynamic_pointer_cast<PtyTransportFactory>(
      fixture.server->createFactory({}));
  REQUIRE(ptyFactory->getArgs() ==
          vector<string>({"-o", "StrictHostKeyChecking=no", "-p", "22",
                          GetOsUserName() + "@localhost"}));

  REQUIRE_THROWS_AS(
      fixture.server->createFactory({{"host", "-oProxyCommand=touch x"}}),
      std::invalid_argument);
  REQUIRE_THROWS_AS(fixture.server->createFactory({{"port", "ssh"}}),
                    std::invalid_argument);
}

TEST_CASE("Query parameters seed remote connect defaults",
          "[WebSocketBridge]") {
  BridgeConfig config;
  config.mode = BridgeMode::SSH;
  ServerFixture fixture(config);

  auto factory = dynamic_pointer_cast<SshTransportFactory>(
      fixture.server->createFactory({{"host", "pi.local"}, {"user", "pi"}}));
  REQUIRE(factory != nullptr);
  REQUIRE(factory->requiresConnectMessage());
  REQUIRE(factory->outputFraming() == OutputFraming::JSON_OUTPUT);

  ConnectRequest resolved = factory->resolve(ConnectRequest());
  REQUIRE(resolved.host == "pi.local");
  REQUIRE(resolved.username == "pi");
  REQUIRE(resolved.port == 22);

  // The client's connect message wins
  ConnectRequest request;
  request.host = "other.local";
  request.port = 2022;
  resolved = factory->resolve(request);
  REQUIRE(resolved.host == "other.local");
  REQUIRE(resolved.port == 2022);
  REQUIRE(resolved.username == "pi");
}
