#include "SshChannelTransport.hpp"
#include "TestHeaders.hpp"

using namespace tb;

namespace {
// Listening loopback socket that never speaks; returns its fd.
int listenOnLoopback(int *port) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  FATAL_FAIL(::bind(fd, (sockaddr *)&addr, sizeof(addr)));
  FATAL_FAIL(::listen(fd, 4));
  socklen_t length = sizeof(addr);
  FATAL_FAIL(getsockname(fd, (sockaddr *)&addr, &length));
  *port = ntohs(addr.sin_port);
  return fd;
}

// A host key blob in the wire format libssh2 hands out
string fakeRsaKey(char fill) {
  string key("\0\0\0\x07ssh-rsa", 11);
  key += string("\0\0\0\x03\x01\0\x01", 7);
  key += string("\0\0\0\x41", 4);
  key += string(65, fill);
  return key;
}

string readFile(const string &path) {
  ifstream in(path);
  stringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

/**
 * @brief A libssh2 session that only serves the known hosts API, plus a
 * scratch directory for the known hosts file.
 */
struct KnownHostsFixture {
  LIBSSH2_SESSION *session;
  string directory;
  SshOptions options;

  KnownHostsFixture() {
    SshChannelTransport::initializeLibrary();
    session = libssh2_session_init();
    REQUIRE(session != NULL);
    string pattern = GetTempDirectory() + string("tb_known_hosts_XXXXXXXX");
    REQUIRE(mkdtemp(&pattern[0]) != NULL);
    directory = pattern;
    options.knownHostsFile = directory + "/ssh/known_hosts";
  }

  ~KnownHostsFixture() {
    libssh2_session_free(session);
    fs::remove_all(directory);
  }

  void check(const string &host, int port, const string &key) {
    SshChannelTransport::checkHostKey(session, options, host, port, key,
                                      LIBSSH2_HOSTKEY_TYPE_RSA);
  }

  ConnectError::Kind rejection(const string &host, int port,
                               const string &key) {
    try {
      check(host, port, key);
    } catch (const ConnectError &ce) {
      return ce.getKind();
    }
    FAIL("the host key should have been rejected");
    return ConnectError::OTHER;
  }
};

string findSshd() {
  for (const string &candidate : {"/usr/sbin/sshd", "/usr/local/sbin/sshd",
                                  "/usr/bin/sshd", "/sbin/sshd"}) {
    if (access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return string();
}

/**
 * @brief An OpenSSH server on loopback with a throwaway host key and
 * password authentication only.
 */
class SshdFixture {
 public:
  SshdFixture() : pid(-1), port(0) {
    string sshd = findSshd();
    if (sshd.empty()) {
      skipReason = "sshd is not installed";
      return;
    }
    string pattern = GetTempDirectory() + string("tb_sshd_XXXXXXXX");
    REQUIRE(mkdtemp(&pattern[0]) != NULL);
    directory = pattern;
    string hostKey = directory + "/host_key";
    string keygen = "ssh-keygen -q -t ed25519 -N '' -f " + hostKey +
                    " >/dev/null 2>&1";
    if (system(keygen.c_str()) != 0) {
      skipReason = "ssh-keygen cannot create a host key";
      return;
    }
    int fd = listenOnLoopback(&port);
    FATAL_FAIL(::close(fd));
    {
      ofstream config(directory + "/sshd_config");
      config << "Port " << port << "\n"
             << "ListenAddress 127.0.0.1\n"
             << "HostKey " << hostKey << "\n"
             << "PidFile " << directory << "/sshd.pid\n"
             << "UsePAM no\n"
             << "StrictModes no\n"
             << "PubkeyAuthentication no\n"
             << "PasswordAuthentication yes\n";
    }
    string configPath = directory + "/sshd_config";
    string logPath = directory + "/sshd.log";
    pid = fork();
    FATAL_FAIL(pid);
    if (pid == 0) {
      int logFd = ::open(logPath.c_str(), O_WRONLY | O_CREAT, 0600);
      if (logFd >= 0) {
        dup2(logFd, STDOUT_FILENO);
        dup2(logFd, STDERR_FILENO);
      }
      execl(sshd.c_str(), sshd.c_str(), "-D", "-e", "-f", configPath.c_str(),
            (char *)NULL);
      _exit(127);
    }
    int listenPort = port;
    bool listening = waitFor([listenPort]() {
      int probeFd = ::socket(AF_INET, SOCK_STREAM, 0);
      sockaddr_in addr;
      memset(&addr, 0, sizeof(addr));
      addr.sin_family = AF_INET;
      addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
      addr.sin_port = htons(listenPort);
      bool connected = ::connect(probeFd, (sockaddr *)&addr, sizeof(addr)) == 0;
      ::close(probeFd);
      return connected;
    });
    if (!listening) {
      skipReason = "sshd did not start: " + readFile(logPath);
    }
  }

  ~SshdFixture() {
    if (pid > 0) {
      kill(pid, SIGTERM);
      int status;
      waitpid(pid, &status, 0);
    }
    if (!directory.empty()) {
      fs::remove_all(directory);
    }
  }

  bool usable() {
    if (!skipReason.empty()) {
      WARN("Skipping: " << skipReason);
      return false;
    }
    return true;
  }

  int getPort() { return port; }
  const string &getDirectory() { return directory; }

 protected:
  pid_t pid;
  int port;
  string directory;
  string skipReason;
};
}  // namespace

TEST_CASE("An unconnected transport is inert", "[SshChannelTransport]") {
  SshChannelTransport transport{SshOptions()};
  REQUIRE_FALSE(transport.isAlive());
  REQUIRE(transport.getFd() == -1);
  REQUIRE(transport.read().empty());
  transport.write("ignored");
  transport.resize(40, 120);
  transport.terminate();
  transport.terminate();
}

TEST_CASE("A refused connection is reported", "[SshChannelTransport]") {
  int port;
  int fd = listenOnLoopback(&port);
  // Nothing listens on the port any more
  FATAL_FAIL(::close(fd));

  SshChannelTransport transport{SshOptions()};
  try {
    transport.connect("127.0.0.1", port, "nobody", "secret");
    FAIL("connect should have thrown");
  } catch (const ConnectError &ce) {
    REQUIRE(ce.getKind() == ConnectError::OTHER);
    REQUIRE(string(ce.what()).find("127.0.0.1") != string::npos);
  }
  REQUIRE_FALSE(transport.isAlive());
  REQUIRE(transport.getFd() == -1);
}

TEST_CASE("An unknown host is reported", "[SshChannelTransport]") {
  SshChannelTransport transport{SshOptions()};
  try {
    transport.connect("tb-test-host.invalid", 22, "nobody", "secret");
    FAIL("connect should have thrown");
  } catch (const ConnectError &ce) {
    REQUIRE(ce.getKind() == ConnectError::OTHER);
  }
  REQUIRE(transport.getFd() == -1);
}

TEST_CASE("A silent server times out", "[SshChannelTransport]") {
  int port;
  int fd = listenOnLoopback(&port);

  SshOptions options;
  options.connectTimeoutMs = 300;
  SshChannelTransport transport(options);
  auto start = std::chrono::steady_clock::now();
  try {
    transport.connect("127.0.0.1", port, "nobody", "secret");
    FAIL("connect should have thrown");
  } catch (const ConnectError &ce) {
    // libssh2 reports the missing banner as a timeout or a protocol error
    REQUIRE((ce.getKind() == ConnectError::TIMEOUT ||
             ce.getKind() == ConnectError::PROTOCOL_ERROR));
  }
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::steady_clock::now() - start)
                     .count();
  REQUIRE(elapsed < 5000);
  REQUIRE(transport.getFd() == -1);
  FATAL_FAIL(::close(fd));
}

TEST_CASE("Connect errors have readable kinds", "[SshChannelTransport]") {
  REQUIRE(string(ConnectError::kindName(ConnectError::AUTH_FAILED)) ==
          "auth-failed");
  REQUIRE(string(ConnectError::kindName(ConnectError::TIMEOUT)) == "timeout");
  REQUIRE(string(ConnectError::kindName(ConnectError::HOST_KEY_REJECTED)) ==
          "host-key-rejected");
  ConnectError error(ConnectError::PROTOCOL_ERROR, "bad banner");
  REQUIRE(error.getKind() == ConnectError::PROTOCOL_ERROR);
  REQUIRE(string(error.what()) == "bad banner");
}

TEST_CASE("Known hosts entries carry non-default ports",
          "[SshChannelTransport]") {
  REQUIRE(SshChannelTransport::knownHostsEntry("example.com", 22) ==
          "example.com");
  REQUIRE(SshChannelTransport::knownHostsEntry("127.0.0.1", 2222) ==
          "[127.0.0.1]:2222");
}

TEST_CASE("Password methods are tried in a fixed order",
          "[SshChannelTransport]") {
  REQUIRE(SshChannelTransport::passwordMethods(
              "publickey,keyboard-interactive,password") ==
          vector<string>({"password", "keyboard-interactive"}));
  REQUIRE(SshChannelTransport::passwordMethods(
              "publickey,keyboard-interactive") ==
          vector<string>({"keyboard-interactive"}));
  REQUIRE(SshChannelTransport::passwordMethods("publickey").empty());
  // Only whole method names count
  REQUIRE(SshChannelTransport::passwordMethods("passwordless").empty());
}

TEST_CASE("New host keys are remembered", "[SshChannelTransport]") {
  KnownHostsFixture f;
  f.check("127.0.0.1", 2222, fakeRsaKey('a'));
  f.check("example.com", 22, fakeRsaKey('b'));

  string knownHosts = readFile(f.options.knownHostsFile);
  REQUIRE(knownHosts.find("[127.0.0.1]:2222 ssh-rsa ") != string::npos);
  REQUIRE(knownHosts.find("example.com ssh-rsa ") != string::npos);

  // Once recorded, the keys pass even under the strict policy
  f.options.hostKeyPolicy = HostKeyPolicy::STRICT;
  f.check("127.0.0.1", 2222, fakeRsaKey('a'));
  f.check("example.com", 22, fakeRsaKey('b'));
}

TEST_CASE("The strict policy rejects unknown and changed keys",
          "[SshChannelTransport]") {
  KnownHostsFixture f;
  f.options.hostKeyPolicy = HostKeyPolicy::STRICT;
  REQUIRE(f.rejection("127.0.0.1", 2222, fakeRsaKey('a')) ==
          ConnectError::HOST_KEY_REJECTED);
  // Nothing is recorded for a rejected key
  REQUIRE_FALSE(fs::exists(f.options.knownHostsFile));

  f.options.hostKeyPolicy = HostKeyPolicy::ACCEPT_NEW;
  f.check("127.0.0.1", 2222, fakeRsaKey('a'));
  f.options.hostKeyPolicy = HostKeyPolicy::STRICT;
  REQUIRE(f.rejection("127.0.0.1", 2222, fakeRsaKey('z')) ==
          ConnectError::HOST_KEY_REJECTED);
}

TEST_CASE("Changed keys are tolerated but not recorded under accept-new",
          "[SshChannelTransport]") {
  KnownHostsFixture f;
  f.check("127.0.0.1", 2222, fakeRsaKey('a'));
  string before = readFile(f.options.knownHostsFile);

  f.check("127.0.0.1", 2222, fakeRsaKey('z'));
  REQUIRE(readFile(f.options.knownHostsFile) == before);
}

TEST_CASE("Accept-any records nothing", "[SshChannelTransport]") {
  KnownHostsFixture f;
  f.options.hostKeyPolicy = HostKeyPolicy::ACCEPT_ANY;
  f.check("127.0.0.1", 2222, fakeRsaKey('a'));
  REQUIRE_FALSE(fs::exists(f.options.knownHostsFile));
}

TEST_CASE("A wrong password is reported as an authentication failure",
          "[SshChannelTransport]") {
  SshdFixture sshd;
  if (!sshd.usable()) {
    return;
  }
  SshOptions options;
  options.knownHostsFile = sshd.getDirectory() + "/known_hosts";
  SshChannelTransport transport(options);
  try {
    transport.connect("127.0.0.1", sshd.getPort(), GetOsUserName(),
                      "tb-wrong-password");
    FAIL("connect should have thrown");
  } catch (const ConnectError &ce) {
    REQUIRE(ce.getKind() == ConnectError::AUTH_FAILED);
  }
  REQUIRE_FALSE(transport.isAlive());
  REQUIRE(transport.getFd() == -1);
  // The host key was checked, and remembered, before authenticating
  string entry = "[127.0.0.1]:" + to_string(sshd.getPort()) + " ";
  REQUIRE(readFile(options.knownHostsFile).find(entry) != string::npos);
}

TEST_CASE("A live server with an unknown key is refused under strict",
          "[SshChannelTransport]") {
  SshdFixture sshd;
  if (!sshd.usable()) {
    return;
  }
  SshOptions options;
  options.hostKeyPolicy = HostKeyPolicy::STRICT;
  options.knownHostsFile = sshd.getDirectory() + "/known_hosts";
  SshChannelTransport transport(options);
  try {
    transport.connect("127.0.0.1", sshd.getPort(), GetOsUserName(),
                      "tb-wrong-password");
    FAIL("connect should have thrown");
  } catch (const ConnectError &ce) {
    REQUIRE(ce.getKind() == ConnectError::HOST_KEY_REJECTED);
  }
  REQUIRE(transport.getFd() == -1);
}
