#include "SshChannelTransport.hpp"

#include "FdUtils.hpp"

namespace tb {
namespace {
std::once_flag libssh2InitFlag;
int libssh2InitResult = 0;

int knownHostKeyMask(int hostKeyType) {
  switch (hostKeyType) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
      return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
      return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_HOSTKEY_TYPE_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
      return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
      return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
      return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_HOSTKEY_TYPE_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
      return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default:
      break;
  }
  return LIBSSH2_KNOWNHOST_KEY_UNKNOWN;
}

int millisecondsUntil(std::chrono::steady_clock::time_point deadline) {
  return int(std::chrono::duration_cast<std::chrono::milliseconds>(
                 deadline - std::chrono::steady_clock::now())
                 .count());
}

// Keyboard-interactive servers (PAM) ask for the password as a prompt
LIBSSH2_USERAUTH_KBDINT_RESPONSE_FUNC(answerWithCredential) {
  SshChannelTransport *transport = static_cast<SshChannelTransport *>(*abstract);
  const string &credential = transport->getPendingCredential();
  for (int a = 0; a < num_prompts; a++) {
    responses[a].text = strdup(credential.c_str());
    responses[a].length = (unsigned int)credential.length();
  }
}
}  // namespace

SshChannelTransport::SshChannelTransport(const SshOptions &_options)
    : options(_options),
      sockFd(-1),
      session(NULL),
      channel(NULL),
      alive(false) {}

SshChannelTransport::~SshChannelTransport() { terminate(); }

void SshChannelTransport::initializeLibrary() {
  std::call_once(libssh2InitFlag, []() { libssh2InitResult = libssh2_init(0); });
  if (libssh2InitResult != 0) {
    throw ConnectError(ConnectError::OTHER, "Cannot initialize libssh2");
  }
}

string SshChannelTransport::knownHostsEntry(const string &host, int port) {
  return port == 22 ? host : "[" + host + "]:" + to_string(port);
}

vector<string> SshChannelTransport::passwordMethods(const string &available) {
  vector<string> methods;
  vector<string> offered = split(available, ',');
  // Plain password first; keyboard-interactive is how PAM asks for the same
  for (const string &method : {"password", "keyboard-interactive"}) {
    if (find(offered.begin(), offered.end(), method) != offered.end()) {
      methods.push_back(method);
    }
  }
  return methods;
}

void SshChannelTransport::connect(const string &host, int port,
                                  const string &username,
                                  const string &credential) {
  initializeLibrary();
  if (session != NULL || sockFd >= 0) {
    throw ConnectError(ConnectError::OTHER, "Already connected");
  }
  LOG(INFO) << "Connecting to " << username << "@" << host << ":" << port;
  try {
    openSocket(host, port);

    session = libssh2_session_init_ex(NULL, NULL, NULL, this);
    if (session == NULL) {
      throw ConnectError(ConnectError::OTHER, "Cannot create an SSH session");
    }
    libssh2_session_set_blocking(session, 1);
    libssh2_session_set_timeout(session, options.connectTimeoutMs);
    int rc = libssh2_session_handshake(session, sockFd);
    if (rc != 0) {
      throw sessionError("SSH handshake with " + host + " failed", rc);
    }

    verifyHostKey(host, port);
    authenticate(username, credential);
    openShell();
  } catch (const ConnectError &ce) {
    LOG(WARNING) << "SSH connection to " << host << ":" << port << " failed ("
                 << ConnectError::kindName(ce.getKind()) << "): " << ce.what();
    releaseResources();
    throw;
  }
  LOG(INFO) << "Remote shell ready on " << host << ":" << port;
}

void SshChannelTransport::openSocket(const string &host, int port) {
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *results = NULL;
  string portString = to_string(port);
  int rc = getaddrinfo(host.c_str(), portString.c_str(), &hints, &results);
  if (rc != 0) {
    throw ConnectError(ConnectError::OTHER, "Cannot resolve host '" + host +
                                                "': " + gai_strerror(rc));
  }

  bool timedOut = false;
  string lastError = "no usable address";
  for (addrinfo *it = results; it != NULL; it = it->ai_next) {
#if __APPLE__
    int fd = ::socket(it->ai_family, it->ai_socktype, it->ai_protocol);
#else
    int fd = ::socket(it->ai_family, it->ai_socktype | SOCK_CLOEXEC,
                      it->ai_protocol);
#endif
    if (fd == -1) {
      lastError = strerror(GetErrno());
      continue;
    }
#if __APPLE__
    FdUtils::setCloseOnExec(fd);
#endif
    FdUtils::setNonBlocking(fd);
    if (::connect(fd, it->ai_addr, it->ai_addrlen) == -1 &&
        GetErrno() != EINPROGRESS) {
      lastError = strerror(GetErrno());
      ::close(fd);
      continue;
    }
    if (!FdUtils::waitForWrite(fd, options.connectTimeoutMs)) {
      timedOut = true;
      lastError = "connection timed out";
      ::close(fd);
      continue;
    }
    int soError = 0;
    socklen_t soErrorLength = sizeof(soError);
    FATAL_FAIL(getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &soErrorLength));
    if (soError != 0) {
      lastError = strerror(soError);
      ::close(fd);
      continue;
    }
    // libssh2 is driven in blocking mode until the shell is running
    int flags = fcntl(fd, F_GETFL, 0);
    FATAL_FAIL(flags);
    FATAL_FAIL(fcntl(fd, F_SETFL, flags & ~O_NONBLOCK));
    int one = 1;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) == -1) {
      VLOG(1) << "Cannot set TCP_NODELAY: " << strerror(GetErrno());
    }
    sockFd = fd;
    break;
  }
  freeaddrinfo(results);

  if (sockFd < 0) {
    throw ConnectError(timedOut ? ConnectError::TIMEOUT : ConnectError::OTHER,
                       "Cannot connect to " + host + ":" + portString + ": " +
                           lastError);
  }
}

void SshChannelTransport::verifyHostKey(const string &host, int port) {
  size_t keyLength = 0;
  int keyType = 0;
  const char *key = libssh2_session_hostkey(session, &keyLength, &keyType);
  if (key == NULL) {
    throw ConnectError(ConnectError::PROTOCOL_ERROR,
                       "Host " + host + " did not present a host key");
  }
  checkHostKey(session, options, host, port, string(key, keyLength), keyType);
}

void SshChannelTransport::checkHostKey(LIBSSH2_SESSION *session,
                                       const SshOptions &options,
                                       const string &host, int port,
                                       const string &key, int keyType) {
  if (options.hostKeyPolicy == HostKeyPolicy::ACCEPT_ANY) {
    VLOG(1) << "Accepting the host key of " << host << " unchecked";
    return;
  }

  LIBSSH2_KNOWNHOSTS *knownHosts = libssh2_knownhost_init(session);
  if (knownHosts == NULL) {
    throw ConnectError(ConnectError::OTHER,
                       "Cannot verify the host key of " + host);
  }
  const string &knownHostsFile = options.knownHostsFile;
  if (!knownHostsFile.empty() && fs::exists(knownHostsFile)) {
    if (libssh2_knownhost_readfile(knownHosts, knownHostsFile.c_str(),
                                   LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0) {
      LOG(WARNING) << "Cannot parse known hosts file " << knownHostsFile;
    }
  }

  const bool strict = options.hostKeyPolicy == HostKeyPolicy::STRICT;
  const int typeMask =
      LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW;
  struct libssh2_knownhost *match = NULL;
  int check = libssh2_knownhost_checkp(knownHosts, host.c_str(), port,
                                       key.data(), key.length(), typeMask,
                                       &match);
  string failure;
  bool remember = false;
  switch (check) {
    case LIBSSH2_KNOWNHOST_CHECK_MATCH:
      VLOG(1) << "Host key for " << host << " matches";
      break;
    case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
      if (strict) {
        failure = "The host key for " + host + " is not known";
      } else {
        remember = true;
      }
      break;
    case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
      if (strict) {
        failure = "The host key for " + host + " has changed";
      } else {
        LOG(WARNING) << "Host key for " << host
                     << " does not match the recorded key, continuing";
      }
      break;
    default:
      if (strict) {
        failure = "Cannot check the host key for " + host;
      } else {
        LOG(WARNING) << "Cannot check the host key for " << host
                     << ", continuing";
      }
      break;
  }

  if (remember && !knownHostsFile.empty()) {
    string entry = knownHostsEntry(host, port);
    int rc = libssh2_knownhost_addc(knownHosts, entry.c_str(), NULL,
                                    key.data(), key.length(), NULL, 0,
                                    typeMask | knownHostKeyMask(keyType), NULL);
    if (rc == 0) {
      fs::path parent = fs::path(knownHostsFile).parent_path();
      if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
          VLOG(1) << "Cannot create " << parent << ": " << ec.message();
        }
      }
      rc = libssh2_knownhost_writefile(knownHosts, knownHostsFile.c_str(),
                                       LIBSSH2_KNOWNHOST_FILE_OPENSSH);
    }
    if (rc != 0) {
      LOG(WARNING) << "Cannot remember the host key for " << entry;
    } else {
      LOG(INFO) << "Remembered the host key for " << entry;
    }
  }
  libssh2_knownhost_free(knownHosts);

  if (!failure.empty()) {
    throw ConnectError(ConnectError::HOST_KEY_REJECTED, failure);
  }
}

void SshChannelTransport::authenticate(const string &username,
                                       const string &credential) {
  char *methods = libssh2_userauth_list(session, username.c_str(),
                                        (unsigned int)username.length());
  if (methods == NULL) {
    if (libssh2_userauth_authenticated(session)) {
      // The server accepted "none"
      return;
    }
    throw sessionError("Cannot start authentication",
                       libssh2_session_last_errno(session));
  }
  string available(methods);
  VLOG(1) << "Server offers authentication methods: " << available;

  pendingCredential = credential;
  int rc = LIBSSH2_ERROR_AUTHENTICATION_FAILED;
  for (const string &method : passwordMethods(available)) {
    if (method == "password") {
      rc = libssh2_userauth_password_ex(
          session, username.c_str(), (unsigned int)username.length(),
          credential.c_str(), (unsigned int)credential.length(), NULL);
    } else {
      rc = libssh2_userauth_keyboard_interactive_ex(
          session, username.c_str(), (unsigned int)username.length(),
          &answerWithCredential);
    }
    if (rc == 0 || rc == LIBSSH2_ERROR_TIMEOUT) {
      break;
    }
    VLOG(1) << method << " authentication for " << username
            << " failed: " << rc;
  }
  pendingCredential.clear();

  if (rc == 0) {
    return;
  }
  if (rc == LIBSSH2_ERROR_AUTHENTICATION_FAILED ||
      rc == LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED) {
    throw ConnectError(ConnectError::AUTH_FAILED,
                       "Authentication failed for user '" + username +
                           "' (server accepts: " + available + ")");
  }
  throw sessionError("Authentication of user '" + username + "' failed", rc);
}

void SshChannelTransport::openShell() {
  channel = libssh2_channel_open_session(session);
  if (channel == NULL) {
    throw sessionError("Cannot open a session channel",
                       libssh2_session_last_errno(session));
  }
  int rc = libssh2_channel_request_pty_ex(
      channel, options.termType.c_str(), (unsigned int)options.termType.length(),
      NULL, 0, options.initialCols, options.initialRows, 0, 0);
  if (rc != 0) {
    throw sessionError("Cannot allocate a remote terminal", rc);
  }
  rc = libssh2_channel_shell(channel);
  if (rc != 0) {
    throw sessionError("Cannot start the remote shell", rc);
  }
  libssh2_session_set_blocking(session, 0);
  FdUtils::setNonBlocking(sockFd);
  alive = true;
}

string SshChannelTransport::read() {
  if (channel == NULL || !alive || !dataReady()) {
    return string();
  }
  char b[TRANSPORT_READ_CHUNK];
  string output;
  ssize_t rc = libssh2_channel_read(channel, b, sizeof(b));
  if (rc > 0) {
    output.append(b, rc);
  } else if (rc < 0 && rc != LIBSSH2_ERROR_EAGAIN) {
    VLOG(1) << "Channel read failed: " << rc;
    alive = false;
    return output;
  }
  if (output.length() < sizeof(b)) {
    // stderr is shown in the same terminal
    rc = libssh2_channel_read_stderr(channel, b, sizeof(b) - output.length());
    if (rc > 0) {
      output.append(b, rc);
    }
  }
  return output;
}

void SshChannelTransport::write(const string &data) {
  if (channel == NULL || !alive || data.empty()) {
    return;
  }
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(options.writeTimeoutMs);
  size_t bytesWritten = 0;
  while (bytesWritten < data.length()) {
    ssize_t rc = libssh2_channel_write(channel, data.c_str() + bytesWritten,
                                       data.length() - bytesWritten);
    if (rc > 0) {
      bytesWritten += rc;
      continue;
    }
    if (rc == LIBSSH2_ERROR_EAGAIN) {
      int remaining = millisecondsUntil(deadline);
      if (remaining > 0 && waitForSession(remaining)) {
        continue;
      }
    }
    VLOG(1) << "Dropped " << (data.length() - bytesWritten)
            << " bytes of input (" << rc << ")";
    return;
  }
}

void SshChannelTransport::resize(int rows, int cols) {
  if (channel == NULL || !alive) {
    return;
  }
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(options.writeTimeoutMs);
  int rc;
  while ((rc = libssh2_channel_request_pty_size(channel, cols, rows)) ==
         LIBSSH2_ERROR_EAGAIN) {
    int remaining = millisecondsUntil(deadline);
    if (remaining <= 0 || !waitForSession(remaining)) {
      break;
    }
  }
  if (rc != 0) {
    VLOG(1) << "Remote resize to " << rows << "x" << cols << " failed: " << rc;
  }
}

void SshChannelTransport::terminate() {
  if (session == NULL && sockFd < 0) {
    return;
  }
  alive = false;
  if (channel != NULL) {
    // Blocking mode with a timeout keeps the close handshake bounded
    libssh2_session_set_blocking(session, 1);
    libssh2_session_set_timeout(session, options.terminateTimeoutMs);
    int rc = libssh2_channel_send_eof(channel);
    if (rc != 0) {
      VLOG(1) << "Cannot send EOF to the remote shell: " << rc;
    }
    rc = libssh2_channel_close(channel);
    if (rc != 0) {
      VLOG(1) << "Cannot close the remote channel: " << rc;
    }
  }
  releaseResources();
  VLOG(1) << "Remote shell closed";
}

bool SshChannelTransport::isAlive() {
  return channel != NULL && alive && !libssh2_channel_eof(channel);
}

bool SshChannelTransport::dataReady() {
  return libssh2_poll_channel_read(channel, 0) ||
         libssh2_poll_channel_read(channel, 1) ||
         FdUtils::waitForRead(sockFd, 0);
}

bool SshChannelTransport::waitForSession(int timeoutMs) {
  int directions = libssh2_session_block_directions(session);
  pollfd pfd;
  pfd.fd = sockFd;
  pfd.events = 0;
  pfd.revents = 0;
  if ((directions & LIBSSH2_SESSION_BLOCK_OUTBOUND) != 0) {
    pfd.events |= POLLOUT;
  }
  if ((directions & LIBSSH2_SESSION_BLOCK_INBOUND) != 0 ||
      (directions & LIBSSH2_SESSION_BLOCK_OUTBOUND) == 0) {
    pfd.events |= POLLIN;
  }
  return ::poll(&pfd, 1, timeoutMs) > 0;
}

ConnectError SshChannelTransport::sessionError(const string &context, int rc) {
  char *message = NULL;
  int messageLength = 0;
  if (session != NULL) {
    libssh2_session_last_error(session, &message, &messageLength, 0);
  }
  string detail = (message != NULL && messageLength > 0)
                      ? string(message, messageLength)
                      : "error " + to_string(rc);

  ConnectError::Kind kind = ConnectError::OTHER;
  switch (rc) {
    case LIBSSH2_ERROR_TIMEOUT:
    case LIBSSH2_ERROR_SOCKET_TIMEOUT:
      kind = ConnectError::TIMEOUT;
      break;
    case LIBSSH2_ERROR_AUTHENTICATION_FAILED:
    case LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED:
      kind = ConnectError::AUTH_FAILED;
      break;
    case LIBSSH2_ERROR_BANNER_RECV:
    case LIBSSH2_ERROR_BANNER_SEND:
    case LIBSSH2_ERROR_INVALID_MAC:
    case LIBSSH2_ERROR_KEX_FAILURE:
    case LIBSSH2_ERROR_KEY_EXCHANGE_FAILURE:
    case LIBSSH2_ERROR_HOSTKEY_INIT:
    case LIBSSH2_ERROR_HOSTKEY_SIGN:
    case LIBSSH2_ERROR_DECRYPT:
    case LIBSSH2_ERROR_PROTO:
      kind = ConnectError::PROTOCOL_ERROR;
      break;
    default:
      break;
  }
  return ConnectError(kind, context + ": " + detail);
}

void SshChannelTransport::releaseResources() {
  pendingCredential.clear();
  alive = false;
  if (channel != NULL) {
    libssh2_channel_free(channel);
    channel = NULL;
  }
  if (session != NULL) {
    libssh2_session_disconnect(session, "Session closed");
    libssh2_session_free(session);
    session = NULL;
  }
  if (sockFd >= 0) {
    ::close(sockFd);
    sockFd = -1;
  }
}
}  // namespace tb
