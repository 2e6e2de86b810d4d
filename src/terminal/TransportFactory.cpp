#include "TransportFactory.hpp"

namespace tb {
shared_ptr<TransportHandle> PtyTransportFactory::open(
    const ConnectRequest &request) {
  shared_ptr<PtyProcessTransport> transport(new PtyProcessTransport(options));
  transport->spawn(command, args);
  return transport;
}

vector<string> PtyTransportFactory::sshCommandLine(const string &host,
                                                   int port,
                                                   const string &user) {
  vector<string> commandLine = {"ssh", "-o", "StrictHostKeyChecking=no", "-p",
                                to_string(port)};
  commandLine.push_back(user.empty() ? host : user + "@" + host);
  return commandLine;
}

shared_ptr<TransportHandle> SshTransportFactory::open(
    const ConnectRequest &request) {
  ConnectRequest resolved = resolve(request);
  if (resolved.host.empty()) {
    throw ConnectError(ConnectError::OTHER, "No host to connect to");
  }
  if (resolved.username.empty()) {
    throw ConnectError(ConnectError::OTHER, "No user name given");
  }
  shared_ptr<SshChannelTransport> transport(new SshChannelTransport(options));
  transport->connect(resolved.host, resolved.port, resolved.username,
                     resolved.credential);
  return transport;
}

ConnectRequest SshTransportFactory::resolve(
    const ConnectRequest &request) const {
  ConnectRequest resolved = request;
  if (resolved.host.empty()) {
    resolved.host = defaults.host;
  }
  if (resolved.port == 0) {
    resolved.port = defaults.port == 0 ? 22 : defaults.port;
  }
  if (resolved.username.empty()) {
    resolved.username = defaults.username;
  }
  if (resolved.credential.empty()) {
    resolved.credential = defaults.credential;
  }
  return resolved;
}
}  // namespace tb
