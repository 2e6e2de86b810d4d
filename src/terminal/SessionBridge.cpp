#include "SessionBridge.hpp"

#include "FdUtils.hpp"

namespace tb {
namespace {
// Bounds on the work done per tick so neither direction starves the other
const int MAX_READS_PER_TICK = 16;
const int MAX_MESSAGES_PER_TICK = 64;
// Descendants of an exited shell may keep the pty open and keep writing
const int MAX_DRAIN_READS = 4 * MAX_READS_PER_TICK;
}  // namespace

SessionBridge::SessionBridge(const string &_id,
                             shared_ptr<MessageChannel> _channel,
                             shared_ptr<SessionRegistry> _registry,
                             shared_ptr<TransportFactory> _factory,
                             int _pollIntervalMs)
    : id(_id),
      channel(_channel),
      registry(_registry),
      factory(_factory),
      pollIntervalMs(_pollIntervalMs),
      framing(_factory->outputFraming()),
      state(IDLE),
      stopped(false),
      registered(false),
      stopRequested(false) {}

SessionBridge::~SessionBridge() { stop(); }

void SessionBridge::start() {
  if (getState() != IDLE) {
    return;
  }
  if (!registry->registerSession(id, shared_from_this())) {
    LOG(ERROR) << "Session id " << id << " is already in use";
    failSession("Internal error: duplicate session id");
    return;
  }
  registered = true;
  LOG(INFO) << "Session " << id << " started";

  if (factory->requiresConnectMessage()) {
    VLOG(1) << "Session " << id << " waiting for connect";
    return;
  }
  openTransport(ConnectRequest());
}

void SessionBridge::handleInboundMessage(const string &message) {
  InboundMessage inbound = BridgeProtocol::parseInboundMessage(message);
  State current = getState();
  switch (inbound.kind) {
    case InboundMessage::MALFORMED:
      LOG(WARNING) << "Ignoring malformed message on session " << id << ": "
                   << inbound.error;
      return;
    case InboundMessage::UNKNOWN:
      LOG(WARNING) << "Ignoring message of unknown type '" << inbound.type
                   << "' on session " << id;
      return;
    case InboundMessage::INPUT:
      if (current != ACTIVE) {
        VLOG(1) << "Ignoring input in state " << stateName(current);
        return;
      }
      VLOG(2) << "Input of " << inbound.data.length() << " bytes";
      transport->write(inbound.data);
      return;
    case InboundMessage::RESIZE:
      if (current != ACTIVE) {
        VLOG(1) << "Ignoring resize in state " << stateName(current);
        return;
      }
      VLOG(1) << "Resizing session " << id << " to " << inbound.rows << "x"
              << inbound.cols;
      transport->resize(inbound.rows, inbound.cols);
      return;
    case InboundMessage::CONNECT:
      if (current != IDLE || !factory->requiresConnectMessage()) {
        VLOG(1) << "Ignoring connect in state " << stateName(current);
        return;
      }
      openTransport(inbound.connect);
      return;
  }
}

bool SessionBridge::relayOnce() {
  if (getState() != ACTIVE || !transport) {
    return false;
  }
  bool relayed = false;
  for (int a = 0; a < MAX_READS_PER_TICK; a++) {
    string chunk = transport->read();
    if (chunk.empty()) {
      break;
    }
    if (!forwardOutput(chunk)) {
      return relayed;
    }
    relayed = true;
  }
  if (!transport->isAlive()) {
    drainAndStop();
  }
  return relayed;
}

void SessionBridge::dispatchPending() {
  try {
    string message;
    for (int a = 0; a < MAX_MESSAGES_PER_TICK && getState() != CLOSED; a++) {
      if (!channel->receive(&message)) {
        break;
      }
      handleInboundMessage(message);
    }
  } catch (const ChannelClosedError &cce) {
    LOG(INFO) << "Client of session " << id << " disconnected: " << cce.what();
    stop();
  }
}

void SessionBridge::run() {
  try {
    start();
    while (getState() != CLOSED) {
      if (stopRequested) {
        LOG(INFO) << "Stopping session " << id << " on request";
        break;
      }
      waitForActivity();
      relayOnce();
      if (getState() == CLOSED) {
        break;
      }
      dispatchPending();
    }
  } catch (const std::exception &e) {
    STERROR << "Session " << id << " failed: " << e.what();
  }
  stop();
}

void SessionBridge::stop() {
  {
    lock_guard<std::mutex> guard(stateMutex);
    if (stopped) {
      return;
    }
    stopped = true;
    // Leave ACTIVE before anything is torn down so nothing reads any more
    state = CLOSED;
  }
  if (transport) {
    transport->terminate();
    transport.reset();
  }
  if (registered) {
    registry->deregisterSession(id);
    registered = false;
  }
  if (channel->isOpen()) {
    channel->close();
  }
  LOG(INFO) << "Session " << id << " closed";
}

void SessionBridge::requestStop() { stopRequested = true; }

SessionBridge::State SessionBridge::getState() {
  lock_guard<std::mutex> guard(stateMutex);
  return state;
}

const char *SessionBridge::stateName(State state) {
  switch (state) {
    case IDLE:
      return "idle";
    case CONNECTING:
      return "connecting";
    case ACTIVE:
      return "active";
    case CLOSED:
      break;
  }
  return "closed";
}

void SessionBridge::setState(State newState) {
  lock_guard<std::mutex> guard(stateMutex);
  if (state != CLOSED) {
    state = newState;
  }
}

void SessionBridge::openTransport(const ConnectRequest &request) {
  setState(CONNECTING);
  try {
    transport = factory->open(request);
  } catch (const SpawnError &se) {
    LOG(WARNING) << "Session " << id << " cannot start its shell: "
                 << se.what();
    failSession(se.what());
    return;
  } catch (const ConnectError &ce) {
    LOG(WARNING) << "Session " << id << " cannot connect ("
                 << ConnectError::kindName(ce.getKind()) << "): " << ce.what();
    failSession(ce.what());
    return;
  }
  setState(ACTIVE);
  LOG(INFO) << "Session " << id << " shell is ready";

  if (factory->requiresConnectMessage()) {
    try {
      channel->send(BridgeProtocol::makeConnectedMessage(), false);
    } catch (const ChannelClosedError &cce) {
      LOG(INFO) << "Client of session " << id
                << " left while connecting: " << cce.what();
      stop();
    }
  }
}

void SessionBridge::failSession(const string &message) {
  try {
    channel->send(BridgeProtocol::makeErrorMessage(message), false);
  } catch (const ChannelClosedError &cce) {
    VLOG(1) << "Cannot report error to the client: " << cce.what();
  }
  stop();
}

bool SessionBridge::forwardOutput(const string &chunk) {
  try {
    if (framing == OutputFraming::RAW_BINARY) {
      channel->send(chunk, true);
    } else {
      channel->send(BridgeProtocol::makeOutputMessage(chunk), false);
    }
  } catch (const ChannelClosedError &cce) {
    LOG(INFO) << "Client of session " << id << " is gone: " << cce.what();
    stop();
    return false;
  }
  VLOG(3) << "Relayed " << chunk.length() << " bytes";
  return true;
}

void SessionBridge::drainAndStop() {
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(pollIntervalMs);
  bool waited = false;
  for (int a = 0; a < MAX_DRAIN_READS && !stopRequested; a++) {
    string chunk = transport->read();
    if (!chunk.empty()) {
      if (!forwardOutput(chunk)) {
        return;
      }
      waited = false;
    } else {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                           deadline - std::chrono::steady_clock::now())
                           .count();
      if (waited || remaining <= 0 ||
          !FdUtils::waitForRead(transport->getFd(), int(remaining))) {
        break;
      }
      waited = true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      VLOG(1) << "Session " << id << " stops draining with output left";
      break;
    }
  }
  LOG(INFO) << "Shell of session " << id << " exited";
  stop();
}

void SessionBridge::waitForActivity() {
  if (channel->hasData()) {
    return;
  }
  vector<int> fds;
  if (getState() == ACTIVE && transport) {
    fds.push_back(transport->getFd());
  }
  fds.push_back(channel->getFd());
  FdUtils::waitForAnyRead(fds, pollIntervalMs);
}
}  // namespace tb
