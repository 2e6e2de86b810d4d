#ifndef __TB_FAKE_TRANSPORT__
#define __TB_FAKE_TRANSPORT__

#include "TransportFactory.hpp"
#include "TransportHandle.hpp"

namespace tb {
/**
 * @brief Scripted shell. Output queued with simulateOutput() is handed out
 * one chunk per read(); writes and resizes are recorded.
 */
class FakeTransport : public TransportHandle {
 public:
  FakeTransport() : alive(true), terminateCount(0) {}

  virtual string read() {
    lock_guard<std::mutex> guard(fakeMutex);
    if (terminateCount > 0) {
      return string();
    }
    if (pendingOutput.empty()) {
      return endlessOutput;
    }
    string chunk = pendingOutput.front();
    pendingOutput.pop_front();
    return chunk;
  }

  virtual void write(const string &data) {
    lock_guard<std::mutex> guard(fakeMutex);
    if (terminateCount == 0) {
      written.push_back(data);
    }
  }

  virtual void resize(int rows, int cols) {
    lock_guard<std::mutex> guard(fakeMutex);
    if (terminateCount == 0) {
      resizes.push_back(make_pair(rows, cols));
    }
  }

  virtual void terminate() {
    lock_guard<std::mutex> guard(fakeMutex);
    alive = false;
    terminateCount++;
  }

  virtual bool isAlive() {
    lock_guard<std::mutex> guard(fakeMutex);
    return alive;
  }

  virtual int getFd() { return -1; }

  void simulateOutput(const string &chunk) {
    lock_guard<std::mutex> guard(fakeMutex);
    pendingOutput.push_back(chunk);
  }

  /**
   * @brief Once the queue is empty every read() returns `chunk`, as a pty
   * does while something keeps writing to it.
   */
  void simulateEndlessOutput(const string &chunk) {
    lock_guard<std::mutex> guard(fakeMutex);
    endlessOutput = chunk;
  }

  /** @brief The shell exits; output already queued can still be read. */
  void simulateExit() {
    lock_guard<std::mutex> guard(fakeMutex);
    alive = false;
  }

  vector<string> getWritten() {
    lock_guard<std::mutex> guard(fakeMutex);
    return written;
  }

  vector<pair<int, int>> getResizes() {
    lock_guard<std::mutex> guard(fakeMutex);
    return resizes;
  }

  int getTerminateCount() {
    lock_guard<std::mutex> guard(fakeMutex);
    return terminateCount;
  }

 protected:
  std::mutex fakeMutex;
  deque<string> pendingOutput;
  vector<string> written;
  vector<pair<int, int>> resizes;
  string endlessOutput;
  bool alive;
  int terminateCount;
};

/**
 * @brief Hands out a prepared FakeTransport, or fails the way a real
 * factory would.
 */
class FakeTransportFactory : public TransportFactory {
 public:
  enum Failure {
    NONE,
    SPAWN,
    CONNECT,
  };

  FakeTransportFactory(shared_ptr<FakeTransport> _transport,
                       bool _needsConnect,
                       OutputFraming _framing = OutputFraming::RAW_BINARY)
      : transport(_transport),
        needsConnect(_needsConnect),
        framing(_framing),
        failure(NONE),
        connectErrorKind(ConnectError::OTHER) {}

  virtual bool requiresConnectMessage() { return needsConnect; }

  virtual shared_ptr<TransportHandle> open(const ConnectRequest &request) {
    requests.push_back(request);
    switch (failure) {
      case SPAWN:
        throw SpawnError(failureMessage);
      case CONNECT:
        throw ConnectError(connectErrorKind, failureMessage);
      case NONE:
        break;
    }
    return transport;
  }

  virtual OutputFraming outputFraming() { return framing; }

  void failWithSpawnError(const string &message) {
    failure = SPAWN;
    failureMessage = message;
  }

  void failWithConnectError(ConnectError::Kind kind, const string &message) {
    failure = CONNECT;
    connectErrorKind = kind;
    failureMessage = message;
  }

  const vector<ConnectRequest> &getRequests() const { return requests; }

 protected:
  shared_ptr<FakeTransport> transport;
  bool needsConnect;
  OutputFraming framing;
  Failure failure;
  ConnectError::Kind connectErrorKind;
  string failureMessage;
  vector<ConnectRequest> requests;
};
}  // namespace tb

#endif  // __TB_FAKE_TRANSPORT__
