#include "SessionRegistry.hpp"

#include "SessionBridge.hpp"

namespace tb {
bool SessionRegistry::registerSession(const string &id,
                                      shared_ptr<SessionBridge> bridge) {
  lock_guard<std::mutex> guard(registryMutex);
  auto it = sessions.find(id);
  if (it != sessions.end() && !it->second.expired()) {
    return false;
  }
  sessions[id] = bridge;
  VLOG(1) << "Registered session " << id << " (" << sessions.size()
          << " active)";
  return true;
}

void SessionRegistry::deregisterSession(const string &id) {
  lock_guard<std::mutex> guard(registryMutex);
  if (sessions.erase(id)) {
    VLOG(1) << "Deregistered session " << id << " (" << sessions.size()
            << " active)";
  }
}

shared_ptr<SessionBridge> SessionRegistry::lookup(const string &id) {
  lock_guard<std::mutex> guard(registryMutex);
  auto it = sessions.find(id);
  if (it == sessions.end()) {
    return shared_ptr<SessionBridge>();
  }
  return it->second.lock();
}

size_t SessionRegistry::size() {
  lock_guard<std::mutex> guard(registryMutex);
  return sessions.size();
}

vector<string> SessionRegistry::ids() {
  lock_guard<std::mutex> guard(registryMutex);
  vector<string> retval;
  for (const auto &it : sessions) {
    retval.push_back(it.first);
  }
  return retval;
}

bool SessionRegistry::stopSession(const string &id) {
  shared_ptr<SessionBridge> bridge = lookup(id);
  if (!bridge) {
    return false;
  }
  bridge->requestStop();
  return true;
}

void SessionRegistry::stopAll() {
  vector<shared_ptr<SessionBridge>> bridges;
  {
    lock_guard<std::mutex> guard(registryMutex);
    for (const auto &it : sessions) {
      shared_ptr<SessionBridge> bridge = it.second.lock();
      if (bridge) {
        bridges.push_back(bridge);
      }
    }
  }
  if (!bridges.empty()) {
    VLOG(1) << "Stopping " << bridges.size() << " sessions";
  }
  for (auto &bridge : bridges) {
    bridge->requestStop();
  }
}
}  // namespace tb
