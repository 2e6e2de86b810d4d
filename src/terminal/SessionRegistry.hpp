#ifndef __TB_SESSION_REGISTRY__
#define __TB_SESSION_REGISTRY__

#include "Headers.hpp"

namespace tb {
class SessionBridge;

/**
 * @brief Live sessions by id. Holds weak references only: a bridge that is
 * gone is never returned.
 */
class SessionRegistry {
 public:
  /** @brief Returns false and changes nothing if `id` is taken. */
  bool registerSession(const string &id, shared_ptr<SessionBridge> bridge);

  void deregisterSession(const string &id);

  /** @brief The bridge for `id`, or null. */
  shared_ptr<SessionBridge> lookup(const string &id);

  size_t size();

  vector<string> ids();

  /**
   * @brief Asks a live session to stop at its next tick.
   * @return false if there is no such session.
   */
  bool stopSession(const string &id);

  /** @brief Asks every live session to stop. */
  void stopAll();

 protected:
  std::mutex registryMutex;
  unordered_map<string, weak_ptr<SessionBridge>> sessions;
};
}  // namespace tb

#endif  // __TB_SESSION_REGISTRY__
