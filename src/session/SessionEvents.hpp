#ifndef __FT_SESSION_EVENTS_HPP__
#define __FT_SESSION_EVENTS_HPP__

#include "Headers.hpp"

namespace ft {
/**
 * @brief Delivers data, mode, blocked and exit events to the subscribers
 * attached to a session.
 */
class SubscriberChannel {
 public:
  virtual ~SubscriberChannel() {}
  virtual void deliver(const string& subscriberId,
                       const SessionEvent& event) = 0;
};

/**
 * @brief Observes every event of every session (persistence, metrics, ...).
 *
 * Exceptions thrown from a hook are logged and otherwise ignored.
 */
class SessionLifecycleHook {
 public:
  virtual ~SessionLifecycleHook() {}
  virtual void onSessionEvent(const SessionEvent& event) = 0;
};
}  // namespace ft

#endif  // __FT_SESSION_EVENTS_HPP__
