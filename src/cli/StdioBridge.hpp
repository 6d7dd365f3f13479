#ifndef __FT_STDIO_BRIDGE_HPP__
#define __FT_STDIO_BRIDGE_HPP__

#include "SessionEngine.hpp"
#include "SessionJson.hpp"

namespace ft {
/**
 * @brief Exposes a SessionEngine over newline-delimited JSON.
 *
 * Each input line is a request such as
 * `{"id": 7, "op": "write", "taskId": "t1", "data": "ls\r"}`; the reply is
 * `{"id": 7, "op": "write", "result": {...}}`. Subscriber events are written
 * as they happen, tagged with `subscriberId`; `started` and `destroyed` come
 * from the lifecycle hook.
 */
class StdioBridge : public SubscriberChannel, public SessionLifecycleHook {
 public:
  StdioBridge(SessionEngine* _engine, std::ostream* _out);
  virtual ~StdioBridge() {}

  /** @brief Runs one request and returns the reply. */
  json handleRequest(const json& request);

  /** @brief Parses, runs and answers one line of input. */
  void processLine(const string& line);

  /** @brief Serves requests until EOF or a shutdown request. */
  void readLoop(std::istream* in);

  virtual void deliver(const string& subscriberId, const SessionEvent& event);
  virtual void onSessionEvent(const SessionEvent& event);

 protected:
  void writeLine(const json& value);

  SessionEngine* engine;
  std::ostream* out;
  std::mutex outMutex;
};
}  // namespace ft

#endif  // __FT_STDIO_BRIDGE_HPP__
