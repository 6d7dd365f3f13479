#ifndef __FT_SESSION_STATE_MACHINE_HPP__
#define __FT_SESSION_STATE_MACHINE_HPP__

#include "Headers.hpp"
#include "MarkerProtocol.hpp"

namespace ft {
/** @brief Result of feeding an input to the state machine. */
struct StateChange {
  bool changed;
  StateSnapshot snapshot;
};

/**
 * @brief Classifies a PTY byte stream into a coarse mode (booting, shell,
 * agent, tui, blocked, exited).
 *
 * Explicit lifecycle markers win over everything else. Without markers the
 * rolling tail of output is run through an ordered table of heuristics. The
 * snapshot's `seq` only moves when some other field actually changed.
 *
 * Not thread safe; the engine serializes access.
 */
class SessionStateMachine {
 public:
  /** @brief Size of the rolling tail, in bytes. */
  static const size_t MAX_TAIL = 6000;

  /**
   * @param providerHint Provider assumed until a marker says otherwise.
   * @param agentCommand Used to detect a provider when `providerHint` is
   * empty.
   */
  explicit SessionStateMachine(const string& providerHint = "",
                               const string& agentCommand = "");

  // The classifier table captures `this`.
  SessionStateMachine(const SessionStateMachine&) = delete;
  SessionStateMachine& operator=(const SessionStateMachine&) = delete;

  const StateSnapshot& snapshot() const { return state; }

  /** @brief A fresh process is running: BOOTING, exit info cleared. */
  StateChange start();

  /**
   * @brief Feeds one chunk of raw output.
   * @param altScreen Explicit alternate-screen state; when absent it is
   * tracked from the mode toggles in the stream.
   */
  StateChange consumeOutput(const string& data,
                            optional<bool> altScreen = nullopt);

  /** @brief Feeds bytes the user typed. */
  StateChange consumeInput(const string& data);

  /**
   * @brief Puts back an earlier snapshot and tail, e.g. when input that
   * unblocked the session never reached the terminal. Counts as a new
   * transition.
   */
  StateChange restore(const StateSnapshot& previous,
                      const string& previousTail);

  StateChange consumeExit(optional<int> exitCode, optional<int> exitSignal);

  StateChange updateAltScreen(bool altScreen);

  /** @brief Re-runs the heuristic classifiers over the current tail. */
  StateChange reconcile();

  /** @brief Records a provider (e.g. from a launched command). */
  StateChange setProviderHint(const string& provider);

  bool isAltScreen() const { return altScreen; }

  const string& getTail() const { return tail; }

 protected:
  typedef std::function<void(StateSnapshot*)> SnapshotPatch;

  struct ClassifierRule {
    string name;
    // Returns true and fills `next` when the rule matches.
    std::function<bool(const string& latest, StateSnapshot* next)> apply;
  };

  StateChange transition(const SnapshotPatch& patch);
  StateChange classify(const string& latest);
  StateChange applyMarker(const Marker& marker);
  void appendToTail(const string& cleaned);

  StateSnapshot state;
  string tail;
  bool altScreen;
  string pendingMarker;
  vector<ClassifierRule> classifiers;
};
}  // namespace ft

#endif  // __FT_SESSION_STATE_MACHINE_HPP__
