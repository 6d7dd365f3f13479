#ifndef __FT_REPLAY_HARNESS_HPP__
#define __FT_REPLAY_HARNESS_HPP__

#include "SessionJson.hpp"
#include "SessionStateMachine.hpp"

namespace ft {
struct ReplayResult {
  string name;
  bool passed = false;
  vector<string> failures;
};

/**
 * @brief Replays recorded terminal sessions through a SessionStateMachine.
 *
 * A fixture is a JSON object:
 *
 *     {
 *       "providerHint": "claude",        // optional
 *       "agentCommand": "claude --resume", // optional
 *       "events": [
 *         {"type": "start"},
 *         {"type": "output", "data": "$ ", "altScreen": false,
 *          "expect": {"mode": "shell"}},
 *         {"type": "input", "data": "y"},
 *         {"type": "exit", "exitCode": 0, "signal": 15},
 *         {"type": "altscreen", "value": true},
 *         {"type": "reconcile"}
 *       ],
 *       "expectFinal": {"mode": "exited", "isBlocked": false}
 *     }
 *
 * `expect` keys are the snapshot's JSON keys (mode, confidence, source, seq,
 * isBlocked, blockedReason, running, provider, exitCode, signal).
 */
class ReplayHarness {
 public:
  static ReplayResult runFixture(const string& name, const json& fixture);

  /** @brief Parses and runs a fixture file. */
  static ReplayResult runFile(const string& path);

  /** @brief Fixture files (`*.json`) in a directory, sorted by name. */
  static vector<string> listFixtures(const string& directory);

 protected:
  static void checkExpectations(const StateSnapshot& snapshot,
                                const json& expected, const string& context,
                                vector<string>* failures);
};
}  // namespace ft

#endif  // __FT_REPLAY_HARNESS_HPP__
