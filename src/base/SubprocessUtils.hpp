#ifndef __FT_SUBPROCESS_UTILS__
#define __FT_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace ft {
/**
 * @brief Runs short-lived helper commands and looks up executables.
 *
 * Virtual so tests can substitute canned answers for the host's tooling.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs a command with arguments (no shell) and returns its stdout.
   * stderr is discarded.
   */
  virtual string SubprocessToString(const string& command,
                                    const vector<string>& args);

  /** @brief True when `which` can resolve `command` on the current PATH. */
  virtual bool commandExists(const string& command);
};
}  // namespace ft

#endif  // __FT_SUBPROCESS_UTILS__
