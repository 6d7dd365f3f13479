#ifndef __FT_ENGINE_CONFIG_HPP__
#define __FT_ENGINE_CONFIG_HPP__

#include "Headers.hpp"

namespace ft {
/**
 * @brief Tunables of a SessionEngine.
 *
 * Values start at the defaults below, then an ini file (see loadIniFile) and
 * the FLEETTERM_* environment variables (see applyEnvironment) override them.
 */
class EngineConfig {
 public:
  EngineConfig();

  /** @brief Most sessions alive at once. */
  int maxSessions;
  /** @brief Per-session output buffer cap; older bytes are dropped. */
  size_t outputBufferBytes;
  /** @brief Largest single write forwarded to a PTY. */
  size_t maxWriteBytes;
  /** @brief Preferred shell. Empty means $SHELL. */
  string shell;
  int cols;
  int rows;
  /** @brief Bytes of output to scan for a hidden command's echo. */
  size_t hiddenEchoWindow;
  /** @brief Time between SIGTERM and SIGKILL when destroying a session. */
  int killGraceMs;

  int portBase;
  int portSpan;
  string portHost;

  /** @brief off, auto, seatbelt or firejail. */
  string sandboxMode;
  /** @brief none, disabled or block deny network access in a sandbox. */
  string networkGuard;

  /** @brief Opaque overlay from the dependency orchestrator. */
  map<string, string> dependencyEnv;

  int verbose;
  bool logToStdout;
  string logDir;

  /** @brief Reads settings from an ini file. Returns false if unreadable. */
  bool loadIniFile(const string& path);

  /** @brief Reads settings from ini text. Returns false if malformed. */
  bool loadIniData(const string& data);

  /** @brief Applies FLEETTERM_* overrides from `env`. */
  void applyEnvironment(const map<string, string>& env);

  /** @brief The current process environment as a map. */
  static map<string, string> processEnvironment();

 protected:
  template <typename Ini>
  void applyIni(const Ini& ini);
};
}  // namespace ft

#endif  // __FT_ENGINE_CONFIG_HPP__
