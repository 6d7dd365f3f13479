#ifndef __FT_LOG_HANDLER__
#define __FT_LOG_HANDLER__

#include "Headers.hpp"

namespace ft {
/**
 * @brief Configures easylogging++ for the FleetTerm binaries and tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sets up file-based logging under `path`.
   *
   * The stdio bridge owns stdout for its JSON protocol, so `logToStdout` must
   * stay false there; stderr redirection keeps child noise out of the
   * operator's terminal.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            bool redirectStderrToFile = false,
                            string maxlogsize = "20971520");

  /** @brief Removes a rolled-over log file. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the `stdout` logger so it just writes messages.
   */
  static void setupStdoutLogger();

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  static string createLogFile(const string &path, const string &filename);
};
}  // namespace ft
#endif  // __FT_LOG_HANDLER__
