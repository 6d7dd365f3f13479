#ifndef __FT_PTY_PROCESS_HPP__
#define __FT_PTY_PROCESS_HPP__

#include "Headers.hpp"
#include "RawFdUtils.hpp"

namespace ft {
/** @brief How a child ended. At most one of the fields is set. */
struct ProcessExit {
  optional<int> exitCode;
  optional<int> exitSignal;
};

/**
 * @brief A child process attached to a pseudo-terminal.
 */
class PtyProcess {
 public:
  virtual ~PtyProcess() {}

  /**
   * @brief Spawns `spec.command spec.args...` with exactly `spec.env`.
   * @param error Receives a description when the spawn fails.
   * @return true if the child was exec'd.
   */
  virtual bool start(const LaunchSpec& spec, const string& cwd, int cols,
                     int rows, string* error) = 0;
  /** @brief Master side descriptor to select on, or -1 if there is none. */
  virtual int getFd() = 0;
  virtual pid_t getPid() = 0;
  /** @brief Drains pending output without blocking. */
  virtual RawFdUtils::ReadStatus read(string* out) = 0;
  /** @brief Reaps the child if it has exited. Never blocks. */
  virtual bool pollExit(ProcessExit* exit) = 0;
  /**
   * @brief Writes what the terminal accepts without blocking.
   * @return Number of leading bytes of `data` taken.
   * @throws std::runtime_error if the terminal is gone.
   */
  virtual size_t write(const string& data) = 0;
  virtual void resize(int cols, int rows) = 0;
  virtual void terminate(int signal) = 0;
};

/** @brief Creates processes for the engine; swapped out in tests. */
class PtyProcessFactory {
 public:
  virtual ~PtyProcessFactory() {}
  virtual shared_ptr<PtyProcess> create() = 0;
};
}  // namespace ft

#endif  // __FT_PTY_PROCESS_HPP__
