#ifndef __FT_PSEUDO_TERMINAL_PROCESS_HPP__
#define __FT_PSEUDO_TERMINAL_PROCESS_HPP__

#include "PtyProcess.hpp"

namespace ft {
/**
 * @brief PtyProcess backed by forkpty().
 */
class PseudoTerminalProcess : public PtyProcess {
 public:
  PseudoTerminalProcess();
  virtual ~PseudoTerminalProcess();

  virtual bool start(const LaunchSpec& spec, const string& cwd, int cols,
                     int rows, string* error);
  virtual int getFd() { return masterFd; }
  virtual pid_t getPid() { return pid; }
  virtual RawFdUtils::ReadStatus read(string* out);
  virtual bool pollExit(ProcessExit* exit);
  virtual size_t write(const string& data);
  virtual void resize(int cols, int rows);
  virtual void terminate(int signal);

 protected:
  pid_t pid;
  int masterFd;
  bool exited;
};

class PseudoTerminalProcessFactory : public PtyProcessFactory {
 public:
  virtual shared_ptr<PtyProcess> create() {
    return shared_ptr<PtyProcess>(new PseudoTerminalProcess());
  }
};
}  // namespace ft

#endif  // __FT_PSEUDO_TERMINAL_PROCESS_HPP__
