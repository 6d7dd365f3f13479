#include "PseudoTerminalProcess.hpp"

extern char** environ;

namespace ft {
namespace {
const size_t READ_CHUNK_BYTES = 64 * 1024;

vector<char*> toCStrings(vector<string>* strings) {
  vector<char*> result;
  for (auto& s : *strings) {
    result.push_back(&s[0]);
  }
  result.push_back(NULL);
  return result;
}
}  // namespace

PseudoTerminalProcess::PseudoTerminalProcess()
    : pid(-1), masterFd(-1), exited(false) {}

PseudoTerminalProcess::~PseudoTerminalProcess() {
  if (masterFd >= 0) {
    ::close(masterFd);
  }
}

bool PseudoTerminalProcess::start(const LaunchSpec& spec, const string& cwd,
                                  int cols, int rows, string* error) {
  // Everything the child needs is prepared before fork().
  vector<string> argvStrings = {spec.command()};
  for (const auto& arg : spec.args()) {
    argvStrings.push_back(arg);
  }
  vector<string> envStrings;
  for (const auto& it : spec.env()) {
    envStrings.push_back(it.first + "=" + it.second);
  }
  vector<char*> argv = toCStrings(&argvStrings);
  vector<char*> envp = toCStrings(&envStrings);

  // Reports a failed chdir/exec back to the parent; closed by a good exec.
  int errorPipe[2];
  FATAL_FAIL(::pipe(errorPipe));
  FATAL_FAIL(::fcntl(errorPipe[1], F_SETFD, FD_CLOEXEC));

  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_col = (unsigned short)cols;
  win.ws_row = (unsigned short)rows;

  pid = forkpty(&masterFd, NULL, NULL, &win);
  switch (pid) {
    case -1: {
      int forkErrno = GetErrno();
      ::close(errorPipe[0]);
      ::close(errorPipe[1]);
      masterFd = -1;
      *error = string("forkpty failed: ") + strerror(forkErrno);
      return false;
    }
    case 0: {
      ::close(errorPipe[0]);
      int childErrno = 0;
      if (!cwd.empty() && ::chdir(cwd.c_str()) == -1) {
        childErrno = GetErrno();
      } else {
        // Restore default SIGCHLD handling for the shell, as the engine's
        // own disposition is inherited otherwise.
        signal(SIGCHLD, SIG_DFL);
        signal(SIGPIPE, SIG_DFL);
        environ = envp.data();
        ::execvp(argv[0], argv.data());
        childErrno = GetErrno();
      }
      ssize_t ignored = ::write(errorPipe[1], &childErrno, sizeof(childErrno));
      (void)ignored;
      _exit(127);
    }
    default:
      break;
  }

  ::close(errorPipe[1]);
  // Sessions spawned later (sandboxed or not) must not inherit this terminal.
  FATAL_FAIL(::fcntl(masterFd, F_SETFD, FD_CLOEXEC));
  int childErrno = 0;
  ssize_t n;
  do {
    n = ::read(errorPipe[0], &childErrno, sizeof(childErrno));
  } while (n == -1 && GetErrno() == EINTR);
  ::close(errorPipe[0]);

  if (n == sizeof(childErrno)) {
    int status;
    ::waitpid(pid, &status, 0);
    ::close(masterFd);
    masterFd = -1;
    pid = -1;
    *error = "spawn " + spec.command() + " in " + cwd +
             " failed: " + strerror(childErrno);
    return false;
  }

  RawFdUtils::setNonBlocking(masterFd);
  VLOG(1) << "Started " << spec.command() << " as pid " << pid << " on fd "
          << masterFd;
  return true;
}

RawFdUtils::ReadStatus PseudoTerminalProcess::read(string* out) {
  if (masterFd < 0) {
    return RawFdUtils::READ_CLOSED;
  }
  return RawFdUtils::readAvailable(masterFd, out, READ_CHUNK_BYTES);
}

bool PseudoTerminalProcess::pollExit(ProcessExit* exit) {
  if (pid <= 0 || exited) {
    return false;
  }
  int status = 0;
  pid_t rc = ::waitpid(pid, &status, WNOHANG);
  if (rc == 0) {
    return false;
  }
  if (rc == -1) {
    if (GetErrno() == EINTR) {
      return false;
    }
    // ECHILD: someone else reaped it.
    STERROR << "waitpid(" << pid << ") failed: " << strerror(GetErrno());
    exited = true;
    return true;
  }
  exited = true;
  if (WIFEXITED(status)) {
    exit->exitCode = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit->exitSignal = WTERMSIG(status);
  }
  return true;
}

size_t PseudoTerminalProcess::write(const string& data) {
  if (masterFd < 0) {
    throw std::runtime_error("PTY is closed");
  }
  return RawFdUtils::writeAvailable(masterFd, data.c_str(), data.length());
}

void PseudoTerminalProcess::resize(int cols, int rows) {
  if (masterFd < 0) {
    return;
  }
  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_col = (unsigned short)cols;
  win.ws_row = (unsigned short)rows;
  if (::ioctl(masterFd, TIOCSWINSZ, &win) == -1) {
    LOG(WARNING) << "TIOCSWINSZ failed: " << strerror(GetErrno());
  }
}

void PseudoTerminalProcess::terminate(int signal) {
  if (pid <= 0 || exited) {
    return;
  }
  if (::kill(pid, signal) == -1 && GetErrno() != ESRCH) {
    STERROR << "kill(" << pid << ", " << signal
            << ") failed: " << strerror(GetErrno());
  }
}
}  // namespace ft
