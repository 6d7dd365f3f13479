#include "SubprocessUtils.hpp"

namespace ft {
string SubprocessUtils::SubprocessToString(const string& command,
                                           const vector<string>& args) {
  int link_client[2];
  char buf_client[4096];
  if (pipe(link_client) == -1) {
    STERROR << "pipe: " << strerror(GetErrno());
    return string();
  }
  // dup2 onto stdout clears the flag for the child's own copy.
  FATAL_FAIL(fcntl(link_client[0], F_SETFD, FD_CLOEXEC));
  FATAL_FAIL(fcntl(link_client[1], F_SETFD, FD_CLOEXEC));

  pid_t pid = fork();
  if (pid == 0) {
    // child process
    dup2(link_client[1], STDOUT_FILENO);
    int devNull = ::open("/dev/null", O_WRONLY);
    if (devNull >= 0) {
      dup2(devNull, STDERR_FILENO);
      close(devNull);
    }
    close(link_client[0]);
    close(link_client[1]);

    vector<char*> argsArray;
    argsArray.push_back(strdup(command.c_str()));
    for (const auto& arg : args) {
      argsArray.push_back(strdup(arg.c_str()));
    }
    argsArray.push_back(NULL);
    execvp(command.c_str(), argsArray.data());
    _exit(127);
  } else if (pid > 0) {
    // parent process
    close(link_client[1]);
    string output;
    while (true) {
      int nbytes = read(link_client[0], buf_client, sizeof(buf_client));
      if (nbytes < 0 && GetErrno() == EINTR) {
        continue;
      }
      if (nbytes <= 0) {
        break;
      }
      output += string(buf_client, nbytes);
    }
    close(link_client[0]);
    int status;
    while (waitpid(pid, &status, 0) == -1 && GetErrno() == EINTR) {
    }
    return output;
  }

  STERROR << "Failed to fork for " << command << ": " << strerror(GetErrno());
  close(link_client[0]);
  close(link_client[1]);
  return string();
}

bool SubprocessUtils::commandExists(const string& command) {
  if (command.empty()) {
    return false;
  }
  string resolved = trim(SubprocessToString("which", {command}));
  VLOG(1) << "which " << command << " -> '" << resolved << "'";
  return !resolved.empty();
}
}  // namespace ft
