#include "FakeSubprocessUtils.hpp"
#include "PseudoTerminalProcess.hpp"
#include "SessionEngine.hpp"
#include "TestHeaders.hpp"

using namespace ft;
using Catch::Matchers::ContainsSubstring;

namespace {
LaunchSpec shellSpec(const string& script) {
  LaunchSpec spec;
  spec.set_command("/bin/sh");
  spec.add_args("-c");
  spec.add_args(script);
  const char* path = ::getenv("PATH");
  (*spec.mutable_env())["PATH"] = path ? path : "/usr/bin:/bin";
  return spec;
}

// Reads until the child exits or `timeoutMs` passes.
string readUntilExit(PseudoTerminalProcess* process, ProcessExit* exit,
                     int timeoutMs = 5000) {
  string output;
  int64_t deadline = nowMillis() + timeoutMs;
  while (nowMillis() < deadline) {
    process->read(&output);
    if (process->pollExit(exit)) {
      process->read(&output);
      return output;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  FAIL("child did not exit in time, output so far: " << output);
  return output;
}

bool waitFor(const std::function<bool()>& condition, int timeoutMs = 5000) {
  int64_t deadline = nowMillis() + timeoutMs;
  while (nowMillis() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return condition();
}
}  // namespace

TEST_CASE("A session does not inherit another session's terminal",
          "[PseudoTerminalProcess]") {
  if (!fs::exists("/proc/self/fd")) {
    SKIP("no /proc fd listing on this platform");
  }
  PseudoTerminalProcess first;
  string error;
  REQUIRE(first.start(shellSpec("sleep 30"), "/tmp", 80, 24, &error));

  char target[256];
  string ownLink = "/proc/self/fd/" + to_string(first.getFd());
  ssize_t len = ::readlink(ownLink.c_str(), target, sizeof(target) - 1);
  REQUIRE(len > 0);
  REQUIRE_THAT(string(target, len), ContainsSubstring("ptmx"));

  PseudoTerminalProcess second;
  REQUIRE(second.start(shellSpec("ls -l /proc/$$/fd; exit 0"), "/tmp", 80, 24,
                       &error));
  ProcessExit exit;
  string listing = readUntilExit(&second, &exit);
  REQUIRE(exit.exitCode == optional<int>(0));
  REQUIRE_THAT(listing, ContainsSubstring("/dev/pts/"));
  REQUIRE_THAT(listing, !ContainsSubstring("ptmx"));

  // Helper processes (sandbox lookups) do not see it either.
  SubprocessUtils subprocessUtils;
  string helperListing =
      subprocessUtils.SubprocessToString("sh", {"-c", "ls -l /proc/$$/fd"});
  REQUIRE_FALSE(helperListing.empty());
  REQUIRE_THAT(helperListing, !ContainsSubstring("ptmx"));

  first.terminate(SIGKILL);
  readUntilExit(&first, &exit);
}

TEST_CASE("A child runs on a pty and reports its exit code",
          "[PseudoTerminalProcess]") {
  PseudoTerminalProcess process;
  string error;
  REQUIRE(process.start(shellSpec("echo hello-pty; exit 3"), "/tmp", 80, 24,
                        &error));
  REQUIRE(process.getPid() > 0);
  REQUIRE(process.getFd() >= 0);

  ProcessExit exit;
  string output = readUntilExit(&process, &exit);
  REQUIRE_THAT(output, ContainsSubstring("hello-pty\r\n"));
  REQUIRE(exit.exitCode);
  REQUIRE(*exit.exitCode == 3);
  REQUIRE_FALSE(exit.exitSignal);
  REQUIRE_FALSE(process.pollExit(&exit));
}

TEST_CASE("The child sees exactly the given environment and cwd",
          "[PseudoTerminalProcess]") {
  setenv("FLEETTERM_LEAK_CHECK", "leaked", 1);
  LaunchSpec spec = shellSpec(
      "printf '[%s|%s|%s]' \"$FT_VAR\" \"$FLEETTERM_LEAK_CHECK\" \"$(pwd)\"");
  (*spec.mutable_env())["FT_VAR"] = "value with spaces";

  PseudoTerminalProcess process;
  string error;
  REQUIRE(process.start(spec, "/", 80, 24, &error));
  unsetenv("FLEETTERM_LEAK_CHECK");

  ProcessExit exit;
  string output = readUntilExit(&process, &exit);
  REQUIRE_THAT(output, ContainsSubstring("[value with spaces||/]"));
}

TEST_CASE("Spawn failures are reported to the caller",
          "[PseudoTerminalProcess]") {
  LaunchSpec spec;
  spec.set_command("/nonexistent/fleetterm-shell");
  PseudoTerminalProcess process;
  string error;
  REQUIRE_FALSE(process.start(spec, "/tmp", 80, 24, &error));
  REQUIRE_THAT(error, ContainsSubstring("No such file or directory"));
  REQUIRE(process.getFd() == -1);

  PseudoTerminalProcess badCwd;
  error.clear();
  REQUIRE_FALSE(
      badCwd.start(shellSpec("true"), "/nonexistent/dir", 80, 24, &error));
  REQUIRE_THAT(error, ContainsSubstring("/nonexistent/dir"));
}

TEST_CASE("Input, resize and termination", "[PseudoTerminalProcess]") {
  PseudoTerminalProcess process;
  string error;
  REQUIRE(process.start(shellSpec("read line; stty size; echo got-$line; "
                                  "exec sleep 30"),
                        "/tmp", 80, 24, &error));
  process.resize(132, 43);
  REQUIRE(process.write("ping\n") == 5);

  string output;
  REQUIRE(waitFor([&]() {
    process.read(&output);
    return output.find("got-ping") != string::npos;
  }));
  REQUIRE_THAT(output, ContainsSubstring("43 132"));

  process.terminate(SIGTERM);
  ProcessExit exit;
  readUntilExit(&process, &exit);
  REQUIRE(exit.exitSignal);
  REQUIRE(*exit.exitSignal == SIGTERM);
}

TEST_CASE("Writes stop when the child is not reading",
          "[PseudoTerminalProcess]") {
  PseudoTerminalProcess process;
  string error;
  REQUIRE(process.start(shellSpec("exec sleep 30"), "/tmp", 80, 24, &error));

  const string flood(4 * 1024 * 1024, 'z');
  size_t taken = process.write(flood);
  REQUIRE(taken > 0);
  REQUIRE(taken < flood.size());

  process.terminate(SIGKILL);
  ProcessExit exit;
  readUntilExit(&process, &exit);
  REQUIRE(*exit.exitSignal == SIGKILL);
}

TEST_CASE("The engine drives a real shell", "[SessionEngine][pty]") {
  EngineConfig config;
  config.shell = "/bin/sh";
  config.killGraceMs = 500;
  SessionEngine engine(
      config, make_shared<PseudoTerminalProcessFactory>(),
      make_shared<SandboxLauncher>(make_shared<FakeSubprocessUtils>()));

  CreateResult created = engine.createSession("pty-task", "/tmp", {});
  REQUIRE(created.success);
  REQUIRE(created.running);

  REQUIRE(engine.write("pty-task", "echo fleet$((40+2)) $FLEETTERM_TASK_ID\r")
              .success);
  REQUIRE(waitFor([&]() {
    engine.update(10);
    return engine.attach("pty-task", "default").buffer.find(
               "fleet42 pty-task") != string::npos;
  }));

  REQUIRE(engine.write("pty-task", "exit 7\r").success);
  REQUIRE(waitFor([&]() {
    engine.update(10);
    return !engine.attach("pty-task", "default").running;
  }));
  AttachResult attached = engine.attach("pty-task", "default");
  REQUIRE(*attached.exitCode == 7);
  REQUIRE(attached.state.mode() == MODE_EXITED);

  REQUIRE(engine.destroy("pty-task").success);
}
