#include "FakeSubprocessUtils.hpp"
#include "SandboxLauncher.hpp"
#include "TestHeaders.hpp"

using namespace ft;

namespace {
string joinArgs(const LaunchSpec& spec) {
  string joined;
  for (const auto& arg : spec.args()) {
    joined += arg + " ";
  }
  return joined;
}
}  // namespace

TEST_CASE("Sandbox mode resolution", "[SandboxLauncher]") {
  SandboxLauncher launcher(make_shared<FakeSubprocessUtils>());
  REQUIRE(launcher.resolveMode({}) == "off");
  REQUIRE(launcher.resolveMode({{"FLEETTERM_SANDBOX_MODE", "0"}}) == "off");
  REQUIRE(launcher.resolveMode({{"FLEETTERM_SANDBOX_MODE", "False"}}) ==
          "off");
  REQUIRE(launcher.resolveMode({{"FLEETTERM_SANDBOX_MODE", "Firejail"}}) ==
          "firejail");
  REQUIRE(launcher.resolveMode({{"FLEETTERM_SANDBOX_MODE", "seatbelt"}}) ==
          "seatbelt");
  REQUIRE(launcher.resolveMode({{"FLEETTERM_SANDBOX_MODE", "docker"}}) ==
          "off");
#if __linux__
  REQUIRE(launcher.resolveMode({{"FLEETTERM_SANDBOX_MODE", "auto"}}) ==
          "firejail");
#endif

  SandboxLauncher defaulted(make_shared<FakeSubprocessUtils>(), "firejail");
  REQUIRE(defaulted.resolveMode({}) == "firejail");
  REQUIRE(defaulted.resolveMode({{"FLEETTERM_SANDBOX_MODE", "off"}}) == "off");
}

TEST_CASE("Network guard values", "[SandboxLauncher]") {
  SandboxLauncher launcher(make_shared<FakeSubprocessUtils>());
  REQUIRE_FALSE(launcher.shouldDenyNetwork({}));
  REQUIRE(launcher.shouldDenyNetwork({{"FLEETTERM_NETWORK_GUARD", "none"}}));
  REQUIRE(
      launcher.shouldDenyNetwork({{"FLEETTERM_NETWORK_GUARD", "Disabled"}}));
  REQUIRE(launcher.shouldDenyNetwork({{"FLEETTERM_NETWORK_GUARD", "block"}}));
  REQUIRE_FALSE(
      launcher.shouldDenyNetwork({{"FLEETTERM_NETWORK_GUARD", "allow"}}));

  SandboxLauncher guarded(make_shared<FakeSubprocessUtils>(), "off", "block");
  REQUIRE(guarded.shouldDenyNetwork({}));
}

TEST_CASE("Unsandboxed launch runs the shell directly", "[SandboxLauncher]") {
  auto subprocess = make_shared<FakeSubprocessUtils>();
  SandboxLauncher launcher(subprocess);
  LaunchSpec spec =
      launcher.resolveLaunch("/bin/bash", "/tmp", {{"FOO", "bar"}});
  REQUIRE(spec.command() == "/bin/bash");
  REQUIRE(spec.args_size() == 0);
  REQUIRE(spec.env().at("FOO") == "bar");
  REQUIRE(spec.sandbox().mode() == "off");
  REQUIRE_FALSE(spec.sandbox().active());
  REQUIRE_FALSE(spec.sandbox().has_warning());
  REQUIRE(subprocess->calls.empty());
}

TEST_CASE("Firejail wraps the shell", "[SandboxLauncher]") {
  auto subprocess =
      make_shared<FakeSubprocessUtils>(set<string>({"firejail"}));
  SandboxLauncher launcher(subprocess);
  LaunchSpec spec = launcher.resolveLaunch(
      "/bin/zsh", "/tmp/project/../work",
      {{"FLEETTERM_SANDBOX_MODE", "firejail"},
       {"FLEETTERM_NETWORK_GUARD", "none"}});
  REQUIRE(spec.command() == "firejail");
  REQUIRE(joinArgs(spec) ==
          "--quiet --private=/tmp/work --whitelist=/tmp/work --net=none -- "
          "/bin/zsh ");
  REQUIRE(spec.env().at("ZDOTDIR") == "/tmp");
  REQUIRE(spec.env().at("HISTFILE") == "/tmp/.zsh_history");
  REQUIRE(spec.sandbox().mode() == "firejail");
  REQUIRE(spec.sandbox().active());
  REQUIRE(spec.sandbox().deny_network());

  spec = launcher.resolveLaunch("/bin/zsh", "/tmp/work",
                                {{"FLEETTERM_SANDBOX_MODE", "firejail"}});
  REQUIRE(joinArgs(spec) ==
          "--quiet --private=/tmp/work --whitelist=/tmp/work -- /bin/zsh ");
  REQUIRE_FALSE(spec.sandbox().deny_network());
}

TEST_CASE("Missing sandbox binary falls back with a warning",
          "[SandboxLauncher]") {
  auto subprocess = make_shared<FakeSubprocessUtils>();
  SandboxLauncher launcher(subprocess, "seatbelt");
  LaunchSpec spec = launcher.resolveLaunch("/bin/zsh", "/tmp", {});
  REQUIRE(spec.command() == "/bin/zsh");
  REQUIRE(spec.args_size() == 0);
  REQUIRE(spec.sandbox().mode() == "seatbelt");
  REQUIRE_FALSE(spec.sandbox().active());
  REQUIRE(spec.sandbox().warning() == "sandbox-exec unavailable");
  REQUIRE(subprocess->calls == vector<string>({"sandbox-exec"}));
  REQUIRE(spec.env().count("ZDOTDIR") == 0);
}

TEST_CASE("Seatbelt wraps the shell with a profile", "[SandboxLauncher]") {
  auto subprocess =
      make_shared<FakeSubprocessUtils>(set<string>({"sandbox-exec"}));
  SandboxLauncher launcher(subprocess, "seatbelt", "block");
  LaunchSpec spec = launcher.resolveLaunch("/bin/zsh", "/tmp/work", {});
  REQUIRE(spec.command() == "sandbox-exec");
  REQUIRE(spec.args_size() == 3);
  REQUIRE(spec.args(0) == "-p");
  REQUIRE(spec.args(2) == "/bin/zsh");
  REQUIRE_THAT(spec.args(1), Catch::Matchers::EndsWith("(deny network*)"));
  REQUIRE(spec.sandbox().active());
  REQUIRE(spec.sandbox().deny_network());
}

TEST_CASE("Seatbelt profile contents", "[SandboxLauncher]") {
  string profile =
      SandboxLauncher::buildSeatbeltProfile("/tmp/a\"b", "/Users/me", false);
  string writable =
      "(allow file-write* (subpath \"/tmp/a\\\"b\") (subpath \"/tmp\") "
      "(subpath \"/private/tmp\"))";
  REQUIRE(profile == "(version 1)\n"
                     "(allow default)\n" +
                         writable +
                         "\n"
                         "(deny file-read* (subpath \"/Users/me/.ssh\"))\n"
                         "(deny file-read* (subpath \"/Users/me/.zshrc\"))\n"
                         "(deny file-write* (subpath \"/Users/me\"))\n" +
                         writable);
  REQUIRE_THAT(SandboxLauncher::buildSeatbeltProfile("/tmp", "/home/me", true),
               Catch::Matchers::EndsWith("\n(deny network*)"));
}
