#include "SandboxLauncher.hpp"

namespace ft {
namespace {
string lookup(const map<string, string>& env, const string& key,
              const string& fallback) {
  auto it = env.find(key);
  if (it == env.end() || it->second.empty()) {
    return fallback;
  }
  return it->second;
}

string escapeForSeatbelt(const string& value) {
  string escaped = value;
  replaceAll(escaped, "\\", "\\\\");
  replaceAll(escaped, "\"", "\\\"");
  return escaped;
}

string resolvePath(const string& path) {
  return fs::absolute(path).lexically_normal().string();
}

LaunchSpec unwrapped(const string& shell, const map<string, string>& env,
                     const string& mode) {
  LaunchSpec spec;
  spec.set_command(shell);
  spec.mutable_env()->insert(env.begin(), env.end());
  spec.mutable_sandbox()->set_mode(mode);
  spec.mutable_sandbox()->set_active(false);
  return spec;
}

void applySandboxShellEnv(LaunchSpec* spec) {
  (*spec->mutable_env())["ZDOTDIR"] = "/tmp";
  (*spec->mutable_env())["HISTFILE"] = "/tmp/.zsh_history";
}
}  // namespace

SandboxLauncher::SandboxLauncher(shared_ptr<SubprocessUtils> _subprocessUtils,
                                 const string& _defaultMode,
                                 const string& _defaultNetworkGuard)
    : subprocessUtils(_subprocessUtils),
      defaultMode(_defaultMode),
      defaultNetworkGuard(_defaultNetworkGuard) {}

string SandboxLauncher::resolveMode(const map<string, string>& env) const {
  string rawMode = toLower(
      lookup(env, "FLEETTERM_SANDBOX_MODE",
             defaultMode.empty() ? string("off") : defaultMode));
  if (rawMode == "off" || rawMode == "0" || rawMode == "false") {
    return "off";
  }
  if (rawMode == "auto") {
#if __APPLE__
    return "seatbelt";
#elif __linux__
    return "firejail";
#else
    return "off";
#endif
  }
  if (rawMode == "seatbelt" || rawMode == "firejail") {
    return rawMode;
  }
  LOG(WARNING) << "Unknown sandbox mode " << rawMode << ", running unsandboxed";
  return "off";
}

bool SandboxLauncher::shouldDenyNetwork(const map<string, string>& env) const {
  string raw = toLower(
      lookup(env, "FLEETTERM_NETWORK_GUARD",
             defaultNetworkGuard.empty() ? string("off") : defaultNetworkGuard));
  return raw == "none" || raw == "disabled" || raw == "block";
}

string SandboxLauncher::buildSeatbeltProfile(const string& cwd,
                                             const string& home,
                                             bool denyNetwork) {
  string escapedCwd = escapeForSeatbelt(resolvePath(cwd));
  string escapedHome = escapeForSeatbelt(home);
  string escapedSsh = escapeForSeatbelt((fs::path(home) / ".ssh").string());
  string escapedShellRc =
      escapeForSeatbelt((fs::path(home) / ".zshrc").string());
  string writableDirs = "(allow file-write* (subpath \"" + escapedCwd +
                        "\") (subpath \"/tmp\") (subpath \"/private/tmp\"))";

  vector<string> lines = {
      "(version 1)",
      "(allow default)",
      writableDirs,
      "(deny file-read* (subpath \"" + escapedSsh + "\"))",
      "(deny file-read* (subpath \"" + escapedShellRc + "\"))",
      "(deny file-write* (subpath \"" + escapedHome + "\"))",
      // Later rules win, so cwd and temp are writable again.
      writableDirs,
  };
  if (denyNetwork) {
    lines.push_back("(deny network*)");
  }

  string profile;
  for (const auto& line : lines) {
    if (!profile.empty()) {
      profile += "\n";
    }
    profile += line;
  }
  return profile;
}

LaunchSpec SandboxLauncher::resolveLaunch(const string& shell,
                                          const string& cwd,
                                          const map<string, string>& env) {
  string mode = resolveMode(env);
  bool denyNetwork = shouldDenyNetwork(env);

  if (mode == "seatbelt") {
    if (!subprocessUtils->commandExists("sandbox-exec")) {
      LOG(WARNING) << "sandbox-exec unavailable, running " << shell
                   << " unsandboxed";
      LaunchSpec spec = unwrapped(shell, env, mode);
      spec.mutable_sandbox()->set_warning("sandbox-exec unavailable");
      return spec;
    }
    LaunchSpec spec;
    spec.set_command("sandbox-exec");
    spec.add_args("-p");
    spec.add_args(buildSeatbeltProfile(cwd, GetHomeDirectory(), denyNetwork));
    spec.add_args(shell);
    spec.mutable_env()->insert(env.begin(), env.end());
    applySandboxShellEnv(&spec);
    spec.mutable_sandbox()->set_mode(mode);
    spec.mutable_sandbox()->set_active(true);
    spec.mutable_sandbox()->set_deny_network(denyNetwork);
    return spec;
  }

  if (mode == "firejail") {
    if (!subprocessUtils->commandExists("firejail")) {
      LOG(WARNING) << "firejail unavailable, running " << shell
                   << " unsandboxed";
      LaunchSpec spec = unwrapped(shell, env, mode);
      spec.mutable_sandbox()->set_warning("firejail unavailable");
      return spec;
    }
    string resolvedCwd = resolvePath(cwd);
    LaunchSpec spec;
    spec.set_command("firejail");
    spec.add_args("--quiet");
    spec.add_args("--private=" + resolvedCwd);
    spec.add_args("--whitelist=" + resolvedCwd);
    if (denyNetwork) {
      spec.add_args("--net=none");
    }
    spec.add_args("--");
    spec.add_args(shell);
    spec.mutable_env()->insert(env.begin(), env.end());
    applySandboxShellEnv(&spec);
    spec.mutable_sandbox()->set_mode(mode);
    spec.mutable_sandbox()->set_active(true);
    spec.mutable_sandbox()->set_deny_network(denyNetwork);
    return spec;
  }

  return unwrapped(shell, env, "off");
}
}  // namespace ft
