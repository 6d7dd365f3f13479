#ifndef __FT_SANDBOX_LAUNCHER_HPP__
#define __FT_SANDBOX_LAUNCHER_HPP__

#include "Headers.hpp"
#include "SubprocessUtils.hpp"

namespace ft {
/**
 * @brief Turns a shell + working directory + environment into the command
 * line that actually gets spawned, optionally wrapped in an OS sandbox
 * (seatbelt on macOS, firejail on Linux).
 *
 * The mode and network guard come from `FLEETTERM_SANDBOX_MODE` and
 * `FLEETTERM_NETWORK_GUARD` in the session environment, falling back to the
 * defaults given at construction.
 */
class SandboxLauncher {
 public:
  SandboxLauncher(shared_ptr<SubprocessUtils> _subprocessUtils,
                  const string& _defaultMode = "off",
                  const string& _defaultNetworkGuard = "off");

  LaunchSpec resolveLaunch(const string& shell, const string& cwd,
                           const map<string, string>& env);

  /** @brief One of off, seatbelt or firejail. */
  string resolveMode(const map<string, string>& env) const;

  bool shouldDenyNetwork(const map<string, string>& env) const;

  static string buildSeatbeltProfile(const string& cwd, const string& home,
                                     bool denyNetwork);

 protected:
  shared_ptr<SubprocessUtils> subprocessUtils;
  string defaultMode;
  string defaultNetworkGuard;
};
}  // namespace ft

#endif  // __FT_SANDBOX_LAUNCHER_HPP__
