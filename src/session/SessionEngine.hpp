#ifndef __FT_SESSION_ENGINE_HPP__
#define __FT_SESSION_ENGINE_HPP__

#include "EngineConfig.hpp"
#include "Headers.hpp"
#include "HiddenEchoFilter.hpp"
#include "PtyProcess.hpp"
#include "ResourceAllocator.hpp"
#include "SandboxLauncher.hpp"
#include "SessionEvents.hpp"
#include "SessionStateMachine.hpp"

namespace ft {
const string INVALID_TASK_ID_ERROR = "invalid taskId";
const string PAYLOAD_TOO_LARGE_ERROR = "payload too large";
const string NOT_RUNNING_ERROR = "PTY is not running for this task.";
const string NO_FREE_PORT_ERROR = "no free port in resource range";
const string UNKNOWN_SESSION_ERROR = "session not found";
const string INPUT_BACKLOG_ERROR = "PTY input backlog is full";

struct CreateResult {
  bool success = false;
  /** @brief True only when a new session was added. */
  bool created = false;
  bool running = false;
  /** @brief True when an existing, stopped session was respawned. */
  bool restarted = false;
  string error;
  optional<string> startError;
  SandboxDescriptor sandbox;
};

struct AttachResult {
  bool success = false;
  string error;
  string buffer;
  bool isBlocked = false;
  optional<string> blockedReason;
  bool running = false;
  optional<int> exitCode;
  optional<int> exitSignal;
  SandboxDescriptor sandbox;
  StateSnapshot state;
  optional<string> startError;
};

struct OperationResult {
  bool success = false;
  string error;
};

struct RestartResult {
  bool success = false;
  bool running = false;
  bool restarted = false;
  string error;
  optional<string> startError;
  SandboxDescriptor sandbox;
};

struct LaunchOptions {
  /** @brief Hide the terminal's echo of the command. */
  bool suppressEcho = false;
  /** @brief Agent provider; detected from the command when empty. */
  string provider;
};

/**
 * @brief Owns every PTY session: spawns and supervises the processes, buffers
 * and fans out their output, and tracks each session's semantic state.
 *
 * Public operations and the I/O pump (update/run) are serialized on one
 * recursive mutex, so hooks and channels may call back into the engine.
 */
class SessionEngine {
 public:
  SessionEngine(const EngineConfig& _config,
                shared_ptr<PtyProcessFactory> _processFactory,
                shared_ptr<SandboxLauncher> _sandboxLauncher);
  ~SessionEngine();

  void setSubscriberChannel(shared_ptr<SubscriberChannel> channel);
  void addLifecycleHook(shared_ptr<SessionLifecycleHook> hook);

  /**
   * @brief Creates the session, or joins (and if needed restarts) an existing
   * one.
   * @param env Caller overlay, applied last when building the environment.
   */
  CreateResult createSession(const string& taskId, const string& cwd,
                             const map<string, string>& env,
                             const string& subscriberId = "default");

  AttachResult attach(const string& taskId, const string& subscriberId);

  OperationResult detach(const string& taskId, const string& subscriberId);

  OperationResult write(const string& taskId, const string& data);

  /** @brief Types `command` followed by a carriage return. */
  OperationResult launch(const string& taskId, const string& command,
                         const LaunchOptions& options = LaunchOptions());

  OperationResult resize(const string& taskId, int cols, int rows);

  RestartResult restart(const string& taskId,
                        const string& subscriberId = "default");

  /** @brief Kills the process and forgets the session. */
  OperationResult destroy(const string& taskId);

  vector<SessionInfo> listSessions();

  /** @brief Destroys every session and waits for the children to go away. */
  void destroyAll();

  /**
   * @brief Runs one iteration of the I/O pump: waits up to `timeoutMs` for
   * output or for room to write queued input, dispatches it and reaps exited
   * children.
   */
  void update(int timeoutMs);

  /** @brief Calls update() until shutdown(). */
  void run();

  void shutdown() { halt = true; }

  bool isShuttingDown() const { return halt; }

  const EngineConfig& getConfig() const { return config; }

  static bool isValidTaskId(const string& taskId);

 protected:
  struct Session {
    string taskId;
    string cwd;
    map<string, string> callerEnv;
    map<string, string> env;
    shared_ptr<PtyProcess> process;
    bool fdClosed = false;
    set<string> subscribers;
    string outputBuffer;
    // Typed bytes the terminal has not accepted yet.
    string pendingInput;
    int64_t createdAt = 0;
    int64_t lastActivityAt = 0;
    optional<int> exitCode;
    optional<int> exitSignal;
    ResourceAssignment resource;
    SandboxDescriptor sandbox;
    unique_ptr<SessionStateMachine> stateMachine;
    unique_ptr<HiddenEchoFilter> echoFilter;
    optional<string> startError;
  };

  struct ReapingProcess {
    shared_ptr<PtyProcess> process;
    int64_t killAt;
    bool killed;
  };

  shared_ptr<Session> getSession(const string& taskId);
  bool isRunning(const Session& session) const;
  string resolveCwd(const string& cwd) const;
  vector<string> shellCandidates() const;
  map<string, string> buildEnv(const Session& session) const;
  bool startProcess(const shared_ptr<Session>& session);
  void stopProcess(const shared_ptr<Session>& session);
  bool hasInputRoom(const Session& session, size_t bytes) const;
  void queueInput(const shared_ptr<Session>& session, const string& data);
  void flushInput(const shared_ptr<Session>& session);
  void pumpSession(const shared_ptr<Session>& session, bool readable);
  void handleOutput(const shared_ptr<Session>& session, const string& chunk);
  void handleExit(const shared_ptr<Session>& session,
                  const ProcessExit& exit);
  void appendDisplayed(const shared_ptr<Session>& session,
                       const string& data);
  void injectLine(const shared_ptr<Session>& session, const string& text);
  void publishStateChange(const shared_ptr<Session>& session, bool wasBlocked,
                          const StateChange& change);
  void publish(const shared_ptr<Session>& session, const SessionEvent& event,
               bool toSubscribers);
  void reapProcesses();
  SessionInfo describe(const Session& session) const;

  EngineConfig config;
  shared_ptr<PtyProcessFactory> processFactory;
  shared_ptr<SandboxLauncher> sandboxLauncher;
  ResourceAllocator resourceAllocator;
  shared_ptr<SubscriberChannel> subscriberChannel;
  vector<shared_ptr<SessionLifecycleHook>> lifecycleHooks;
  map<string, shared_ptr<Session>> sessions;
  vector<ReapingProcess> reaping;
  std::atomic<bool> halt;
  recursive_mutex engineMutex;
};
}  // namespace ft

#endif  // __FT_SESSION_ENGINE_HPP__
