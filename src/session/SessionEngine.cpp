#include "SessionEngine.hpp"

namespace ft {
namespace {
const int MIN_COLS = 20;
const int MAX_COLS = 1000;
const int MIN_ROWS = 10;
const int MAX_ROWS = 1000;
// Queued input may reach this many maximum-size writes.
const size_t INPUT_BACKLOG_WRITES = 4;

string lookup(const map<string, string>& env, const string& key) {
  auto it = env.find(key);
  return it == env.end() ? string() : it->second;
}
}  // namespace

SessionEngine::SessionEngine(const EngineConfig& _config,
                             shared_ptr<PtyProcessFactory> _processFactory,
                             shared_ptr<SandboxLauncher> _sandboxLauncher)
    : config(_config),
      processFactory(_processFactory),
      sandboxLauncher(_sandboxLauncher),
      resourceAllocator(_config.portBase, _config.portSpan, _config.portHost),
      halt(false) {}

SessionEngine::~SessionEngine() { destroyAll(); }

void SessionEngine::setSubscriberChannel(shared_ptr<SubscriberChannel> channel) {
  lock_guard<recursive_mutex> guard(engineMutex);
  subscriberChannel = channel;
}

void SessionEngine::addLifecycleHook(shared_ptr<SessionLifecycleHook> hook) {
  lock_guard<recursive_mutex> guard(engineMutex);
  lifecycleHooks.push_back(hook);
}

bool SessionEngine::isValidTaskId(const string& taskId) {
  if (taskId.empty() || taskId.size() > 128) {
    return false;
  }
  for (char c : taskId) {
    if (!isalnum((unsigned char)c) && c != '.' && c != '_' && c != '-') {
      return false;
    }
  }
  return true;
}

shared_ptr<SessionEngine::Session> SessionEngine::getSession(
    const string& taskId) {
  auto it = sessions.find(taskId);
  if (it == sessions.end()) {
    return shared_ptr<Session>();
  }
  return it->second;
}

bool SessionEngine::isRunning(const Session& session) const {
  return session.process.get() != NULL;
}

string SessionEngine::resolveCwd(const string& cwd) const {
  if (!cwd.empty()) {
    return cwd;
  }
  string home = GetHomeDirectory();
  if (!home.empty()) {
    return home;
  }
  return fs::current_path().string();
}

vector<string> SessionEngine::shellCandidates() const {
  vector<string> candidates;
  auto add = [&candidates](const string& shell) {
    if (!shell.empty() && std::find(candidates.begin(), candidates.end(),
                                    shell) == candidates.end()) {
      candidates.push_back(shell);
    }
  };
  add(config.shell);
  const char* envShell = ::getenv("SHELL");
  if (envShell) {
    add(string(envShell));
  }
  add("/bin/zsh");
  add("/bin/bash");
  add("/bin/sh");
  return candidates;
}

map<string, string> SessionEngine::buildEnv(const Session& session) const {
  map<string, string> env = EngineConfig::processEnvironment();
  // Tools gate color on these; the operator's view is always a color terminal.
  env.erase("NO_COLOR");
  env["TERM"] = "xterm-256color";
  env["COLORTERM"] = "truecolor";
  if (env["TERM_PROGRAM"].empty()) {
    env["TERM_PROGRAM"] = "FleetTerm";
  }
  env["FORCE_COLOR"] = "1";
  env["CLICOLOR"] = "1";
  env["CLICOLOR_FORCE"] = "1";

  for (const auto& it : config.dependencyEnv) {
    env[it.first] = it.second;
  }
  for (const auto& it : ResourceAllocator::buildResourceEnv(session.resource)) {
    env[it.first] = it.second;
  }
  for (const auto& it : session.callerEnv) {
    env[it.first] = it.second;
  }
  return env;
}

CreateResult SessionEngine::createSession(const string& taskId,
                                          const string& cwd,
                                          const map<string, string>& env,
                                          const string& subscriberId) {
  lock_guard<recursive_mutex> guard(engineMutex);
  CreateResult result;
  if (!isValidTaskId(taskId)) {
    result.error = INVALID_TASK_ID_ERROR;
    return result;
  }

  auto existing = getSession(taskId);
  if (existing) {
    for (const auto& it : env) {
      existing->callerEnv[it.first] = it.second;
    }
    existing->subscribers.insert(subscriberId);
    if (!isRunning(*existing)) {
      LOG(INFO) << "Session " << taskId << " is not running, restarting";
      restart(taskId, subscriberId);
      result.restarted = true;
    }
    result.success = true;
    result.running = isRunning(*existing);
    result.startError = existing->startError;
    result.sandbox = existing->sandbox;
    return result;
  }

  if (int(sessions.size()) >= config.maxSessions) {
    LOG(WARNING) << "Refusing session " << taskId << ": " << sessions.size()
                 << " sessions already running";
    result.error =
        "session limit reached (" + to_string(config.maxSessions) + ")";
    return result;
  }

  auto assignment = resourceAllocator.allocate(taskId);
  if (!assignment) {
    result.error = NO_FREE_PORT_ERROR;
    return result;
  }

  auto session = make_shared<Session>();
  session->taskId = taskId;
  session->cwd = resolveCwd(cwd);
  session->callerEnv = env;
  session->subscribers.insert(subscriberId);
  session->createdAt = nowMillis();
  session->lastActivityAt = session->createdAt;
  session->resource = *assignment;
  session->stateMachine.reset(
      new SessionStateMachine(lookup(env, "FLEETTERM_AGENT_PROVIDER")));
  session->echoFilter.reset(new HiddenEchoFilter(config.hiddenEchoWindow));
  sessions[taskId] = session;
  LOG(INFO) << "Created session " << taskId << " in " << session->cwd
            << " with port " << assignment->port();

  startProcess(session);

  result.success = true;
  result.created = true;
  result.running = isRunning(*session);
  result.startError = session->startError;
  result.sandbox = session->sandbox;
  return result;
}

bool SessionEngine::startProcess(const shared_ptr<Session>& session) {
  session->env = buildEnv(*session);
  string lastError;
  SandboxDescriptor lastSandbox;
  for (const auto& shell : shellCandidates()) {
    LaunchSpec spec =
        sandboxLauncher->resolveLaunch(shell, session->cwd, session->env);
    lastSandbox = spec.sandbox();
    shared_ptr<PtyProcess> process = processFactory->create();
    string error;
    if (!process->start(spec, session->cwd, config.cols, config.rows,
                        &error)) {
      LOG(WARNING) << "Could not start " << shell << " for "
                   << session->taskId << ": " << error;
      lastError = error;
      continue;
    }

    session->process = process;
    session->fdClosed = false;
    session->sandbox = spec.sandbox();
    session->startError.reset();
    session->exitCode.reset();
    session->exitSignal.reset();
    session->lastActivityAt = nowMillis();
    session->echoFilter->flush();
    LOG(INFO) << "Session " << session->taskId << " running "
              << spec.command() << " as pid " << process->getPid();

    SessionEvent started;
    started.set_task_id(session->taskId);
    started.mutable_started()->set_cwd(session->cwd);
    started.mutable_started()->set_created_at(session->createdAt);
    publish(session, started, false);

    bool wasBlocked = session->stateMachine->snapshot().is_blocked();
    publishStateChange(session, wasBlocked, session->stateMachine->start());
    return true;
  }

  session->sandbox = lastSandbox;
  if (lastError.empty()) {
    lastError = "no shell available";
  }
  if (!session->startError || *session->startError != lastError) {
    session->startError = lastError;
    STERROR << "Session " << session->taskId
            << " failed to start: " << lastError;
    injectLine(session, "Failed to start terminal: " + lastError);
  }
  return false;
}

void SessionEngine::stopProcess(const shared_ptr<Session>& session) {
  if (!session->process) {
    return;
  }
  VLOG(1) << "Sending SIGTERM to pid " << session->process->getPid();
  session->process->terminate(SIGTERM);
  reaping.push_back(
      {session->process, nowMillis() + config.killGraceMs, false});
  session->process.reset();
  session->fdClosed = true;
  session->pendingInput.clear();
  session->echoFilter->flush();
}

bool SessionEngine::hasInputRoom(const Session& session, size_t bytes) const {
  return session.pendingInput.size() + bytes <=
         config.maxWriteBytes * INPUT_BACKLOG_WRITES;
}

void SessionEngine::queueInput(const shared_ptr<Session>& session,
                               const string& data) {
  session->pendingInput.append(data);
  flushInput(session);
}

void SessionEngine::flushInput(const shared_ptr<Session>& session) {
  if (session->pendingInput.empty() || !session->process) {
    return;
  }
  size_t written;
  try {
    written = session->process->write(session->pendingInput);
  } catch (const std::runtime_error&) {
    session->pendingInput.clear();
    throw;
  }
  session->pendingInput.erase(0, written);
  if (!session->pendingInput.empty()) {
    VLOG(2) << session->pendingInput.size() << " input bytes queued for "
            << session->taskId;
  }
}

AttachResult SessionEngine::attach(const string& taskId,
                                   const string& subscriberId) {
  lock_guard<recursive_mutex> guard(engineMutex);
  AttachResult result;
  if (!isValidTaskId(taskId)) {
    result.error = INVALID_TASK_ID_ERROR;
    return result;
  }
  auto session = getSession(taskId);
  if (!session) {
    result.error = UNKNOWN_SESSION_ERROR;
    return result;
  }
  session->subscribers.insert(subscriberId);

  const StateSnapshot& state = session->stateMachine->snapshot();
  result.success = true;
  result.buffer = session->outputBuffer;
  result.isBlocked = state.is_blocked();
  if (state.has_blocked_reason()) {
    result.blockedReason = state.blocked_reason();
  }
  result.running = isRunning(*session);
  result.exitCode = session->exitCode;
  result.exitSignal = session->exitSignal;
  result.sandbox = session->sandbox;
  result.state = state;
  result.startError = session->startError;
  return result;
}

OperationResult SessionEngine::detach(const string& taskId,
                                      const string& subscriberId) {
  lock_guard<recursive_mutex> guard(engineMutex);
  OperationResult result;
  if (!isValidTaskId(taskId)) {
    result.error = INVALID_TASK_ID_ERROR;
    return result;
  }
  auto session = getSession(taskId);
  if (!session) {
    result.error = UNKNOWN_SESSION_ERROR;
    return result;
  }
  session->subscribers.erase(subscriberId);
  result.success = true;
  return result;
}

OperationResult SessionEngine::write(const string& taskId,
                                     const string& data) {
  lock_guard<recursive_mutex> guard(engineMutex);
  OperationResult result;
  if (!isValidTaskId(taskId)) {
    result.error = INVALID_TASK_ID_ERROR;
    return result;
  }
  auto session = getSession(taskId);
  if (!session) {
    result.error = NOT_RUNNING_ERROR;
    return result;
  }
  if (data.size() > config.maxWriteBytes) {
    LOG(WARNING) << "Dropping " << data.size() << " byte write to " << taskId;
    injectLine(session, "PTY write dropped: payload too large.");
    result.error = PAYLOAD_TOO_LARGE_ERROR;
    return result;
  }
  if (!isRunning(*session)) {
    result.error = NOT_RUNNING_ERROR;
    return result;
  }

  if (!hasInputRoom(*session, data.size())) {
    LOG(WARNING) << "Input backlog for " << taskId << " is full, dropping "
                 << data.size() << " bytes";
    result.error = INPUT_BACKLOG_ERROR;
    return result;
  }

  StateSnapshot previous = session->stateMachine->snapshot();
  string previousTail = session->stateMachine->getTail();
  publishStateChange(session, previous.is_blocked(),
                     session->stateMachine->consumeInput(data));

  // A hook may have torn the process down.
  if (!isRunning(*session)) {
    result.error = NOT_RUNNING_ERROR;
    return result;
  }
  try {
    queueInput(session, data);
  } catch (const std::runtime_error& re) {
    STERROR << "Write to " << taskId << " failed: " << re.what();
    // The keystrokes never arrived, so the prompt is still waiting.
    bool wasBlocked = session->stateMachine->snapshot().is_blocked();
    publishStateChange(session, wasBlocked,
                       session->stateMachine->restore(previous, previousTail));
    result.error = re.what();
    return result;
  }
  session->lastActivityAt = nowMillis();
  result.success = true;
  return result;
}

OperationResult SessionEngine::launch(const string& taskId,
                                      const string& command,
                                      const LaunchOptions& options) {
  lock_guard<recursive_mutex> guard(engineMutex);
  OperationResult result;
  if (!isValidTaskId(taskId)) {
    result.error = INVALID_TASK_ID_ERROR;
    return result;
  }
  auto session = getSession(taskId);
  if (!session) {
    result.error = UNKNOWN_SESSION_ERROR;
    return result;
  }
  if (!isRunning(*session)) {
    restart(taskId, "");
  }
  if (!isRunning(*session)) {
    result.error = NOT_RUNNING_ERROR;
    return result;
  }

  string provider = MarkerProtocol::normalizeProvider(options.provider);
  if (provider.empty()) {
    provider = MarkerProtocol::detectProviderFromCommand(command);
  }
  string line = command;
  if (!provider.empty()) {
    line = MarkerProtocol::buildAgentWrapperCommand(command, provider);
    bool wasBlocked = session->stateMachine->snapshot().is_blocked();
    publishStateChange(session, wasBlocked,
                       session->stateMachine->setProviderHint(provider));
  }

  if (!options.suppressEcho) {
    return write(taskId, line + "\r");
  }

  string data = line + "\r";
  if (data.size() > config.maxWriteBytes) {
    injectLine(session, "PTY write dropped: payload too large.");
    result.error = PAYLOAD_TOO_LARGE_ERROR;
    return result;
  }
  if (!hasInputRoom(*session, data.size())) {
    result.error = INPUT_BACKLOG_ERROR;
    return result;
  }
  session->echoFilter->arm(line);
  try {
    queueInput(session, data);
  } catch (const std::runtime_error& re) {
    STERROR << "Launch in " << taskId << " failed: " << re.what();
    session->echoFilter->flush();
    result.error = re.what();
    return result;
  }
  session->lastActivityAt = nowMillis();
  result.success = true;
  return result;
}

OperationResult SessionEngine::resize(const string& taskId, int cols,
                                      int rows) {
  lock_guard<recursive_mutex> guard(engineMutex);
  OperationResult result;
  if (!isValidTaskId(taskId)) {
    result.error = INVALID_TASK_ID_ERROR;
    return result;
  }
  auto session = getSession(taskId);
  if (!session || !isRunning(*session)) {
    result.error = NOT_RUNNING_ERROR;
    return result;
  }
  cols = std::max(MIN_COLS, std::min(MAX_COLS, cols));
  rows = std::max(MIN_ROWS, std::min(MAX_ROWS, rows));
  session->process->resize(cols, rows);
  result.success = true;
  return result;
}

RestartResult SessionEngine::restart(const string& taskId,
                                     const string& subscriberId) {
  lock_guard<recursive_mutex> guard(engineMutex);
  RestartResult result;
  if (!isValidTaskId(taskId)) {
    result.error = INVALID_TASK_ID_ERROR;
    return result;
  }
  auto session = getSession(taskId);
  if (!session) {
    result.error = UNKNOWN_SESSION_ERROR;
    return result;
  }
  if (!subscriberId.empty()) {
    session->subscribers.insert(subscriberId);
  }

  stopProcess(session);
  session->exitCode.reset();
  session->exitSignal.reset();
  bool started = startProcess(session);

  result.success = started;
  result.running = isRunning(*session);
  result.restarted = true;
  result.startError = session->startError;
  if (!started && session->startError) {
    result.error = *session->startError;
  }
  result.sandbox = session->sandbox;
  return result;
}

OperationResult SessionEngine::destroy(const string& taskId) {
  lock_guard<recursive_mutex> guard(engineMutex);
  OperationResult result;
  if (!isValidTaskId(taskId)) {
    result.error = INVALID_TASK_ID_ERROR;
    return result;
  }
  auto session = getSession(taskId);
  result.success = true;
  if (!session) {
    return result;
  }

  stopProcess(session);
  sessions.erase(taskId);
  resourceAllocator.release(taskId);
  LOG(INFO) << "Destroyed session " << taskId;

  SessionEvent destroyed;
  destroyed.set_task_id(taskId);
  destroyed.mutable_destroyed();
  publish(session, destroyed, false);
  return result;
}

vector<SessionInfo> SessionEngine::listSessions() {
  lock_guard<recursive_mutex> guard(engineMutex);
  vector<SessionInfo> result;
  for (const auto& it : sessions) {
    result.push_back(describe(*it.second));
  }
  return result;
}

SessionInfo SessionEngine::describe(const Session& session) const {
  SessionInfo info;
  const StateSnapshot& state = session.stateMachine->snapshot();
  info.set_task_id(session.taskId);
  info.set_cwd(session.cwd);
  info.set_running(isRunning(session));
  info.set_is_blocked(state.is_blocked());
  if (state.has_blocked_reason()) {
    info.set_blocked_reason(state.blocked_reason());
  }
  info.set_subscribers(int(session.subscribers.size()));
  info.set_created_at(session.createdAt);
  info.set_last_activity_at(session.lastActivityAt);
  if (session.exitCode) {
    info.set_exit_code(*session.exitCode);
  }
  if (session.exitSignal) {
    info.set_exit_signal(*session.exitSignal);
  }
  info.set_buffer_size(int64_t(session.outputBuffer.size()));
  *info.mutable_state() = state;
  *info.mutable_resource() = session.resource;
  *info.mutable_sandbox() = session.sandbox;
  if (session.startError) {
    info.set_start_error(*session.startError);
  }
  info.set_pid(session.process ? int(session.process->getPid()) : 0);
  return info;
}

void SessionEngine::destroyAll() {
  lock_guard<recursive_mutex> guard(engineMutex);
  vector<string> taskIds;
  for (const auto& it : sessions) {
    taskIds.push_back(it.first);
  }
  for (const auto& taskId : taskIds) {
    destroy(taskId);
  }

  int64_t deadline = nowMillis() + config.killGraceMs + 1000;
  while (!reaping.empty()) {
    reapProcesses();
    if (reaping.empty()) {
      break;
    }
    if (nowMillis() > deadline) {
      LOG(WARNING) << reaping.size() << " child process(es) did not exit";
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

void SessionEngine::update(int timeoutMs) {
  fd_set rfd;
  fd_set wfd;
  FD_ZERO(&rfd);
  FD_ZERO(&wfd);
  int maxFd = -1;
  vector<pair<shared_ptr<Session>, shared_ptr<PtyProcess>>> active;
  {
    lock_guard<recursive_mutex> guard(engineMutex);
    for (const auto& it : sessions) {
      const auto& session = it.second;
      if (!session->process) {
        continue;
      }
      active.push_back(make_pair(session, session->process));
      int fd = session->process->getFd();
      if (fd >= 0 && !session->fdClosed) {
        FD_SET(fd, &rfd);
        if (!session->pendingInput.empty()) {
          FD_SET(fd, &wfd);
        }
        maxFd = std::max(maxFd, fd);
      }
    }
  }

  timeval tv;
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  int rc = select(maxFd + 1, &rfd, &wfd, NULL, &tv);
  if (rc < 0) {
    if (GetErrno() == EINTR) {
      return;
    }
    FATAL_FAIL(rc);
  }

  lock_guard<recursive_mutex> guard(engineMutex);
  for (const auto& entry : active) {
    const auto& session = entry.first;
    // Skip sessions destroyed or restarted since the select.
    if (getSession(session->taskId) != session ||
        session->process != entry.second) {
      continue;
    }
    int fd = entry.second->getFd();
    bool readable =
        fd < 0 || (rc > 0 && !session->fdClosed && FD_ISSET(fd, &rfd));
    bool writable =
        fd < 0 || (rc > 0 && !session->fdClosed && FD_ISSET(fd, &wfd));
    if (writable && !session->pendingInput.empty()) {
      try {
        flushInput(session);
      } catch (const std::runtime_error& re) {
        STERROR << "Queued input for " << session->taskId
                << " was lost: " << re.what();
      }
    }
    pumpSession(session, readable);
  }
  reapProcesses();
}

void SessionEngine::run() {
  while (!halt) {
    update(10);
  }
}

void SessionEngine::pumpSession(const shared_ptr<Session>& session,
                                bool readable) {
  shared_ptr<PtyProcess> process = session->process;
  if (readable) {
    string chunk;
    RawFdUtils::ReadStatus status = process->read(&chunk);
    if (!chunk.empty()) {
      handleOutput(session, chunk);
    }
    if (status == RawFdUtils::READ_CLOSED && session->process == process) {
      VLOG(1) << "PTY for " << session->taskId << " closed";
      session->fdClosed = true;
    }
  }
  if (session->process != process) {
    return;
  }

  ProcessExit exit;
  if (!process->pollExit(&exit)) {
    return;
  }
  // Drain whatever the child wrote right before exiting.
  while (true) {
    string rest;
    RawFdUtils::ReadStatus status = process->read(&rest);
    if (!rest.empty()) {
      handleOutput(session, rest);
      if (session->process != process) {
        return;
      }
    }
    if (status != RawFdUtils::READ_OK || rest.empty()) {
      break;
    }
  }
  handleExit(session, exit);
}

void SessionEngine::handleOutput(const shared_ptr<Session>& session,
                                 const string& chunk) {
  VLOG(3) << "Read " << chunk.size() << " bytes from " << session->taskId;
  session->lastActivityAt = nowMillis();
  appendDisplayed(session, session->echoFilter->filter(chunk));

  SessionEvent activity;
  activity.set_task_id(session->taskId);
  activity.mutable_activity()->set_at(session->lastActivityAt);
  publish(session, activity, false);

  bool wasBlocked = session->stateMachine->snapshot().is_blocked();
  publishStateChange(session, wasBlocked,
                     session->stateMachine->consumeOutput(chunk));
}

void SessionEngine::handleExit(const shared_ptr<Session>& session,
                               const ProcessExit& exit) {
  session->process.reset();
  session->fdClosed = true;
  session->pendingInput.clear();
  appendDisplayed(session, session->echoFilter->flush());
  session->exitCode = exit.exitCode;
  session->exitSignal = exit.exitSignal;
  session->lastActivityAt = nowMillis();
  LOG(INFO) << "Session " << session->taskId << " exited"
            << (exit.exitCode ? " with code " + to_string(*exit.exitCode)
                              : string())
            << (exit.exitSignal
                    ? " on signal " + to_string(*exit.exitSignal)
                    : string());

  SessionEvent exited;
  exited.set_task_id(session->taskId);
  ExitEvent* exitEvent = exited.mutable_exit();
  if (exit.exitCode) {
    exitEvent->set_exit_code(*exit.exitCode);
  }
  if (exit.exitSignal) {
    exitEvent->set_exit_signal(*exit.exitSignal);
  }
  publish(session, exited, true);

  bool wasBlocked = session->stateMachine->snapshot().is_blocked();
  publishStateChange(
      session, wasBlocked,
      session->stateMachine->consumeExit(exit.exitCode, exit.exitSignal));
}

void SessionEngine::appendDisplayed(const shared_ptr<Session>& session,
                                    const string& data) {
  if (data.empty()) {
    return;
  }
  session->outputBuffer.append(data);
  if (session->outputBuffer.size() > config.outputBufferBytes) {
    session->outputBuffer.erase(
        0, session->outputBuffer.size() - config.outputBufferBytes);
  }

  SessionEvent event;
  event.set_task_id(session->taskId);
  event.mutable_data()->set_data(data);
  publish(session, event, true);
}

void SessionEngine::injectLine(const shared_ptr<Session>& session,
                               const string& text) {
  appendDisplayed(session, "\r\n" + ORCHESTRATOR_TAG + " " + text + "\r\n");
}

void SessionEngine::publishStateChange(const shared_ptr<Session>& session,
                                       bool wasBlocked,
                                       const StateChange& change) {
  if (!change.changed) {
    return;
  }
  SessionEvent mode;
  mode.set_task_id(session->taskId);
  *mode.mutable_mode()->mutable_snapshot() = change.snapshot;
  publish(session, mode, true);

  bool isBlocked = change.snapshot.is_blocked();
  if (isBlocked == wasBlocked) {
    return;
  }
  SessionEvent blocked;
  blocked.set_task_id(session->taskId);
  blocked.mutable_blocked()->set_is_blocked(isBlocked);
  if (isBlocked && change.snapshot.has_blocked_reason()) {
    blocked.mutable_blocked()->set_reason(change.snapshot.blocked_reason());
    LOG(INFO) << "Session " << session->taskId
              << " blocked: " << change.snapshot.blocked_reason();
  }
  publish(session, blocked, true);
}

void SessionEngine::publish(const shared_ptr<Session>& session,
                            const SessionEvent& event, bool toSubscribers) {
  if (toSubscribers && subscriberChannel) {
    set<string> subscribers = session->subscribers;
    for (const auto& subscriberId : subscribers) {
      try {
        subscriberChannel->deliver(subscriberId, event);
      } catch (const std::exception& e) {
        STERROR << "Delivering to " << subscriberId << " failed: " << e.what();
      }
    }
  }
  auto hooks = lifecycleHooks;
  for (const auto& hook : hooks) {
    try {
      hook->onSessionEvent(event);
    } catch (const std::exception& e) {
      STERROR << "Lifecycle hook failed on " << event.task_id() << ": "
              << e.what();
    }
  }
}

void SessionEngine::reapProcesses() {
  int64_t now = nowMillis();
  for (auto it = reaping.begin(); it != reaping.end();) {
    string discarded;
    it->process->read(&discarded);
    ProcessExit exit;
    if (it->process->pollExit(&exit)) {
      VLOG(1) << "Reaped pid " << it->process->getPid();
      it = reaping.erase(it);
      continue;
    }
    if (!it->killed && now >= it->killAt) {
      LOG(INFO) << "pid " << it->process->getPid()
                << " ignored SIGTERM, sending SIGKILL";
      it->process->terminate(SIGKILL);
      it->killed = true;
    }
    ++it;
  }
}
}  // namespace ft
