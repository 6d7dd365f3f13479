#include "SessionJson.hpp"

namespace ft {
namespace SessionJson {
namespace {
template <typename T>
json optionalJson(const optional<T>& value) {
  return value ? json(*value) : json(nullptr);
}
}  // namespace

string modeName(SessionMode mode) {
  switch (mode) {
    case MODE_BOOTING:
      return "booting";
    case MODE_SHELL:
      return "shell";
    case MODE_AGENT:
      return "agent";
    case MODE_TUI:
      return "tui";
    case MODE_BLOCKED:
      return "blocked";
    case MODE_EXITED:
      return "exited";
    default:
      return "unknown";
  }
}

string confidenceName(ModeConfidence confidence) {
  switch (confidence) {
    case CONFIDENCE_LOW:
      return "low";
    case CONFIDENCE_MEDIUM:
      return "medium";
    case CONFIDENCE_HIGH:
      return "high";
    default:
      return "unknown";
  }
}

optional<SessionMode> parseMode(const string& name) {
  static const map<string, SessionMode> modes = {
      {"booting", MODE_BOOTING}, {"shell", MODE_SHELL},
      {"agent", MODE_AGENT},     {"tui", MODE_TUI},
      {"blocked", MODE_BLOCKED}, {"exited", MODE_EXITED},
  };
  auto it = modes.find(toLower(name));
  if (it == modes.end()) {
    return nullopt;
  }
  return it->second;
}

json toJson(const StateSnapshot& snapshot) {
  json j;
  j["mode"] = modeName(snapshot.mode());
  j["confidence"] = confidenceName(snapshot.confidence());
  j["source"] = snapshot.source();
  j["seq"] = snapshot.seq();
  j["isBlocked"] = snapshot.is_blocked();
  j["blockedReason"] = snapshot.has_blocked_reason()
                           ? json(snapshot.blocked_reason())
                           : json(nullptr);
  j["running"] = snapshot.running();
  j["provider"] =
      snapshot.has_provider() ? json(snapshot.provider()) : json(nullptr);
  j["exitCode"] =
      snapshot.has_exit_code() ? json(snapshot.exit_code()) : json(nullptr);
  j["signal"] = snapshot.has_exit_signal() ? json(snapshot.exit_signal())
                                           : json(nullptr);
  j["updatedAt"] = snapshot.updated_at();
  return j;
}

json toJson(const SandboxDescriptor& sandbox) {
  json j;
  j["mode"] = sandbox.mode().empty() ? string("off") : sandbox.mode();
  j["active"] = sandbox.active();
  j["denyNetwork"] = sandbox.deny_network();
  if (sandbox.has_warning()) {
    j["warning"] = sandbox.warning();
  }
  return j;
}

json toJson(const ResourceAssignment& assignment) {
  json j;
  j["taskId"] = assignment.task_id();
  j["sessionId"] = assignment.session_id();
  j["port"] = assignment.port();
  j["host"] = assignment.host();
  j["baseUrl"] = assignment.base_url();
  j["assignedAt"] = assignment.assigned_at();
  return j;
}

json toJson(const SessionInfo& info) {
  json j;
  j["taskId"] = info.task_id();
  j["cwd"] = info.cwd();
  j["running"] = info.running();
  j["isBlocked"] = info.is_blocked();
  j["blockedReason"] =
      info.has_blocked_reason() ? json(info.blocked_reason()) : json(nullptr);
  j["subscribers"] = info.subscribers();
  j["createdAt"] = info.created_at();
  j["lastActivityAt"] = info.last_activity_at();
  j["exitCode"] = info.has_exit_code() ? json(info.exit_code()) : json(nullptr);
  j["signal"] =
      info.has_exit_signal() ? json(info.exit_signal()) : json(nullptr);
  j["bufferSize"] = info.buffer_size();
  j["state"] = toJson(info.state());
  j["resource"] = toJson(info.resource());
  j["sandbox"] = toJson(info.sandbox());
  j["startError"] =
      info.has_start_error() ? json(info.start_error()) : json(nullptr);
  j["pid"] = info.pid();
  return j;
}

json toJson(const SessionEvent& event) {
  json j;
  j["taskId"] = event.task_id();
  switch (event.payload_case()) {
    case SessionEvent::kStarted:
      j["event"] = "started";
      j["cwd"] = event.started().cwd();
      j["createdAt"] = event.started().created_at();
      break;
    case SessionEvent::kActivity:
      j["event"] = "activity";
      j["at"] = event.activity().at();
      break;
    case SessionEvent::kBlocked:
      j["event"] = "blocked";
      j["isBlocked"] = event.blocked().is_blocked();
      j["reason"] = event.blocked().has_reason()
                        ? json(event.blocked().reason())
                        : json(nullptr);
      break;
    case SessionEvent::kMode:
      j["event"] = "mode";
      j["snapshot"] = toJson(event.mode().snapshot());
      break;
    case SessionEvent::kData:
      j["event"] = "data";
      j["data"] = event.data().data();
      break;
    case SessionEvent::kExit:
      j["event"] = "exit";
      j["exitCode"] = event.exit().has_exit_code()
                          ? json(event.exit().exit_code())
                          : json(nullptr);
      j["signal"] = event.exit().has_exit_signal()
                        ? json(event.exit().exit_signal())
                        : json(nullptr);
      break;
    case SessionEvent::kDestroyed:
      j["event"] = "destroyed";
      break;
    default:
      j["event"] = "unknown";
      break;
  }
  return j;
}

json toJson(const CreateResult& result) {
  json j;
  j["success"] = result.success;
  j["created"] = result.created;
  j["running"] = result.running;
  j["restarted"] = result.restarted;
  if (!result.error.empty()) {
    j["error"] = result.error;
  }
  j["startError"] = optionalJson(result.startError);
  j["sandbox"] = toJson(result.sandbox);
  return j;
}

json toJson(const AttachResult& result) {
  json j;
  j["success"] = result.success;
  if (!result.error.empty()) {
    j["error"] = result.error;
    return j;
  }
  j["buffer"] = result.buffer;
  j["isBlocked"] = result.isBlocked;
  j["blockedReason"] = optionalJson(result.blockedReason);
  j["running"] = result.running;
  j["exitCode"] = optionalJson(result.exitCode);
  j["signal"] = optionalJson(result.exitSignal);
  j["sandbox"] = toJson(result.sandbox);
  j["state"] = toJson(result.state);
  j["startError"] = optionalJson(result.startError);
  return j;
}

json toJson(const OperationResult& result) {
  json j;
  j["success"] = result.success;
  if (!result.error.empty()) {
    j["error"] = result.error;
  }
  return j;
}

json toJson(const RestartResult& result) {
  json j;
  j["success"] = result.success;
  j["running"] = result.running;
  j["restarted"] = result.restarted;
  if (!result.error.empty()) {
    j["error"] = result.error;
  }
  j["startError"] = optionalJson(result.startError);
  j["sandbox"] = toJson(result.sandbox);
  return j;
}

string dumpLine(const json& value) {
  return value.dump(-1, ' ', false, json::error_handler_t::replace);
}
}  // namespace SessionJson
}  // namespace ft
