#include "StdioBridge.hpp"

namespace ft {
namespace {
map<string, string> parseEnv(const json& request) {
  map<string, string> env;
  auto it = request.find("env");
  if (it == request.end() || !it->is_object()) {
    return env;
  }
  for (auto kv = it->begin(); kv != it->end(); ++kv) {
    if (kv.value().is_string()) {
      env[kv.key()] = kv.value().get<string>();
    }
  }
  return env;
}
}  // namespace

StdioBridge::StdioBridge(SessionEngine* _engine, std::ostream* _out)
    : engine(_engine), out(_out) {}

json StdioBridge::handleRequest(const json& request) {
  json reply;
  reply["id"] = request.contains("id") ? request["id"] : json(nullptr);
  string op = request.value("op", "");
  reply["op"] = op;

  string taskId = request.value("taskId", "");
  string subscriberId = request.value("subscriberId", "default");

  if (op == "create") {
    reply["result"] = SessionJson::toJson(engine->createSession(
        taskId, request.value("cwd", ""), parseEnv(request), subscriberId));
  } else if (op == "attach") {
    reply["result"] = SessionJson::toJson(engine->attach(taskId, subscriberId));
  } else if (op == "detach") {
    reply["result"] = SessionJson::toJson(engine->detach(taskId, subscriberId));
  } else if (op == "write") {
    reply["result"] =
        SessionJson::toJson(engine->write(taskId, request.value("data", "")));
  } else if (op == "launch") {
    LaunchOptions options;
    options.suppressEcho = request.value("suppressEcho", false);
    options.provider = request.value("provider", "");
    reply["result"] = SessionJson::toJson(
        engine->launch(taskId, request.value("command", ""), options));
  } else if (op == "resize") {
    reply["result"] = SessionJson::toJson(engine->resize(
        taskId, request.value("cols", 80), request.value("rows", 30)));
  } else if (op == "restart") {
    reply["result"] =
        SessionJson::toJson(engine->restart(taskId, subscriberId));
  } else if (op == "destroy") {
    reply["result"] = SessionJson::toJson(engine->destroy(taskId));
  } else if (op == "list") {
    json sessions = json::array();
    for (const auto& info : engine->listSessions()) {
      sessions.push_back(SessionJson::toJson(info));
    }
    reply["result"] = {{"success", true}, {"sessions", sessions}};
  } else if (op == "shutdown") {
    engine->shutdown();
    reply["result"] = {{"success", true}};
  } else {
    reply["result"] = {{"success", false}, {"error", "unknown op: " + op}};
  }
  return reply;
}

void StdioBridge::processLine(const string& line) {
  json reply;
  try {
    json request = json::parse(line);
    if (!request.is_object()) {
      reply = {{"id", nullptr},
               {"result", {{"success", false}, {"error", "not an object"}}}};
    } else {
      reply = handleRequest(request);
    }
  } catch (const json::exception& je) {
    LOG(WARNING) << "Bad request: " << je.what();
    reply = {{"id", nullptr},
             {"result", {{"success", false}, {"error", je.what()}}}};
  }
  writeLine(reply);
}

void StdioBridge::readLoop(std::istream* in) {
  string line;
  while (!engine->isShuttingDown() && std::getline(*in, line)) {
    if (trim(line).empty()) {
      continue;
    }
    VLOG(2) << "Request: " << line;
    processLine(line);
  }
  LOG(INFO) << "Request stream finished, shutting down";
  engine->shutdown();
}

void StdioBridge::deliver(const string& subscriberId,
                          const SessionEvent& event) {
  json line = SessionJson::toJson(event);
  line["subscriberId"] = subscriberId;
  writeLine(line);
}

void StdioBridge::onSessionEvent(const SessionEvent& event) {
  if (event.has_started() || event.has_destroyed()) {
    writeLine(SessionJson::toJson(event));
  }
}

void StdioBridge::writeLine(const json& value) {
  lock_guard<std::mutex> guard(outMutex);
  (*out) << SessionJson::dumpLine(value) << "\n";
  out->flush();
}
}  // namespace ft
