#include "MarkerProtocol.hpp"

namespace ft {
namespace {
// An unterminated marker longer than this is treated as plain output.
const size_t MAX_PENDING_MARKER = 4096;
}  // namespace

const string MarkerProtocol::PREFIX = "\x1b]1337;FleetTermEvent=";

const vector<string> MarkerProtocol::SUPPORTED_PROVIDERS = {
    "claude", "gemini", "amp", "aider", "codex"};

string MarkerProtocol::normalizeProvider(const string& value) {
  string normalized = toLower(trim(value));
  for (const auto& provider : SUPPORTED_PROVIDERS) {
    if (provider == normalized) {
      return provider;
    }
  }
  return "";
}

string MarkerProtocol::detectProviderFromCommand(const string& value) {
  string normalized = toLower(trim(value));
  if (normalized.empty()) {
    return "";
  }
  for (const auto& provider : SUPPORTED_PROVIDERS) {
    if (normalized.find(provider) != string::npos) {
      return provider;
    }
  }
  return "";
}

Marker MarkerProtocol::parsePayload(const string& raw) {
  Marker marker;
  for (const auto& part : split(raw, ';')) {
    auto eq = part.find('=');
    string key = toLower(trim(part.substr(0, eq)));
    if (key.empty()) {
      continue;
    }
    marker[key] = (eq == string::npos) ? "" : trim(part.substr(eq + 1));
  }
  return marker;
}

vector<Marker> MarkerProtocol::parseMarkers(const string& data,
                                            string* stripped,
                                            string* pending) {
  vector<Marker> markers;
  string rest;
  string held;
  size_t pos = 0;
  while (pos < data.size()) {
    size_t start = data.find(PREFIX, pos);
    if (start == string::npos) {
      break;
    }
    rest.append(data, pos, start - pos);
    size_t payloadStart = start + PREFIX.size();
    size_t end = data.find_first_of("\x07\x1b", payloadStart);
    if (end == string::npos) {
      if (data.size() - start <= MAX_PENDING_MARKER) {
        held = data.substr(start);
      } else {
        rest.append(data, start, string::npos);
      }
      pos = data.size();
      break;
    }
    if (data[end] == '\x07') {
      markers.push_back(
          parsePayload(data.substr(payloadStart, end - payloadStart)));
      pos = end + 1;
      continue;
    }
    // ESC: only `ESC \` terminates a marker.
    if (end + 1 == data.size()) {
      held = data.substr(start);
      pos = data.size();
      break;
    }
    if (data[end + 1] == '\\') {
      markers.push_back(
          parsePayload(data.substr(payloadStart, end - payloadStart)));
      pos = end + 2;
      continue;
    }
    rest.append(data, start, end - start);
    pos = end;
  }
  if (pos < data.size()) {
    rest.append(data, pos, string::npos);
  }

  if (held.empty()) {
    // The chunk may end part way through the prefix itself.
    size_t longest = std::min(rest.size(), PREFIX.size() - 1);
    for (size_t len = longest; len > 0; len--) {
      if (rest.compare(rest.size() - len, len, PREFIX, 0, len) == 0) {
        held = rest.substr(rest.size() - len);
        rest.resize(rest.size() - len);
        break;
      }
    }
  }

  if (stripped) {
    *stripped = rest;
  }
  if (pending) {
    *pending = held;
  } else {
    if (stripped) {
      stripped->append(held);
    }
  }
  return markers;
}

string MarkerProtocol::encode(const Marker& marker) {
  string payload;
  auto it = marker.find("type");
  if (it != marker.end()) {
    payload = "type=" + it->second;
  }
  for (const auto& kv : marker) {
    if (kv.first == "type") {
      continue;
    }
    if (!payload.empty()) {
      payload += ";";
    }
    payload += kv.first + "=" + kv.second;
  }
  return PREFIX + payload + "\x07";
}

string MarkerProtocol::buildAgentWrapperCommand(const string& command,
                                                const string& provider) {
  string safeProvider = normalizeProvider(provider);
  if (safeProvider.empty()) {
    return command;
  }
  string rawCommand = trim(command);
  if (rawCommand.empty()) {
    return rawCommand;
  }
  return "{ __fleetterm_emit(){ printf '\\033]1337;FleetTermEvent=%s\\007' "
         "\"$1\"; }; __fleetterm_emit 'type=agent_started;provider=" +
         safeProvider + "'; " + rawCommand +
         "; __fleetterm_ec=$?; __fleetterm_emit "
         "\"type=agent_exited;provider=" +
         safeProvider + ";code=${__fleetterm_ec}\"; }";
}
}  // namespace ft
