#include "ReplayHarness.hpp"

namespace ft {
namespace {
string jsonString(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return "";
  }
  return it->get<string>();
}

optional<int> jsonInt(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_number_integer()) {
    return nullopt;
  }
  return it->get<int>();
}
}  // namespace

ReplayResult ReplayHarness::runFixture(const string& name,
                                       const json& fixture) {
  ReplayResult result;
  result.name = name;
  if (!fixture.is_object()) {
    result.failures.push_back(name + ": fixture is not an object");
    return result;
  }

  SessionStateMachine machine(jsonString(fixture, "providerHint"),
                              jsonString(fixture, "agentCommand"));

  json events = fixture.value("events", json::array());
  for (size_t i = 0; i < events.size(); i++) {
    const json& event = events[i];
    string context = name + " event#" + to_string(i);
    if (!event.is_object()) {
      result.failures.push_back(context + ": event is not an object");
      return result;
    }
    string type = toLower(trim(jsonString(event, "type")));
    if (type == "start") {
      machine.start();
    } else if (type == "output") {
      optional<bool> altScreen;
      auto it = event.find("altScreen");
      if (it != event.end() && it->is_boolean()) {
        altScreen = it->get<bool>();
      }
      machine.consumeOutput(jsonString(event, "data"), altScreen);
    } else if (type == "input") {
      machine.consumeInput(jsonString(event, "data"));
    } else if (type == "exit") {
      machine.consumeExit(jsonInt(event, "exitCode"),
                          jsonInt(event, "signal"));
    } else if (type == "altscreen") {
      machine.updateAltScreen(event.value("value", false));
    } else if (type == "reconcile") {
      machine.reconcile();
    } else {
      result.failures.push_back(context + ": unsupported event type \"" +
                                type + "\"");
      return result;
    }

    auto expect = event.find("expect");
    if (expect != event.end()) {
      checkExpectations(machine.snapshot(), *expect, context,
                        &result.failures);
    }
  }

  auto expectFinal = fixture.find("expectFinal");
  if (expectFinal != fixture.end()) {
    checkExpectations(machine.snapshot(), *expectFinal, name + " final",
                      &result.failures);
  }
  result.passed = result.failures.empty();
  return result;
}

ReplayResult ReplayHarness::runFile(const string& path) {
  string name = fs::path(path).filename().string();
  std::ifstream input(path);
  if (!input.good()) {
    ReplayResult result;
    result.name = name;
    result.failures.push_back(name + ": cannot open " + path);
    return result;
  }
  json fixture;
  try {
    input >> fixture;
  } catch (const json::parse_error& pe) {
    ReplayResult result;
    result.name = name;
    result.failures.push_back(name + ": " + pe.what());
    return result;
  }
  return runFixture(name, fixture);
}

vector<string> ReplayHarness::listFixtures(const string& directory) {
  vector<string> files;
  for (const auto& entry : fs::directory_iterator(directory)) {
    if (entry.is_regular_file() && entry.path().extension() == ".json") {
      files.push_back(entry.path().string());
    }
  }
  sort(files.begin(), files.end());
  return files;
}

void ReplayHarness::checkExpectations(const StateSnapshot& snapshot,
                                      const json& expected,
                                      const string& context,
                                      vector<string>* failures) {
  if (!expected.is_object()) {
    failures->push_back(context + ": expect is not an object");
    return;
  }
  json actual = SessionJson::toJson(snapshot);
  for (auto it = expected.begin(); it != expected.end(); ++it) {
    json value = actual.contains(it.key()) ? actual[it.key()] : json(nullptr);
    if (value != it.value()) {
      failures->push_back(context + ": expected " + it.key() + "=" +
                          it.value().dump() + ", got " + value.dump());
    }
  }
}
}  // namespace ft
