#include "SessionJson.hpp"
#include "TestHeaders.hpp"

using namespace ft;

TEST_CASE("Mode names round trip", "[SessionJson]") {
  REQUIRE(SessionJson::modeName(MODE_BLOCKED) == "blocked");
  REQUIRE(SessionJson::confidenceName(CONFIDENCE_HIGH) == "high");
  REQUIRE(SessionJson::parseMode("TUI") == MODE_TUI);
  REQUIRE(SessionJson::parseMode("exited") == MODE_EXITED);
  REQUIRE_FALSE(SessionJson::parseMode("sleeping"));
}

TEST_CASE("Snapshot json uses null for missing fields", "[SessionJson]") {
  StateSnapshot snapshot;
  snapshot.set_mode(MODE_SHELL);
  snapshot.set_confidence(CONFIDENCE_MEDIUM);
  snapshot.set_source("fallback_shell");
  snapshot.set_seq(4);
  snapshot.set_running(true);
  snapshot.set_exit_code(0);
  snapshot.set_updated_at(1234);

  json j = SessionJson::toJson(snapshot);
  REQUIRE(j["mode"] == "shell");
  REQUIRE(j["confidence"] == "medium");
  REQUIRE(j["source"] == "fallback_shell");
  REQUIRE(j["seq"] == 4);
  REQUIRE(j["isBlocked"] == false);
  REQUIRE(j["blockedReason"].is_null());
  REQUIRE(j["running"] == true);
  REQUIRE(j["provider"].is_null());
  REQUIRE(j["exitCode"] == 0);
  REQUIRE(j["signal"].is_null());
  REQUIRE(j["updatedAt"] == 1234);
}

TEST_CASE("Events carry their kind", "[SessionJson]") {
  SessionEvent event;
  event.set_task_id("t1");
  event.mutable_blocked()->set_is_blocked(true);
  event.mutable_blocked()->set_reason("Continue? (y/n)");
  json j = SessionJson::toJson(event);
  REQUIRE(j["event"] == "blocked");
  REQUIRE(j["taskId"] == "t1");
  REQUIRE(j["isBlocked"] == true);
  REQUIRE(j["reason"] == "Continue? (y/n)");

  event.mutable_exit()->set_exit_signal(15);
  j = SessionJson::toJson(event);
  REQUIRE(j["event"] == "exit");
  REQUIRE(j["exitCode"].is_null());
  REQUIRE(j["signal"] == 15);

  event.mutable_data()->set_data("hello\r\n");
  REQUIRE(SessionJson::toJson(event)["data"] == "hello\r\n");
}

TEST_CASE("Results omit empty errors", "[SessionJson]") {
  OperationResult ok;
  ok.success = true;
  json j = SessionJson::toJson(ok);
  REQUIRE(j["success"] == true);
  REQUIRE_FALSE(j.contains("error"));

  AttachResult missing;
  missing.error = UNKNOWN_SESSION_ERROR;
  j = SessionJson::toJson(missing);
  REQUIRE(j["success"] == false);
  REQUIRE(j["error"] == UNKNOWN_SESSION_ERROR);
  REQUIRE_FALSE(j.contains("buffer"));

  CreateResult created;
  created.success = true;
  created.startError = "spawn failed";
  j = SessionJson::toJson(created);
  REQUIRE(j["startError"] == "spawn failed");
  REQUIRE(j["sandbox"]["mode"] == "off");
}

TEST_CASE("dumpLine tolerates invalid UTF-8", "[SessionJson]") {
  json j;
  j["data"] = string("ok\xff");
  string line = SessionJson::dumpLine(j);
  REQUIRE(line == "{\"data\":\"ok\xef\xbf\xbd\"}");
  REQUIRE(line.find('\n') == string::npos);
}
